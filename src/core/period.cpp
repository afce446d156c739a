#include "salescast/core/period.hpp"
#include "salescast/core/errors.hpp"
#include "salescast/utils/logging.hpp"

#include <algorithm>
#include <cctype>

namespace salescast::core {

Period Period::normalized(const Date &first, const Date &second) {
	if (second < first) {
		SALESCAST_WARN("Start date {} is after end date {}, swapping dates.", first.toString(), second.toString());
		return Period{second, first};
	}
	return Period{first, second};
}

std::vector<Date> Period::dates() const {
	std::vector<Date> result;
	if (end < start) {
		return result;
	}
	result.reserve(static_cast<std::size_t>(days()));
	for (Date current = start; current <= end; current = current.addDays(1)) {
		result.push_back(current);
	}
	return result;
}

std::string Period::toString() const {
	return start.toString() + ".." + end.toString();
}

Period resolvePeriod(const std::optional<std::string> &start_date, const std::optional<std::string> &end_date,
                     std::int64_t days, const Date &today) {
	if (days < 0) {
		throw ValidationError("Number of days must be non-negative, got " + std::to_string(days) + ".");
	}
	const Date end = end_date ? Date::parse(*end_date) : today;
	const Date start = start_date ? Date::parse(*start_date) : end.addDays(-days);
	return Period::normalized(start, end);
}

RangePreset parseRangePreset(const std::string &name) {
	std::string lowered = name;
	std::transform(lowered.begin(), lowered.end(), lowered.begin(),
	               [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
	if (lowered == "week") {
		return RangePreset::Week;
	}
	if (lowered == "month") {
		return RangePreset::Month;
	}
	if (lowered == "quarter") {
		return RangePreset::Quarter;
	}
	if (lowered == "year") {
		return RangePreset::Year;
	}
	if (lowered == "custom") {
		return RangePreset::Custom;
	}
	throw ValidationError("Invalid range '" + name + "'. Must be one of: week, month, quarter, year, custom.");
}

std::string rangePresetName(RangePreset preset) {
	switch (preset) {
	case RangePreset::Week:
		return "week";
	case RangePreset::Month:
		return "month";
	case RangePreset::Quarter:
		return "quarter";
	case RangePreset::Year:
		return "year";
	case RangePreset::Custom:
		return "custom";
	}
	return "custom";
}

Period periodForPreset(RangePreset preset, const Date &today, const std::optional<std::string> &start_date,
                       const std::optional<std::string> &end_date) {
	switch (preset) {
	case RangePreset::Week:
		return Period{today, today.addDays(6)};
	case RangePreset::Month:
		return Period{today, today.endOfMonth()};
	case RangePreset::Quarter: {
		// Through the end of the month three months ahead.
		int end_month = today.month() + 3;
		int end_year = today.year();
		if (end_month > 12) {
			end_month -= 12;
			++end_year;
		}
		return Period{today, Date::fromYmd(end_year, end_month, Date::daysInMonth(end_year, end_month))};
	}
	case RangePreset::Year:
		return Period{today, Date::fromYmd(today.year(), 12, 31)};
	case RangePreset::Custom:
		if (!start_date || !end_date) {
			throw ValidationError("start_date and end_date are required for custom range.");
		}
		return Period::normalized(Date::parse(*start_date), Date::parse(*end_date));
	}
	throw ValidationError("Unsupported range preset.");
}

} // namespace salescast::core
