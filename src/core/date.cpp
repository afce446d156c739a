#include "salescast/core/date.hpp"
#include "salescast/core/errors.hpp"

#include <cctype>
#include <chrono>
#include <cstdio>

namespace salescast::core {

namespace {

int weeksInIsoYear(int year) {
	// A year has 53 ISO weeks when Jan 1 is a Thursday, or a Wednesday in a leap year.
	const int jan1 = Date::fromYmd(year, 1, 1).dayOfWeek();
	if (jan1 == 3 || (jan1 == 2 && Date::isLeapYear(year))) {
		return 53;
	}
	return 52;
}

} // namespace

// Howard Hinnant's days_from_civil / civil_from_days, proleptic Gregorian.
std::int64_t Date::daysFromCivil(int year, int month, int day) {
	const std::int64_t y = static_cast<std::int64_t>(year) - (month <= 2 ? 1 : 0);
	const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
	const std::int64_t yoe = y - era * 400;
	const std::int64_t mp = (month + 9) % 12;
	const std::int64_t doy = (153 * mp + 2) / 5 + day - 1;
	const std::int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
	return era * 146097 + doe - 719468;
}

Date::Civil Date::civilFromDays(std::int64_t day_key) {
	const std::int64_t z = day_key + 719468;
	const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
	const std::int64_t doe = z - era * 146097;
	const std::int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
	const std::int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
	const std::int64_t mp = (5 * doy + 2) / 153;
	const std::int64_t d = doy - (153 * mp + 2) / 5 + 1;
	const std::int64_t m = mp < 10 ? mp + 3 : mp - 9;
	const std::int64_t y = yoe + era * 400 + (m <= 2 ? 1 : 0);
	return Civil{static_cast<int>(y), static_cast<int>(m), static_cast<int>(d)};
}

bool Date::isLeapYear(int year) {
	return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int Date::daysInMonth(int year, int month) {
	static constexpr int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
	if (month < 1 || month > 12) {
		throw ValidationError("Month must be between 1 and 12, got " + std::to_string(month) + ".");
	}
	if (month == 2 && isLeapYear(year)) {
		return 29;
	}
	return kDays[month - 1];
}

Date Date::fromYmd(int year, int month, int day) {
	if (year < 1 || year > 9999) {
		throw ValidationError("Year must be between 1 and 9999, got " + std::to_string(year) + ".");
	}
	const int month_days = daysInMonth(year, month);
	if (day < 1 || day > month_days) {
		throw ValidationError("Day " + std::to_string(day) + " is out of range for " + std::to_string(year) + "-" +
		                      std::to_string(month) + ".");
	}
	return Date(daysFromCivil(year, month, day));
}

Date Date::today() {
	using Days = std::chrono::duration<std::int64_t, std::ratio<86400>>;
	const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
	return Date(std::chrono::duration_cast<Days>(since_epoch).count());
}

Date Date::parse(const std::string &text) {
	// Accept exactly YYYY-MM-DD.
	if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
		throw ValidationError("Invalid date '" + text + "', expected YYYY-MM-DD.");
	}
	for (std::size_t i = 0; i < text.size(); ++i) {
		if (i == 4 || i == 7) {
			continue;
		}
		if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
			throw ValidationError("Invalid date '" + text + "', expected YYYY-MM-DD.");
		}
	}
	const int year = std::stoi(text.substr(0, 4));
	const int month = std::stoi(text.substr(5, 2));
	const int day = std::stoi(text.substr(8, 2));
	return fromYmd(year, month, day);
}

int Date::year() const {
	return civilFromDays(day_key_).year;
}

int Date::month() const {
	return civilFromDays(day_key_).month;
}

int Date::day() const {
	return civilFromDays(day_key_).day;
}

int Date::dayOfWeek() const {
	// 1970-01-01 was a Thursday (index 3 when Monday = 0).
	std::int64_t weekday = (day_key_ + 3) % 7;
	if (weekday < 0) {
		weekday += 7;
	}
	return static_cast<int>(weekday);
}

int Date::dayOfYear() const {
	const Civil civil = civilFromDays(day_key_);
	return static_cast<int>(day_key_ - daysFromCivil(civil.year, 1, 1)) + 1;
}

int Date::isoWeek() const {
	const int year_value = year();
	const int week = (dayOfYear() - (dayOfWeek() + 1) + 10) / 7;
	if (week < 1) {
		return weeksInIsoYear(year_value - 1);
	}
	if (week > weeksInIsoYear(year_value)) {
		return 1;
	}
	return week;
}

bool Date::isMonthEnd() const {
	const Civil civil = civilFromDays(day_key_);
	return civil.day == daysInMonth(civil.year, civil.month);
}

Date Date::endOfMonth() const {
	const Civil civil = civilFromDays(day_key_);
	return Date(daysFromCivil(civil.year, civil.month, daysInMonth(civil.year, civil.month)));
}

std::string Date::toString() const {
	const Civil civil = civilFromDays(day_key_);
	char buffer[16];
	std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", civil.year, civil.month, civil.day);
	return std::string(buffer);
}

} // namespace salescast::core
