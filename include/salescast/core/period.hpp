#pragma once

#include "salescast/core/date.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace salescast::core {

/**
 * @struct Period
 * @brief An inclusive range of calendar days, always with start <= end.
 */
struct Period {
	Date start;
	Date end;

	/**
	 * @brief Builds a period from two dates in either order.
	 *
	 * A reversed range is swapped (and a warning logged) rather than rejected.
	 */
	static Period normalized(const Date &first, const Date &second);

	/// Number of days in the period, end - start + 1.
	std::int64_t days() const {
		return start.daysUntil(end) + 1;
	}

	bool contains(const Date &date) const {
		return start <= date && date <= end;
	}

	/// Every date of the period in ascending order.
	std::vector<Date> dates() const;

	/// The same period moved by @p offset days.
	Period shifted(std::int64_t offset) const {
		return Period{start.addDays(offset), end.addDays(offset)};
	}

	/// The @p count days immediately before start.
	Period preceding(std::int64_t count) const {
		return Period{start.addDays(-count), start.addDays(-1)};
	}

	std::string toString() const;

	friend bool operator==(const Period &lhs, const Period &rhs) {
		return lhs.start == rhs.start && lhs.end == rhs.end;
	}
	friend bool operator!=(const Period &lhs, const Period &rhs) {
		return !(lhs == rhs);
	}
};

/**
 * @brief Resolves optional request dates into a period.
 *
 * A missing end defaults to @p today, a missing start to end - @p days.
 * Reversed ranges are swapped.
 *
 * @throws ValidationError If a date is malformed or @p days is negative.
 */
Period resolvePeriod(const std::optional<std::string> &start_date, const std::optional<std::string> &end_date,
                     std::int64_t days, const Date &today);

/// Named horizons accepted by the top-categories-for-range operation.
enum class RangePreset { Week, Month, Quarter, Year, Custom };

/**
 * @brief Parses "week", "month", "quarter", "year" or "custom".
 * @throws ValidationError On any other value.
 */
RangePreset parseRangePreset(const std::string &name);

std::string rangePresetName(RangePreset preset);

/**
 * @brief Computes the forward-looking period for a preset, starting at @p today.
 *
 * Custom ranges require both @p start_date and @p end_date.
 */
Period periodForPreset(RangePreset preset, const Date &today, const std::optional<std::string> &start_date = {},
                       const std::optional<std::string> &end_date = {});

} // namespace salescast::core
