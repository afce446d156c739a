#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace salescast::core {

/**
 * @class Date
 * @brief A calendar day, stored as the number of days since 1970-01-01 (UTC).
 *
 * Dates carry no time-of-day or time zone. All calendar fields used by the
 * feature synthesizer (ISO week, quarter, month boundaries) are derived from
 * the day key, so two equal dates always yield identical features.
 */
class Date {
public:
	Date() = default;

	/**
	 * @brief Constructs a date from a day key (days since 1970-01-01).
	 */
	explicit Date(std::int64_t day_key) : day_key_(day_key) {
	}

	/**
	 * @brief Builds a date from year, month (1-12) and day (1-31).
	 * @throws ValidationError If the triple is not a valid calendar day.
	 */
	static Date fromYmd(int year, int month, int day);

	/**
	 * @brief Parses an ISO `YYYY-MM-DD` string.
	 * @throws ValidationError If the text is not a valid ISO date.
	 */
	static Date parse(const std::string &text);

	/// Today's date in UTC, from the system clock.
	static Date today();

	static bool isLeapYear(int year);
	static int daysInMonth(int year, int month);

	std::int64_t dayKey() const {
		return day_key_;
	}

	Date addDays(std::int64_t days) const {
		return Date(day_key_ + days);
	}

	/// Signed number of days from this date to @p other.
	std::int64_t daysUntil(const Date &other) const {
		return other.day_key_ - day_key_;
	}

	int year() const;
	int month() const;
	int day() const;

	/// Day of week with Monday = 0 ... Sunday = 6.
	int dayOfWeek() const;

	/// ISO-8601 week number (1-53).
	int isoWeek() const;

	/// Day of year (1-366).
	int dayOfYear() const;

	int quarter() const {
		return (month() - 1) / 3 + 1;
	}

	bool isWeekend() const {
		return dayOfWeek() >= 5;
	}

	bool isMonthStart() const {
		return day() == 1;
	}

	bool isMonthEnd() const;

	/// Last day of this date's month.
	Date endOfMonth() const;

	/// Formats the date as `YYYY-MM-DD`.
	std::string toString() const;

	friend bool operator==(const Date &lhs, const Date &rhs) {
		return lhs.day_key_ == rhs.day_key_;
	}
	friend bool operator!=(const Date &lhs, const Date &rhs) {
		return lhs.day_key_ != rhs.day_key_;
	}
	friend bool operator<(const Date &lhs, const Date &rhs) {
		return lhs.day_key_ < rhs.day_key_;
	}
	friend bool operator<=(const Date &lhs, const Date &rhs) {
		return lhs.day_key_ <= rhs.day_key_;
	}
	friend bool operator>(const Date &lhs, const Date &rhs) {
		return lhs.day_key_ > rhs.day_key_;
	}
	friend bool operator>=(const Date &lhs, const Date &rhs) {
		return lhs.day_key_ >= rhs.day_key_;
	}

private:
	struct Civil {
		int year;
		int month;
		int day;
	};

	static std::int64_t daysFromCivil(int year, int month, int day);
	static Civil civilFromDays(std::int64_t day_key);

	std::int64_t day_key_ = 0;
};

} // namespace salescast::core

namespace std {

template <>
struct hash<salescast::core::Date> {
	std::size_t operator()(const salescast::core::Date &date) const noexcept {
		return std::hash<std::int64_t>{}(date.dayKey());
	}
};

} // namespace std
