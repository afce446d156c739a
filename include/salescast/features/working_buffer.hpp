#pragma once

#include "salescast/core/date.hpp"
#include "salescast/core/sales_record.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace salescast::features {

/**
 * @class WorkingBuffer
 * @brief Append-only, date-ordered view of seeded history plus rows committed in the current run.
 *
 * Lag and rolling lookups read from this buffer, so a date synthesized earlier
 * in the run is visible to every later date. Rows can only be appended after
 * the latest date already held; nothing is ever rewritten.
 */
class WorkingBuffer {
public:
	WorkingBuffer() = default;

	/**
	 * @brief Seeds the buffer with recorded history.
	 * @throws std::invalid_argument If a date is repeated.
	 * @throws std::logic_error If rows were already committed.
	 */
	void seed(const std::vector<core::DailyRecord> &records);

	/**
	 * @brief Appends a row for a date strictly after every date held.
	 * @throws std::logic_error If the row would be out of order.
	 */
	void commit(core::DailyRecord record);

	/**
	 * @brief Value of @p category on @p date.
	 * @return std::nullopt when the date is not held; 0.0 when the date is held
	 *         without an entry for the category.
	 */
	std::optional<double> valueAt(const std::string &category, const core::Date &date) const;

	/// Values of @p category on those of the @p window days before @p date that the buffer holds.
	std::vector<double> trailingValues(const std::string &category, const core::Date &date, int window) const;

	bool contains(const core::Date &date) const {
		return rows_.find(date) != rows_.end();
	}

	std::optional<core::Date> latestDate() const;

	std::size_t size() const {
		return rows_.size();
	}

	std::size_t committedCount() const {
		return commit_order_.size();
	}

	/// Rows committed during the run, in commit order.
	std::vector<core::DailyRecord> committedRows() const;

private:
	std::map<core::Date, core::CategoryAmounts> rows_;
	std::vector<core::Date> commit_order_;
};

} // namespace salescast::features
