#include "salescast/features/working_buffer.hpp"

#include <stdexcept>

namespace salescast::features {

void WorkingBuffer::seed(const std::vector<core::DailyRecord> &records) {
	if (!commit_order_.empty()) {
		throw std::logic_error("Cannot seed a working buffer after rows have been committed.");
	}
	for (const auto &record : records) {
		if (!rows_.emplace(record.date, record.amounts).second) {
			throw std::invalid_argument("Duplicate history row for " + record.date.toString() + ".");
		}
	}
}

void WorkingBuffer::commit(core::DailyRecord record) {
	if (!rows_.empty() && !(rows_.rbegin()->first < record.date)) {
		throw std::logic_error("Working buffer rows must be committed in date order: " + record.date.toString() +
		                       " is not after " + rows_.rbegin()->first.toString() + ".");
	}
	commit_order_.push_back(record.date);
	rows_.emplace_hint(rows_.end(), record.date, std::move(record.amounts));
}

std::optional<double> WorkingBuffer::valueAt(const std::string &category, const core::Date &date) const {
	auto row = rows_.find(date);
	if (row == rows_.end()) {
		return std::nullopt;
	}
	// A held date without an entry for the category recorded no sales for it.
	auto value = row->second.find(category);
	return value == row->second.end() ? 0.0 : value->second;
}

std::vector<double> WorkingBuffer::trailingValues(const std::string &category, const core::Date &date,
                                                  int window) const {
	std::vector<double> values;
	if (window <= 0) {
		return values;
	}
	values.reserve(static_cast<std::size_t>(window));
	for (int offset = 1; offset <= window; ++offset) {
		auto value = valueAt(category, date.addDays(-offset));
		if (value) {
			values.push_back(*value);
		}
	}
	return values;
}

std::optional<core::Date> WorkingBuffer::latestDate() const {
	if (rows_.empty()) {
		return std::nullopt;
	}
	return rows_.rbegin()->first;
}

std::vector<core::DailyRecord> WorkingBuffer::committedRows() const {
	std::vector<core::DailyRecord> rows;
	rows.reserve(commit_order_.size());
	for (const auto &date : commit_order_) {
		rows.push_back(core::DailyRecord{date, rows_.at(date)});
	}
	return rows;
}

} // namespace salescast::features
