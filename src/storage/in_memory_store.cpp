#include "salescast/storage/in_memory_store.hpp"

#include <set>
#include <stdexcept>
#include <utility>

namespace salescast::storage {

InMemoryHistoricalStore::InMemoryHistoricalStore(const std::vector<core::SalesPoint> &points) {
	insert(points);
}

void InMemoryHistoricalStore::insert(const std::vector<core::SalesPoint> &points) {
	// Validate the whole batch first so a rejected batch leaves the store untouched.
	std::set<std::pair<core::Date, std::string>> batch;
	for (const auto &point : points) {
		auto row = rows_.find(point.date);
		const bool held = row != rows_.end() && row->second.count(point.category) > 0;
		if (held || !batch.emplace(point.date, point.category).second) {
			throw std::invalid_argument("Duplicate sales point for " + point.category + " on " +
			                            point.date.toString() + ".");
		}
	}
	for (const auto &point : points) {
		rows_[point.date].emplace(point.category, point.amount);
	}
}

std::vector<core::DailyRecord> InMemoryHistoricalStore::getRange(const core::Period &period) const {
	std::vector<core::DailyRecord> records;
	if (period.end < period.start) {
		return records;
	}
	auto first = rows_.lower_bound(period.start);
	auto last = rows_.upper_bound(period.end);
	for (auto it = first; it != last; ++it) {
		if (!it->second.empty()) {
			records.push_back(core::DailyRecord{it->first, it->second});
		}
	}
	return records;
}

std::vector<std::string> InMemoryHistoricalStore::categories() const {
	std::set<std::string> names;
	for (const auto &row : rows_) {
		for (const auto &entry : row.second) {
			names.insert(entry.first);
		}
	}
	return std::vector<std::string>(names.begin(), names.end());
}

std::optional<core::Period> InMemoryHistoricalStore::coverage() const {
	if (rows_.empty()) {
		return std::nullopt;
	}
	return core::Period{rows_.begin()->first, rows_.rbegin()->first};
}

} // namespace salescast::storage
