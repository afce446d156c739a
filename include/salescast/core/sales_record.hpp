#pragma once

#include "salescast/core/date.hpp"

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace salescast::core {

/// Amount per category name. Ordered so iteration is deterministic.
using CategoryAmounts = std::map<std::string, double>;

/**
 * @struct SalesPoint
 * @brief One recorded amount, uniquely keyed by (date, category).
 */
struct SalesPoint {
	Date date;
	std::string category;
	double amount = 0.0;
};

/**
 * @struct DailyRecord
 * @brief All category amounts for a single date.
 */
struct DailyRecord {
	Date date;
	CategoryAmounts amounts;

	/// Amount for @p category, or @p fallback when the category is absent.
	double amountOr(const std::string &category, double fallback = 0.0) const {
		auto it = amounts.find(category);
		return it == amounts.end() ? fallback : it->second;
	}
};

/// Where the values of a date came from.
enum class Provenance { Historical, Predicted };

inline const char *provenanceName(Provenance provenance) {
	return provenance == Provenance::Historical ? "historical" : "predicted";
}

/**
 * @struct ReconciledRecord
 * @brief A daily record tagged with its provenance.
 */
struct ReconciledRecord {
	DailyRecord record;
	Provenance provenance = Provenance::Historical;
};

/**
 * @brief Groups sales points into one record per date, sorted ascending.
 *
 * Amounts for the same (date, category) are summed.
 */
inline std::vector<DailyRecord> groupByDate(const std::vector<SalesPoint> &points) {
	std::map<Date, CategoryAmounts> grouped;
	for (const auto &point : points) {
		grouped[point.date][point.category] += point.amount;
	}
	std::vector<DailyRecord> records;
	records.reserve(grouped.size());
	for (auto &entry : grouped) {
		records.push_back(DailyRecord{entry.first, std::move(entry.second)});
	}
	return records;
}

} // namespace salescast::core
