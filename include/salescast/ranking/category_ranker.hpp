#pragma once

#include "salescast/core/sales_record.hpp"

#include <string>
#include <vector>

namespace salescast::ranking {

/**
 * @struct CategoryTotal
 * @brief A category's aggregated amount and its share of the grand total.
 */
struct CategoryTotal {
	std::string category;
	double amount = 0.0;
	double percentage = 0.0;
};

/**
 * @struct RankedCategories
 * @brief Top-N categories plus the total over every category (not only the top N).
 */
struct RankedCategories {
	std::vector<CategoryTotal> entries;
	double grand_total = 0.0;
};

/**
 * @brief Ranks categories by amount.
 *
 * Entries are sorted by amount descending with ties broken by category name
 * ascending, then truncated to @p top_n. Percentages are relative to the sum
 * over all categories and are 0 when that sum is 0.
 *
 * @throws core::ValidationError If @p top_n is not positive.
 */
RankedCategories rankCategories(const core::CategoryAmounts &totals, int top_n);

/// Sums every category over @p records.
core::CategoryAmounts aggregateByCategory(const std::vector<core::DailyRecord> &records);

/// Formats an amount as `$1,234.56` (negatives as `-$1,234.56`).
std::string formatCurrency(double amount);

/// Formats a percentage as `12.34%`.
std::string formatPercentage(double value);

/**
 * @struct GrowthRate
 * @brief Relative change of a total against a baseline.
 *
 * When the baseline is zero and the current value positive, growth is
 * unbounded: @c infinite is set and @c percentage is meaningless.
 */
struct GrowthRate {
	double percentage = 0.0;
	bool infinite = false;

	std::string formatted() const {
		return infinite ? std::string("inf%") : formatPercentage(percentage);
	}
};

GrowthRate growthRate(double current, double baseline);

} // namespace salescast::ranking
