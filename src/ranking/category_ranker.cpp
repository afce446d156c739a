#include "salescast/ranking/category_ranker.hpp"
#include "salescast/core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace salescast::ranking {

RankedCategories rankCategories(const core::CategoryAmounts &totals, int top_n) {
	if (top_n <= 0) {
		throw core::ValidationError("top_n must be positive, got " + std::to_string(top_n) + ".");
	}

	RankedCategories ranked;
	// std::map iterates in name order, so the sum is the same on every run.
	for (const auto &entry : totals) {
		ranked.grand_total += entry.second;
	}

	std::vector<CategoryTotal> entries;
	entries.reserve(totals.size());
	for (const auto &entry : totals) {
		CategoryTotal total;
		total.category = entry.first;
		total.amount = entry.second;
		total.percentage = ranked.grand_total != 0.0 ? entry.second / ranked.grand_total * 100.0 : 0.0;
		entries.push_back(std::move(total));
	}

	std::sort(entries.begin(), entries.end(), [](const CategoryTotal &lhs, const CategoryTotal &rhs) {
		if (lhs.amount != rhs.amount) {
			return lhs.amount > rhs.amount;
		}
		return lhs.category < rhs.category;
	});

	if (entries.size() > static_cast<std::size_t>(top_n)) {
		entries.resize(static_cast<std::size_t>(top_n));
	}
	ranked.entries = std::move(entries);
	return ranked;
}

core::CategoryAmounts aggregateByCategory(const std::vector<core::DailyRecord> &records) {
	core::CategoryAmounts totals;
	for (const auto &record : records) {
		for (const auto &entry : record.amounts) {
			totals[entry.first] += entry.second;
		}
	}
	return totals;
}

std::string formatCurrency(double amount) {
	std::ostringstream fixed;
	fixed << std::fixed << std::setprecision(2) << std::fabs(amount);
	const std::string digits = fixed.str();

	const auto dot = digits.find('.');
	const std::string whole = digits.substr(0, dot);
	std::string grouped;
	for (std::size_t i = 0; i < whole.size(); ++i) {
		if (i > 0 && (whole.size() - i) % 3 == 0) {
			grouped.push_back(',');
		}
		grouped.push_back(whole[i]);
	}

	// Rounds to "$0.00" rather than "-$0.00".
	const bool negative = amount < 0.0 && digits != "0.00";
	return std::string(negative ? "-$" : "$") + grouped + digits.substr(dot);
}

std::string formatPercentage(double value) {
	std::ostringstream out;
	out << std::fixed << std::setprecision(2) << value << '%';
	return out.str();
}

GrowthRate growthRate(double current, double baseline) {
	GrowthRate rate;
	if (baseline == 0.0) {
		rate.infinite = current > 0.0;
		return rate;
	}
	rate.percentage = (current - baseline) / baseline * 100.0;
	return rate;
}

} // namespace salescast::ranking
