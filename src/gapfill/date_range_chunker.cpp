#include "salescast/gapfill/date_range_chunker.hpp"

#include <algorithm>
#include <stdexcept>
#include <unordered_set>

namespace salescast::gapfill {

std::vector<core::Period> chunkContiguous(std::vector<core::Date> dates, int max_chunk_days) {
	if (max_chunk_days < 0) {
		throw std::invalid_argument("max_chunk_days must be non-negative.");
	}

	std::vector<core::Period> chunks;
	if (dates.empty()) {
		return chunks;
	}

	std::sort(dates.begin(), dates.end());
	dates.erase(std::unique(dates.begin(), dates.end()), dates.end());

	core::Date chunk_start = dates.front();
	core::Date previous = dates.front();
	for (std::size_t i = 1; i < dates.size(); ++i) {
		const core::Date &current = dates[i];
		const bool gap = previous.daysUntil(current) > 1;
		const bool full = max_chunk_days > 0 && chunk_start.daysUntil(current) >= max_chunk_days;
		if (gap || full) {
			chunks.push_back(core::Period{chunk_start, previous});
			chunk_start = current;
		}
		previous = current;
	}
	chunks.push_back(core::Period{chunk_start, previous});
	return chunks;
}

std::vector<core::Date> missingDates(const core::Period &period, const std::vector<core::Date> &present) {
	std::unordered_set<core::Date> seen(present.begin(), present.end());
	std::vector<core::Date> missing;
	for (const auto &date : period.dates()) {
		if (seen.find(date) == seen.end()) {
			missing.push_back(date);
		}
	}
	return missing;
}

} // namespace salescast::gapfill
