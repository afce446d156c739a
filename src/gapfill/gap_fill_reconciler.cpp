#include "salescast/gapfill/gap_fill_reconciler.hpp"
#include "salescast/core/errors.hpp"
#include "salescast/gapfill/date_range_chunker.hpp"
#include "salescast/utils/logging.hpp"

#include <map>
#include <stdexcept>

namespace salescast::gapfill {

GapFillReconciler::GapFillReconciler(const storage::IHistoricalStore &store, const IGapPredictor *predictor,
                                     int max_chunk_days)
    : store_(store), predictor_(predictor), max_chunk_days_(max_chunk_days) {
	if (max_chunk_days_ < 0) {
		throw std::invalid_argument("max_chunk_days must be non-negative.");
	}
}

ReconciliationResult GapFillReconciler::reconcile(const core::Period &requested, int top_n, bool fill_gaps) const {
	if (top_n <= 0) {
		throw core::ValidationError("top_n must be positive, got " + std::to_string(top_n) + ".");
	}
	const auto period = core::Period::normalized(requested.start, requested.end);

	ReconciliationResult result;
	result.period = period;

	std::map<core::Date, core::ReconciledRecord> merged;
	std::vector<core::Date> recorded_dates;
	for (auto &record : store_.getRange(period)) {
		if (!period.contains(record.date)) {
			continue;
		}
		recorded_dates.push_back(record.date);
		merged.emplace(record.date, core::ReconciledRecord{std::move(record), core::Provenance::Historical});
	}
	result.quality.historical_points = merged.size();

	const auto missing = missingDates(period, recorded_dates);
	if (!missing.empty()) {
		if (!fill_gaps || predictor_ == nullptr) {
			SALESCAST_DEBUG("Leaving {} missing dates of {} unfilled.", missing.size(), period.toString());
			result.quality.unfilled_points = missing.size();
		} else {
			const auto chunks = chunkContiguous(missing, max_chunk_days_);
			SALESCAST_DEBUG("Filling {} missing dates of {} in {} chunks.", missing.size(), period.toString(),
			                chunks.size());
			for (const auto &chunk : chunks) {
				std::vector<core::DailyRecord> forecast;
				try {
					forecast = predictor_->forecastChunk(chunk);
				} catch (const core::PredictionFailure &e) {
					SALESCAST_ERROR("Gap fill for {} failed: {}", chunk.toString(), e.what());
					result.quality.failed_chunks.push_back(chunk);
					result.quality.unfilled_points += static_cast<std::size_t>(chunk.days());
					continue;
				} catch (const core::NoContextError &e) {
					SALESCAST_ERROR("Gap fill for {} failed: {}", chunk.toString(), e.what());
					result.quality.failed_chunks.push_back(chunk);
					result.quality.unfilled_points += static_cast<std::size_t>(chunk.days());
					continue;
				}

				std::map<core::Date, core::CategoryAmounts> by_date;
				for (auto &row : forecast) {
					by_date[row.date] = std::move(row.amounts);
				}
				// Every date of the chunk is filled; a category the model left out counts as 0.
				for (const auto &date : chunk.dates()) {
					core::DailyRecord record{date, {}};
					auto it = by_date.find(date);
					if (it != by_date.end()) {
						record.amounts = std::move(it->second);
					}
					// Recorded rows win; emplace never overwrites.
					if (merged.emplace(date, core::ReconciledRecord{std::move(record), core::Provenance::Predicted})
					        .second) {
						++result.quality.predicted_points;
					}
				}
			}
		}
	}

	const auto counted = result.quality.historical_points + result.quality.predicted_points;
	result.quality.completeness_pct =
	    counted == 0 ? 0.0
	                 : static_cast<double>(result.quality.historical_points) / static_cast<double>(counted) * 100.0;

	std::vector<core::DailyRecord> records;
	records.reserve(merged.size());
	result.rows.reserve(merged.size());
	for (auto &entry : merged) {
		records.push_back(entry.second.record);
		result.rows.push_back(std::move(entry.second));
	}
	result.ranking = ranking::rankCategories(ranking::aggregateByCategory(records), top_n);

	SALESCAST_DEBUG("Reconciled {}: {} historical, {} predicted, {} unfilled.", period.toString(),
	                result.quality.historical_points, result.quality.predicted_points,
	                result.quality.unfilled_points);
	return result;
}

} // namespace salescast::gapfill
