#pragma once

#include "salescast/core/period.hpp"
#include "salescast/core/sales_record.hpp"
#include "salescast/ranking/category_ranker.hpp"
#include "salescast/storage/historical_store.hpp"

#include <cstddef>
#include <vector>

namespace salescast::gapfill {

/**
 * @class IGapPredictor
 * @brief Supplies model values for a contiguous run of missing dates.
 */
class IGapPredictor {
public:
	virtual ~IGapPredictor() = default;

	/**
	 * @brief Forecasts every date of @p chunk.
	 * @return One record per date of the chunk, ascending.
	 * @throws core::PredictionFailure If the model cannot produce values.
	 * @throws core::NoContextError If no history precedes the chunk.
	 */
	virtual std::vector<core::DailyRecord> forecastChunk(const core::Period &chunk) const = 0;
};

/**
 * @struct DataQuality
 * @brief How much of a reconciled period is recorded versus model-filled.
 *
 * Points are counted per date. Completeness is
 * historical / (historical + predicted) x 100, and 0 when both are 0.
 */
struct DataQuality {
	std::size_t historical_points = 0;
	std::size_t predicted_points = 0;
	double completeness_pct = 0.0;
	/// Missing dates left empty, because their chunk failed or no predictor was available.
	std::size_t unfilled_points = 0;
	std::vector<core::Period> failed_chunks;
};

/**
 * @struct ReconciliationResult
 * @brief Merged rows of a period with their ranking and data quality.
 */
struct ReconciliationResult {
	core::Period period;
	/// Recorded and predicted rows, ascending by date, at most one per date.
	std::vector<core::ReconciledRecord> rows;
	ranking::RankedCategories ranking;
	DataQuality quality;
};

/**
 * @class GapFillReconciler
 * @brief Completes a historical period by asking the model for the dates that were never recorded.
 *
 * Missing dates are grouped into contiguous chunks and forecast chunk by
 * chunk. A chunk that fails is logged and left unfilled; the rest of the
 * period is still returned. Recorded values always take precedence over
 * predicted ones.
 */
class GapFillReconciler {
public:
	/**
	 * @param store Recorded history.
	 * @param predictor Source of gap values; nullptr leaves gaps unfilled.
	 * @param max_chunk_days Longest chunk handed to the predictor, 0 for unbounded.
	 */
	GapFillReconciler(const storage::IHistoricalStore &store, const IGapPredictor *predictor, int max_chunk_days = 0);

	/**
	 * @brief Reconciles @p period and ranks the merged rows. A reversed period is swapped.
	 * @param fill_gaps When false, missing dates are left unfilled even if a predictor is set.
	 * @throws core::ValidationError If @p top_n is not positive.
	 */
	ReconciliationResult reconcile(const core::Period &period, int top_n, bool fill_gaps = true) const;

	bool canFillGaps() const {
		return predictor_ != nullptr;
	}

private:
	const storage::IHistoricalStore &store_;
	const IGapPredictor *predictor_;
	int max_chunk_days_;
};

} // namespace salescast::gapfill
