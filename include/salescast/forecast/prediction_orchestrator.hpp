#pragma once

#include "salescast/core/config.hpp"
#include "salescast/core/period.hpp"
#include "salescast/core/sales_record.hpp"
#include "salescast/features/feature_synthesizer.hpp"
#include "salescast/gapfill/gap_fill_reconciler.hpp"
#include "salescast/models/model_artifact.hpp"
#include "salescast/ranking/category_ranker.hpp"
#include "salescast/storage/historical_store.hpp"

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace salescast::forecast {

/// Lifecycle of a single request.
enum class RequestStage {
	Requested,
	ContextLoaded,
	FeaturesSynthesized,
	Predicted,
	Aggregated,
	HistoricalComparisonAttached,
	Done,
	Failed
};

const char *requestStageName(RequestStage stage);

/**
 * @struct ForecastRequest
 * @brief Parameters of a top-categories forecast.
 */
struct ForecastRequest {
	core::Period period;
	int top_n = 5;
	/// Attach the equally long period immediately before, with the growth of the totals.
	bool include_historical = false;
};

/**
 * @struct HistoricalRequest
 * @brief Parameters of a top-categories query over recorded (and gap-filled) history.
 */
struct HistoricalRequest {
	core::Period period;
	int top_n = 5;
};

/**
 * @struct TopCategoriesResponse
 * @brief Ranked categories of a period, with provenance and data quality.
 */
struct TopCategoriesResponse {
	core::Period period;
	ranking::RankedCategories ranking;
	gapfill::DataQuality quality;
	/// Predicted when the model produced the period, Historical otherwise.
	core::Provenance source = core::Provenance::Historical;
	bool degraded = false;
	std::string degraded_reason;
	/// Preset name when the request came through topCategoriesForRange.
	std::string range;

	std::shared_ptr<const TopCategoriesResponse> historical;
	std::optional<ranking::GrowthRate> growth;
	std::optional<models::ModelInfo> model_info;
	std::vector<RequestStage> stages;
};

/**
 * @struct CategorySeries
 * @brief Daily values of one category, recorded before the period and predicted within it.
 */
struct CategorySeries {
	std::string category;
	std::vector<std::pair<core::Date, double>> historical;
	std::vector<std::pair<core::Date, double>> predicted;
};

/**
 * @struct TimeSeriesResponse
 * @brief Chart data for the top categories of a forecast.
 */
struct TimeSeriesResponse {
	core::Period period;
	/// Charted history before the period; absent when no history days were asked for.
	std::optional<core::Period> history_period;
	std::vector<CategorySeries> series;
	bool degraded = false;
	std::string degraded_reason;
};

/**
 * @class PredictionOrchestrator
 * @brief Runs the forecast pipeline: context load, feature synthesis, prediction, aggregation.
 *
 * The orchestrator also serves as the gap predictor of its own reconciler, so
 * historical periods with missing dates are completed with the same model.
 * When no model artifact is loaded, or the model fails, every forecast
 * degrades to a historical-only answer instead of failing.
 *
 * All operations are const and keep their state on the stack; one instance
 * may serve concurrent requests as long as the store does.
 */
class PredictionOrchestrator final : public gapfill::IGapPredictor {
public:
	/**
	 * @param store Recorded history. Must outlive the orchestrator.
	 * @param artifact Loaded model, or nullptr for historical-only mode.
	 * @param config Engine settings; validated here.
	 * @throws core::ConfigurationError If @p config is invalid.
	 */
	PredictionOrchestrator(const storage::IHistoricalStore &store, std::shared_ptr<const models::ModelArtifact> artifact,
	                       core::EngineConfig config);

	PredictionOrchestrator(const PredictionOrchestrator &) = delete;
	PredictionOrchestrator &operator=(const PredictionOrchestrator &) = delete;

	/**
	 * @brief Forecasts the top categories of a future period. A reversed period is swapped.
	 * @throws core::NoContextError If no history precedes the period.
	 * @throws core::ValidationError If top_n is not positive.
	 */
	TopCategoriesResponse predictTopCategories(const ForecastRequest &request) const;

	/**
	 * @brief Ranks a past period, filling missing dates with the model when one is loaded.
	 *
	 * Stages record ContextLoaded, FeaturesSynthesized and Predicted only when a gap was predicted.
	 * @throws core::ValidationError If top_n is not positive.
	 */
	TopCategoriesResponse historicalTopCategories(const HistoricalRequest &request) const;

	/**
	 * @brief Forecasts the period a named preset covers, starting at @p today.
	 * @throws core::ValidationError If the preset is unknown or a custom range lacks a date.
	 */
	TopCategoriesResponse topCategoriesForRange(const std::string &range, const core::Date &today, int top_n,
	                                            const std::optional<std::string> &start_date = {},
	                                            const std::optional<std::string> &end_date = {}) const;

	/**
	 * @brief Daily series of the top predicted categories, with @p historical_days of recorded history before.
	 * @throws core::NoContextError If no history precedes the period.
	 */
	TimeSeriesResponse timeSeries(const ForecastRequest &request, int historical_days) const;

	/**
	 * @brief Forecasts every date of @p chunk from the history that precedes it.
	 * @throws core::PredictionFailure If no model is loaded or the model fails.
	 * @throws core::NoContextError If no history precedes the chunk.
	 */
	std::vector<core::DailyRecord> forecastChunk(const core::Period &chunk) const override;

	models::ModelInfo modelInfo() const;

	bool hasModel() const {
		return artifact_ != nullptr;
	}

	const core::EngineConfig &config() const {
		return config_;
	}

private:
	std::vector<core::DailyRecord> runForecast(const core::Period &period, std::vector<RequestStage> &stages) const;
	std::vector<core::DailyRecord> predictRecursive(const core::Period &period,
	                                                features::WorkingBuffer &buffer) const;
	std::vector<core::DailyRecord> predictBatched(const core::Period &period, features::WorkingBuffer &buffer) const;
	core::CategoryAmounts mapOutputs(const std::vector<double> &outputs) const;

	TopCategoriesResponse fromReconciliation(gapfill::ReconciliationResult result,
	                                         std::vector<RequestStage> stages) const;
	TopCategoriesResponse degradedAnswer(const ForecastRequest &request, std::string reason,
	                                     std::vector<RequestStage> stages) const;

	const storage::IHistoricalStore &store_;
	std::shared_ptr<const models::ModelArtifact> artifact_;
	core::EngineConfig config_;
	int context_days_ = 0;
	std::unique_ptr<features::FeatureSynthesizer> synthesizer_;
	gapfill::GapFillReconciler reconciler_;
};

} // namespace salescast::forecast
