#include "salescast/forecast/prediction_orchestrator.hpp"
#include "salescast/core/errors.hpp"
#include "salescast/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace salescast::forecast {

namespace {

core::EngineConfig validated(core::EngineConfig config) {
	config.validate();
	return config;
}

template <typename Request>
Request withOrderedPeriod(Request request) {
	request.period = core::Period::normalized(request.period.start, request.period.end);
	return request;
}

// Runs the predictor and turns anything it throws into a PredictionFailure.
models::Matrix callPredictor(const models::IPredictor &predictor, const models::Matrix &input) {
	for (const auto &row : input) {
		if (row.size() != predictor.featureCount()) {
			throw core::PredictionFailure("feature vector has " + std::to_string(row.size()) +
			                              " values but the model expects " +
			                              std::to_string(predictor.featureCount()) + ".");
		}
	}
	models::Matrix output;
	try {
		output = predictor.predict(input);
	} catch (const core::SalescastError &) {
		throw;
	} catch (const std::exception &e) {
		throw core::PredictionFailure(predictor.getName() + " failed: " + e.what());
	}
	if (output.size() != input.size()) {
		throw core::PredictionFailure("model returned " + std::to_string(output.size()) + " rows for " +
		                              std::to_string(input.size()) + " inputs.");
	}
	return output;
}

void advance(std::vector<RequestStage> &stages, RequestStage stage) {
	stages.push_back(stage);
	SALESCAST_TRACE("Request stage: {}", requestStageName(stage));
}

} // namespace

const char *requestStageName(RequestStage stage) {
	switch (stage) {
	case RequestStage::Requested:
		return "requested";
	case RequestStage::ContextLoaded:
		return "context_loaded";
	case RequestStage::FeaturesSynthesized:
		return "features_synthesized";
	case RequestStage::Predicted:
		return "predicted";
	case RequestStage::Aggregated:
		return "aggregated";
	case RequestStage::HistoricalComparisonAttached:
		return "historical_comparison_attached";
	case RequestStage::Done:
		return "done";
	case RequestStage::Failed:
		return "failed";
	}
	return "unknown";
}

PredictionOrchestrator::PredictionOrchestrator(const storage::IHistoricalStore &store,
                                               std::shared_ptr<const models::ModelArtifact> artifact,
                                               core::EngineConfig config)
    : store_(store), artifact_(std::move(artifact)), config_(validated(std::move(config))),
      context_days_(config_.context_days), reconciler_(store_, artifact_ ? this : nullptr, config_.max_chunk_days) {
	if (artifact_) {
		synthesizer_ = features::FeatureSynthesizerBuilder()
		                   .withManifest(artifact_->manifest())
		                   .withColdStartValue(config_.cold_start_value)
		                   .withSpecialMonth(config_.special_month)
		                   .build();
		// Context must reach back at least as far as the longest lag or window.
		context_days_ = std::max(config_.context_days, synthesizer_->manifest().maxLookback());
		SALESCAST_INFO("Forecasting with {} over {} features from {} days of context.",
		               artifact_->info().model_type, synthesizer_->manifest().size(), context_days_);
	} else {
		SALESCAST_WARN("No model loaded; forecasts fall back to historical data.");
	}
}

// --- Forecast pipeline ---

core::CategoryAmounts PredictionOrchestrator::mapOutputs(const std::vector<double> &outputs) const {
	const auto &targets = artifact_->predictor().targetCategories();
	if (outputs.size() != targets.size()) {
		throw core::PredictionFailure("model returned " + std::to_string(outputs.size()) + " values for " +
		                              std::to_string(targets.size()) + " target categories.");
	}
	core::CategoryAmounts amounts;
	for (std::size_t i = 0; i < targets.size(); ++i) {
		if (!std::isfinite(outputs[i])) {
			throw core::PredictionFailure("model returned a non-finite value for '" + targets[i] + "'.");
		}
		amounts[targets[i]] += outputs[i];
	}
	return amounts;
}

std::vector<core::DailyRecord> PredictionOrchestrator::predictRecursive(const core::Period &period,
                                                                        features::WorkingBuffer &buffer) const {
	const auto &predictor = artifact_->predictor();
	auto resolver = [this, &predictor](const features::FeatureVector &vector) {
		const auto outputs = callPredictor(predictor, models::Matrix{vector.values});
		return mapOutputs(outputs.front());
	};
	synthesizer_->synthesize(period, buffer, resolver);
	return buffer.committedRows();
}

std::vector<core::DailyRecord> PredictionOrchestrator::predictBatched(const core::Period &period,
                                                                      features::WorkingBuffer &buffer) const {
	const auto matrix = synthesizer_->synthesize(period, buffer);
	const auto outputs = callPredictor(artifact_->predictor(), matrix.values());

	std::vector<core::DailyRecord> records;
	records.reserve(matrix.rowCount());
	for (std::size_t row = 0; row < matrix.rowCount(); ++row) {
		records.push_back(core::DailyRecord{matrix.rows[row].date, mapOutputs(outputs[row])});
	}
	return records;
}

std::vector<core::DailyRecord> PredictionOrchestrator::runForecast(const core::Period &period,
                                                                   std::vector<RequestStage> &stages) const {
	const auto context_period = period.preceding(context_days_);
	const auto context = store_.getRange(context_period);
	if (context.empty()) {
		throw core::NoContextError("no recorded sales in " + context_period.toString() + " before " +
		                           period.start.toString() + ".");
	}

	features::WorkingBuffer buffer;
	buffer.seed(context);
	advance(stages, RequestStage::ContextLoaded);

	std::vector<core::DailyRecord> predicted;
	if (config_.batch_inference && artifact_->predictor().supportsBatching()) {
		predicted = predictBatched(period, buffer);
	} else {
		// Each prediction is committed before the next date is synthesized.
		predicted = predictRecursive(period, buffer);
	}
	advance(stages, RequestStage::FeaturesSynthesized);
	advance(stages, RequestStage::Predicted);

	SALESCAST_DEBUG("Predicted {} days for {} from {} days of context.", predicted.size(), period.toString(),
	                context.size());
	return predicted;
}

std::vector<core::DailyRecord> PredictionOrchestrator::forecastChunk(const core::Period &chunk) const {
	if (!artifact_) {
		throw core::PredictionFailure("no model loaded.");
	}
	std::vector<RequestStage> stages;
	return runForecast(core::Period::normalized(chunk.start, chunk.end), stages);
}

// --- Responses ---

TopCategoriesResponse PredictionOrchestrator::fromReconciliation(gapfill::ReconciliationResult result,
                                                                 std::vector<RequestStage> stages) const {
	TopCategoriesResponse response;
	response.period = result.period;
	response.ranking = std::move(result.ranking);
	response.quality = std::move(result.quality);
	response.source = core::Provenance::Historical;
	response.stages = std::move(stages);
	return response;
}

TopCategoriesResponse PredictionOrchestrator::degradedAnswer(const ForecastRequest &request, std::string reason,
                                                             std::vector<RequestStage> stages) const {
	auto result = reconciler_.reconcile(request.period, request.top_n, false);
	advance(stages, RequestStage::Aggregated);
	advance(stages, RequestStage::Done);

	auto response = fromReconciliation(std::move(result), std::move(stages));
	response.degraded = true;
	response.degraded_reason = std::move(reason);
	response.model_info = modelInfo();
	return response;
}

TopCategoriesResponse PredictionOrchestrator::predictTopCategories(const ForecastRequest &raw_request) const {
	const auto request = withOrderedPeriod(raw_request);
	if (request.top_n <= 0) {
		throw core::ValidationError("top_n must be positive, got " + std::to_string(request.top_n) + ".");
	}
	std::vector<RequestStage> stages;
	advance(stages, RequestStage::Requested);
	SALESCAST_INFO("Predicting top {} categories for {}.", request.top_n, request.period.toString());

	if (!artifact_) {
		SALESCAST_WARN("Model not loaded, returning historical data only.");
		return degradedAnswer(request, "model not loaded", std::move(stages));
	}

	TopCategoriesResponse response;
	try {
		const auto predicted = runForecast(request.period, stages);

		response.period = request.period;
		response.source = core::Provenance::Predicted;
		response.ranking = ranking::rankCategories(ranking::aggregateByCategory(predicted), request.top_n);
		response.quality.predicted_points = predicted.size();
		advance(stages, RequestStage::Aggregated);
	} catch (const core::PredictionFailure &e) {
		SALESCAST_WARN("Prediction for {} failed, falling back to historical data: {}", request.period.toString(),
		               e.what());
		return degradedAnswer(request, std::string("prediction failed: ") + e.what(), std::move(stages));
	} catch (const core::SalescastError &e) {
		advance(stages, RequestStage::Failed);
		SALESCAST_ERROR("Request for {} failed after {} stages: {}", request.period.toString(), stages.size() - 1,
		                e.what());
		throw;
	}
	response.model_info = artifact_->info();

	if (request.include_historical) {
		const auto baseline = request.period.shifted(-request.period.days());
		auto historical = std::make_shared<TopCategoriesResponse>(
		    fromReconciliation(reconciler_.reconcile(baseline, request.top_n), {}));
		response.growth = ranking::growthRate(response.ranking.grand_total, historical->ranking.grand_total);
		response.historical = std::move(historical);
		advance(stages, RequestStage::HistoricalComparisonAttached);
	}

	advance(stages, RequestStage::Done);
	response.stages = std::move(stages);
	SALESCAST_INFO("Predicted total for {}: {}.", request.period.toString(),
	               ranking::formatCurrency(response.ranking.grand_total));
	return response;
}

TopCategoriesResponse PredictionOrchestrator::historicalTopCategories(const HistoricalRequest &raw_request) const {
	const auto request = withOrderedPeriod(raw_request);
	std::vector<RequestStage> stages;
	advance(stages, RequestStage::Requested);

	auto result = reconciler_.reconcile(request.period, request.top_n);
	// The forecast stages only ran when at least one gap chunk was predicted.
	if (result.quality.predicted_points > 0) {
		advance(stages, RequestStage::ContextLoaded);
		advance(stages, RequestStage::FeaturesSynthesized);
		advance(stages, RequestStage::Predicted);
	}
	advance(stages, RequestStage::Aggregated);
	advance(stages, RequestStage::Done);

	auto response = fromReconciliation(std::move(result), std::move(stages));
	if (!response.quality.failed_chunks.empty()) {
		SALESCAST_WARN("{} of {} left unfilled after {} failed chunks.", response.quality.unfilled_points,
		               request.period.toString(), response.quality.failed_chunks.size());
	}
	return response;
}

TopCategoriesResponse PredictionOrchestrator::topCategoriesForRange(const std::string &range, const core::Date &today,
                                                                    int top_n,
                                                                    const std::optional<std::string> &start_date,
                                                                    const std::optional<std::string> &end_date) const {
	const auto preset = core::parseRangePreset(range);
	const auto period = core::periodForPreset(preset, today, start_date, end_date);

	ForecastRequest request;
	request.period = period;
	request.top_n = top_n;
	auto response = predictTopCategories(request);
	response.range = core::rangePresetName(preset);
	return response;
}

TimeSeriesResponse PredictionOrchestrator::timeSeries(const ForecastRequest &raw_request, int historical_days) const {
	if (historical_days < 0) {
		throw core::ValidationError("historical_days must be non-negative, got " + std::to_string(historical_days) +
		                            ".");
	}
	if (raw_request.top_n <= 0) {
		throw core::ValidationError("top_n must be positive, got " + std::to_string(raw_request.top_n) + ".");
	}

	const auto request = withOrderedPeriod(raw_request);

	TimeSeriesResponse response;
	response.period = request.period;

	std::vector<core::DailyRecord> history;
	if (historical_days > 0) {
		response.history_period = request.period.preceding(historical_days);
		history = store_.getRange(*response.history_period);
	}

	std::vector<core::DailyRecord> predicted;
	if (!artifact_) {
		response.degraded = true;
		response.degraded_reason = "model not loaded";
	} else {
		try {
			std::vector<RequestStage> stages;
			predicted = runForecast(request.period, stages);
		} catch (const core::PredictionFailure &e) {
			SALESCAST_WARN("Prediction for {} failed, charting history only: {}", request.period.toString(),
			               e.what());
			response.degraded = true;
			response.degraded_reason = std::string("prediction failed: ") + e.what();
		}
	}

	// Rank on the forecast when there is one, on the charted history otherwise.
	const auto &ranked_rows = response.degraded ? history : predicted;
	const auto top = ranking::rankCategories(ranking::aggregateByCategory(ranked_rows), request.top_n);

	for (const auto &entry : top.entries) {
		CategorySeries series;
		series.category = entry.category;
		for (const auto &record : history) {
			series.historical.emplace_back(record.date, record.amountOr(entry.category));
		}
		for (const auto &record : predicted) {
			series.predicted.emplace_back(record.date, record.amountOr(entry.category));
		}
		response.series.push_back(std::move(series));
	}
	SALESCAST_DEBUG("Time series for {}: {} categories, {} history days, {} predicted days.",
	                request.period.toString(), response.series.size(), history.size(), predicted.size());
	return response;
}

models::ModelInfo PredictionOrchestrator::modelInfo() const {
	return artifact_ ? artifact_->info() : models::ModelInfo();
}

} // namespace salescast::forecast
