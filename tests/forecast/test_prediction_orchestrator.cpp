#include "common/catch.hpp"

#include "salescast/core/errors.hpp"
#include "salescast/forecast/prediction_orchestrator.hpp"
#include "salescast/storage/in_memory_store.hpp"
#include "common/fake_predictors.hpp"
#include "common/sales_helpers.hpp"

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

using salescast::core::EngineConfig;
using salescast::core::Provenance;
using salescast::forecast::ForecastRequest;
using salescast::forecast::HistoricalRequest;
using salescast::forecast::PredictionOrchestrator;
using salescast::forecast::RequestStage;
using salescast::models::ModelArtifact;
using salescast::storage::InMemoryHistoricalStore;
using tests::helpers::dailyPoints;
using tests::helpers::day;
using tests::helpers::lagOneArtifact;
using tests::helpers::period;

namespace {

bool hasStage(const std::vector<RequestStage> &stages, RequestStage stage) {
	return std::find(stages.begin(), stages.end(), stage) != stages.end();
}

std::shared_ptr<const ModelArtifact> artifactWith(std::shared_ptr<const salescast::models::IPredictor> predictor,
                                                  std::vector<std::string> columns) {
	auto manifest = std::make_shared<const salescast::features::FeatureManifest>(std::move(columns));
	return std::make_shared<const ModelArtifact>(std::move(predictor), std::move(manifest),
	                                             salescast::models::ModelInfo());
}

ForecastRequest forecastFor(const std::string &start, const std::string &end, int top_n = 5) {
	ForecastRequest request;
	request.period = period(start, end);
	request.top_n = top_n;
	return request;
}

} // namespace

TEST_CASE("Historical gaps are filled with the model", "[forecast][orchestrator][end_to_end]") {
	InMemoryHistoricalStore store(dailyPoints("Electronics", "2024-01-01", {100.0, 200.0, 150.0, 0.0, 180.0}));
	PredictionOrchestrator orchestrator(store, lagOneArtifact({"Electronics"}), EngineConfig());

	HistoricalRequest request;
	request.period = period("2024-01-03", "2024-01-06");
	request.top_n = 2;
	const auto response = orchestrator.historicalTopCategories(request);

	// Only 2024-01-06 is missing; lag-1 persistence predicts it as 180.
	REQUIRE(response.quality.historical_points == 3);
	REQUIRE(response.quality.predicted_points == 1);
	REQUIRE(response.quality.completeness_pct == Catch::Approx(75.0));
	REQUIRE(response.quality.failed_chunks.empty());
	REQUIRE(response.ranking.grand_total == Catch::Approx(330.0 + 180.0));
	REQUIRE(response.ranking.entries.size() == 1);
	REQUIRE(response.ranking.entries[0].category == "Electronics");
	REQUIRE(response.ranking.entries[0].percentage == Catch::Approx(100.0));
	REQUIRE(response.source == Provenance::Historical);
	REQUIRE_FALSE(response.degraded);
	REQUIRE(response.stages == std::vector<RequestStage>{RequestStage::Requested, RequestStage::ContextLoaded,
	                                                     RequestStage::FeaturesSynthesized, RequestStage::Predicted,
	                                                     RequestStage::Aggregated, RequestStage::Done});

	// A fully recorded period never reaches the model.
	request.period = period("2024-01-01", "2024-01-05");
	const auto recorded = orchestrator.historicalTopCategories(request);
	REQUIRE(recorded.quality.predicted_points == 0);
	REQUIRE(recorded.stages ==
	        std::vector<RequestStage>{RequestStage::Requested, RequestStage::Aggregated, RequestStage::Done});
}

TEST_CASE("Forecasts feed each prediction into the next date", "[forecast][orchestrator][recursive]") {
	InMemoryHistoricalStore store(dailyPoints("Books", "2024-01-01", {100.0, 200.0, 150.0, 0.0, 180.0}));
	PredictionOrchestrator orchestrator(store, lagOneArtifact({"Books"}, 1.0, 10.0), EngineConfig());

	const auto response = orchestrator.predictTopCategories(forecastFor("2024-01-06", "2024-01-08"));

	// 190, 200, 210: every day builds on the one predicted before it.
	REQUIRE(response.source == Provenance::Predicted);
	REQUIRE_FALSE(response.degraded);
	REQUIRE(response.ranking.grand_total == Catch::Approx(600.0));
	REQUIRE(response.quality.predicted_points == 3);
	REQUIRE(response.quality.historical_points == 0);
	REQUIRE(response.model_info.has_value());
	REQUIRE(response.model_info->is_loaded);
	REQUIRE(response.stages == std::vector<RequestStage>{RequestStage::Requested, RequestStage::ContextLoaded,
	                                                     RequestStage::FeaturesSynthesized, RequestStage::Predicted,
	                                                     RequestStage::Aggregated, RequestStage::Done});
}

TEST_CASE("Batched inference predicts the whole period at once", "[forecast][orchestrator][batch]") {
	InMemoryHistoricalStore store(dailyPoints("Books", "2024-01-01", {100.0, 200.0, 150.0, 0.0, 180.0}));
	EngineConfig config;
	config.batch_inference = true;

	auto predictor = std::make_shared<tests::fixtures::FixedRowPredictor>(1, std::vector<std::string>{"Books"},
	                                                                      std::vector<double>{7.0});
	PredictionOrchestrator orchestrator(store, artifactWith(predictor, {"Books_lag_1"}), config);

	const auto response = orchestrator.predictTopCategories(forecastFor("2024-01-06", "2024-01-10"));
	REQUIRE(predictor->calls() == 1);
	REQUIRE(response.ranking.grand_total == Catch::Approx(35.0));

	// A model that cannot batch is still called once per date.
	auto unbatched = std::make_shared<tests::fixtures::FixedRowPredictor>(
	    1, std::vector<std::string>{"Books"}, std::vector<double>{7.0}, false);
	PredictionOrchestrator fallback(store, artifactWith(unbatched, {"Books_lag_1"}), config);
	fallback.predictTopCategories(forecastFor("2024-01-06", "2024-01-10"));
	REQUIRE(unbatched->calls() == 5);
}

TEST_CASE("Context reaches back as far as the longest feature", "[forecast][orchestrator]") {
	InMemoryHistoricalStore store(dailyPoints("Books", "2024-01-01", {100.0}));
	EngineConfig config;
	config.context_days = 1;

	auto predictor = std::make_shared<tests::fixtures::FixedRowPredictor>(1, std::vector<std::string>{"Books"},
	                                                                      std::vector<double>{7.0});
	PredictionOrchestrator weekly(store, artifactWith(predictor, {"Books_lag_7"}), config);
	const auto response = weekly.predictTopCategories(forecastFor("2024-01-06", "2024-01-07"));
	REQUIRE_FALSE(response.degraded);
	REQUIRE(response.ranking.grand_total == Catch::Approx(14.0));

	PredictionOrchestrator daily(store, lagOneArtifact({"Books"}), config);
	REQUIRE_THROWS_AS(daily.predictTopCategories(forecastFor("2024-01-06", "2024-01-07")),
	                  salescast::core::NoContextError);
}

TEST_CASE("Forecasts without history fail with NoContextError", "[forecast][orchestrator]") {
	InMemoryHistoricalStore store(dailyPoints("Books", "2024-01-01", {100.0}));
	PredictionOrchestrator orchestrator(store, lagOneArtifact({"Books"}), EngineConfig());

	REQUIRE_THROWS_AS(orchestrator.predictTopCategories(forecastFor("2025-01-01", "2025-01-07")),
	                  salescast::core::NoContextError);
	REQUIRE_THROWS_AS(orchestrator.forecastChunk(period("2025-01-01", "2025-01-02")),
	                  salescast::core::NoContextError);
}

TEST_CASE("Forecasts degrade to history without a model", "[forecast][orchestrator][degraded]") {
	InMemoryHistoricalStore store(dailyPoints("Books", "2024-01-01", {10.0, 20.0}));
	PredictionOrchestrator orchestrator(store, nullptr, EngineConfig());
	REQUIRE_FALSE(orchestrator.hasModel());

	const auto response = orchestrator.predictTopCategories(forecastFor("2024-01-01", "2024-01-03"));
	REQUIRE(response.degraded);
	REQUIRE(response.degraded_reason == "model not loaded");
	REQUIRE(response.source == Provenance::Historical);
	REQUIRE(response.ranking.grand_total == Catch::Approx(30.0));
	REQUIRE(response.quality.unfilled_points == 1);
	REQUIRE_FALSE(response.model_info->is_loaded);

	REQUIRE_THROWS_AS(orchestrator.forecastChunk(period("2024-01-03", "2024-01-03")),
	                  salescast::core::PredictionFailure);
}

TEST_CASE("Forecasts degrade when the model fails", "[forecast][orchestrator][degraded]") {
	InMemoryHistoricalStore store(dailyPoints("Books", "2024-01-01", {10.0, 20.0, 30.0}));

	SECTION("predictor throws") {
		auto predictor =
		    std::make_shared<tests::fixtures::ThrowingPredictor>(1, std::vector<std::string>{"Books"});
		PredictionOrchestrator orchestrator(store, artifactWith(predictor, {"Books_lag_1"}), EngineConfig());

		const auto response = orchestrator.predictTopCategories(forecastFor("2024-01-02", "2024-01-04"));
		REQUIRE(response.degraded);
		REQUIRE(response.degraded_reason.find("prediction failed") == 0);
		REQUIRE(response.ranking.grand_total == Catch::Approx(50.0));
		REQUIRE(hasStage(response.stages, RequestStage::ContextLoaded));
		REQUIRE_FALSE(hasStage(response.stages, RequestStage::Predicted));
	}
	SECTION("predictor returns the wrong shape") {
		auto predictor = std::make_shared<tests::fixtures::FixedRowPredictor>(
		    1, std::vector<std::string>{"Books"}, std::vector<double>{1.0, 2.0});
		PredictionOrchestrator orchestrator(store, artifactWith(predictor, {"Books_lag_1"}), EngineConfig());

		const auto response = orchestrator.predictTopCategories(forecastFor("2024-01-04", "2024-01-05"));
		REQUIRE(response.degraded);
		REQUIRE_THROWS_AS(orchestrator.forecastChunk(period("2024-01-04", "2024-01-05")),
		                  salescast::core::PredictionFailure);
	}
	SECTION("a failing model leaves historical gaps unfilled") {
		auto predictor =
		    std::make_shared<tests::fixtures::ThrowingPredictor>(1, std::vector<std::string>{"Books"});
		PredictionOrchestrator orchestrator(store, artifactWith(predictor, {"Books_lag_1"}), EngineConfig());

		HistoricalRequest request;
		request.period = period("2024-01-01", "2024-01-05");
		const auto response = orchestrator.historicalTopCategories(request);
		REQUIRE(response.quality.failed_chunks.size() == 1);
		REQUIRE(response.quality.unfilled_points == 2);
		REQUIRE(response.ranking.grand_total == Catch::Approx(60.0));
	}
}

TEST_CASE("Forecasts attach the preceding period and growth", "[forecast][orchestrator][comparison]") {
	InMemoryHistoricalStore store(
	    dailyPoints("Books", "2024-01-01", {10.0, 10.0, 10.0, 10.0, 10.0, 10.0, 10.0, 10.0, 10.0, 10.0}));
	PredictionOrchestrator orchestrator(store, lagOneArtifact({"Books"}, 1.0, 10.0), EngineConfig());

	auto request = forecastFor("2024-01-11", "2024-01-15");
	request.include_historical = true;
	const auto response = orchestrator.predictTopCategories(request);

	// Forecast 20 + 30 + 40 + 50 + 60 against a baseline of 5 x 10.
	REQUIRE(response.ranking.grand_total == Catch::Approx(200.0));
	REQUIRE(response.historical);
	REQUIRE(response.historical->period == period("2024-01-06", "2024-01-10"));
	REQUIRE(response.historical->ranking.grand_total == Catch::Approx(50.0));
	REQUIRE(response.historical->quality.completeness_pct == Catch::Approx(100.0));
	REQUIRE(response.growth.has_value());
	REQUIRE(response.growth->percentage == Catch::Approx(300.0));
	REQUIRE(hasStage(response.stages, RequestStage::HistoricalComparisonAttached));
}

TEST_CASE("Range presets forecast forward from today", "[forecast][orchestrator][range]") {
	InMemoryHistoricalStore store(dailyPoints("Books", "2024-01-01", {10.0, 10.0, 10.0}));
	PredictionOrchestrator orchestrator(store, lagOneArtifact({"Books"}), EngineConfig());

	const auto week = orchestrator.topCategoriesForRange("week", day(2024, 1, 4), 3);
	REQUIRE(week.range == "week");
	REQUIRE(week.period == period("2024-01-04", "2024-01-10"));
	REQUIRE(week.ranking.grand_total == Catch::Approx(70.0));

	const auto custom = orchestrator.topCategoriesForRange("custom", day(2024, 1, 4), 3, std::string("2024-01-05"),
	                                                       std::string("2024-01-04"));
	REQUIRE(custom.period == period("2024-01-04", "2024-01-05"));

	REQUIRE_THROWS_AS(orchestrator.topCategoriesForRange("fortnight", day(2024, 1, 4), 3),
	                  salescast::core::ValidationError);
	REQUIRE_THROWS_AS(orchestrator.topCategoriesForRange("custom", day(2024, 1, 4), 3),
	                  salescast::core::ValidationError);
}

TEST_CASE("Time series charts history and forecast for the top categories", "[forecast][orchestrator][series]") {
	auto points = dailyPoints("Books", "2024-01-01", {10.0, 20.0, 30.0});
	tests::helpers::append(points, dailyPoints("Toys", "2024-01-01", {1.0, 1.0, 1.0}));
	InMemoryHistoricalStore store(points);
	PredictionOrchestrator orchestrator(store, lagOneArtifact({"Books", "Toys"}), EngineConfig());

	const auto response = orchestrator.timeSeries(forecastFor("2024-01-04", "2024-01-05", 1), 2);
	REQUIRE_FALSE(response.degraded);
	REQUIRE(response.history_period.has_value());
	REQUIRE(*response.history_period == period("2024-01-02", "2024-01-03"));
	REQUIRE(response.series.size() == 1);
	REQUIRE(response.series[0].category == "Books");
	REQUIRE(response.series[0].historical.size() == 2);
	REQUIRE(response.series[0].historical.back().second == 30.0);
	REQUIRE(response.series[0].predicted.size() == 2);
	REQUIRE(response.series[0].predicted.front().first == day(2024, 1, 4));
	REQUIRE(response.series[0].predicted.front().second == Catch::Approx(30.0));

	REQUIRE_THROWS_AS(orchestrator.timeSeries(forecastFor("2024-01-04", "2024-01-05"), -1),
	                  salescast::core::ValidationError);

	PredictionOrchestrator unloaded(store, nullptr, EngineConfig());
	const auto history_only = unloaded.timeSeries(forecastFor("2024-01-04", "2024-01-05", 2), 3);
	REQUIRE(history_only.degraded);
	REQUIRE(history_only.series.size() == 2);
	REQUIRE(history_only.series[0].predicted.empty());
}

TEST_CASE("Orchestrator validates requests and settings", "[forecast][orchestrator]") {
	InMemoryHistoricalStore store(dailyPoints("Books", "2024-01-01", {10.0}));
	PredictionOrchestrator orchestrator(store, lagOneArtifact({"Books"}), EngineConfig());

	REQUIRE_THROWS_AS(orchestrator.predictTopCategories(forecastFor("2024-01-02", "2024-01-03", 0)),
	                  salescast::core::ValidationError);

	HistoricalRequest request;
	request.period = period("2024-01-01", "2024-01-01");
	request.top_n = -1;
	REQUIRE_THROWS_AS(orchestrator.historicalTopCategories(request), salescast::core::ValidationError);

	EngineConfig invalid;
	invalid.context_days = 0;
	REQUIRE_THROWS_AS(PredictionOrchestrator(store, nullptr, invalid), salescast::core::ConfigurationError);

	REQUIRE(orchestrator.modelInfo().is_loaded);
	REQUIRE(orchestrator.modelInfo().feature_count == 1);
}

TEST_CASE("Reversed periods are swapped before they reach the store", "[forecast][orchestrator][period]") {
	InMemoryHistoricalStore store(dailyPoints("Books", "2024-01-01", {10.0, 20.0, 30.0, 40.0, 50.0}));
	PredictionOrchestrator orchestrator(store, lagOneArtifact({"Books"}), EngineConfig());

	HistoricalRequest historical;
	historical.period = period("2024-01-05", "2024-01-01");
	const auto past = orchestrator.historicalTopCategories(historical);
	REQUIRE(past.period == period("2024-01-01", "2024-01-05"));
	REQUIRE(past.quality.historical_points == 5);
	REQUIRE(past.ranking.grand_total == Catch::Approx(150.0));

	const auto forecast = orchestrator.predictTopCategories(forecastFor("2024-01-08", "2024-01-06"));
	REQUIRE(forecast.period == period("2024-01-06", "2024-01-08"));
	REQUIRE(forecast.period.days() == 3);
	REQUIRE(forecast.quality.predicted_points == 3);
	REQUIRE(forecast.ranking.grand_total == Catch::Approx(150.0));

	const auto series = orchestrator.timeSeries(forecastFor("2024-01-07", "2024-01-06"), 0);
	REQUIRE(series.period == period("2024-01-06", "2024-01-07"));
	REQUIRE_FALSE(series.history_period.has_value());
	REQUIRE(series.series.front().historical.empty());
	REQUIRE(series.series.front().predicted.size() == 2);
}
