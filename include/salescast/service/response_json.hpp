#pragma once

#include "salescast/forecast/prediction_orchestrator.hpp"
#include "salescast/models/model_artifact.hpp"
#include "salescast/storage/historical_store.hpp"

#include <json/json.h>

#include <string>

namespace salescast::service {

/**
 * @brief Serializes a top-categories answer.
 *
 * Keys: period, total_amount, total_amount_formatted, top_categories,
 * data_quality, source, degraded, stages, plus degraded_reason, range,
 * historical, growth and model_info when they apply.
 */
Json::Value toJson(const forecast::TopCategoriesResponse &response);

Json::Value toJson(const forecast::TimeSeriesResponse &response);

Json::Value toJson(const models::ModelInfo &info);

/// `{"categories": [...], "coverage": {start_date, end_date, days} | null}` for a store.
Json::Value toJson(const storage::IHistoricalStore &store);

/// `{"error": {"type": ..., "message": ...}}`
Json::Value errorJson(const std::string &type, const std::string &message);

/**
 * @brief Writes @p value as text. Keys are emitted in sorted order, so equal
 *        values always produce identical bytes.
 */
std::string render(const Json::Value &value, bool pretty = true);

} // namespace salescast::service
