#include "salescast/service/response_json.hpp"
#include "salescast/ranking/category_ranker.hpp"

#include <memory>
#include <sstream>

namespace salescast::service {

namespace {

Json::Value periodJson(const core::Period &period) {
	Json::Value value(Json::objectValue);
	value["start_date"] = period.start.toString();
	value["end_date"] = period.end.toString();
	value["days"] = static_cast<Json::Int64>(period.days());
	return value;
}

Json::Value categoriesJson(const ranking::RankedCategories &ranked) {
	Json::Value entries(Json::arrayValue);
	for (const auto &entry : ranked.entries) {
		Json::Value item(Json::objectValue);
		item["category"] = entry.category;
		item["amount"] = entry.amount;
		item["amount_formatted"] = ranking::formatCurrency(entry.amount);
		item["percentage"] = entry.percentage;
		item["percentage_formatted"] = ranking::formatPercentage(entry.percentage);
		entries.append(item);
	}
	return entries;
}

Json::Value qualityJson(const gapfill::DataQuality &quality) {
	Json::Value value(Json::objectValue);
	value["historical_points"] = static_cast<Json::UInt64>(quality.historical_points);
	value["predicted_points"] = static_cast<Json::UInt64>(quality.predicted_points);
	value["completeness_pct"] = quality.completeness_pct;
	value["unfilled_points"] = static_cast<Json::UInt64>(quality.unfilled_points);
	Json::Value failed(Json::arrayValue);
	for (const auto &chunk : quality.failed_chunks) {
		failed.append(periodJson(chunk));
	}
	value["failed_chunks"] = failed;
	return value;
}

Json::Value growthJson(const ranking::GrowthRate &growth) {
	Json::Value value(Json::objectValue);
	value["percentage"] = growth.infinite ? Json::Value(Json::nullValue) : Json::Value(growth.percentage);
	value["infinite"] = growth.infinite;
	value["formatted"] = growth.formatted();
	return value;
}

Json::Value seriesJson(const std::vector<std::pair<core::Date, double>> &points) {
	Json::Value values(Json::arrayValue);
	for (const auto &point : points) {
		Json::Value item(Json::objectValue);
		item["date"] = point.first.toString();
		item["amount"] = point.second;
		values.append(item);
	}
	return values;
}

} // namespace

Json::Value toJson(const forecast::TopCategoriesResponse &response) {
	Json::Value root(Json::objectValue);
	root["period"] = periodJson(response.period);
	root["total_amount"] = response.ranking.grand_total;
	root["total_amount_formatted"] = ranking::formatCurrency(response.ranking.grand_total);
	root["top_categories"] = categoriesJson(response.ranking);
	root["data_quality"] = qualityJson(response.quality);
	root["source"] = core::provenanceName(response.source);
	root["degraded"] = response.degraded;
	if (response.degraded) {
		root["degraded_reason"] = response.degraded_reason;
	}
	if (!response.range.empty()) {
		root["range"] = response.range;
	}
	if (response.historical) {
		root["historical"] = toJson(*response.historical);
	}
	if (response.growth) {
		root["growth"] = growthJson(*response.growth);
	}
	if (response.model_info) {
		root["model_info"] = toJson(*response.model_info);
	}

	Json::Value stages(Json::arrayValue);
	for (auto stage : response.stages) {
		stages.append(forecast::requestStageName(stage));
	}
	root["stages"] = stages;
	return root;
}

Json::Value toJson(const forecast::TimeSeriesResponse &response) {
	Json::Value root(Json::objectValue);
	root["period"] = periodJson(response.period);
	root["history_period"] =
	    response.history_period ? periodJson(*response.history_period) : Json::Value(Json::nullValue);
	root["degraded"] = response.degraded;
	if (response.degraded) {
		root["degraded_reason"] = response.degraded_reason;
	}

	Json::Value series(Json::arrayValue);
	for (const auto &entry : response.series) {
		Json::Value item(Json::objectValue);
		item["category"] = entry.category;
		item["historical"] = seriesJson(entry.historical);
		item["predicted"] = seriesJson(entry.predicted);
		series.append(item);
	}
	root["series"] = series;
	return root;
}

Json::Value toJson(const models::ModelInfo &info) {
	Json::Value root(Json::objectValue);
	root["model_type"] = info.model_type;
	root["training_date"] = info.training_date;
	root["feature_count"] = static_cast<Json::UInt64>(info.feature_count);
	root["description"] = info.description;
	root["is_loaded"] = info.is_loaded;
	return root;
}

Json::Value toJson(const storage::IHistoricalStore &store) {
	Json::Value root(Json::objectValue);
	Json::Value names(Json::arrayValue);
	for (const auto &name : store.categories()) {
		names.append(name);
	}
	root["categories"] = names;
	const auto coverage = store.coverage();
	root["coverage"] = coverage ? periodJson(*coverage) : Json::Value(Json::nullValue);
	return root;
}

Json::Value errorJson(const std::string &type, const std::string &message) {
	Json::Value error(Json::objectValue);
	error["type"] = type;
	error["message"] = message;
	Json::Value root(Json::objectValue);
	root["error"] = error;
	return root;
}

std::string render(const Json::Value &value, bool pretty) {
	Json::StreamWriterBuilder builder;
	builder["indentation"] = pretty ? "  " : "";
	builder["precision"] = 12;
	std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
	std::ostringstream out;
	writer->write(value, &out);
	return out.str();
}

} // namespace salescast::service
