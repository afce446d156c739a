#include "salescast/core/config.hpp"
#include "salescast/core/errors.hpp"
#include "salescast/utils/logging.hpp"

#include <json/json.h>

#include <fstream>

namespace salescast::core {

namespace {

std::vector<int> readIntArray(const Json::Value &value, const std::string &key) {
	if (!value.isArray()) {
		throw ConfigurationError("'" + key + "' must be an array of integers.");
	}
	std::vector<int> result;
	result.reserve(value.size());
	for (const auto &item : value) {
		if (!item.isInt()) {
			throw ConfigurationError("'" + key + "' must be an array of integers.");
		}
		result.push_back(item.asInt());
	}
	return result;
}

int readInt(const Json::Value &root, const std::string &key, int fallback) {
	if (!root.isMember(key)) {
		return fallback;
	}
	if (!root[key].isInt()) {
		throw ConfigurationError("'" + key + "' must be an integer.");
	}
	return root[key].asInt();
}

std::string readString(const Json::Value &root, const std::string &key, const std::string &fallback) {
	if (!root.isMember(key)) {
		return fallback;
	}
	if (!root[key].isString()) {
		throw ConfigurationError("'" + key + "' must be a string.");
	}
	return root[key].asString();
}

} // namespace

void EngineConfig::validate() const {
	for (int lag : lag_days) {
		if (lag <= 0) {
			throw ConfigurationError("Lag days must be positive, got " + std::to_string(lag) + ".");
		}
	}
	for (int window : rolling_windows) {
		if (window <= 0) {
			throw ConfigurationError("Rolling windows must be positive, got " + std::to_string(window) + ".");
		}
	}
	if (context_days <= 0) {
		throw ConfigurationError("context_days must be positive.");
	}
	if (default_forecast_days <= 0) {
		throw ConfigurationError("default_forecast_days must be positive.");
	}
	if (default_top_n <= 0) {
		throw ConfigurationError("default_top_n must be positive.");
	}
	if (special_month < 1 || special_month > 12) {
		throw ConfigurationError("special_month must be between 1 and 12.");
	}
	if (max_chunk_days < 0) {
		throw ConfigurationError("max_chunk_days must be non-negative.");
	}
}

EngineConfig loadEngineConfig(const std::string &path) {
	std::ifstream input(path);
	if (!input) {
		throw ConfigurationError("Cannot open config file '" + path + "'.");
	}

	Json::CharReaderBuilder builder;
	Json::Value root;
	std::string errors;
	if (!Json::parseFromStream(builder, input, &root, &errors)) {
		throw ConfigurationError("Cannot parse config file '" + path + "': " + errors);
	}
	if (!root.isObject()) {
		throw ConfigurationError("Config file '" + path + "' must contain a JSON object.");
	}

	EngineConfig config;
	if (root.isMember("lag_days")) {
		config.lag_days = readIntArray(root["lag_days"], "lag_days");
	}
	if (root.isMember("rolling_windows")) {
		config.rolling_windows = readIntArray(root["rolling_windows"], "rolling_windows");
	}
	config.context_days = readInt(root, "context_days", config.context_days);
	config.default_forecast_days = readInt(root, "default_forecast_days", config.default_forecast_days);
	config.default_top_n = readInt(root, "default_top_n", config.default_top_n);
	config.special_month = readInt(root, "special_month", config.special_month);
	config.max_chunk_days = readInt(root, "max_chunk_days", config.max_chunk_days);
	if (root.isMember("cold_start_value")) {
		if (!root["cold_start_value"].isNumeric()) {
			throw ConfigurationError("'cold_start_value' must be a number.");
		}
		config.cold_start_value = root["cold_start_value"].asDouble();
	}
	if (root.isMember("batch_inference")) {
		if (!root["batch_inference"].isBool()) {
			throw ConfigurationError("'batch_inference' must be a boolean.");
		}
		config.batch_inference = root["batch_inference"].asBool();
	}
	config.model_path = readString(root, "model_path", config.model_path);
	config.manifest_path = readString(root, "manifest_path", config.manifest_path);
	config.database_path = readString(root, "database_path", config.database_path);

	config.validate();
	SALESCAST_DEBUG("Loaded engine config from {} (context {} days, {} lags, {} windows).", path,
	                config.context_days, config.lag_days.size(), config.rolling_windows.size());
	return config;
}

} // namespace salescast::core
