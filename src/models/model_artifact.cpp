#include "salescast/models/model_artifact.hpp"
#include "salescast/core/errors.hpp"
#include "salescast/models/linear_predictor.hpp"
#include "salescast/utils/logging.hpp"

#include <json/json.h>

#include <fstream>
#include <stdexcept>
#include <vector>

namespace salescast::models {

namespace {

Json::Value readJsonFile(const std::string &path, const std::string &what) {
	std::ifstream input(path);
	if (!input) {
		throw core::ConfigurationError("Cannot open " + what + " '" + path + "'.");
	}
	Json::CharReaderBuilder builder;
	Json::Value root;
	std::string errors;
	if (!Json::parseFromStream(builder, input, &root, &errors)) {
		throw core::ConfigurationError("Cannot parse " + what + " '" + path + "': " + errors);
	}
	return root;
}

std::vector<std::string> readStrings(const Json::Value &value, const std::string &key) {
	if (!value.isArray()) {
		throw core::ConfigurationError("'" + key + "' must be an array of strings.");
	}
	std::vector<std::string> result;
	result.reserve(value.size());
	for (const auto &item : value) {
		if (!item.isString()) {
			throw core::ConfigurationError("'" + key + "' must be an array of strings.");
		}
		result.push_back(item.asString());
	}
	return result;
}

std::vector<double> readNumbers(const Json::Value &value, const std::string &key) {
	if (!value.isArray()) {
		throw core::ConfigurationError("'" + key + "' must be an array of numbers.");
	}
	std::vector<double> result;
	result.reserve(value.size());
	for (const auto &item : value) {
		if (!item.isNumeric()) {
			throw core::ConfigurationError("'" + key + "' must be an array of numbers.");
		}
		result.push_back(item.asDouble());
	}
	return result;
}

std::string readText(const Json::Value &root, const std::string &key, const std::string &fallback) {
	if (!root.isMember(key)) {
		return fallback;
	}
	if (!root[key].isString()) {
		throw core::ConfigurationError("'" + key + "' must be a string.");
	}
	return root[key].asString();
}

} // namespace

ModelArtifact::ModelArtifact(std::shared_ptr<const IPredictor> predictor,
                             std::shared_ptr<const features::FeatureManifest> manifest, ModelInfo info)
    : predictor_(std::move(predictor)), manifest_(std::move(manifest)), info_(std::move(info)) {
	if (!predictor_ || !manifest_) {
		throw std::invalid_argument("A model artifact needs both a predictor and a feature manifest.");
	}
	if (predictor_->featureCount() != manifest_->size()) {
		throw std::invalid_argument("Predictor expects " + std::to_string(predictor_->featureCount()) +
		                            " features but the manifest lists " + std::to_string(manifest_->size()) + ".");
	}
	info_.feature_count = manifest_->size();
	info_.is_loaded = true;
}

std::shared_ptr<const ModelArtifact> ModelArtifact::load(const std::string &model_path,
                                                         const std::string &manifest_path,
                                                         const core::EngineConfig &config) {
	const Json::Value root = readJsonFile(model_path, "model file");
	if (!root.isObject()) {
		throw core::ConfigurationError("Model file '" + model_path + "' must contain a JSON object.");
	}

	ModelInfo info;
	info.model_type = readText(root, "model_type", "LinearRegression");
	info.training_date = readText(root, "training_date", "Unknown");
	info.description = readText(root, "description", "");

	if (info.model_type != "LinearRegression") {
		throw core::ConfigurationError("Unsupported model type '" + info.model_type + "'.");
	}
	if (!root.isMember("target_categories") || !root.isMember("coefficients")) {
		throw core::ConfigurationError("Model file '" + model_path +
		                               "' must define 'target_categories' and 'coefficients'.");
	}

	const auto targets = readStrings(root["target_categories"], "target_categories");

	std::shared_ptr<const features::FeatureManifest> manifest;
	try {
		if (!manifest_path.empty()) {
			manifest = std::make_shared<const features::FeatureManifest>(
			    features::FeatureManifest::loadFromFile(manifest_path));
		} else if (root.isMember("feature_columns")) {
			manifest = std::make_shared<const features::FeatureManifest>(
			    readStrings(root["feature_columns"], "feature_columns"));
		} else {
			manifest = std::make_shared<const features::FeatureManifest>(
			    features::FeatureManifest::generate(targets, config.lag_days, config.rolling_windows));
			SALESCAST_INFO("Model file '{}' lists no feature columns; using the {} generated columns.", model_path,
			               manifest->size());
		}
	} catch (const std::invalid_argument &e) {
		throw core::ConfigurationError(std::string("Invalid feature manifest: ") + e.what());
	}

	const Json::Value &coefficient_rows = root["coefficients"];
	if (!coefficient_rows.isArray()) {
		throw core::ConfigurationError("'coefficients' must be an array of rows.");
	}
	std::vector<std::vector<double>> coefficients;
	coefficients.reserve(coefficient_rows.size());
	for (const auto &row : coefficient_rows) {
		coefficients.push_back(readNumbers(row, "coefficients"));
	}

	LinearPredictorBuilder builder;
	builder.withTargets(targets).withCoefficients(coefficients);
	if (root.isMember("intercept")) {
		builder.withIntercept(readNumbers(root["intercept"], "intercept"));
	}
	if (root.isMember("clip_negative")) {
		if (!root["clip_negative"].isBool()) {
			throw core::ConfigurationError("'clip_negative' must be a boolean.");
		}
		builder.withNegativeClipping(root["clip_negative"].asBool());
	}

	std::shared_ptr<const ModelArtifact> artifact;
	try {
		std::shared_ptr<const IPredictor> predictor = builder.build();
		artifact = std::make_shared<const ModelArtifact>(std::move(predictor), std::move(manifest), std::move(info));
	} catch (const std::invalid_argument &e) {
		throw core::ConfigurationError("Model file '" + model_path + "' is inconsistent: " + e.what());
	}

	SALESCAST_INFO("Loaded model: {}", artifact->info().model_type);
	SALESCAST_INFO("Feature count: {}", artifact->info().feature_count);
	return artifact;
}

} // namespace salescast::models
