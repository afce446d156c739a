#pragma once

#include "salescast/core/config.hpp"
#include "salescast/features/feature_manifest.hpp"
#include "salescast/models/predictor.hpp"

#include <cstddef>
#include <memory>
#include <string>

namespace salescast::models {

/**
 * @struct ModelInfo
 * @brief Descriptive metadata of the loaded model.
 */
struct ModelInfo {
	std::string model_type = "None";
	std::string training_date = "Unknown";
	std::size_t feature_count = 0;
	std::string description = "Model not loaded";
	bool is_loaded = false;
};

/**
 * @class ModelArtifact
 * @brief An immutable bundle of predictor, feature manifest and metadata.
 *
 * Artifacts are loaded once and then shared read-only between requests
 * through std::shared_ptr<const ModelArtifact>.
 */
class ModelArtifact {
public:
	/**
	 * @brief Bundles an already constructed predictor with its manifest.
	 * @throws std::invalid_argument If either is missing or their widths disagree.
	 */
	ModelArtifact(std::shared_ptr<const IPredictor> predictor, std::shared_ptr<const features::FeatureManifest> manifest,
	              ModelInfo info);

	/**
	 * @brief Loads a JSON model file.
	 *
	 * The file holds `model_type`, `training_date`, `description`,
	 * `feature_columns`, `target_categories`, `coefficients`, `intercept` and
	 * `clip_negative`. When @p manifest_path is not empty, the manifest stored
	 * there replaces the model's own `feature_columns`. A model with neither is
	 * assumed to use the standard layout generated from its target categories
	 * and the `lag_days` and `rolling_windows` of @p config.
	 *
	 * @throws core::ConfigurationError If a file is missing or malformed, or the shapes disagree.
	 */
	static std::shared_ptr<const ModelArtifact> load(const std::string &model_path,
	                                                 const std::string &manifest_path = std::string(),
	                                                 const core::EngineConfig &config = core::EngineConfig());

	const IPredictor &predictor() const {
		return *predictor_;
	}

	const std::shared_ptr<const features::FeatureManifest> &manifest() const {
		return manifest_;
	}

	const ModelInfo &info() const {
		return info_;
	}

private:
	std::shared_ptr<const IPredictor> predictor_;
	std::shared_ptr<const features::FeatureManifest> manifest_;
	ModelInfo info_;
};

} // namespace salescast::models
