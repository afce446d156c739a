#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace salescast::core {

/**
 * @struct EngineConfig
 * @brief Tunables shared by the feature synthesizer, gap filler and orchestrator.
 */
struct EngineConfig {
	/// Lags (days) used when a feature manifest is generated rather than loaded.
	std::vector<int> lag_days{1, 7, 14, 28};
	/// Rolling windows (days) used when a feature manifest is generated.
	std::vector<int> rolling_windows{7, 14, 28};
	/// Days of history loaded before a period to seed lag and rolling features.
	int context_days = 60;
	/// Period length used when a request gives no start date.
	int default_forecast_days = 30;
	int default_top_n = 5;
	/// Value used when a lag or rolling window finds no data.
	double cold_start_value = 0.0;
	/// Month flagged by the `is_special_month` calendar feature.
	int special_month = 11;
	/// Longest gap-fill chunk in days; 0 leaves contiguous runs unsplit.
	int max_chunk_days = 31;
	/// Predict the whole period in one batched call instead of day by day.
	bool batch_inference = false;

	std::string model_path;
	std::string manifest_path;
	std::string database_path;

	/**
	 * @brief Checks the numeric settings.
	 * @throws ConfigurationError If a lag, window or count is not positive.
	 */
	void validate() const;
};

/**
 * @brief Loads an EngineConfig from a JSON object; absent keys keep their defaults.
 * @throws ConfigurationError If the file is missing, malformed or fails validation.
 */
EngineConfig loadEngineConfig(const std::string &path);

} // namespace salescast::core
