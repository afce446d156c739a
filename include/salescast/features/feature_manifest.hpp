#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace salescast::features {

enum class FeatureKind {
	Year,
	Month,
	Day,
	DayOfWeek,
	IsWeekend,
	WeekOfYear,
	Quarter,
	IsMonthStart,
	IsMonthEnd,
	IsSpecialMonth,
	Lag,
	RollingMean,
	RollingStd,
	Unknown
};

/**
 * @struct FeatureSpec
 * @brief The parsed meaning of one manifest column.
 *
 * For lag and rolling columns @c category names the series and @c days holds
 * the lag or window length. Calendar and unknown columns leave both empty.
 */
struct FeatureSpec {
	std::string name;
	FeatureKind kind = FeatureKind::Unknown;
	std::string category;
	int days = 0;

	bool isCalendar() const {
		return kind != FeatureKind::Lag && kind != FeatureKind::RollingMean && kind != FeatureKind::RollingStd &&
		       kind != FeatureKind::Unknown;
	}
};

/**
 * @brief Parses a column name into a FeatureSpec.
 *
 * Recognised forms are the calendar names, `<category>_lag_<N>`,
 * `<category>_rolling_mean_<W>` (or `_rolling_avg_`) and `<category>_rolling_std_<W>`,
 * with an optional trailing `d` on the number. Anything else is Unknown.
 */
FeatureSpec parseFeatureName(const std::string &name);

/**
 * @class FeatureManifest
 * @brief The ordered list of feature names a trained predictor expects.
 *
 * The manifest is the sole contract between the feature synthesizer and the
 * predictor: synthesized vectors follow its order exactly.
 */
class FeatureManifest {
public:
	FeatureManifest() = default;

	/**
	 * @brief Builds a manifest from explicit names.
	 * @throws std::invalid_argument If a name is empty or repeated.
	 */
	explicit FeatureManifest(std::vector<std::string> names);

	/**
	 * @brief Builds the default manifest: calendar columns, then lags, then rolling stats per category.
	 */
	static FeatureManifest generate(const std::vector<std::string> &categories, const std::vector<int> &lag_days,
	                                const std::vector<int> &rolling_windows);

	/**
	 * @brief Loads a manifest from a JSON file holding either an array of names or
	 *        an object with a `feature_columns` array.
	 * @throws ConfigurationError If the file is missing or malformed.
	 */
	static FeatureManifest loadFromFile(const std::string &path);

	const std::vector<std::string> &names() const {
		return names_;
	}

	const std::vector<FeatureSpec> &specs() const {
		return specs_;
	}

	std::size_t size() const {
		return names_.size();
	}

	bool empty() const {
		return names_.empty();
	}

	/// Categories referenced by lag or rolling columns, in order of first appearance.
	std::vector<std::string> categories() const;

	/// Largest lag or rolling window referenced, 0 when none.
	int maxLookback() const;

private:
	std::vector<std::string> names_;
	std::vector<FeatureSpec> specs_;
};

} // namespace salescast::features
