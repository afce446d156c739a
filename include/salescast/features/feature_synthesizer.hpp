#pragma once

#include "salescast/core/period.hpp"
#include "salescast/core/sales_record.hpp"
#include "salescast/features/feature_manifest.hpp"
#include "salescast/features/working_buffer.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace salescast::features {

/**
 * @struct FeatureVector
 * @brief One synthesized row, laid out in manifest order.
 */
struct FeatureVector {
	core::Date date;
	std::vector<double> values;
};

/**
 * @struct FeatureMatrix
 * @brief Dated feature rows sharing one column order.
 */
struct FeatureMatrix {
	std::vector<std::string> columns;
	std::vector<FeatureVector> rows;

	std::size_t rowCount() const {
		return rows.size();
	}

	std::size_t columnCount() const {
		return columns.size();
	}

	/// Row-major copy of the values, as handed to a predictor.
	std::vector<std::vector<double>> values() const;

	/// Value of column @p name in row @p row.
	double at(std::size_t row, const std::string &name) const;
};

/**
 * @brief Produces the category amounts of a freshly synthesized date.
 *
 * The returned row is committed to the working buffer before the next date is
 * synthesized, which is what lets later lags see same-run values.
 */
using RowResolver = std::function<core::CategoryAmounts(const FeatureVector &)>;

class FeatureSynthesizerBuilder; // Forward declaration

/**
 * @class FeatureSynthesizer
 * @brief Builds calendar, lag and rolling-window features date by date.
 *
 * Dates are processed in strict chronological order. For each date the
 * synthesizer reads lags and trailing windows from the working buffer
 * (history plus rows committed earlier in the run), lays the vector out in
 * manifest order, then commits the resolved row for that date.
 */
class FeatureSynthesizer {
public:
	friend class FeatureSynthesizerBuilder;

	/**
	 * @brief Builds the feature vector of a single date from the current buffer contents.
	 */
	FeatureVector buildVector(const core::Date &date, const WorkingBuffer &buffer) const;

	/**
	 * @brief Synthesizes every date of @p period in ascending order.
	 * @param period Dates to synthesize.
	 * @param buffer Combined history and same-run view; receives one committed row per
	 *        resolved date.
	 * @param resolver Supplies the amounts committed for each date. When empty, nothing
	 *        is committed and later lookups of the period fall back to the cold-start value.
	 * @return One vector per date.
	 */
	FeatureMatrix synthesize(const core::Period &period, WorkingBuffer &buffer,
	                         const RowResolver &resolver = RowResolver()) const;

	const FeatureManifest &manifest() const {
		return *manifest_;
	}

private:
	FeatureSynthesizer(std::shared_ptr<const FeatureManifest> manifest, double cold_start_value, int special_month);

	double calendarValue(const FeatureSpec &spec, const core::Date &date) const;
	double lagValue(const FeatureSpec &spec, const core::Date &date, const WorkingBuffer &buffer) const;
	double rollingValue(const FeatureSpec &spec, const core::Date &date, const WorkingBuffer &buffer) const;

	std::shared_ptr<const FeatureManifest> manifest_;
	double cold_start_value_;
	int special_month_;
};

/**
 * @class FeatureSynthesizerBuilder
 * @brief A builder for fluently configuring and creating FeatureSynthesizer instances.
 */
class FeatureSynthesizerBuilder {
public:
	FeatureSynthesizerBuilder &withManifest(std::shared_ptr<const FeatureManifest> manifest);

	/**
	 * @brief Sets the value used when no lag or rolling data exists.
	 */
	FeatureSynthesizerBuilder &withColdStartValue(double value);

	/**
	 * @brief Sets the month (1-12) flagged by `is_special_month`.
	 */
	FeatureSynthesizerBuilder &withSpecialMonth(int month);

	/**
	 * @brief Creates the synthesizer.
	 * @throws std::invalid_argument If no manifest was given or the month is out of range.
	 */
	std::unique_ptr<FeatureSynthesizer> build();

private:
	std::shared_ptr<const FeatureManifest> manifest_;
	double cold_start_value_ = 0.0;
	int special_month_ = 11;
};

} // namespace salescast::features
