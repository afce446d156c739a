#include "salescast/features/feature_synthesizer.hpp"
#include "salescast/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace salescast::features {

namespace {

double mean(const std::vector<double> &values) {
	return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

// Population standard deviation (ddof = 0).
double populationStd(const std::vector<double> &values) {
	const double mu = mean(values);
	double sum_sq = 0.0;
	for (double value : values) {
		const double diff = value - mu;
		sum_sq += diff * diff;
	}
	return std::sqrt(sum_sq / static_cast<double>(values.size()));
}

} // namespace

std::vector<std::vector<double>> FeatureMatrix::values() const {
	std::vector<std::vector<double>> result;
	result.reserve(rows.size());
	for (const auto &row : rows) {
		result.push_back(row.values);
	}
	return result;
}

double FeatureMatrix::at(std::size_t row, const std::string &name) const {
	if (row >= rows.size()) {
		throw std::out_of_range("Feature row index out of range.");
	}
	auto it = std::find(columns.begin(), columns.end(), name);
	if (it == columns.end()) {
		throw std::out_of_range("Unknown feature column '" + name + "'.");
	}
	return rows[row].values[static_cast<std::size_t>(it - columns.begin())];
}

// --- Synthesizer Implementation ---

FeatureSynthesizer::FeatureSynthesizer(std::shared_ptr<const FeatureManifest> manifest, double cold_start_value,
                                       int special_month)
    : manifest_(std::move(manifest)), cold_start_value_(cold_start_value), special_month_(special_month) {
}

double FeatureSynthesizer::calendarValue(const FeatureSpec &spec, const core::Date &date) const {
	switch (spec.kind) {
	case FeatureKind::Year:
		return static_cast<double>(date.year());
	case FeatureKind::Month:
		return static_cast<double>(date.month());
	case FeatureKind::Day:
		return static_cast<double>(date.day());
	case FeatureKind::DayOfWeek:
		return static_cast<double>(date.dayOfWeek());
	case FeatureKind::IsWeekend:
		return date.isWeekend() ? 1.0 : 0.0;
	case FeatureKind::WeekOfYear:
		return static_cast<double>(date.isoWeek());
	case FeatureKind::Quarter:
		return static_cast<double>(date.quarter());
	case FeatureKind::IsMonthStart:
		return date.isMonthStart() ? 1.0 : 0.0;
	case FeatureKind::IsMonthEnd:
		return date.isMonthEnd() ? 1.0 : 0.0;
	case FeatureKind::IsSpecialMonth:
		return date.month() == special_month_ ? 1.0 : 0.0;
	default:
		return 0.0;
	}
}

double FeatureSynthesizer::lagValue(const FeatureSpec &spec, const core::Date &date,
                                    const WorkingBuffer &buffer) const {
	auto value = buffer.valueAt(spec.category, date.addDays(-spec.days));
	return value ? *value : cold_start_value_;
}

double FeatureSynthesizer::rollingValue(const FeatureSpec &spec, const core::Date &date,
                                        const WorkingBuffer &buffer) const {
	const auto values = buffer.trailingValues(spec.category, date, spec.days);
	if (values.empty()) {
		return cold_start_value_;
	}
	return spec.kind == FeatureKind::RollingMean ? mean(values) : populationStd(values);
}

FeatureVector FeatureSynthesizer::buildVector(const core::Date &date, const WorkingBuffer &buffer) const {
	FeatureVector vector;
	vector.date = date;
	vector.values.reserve(manifest_->size());

	for (const auto &spec : manifest_->specs()) {
		switch (spec.kind) {
		case FeatureKind::Lag:
			vector.values.push_back(lagValue(spec, date, buffer));
			break;
		case FeatureKind::RollingMean:
		case FeatureKind::RollingStd:
			vector.values.push_back(rollingValue(spec, date, buffer));
			break;
		case FeatureKind::Unknown:
			vector.values.push_back(0.0);
			break;
		default:
			vector.values.push_back(calendarValue(spec, date));
			break;
		}
	}
	return vector;
}

FeatureMatrix FeatureSynthesizer::synthesize(const core::Period &period, WorkingBuffer &buffer,
                                             const RowResolver &resolver) const {
	FeatureMatrix matrix;
	matrix.columns = manifest_->names();
	matrix.rows.reserve(static_cast<std::size_t>(std::max<std::int64_t>(period.days(), 0)));

	for (const auto &date : period.dates()) {
		FeatureVector vector = buildVector(date, buffer);

		if (resolver) {
			// The row must be in the buffer before the next date looks back at it.
			buffer.commit(core::DailyRecord{date, resolver(vector)});
		}
		matrix.rows.push_back(std::move(vector));
	}

	SALESCAST_DEBUG("Synthesized {} feature rows x {} columns for {}.", matrix.rowCount(), matrix.columnCount(),
	                period.toString());
	return matrix;
}

// --- Builder Implementation ---

FeatureSynthesizerBuilder &FeatureSynthesizerBuilder::withManifest(std::shared_ptr<const FeatureManifest> manifest) {
	manifest_ = std::move(manifest);
	return *this;
}

FeatureSynthesizerBuilder &FeatureSynthesizerBuilder::withColdStartValue(double value) {
	cold_start_value_ = value;
	return *this;
}

FeatureSynthesizerBuilder &FeatureSynthesizerBuilder::withSpecialMonth(int month) {
	special_month_ = month;
	return *this;
}

std::unique_ptr<FeatureSynthesizer> FeatureSynthesizerBuilder::build() {
	if (!manifest_) {
		throw std::invalid_argument("FeatureSynthesizer requires a feature manifest.");
	}
	if (special_month_ < 1 || special_month_ > 12) {
		throw std::invalid_argument("Special month must be between 1 and 12.");
	}
	if (!std::isfinite(cold_start_value_)) {
		throw std::invalid_argument("Cold-start value must be finite.");
	}
	SALESCAST_DEBUG("Building FeatureSynthesizer over {} columns (cold start {}).", manifest_->size(),
	                cold_start_value_);
	return std::unique_ptr<FeatureSynthesizer>(new FeatureSynthesizer(manifest_, cold_start_value_, special_month_));
}

} // namespace salescast::features
