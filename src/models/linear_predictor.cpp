#include "salescast/models/linear_predictor.hpp"
#include "salescast/utils/logging.hpp"

#include <cmath>
#include <stdexcept>

namespace salescast::models {

// --- Model Implementation ---

LinearPredictor::LinearPredictor(Eigen::MatrixXd coefficients, Eigen::VectorXd intercept,
                                 std::vector<std::string> targets, bool clip_negative)
    : coefficients_(std::move(coefficients)), intercept_(std::move(intercept)), targets_(std::move(targets)),
      clip_negative_(clip_negative) {
}

Matrix LinearPredictor::predict(const Matrix &features) const {
	const auto width = static_cast<Eigen::Index>(featureCount());
	Eigen::MatrixXd input(static_cast<Eigen::Index>(features.size()), width);
	for (std::size_t row = 0; row < features.size(); ++row) {
		if (static_cast<Eigen::Index>(features[row].size()) != width) {
			throw std::invalid_argument("Feature row " + std::to_string(row) + " has " +
			                            std::to_string(features[row].size()) + " values, expected " +
			                            std::to_string(width) + ".");
		}
		for (Eigen::Index col = 0; col < width; ++col) {
			input(static_cast<Eigen::Index>(row), col) = features[row][static_cast<std::size_t>(col)];
		}
	}

	// rows x targets
	Eigen::MatrixXd output = input * coefficients_.transpose();
	output.rowwise() += intercept_.transpose();
	if (clip_negative_) {
		output = output.cwiseMax(0.0);
	}

	Matrix result(features.size(), std::vector<double>(targets_.size(), 0.0));
	for (Eigen::Index row = 0; row < output.rows(); ++row) {
		for (Eigen::Index col = 0; col < output.cols(); ++col) {
			result[static_cast<std::size_t>(row)][static_cast<std::size_t>(col)] = output(row, col);
		}
	}
	return result;
}

// --- Builder Implementation ---

LinearPredictorBuilder &LinearPredictorBuilder::withTargets(std::vector<std::string> targets) {
	targets_ = std::move(targets);
	return *this;
}

LinearPredictorBuilder &LinearPredictorBuilder::withCoefficients(const std::vector<std::vector<double>> &rows) {
	coefficients_ = rows;
	return *this;
}

LinearPredictorBuilder &LinearPredictorBuilder::withIntercept(const std::vector<double> &intercept) {
	intercept_ = intercept;
	return *this;
}

LinearPredictorBuilder &LinearPredictorBuilder::withNegativeClipping(bool enabled) {
	clip_negative_ = enabled;
	return *this;
}

std::unique_ptr<LinearPredictor> LinearPredictorBuilder::build() {
	if (targets_.empty()) {
		throw std::invalid_argument("LinearPredictor requires at least one target category.");
	}
	if (coefficients_.size() != targets_.size()) {
		throw std::invalid_argument("LinearPredictor needs one coefficient row per target: got " +
		                            std::to_string(coefficients_.size()) + " rows for " +
		                            std::to_string(targets_.size()) + " targets.");
	}
	const std::size_t width = coefficients_.front().size();
	if (width == 0) {
		throw std::invalid_argument("Coefficient rows must not be empty.");
	}
	if (!intercept_.empty() && intercept_.size() != targets_.size()) {
		throw std::invalid_argument("Intercept length must match the number of targets.");
	}

	const auto rows = static_cast<Eigen::Index>(targets_.size());
	const auto cols = static_cast<Eigen::Index>(width);
	Eigen::MatrixXd coefficients(rows, cols);
	for (Eigen::Index r = 0; r < rows; ++r) {
		const auto &row = coefficients_[static_cast<std::size_t>(r)];
		if (row.size() != width) {
			throw std::invalid_argument("All coefficient rows must have the same length.");
		}
		for (Eigen::Index c = 0; c < cols; ++c) {
			const double value = row[static_cast<std::size_t>(c)];
			if (!std::isfinite(value)) {
				throw std::invalid_argument("Coefficients must be finite.");
			}
			coefficients(r, c) = value;
		}
	}

	Eigen::VectorXd intercept = Eigen::VectorXd::Zero(rows);
	for (std::size_t i = 0; i < intercept_.size(); ++i) {
		intercept(static_cast<Eigen::Index>(i)) = intercept_[i];
	}

	SALESCAST_DEBUG("Building LinearPredictor: {} targets x {} features (clip negative: {}).", targets_.size(),
	                width, clip_negative_);
	return std::unique_ptr<LinearPredictor>(
	    new LinearPredictor(std::move(coefficients), std::move(intercept), targets_, clip_negative_));
}

} // namespace salescast::models
