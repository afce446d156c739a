#pragma once

#include "salescast/models/predictor.hpp"

#include <Eigen/Dense>

#include <memory>
#include <string>
#include <vector>

namespace salescast::models {

class LinearPredictorBuilder; // Forward declaration

/**
 * @class LinearPredictor
 * @brief Multi-output linear regression: y = W x + b, one output per target category.
 */
class LinearPredictor final : public IPredictor {
public:
	friend class LinearPredictorBuilder;

	Matrix predict(const Matrix &features) const override;

	std::size_t featureCount() const override {
		return static_cast<std::size_t>(coefficients_.cols());
	}

	const std::vector<std::string> &targetCategories() const override {
		return targets_;
	}

	std::string getName() const override {
		return "LinearRegression";
	}

	const Eigen::MatrixXd &coefficients() const {
		return coefficients_;
	}

	const Eigen::VectorXd &intercept() const {
		return intercept_;
	}

	bool clipsNegative() const {
		return clip_negative_;
	}

private:
	LinearPredictor(Eigen::MatrixXd coefficients, Eigen::VectorXd intercept, std::vector<std::string> targets,
	                bool clip_negative);

	Eigen::MatrixXd coefficients_; // targets x features
	Eigen::VectorXd intercept_;
	std::vector<std::string> targets_;
	bool clip_negative_;
};

/**
 * @class LinearPredictorBuilder
 * @brief A builder for fluently configuring and creating LinearPredictor models.
 */
class LinearPredictorBuilder {
public:
	/**
	 * @brief Sets the output categories, in output column order.
	 */
	LinearPredictorBuilder &withTargets(std::vector<std::string> targets);

	/**
	 * @brief Sets the coefficient rows, one per target, each as wide as the feature manifest.
	 */
	LinearPredictorBuilder &withCoefficients(const std::vector<std::vector<double>> &rows);

	/**
	 * @brief Sets one intercept per target. Defaults to zeros.
	 */
	LinearPredictorBuilder &withIntercept(const std::vector<double> &intercept);

	/**
	 * @brief Clamps negative predictions to zero.
	 */
	LinearPredictorBuilder &withNegativeClipping(bool enabled);

	/**
	 * @brief Creates the predictor.
	 * @throws std::invalid_argument If shapes disagree or no target was given.
	 */
	std::unique_ptr<LinearPredictor> build();

private:
	std::vector<std::string> targets_;
	std::vector<std::vector<double>> coefficients_;
	std::vector<double> intercept_;
	bool clip_negative_ = false;
};

} // namespace salescast::models
