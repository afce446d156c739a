#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace salescast::models {

/// Row-major matrix: one inner vector per row.
using Matrix = std::vector<std::vector<double>>;

/**
 * @class IPredictor
 * @brief An interface for pre-trained regression models.
 *
 * A predictor maps each input row (laid out in feature manifest order) to one
 * output row, interpreted positionally against targetCategories(). It does not
 * check that its input honours the manifest; callers must.
 */
class IPredictor {
public:
	virtual ~IPredictor() = default;

	/**
	 * @brief Predicts one output row per input row.
	 * @param features Input rows, each featureCount() wide.
	 * @return Output rows, each targetCategories().size() wide.
	 */
	virtual Matrix predict(const Matrix &features) const = 0;

	/// Number of input columns the model was trained on.
	virtual std::size_t featureCount() const = 0;

	/// Output categories, in output column order.
	virtual const std::vector<std::string> &targetCategories() const = 0;

	/// Whether predict() accepts many rows at once.
	virtual bool supportsBatching() const {
		return true;
	}

	/**
	 * @brief Gets the name of the model.
	 * @return A string representing the model's name (e.g., "LinearRegression").
	 */
	virtual std::string getName() const = 0;
};

} // namespace salescast::models
