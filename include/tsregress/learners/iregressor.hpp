#pragma once

#include "tsregress/core/feature_table.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace tsregress::learners {

/**
 * @class IRegressor
 * @brief An interface for the tabular learners fitted inside each ensemble member.
 *
 * The forest never fits a learner it was handed: it clones the prototype once
 * per member, so fitted state is never shared between members.
 */
class IRegressor {
public:
	virtual ~IRegressor() = default;

	/**
	 * @brief Fits the learner to a feature table.
	 * @param features One row per case.
	 * @param targets One target per row.
	 * @throws std::invalid_argument If the row and target counts differ.
	 * @throws std::runtime_error If the fit is numerically impossible.
	 */
	virtual void fit(const core::FeatureTable &features, const std::vector<double> &targets) = 0;

	/**
	 * @brief Predicts one value per row.
	 * @throws std::runtime_error If called before fit.
	 */
	virtual std::vector<double> predict(const core::FeatureTable &features) const = 0;

	/// Returns an unfitted learner with the same configuration.
	virtual std::unique_ptr<IRegressor> clone() const = 0;

	/// Reseeds any internal randomness; learners without randomness ignore it.
	virtual void setSeed(std::uint32_t seed) {
		(void)seed;
	}

	virtual bool isFitted() const = 0;

	virtual std::string getName() const = 0;
};

using RegressorPtr = std::shared_ptr<const IRegressor>;

} // namespace tsregress::learners
