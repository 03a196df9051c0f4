#pragma once

#include "tsregress/learners/iregressor.hpp"
#include <Eigen/Dense>

namespace tsregress::learners {

/**
 * @class RidgeRegressor
 * @brief L2-penalised least squares on standardised features.
 *
 * Columns are centred and scaled to unit variance before solving; constant
 * columns are centred only. With alpha = 0 the fit is ordinary least squares,
 * which fails on a rank-deficient table.
 */
class RidgeRegressor final : public IRegressor {
public:
	/// @throws std::invalid_argument If @p alpha is negative or not finite.
	explicit RidgeRegressor(double alpha = 1.0);

	/// @throws std::runtime_error If alpha is 0 and the table is rank deficient.
	void fit(const core::FeatureTable &features, const std::vector<double> &targets) override;
	std::vector<double> predict(const core::FeatureTable &features) const override;
	std::unique_ptr<IRegressor> clone() const override;

	bool isFitted() const override {
		return is_fitted_;
	}

	std::string getName() const override {
		return "RidgeRegressor";
	}

	double alpha() const {
		return alpha_;
	}

	/// Coefficients on the original (unscaled) feature axes.
	const Eigen::VectorXd &coefficients() const {
		return coefficients_;
	}

	double intercept() const {
		return intercept_;
	}

private:
	double alpha_;
	Eigen::VectorXd coefficients_;
	double intercept_ = 0.0;
	bool is_fitted_ = false;
};

} // namespace tsregress::learners
