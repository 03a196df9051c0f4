#include "tsregress/learners/ridge_regressor.hpp"
#include "tsregress/utils/logging.hpp"
#include <cmath>
#include <stdexcept>

namespace tsregress::learners {

RidgeRegressor::RidgeRegressor(double alpha) : alpha_(alpha) {
	if (!std::isfinite(alpha) || alpha < 0.0) {
		throw std::invalid_argument("RidgeRegressor: alpha must be a non-negative finite number.");
	}
}

void RidgeRegressor::fit(const core::FeatureTable &features, const std::vector<double> &targets) {
	if (features.rows() == 0) {
		throw std::invalid_argument("RidgeRegressor: cannot fit an empty feature table.");
	}
	if (features.rows() != targets.size()) {
		throw std::invalid_argument("RidgeRegressor: feature rows and targets differ in length.");
	}

	const auto n = static_cast<Eigen::Index>(features.rows());
	const auto p = static_cast<Eigen::Index>(features.cols());
	const Eigen::Map<const Eigen::VectorXd> y(targets.data(), n);
	if (!y.allFinite()) {
		throw std::invalid_argument("RidgeRegressor: targets must be finite.");
	}
	const double y_mean = y.mean();

	Eigen::MatrixXd x = features.values();
	Eigen::RowVectorXd x_mean = x.colwise().mean();
	x.rowwise() -= x_mean;
	Eigen::RowVectorXd x_scale = (x.colwise().squaredNorm() / static_cast<double>(n)).cwiseSqrt();
	for (Eigen::Index j = 0; j < p; ++j) {
		if (x_scale(j) <= 0.0) {
			x_scale(j) = 1.0;
		}
	}
	x.array().rowwise() /= x_scale.array();
	const Eigen::VectorXd centred = y.array() - y_mean;

	Eigen::VectorXd beta(p);
	if (p == 0) {
		beta.resize(0);
	} else if (alpha_ == 0.0) {
		Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(x);
		if (qr.rank() < p) {
			throw std::runtime_error("RidgeRegressor: feature table is rank deficient (rank " +
			                         std::to_string(qr.rank()) + " of " + std::to_string(p) +
			                         " columns); least squares has no unique solution.");
		}
		beta = qr.solve(centred);
	} else {
		Eigen::MatrixXd gram = x.transpose() * x;
		gram.diagonal().array() += alpha_;
		Eigen::LDLT<Eigen::MatrixXd> ldlt(gram);
		if (ldlt.info() != Eigen::Success) {
			throw std::runtime_error("RidgeRegressor: normal equations could not be factorised.");
		}
		beta = ldlt.solve(x.transpose() * centred);
	}
	if (!beta.allFinite()) {
		throw std::runtime_error("RidgeRegressor: solution is not finite.");
	}

	coefficients_ = beta.array() / x_scale.transpose().array();
	intercept_ = y_mean - x_mean.transpose().dot(coefficients_);
	is_fitted_ = true;
	TSREGRESS_TRACE("RidgeRegressor fitted {} rows x {} features (alpha={}).", n, p, alpha_);
}

std::vector<double> RidgeRegressor::predict(const core::FeatureTable &features) const {
	if (!is_fitted_) {
		throw std::runtime_error("RidgeRegressor: predict called before fit.");
	}
	if (static_cast<Eigen::Index>(features.cols()) != coefficients_.size()) {
		throw std::invalid_argument("RidgeRegressor: expected " + std::to_string(coefficients_.size()) +
		                            " features, got " + std::to_string(features.cols()) + ".");
	}
	std::vector<double> predictions(features.rows(), intercept_);
	if (coefficients_.size() > 0) {
		Eigen::Map<Eigen::VectorXd> out(predictions.data(), static_cast<Eigen::Index>(predictions.size()));
		out += features.values() * coefficients_;
	}
	return predictions;
}

std::unique_ptr<IRegressor> RidgeRegressor::clone() const {
	return std::make_unique<RidgeRegressor>(alpha_);
}

} // namespace tsregress::learners
