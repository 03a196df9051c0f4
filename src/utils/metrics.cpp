#include "tsregress/utils/metrics.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace tsregress::utils {

namespace {

// Residual and target sums gathered in one sweep over the cases.
struct ResidualSums {
	std::size_t n = 0;
	double absolute = 0.0;
	double squared = 0.0;
	double target_sum = 0.0;
	double target_squared = 0.0;

	double meanAbsolute() const {
		return absolute / static_cast<double>(n);
	}

	double meanSquared() const {
		return squared / static_cast<double>(n);
	}

	// Total sum of squares of the targets around their mean.
	double targetSpread() const {
		return std::max(target_squared - target_sum * target_sum / static_cast<double>(n), 0.0);
	}

	double rSquared() const {
		const double spread = targetSpread();
		const double tolerance = 1e-12 * std::max(target_squared, 1.0);
		if (spread <= tolerance) {
			return squared <= tolerance ? 1.0 : 0.0;
		}
		return 1.0 - squared / spread;
	}
};

ResidualSums Accumulate(const std::vector<double> &actual, const std::vector<double> &predicted) {
	if (actual.empty()) {
		throw std::invalid_argument("Metrics: no targets to score against.");
	}
	if (actual.size() != predicted.size()) {
		throw std::invalid_argument("Metrics: " + std::to_string(actual.size()) + " targets but " +
		                            std::to_string(predicted.size()) + " predictions.");
	}
	ResidualSums sums;
	sums.n = actual.size();
	for (std::size_t c = 0; c < actual.size(); ++c) {
		const double residual = actual[c] - predicted[c];
		sums.absolute += std::abs(residual);
		sums.squared += residual * residual;
		sums.target_sum += actual[c];
		sums.target_squared += actual[c] * actual[c];
	}
	return sums;
}

} // namespace

double Metrics::mae(const std::vector<double> &actual, const std::vector<double> &predicted) {
	return Accumulate(actual, predicted).meanAbsolute();
}

double Metrics::mse(const std::vector<double> &actual, const std::vector<double> &predicted) {
	return Accumulate(actual, predicted).meanSquared();
}

double Metrics::rmse(const std::vector<double> &actual, const std::vector<double> &predicted) {
	return std::sqrt(mse(actual, predicted));
}

double Metrics::r2(const std::vector<double> &actual, const std::vector<double> &predicted) {
	return Accumulate(actual, predicted).rSquared();
}

AccuracyMetrics Metrics::evaluate(const std::vector<double> &actual, const std::vector<double> &predicted) {
	const auto sums = Accumulate(actual, predicted);
	AccuracyMetrics metrics;
	metrics.n = sums.n;
	metrics.mae = sums.meanAbsolute();
	metrics.mse = sums.meanSquared();
	metrics.rmse = std::sqrt(metrics.mse);
	metrics.r_squared = sums.rSquared();
	return metrics;
}

std::vector<AccuracyMetrics> Metrics::evaluateRows(const std::vector<double> &actual,
                                                   const std::vector<std::vector<double>> &predictions) {
	std::vector<AccuracyMetrics> rows;
	rows.reserve(predictions.size());
	for (const auto &row : predictions) {
		rows.push_back(evaluate(actual, row));
	}
	return rows;
}

} // namespace tsregress::utils
