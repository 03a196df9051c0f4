#pragma once

#include <cstddef>
#include <limits>
#include <vector>

namespace tsregress::utils {

/// Regression accuracy of one set of predictions.
struct AccuracyMetrics {
	double mae = std::numeric_limits<double>::quiet_NaN();
	double mse = std::numeric_limits<double>::quiet_NaN();
	double rmse = std::numeric_limits<double>::quiet_NaN();
	double r_squared = std::numeric_limits<double>::quiet_NaN();
	std::size_t n = 0;
};

/**
 * @class Metrics
 * @brief Scores regression predictions against their targets.
 *
 * Every function requires non-empty, equally long target and prediction
 * vectors and throws std::invalid_argument otherwise.
 */
class Metrics final {
public:
	static double mae(const std::vector<double> &actual, const std::vector<double> &predicted);
	static double mse(const std::vector<double> &actual, const std::vector<double> &predicted);
	static double rmse(const std::vector<double> &actual, const std::vector<double> &predicted);

	/**
	 * @brief Coefficient of determination.
	 *
	 * Constant targets score 1 when predicted exactly and 0 otherwise.
	 */
	static double r2(const std::vector<double> &actual, const std::vector<double> &predicted);

	static AccuracyMetrics evaluate(const std::vector<double> &actual, const std::vector<double> &predicted);

	/// Scores every row of a member-by-case prediction matrix against the same targets.
	static std::vector<AccuracyMetrics> evaluateRows(const std::vector<double> &actual,
	                                                 const std::vector<std::vector<double>> &predictions);
};

} // namespace tsregress::utils
