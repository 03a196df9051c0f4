#include "tsregress/features/feature_calculators.hpp"
#include "tsregress/features/feature_math.hpp"
#include <cmath>
#include <limits>

namespace tsregress::features {

namespace {

double FeatureMean(const Series &series, FeatureCache &cache) {
	return ComputeMean(series, cache);
}

double FeatureStd(const Series &series, FeatureCache &cache) {
	return ComputeStdDev(series, cache);
}

// Least-squares slope against the index 0..n-1.
double FeatureSlope(const Series &series, FeatureCache &cache) {
	const std::size_t n = series.size();
	if (n < 2) {
		return 0.0;
	}
	const double mean_y = ComputeMean(series, cache);
	const double mean_x = (static_cast<double>(n) - 1.0) / 2.0;
	double numerator = 0.0;
	double denominator = 0.0;
	for (std::size_t i = 0; i < n; ++i) {
		const double dx = static_cast<double>(i) - mean_x;
		numerator += dx * (series[i] - mean_y);
		denominator += dx * dx;
	}
	return numerator / denominator;
}

} // namespace

void RegisterSummaryFeatures(FeatureRegistry &registry) {
	registry.Register("mean", FeatureMean);
	registry.Register("std", FeatureStd);
	registry.Register("slope", FeatureSlope);
}

void RegisterCanonicalFeatures(FeatureRegistry &registry) {
	RegisterCatch22Features(registry);
	RegisterSummaryFeatures(registry);
}

} // namespace tsregress::features
