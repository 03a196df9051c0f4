#pragma once

#include "tsregress/features/feature_types.hpp"
#include <complex>
#include <optional>

namespace tsregress::features {

/**
 * @struct FeatureCache
 * @brief Per-slice memo of derived quantities shared between attributes.
 *
 * A cache is bound to exactly one slice; the extractor creates a fresh cache
 * for every (case, interval) pair.
 */
struct FeatureCache {
	const Series *series = nullptr;
	mutable std::optional<double> mean;
	mutable std::optional<double> variance;
	mutable std::optional<double> stddev;
	mutable std::optional<std::vector<double>> sorted_values;
	mutable std::optional<std::vector<double>> diffs;
	mutable std::optional<std::vector<double>> autocorrelations;
	mutable std::optional<std::size_t> first_zero_crossing;
	mutable std::optional<std::vector<double>> zscored;

	explicit FeatureCache(const Series &series_ref) : series(&series_ref) {
	}
};

double ComputeMean(const Series &series, FeatureCache &cache);
double ComputeVariance(const Series &series, FeatureCache &cache);
double ComputeStdDev(const Series &series, FeatureCache &cache);
const std::vector<double> &ComputeSorted(const Series &series, FeatureCache &cache);
const std::vector<double> &ComputeDiffs(const Series &series, FeatureCache &cache);
const std::vector<double> &ComputeAutocorrelations(const Series &series, FeatureCache &cache);
std::size_t ComputeFirstZeroCrossing(const Series &series, FeatureCache &cache);
const std::vector<double> &ComputeZScored(const Series &series, FeatureCache &cache);

double Mean(const std::vector<double> &values);
double SampleStdDev(const std::vector<double> &values);
double Median(std::vector<double> values);
bool IsConstant(const Series &series);

/// Normalised autocorrelation for every lag 0..n-1, computed through the FFT.
std::vector<double> Autocorrelations(const Series &series);

/// First lag at which the autocorrelation is no longer positive, capped at @p max_lag.
std::size_t FirstZeroCrossing(const std::vector<double> &autocorrelations, std::size_t max_lag);

std::size_t NextPowerOfTwo(std::size_t n);

/// In-place iterative radix-2 FFT; the input size must be a power of two.
void FastFourierTransform(std::vector<std::complex<double>> &values, bool inverse = false);

struct LinearFit {
	double slope = 0.0;
	double intercept = 0.0;
};

/// Ordinary least squares of @p y on @p x over the first @p n points.
LinearFit FitLine(const double *x, const double *y, std::size_t n);

} // namespace tsregress::features
