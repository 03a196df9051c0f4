#include "tsregress/features/feature_math.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <stdexcept>

namespace tsregress::features {

namespace {

constexpr double kPi = 3.14159265358979323846;

double NaN() {
	return std::numeric_limits<double>::quiet_NaN();
}

} // namespace

double ComputeMean(const Series &series, FeatureCache &cache) {
	if (cache.mean) {
		return *cache.mean;
	}
	cache.mean = Mean(series);
	return *cache.mean;
}

double ComputeVariance(const Series &series, FeatureCache &cache) {
	if (cache.variance) {
		return *cache.variance;
	}
	if (series.empty()) {
		cache.variance = NaN();
		return *cache.variance;
	}
	double mean = ComputeMean(series, cache);
	double accum = 0.0;
	for (double value : series) {
		double diff = value - mean;
		accum += diff * diff;
	}
	cache.variance = accum / static_cast<double>(series.size());
	return *cache.variance;
}

double ComputeStdDev(const Series &series, FeatureCache &cache) {
	if (cache.stddev) {
		return *cache.stddev;
	}
	double variance = ComputeVariance(series, cache);
	cache.stddev = variance < 0 ? NaN() : std::sqrt(variance);
	return *cache.stddev;
}

const std::vector<double> &ComputeSorted(const Series &series, FeatureCache &cache) {
	if (!cache.sorted_values) {
		cache.sorted_values = series;
		std::sort(cache.sorted_values->begin(), cache.sorted_values->end());
	}
	return *cache.sorted_values;
}

const std::vector<double> &ComputeDiffs(const Series &series, FeatureCache &cache) {
	if (!cache.diffs) {
		std::vector<double> diffs;
		if (series.size() >= 2) {
			diffs.reserve(series.size() - 1);
			for (size_t i = 1; i < series.size(); ++i) {
				diffs.push_back(series[i] - series[i - 1]);
			}
		}
		cache.diffs = std::move(diffs);
	}
	return *cache.diffs;
}

const std::vector<double> &ComputeAutocorrelations(const Series &series, FeatureCache &cache) {
	if (!cache.autocorrelations) {
		cache.autocorrelations = Autocorrelations(series);
	}
	return *cache.autocorrelations;
}

std::size_t ComputeFirstZeroCrossing(const Series &series, FeatureCache &cache) {
	if (!cache.first_zero_crossing) {
		cache.first_zero_crossing = FirstZeroCrossing(ComputeAutocorrelations(series, cache), series.size());
	}
	return *cache.first_zero_crossing;
}

const std::vector<double> &ComputeZScored(const Series &series, FeatureCache &cache) {
	if (!cache.zscored) {
		double mean = ComputeMean(series, cache);
		double stddev = ComputeStdDev(series, cache);
		std::vector<double> scaled(series.size());
		for (size_t i = 0; i < series.size(); ++i) {
			scaled[i] = (series[i] - mean) / stddev;
		}
		cache.zscored = std::move(scaled);
	}
	return *cache.zscored;
}

double Mean(const std::vector<double> &values) {
	if (values.empty()) {
		return NaN();
	}
	double sum = std::accumulate(values.begin(), values.end(), 0.0);
	return sum / static_cast<double>(values.size());
}

double SampleStdDev(const std::vector<double> &values) {
	if (values.size() < 2) {
		return NaN();
	}
	double mean = Mean(values);
	double accum = 0.0;
	for (double value : values) {
		accum += (value - mean) * (value - mean);
	}
	return std::sqrt(accum / static_cast<double>(values.size() - 1));
}

double Median(std::vector<double> values) {
	if (values.empty()) {
		return NaN();
	}
	std::sort(values.begin(), values.end());
	size_t n = values.size();
	if (n % 2 == 1) {
		return values[n / 2];
	}
	return (values[n / 2 - 1] + values[n / 2]) / 2.0;
}

bool IsConstant(const Series &series) {
	if (series.empty()) {
		return true;
	}
	return std::all_of(series.begin(), series.end(), [&](double v) { return v == series.front(); });
}

std::size_t NextPowerOfTwo(std::size_t n) {
	std::size_t power = 1;
	while (power < n) {
		power <<= 1;
	}
	return power;
}

void FastFourierTransform(std::vector<std::complex<double>> &values, bool inverse) {
	const std::size_t n = values.size();
	if (n == 0) {
		return;
	}
	if ((n & (n - 1)) != 0) {
		throw std::invalid_argument("FastFourierTransform: size must be a power of two.");
	}

	for (std::size_t i = 1, j = 0; i < n; ++i) {
		std::size_t bit = n >> 1;
		for (; j & bit; bit >>= 1) {
			j ^= bit;
		}
		j ^= bit;
		if (i < j) {
			std::swap(values[i], values[j]);
		}
	}

	for (std::size_t len = 2; len <= n; len <<= 1) {
		const double angle = 2.0 * kPi / static_cast<double>(len) * (inverse ? 1.0 : -1.0);
		const std::complex<double> step(std::cos(angle), std::sin(angle));
		for (std::size_t start = 0; start < n; start += len) {
			std::complex<double> w(1.0, 0.0);
			for (std::size_t k = 0; k < len / 2; ++k) {
				auto even = values[start + k];
				auto odd = values[start + k + len / 2] * w;
				values[start + k] = even + odd;
				values[start + k + len / 2] = even - odd;
				w *= step;
			}
		}
	}

	if (inverse) {
		for (auto &value : values) {
			value /= static_cast<double>(n);
		}
	}
}

std::vector<double> Autocorrelations(const Series &series) {
	const std::size_t n = series.size();
	if (n == 0) {
		return {};
	}
	const double mean = Mean(series);
	const std::size_t n_fft = NextPowerOfTwo(n) * 2;

	std::vector<std::complex<double>> spectrum(n_fft, {0.0, 0.0});
	for (std::size_t i = 0; i < n; ++i) {
		spectrum[i] = {series[i] - mean, 0.0};
	}
	FastFourierTransform(spectrum);
	for (auto &value : spectrum) {
		value = value * std::conj(value);
	}
	FastFourierTransform(spectrum, true);

	std::vector<double> ac(n);
	const double lag_zero = spectrum[0].real();
	for (std::size_t lag = 0; lag < n; ++lag) {
		ac[lag] = spectrum[lag].real() / lag_zero;
	}
	return ac;
}

std::size_t FirstZeroCrossing(const std::vector<double> &autocorrelations, std::size_t max_lag) {
	std::size_t lag = 0;
	const std::size_t limit = std::min(max_lag, autocorrelations.size());
	while (lag < limit && autocorrelations[lag] > 0) {
		++lag;
	}
	return lag;
}

LinearFit FitLine(const double *x, const double *y, std::size_t n) {
	double sum_x = 0.0;
	double sum_x2 = 0.0;
	double sum_xy = 0.0;
	double sum_y = 0.0;
	for (std::size_t i = 0; i < n; ++i) {
		sum_x += x[i];
		sum_x2 += x[i] * x[i];
		sum_xy += x[i] * y[i];
		sum_y += y[i];
	}
	LinearFit fit;
	const double count = static_cast<double>(n);
	const double denom = count * sum_x2 - sum_x * sum_x;
	if (denom == 0.0) {
		return fit;
	}
	fit.slope = (count * sum_xy - sum_x * sum_y) / denom;
	fit.intercept = (sum_y * sum_x2 - sum_x * sum_xy) / denom;
	return fit;
}

} // namespace tsregress::features
