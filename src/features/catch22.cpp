#include "tsregress/features/feature_calculators.hpp"
#include "tsregress/features/feature_math.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <array>
#include <cmath>
#include <complex>
#include <limits>
#include <numeric>
#include <optional>

namespace tsregress::features {

namespace {

constexpr double kPi = 3.14159265358979323846;

double NaN() {
	return std::numeric_limits<double>::quiet_NaN();
}

double MinValue(const std::vector<double> &values) {
	return *std::min_element(values.begin(), values.end());
}

double MaxValue(const std::vector<double> &values) {
	return *std::max_element(values.begin(), values.end());
}

// Unbiased covariance of the first n values of x and y.
double Covariance(const double *x, const double *y, std::size_t n) {
	double mean_x = 0.0;
	double mean_y = 0.0;
	for (std::size_t i = 0; i < n; ++i) {
		mean_x += x[i];
		mean_y += y[i];
	}
	mean_x /= static_cast<double>(n);
	mean_y /= static_cast<double>(n);
	double sum = 0.0;
	for (std::size_t i = 0; i < n; ++i) {
		sum += (x[i] - mean_x) * (y[i] - mean_y);
	}
	return sum / static_cast<double>(n - 1);
}

double Correlation(const double *x, const double *y, std::size_t n) {
	double mean_x = 0.0;
	double mean_y = 0.0;
	for (std::size_t i = 0; i < n; ++i) {
		mean_x += x[i];
		mean_y += y[i];
	}
	mean_x /= static_cast<double>(n);
	mean_y /= static_cast<double>(n);
	double nom = 0.0;
	double denom_x = 0.0;
	double denom_y = 0.0;
	for (std::size_t i = 0; i < n; ++i) {
		nom += (x[i] - mean_x) * (y[i] - mean_y);
		denom_x += (x[i] - mean_x) * (x[i] - mean_x);
		denom_y += (y[i] - mean_y) * (y[i] - mean_y);
	}
	return nom / std::sqrt(denom_x * denom_y);
}

// Linearly interpolated quantile on the half-sample grid used by catch22.
double GridQuantile(const std::vector<double> &sorted, double quant) {
	const double n = static_cast<double>(sorted.size());
	const double q = 0.5 / n;
	if (quant < q) {
		return sorted.front();
	}
	if (quant > 1.0 - q) {
		return sorted.back();
	}
	const double quant_idx = n * quant - 0.5;
	const auto left = static_cast<std::size_t>(std::floor(quant_idx));
	const auto right = static_cast<std::size_t>(std::ceil(quant_idx));
	if (left == right) {
		return sorted[left];
	}
	return sorted[left] + (quant_idx - static_cast<double>(left)) * (sorted[right] - sorted[left]) /
	                          static_cast<double>(right - left);
}

// Labels each value 1..groups by equiprobable quantile bins; 0 marks values outside every bin.
std::vector<int> CoarseGrainQuantile(const std::vector<double> &y, int groups) {
	std::vector<double> sorted = y;
	std::sort(sorted.begin(), sorted.end());
	std::vector<double> thresholds(groups + 1);
	for (int i = 0; i <= groups; ++i) {
		thresholds[i] = GridQuantile(sorted, static_cast<double>(i) / groups);
	}
	thresholds[0] -= 1.0;
	std::vector<int> labels(y.size(), 0);
	for (int i = 0; i < groups; ++i) {
		for (std::size_t j = 0; j < y.size(); ++j) {
			if (y[j] > thresholds[i] && y[j] <= thresholds[i + 1]) {
				labels[j] = i + 1;
			}
		}
	}
	return labels;
}

struct Histogram {
	std::vector<int> counts;
	std::vector<double> edges;
};

// Equal-width histogram spanning [min, max]; the caller guarantees a non-zero range.
Histogram HistCounts(const std::vector<double> &y, int n_bins) {
	const double min_val = MinValue(y);
	const double max_val = MaxValue(y);
	const double bin_step = (max_val - min_val) / n_bins;
	Histogram hist;
	hist.counts.assign(n_bins, 0);
	for (double value : y) {
		int bin = static_cast<int>((value - min_val) / bin_step);
		bin = std::clamp(bin, 0, n_bins - 1);
		hist.counts[bin] += 1;
	}
	hist.edges.resize(n_bins + 1);
	for (int i = 0; i <= n_bins; ++i) {
		hist.edges[i] = min_val + i * bin_step;
	}
	return hist;
}

double HistogramMode(const Series &series, int n_bins) {
	if (series.empty()) {
		return NaN();
	}
	if (IsConstant(series)) {
		return series.front();
	}
	auto hist = HistCounts(series, n_bins);
	int max_count = 0;
	int num_maxs = 1;
	double out = 0.0;
	for (int i = 0; i < n_bins; ++i) {
		const double centre = (hist.edges[i] + hist.edges[i + 1]) * 0.5;
		if (hist.counts[i] > max_count) {
			max_count = hist.counts[i];
			num_maxs = 1;
			out = centre;
		} else if (hist.counts[i] == max_count) {
			num_maxs += 1;
			out += centre;
		}
	}
	return out / num_maxs;
}

double FeatureHistogramMode5(const Series &series, FeatureCache &) {
	return HistogramMode(series, 5);
}

double FeatureHistogramMode10(const Series &series, FeatureCache &) {
	return HistogramMode(series, 10);
}

double FeatureBinaryStatsDiffLongstretch0(const Series &series, FeatureCache &) {
	if (series.size() < 2) {
		return NaN();
	}
	const std::size_t n = series.size() - 1;
	int max_stretch = 0;
	std::size_t last_one = 0;
	for (std::size_t i = 0; i < n; ++i) {
		const bool rising = series[i + 1] - series[i] >= 0;
		if (rising || i == n - 1) {
			const int stretch = static_cast<int>(i - last_one);
			max_stretch = std::max(max_stretch, stretch);
			last_one = i;
		}
	}
	return max_stretch;
}

double FeatureBinaryStatsMeanLongstretch1(const Series &series, FeatureCache &cache) {
	if (series.size() < 2) {
		return NaN();
	}
	const double mean = ComputeMean(series, cache);
	const std::size_t n = series.size() - 1;
	int max_stretch = 0;
	std::size_t last_zero = 0;
	for (std::size_t i = 0; i < n; ++i) {
		const bool above = series[i] - mean > 0;
		if (!above || i == n - 1) {
			const int stretch = static_cast<int>(i - last_zero);
			max_stretch = std::max(max_stretch, stretch);
			last_zero = i;
		}
	}
	return max_stretch;
}

// Median position of exceedances as the threshold sweeps through the (normalised) tail.
double OutlierInclude(const std::vector<double> &y, double sign) {
	if (y.empty() || IsConstant(y)) {
		return 0.0;
	}
	for (double v : y) {
		if (!std::isfinite(v)) {
			return NaN();
		}
	}
	const double increment = 0.01;
	const std::size_t n = y.size();
	std::vector<double> work(n);
	int total = 0;
	for (std::size_t i = 0; i < n; ++i) {
		work[i] = sign * y[i];
		if (work[i] >= 0) {
			total += 1;
		}
	}
	const double max_val = MaxValue(work);
	if (max_val < increment) {
		return 0.0;
	}
	const auto n_thresh = static_cast<std::size_t>(max_val / increment) + 1;

	std::vector<double> mean_gap(n_thresh);
	std::vector<double> proportion(n_thresh);
	std::vector<double> median_pos(n_thresh);
	std::vector<double> high_indices;
	high_indices.reserve(n);
	for (std::size_t j = 0; j < n_thresh; ++j) {
		high_indices.clear();
		const double threshold = static_cast<double>(j) * increment;
		for (std::size_t i = 0; i < n; ++i) {
			if (work[i] >= threshold) {
				high_indices.push_back(static_cast<double>(i));
			}
		}
		if (high_indices.empty()) {
			mean_gap[j] = NaN();
			proportion[j] = 0.0;
			median_pos[j] = NaN();
			continue;
		}
		std::vector<double> gaps;
		for (std::size_t i = 0; i + 1 < high_indices.size(); ++i) {
			gaps.push_back(high_indices[i + 1] - high_indices[i]);
		}
		mean_gap[j] = Mean(gaps);
		proportion[j] = (static_cast<double>(high_indices.size()) - 1.0) * 100.0 / total;
		median_pos[j] = Median(high_indices) / (static_cast<double>(n) / 2.0) - 1.0;
	}

	const double trim_threshold = 2.0;
	std::size_t last_above_trim = 0;
	std::size_t first_bad_index = n_thresh - 1;
	for (std::size_t i = 0; i < n_thresh; ++i) {
		if (proportion[i] > trim_threshold) {
			last_above_trim = i;
		}
		if (std::isnan(mean_gap[n_thresh - 1 - i])) {
			first_bad_index = n_thresh - 1 - i;
		}
	}
	const std::size_t trim_limit = std::min(last_above_trim, first_bad_index);
	return Median(std::vector<double>(median_pos.begin(), median_pos.begin() + trim_limit + 1));
}

double FeatureOutlierIncludeP(const Series &series, FeatureCache &cache) {
	if (IsConstant(series)) {
		return 0.0;
	}
	return OutlierInclude(ComputeZScored(series, cache), 1.0);
}

double FeatureOutlierIncludeN(const Series &series, FeatureCache &cache) {
	if (IsConstant(series)) {
		return 0.0;
	}
	return OutlierInclude(ComputeZScored(series, cache), -1.0);
}

double FeatureFirstOneOverEAutocorrelation(const Series &series, FeatureCache &cache) {
	if (series.size() < 2 || IsConstant(series)) {
		return NaN();
	}
	const auto &ac = ComputeAutocorrelations(series, cache);
	const double threshold = 1.0 / std::exp(1.0);
	for (std::size_t i = 0; i + 1 < series.size(); ++i) {
		if (ac[i + 1] < threshold) {
			const double m = ac[i + 1] - ac[i];
			const double dy = threshold - ac[i];
			return static_cast<double>(i) + dy / m;
		}
	}
	return static_cast<double>(series.size());
}

double FeatureFirstMinAutocorrelation(const Series &series, FeatureCache &cache) {
	if (series.size() < 3 || IsConstant(series)) {
		return NaN();
	}
	const auto &ac = ComputeAutocorrelations(series, cache);
	for (std::size_t i = 1; i + 1 < series.size(); ++i) {
		if (ac[i] < ac[i - 1] && ac[i] < ac[i + 1]) {
			return static_cast<double>(i);
		}
	}
	return static_cast<double>(series.size());
}

struct WelchSpectrum {
	std::vector<double> angular_frequency;
	std::vector<double> power;
};

// Single rectangular-window Welch estimate over the whole slice, in angular frequency.
WelchSpectrum WelchRect(const Series &series, double mean) {
	const std::size_t n = series.size();
	const std::size_t n_fft = NextPowerOfTwo(n);
	std::vector<std::complex<double>> spectrum(n_fft, {0.0, 0.0});
	for (std::size_t i = 0; i < n; ++i) {
		spectrum[i] = {series[i] - mean, 0.0};
	}
	FastFourierTransform(spectrum);

	const std::size_t n_welch = n_fft / 2 + 1;
	const double scale = static_cast<double>(n);
	WelchSpectrum welch;
	welch.angular_frequency.resize(n_welch);
	welch.power.resize(n_welch);
	for (std::size_t i = 0; i < n_welch; ++i) {
		double pxx = std::norm(spectrum[i]) / scale;
		if (i > 0 && i < n_fft / 2) {
			pxx *= 2.0;
		}
		welch.angular_frequency[i] = 2.0 * kPi * static_cast<double>(i) / static_cast<double>(n_fft);
		welch.power[i] = pxx / (2.0 * kPi);
	}
	return welch;
}

double FeatureWelchRectArea51(const Series &series, FeatureCache &cache) {
	if (series.size() < 2) {
		return NaN();
	}
	auto welch = WelchRect(series, ComputeMean(series, cache));
	const double dw = welch.angular_frequency[1] - welch.angular_frequency[0];
	double area = 0.0;
	const std::size_t limit = welch.power.size() / 5;
	for (std::size_t i = 0; i < limit; ++i) {
		area += welch.power[i];
	}
	return area * dw;
}

double FeatureWelchRectCentroid(const Series &series, FeatureCache &cache) {
	if (series.size() < 2) {
		return NaN();
	}
	auto welch = WelchRect(series, ComputeMean(series, cache));
	std::vector<double> cumulative(welch.power.size());
	std::partial_sum(welch.power.begin(), welch.power.end(), cumulative.begin());
	const double half = cumulative.back() * 0.5;
	for (std::size_t i = 0; i < cumulative.size(); ++i) {
		if (cumulative[i] > half) {
			return welch.angular_frequency[i];
		}
	}
	return 0.0;
}

// Residuals of forecasting each point by the mean of the preceding @p train_length points.
std::vector<double> LocalMeanResiduals(const Series &series, std::size_t train_length) {
	std::vector<double> residuals;
	if (series.size() <= train_length) {
		return residuals;
	}
	residuals.reserve(series.size() - train_length);
	for (std::size_t i = 0; i + train_length < series.size(); ++i) {
		double window = 0.0;
		for (std::size_t j = 0; j < train_length; ++j) {
			window += series[i + j];
		}
		residuals.push_back(series[i + train_length] - window / static_cast<double>(train_length));
	}
	return residuals;
}

double FeatureLocalSimpleMean3Stderr(const Series &series, FeatureCache &) {
	auto residuals = LocalMeanResiduals(series, 3);
	return SampleStdDev(residuals);
}

double FeatureLocalSimpleMean1Tauresrat(const Series &series, FeatureCache &cache) {
	if (series.size() < 3 || IsConstant(series)) {
		return NaN();
	}
	auto residuals = LocalMeanResiduals(series, 1);
	const auto residual_tau = FirstZeroCrossing(Autocorrelations(residuals), residuals.size());
	const auto series_tau = ComputeFirstZeroCrossing(series, cache);
	return static_cast<double>(residual_tau) / static_cast<double>(series_tau);
}

double FeatureTrev1Num(const Series &series, FeatureCache &cache) {
	const auto &diffs = ComputeDiffs(series, cache);
	if (diffs.empty()) {
		return NaN();
	}
	double sum = 0.0;
	for (double d : diffs) {
		sum += d * d * d;
	}
	return sum / static_cast<double>(diffs.size());
}

double FeatureHistogramAmiEven25(const Series &series, FeatureCache &) {
	constexpr std::size_t tau = 2;
	constexpr int n_bins = 5;
	if (series.size() <= tau) {
		return NaN();
	}
	const double min_val = MinValue(series);
	const double max_val = MaxValue(series);
	const double bin_step = (max_val - min_val + 0.2) / n_bins;
	const double lower_edge = min_val - 0.1;
	auto bin_of = [&](double value) {
		int bin = static_cast<int>(std::floor((value - lower_edge) / bin_step));
		return std::clamp(bin, 0, n_bins - 1);
	};

	const std::size_t n_pairs = series.size() - tau;
	std::array<std::array<double, n_bins>, n_bins> joint {};
	for (std::size_t i = 0; i < n_pairs; ++i) {
		joint[bin_of(series[i])][bin_of(series[i + tau])] += 1.0;
	}
	std::array<double, n_bins> marginal_i {};
	std::array<double, n_bins> marginal_j {};
	for (int i = 0; i < n_bins; ++i) {
		for (int j = 0; j < n_bins; ++j) {
			joint[i][j] /= static_cast<double>(n_pairs);
			marginal_i[i] += joint[i][j];
			marginal_j[j] += joint[i][j];
		}
	}
	double ami = 0.0;
	for (int i = 0; i < n_bins; ++i) {
		for (int j = 0; j < n_bins; ++j) {
			if (joint[i][j] > 0) {
				ami += joint[i][j] * std::log(joint[i][j] / (marginal_i[i] * marginal_j[j]));
			}
		}
	}
	return ami;
}

double FeatureAutoMutualInfoStats40GaussianFmmi(const Series &series, FeatureCache &) {
	const std::size_t n = series.size();
	if (n < 2 || IsConstant(series)) {
		return NaN();
	}
	std::size_t tau = std::min<std::size_t>(40, static_cast<std::size_t>(std::ceil(n / 2.0)));
	std::vector<double> ami(tau);
	for (std::size_t i = 0; i < tau; ++i) {
		const std::size_t lag = i + 1;
		if (lag >= n) {
			ami[i] = NaN();
			continue;
		}
		const double ac = Correlation(series.data(), series.data() + lag, n - lag);
		ami[i] = -0.5 * std::log(1.0 - ac * ac);
	}
	for (std::size_t i = 1; i + 1 < tau; ++i) {
		if (ami[i] < ami[i - 1] && ami[i] < ami[i + 1]) {
			return static_cast<double>(i);
		}
	}
	return static_cast<double>(tau);
}

double FeatureHrvClassicPnn40(const Series &series, FeatureCache &cache) {
	const auto &diffs = ComputeDiffs(series, cache);
	if (diffs.empty()) {
		return NaN();
	}
	const double threshold = 40.0;
	std::size_t count = 0;
	for (double d : diffs) {
		if (std::fabs(d) * 1000.0 > threshold) {
			++count;
		}
	}
	return static_cast<double>(count) / static_cast<double>(diffs.size());
}

double FeatureMotifThreeQuantileHh(const Series &series, FeatureCache &) {
	constexpr int alphabet = 3;
	const std::size_t n = series.size();
	if (n < 2) {
		return NaN();
	}
	auto labels = CoarseGrainQuantile(series, alphabet);

	std::array<std::array<double, alphabet>, alphabet> transitions {};
	// The final symbol has no successor.
	for (std::size_t k = 0; k + 1 < n; ++k) {
		const int from = labels[k];
		const int to = labels[k + 1];
		if (from < 1 || to < 1) {
			continue;
		}
		transitions[from - 1][to - 1] += 1.0;
	}
	double entropy = 0.0;
	for (const auto &row : transitions) {
		for (double count : row) {
			const double p = count / (static_cast<double>(n) - 1.0);
			if (p > 0) {
				entropy -= p * std::log(p);
			}
		}
	}
	return entropy;
}

double FeatureEmbed2DistTauDExpfitMeandiff(const Series &series, FeatureCache &cache) {
	const std::size_t n = series.size();
	if (n < 3 || IsConstant(series)) {
		return NaN();
	}
	std::size_t tau = ComputeFirstZeroCrossing(series, cache);
	if (static_cast<double>(tau) > n / 10.0) {
		tau = static_cast<std::size_t>(std::floor(n / 10.0));
	}
	if (n < tau + 3) {
		return NaN();
	}
	std::vector<double> distances(n - tau - 1);
	for (std::size_t i = 0; i < distances.size(); ++i) {
		const double a = series[i + 1] - series[i];
		const double b = series[i + tau] - series[i + tau + 1];
		distances[i] = std::sqrt(a * a + b * b);
		if (std::isnan(distances[i])) {
			return NaN();
		}
	}

	const double scale = Mean(distances);
	const double spread = SampleStdDev(distances);
	if (!(spread >= 0.001)) {
		return 0.0;
	}
	const double range = MaxValue(distances) - MinValue(distances);
	const int n_bins =
	    static_cast<int>(std::ceil(range / (3.5 * spread / std::pow(static_cast<double>(distances.size()), 1.0 / 3.0))));
	if (n_bins <= 0) {
		return 0.0;
	}
	auto hist = HistCounts(distances, n_bins);
	double sum_diff = 0.0;
	for (int i = 0; i < n_bins; ++i) {
		const double density = static_cast<double>(hist.counts[i]) / static_cast<double>(distances.size());
		double expected = std::exp(-(hist.edges[i] + hist.edges[i + 1]) * 0.5 / scale) / scale;
		if (expected < 0) {
			expected = 0;
		}
		sum_diff += std::fabs(density - expected);
	}
	return sum_diff / n_bins;
}

enum class FluctuationMethod { Dfa, RangeFit };

// Proportion of timescales before the best two-segment break of the log fluctuation curve.
double FluctuationAnalysis(const std::vector<double> &y, std::size_t lag, FluctuationMethod method) {
	const std::size_t n = y.size();
	if (n / 2 < 5) {
		return 0.0;
	}
	const double lin_low = std::log(5.0);
	const double lin_high = std::log(static_cast<double>(n / 2));
	constexpr int n_tau_steps = 50;
	const double tau_step = (lin_high - lin_low) / (n_tau_steps - 1);
	std::vector<std::size_t> taus;
	taus.reserve(n_tau_steps);
	for (int i = 0; i < n_tau_steps; ++i) {
		taus.push_back(static_cast<std::size_t>(std::lround(std::exp(lin_low + i * tau_step))));
	}
	taus.erase(std::unique(taus.begin(), taus.end()), taus.end());
	const std::size_t n_tau = taus.size();
	if (n_tau < 12) {
		return 0.0;
	}

	const std::size_t size_cs = n / lag;
	std::vector<double> cumulative(size_cs);
	cumulative[0] = y[0];
	for (std::size_t i = 0; i + 1 < size_cs; ++i) {
		cumulative[i + 1] = cumulative[i] + y[(i + 1) * lag];
	}

	std::vector<double> support(taus.back());
	std::iota(support.begin(), support.end(), 1.0);

	std::vector<double> fluctuation(n_tau, 0.0);
	std::vector<double> buffer;
	for (std::size_t i = 0; i < n_tau; ++i) {
		const std::size_t tau = taus[i];
		const std::size_t n_buffer = size_cs / tau;
		buffer.resize(tau);
		for (std::size_t j = 0; j < n_buffer; ++j) {
			const double *segment = cumulative.data() + j * tau;
			auto fit = FitLine(support.data(), segment, tau);
			for (std::size_t k = 0; k < tau; ++k) {
				buffer[k] = segment[k] - (fit.slope * static_cast<double>(k + 1) + fit.intercept);
			}
			if (method == FluctuationMethod::RangeFit) {
				const double range = MaxValue(buffer) - MinValue(buffer);
				fluctuation[i] += range * range;
			} else {
				for (double b : buffer) {
					fluctuation[i] += b * b;
				}
			}
		}
		if (method == FluctuationMethod::RangeFit) {
			fluctuation[i] = std::sqrt(fluctuation[i] / static_cast<double>(n_buffer));
		} else {
			fluctuation[i] = std::sqrt(fluctuation[i] / static_cast<double>(n_buffer * tau));
		}
	}

	std::vector<double> log_tau(n_tau);
	std::vector<double> log_f(n_tau);
	for (std::size_t i = 0; i < n_tau; ++i) {
		log_tau[i] = std::log(static_cast<double>(taus[i]));
		log_f[i] = std::log(fluctuation[i]);
	}

	constexpr std::size_t min_points = 6;
	const std::size_t n_sserr = n_tau - 2 * min_points + 1;
	std::vector<double> sserr(n_sserr, 0.0);
	for (std::size_t i = min_points; i < n_tau - min_points + 1; ++i) {
		auto first = FitLine(log_tau.data(), log_f.data(), i);
		auto second = FitLine(log_tau.data() + i - 1, log_f.data() + i - 1, n_tau - i + 1);
		double norm_first = 0.0;
		for (std::size_t j = 0; j < i; ++j) {
			const double r = log_tau[j] * first.slope + first.intercept - log_f[j];
			norm_first += r * r;
		}
		double norm_second = 0.0;
		for (std::size_t j = 0; j < n_tau - i + 1; ++j) {
			const double r = log_tau[j + i - 1] * second.slope + second.intercept - log_f[j + i - 1];
			norm_second += r * r;
		}
		sserr[i - min_points] = std::sqrt(norm_first) + std::sqrt(norm_second);
	}

	double minimum = sserr[0];
	for (double value : sserr) {
		if (value < minimum) {
			minimum = value;
		}
	}
	double first_min_index = 0.0;
	for (std::size_t i = 0; i < n_sserr; ++i) {
		if (sserr[i] == minimum) {
			first_min_index = static_cast<double>(i + min_points - 1);
			break;
		}
	}
	return (first_min_index + 1.0) / static_cast<double>(n_tau);
}

double FeatureFluctAnalDfa(const Series &series, FeatureCache &) {
	if (IsConstant(series)) {
		return NaN();
	}
	std::vector<double> cumulative(series.size());
	std::partial_sum(series.begin(), series.end(), cumulative.begin());
	return FluctuationAnalysis(cumulative, 2, FluctuationMethod::Dfa);
}

double FeatureFluctAnalRangeFit(const Series &series, FeatureCache &) {
	if (IsConstant(series)) {
		return NaN();
	}
	return FluctuationAnalysis(series, 1, FluctuationMethod::RangeFit);
}

double FeatureTransitionMatrix3acSumdiagcov(const Series &series, FeatureCache &cache) {
	if (series.size() < 3 || IsConstant(series)) {
		return NaN();
	}
	constexpr int groups = 3;
	const std::size_t tau = ComputeFirstZeroCrossing(series, cache);
	if (tau == 0) {
		return NaN();
	}
	const std::size_t n_down = (series.size() - 1) / tau + 1;
	if (n_down < 2) {
		return NaN();
	}
	std::vector<double> downsampled(n_down);
	for (std::size_t i = 0; i < n_down; ++i) {
		downsampled[i] = series[i * tau];
	}
	auto labels = CoarseGrainQuantile(downsampled, groups);

	std::array<std::array<double, groups>, groups> transitions {};
	for (std::size_t j = 0; j + 1 < n_down; ++j) {
		if (labels[j] < 1 || labels[j + 1] < 1) {
			continue;
		}
		transitions[labels[j] - 1][labels[j + 1] - 1] += 1.0;
	}
	for (auto &row : transitions) {
		for (auto &value : row) {
			value /= static_cast<double>(n_down - 1);
		}
	}

	double sum_diag_cov = 0.0;
	for (int col = 0; col < groups; ++col) {
		std::array<double, groups> column {};
		for (int row = 0; row < groups; ++row) {
			column[row] = transitions[row][col];
		}
		sum_diag_cov += Covariance(column.data(), column.data(), groups);
	}
	return sum_diag_cov;
}

// Least-squares cubic spline with one interior break at the middle of the slice.
std::vector<double> SplineTrend(const Series &series) {
	const std::size_t n = series.size();
	const double last = static_cast<double>(n - 1);
	const double knot = (std::floor(n / 2.0) - 1.0) / last;
	Eigen::MatrixXd basis(static_cast<Eigen::Index>(n), 5);
	Eigen::VectorXd target(static_cast<Eigen::Index>(n));
	for (std::size_t i = 0; i < n; ++i) {
		const double t = static_cast<double>(i) / last;
		const double shifted = std::max(t - knot, 0.0);
		const auto row = static_cast<Eigen::Index>(i);
		basis(row, 0) = 1.0;
		basis(row, 1) = t;
		basis(row, 2) = t * t;
		basis(row, 3) = t * t * t;
		basis(row, 4) = shifted * shifted * shifted;
		target(row) = series[i];
	}
	Eigen::VectorXd coefficients = basis.colPivHouseholderQr().solve(target);
	Eigen::VectorXd fitted = basis * coefficients;
	return std::vector<double>(fitted.data(), fitted.data() + fitted.size());
}

double FeaturePeriodicityWangTh001(const Series &series, FeatureCache &) {
	const std::size_t n = series.size();
	if (n < 4 || IsConstant(series)) {
		return NaN();
	}
	const double threshold = 0.01;
	auto trend = SplineTrend(series);
	std::vector<double> detrended(n);
	for (std::size_t i = 0; i < n; ++i) {
		detrended[i] = series[i] - trend[i];
	}

	const auto ac_max = static_cast<std::size_t>(std::ceil(n / 3.0));
	std::vector<double> acf(ac_max);
	for (std::size_t tau = 1; tau <= ac_max; ++tau) {
		acf[tau - 1] = Covariance(detrended.data(), detrended.data() + tau, n - tau);
	}

	std::vector<std::size_t> troughs;
	std::vector<std::size_t> peaks;
	for (std::size_t i = 1; i + 1 < ac_max; ++i) {
		const double slope_in = acf[i] - acf[i - 1];
		const double slope_out = acf[i + 1] - acf[i];
		if (slope_in < 0 && slope_out > 0) {
			troughs.push_back(i);
		} else if (slope_in > 0 && slope_out < 0) {
			peaks.push_back(i);
		}
	}

	for (auto peak : peaks) {
		const double the_peak = acf[peak];
		// Nearest trough before this peak.
		std::optional<std::size_t> trough;
		for (auto candidate : troughs) {
			if (candidate >= peak) {
				break;
			}
			trough = candidate;
		}
		if (!trough) {
			continue;
		}
		if (the_peak - acf[*trough] < threshold) {
			continue;
		}
		if (the_peak < 0) {
			continue;
		}
		return static_cast<double>(peak);
	}
	return 0.0;
}

} // namespace

void RegisterCatch22Features(FeatureRegistry &registry) {
	registry.Register("DN_HistogramMode_5", FeatureHistogramMode5);
	registry.Register("DN_HistogramMode_10", FeatureHistogramMode10);
	registry.Register("SB_BinaryStats_diff_longstretch0", FeatureBinaryStatsDiffLongstretch0);
	registry.Register("DN_OutlierInclude_p_001_mdrmd", FeatureOutlierIncludeP);
	registry.Register("DN_OutlierInclude_n_001_mdrmd", FeatureOutlierIncludeN);
	registry.Register("CO_f1ecac", FeatureFirstOneOverEAutocorrelation);
	registry.Register("CO_FirstMin_ac", FeatureFirstMinAutocorrelation);
	registry.Register("SP_Summaries_welch_rect_area_5_1", FeatureWelchRectArea51);
	registry.Register("SP_Summaries_welch_rect_centroid", FeatureWelchRectCentroid);
	registry.Register("FC_LocalSimple_mean3_stderr", FeatureLocalSimpleMean3Stderr);
	registry.Register("CO_trev_1_num", FeatureTrev1Num);
	registry.Register("CO_HistogramAMI_even_2_5", FeatureHistogramAmiEven25);
	registry.Register("IN_AutoMutualInfoStats_40_gaussian_fmmi", FeatureAutoMutualInfoStats40GaussianFmmi);
	registry.Register("MD_hrv_classic_pnn40", FeatureHrvClassicPnn40);
	registry.Register("SB_BinaryStats_mean_longstretch1", FeatureBinaryStatsMeanLongstretch1);
	registry.Register("SB_MotifThree_quantile_hh", FeatureMotifThreeQuantileHh);
	registry.Register("FC_LocalSimple_mean1_tauresrat", FeatureLocalSimpleMean1Tauresrat);
	registry.Register("CO_Embed2_Dist_tau_d_expfit_meandiff", FeatureEmbed2DistTauDExpfitMeandiff);
	registry.Register("SC_FluctAnal_2_dfa_50_1_2_logi_prop_r1", FeatureFluctAnalDfa);
	registry.Register("SC_FluctAnal_2_rsrangefit_50_1_logi_prop_r1", FeatureFluctAnalRangeFit);
	registry.Register("SB_TransitionMatrix_3ac_sumdiagcov", FeatureTransitionMatrix3acSumdiagcov);
	registry.Register("PD_PeriodicityWang_th0_01", FeaturePeriodicityWangTh001);
}

} // namespace tsregress::features
