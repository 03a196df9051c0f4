#pragma once

#include "tsregress/core/series_batch.hpp"

#include <cmath>
#include <cstddef>
#include <random>
#include <vector>

namespace tests::helpers {

struct LabelledBatch {
	tsregress::core::SeriesBatch batch;
	std::vector<double> targets;
};

/// Noisy sinusoids whose target is the amplitude of the case.
inline LabelledBatch makeAmplitudeBatch(std::size_t n_cases, std::size_t n_timepoints, std::size_t n_channels = 1,
                                        unsigned seed = 7) {
	std::mt19937 rng(seed);
	std::normal_distribution<double> noise(0.0, 0.1);
	std::uniform_real_distribution<double> amplitude(0.5, 3.0);

	std::vector<tsregress::core::SeriesBatch::Case> cases;
	std::vector<double> targets;
	for (std::size_t c = 0; c < n_cases; ++c) {
		const double a = amplitude(rng);
		tsregress::core::SeriesBatch::Case series_case;
		for (std::size_t ch = 0; ch < n_channels; ++ch) {
			std::vector<double> channel(n_timepoints);
			for (std::size_t t = 0; t < n_timepoints; ++t) {
				channel[t] = a * std::sin(0.5 * static_cast<double>(t) + static_cast<double>(ch)) + noise(rng);
			}
			series_case.push_back(std::move(channel));
		}
		cases.push_back(std::move(series_case));
		targets.push_back(a);
	}
	return {tsregress::core::SeriesBatch(std::move(cases)), std::move(targets)};
}

/// Univariate linear trends of varying length; the target is the slope.
inline LabelledBatch makeVariableLengthBatch(std::size_t n_cases, std::size_t min_length) {
	std::vector<std::vector<double>> rows;
	std::vector<double> targets;
	for (std::size_t c = 0; c < n_cases; ++c) {
		const double slope = 0.1 * static_cast<double>(c + 1);
		std::vector<double> row(min_length + c % 4);
		for (std::size_t t = 0; t < row.size(); ++t) {
			row[t] = slope * static_cast<double>(t) + std::cos(static_cast<double>(t));
		}
		rows.push_back(std::move(row));
		targets.push_back(slope);
	}
	return {tsregress::core::SeriesBatch::fromUnivariate(std::move(rows)), std::move(targets)};
}

inline bool allFinite(const std::vector<double> &values) {
	for (double value : values) {
		if (!std::isfinite(value)) {
			return false;
		}
	}
	return true;
}

} // namespace tests::helpers
