#include "tsregress/core/errors.hpp"
#include "tsregress/features/feature_math.hpp"
#include "tsregress/transform/series_transformer.hpp"
#include <complex>

namespace tsregress::transform {

core::SeriesBatch SeriesTransformer::transformBatch(const core::SeriesBatch &batch) const {
	std::vector<core::SeriesBatch::Case> cases;
	cases.reserve(batch.nCases());
	for (std::size_t c = 0; c < batch.nCases(); ++c) {
		if (outputLength(batch.nTimepoints(c)) == 0) {
			throw core::ShapeMismatchError(getName() + ": case " + std::to_string(c) + " with " +
			                               std::to_string(batch.nTimepoints(c)) +
			                               " timepoints is too short for this representation.");
		}
		core::SeriesBatch::Case transformed;
		transformed.reserve(batch.nChannels());
		for (const auto &channel : batch[c]) {
			transformed.push_back(transform(channel));
		}
		cases.push_back(std::move(transformed));
	}
	return core::SeriesBatch(std::move(cases));
}

std::vector<double> Identity::transform(const std::vector<double> &channel) const {
	return channel;
}

core::SeriesBatch Identity::transformBatch(const core::SeriesBatch &batch) const {
	return batch;
}

std::vector<double> FirstDifference::transform(const std::vector<double> &channel) const {
	std::vector<double> diffs;
	if (channel.size() < 2) {
		return diffs;
	}
	diffs.reserve(channel.size() - 1);
	for (std::size_t i = 1; i < channel.size(); ++i) {
		diffs.push_back(channel[i] - channel[i - 1]);
	}
	return diffs;
}

std::size_t Periodogram::outputLength(std::size_t n_timepoints) const {
	return features::NextPowerOfTwo(n_timepoints) / 2;
}

std::vector<double> Periodogram::transform(const std::vector<double> &channel) const {
	const std::size_t n_fft = features::NextPowerOfTwo(channel.size());
	std::vector<std::complex<double>> spectrum(n_fft, {0.0, 0.0});
	for (std::size_t i = 0; i < channel.size(); ++i) {
		spectrum[i] = {channel[i], 0.0};
	}
	features::FastFourierTransform(spectrum);

	std::vector<double> magnitude(n_fft / 2);
	for (std::size_t i = 0; i < magnitude.size(); ++i) {
		magnitude[i] = std::abs(spectrum[i]);
	}
	return magnitude;
}

std::vector<SeriesTransformerPtr> DefaultRepresentations() {
	return {std::make_shared<Identity>()};
}

} // namespace tsregress::transform
