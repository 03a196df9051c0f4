#include "tsregress/interval/interval_feature_extractor.hpp"
#include "tsregress/core/errors.hpp"
#include "tsregress/features/feature_math.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

namespace tsregress::interval {

IntervalFeatureExtractor::IntervalFeatureExtractor(std::shared_ptr<const features::FeatureRegistry> registry,
                                                   double replace_nan)
    : registry_(std::move(registry)), replace_nan_(replace_nan) {
	if (!registry_) {
		throw std::invalid_argument("IntervalFeatureExtractor requires a feature registry.");
	}
}

core::FeatureTable IntervalFeatureExtractor::extract(const core::SeriesBatch &batch,
                                                     const std::vector<IntervalSpec> &intervals,
                                                     const AttributeSelection &attributes) const {
	core::FeatureTable table(batch.nCases(), intervals.size() * attributes.size());
	extractInto(batch, intervals, attributes, table, 0);
	return table;
}

core::FeatureTable IntervalFeatureExtractor::extract(const std::vector<core::SeriesBatch> &representations,
                                                     const std::vector<IntervalBlock> &blocks) const {
	if (representations.empty()) {
		throw std::invalid_argument("IntervalFeatureExtractor: no representations supplied.");
	}
	const std::size_t n_cases = representations.front().nCases();
	std::size_t n_columns = 0;
	for (const auto &block : blocks) {
		if (block.representation >= representations.size()) {
			throw std::out_of_range("IntervalFeatureExtractor: block refers to a missing representation.");
		}
		if (representations[block.representation].nCases() != n_cases) {
			throw core::ShapeMismatchError("IntervalFeatureExtractor: representations disagree on the case count.");
		}
		n_columns += block.nColumns();
	}

	core::FeatureTable table(n_cases, n_columns);
	std::size_t offset = 0;
	for (const auto &block : blocks) {
		extractInto(representations[block.representation], block.intervals, block.attributes, table, offset);
		offset += block.nColumns();
	}
	return table;
}

void IntervalFeatureExtractor::extractInto(const core::SeriesBatch &batch, const std::vector<IntervalSpec> &intervals,
                                           const AttributeSelection &attributes, core::FeatureTable &table,
                                           std::size_t column_offset) const {
	for (auto attribute : attributes) {
		if (attribute >= registry_->Size()) {
			throw std::out_of_range("IntervalFeatureExtractor: attribute index " + std::to_string(attribute) +
			                        " is not registered.");
		}
	}

	features::Series slice;
	for (std::size_t c = 0; c < batch.nCases(); ++c) {
		const std::size_t n_timepoints = batch.nTimepoints(c);
		std::size_t column = column_offset;
		for (const auto &spec : intervals) {
			if (spec.channel >= batch.nChannels() || spec.length == 0 || spec.start + spec.length > n_timepoints) {
				throw core::ShapeMismatchError("Interval [" + std::to_string(spec.start) + ", " +
				                               std::to_string(spec.start + spec.length) + ") on channel " +
				                               std::to_string(spec.channel) + " does not fit case " +
				                               std::to_string(c) + " with " + std::to_string(n_timepoints) +
				                               " timepoints.");
			}
			const auto &channel = batch[c][spec.channel];
			slice.assign(channel.begin() + static_cast<std::ptrdiff_t>(spec.start),
			             channel.begin() + static_cast<std::ptrdiff_t>(spec.start + spec.length));
			features::FeatureCache cache(slice);
			for (auto attribute : attributes) {
				double value = registry_->Compute(attribute, slice, cache);
				if (!std::isfinite(value)) {
					value = replace_nan_;
				}
				table(c, column++) = value;
			}
		}
	}
}

} // namespace tsregress::interval
