#include "tsregress/interval/attribute_subsampler.hpp"
#include "tsregress/core/errors.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <sstream>

namespace tsregress::interval {

AttributeSubsample::AttributeSubsample(int count) {
	if (count <= 0) {
		throw core::ConfigurationError("att_subsample_size must be positive.");
	}
	value_ = static_cast<std::size_t>(count);
}

AttributeSubsample AttributeSubsample::Proportion(double proportion) {
	if (!std::isfinite(proportion) || proportion <= 0.0 || proportion > 1.0) {
		throw core::ConfigurationError("att_subsample_size proportion must lie in (0, 1].");
	}
	AttributeSubsample subsample;
	subsample.value_ = proportion;
	return subsample;
}

std::size_t AttributeSubsample::resolve(std::size_t n_available) const {
	if (n_available == 0) {
		throw core::ConfigurationError("The attribute registry is empty.");
	}
	if (isAll()) {
		return n_available;
	}
	if (const auto *proportion = std::get_if<double>(&value_)) {
		const auto count = std::lround(*proportion * static_cast<double>(n_available));
		return std::clamp<std::size_t>(static_cast<std::size_t>(std::max<long>(count, 1)), 1, n_available);
	}
	const auto count = std::get<std::size_t>(value_);
	if (count == 0) {
		throw core::ConfigurationError("att_subsample_size must be positive.");
	}
	if (count > n_available) {
		throw core::ConfigurationError("att_subsample_size " + std::to_string(count) + " exceeds the " +
		                               std::to_string(n_available) + " registered attributes.");
	}
	return count;
}

std::string AttributeSubsample::toString() const {
	if (isAll()) {
		return "None";
	}
	std::ostringstream out;
	if (const auto *proportion = std::get_if<double>(&value_)) {
		out << *proportion;
	} else {
		out << std::get<std::size_t>(value_);
	}
	return out.str();
}

AttributeSubsampler::AttributeSubsampler(const features::FeatureRegistry &registry, AttributeSubsample subsample)
    : n_available_(registry.Size()), selection_size_(subsample.resolve(registry.Size())),
      take_all_(subsample.isAll()) {
}

AttributeSelection AttributeSubsampler::subsample(std::mt19937 &rng) const {
	AttributeSelection selection(n_available_);
	std::iota(selection.begin(), selection.end(), std::size_t {0});
	if (take_all_) {
		return selection;
	}
	std::shuffle(selection.begin(), selection.end(), rng);
	selection.resize(selection_size_);
	return selection;
}

} // namespace tsregress::interval
