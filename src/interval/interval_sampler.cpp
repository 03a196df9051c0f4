#include "tsregress/interval/interval_sampler.hpp"
#include "tsregress/core/errors.hpp"
#include "tsregress/utils/logging.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace tsregress::interval {

IntervalCount::IntervalCount(int count) {
	if (count < 0) {
		throw core::ConfigurationError("n_intervals must not be negative.");
	}
	terms_.emplace_back(static_cast<std::size_t>(count));
}

std::size_t IntervalCount::resolve(std::size_t n_timepoints, std::size_t n_representations) const {
	if (terms_.empty()) {
		throw core::ConfigurationError("n_intervals: an interval count needs at least one term.");
	}
	const double root = std::sqrt(static_cast<double>(n_timepoints));
	std::size_t total = 0;
	for (const auto &term : terms_) {
		if (const auto *literal = std::get_if<std::size_t>(&term)) {
			total += *literal;
			continue;
		}
		switch (std::get<IntervalCountRule>(term)) {
		case IntervalCountRule::Sqrt:
			total += static_cast<std::size_t>(std::lround(root));
			break;
		case IntervalCountRule::SqrtDiv:
			total += static_cast<std::size_t>(
			    std::lround(root / static_cast<double>(std::max<std::size_t>(n_representations, 1))));
			break;
		}
	}
	return std::max<std::size_t>(total, 1);
}

std::string IntervalCount::toString() const {
	std::ostringstream out;
	for (std::size_t i = 0; i < terms_.size(); ++i) {
		if (i > 0) {
			out << "+";
		}
		if (const auto *literal = std::get_if<std::size_t>(&terms_[i])) {
			out << *literal;
		} else {
			out << (std::get<IntervalCountRule>(terms_[i]) == IntervalCountRule::Sqrt ? "sqrt" : "sqrt-div");
		}
	}
	return out.str();
}

LengthBound::LengthBound(int absolute) {
	if (absolute < 0) {
		throw core::ConfigurationError("Interval lengths must not be negative.");
	}
	value_ = static_cast<std::size_t>(absolute);
}

LengthBound LengthBound::Proportion(double proportion) {
	if (!std::isfinite(proportion) || proportion <= 0.0) {
		throw core::ConfigurationError("Interval length proportion must be a positive finite number.");
	}
	LengthBound bound;
	bound.value_ = proportion;
	return bound;
}

std::size_t LengthBound::resolve(std::size_t n_timepoints) const {
	if (isUnbounded()) {
		return n_timepoints;
	}
	if (const auto *proportion = std::get_if<double>(&value_)) {
		const auto length = std::lround(*proportion * static_cast<double>(n_timepoints));
		return static_cast<std::size_t>(std::max<long>(length, 1));
	}
	return std::get<std::size_t>(value_);
}

std::string LengthBound::toString() const {
	if (isUnbounded()) {
		return "inf";
	}
	std::ostringstream out;
	if (const auto *proportion = std::get_if<double>(&value_)) {
		out << *proportion;
	} else {
		out << std::get<std::size_t>(value_);
	}
	return out.str();
}

ResolvedGeometry ResolveGeometry(std::size_t n_timepoints, std::size_t n_channels, const IntervalCount &count,
                                 const LengthBound &min_length, const LengthBound &max_length,
                                 std::size_t n_representations) {
	if (n_timepoints == 0 || n_channels == 0) {
		throw core::ConfigurationError("Cannot sample intervals from an empty series.");
	}
	std::size_t min_resolved = min_length.resolve(n_timepoints);
	std::size_t max_resolved = max_length.resolve(n_timepoints);
	// An unbounded maximum always admits the minimum.
	if (!max_length.isUnbounded() && min_resolved > max_resolved) {
		throw core::ConfigurationError("min_interval_length (" + min_length.toString() + " -> " +
		                               std::to_string(min_resolved) + ") exceeds max_interval_length (" +
		                               max_length.toString() + " -> " + std::to_string(max_resolved) + ").");
	}

	ResolvedGeometry geometry;
	geometry.n_timepoints = n_timepoints;
	geometry.n_channels = n_channels;
	geometry.n_intervals = count.resolve(n_timepoints, n_representations);
	geometry.min_length = std::clamp<std::size_t>(min_resolved, 1, n_timepoints);
	geometry.max_length = std::clamp<std::size_t>(max_resolved, 1, n_timepoints);
	if (geometry.max_length < geometry.min_length) {
		geometry.max_length = geometry.min_length;
	}
	if (min_resolved > n_timepoints) {
		TSREGRESS_DEBUG("min_interval_length {} exceeds series length {}; using full-series intervals.",
		                min_resolved, n_timepoints);
	}
	return geometry;
}

IntervalSampler::IntervalSampler(ResolvedGeometry geometry, std::size_t representation)
    : geometry_(geometry), representation_(representation) {
	if (geometry_.n_timepoints == 0 || geometry_.n_channels == 0) {
		throw std::invalid_argument("IntervalSampler: geometry has no timepoints or channels.");
	}
	if (geometry_.min_length < 1 || geometry_.min_length > geometry_.max_length ||
	    geometry_.max_length > geometry_.n_timepoints) {
		throw std::invalid_argument("IntervalSampler: geometry length bounds are not resolved.");
	}
}

std::vector<IntervalSpec> IntervalSampler::sample(std::mt19937 &rng) const {
	std::uniform_int_distribution<std::size_t> channel_dist(0, geometry_.n_channels - 1);
	std::uniform_int_distribution<std::size_t> length_dist(geometry_.min_length, geometry_.max_length);

	std::vector<IntervalSpec> intervals;
	intervals.reserve(geometry_.n_intervals);
	for (std::size_t i = 0; i < geometry_.n_intervals; ++i) {
		IntervalSpec spec;
		spec.representation = representation_;
		spec.channel = channel_dist(rng);
		spec.length = length_dist(rng);
		std::uniform_int_distribution<std::size_t> start_dist(0, geometry_.n_timepoints - spec.length);
		spec.start = start_dist(rng);
		intervals.push_back(spec);
	}
	return intervals;
}

std::vector<IntervalSpec> SampleIntervals(std::size_t n_timepoints, std::size_t n_channels,
                                          const IntervalCount &count, const LengthBound &min_length,
                                          const LengthBound &max_length, std::mt19937 &rng) {
	return IntervalSampler(ResolveGeometry(n_timepoints, n_channels, count, min_length, max_length)).sample(rng);
}

} // namespace tsregress::interval
