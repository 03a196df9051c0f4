#pragma once

#include <cstddef>
#include <random>
#include <string>
#include <variant>
#include <vector>

namespace tsregress::interval {

/**
 * @struct IntervalSpec
 * @brief A contiguous range of one channel of one series representation.
 *
 * Invariant: start + length never exceeds the timepoints of the representation
 * the interval was sampled for. Intervals are immutable once sampled.
 */
struct IntervalSpec {
	std::size_t representation = 0;
	std::size_t channel = 0;
	std::size_t start = 0;
	std::size_t length = 0;

	bool operator==(const IntervalSpec &other) const {
		return representation == other.representation && channel == other.channel && start == other.start &&
		       length == other.length;
	}

	bool operator!=(const IntervalSpec &other) const {
		return !(*this == other);
	}
};

/// Rules resolving an interval count from the series length.
enum class IntervalCountRule {
	Sqrt,    ///< round(sqrt(n_timepoints))
	SqrtDiv, ///< round(sqrt(n_timepoints) / n_representations)
};

/**
 * @class IntervalCount
 * @brief Interval count of one representation: a sum of literal counts and rules.
 */
class IntervalCount {
public:
	using Term = std::variant<std::size_t, IntervalCountRule>;

	IntervalCount() : terms_ {IntervalCountRule::Sqrt} {
	}

	IntervalCount(std::size_t count) : terms_ {count} {
	}

	/// @throws core::ConfigurationError If @p count is negative.
	IntervalCount(int count);

	IntervalCount(IntervalCountRule rule) : terms_ {rule} {
	}

	explicit IntervalCount(std::vector<Term> terms) : terms_(std::move(terms)) {
	}

	static IntervalCount Sqrt() {
		return IntervalCount(IntervalCountRule::Sqrt);
	}

	static IntervalCount SqrtDiv() {
		return IntervalCount(IntervalCountRule::SqrtDiv);
	}

	const std::vector<Term> &terms() const {
		return terms_;
	}

	/// Sum of all terms; at least 1.
	std::size_t resolve(std::size_t n_timepoints, std::size_t n_representations) const;

	std::string toString() const;

private:
	std::vector<Term> terms_;
};

/**
 * @class LengthBound
 * @brief A minimum or maximum interval length.
 *
 * Either an absolute number of timepoints, a proportion of the series length, or
 * unbounded (resolves to the full series length).
 */
class LengthBound {
public:
	LengthBound() = default;

	LengthBound(std::size_t absolute) : value_(absolute) {
	}

	/// @throws core::ConfigurationError If @p absolute is negative.
	LengthBound(int absolute);

	/// Proportions are explicit: use LengthBound::Proportion.
	LengthBound(double) = delete;

	static LengthBound Absolute(std::size_t length) {
		return LengthBound(length);
	}

	static LengthBound Proportion(double proportion);

	static LengthBound Unbounded() {
		return LengthBound();
	}

	bool isUnbounded() const {
		return std::holds_alternative<std::monostate>(value_);
	}

	bool isProportion() const {
		return std::holds_alternative<double>(value_);
	}

	/// Resolves against a series length, before clipping; proportions round to at least 1.
	std::size_t resolve(std::size_t n_timepoints) const;

	std::string toString() const;

private:
	std::variant<std::monostate, std::size_t, double> value_;
};

/**
 * @struct ResolvedGeometry
 * @brief Sampling bounds of one representation, resolved once per fit.
 */
struct ResolvedGeometry {
	std::size_t n_timepoints = 0;
	std::size_t n_channels = 0;
	std::size_t n_intervals = 0;
	std::size_t min_length = 0;
	std::size_t max_length = 0;
};

/**
 * @brief Resolves the count and length bounds of one representation.
 *
 * Lengths are clipped to [1, n_timepoints]. A minimum longer than the series
 * degenerates to full-series intervals.
 *
 * @throws core::ConfigurationError If the resolved minimum exceeds the resolved
 *         maximum, or the series is empty.
 */
ResolvedGeometry ResolveGeometry(std::size_t n_timepoints, std::size_t n_channels, const IntervalCount &count,
                                 const LengthBound &min_length, const LengthBound &max_length,
                                 std::size_t n_representations = 1);

/**
 * @class IntervalSampler
 * @brief Draws random interval specs within a resolved geometry.
 *
 * For each interval the channel is drawn uniformly, then the length uniformly
 * in [min_length, max_length], then the start uniformly among the positions the
 * length allows. All randomness comes from the generator handed in.
 */
class IntervalSampler {
public:
	explicit IntervalSampler(ResolvedGeometry geometry, std::size_t representation = 0);

	const ResolvedGeometry &geometry() const {
		return geometry_;
	}

	std::vector<IntervalSpec> sample(std::mt19937 &rng) const;

private:
	ResolvedGeometry geometry_;
	std::size_t representation_;
};

/// Resolves the bounds and samples a single representation in one call.
std::vector<IntervalSpec> SampleIntervals(std::size_t n_timepoints, std::size_t n_channels,
                                          const IntervalCount &count, const LengthBound &min_length,
                                          const LengthBound &max_length, std::mt19937 &rng);

} // namespace tsregress::interval
