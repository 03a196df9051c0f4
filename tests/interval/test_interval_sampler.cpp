#include <catch2/catch.hpp>

#include "tsregress/core/errors.hpp"
#include "tsregress/interval/interval_sampler.hpp"

#include <random>

using namespace tsregress::interval;
using tsregress::core::ConfigurationError;

TEST_CASE("Interval counts resolve from the series length", "[interval]") {
	REQUIRE(IntervalCount::Sqrt().resolve(100, 1) == 10);
	REQUIRE(IntervalCount::Sqrt().resolve(12, 1) == 3);
	REQUIRE(IntervalCount::SqrtDiv().resolve(100, 2) == 5);
	REQUIRE(IntervalCount(4).resolve(100, 1) == 4);

	IntervalCount summed({std::size_t {2}, IntervalCountRule::Sqrt});
	REQUIRE(summed.resolve(16, 1) == 6);

	// Never fewer than one interval.
	REQUIRE(IntervalCount(0).resolve(100, 1) == 1);
	REQUIRE(IntervalCount::SqrtDiv().resolve(1, 5) == 1);
	REQUIRE_THROWS_AS(IntervalCount(-1), ConfigurationError);
}

TEST_CASE("Length bounds resolve absolute and proportional lengths", "[interval]") {
	REQUIRE(LengthBound(5).resolve(100) == 5);
	REQUIRE(LengthBound::Proportion(0.5).resolve(12) == 6);
	REQUIRE(LengthBound::Proportion(0.01).resolve(12) == 1);
	REQUIRE(LengthBound::Unbounded().resolve(42) == 42);
	REQUIRE_THROWS_AS(LengthBound::Proportion(0.0), ConfigurationError);
	REQUIRE_THROWS_AS(LengthBound(-3), ConfigurationError);
}

TEST_CASE("ResolveGeometry clips bounds to the series", "[interval]") {
	auto geometry = ResolveGeometry(12, 2, IntervalCount(3), LengthBound(3), LengthBound::Unbounded());
	REQUIRE(geometry.n_intervals == 3);
	REQUIRE(geometry.min_length == 3);
	REQUIRE(geometry.max_length == 12);
	REQUIRE(geometry.n_channels == 2);

	auto zero_min = ResolveGeometry(12, 1, IntervalCount(1), LengthBound(0), LengthBound(4));
	REQUIRE(zero_min.min_length == 1);
	REQUIRE(zero_min.max_length == 4);
}

TEST_CASE("A minimum longer than the series yields full-series intervals", "[interval]") {
	auto geometry = ResolveGeometry(8, 1, IntervalCount(4), LengthBound(20), LengthBound::Unbounded());
	REQUIRE(geometry.min_length == 8);
	REQUIRE(geometry.max_length == 8);

	std::mt19937 rng(3);
	for (const auto &spec : IntervalSampler(geometry).sample(rng)) {
		REQUIRE(spec.start == 0);
		REQUIRE(spec.length == 8);
	}
}

TEST_CASE("A minimum above the maximum is a configuration error", "[interval]") {
	REQUIRE_THROWS_AS(ResolveGeometry(100, 1, IntervalCount(2), LengthBound(10), LengthBound(5)),
	                  ConfigurationError);
	REQUIRE_THROWS_AS(ResolveGeometry(100, 1, IntervalCount(2), LengthBound::Proportion(0.5),
	                                  LengthBound::Proportion(0.2)),
	                  ConfigurationError);
	REQUIRE_THROWS_AS(ResolveGeometry(0, 1, IntervalCount(2), LengthBound(1), LengthBound(2)), ConfigurationError);
}

TEST_CASE("Sampled intervals always respect the resolved bounds", "[interval]") {
	for (std::size_t n_timepoints : {3, 12, 50, 101}) {
		for (std::size_t min_length : {1, 3, 7}) {
			for (std::size_t max_length : {7, 20, 200}) {
				if (min_length > max_length) {
					continue;
				}
				auto geometry = ResolveGeometry(n_timepoints, 3, IntervalCount(25), LengthBound(min_length),
				                                LengthBound(max_length));
				std::mt19937 rng(static_cast<unsigned>(n_timepoints * 31 + min_length * 7 + max_length));
				auto intervals = IntervalSampler(geometry, 1).sample(rng);

				REQUIRE(intervals.size() == 25);
				for (const auto &spec : intervals) {
					REQUIRE(spec.representation == 1);
					REQUIRE(spec.channel < 3);
					REQUIRE(spec.start + spec.length <= n_timepoints);
					REQUIRE(spec.length >= geometry.min_length);
					REQUIRE(spec.length <= geometry.max_length);
					if (min_length <= n_timepoints) {
						REQUIRE(spec.length >= min_length);
					}
				}
			}
		}
	}
}

TEST_CASE("Sampling is reproducible for a fixed seed", "[interval]") {
	std::mt19937 first(42);
	std::mt19937 second(42);
	auto a = SampleIntervals(60, 2, IntervalCount::Sqrt(), LengthBound(3), LengthBound::Unbounded(), first);
	auto b = SampleIntervals(60, 2, IntervalCount::Sqrt(), LengthBound(3), LengthBound::Unbounded(), second);

	REQUIRE(a.size() == 8);
	REQUIRE(a == b);
}
