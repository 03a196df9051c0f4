#include <catch2/catch.hpp>

#include "tsregress/core/errors.hpp"
#include "tsregress/features/feature_types.hpp"
#include "tsregress/interval/attribute_subsampler.hpp"

#include <algorithm>
#include <random>
#include <set>

using namespace tsregress::interval;
using tsregress::core::ConfigurationError;
using tsregress::features::FeatureRegistry;

TEST_CASE("All attributes are selected in registration order", "[interval][attributes]") {
	AttributeSubsampler subsampler(*FeatureRegistry::Canonical(), AttributeSubsample::All());
	std::mt19937 rng(1);
	auto selection = subsampler.subsample(rng);

	REQUIRE(selection.size() == 25);
	REQUIRE(std::is_sorted(selection.begin(), selection.end()));
	REQUIRE(selection.front() == 0);
}

TEST_CASE("A count draws distinct attributes", "[interval][attributes]") {
	AttributeSubsampler subsampler(*FeatureRegistry::Canonical(), AttributeSubsample(8));
	std::mt19937 rng(5);
	for (int draw = 0; draw < 20; ++draw) {
		auto selection = subsampler.subsample(rng);
		REQUIRE(selection.size() == 8);
		std::set<std::size_t> unique(selection.begin(), selection.end());
		REQUIRE(unique.size() == 8);
		REQUIRE(*unique.rbegin() < 25);
	}
}

TEST_CASE("A proportion rounds to at least one attribute", "[interval][attributes]") {
	REQUIRE(AttributeSubsample::Proportion(0.2).resolve(25) == 5);
	REQUIRE(AttributeSubsample::Proportion(0.01).resolve(25) == 1);
	REQUIRE(AttributeSubsample::All().resolve(25) == 25);
}

TEST_CASE("Impossible subsample sizes are configuration errors", "[interval][attributes]") {
	REQUIRE_THROWS_AS(AttributeSubsampler(*FeatureRegistry::Canonical(), AttributeSubsample(30)), ConfigurationError);
	REQUIRE_THROWS_AS(AttributeSubsample(0), ConfigurationError);
	REQUIRE_THROWS_AS(AttributeSubsample::Proportion(1.5), ConfigurationError);
	REQUIRE_THROWS_AS(AttributeSubsampler(FeatureRegistry(), AttributeSubsample::All()), ConfigurationError);
}

TEST_CASE("Subsampling is reproducible for a fixed seed", "[interval][attributes]") {
	AttributeSubsampler subsampler(*FeatureRegistry::Canonical(), AttributeSubsample(4));
	std::mt19937 first(9);
	std::mt19937 second(9);
	REQUIRE(subsampler.subsample(first) == subsampler.subsample(second));
}
