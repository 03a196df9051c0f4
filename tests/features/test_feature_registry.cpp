#include <catch2/catch.hpp>

#include "tsregress/core/errors.hpp"
#include "tsregress/features/feature_calculators.hpp"
#include "tsregress/features/feature_math.hpp"
#include "tsregress/features/feature_types.hpp"

#include <cmath>

using namespace tsregress::features;
using tsregress::core::ConfigurationError;

TEST_CASE("Canonical registry holds catch22 followed by summary statistics", "[features]") {
	auto canonical = FeatureRegistry::Canonical();
	REQUIRE(canonical->Size() == 25);
	REQUIRE(canonical->At(0).name == "DN_HistogramMode_5");
	REQUIRE(canonical->At(21).name == "PD_PeriodicityWang_th0_01");
	REQUIRE(canonical->At(22).name == "mean");
	REQUIRE(canonical->At(24).name == "slope");
	REQUIRE(canonical->IndexOf("std") == std::optional<std::size_t>(23));

	auto catch22 = FeatureRegistry::Catch22();
	REQUIRE(catch22->Size() == 22);
	REQUIRE_FALSE(catch22->Find("mean"));
}

TEST_CASE("Registering a custom attribute", "[features]") {
	FeatureRegistry registry;
	registry.Register("first", [](const Series &series, FeatureCache &) { return series.front(); });

	REQUIRE(registry.Size() == 1);
	REQUIRE(registry.ComputeAll({4.0, 5.0}) == std::vector<double> {4.0});
	REQUIRE_THROWS_AS(registry.Register("first", [](const Series &, FeatureCache &) { return 0.0; }),
	                  ConfigurationError);
	REQUIRE_THROWS_AS(registry.Register("", [](const Series &, FeatureCache &) { return 0.0; }),
	                  ConfigurationError);
	REQUIRE_THROWS_AS(registry.Register("empty", FeatureCalculatorFn {}), ConfigurationError);
	REQUIRE_THROWS_AS(registry.At(1), std::out_of_range);
}

TEST_CASE("Summary attributes", "[features]") {
	FeatureRegistry registry;
	RegisterSummaryFeatures(registry);

	const auto values = registry.ComputeAll({1.0, 2.0, 3.0, 4.0});
	REQUIRE(values[0] == Approx(2.5));
	REQUIRE(values[1] == Approx(std::sqrt(1.25)));
	REQUIRE(values[2] == Approx(1.0));

	REQUIRE(registry.ComputeAll({1.0, 3.0, 5.0, 7.0})[2] == Approx(2.0));
	REQUIRE(registry.ComputeAll({3.0})[2] == Approx(0.0));
}
