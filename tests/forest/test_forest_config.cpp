#include <catch2/catch.hpp>

#include "tsregress/core/errors.hpp"
#include "tsregress/features/feature_types.hpp"
#include "tsregress/forest/forest_config.hpp"

#include <chrono>
#include <limits>
#include <memory>
#include <string>

using namespace tsregress::forest;
using namespace tsregress::interval;
using tsregress::core::ConfigurationError;

TEST_CASE("Default configuration is valid", "[forest][config]") {
	ForestConfig config;
	REQUIRE_NOTHROW(config.validate());
	REQUIRE(config.n_estimators == 200);
	REQUIRE(config.nRepresentations() == 1);
	REQUIRE(config.attributeRegistry() == tsregress::features::FeatureRegistry::Canonical());
	REQUIRE(config.baseLearner());
	REQUIRE(config.baseLearner()->getName() == "RegressionTree");
}

TEST_CASE("validate rejects structural errors", "[forest][config][error]") {
	ForestConfig config;

	SECTION("zero estimators") {
		config.n_estimators = 0;
		REQUIRE_THROWS_AS(config.validate(), ConfigurationError);
	}
	SECTION("bad n_jobs") {
		config.n_jobs = 0;
		REQUIRE_THROWS_AS(config.validate(), ConfigurationError);
		config.n_jobs = -2;
		REQUIRE_THROWS_AS(config.validate(), ConfigurationError);
	}
	SECTION("non-finite replace_nan") {
		config.replace_nan = std::numeric_limits<double>::quiet_NaN();
		REQUIRE_THROWS_AS(config.validate(), ConfigurationError);
	}
	SECTION("negative time limit") {
		config.time_limit = std::chrono::milliseconds(-1);
		REQUIRE_THROWS_AS(config.validate(), ConfigurationError);
	}
	SECTION("per-representation list of the wrong size") {
		config.series_transformers = {std::make_shared<tsregress::transform::Identity>(),
		                              std::make_shared<tsregress::transform::FirstDifference>()};
		config.n_intervals = {IntervalCount(1), IntervalCount(2), IntervalCount(3)};
		REQUIRE_THROWS_AS(config.validate(), ConfigurationError);
		config.n_intervals = {IntervalCount(1), IntervalCount(2)};
		REQUIRE_NOTHROW(config.validate());
		REQUIRE(config.intervalsFor(1).resolve(100) == 2);
	}
	SECTION("min above max in the same unit") {
		config.min_interval_length = {LengthBound::Absolute(10)};
		config.max_interval_length = {LengthBound::Absolute(5)};
		REQUIRE_THROWS_AS(config.validate(), ConfigurationError);
	}
	SECTION("attribute subsample larger than the battery") {
		config.att_subsample_size = {AttributeSubsample::Count(1000)};
		REQUIRE_THROWS_AS(config.validate(), ConfigurationError);
	}
	SECTION("null transformer") {
		config.series_transformers = {nullptr};
		REQUIRE_THROWS_AS(config.validate(), ConfigurationError);
	}
}

TEST_CASE("configFromOptions maps named options", "[forest][config][options]") {
	const OptionMap options {
	    {"n_estimators", std::int64_t {25}},
	    {"n_intervals", std::vector<OptionScalar> {std::string("sqrt"), std::int64_t {2}}},
	    {"min_interval_length", 0.1},
	    {"max_interval_length", std::string("inf")},
	    {"att_subsample_size", std::int64_t {8}},
	    {"time_limit", 1.5},
	    {"random_seed", std::int64_t {42}},
	    {"n_jobs", std::int64_t {-1}},
	    {"replace_nan", std::int64_t {-1}},
	};
	const auto config = configFromOptions(options);

	REQUIRE(config.n_estimators == 25);
	REQUIRE(config.n_intervals.size() == 1);
	REQUIRE(config.intervalsFor(0).resolve(100) == 12);
	REQUIRE(config.minLengthFor(0).isProportion());
	REQUIRE(config.minLengthFor(0).resolve(100) == 10);
	REQUIRE(config.maxLengthFor(0).isUnbounded());
	REQUIRE(config.attSubsampleFor(0).resolve(25) == 8);
	REQUIRE(config.time_limit.has_value());
	REQUIRE(*config.time_limit == std::chrono::milliseconds(1500));
	REQUIRE(config.random_seed == std::uint32_t {42});
	REQUIRE(config.n_jobs == -1);
	REQUIRE(config.replace_nan == -1.0);
}

TEST_CASE("configFromOptions keeps the base for absent options", "[forest][config][options]") {
	ForestConfig base;
	base.n_estimators = 7;
	base.random_seed = 3;
	const auto config = configFromOptions({{"att_subsample_size", std::monostate {}}, {"random_seed", std::monostate {}}},
	                                      base);
	REQUIRE(config.n_estimators == 7);
	REQUIRE(config.attSubsampleFor(0).isAll());
	REQUIRE_FALSE(config.random_seed.has_value());
}

TEST_CASE("configFromOptions rejects bad options", "[forest][config][options][error]") {
	REQUIRE_THROWS_AS(configFromOptions({{"n_trees", std::int64_t {5}}}), ConfigurationError);
	REQUIRE_THROWS_AS(configFromOptions({{"n_estimators", 2.5}}), ConfigurationError);
	REQUIRE_THROWS_AS(configFromOptions({{"n_estimators", std::int64_t {0}}}), ConfigurationError);
	REQUIRE_THROWS_AS(configFromOptions({{"n_intervals", std::string("log")}}), ConfigurationError);
	REQUIRE_THROWS_AS(configFromOptions({{"time_limit", std::string("soon")}}), ConfigurationError);
	REQUIRE_THROWS_AS(configFromOptions({{"random_seed", std::int64_t {-4}}}), ConfigurationError);
	REQUIRE_THROWS_AS(configFromOptions({{"min_interval_length", std::monostate {}}}), ConfigurationError);
	REQUIRE_THROWS_AS(configFromOptions({{"att_subsample_size", 1.5}}), ConfigurationError);
}

TEST_CASE("configFromOptions reads one interval count per representation", "[forest][config][options]") {
	ForestConfig base;
	base.series_transformers = {std::make_shared<tsregress::transform::Identity>(),
	                            std::make_shared<tsregress::transform::FirstDifference>()};

	const auto config = configFromOptions(
	    {{"n_intervals", std::vector<OptionList> {{std::string("sqrt"), std::int64_t {1}}, {std::int64_t {4}}}}}, base);
	REQUIRE(config.n_intervals.size() == 2);
	REQUIRE(config.intervalsFor(0).resolve(100, 2) == 11);
	REQUIRE(config.intervalsFor(1).resolve(100, 2) == 4);

	// A flat list is still one summed count shared by both representations.
	const auto shared = configFromOptions({{"n_intervals", OptionList {std::int64_t {2}, std::int64_t {3}}}}, base);
	REQUIRE(shared.n_intervals.size() == 1);
	REQUIRE(shared.intervalsFor(1).resolve(100, 2) == 5);

	REQUIRE_THROWS_AS(configFromOptions({{"n_intervals", std::vector<OptionList> {{std::int64_t {1}},
	                                                                              {std::int64_t {2}},
	                                                                              {std::int64_t {3}}}}},
	                                    base),
	                  ConfigurationError);
	REQUIRE_THROWS_AS(configFromOptions({{"n_intervals", std::vector<OptionList> {}}}, base), ConfigurationError);
	REQUIRE_THROWS_AS(configFromOptions({{"att_subsample_size", std::vector<OptionList> {{std::int64_t {2}}}}}, base),
	                  ConfigurationError);
}
