#include <catch2/catch.hpp>

#include "tsregress/core/errors.hpp"
#include "tsregress/features/feature_types.hpp"
#include "tsregress/interval/interval_feature_extractor.hpp"

#include <limits>
#include <memory>

using namespace tsregress::interval;
using tsregress::core::SeriesBatch;
using tsregress::features::FeatureCache;
using tsregress::features::FeatureRegistry;
using tsregress::features::Series;

namespace {

std::shared_ptr<const FeatureRegistry> ProbeRegistry() {
	auto registry = std::make_shared<FeatureRegistry>();
	registry->Register("first", [](const Series &slice, FeatureCache &) { return slice.front(); });
	registry->Register("length", [](const Series &slice, FeatureCache &) { return static_cast<double>(slice.size()); });
	registry->Register("nan", [](const Series &, FeatureCache &) { return std::numeric_limits<double>::quiet_NaN(); });
	registry->Register("inf", [](const Series &, FeatureCache &) { return std::numeric_limits<double>::infinity(); });
	return registry;
}

SeriesBatch Ramps() {
	return SeriesBatch::fromUnivariate({{0, 1, 2, 3, 4, 5, 6, 7, 8, 9}, {10, 11, 12, 13, 14, 15, 16, 17, 18, 19}});
}

} // namespace

TEST_CASE("Columns are ordered intervals outer, attributes inner", "[interval][extractor]") {
	IntervalFeatureExtractor extractor(ProbeRegistry());
	std::vector<IntervalSpec> intervals {{0, 0, 2, 3}, {0, 0, 6, 4}};
	AttributeSelection attributes {1, 0};

	auto table = extractor.extract(Ramps(), intervals, attributes);
	REQUIRE(table.rows() == 2);
	REQUIRE(table.cols() == 4);
	REQUIRE(table(0, 0) == 3.0);
	REQUIRE(table(0, 1) == 2.0);
	REQUIRE(table(0, 2) == 4.0);
	REQUIRE(table(0, 3) == 6.0);
	REQUIRE(table(1, 3) == 16.0);
}

TEST_CASE("Non-finite attribute values are replaced", "[interval][extractor]") {
	IntervalFeatureExtractor extractor(ProbeRegistry(), -1.5);
	auto table = extractor.extract(Ramps(), {{0, 0, 0, 10}}, {2, 3, 0});

	REQUIRE(table(0, 0) == -1.5);
	REQUIRE(table(0, 1) == -1.5);
	REQUIRE(table(0, 2) == 0.0);
	REQUIRE(table(1, 1) == -1.5);
}

TEST_CASE("Blocks of several representations are concatenated", "[interval][extractor]") {
	IntervalFeatureExtractor extractor(ProbeRegistry());
	std::vector<SeriesBatch> views {Ramps(), SeriesBatch::fromUnivariate({{5, 5, 5}, {7, 7, 7}})};
	std::vector<IntervalBlock> blocks {
	    {0, {{0, 0, 1, 2}}, {0}},
	    {1, {{1, 0, 0, 3}, {1, 0, 1, 1}}, {0, 1}},
	};

	auto table = extractor.extract(views, blocks);
	REQUIRE(table.cols() == 5);
	REQUIRE(table(1, 0) == 11.0);
	REQUIRE(table(1, 1) == 7.0);
	REQUIRE(table(1, 2) == 3.0);
	REQUIRE(table(1, 4) == 1.0);
}

TEST_CASE("Intervals outside a case are shape mismatches", "[interval][extractor]") {
	IntervalFeatureExtractor extractor(ProbeRegistry());
	REQUIRE_THROWS_AS(extractor.extract(Ramps(), {{0, 0, 8, 3}}, {0}), tsregress::core::ShapeMismatchError);
	REQUIRE_THROWS_AS(extractor.extract(Ramps(), {{0, 1, 0, 3}}, {0}), tsregress::core::ShapeMismatchError);
	REQUIRE_THROWS_AS(extractor.extract(Ramps(), {{0, 0, 0, 3}}, {9}), std::out_of_range);
}
