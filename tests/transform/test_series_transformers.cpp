#include <catch2/catch.hpp>

#include "tsregress/core/errors.hpp"
#include "tsregress/transform/series_transformer.hpp"

#include <vector>

using namespace tsregress::transform;
using tsregress::core::SeriesBatch;

TEST_CASE("Identity keeps the batch unchanged", "[transform]") {
	auto batch = SeriesBatch::fromUnivariate({{1.0, 2.0, 3.0}});
	Identity identity;
	auto view = identity.transformBatch(batch);

	REQUIRE(view.channel(0, 0) == batch.channel(0, 0));
	REQUIRE(identity.outputLength(7) == 7);
}

TEST_CASE("FirstDifference shortens every channel by one", "[transform]") {
	FirstDifference difference;
	REQUIRE(difference.transform({1.0, 4.0, 9.0}) == std::vector<double> {3.0, 5.0});
	REQUIRE(difference.outputLength(3) == 2);
	REQUIRE(difference.outputLength(1) == 0);

	auto batch = SeriesBatch::fromUnivariate({{1.0, 2.0, 4.0}, {0.0, 0.0, 1.0, 1.0}});
	auto view = difference.transformBatch(batch);
	REQUIRE(view.nTimepoints(0) == 2);
	REQUIRE(view.nTimepoints(1) == 3);
}

TEST_CASE("FirstDifference rejects single-sample cases", "[transform]") {
	auto batch = SeriesBatch::fromUnivariate({{1.0}});
	REQUIRE_THROWS_AS(FirstDifference().transformBatch(batch), tsregress::core::ShapeMismatchError);
}

TEST_CASE("Periodogram keeps the lower half of the padded spectrum", "[transform]") {
	Periodogram periodogram;

	auto impulse = periodogram.transform({1.0, 0.0, 0.0, 0.0});
	REQUIRE(impulse.size() == 2);
	REQUIRE(impulse[0] == Approx(1.0));
	REQUIRE(impulse[1] == Approx(1.0));

	auto constant = periodogram.transform({1.0, 1.0, 1.0, 1.0});
	REQUIRE(constant[0] == Approx(4.0));
	REQUIRE(constant[1] == Approx(0.0).margin(1e-12));

	REQUIRE(periodogram.outputLength(5) == 4);
	REQUIRE(periodogram.transform({1.0, 2.0, 3.0, 4.0, 5.0}).size() == 4);
}
