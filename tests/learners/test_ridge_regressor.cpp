#include <catch2/catch.hpp>

#include "tsregress/learners/ridge_regressor.hpp"

#include <stdexcept>

using namespace tsregress::learners;
using tsregress::core::FeatureTable;

TEST_CASE("Ordinary least squares recovers a linear relation", "[learners][ridge]") {
	FeatureTable x(5, 2);
	std::vector<double> y(5);
	for (std::size_t r = 0; r < 5; ++r) {
		x(r, 0) = static_cast<double>(r);
		x(r, 1) = static_cast<double>(r * r);
		y[r] = 2.0 * x(r, 0) - 0.5 * x(r, 1) + 1.0;
	}

	RidgeRegressor ols(0.0);
	ols.fit(x, y);
	REQUIRE(ols.coefficients()(0) == Approx(2.0));
	REQUIRE(ols.coefficients()(1) == Approx(-0.5));
	REQUIRE(ols.intercept() == Approx(1.0));
	REQUIRE(ols.predict(x)[4] == Approx(y[4]));
}

TEST_CASE("Rank-deficient tables fail without a penalty", "[learners][ridge]") {
	FeatureTable duplicated(4, 2);
	FeatureTable constant(4, 1);
	const std::vector<double> y {1.0, 2.0, 3.0, 5.0};
	for (std::size_t r = 0; r < 4; ++r) {
		duplicated(r, 0) = static_cast<double>(r);
		duplicated(r, 1) = static_cast<double>(r);
		constant(r, 0) = 3.0;
	}

	REQUIRE_THROWS_AS(RidgeRegressor(0.0).fit(duplicated, y), std::runtime_error);
	REQUIRE_THROWS_AS(RidgeRegressor(0.0).fit(constant, y), std::runtime_error);

	RidgeRegressor ridge(1.0);
	ridge.fit(duplicated, y);
	REQUIRE(ridge.coefficients()(0) == Approx(ridge.coefficients()(1)));

	RidgeRegressor constant_ridge(1.0);
	constant_ridge.fit(constant, y);
	REQUIRE(constant_ridge.predict(constant)[0] == Approx(2.75));
}

TEST_CASE("RidgeRegressor validates its inputs", "[learners][ridge]") {
	REQUIRE_THROWS_AS(RidgeRegressor(-1.0), std::invalid_argument);

	RidgeRegressor ridge;
	REQUIRE_THROWS_AS(ridge.predict(FeatureTable(1, 1)), std::runtime_error);
	REQUIRE_THROWS_AS(ridge.fit(FeatureTable(2, 1), {1.0}), std::invalid_argument);

	auto clone = ridge.clone();
	REQUIRE(clone->getName() == "RidgeRegressor");
	REQUIRE_FALSE(clone->isFitted());
}
