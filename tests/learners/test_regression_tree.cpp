#include <catch2/catch.hpp>

#include "tsregress/learners/regression_tree.hpp"

#include <stdexcept>

using namespace tsregress::learners;
using tsregress::core::FeatureTable;

namespace {

FeatureTable Column(const std::vector<double> &values) {
	FeatureTable table(values.size(), 1);
	for (std::size_t i = 0; i < values.size(); ++i) {
		table(i, 0) = values[i];
	}
	return table;
}

} // namespace

TEST_CASE("RegressionTree learns a step function exactly", "[learners][tree]") {
	auto tree = RegressionTreeBuilder().build();
	const auto x = Column({1, 2, 3, 4, 6, 7, 8, 9});
	const std::vector<double> y {0, 0, 0, 0, 10, 10, 10, 10};
	tree->fit(x, y);

	REQUIRE(tree->leafCount() == 2);
	REQUIRE(tree->nodes()[0].threshold == Approx(5.0));
	const auto predictions = tree->predict(Column({0.0, 4.5, 5.0, 5.5, 100.0}));
	REQUIRE(predictions == std::vector<double> {0, 0, 0, 10, 10});
}

TEST_CASE("RegressionTree without a usable split is a single leaf", "[learners][tree]") {
	auto tree = RegressionTreeBuilder().build();
	tree->fit(Column({1, 1, 1}), {1.0, 2.0, 6.0});
	REQUIRE(tree->leafCount() == 1);
	REQUIRE(tree->predict(Column({5}))[0] == Approx(3.0));

	auto no_features = RegressionTreeBuilder().build();
	no_features->fit(FeatureTable(3, 0), {1.0, 2.0, 6.0});
	REQUIRE(no_features->predict(FeatureTable(2, 0)) == std::vector<double> {3.0, 3.0});
}

TEST_CASE("Absolute error leaves predict the median", "[learners][tree]") {
	auto tree = RegressionTreeBuilder().withCriterion(SplitCriterion::AbsoluteError).build();
	tree->fit(FeatureTable(3, 0), {1.0, 2.0, 100.0});
	REQUIRE(tree->predict(FeatureTable(1, 0))[0] == Approx(2.0));

	auto split = RegressionTreeBuilder().withCriterion(SplitCriterion::AbsoluteError).build();
	split->fit(Column({1, 2, 3, 10, 11, 12}), {1.0, 1.0, 50.0, 20.0, 20.0, 21.0});
	REQUIRE(split->predict(Column({0.0}))[0] == Approx(1.0));
	REQUIRE(split->predict(Column({11.5}))[0] == Approx(20.0));
}

TEST_CASE("RegressionTree honours its growth limits", "[learners][tree]") {
	const auto x = Column({1, 2, 3, 4, 5, 6, 7, 8});
	const std::vector<double> y {1, 2, 3, 4, 5, 6, 7, 8};

	auto stump = RegressionTreeBuilder().withMaxDepth(1).build();
	stump->fit(x, y);
	REQUIRE(stump->depth() == 1);
	REQUIRE(stump->leafCount() == 2);

	auto coarse = RegressionTreeBuilder().withMinSamplesLeaf(3).build();
	coarse->fit(x, y);
	for (const auto &node : coarse->nodes()) {
		REQUIRE(node.n_samples >= 3);
	}

	REQUIRE_THROWS_AS(RegressionTreeBuilder().withMinSamplesSplit(1), std::invalid_argument);
	REQUIRE_THROWS_AS(RegressionTreeBuilder().withMinSamplesLeaf(0), std::invalid_argument);
}

TEST_CASE("RegressionTree validates its inputs", "[learners][tree]") {
	auto tree = RegressionTreeBuilder().build();
	REQUIRE_FALSE(tree->isFitted());
	REQUIRE_THROWS_AS(tree->predict(Column({1.0})), std::runtime_error);
	REQUIRE_THROWS_AS(tree->fit(Column({1.0, 2.0}), {1.0}), std::invalid_argument);

	tree->fit(Column({1.0, 2.0}), {1.0, 2.0});
	REQUIRE_THROWS_AS(tree->predict(FeatureTable(1, 2)), std::invalid_argument);
}

TEST_CASE("Clones are unfitted and grow identical trees", "[learners][tree]") {
	FeatureTable x(6, 3);
	const std::vector<double> y {1, 5, 2, 8, 3, 9};
	for (std::size_t r = 0; r < 6; ++r) {
		x(r, 0) = static_cast<double>(r % 2);
		x(r, 1) = static_cast<double>(r % 2);
		x(r, 2) = static_cast<double>(r);
	}
	auto prototype = RegressionTreeBuilder().withSeed(11).build();
	auto first = prototype->clone();
	auto second = prototype->clone();
	REQUIRE_FALSE(first->isFitted());

	first->fit(x, y);
	second->fit(x, y);
	REQUIRE(first->predict(x) == second->predict(x));
	REQUIRE(first->getName() == "RegressionTree");
}
