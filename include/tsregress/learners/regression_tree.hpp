#pragma once

#include "tsregress/learners/iregressor.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>

namespace tsregress::learners {

enum class SplitCriterion {
	SquaredError,  ///< Leaves predict the mean; splits minimise the summed squared error.
	AbsoluteError, ///< Leaves predict the median; splits minimise the summed absolute deviation.
};

class RegressionTreeBuilder; // Forward declaration

/**
 * @class RegressionTree
 * @brief A CART regression tree grown greedily to purity or to its limits.
 *
 * Features are evaluated in a per-node random order drawn from the tree seed;
 * among equally good splits the first one in that order wins. Thresholds lie
 * halfway between adjacent distinct feature values, and rows with a value at
 * or below the threshold go left.
 */
class RegressionTree final : public IRegressor {
public:
	friend class RegressionTreeBuilder;

	struct Node {
		int feature = -1; ///< -1 marks a leaf
		double threshold = 0.0;
		int left = -1;
		int right = -1;
		double value = 0.0;
		std::size_t n_samples = 0;
	};

	void fit(const core::FeatureTable &features, const std::vector<double> &targets) override;
	std::vector<double> predict(const core::FeatureTable &features) const override;
	std::unique_ptr<IRegressor> clone() const override;

	void setSeed(std::uint32_t seed) override {
		seed_ = seed;
	}

	bool isFitted() const override {
		return !nodes_.empty();
	}

	std::string getName() const override {
		return "RegressionTree";
	}

	const std::vector<Node> &nodes() const {
		return nodes_;
	}

	std::size_t depth() const;

	std::size_t leafCount() const;

	SplitCriterion criterion() const {
		return criterion_;
	}

private:
	RegressionTree(SplitCriterion criterion, std::optional<std::size_t> max_depth, std::size_t min_samples_split,
	               std::size_t min_samples_leaf, std::uint32_t seed);

	SplitCriterion criterion_;
	std::optional<std::size_t> max_depth_;
	std::size_t min_samples_split_;
	std::size_t min_samples_leaf_;
	std::uint32_t seed_;
	std::vector<Node> nodes_;
	std::size_t n_features_ = 0;
};

/**
 * @class RegressionTreeBuilder
 * @brief A builder for fluently configuring RegressionTree learners.
 */
class RegressionTreeBuilder {
public:
	RegressionTreeBuilder &withCriterion(SplitCriterion criterion);

	/// Unlimited when not set.
	RegressionTreeBuilder &withMaxDepth(std::size_t max_depth);

	/// @throws std::invalid_argument If @p min_samples is below 2.
	RegressionTreeBuilder &withMinSamplesSplit(std::size_t min_samples);

	/// @throws std::invalid_argument If @p min_samples is 0.
	RegressionTreeBuilder &withMinSamplesLeaf(std::size_t min_samples);

	RegressionTreeBuilder &withSeed(std::uint32_t seed);

	std::unique_ptr<RegressionTree> build();

private:
	SplitCriterion criterion_ = SplitCriterion::SquaredError;
	std::optional<std::size_t> max_depth_;
	std::size_t min_samples_split_ = 2;
	std::size_t min_samples_leaf_ = 1;
	std::uint32_t seed_ = 0;
};

} // namespace tsregress::learners
