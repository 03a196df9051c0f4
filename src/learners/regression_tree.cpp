#include "tsregress/learners/regression_tree.hpp"
#include "tsregress/utils/logging.hpp"
#include <algorithm>
#include <cmath>
#include <functional>
#include <limits>
#include <numeric>
#include <queue>
#include <random>
#include <stdexcept>

namespace tsregress::learners {

namespace {

constexpr double kImpurityTolerance = 1e-12;

// Sum of absolute deviations from the median of a growing sample.
class RunningAbsoluteDeviation {
public:
	void push(double value) {
		if (lower_.empty() || value <= lower_.top()) {
			lower_.push(value);
			lower_sum_ += value;
		} else {
			upper_.push(value);
			upper_sum_ += value;
		}
		if (lower_.size() > upper_.size() + 1) {
			const double moved = lower_.top();
			lower_.pop();
			lower_sum_ -= moved;
			upper_.push(moved);
			upper_sum_ += moved;
		} else if (upper_.size() > lower_.size()) {
			const double moved = upper_.top();
			upper_.pop();
			upper_sum_ -= moved;
			lower_.push(moved);
			lower_sum_ += moved;
		}
	}

	double median() const {
		if (lower_.size() == upper_.size()) {
			return (lower_.top() + upper_.top()) / 2.0;
		}
		return lower_.top();
	}

	double cost() const {
		const double m = median();
		return m * static_cast<double>(lower_.size()) - lower_sum_ + upper_sum_ - m * static_cast<double>(upper_.size());
	}

private:
	std::priority_queue<double> lower_;
	std::priority_queue<double, std::vector<double>, std::greater<double>> upper_;
	double lower_sum_ = 0.0;
	double upper_sum_ = 0.0;
};

double MeanOf(const std::vector<std::size_t> &rows, const std::vector<double> &targets) {
	double sum = 0.0;
	for (auto row : rows) {
		sum += targets[row];
	}
	return sum / static_cast<double>(rows.size());
}

double MedianOf(const std::vector<std::size_t> &rows, const std::vector<double> &targets) {
	std::vector<double> values;
	values.reserve(rows.size());
	for (auto row : rows) {
		values.push_back(targets[row]);
	}
	std::sort(values.begin(), values.end());
	const std::size_t n = values.size();
	return n % 2 == 1 ? values[n / 2] : (values[n / 2 - 1] + values[n / 2]) / 2.0;
}

// Cost of the first k rows of @p order for every k in [1, n], indexed by k.
std::vector<double> PrefixCosts(const std::vector<std::size_t> &order, const std::vector<double> &targets,
                                SplitCriterion criterion, bool reversed) {
	const std::size_t n = order.size();
	std::vector<double> costs(n + 1, 0.0);
	if (criterion == SplitCriterion::SquaredError) {
		double sum = 0.0;
		double sum_sq = 0.0;
		for (std::size_t k = 1; k <= n; ++k) {
			const double y = targets[order[reversed ? n - k : k - 1]];
			sum += y;
			sum_sq += y * y;
			costs[k] = std::max(sum_sq - sum * sum / static_cast<double>(k), 0.0);
		}
	} else {
		RunningAbsoluteDeviation running;
		for (std::size_t k = 1; k <= n; ++k) {
			running.push(targets[order[reversed ? n - k : k - 1]]);
			costs[k] = running.cost();
		}
	}
	return costs;
}

struct SplitCandidate {
	int feature = -1;
	double threshold = 0.0;
	double cost = std::numeric_limits<double>::infinity();
};

} // namespace

RegressionTree::RegressionTree(SplitCriterion criterion, std::optional<std::size_t> max_depth,
                               std::size_t min_samples_split, std::size_t min_samples_leaf, std::uint32_t seed)
    : criterion_(criterion), max_depth_(max_depth), min_samples_split_(min_samples_split),
      min_samples_leaf_(min_samples_leaf), seed_(seed) {
}

void RegressionTree::fit(const core::FeatureTable &features, const std::vector<double> &targets) {
	if (features.rows() == 0) {
		throw std::invalid_argument("RegressionTree: cannot fit an empty feature table.");
	}
	if (features.rows() != targets.size()) {
		throw std::invalid_argument("RegressionTree: feature rows and targets differ in length.");
	}
	for (double y : targets) {
		if (!std::isfinite(y)) {
			throw std::invalid_argument("RegressionTree: targets must be finite.");
		}
	}

	nodes_.clear();
	n_features_ = features.cols();
	std::mt19937 rng(seed_);
	std::vector<std::size_t> feature_order(n_features_);

	const auto leaf_value = [&](const std::vector<std::size_t> &rows) {
		return criterion_ == SplitCriterion::SquaredError ? MeanOf(rows, targets) : MedianOf(rows, targets);
	};

	std::function<int(const std::vector<std::size_t> &, std::size_t)> grow;
	grow = [&](const std::vector<std::size_t> &rows, std::size_t depth) -> int {
		Node node;
		node.value = leaf_value(rows);
		node.n_samples = rows.size();

		const std::size_t n = rows.size();
		const bool depth_reached = max_depth_ && depth >= *max_depth_;
		const bool too_small = n < min_samples_split_ || n < 2 * min_samples_leaf_;
		if (depth_reached || too_small || n_features_ == 0) {
			nodes_.push_back(node);
			return static_cast<int>(nodes_.size() - 1);
		}
		const double impurity = PrefixCosts(rows, targets, criterion_, false)[n];
		if (impurity <= kImpurityTolerance) {
			nodes_.push_back(node);
			return static_cast<int>(nodes_.size() - 1);
		}

		std::iota(feature_order.begin(), feature_order.end(), std::size_t {0});
		std::shuffle(feature_order.begin(), feature_order.end(), rng);

		SplitCandidate best;
		std::vector<std::size_t> order = rows;
		for (auto feature : feature_order) {
			std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
				return features(a, feature) < features(b, feature);
			});
			const auto left_costs = PrefixCosts(order, targets, criterion_, false);
			const auto right_costs = PrefixCosts(order, targets, criterion_, true);
			for (std::size_t k = min_samples_leaf_; k + min_samples_leaf_ <= n; ++k) {
				const double below = features(order[k - 1], feature);
				const double above = features(order[k], feature);
				if (!(below < above)) {
					continue;
				}
				const double cost = left_costs[k] + right_costs[n - k];
				if (cost < best.cost) {
					best.cost = cost;
					best.feature = static_cast<int>(feature);
					best.threshold = below + (above - below) / 2.0;
					// Midpoints of adjacent doubles can round onto the upper value.
					if (!(best.threshold < above)) {
						best.threshold = below;
					}
				}
			}
		}

		if (best.feature < 0) {
			nodes_.push_back(node);
			return static_cast<int>(nodes_.size() - 1);
		}

		std::vector<std::size_t> left_rows;
		std::vector<std::size_t> right_rows;
		for (auto row : rows) {
			(features(row, static_cast<std::size_t>(best.feature)) <= best.threshold ? left_rows : right_rows)
			    .push_back(row);
		}

		node.feature = best.feature;
		node.threshold = best.threshold;
		const auto current = static_cast<int>(nodes_.size());
		nodes_.push_back(node);
		const int left = grow(left_rows, depth + 1);
		const int right = grow(right_rows, depth + 1);
		nodes_[current].left = left;
		nodes_[current].right = right;
		return current;
	};

	std::vector<std::size_t> all_rows(features.rows());
	std::iota(all_rows.begin(), all_rows.end(), std::size_t {0});
	grow(all_rows, 0);
	TSREGRESS_TRACE("RegressionTree fitted {} rows x {} features into {} nodes.", features.rows(), n_features_,
	                nodes_.size());
}

std::vector<double> RegressionTree::predict(const core::FeatureTable &features) const {
	if (!isFitted()) {
		throw std::runtime_error("RegressionTree: predict called before fit.");
	}
	if (features.cols() != n_features_) {
		throw std::invalid_argument("RegressionTree: expected " + std::to_string(n_features_) + " features, got " +
		                            std::to_string(features.cols()) + ".");
	}
	std::vector<double> predictions(features.rows());
	for (std::size_t r = 0; r < features.rows(); ++r) {
		int id = 0;
		while (nodes_[id].feature != -1) {
			id = features(r, static_cast<std::size_t>(nodes_[id].feature)) <= nodes_[id].threshold ? nodes_[id].left
			                                                                                       : nodes_[id].right;
		}
		predictions[r] = nodes_[id].value;
	}
	return predictions;
}

std::unique_ptr<IRegressor> RegressionTree::clone() const {
	return std::unique_ptr<IRegressor>(
	    new RegressionTree(criterion_, max_depth_, min_samples_split_, min_samples_leaf_, seed_));
}

std::size_t RegressionTree::depth() const {
	if (nodes_.empty()) {
		return 0;
	}
	std::size_t deepest = 0;
	std::vector<std::pair<int, std::size_t>> stack {{0, 0}};
	while (!stack.empty()) {
		auto [id, level] = stack.back();
		stack.pop_back();
		deepest = std::max(deepest, level);
		if (nodes_[id].feature != -1) {
			stack.emplace_back(nodes_[id].left, level + 1);
			stack.emplace_back(nodes_[id].right, level + 1);
		}
	}
	return deepest;
}

std::size_t RegressionTree::leafCount() const {
	return static_cast<std::size_t>(
	    std::count_if(nodes_.begin(), nodes_.end(), [](const Node &node) { return node.feature == -1; }));
}

RegressionTreeBuilder &RegressionTreeBuilder::withCriterion(SplitCriterion criterion) {
	criterion_ = criterion;
	return *this;
}

RegressionTreeBuilder &RegressionTreeBuilder::withMaxDepth(std::size_t max_depth) {
	max_depth_ = max_depth;
	return *this;
}

RegressionTreeBuilder &RegressionTreeBuilder::withMinSamplesSplit(std::size_t min_samples) {
	if (min_samples < 2) {
		throw std::invalid_argument("min_samples_split must be at least 2.");
	}
	min_samples_split_ = min_samples;
	return *this;
}

RegressionTreeBuilder &RegressionTreeBuilder::withMinSamplesLeaf(std::size_t min_samples) {
	if (min_samples == 0) {
		throw std::invalid_argument("min_samples_leaf must be at least 1.");
	}
	min_samples_leaf_ = min_samples;
	return *this;
}

RegressionTreeBuilder &RegressionTreeBuilder::withSeed(std::uint32_t seed) {
	seed_ = seed;
	return *this;
}

std::unique_ptr<RegressionTree> RegressionTreeBuilder::build() {
	return std::unique_ptr<RegressionTree>(
	    new RegressionTree(criterion_, max_depth_, min_samples_split_, min_samples_leaf_, seed_));
}

} // namespace tsregress::learners
