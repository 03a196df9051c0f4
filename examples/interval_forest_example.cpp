#include "tsregress/core/series_batch.hpp"
#include "tsregress/forest/interval_forest.hpp"
#include "tsregress/transform/series_transformer.hpp"
#include "tsregress/utils/logging.hpp"
#include "tsregress/utils/metrics.hpp"
#include <chrono>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <random>
#include <string>
#include <vector>

using namespace tsregress;

namespace {

struct Dataset {
	core::SeriesBatch batch;
	std::vector<double> targets;
};

// Damped oscillations; the target is the damping rate.
Dataset generateDampedOscillations(std::size_t n_cases, std::size_t length, unsigned seed) {
	std::mt19937 rng(seed);
	std::uniform_real_distribution<double> rate(0.01, 0.1);
	std::uniform_real_distribution<double> phase(0.0, 3.14159);
	std::normal_distribution<double> noise(0.0, 0.05);

	std::vector<std::vector<double>> rows;
	std::vector<double> targets;
	for (std::size_t c = 0; c < n_cases; ++c) {
		const double damping = rate(rng);
		const double shift = phase(rng);
		std::vector<double> row(length);
		for (std::size_t t = 0; t < length; ++t) {
			const double x = static_cast<double>(t);
			row[t] = std::exp(-damping * x) * std::sin(0.4 * x + shift) + noise(rng);
		}
		rows.push_back(std::move(row));
		targets.push_back(damping);
	}
	return {core::SeriesBatch::fromUnivariate(std::move(rows)), std::move(targets)};
}

void printHeader(const std::string &title) {
	std::cout << "\n=== " << title << " ===\n\n";
}

void printScore(const std::string &label, const utils::AccuracyMetrics &metrics) {
	std::cout << "  " << std::setw(28) << std::left << label << " | ";
	std::cout << "MAE: " << std::fixed << std::setprecision(4) << metrics.mae << " | ";
	std::cout << "RMSE: " << metrics.rmse << " | ";
	std::cout << "R2: " << std::setprecision(3) << metrics.r_squared << "\n";
	std::cout.unsetf(std::ios::floatfield);
}

} // namespace

int main() {
	utils::Logging::init(spdlog::level::warn);

	const auto train = generateDampedOscillations(120, 64, 1);
	const auto test = generateDampedOscillations(40, 64, 2);

	printHeader("Fixed size forest");
	auto forest = forest::makeCanonicalIntervalForest().withNEstimators(50).withRandomSeed(42).withNJobs(-1).build();
	forest->fit(train.batch, train.targets);
	std::cout << "  members: " << forest->nMembers() << ", intervals per member: " << forest->model().total_intervals
	          << ", build time: " << forest->model().build_time.count() << " ms\n";
	printScore("canonical battery", forest->score(test.batch, test.targets));

	const auto member_scores = forest->scoreMembers(test.batch, test.targets);
	double member_rmse = 0.0;
	for (const auto &member_score : member_scores) {
		member_rmse += member_score.rmse;
	}
	std::cout << "  mean member RMSE: " << std::fixed << std::setprecision(4)
	          << member_rmse / static_cast<double>(member_scores.size()) << "\n";
	std::cout.unsetf(std::ios::floatfield);

	printHeader("Contracted forest with three representations");
	auto contracted = forest::IntervalForestRegressorBuilder()
	                      .withSeriesTransformers({std::make_shared<transform::Identity>(),
	                                               std::make_shared<transform::FirstDifference>(),
	                                               std::make_shared<transform::Periodogram>()})
	                      .withIntervals(interval::IntervalCount::SqrtDiv())
	                      .withAttSubsampleSize(interval::AttributeSubsample::Count(8))
	                      .withTimeLimit(std::chrono::milliseconds(500))
	                      .withContractMaxNEstimators(200)
	                      .withRandomSeed(42)
	                      .withNJobs(-1)
	                      .build();
	const auto oob = contracted->fitPredict(train.batch, train.targets);
	std::cout << "  members built in budget: " << contracted->nMembers() << "\n";
	printScore("out-of-bag (train)", utils::Metrics::evaluate(train.targets, oob));
	printScore("held out", contracted->score(test.batch, test.targets));

	return 0;
}
