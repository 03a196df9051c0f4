#pragma once

#include "tsregress/core/series_batch.hpp"
#include "tsregress/forest/ensemble_member.hpp"
#include "tsregress/forest/forest_config.hpp"
#include "tsregress/utils/metrics.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace tsregress::forest {

enum class FitState {
	Unfit,     ///< No fit has been attempted.
	Building,  ///< Members are being built.
	Fit,       ///< A model is available for prediction.
	FitFailed, ///< The last fit could not build a single member.
};

/**
 * @struct ForestModel
 * @brief The members of one fit together with the geometry they were fitted on.
 *
 * A model is created once per fit and never modified afterwards; a new fit
 * replaces it.
 */
struct ForestModel {
	std::vector<EnsembleMember> members;
	std::vector<interval::ResolvedGeometry> geometry;
	std::size_t n_cases = 0;
	std::size_t n_channels = 0;
	/// Shortest training case.
	std::size_t n_timepoints = 0;
	bool equal_length = true;
	std::size_t total_intervals = 0;
	std::uint32_t master_seed = 0;
	/// Candidates whose build failed after retrying.
	std::size_t failed_members = 0;
	std::chrono::milliseconds build_time {0};
};

class IntervalForestRegressorBuilder; // Forward declaration

/**
 * @class IntervalForestRegressor
 * @brief A randomised interval forest for time series regression.
 *
 * Each member samples random intervals of each series representation, computes
 * a random subset of the attribute battery on every interval and fits a base
 * learner on the resulting table. Predictions are the unweighted mean of the
 * members' predictions.
 *
 * With a time limit the forest is built in batches of n_jobs members until the
 * limit or contract_max_n_estimators is reached; at least one member is always
 * built. Results do not depend on n_jobs for a fixed random seed.
 */
class IntervalForestRegressor {
public:
	friend class IntervalForestRegressorBuilder;

	/// @throws core::ConfigurationError If the configuration is invalid.
	explicit IntervalForestRegressor(ForestConfig config = ForestConfig());

	/**
	 * @brief Builds a new model, replacing any previous one.
	 * @throws std::invalid_argument If the batch is empty or targets do not match it.
	 * @throws core::ConfigurationError If the interval bounds cannot be resolved for the data.
	 * @throws core::MemberBuildError If no member could be built.
	 */
	void fit(const core::SeriesBatch &batch, const std::vector<double> &targets);

	/**
	 * @brief Mean prediction of all members, one per case.
	 * @throws std::runtime_error If the forest is not fitted.
	 * @throws core::ShapeMismatchError If the batch does not match the training geometry.
	 */
	std::vector<double> predict(const core::SeriesBatch &batch) const;

	/// Unweighted predictions, one row per member and one column per case.
	std::vector<std::vector<double>> predictPerMember(const core::SeriesBatch &batch) const;

	/**
	 * @brief Fits the forest and returns an out-of-bag estimate for the training cases.
	 *
	 * Cases that no member left out of its bootstrap receive the mean target.
	 */
	std::vector<double> fitPredict(const core::SeriesBatch &batch, const std::vector<double> &targets);

	utils::AccuracyMetrics score(const core::SeriesBatch &batch, const std::vector<double> &targets) const;

	/// Accuracy of each member on its own, in member order.
	std::vector<utils::AccuracyMetrics> scoreMembers(const core::SeriesBatch &batch,
	                                                 const std::vector<double> &targets) const;

	FitState state() const noexcept {
		return state_;
	}

	bool isFitted() const noexcept {
		return state_ == FitState::Fit;
	}

	const ForestConfig &config() const noexcept {
		return config_;
	}

	/// @throws std::runtime_error If the forest is not fitted.
	const ForestModel &model() const;

	std::size_t nMembers() const;

	std::string getName() const {
		return "IntervalForestRegressor";
	}

private:
	void build(const core::SeriesBatch &batch, const std::vector<double> &targets, bool out_of_bag);
	std::vector<core::SeriesBatch> representationsOf(const core::SeriesBatch &batch) const;
	void checkCompatible(const core::SeriesBatch &batch) const;

	ForestConfig config_;
	FitState state_ = FitState::Unfit;
	std::shared_ptr<const ForestModel> model_;
	std::shared_ptr<const interval::IntervalFeatureExtractor> extractor_;
};

/**
 * @class IntervalForestRegressorBuilder
 * @brief A builder for fluently configuring IntervalForestRegressor models.
 */
class IntervalForestRegressorBuilder {
public:
	IntervalForestRegressorBuilder &withConfig(ForestConfig config);
	IntervalForestRegressorBuilder &withNEstimators(std::size_t n_estimators);

	/// One interval count shared by every representation.
	IntervalForestRegressorBuilder &withIntervals(interval::IntervalCount count);
	IntervalForestRegressorBuilder &withIntervals(std::vector<interval::IntervalCount> per_representation);

	IntervalForestRegressorBuilder &withMinIntervalLength(interval::LengthBound length);
	IntervalForestRegressorBuilder &withMinIntervalLength(std::vector<interval::LengthBound> per_representation);
	IntervalForestRegressorBuilder &withMaxIntervalLength(interval::LengthBound length);
	IntervalForestRegressorBuilder &withMaxIntervalLength(std::vector<interval::LengthBound> per_representation);
	IntervalForestRegressorBuilder &withAttSubsampleSize(interval::AttributeSubsample subsample);
	IntervalForestRegressorBuilder &
	withAttSubsampleSize(std::vector<interval::AttributeSubsample> per_representation);

	IntervalForestRegressorBuilder &withTimeLimit(std::chrono::milliseconds limit);
	IntervalForestRegressorBuilder &withContractMaxNEstimators(std::size_t max_estimators);
	IntervalForestRegressorBuilder &withRandomSeed(std::uint32_t seed);
	IntervalForestRegressorBuilder &withNJobs(int n_jobs);
	IntervalForestRegressorBuilder &withReplaceNan(double value);
	IntervalForestRegressorBuilder &withSeriesTransformers(std::vector<transform::SeriesTransformerPtr> transformers);
	IntervalForestRegressorBuilder &withMaxExtraMembers(std::size_t max_extra);
	IntervalForestRegressorBuilder &withBaseLearner(learners::RegressorPtr learner);
	IntervalForestRegressorBuilder &withAttributes(std::shared_ptr<const features::FeatureRegistry> registry);

	/// @throws core::ConfigurationError If the configuration is invalid.
	std::unique_ptr<IntervalForestRegressor> build();

private:
	ForestConfig config_;
};

/**
 * @brief Builder preset for the canonical interval forest.
 *
 * Canonical battery, eight attributes per member, sqrt(n) intervals of at
 * least three timepoints and a regression tree learner.
 */
IntervalForestRegressorBuilder makeCanonicalIntervalForest();

} // namespace tsregress::forest
