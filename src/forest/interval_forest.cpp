#include "tsregress/forest/interval_forest.hpp"
#include "tsregress/core/errors.hpp"
#include "tsregress/learners/regression_tree.hpp"
#include "tsregress/utils/logging.hpp"
#include "tsregress/utils/worker_pool.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <optional>
#include <random>
#include <stdexcept>

namespace tsregress::forest {

namespace {

using Clock = std::chrono::steady_clock;

void ValidateTrainingData(const core::SeriesBatch &batch, const std::vector<double> &targets) {
	if (batch.empty()) {
		throw std::invalid_argument("IntervalForestRegressor: cannot fit an empty batch.");
	}
	if (batch.nCases() != targets.size()) {
		throw std::invalid_argument("IntervalForestRegressor: " + std::to_string(batch.nCases()) + " cases but " +
		                            std::to_string(targets.size()) + " targets.");
	}
	for (double y : targets) {
		if (!std::isfinite(y)) {
			throw std::invalid_argument("IntervalForestRegressor: targets must be finite.");
		}
	}
}

std::chrono::milliseconds ElapsedSince(Clock::time_point start) {
	return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

} // namespace

IntervalForestRegressor::IntervalForestRegressor(ForestConfig config) : config_(std::move(config)) {
	config_.validate();
}

std::vector<core::SeriesBatch> IntervalForestRegressor::representationsOf(const core::SeriesBatch &batch) const {
	std::vector<core::SeriesBatch> representations;
	representations.reserve(config_.nRepresentations());
	for (const auto &transformer : config_.series_transformers) {
		representations.push_back(transformer->transformBatch(batch));
	}
	return representations;
}

void IntervalForestRegressor::fit(const core::SeriesBatch &batch, const std::vector<double> &targets) {
	build(batch, targets, false);
}

std::vector<double> IntervalForestRegressor::fitPredict(const core::SeriesBatch &batch,
                                                        const std::vector<double> &targets) {
	build(batch, targets, true);

	const std::size_t n_cases = batch.nCases();
	std::vector<double> sums(n_cases, 0.0);
	std::vector<std::size_t> counts(n_cases, 0);
	for (const auto &member : model_->members) {
		for (std::size_t k = 0; k < member.oob_cases.size(); ++k) {
			sums[member.oob_cases[k]] += member.oob_predictions[k];
			counts[member.oob_cases[k]] += 1;
		}
	}
	const double mean_target =
	    std::accumulate(targets.begin(), targets.end(), 0.0) / static_cast<double>(targets.size());
	std::vector<double> estimate(n_cases);
	for (std::size_t c = 0; c < n_cases; ++c) {
		estimate[c] = counts[c] > 0 ? sums[c] / static_cast<double>(counts[c]) : mean_target;
	}
	return estimate;
}

void IntervalForestRegressor::build(const core::SeriesBatch &batch, const std::vector<double> &targets,
                                    bool out_of_bag) {
	ValidateTrainingData(batch, targets);
	config_.validate();

	state_ = FitState::Building;
	model_.reset();
	extractor_.reset();
	try {
		const auto start = Clock::now();
		auto model = std::make_shared<ForestModel>();
		model->n_cases = batch.nCases();
		model->n_channels = batch.nChannels();
		model->n_timepoints = batch.minTimepoints();
		model->equal_length = batch.isEqualLength();

		const auto representations = representationsOf(batch);
		const std::size_t n_reps = representations.size();
		for (std::size_t rep = 0; rep < n_reps; ++rep) {
			const auto &view = representations[rep];
			auto geometry = interval::ResolveGeometry(view.minTimepoints(), view.nChannels(),
			                                          config_.intervalsFor(rep), config_.minLengthFor(rep),
			                                          config_.maxLengthFor(rep), n_reps);
			TSREGRESS_DEBUG("Representation {} ({}): {} timepoints, {} intervals of length [{}, {}].", rep,
			                config_.series_transformers[rep]->getName(), geometry.n_timepoints, geometry.n_intervals,
			                geometry.min_length, geometry.max_length);
			model->total_intervals += geometry.n_intervals;
			model->geometry.push_back(geometry);
		}

		const MemberBuilder builder(representations, targets, model->geometry, config_);
		model->master_seed = config_.random_seed ? *config_.random_seed : std::random_device {}();

		utils::WorkerPool pool(config_.n_jobs);
		const bool contracted = config_.time_limit.has_value();
		const std::size_t planned = contracted ? config_.contract_max_n_estimators : config_.n_estimators;
		const std::size_t candidate_limit = planned + config_.max_extra_members;
		TSREGRESS_INFO("Fitting {} on {} cases x {} channels: {} members{}, {} worker(s).", getName(),
		               model->n_cases, model->n_channels, contracted ? "up to " : "", planned,
		               pool.concurrency());

		std::size_t next_candidate = 0;
		std::optional<core::MemberBuildError> last_failure;
		while (model->members.size() < planned) {
			std::size_t wanted = planned - model->members.size();
			if (contracted) {
				wanted = std::min(wanted, pool.concurrency());
			}
			wanted = std::min(wanted, candidate_limit - next_candidate);
			if (wanted == 0) {
				break;
			}
			if (next_candidate >= planned) {
				TSREGRESS_INFO("Topping up {} failed member(s) with extra candidates.", wanted);
			}

			std::vector<std::optional<EnsembleMember>> built(wanted);
			std::vector<std::optional<core::MemberBuildError>> failures(wanted);
			for (std::size_t slot = 0; slot < wanted; ++slot) {
				const std::size_t candidate = next_candidate + slot;
				pool.submit([&, slot, candidate]() {
					try {
						built[slot] = builder.build(candidate, MemberBuilder::MemberSeed(model->master_seed, candidate),
						                            out_of_bag);
					} catch (const core::MemberBuildError &error) {
						failures[slot] = error;
					}
				});
			}
			pool.joinBatch();
			next_candidate += wanted;

			for (std::size_t slot = 0; slot < wanted; ++slot) {
				if (built[slot]) {
					model->members.push_back(std::move(*built[slot]));
				} else {
					model->failed_members += 1;
					last_failure = failures[slot];
				}
			}

			if (contracted) {
				const auto elapsed = ElapsedSince(start);
				TSREGRESS_DEBUG("Contract batch of {} done: {} members after {} ms.", wanted, model->members.size(),
				                elapsed.count());
				if (!model->members.empty() && elapsed >= *config_.time_limit) {
					break;
				}
			}
		}

		if (model->members.empty()) {
			TSREGRESS_ERROR("{} could not build any member from {} candidates.", getName(), next_candidate);
			if (last_failure) {
				throw core::MemberBuildError("No ensemble member could be built; last failure: " +
				                                 std::string(last_failure->what()),
				                             last_failure->memberIndex(), last_failure->attempts());
			}
			throw core::MemberBuildError("No ensemble member could be built.", 0, 0);
		}
		if (!contracted && model->members.size() < config_.n_estimators) {
			TSREGRESS_WARN("Built {} of {} members; {} candidate(s) failed.", model->members.size(),
			               config_.n_estimators, model->failed_members);
		}

		model->build_time = ElapsedSince(start);
		TSREGRESS_INFO("{} fitted {} members in {} ms.", getName(), model->members.size(), model->build_time.count());
		extractor_ = std::make_shared<interval::IntervalFeatureExtractor>(builder.extractor());
		model_ = std::move(model);
		state_ = FitState::Fit;
	} catch (...) {
		state_ = FitState::FitFailed;
		throw;
	}
}

const ForestModel &IntervalForestRegressor::model() const {
	if (!model_ || state_ != FitState::Fit) {
		throw std::runtime_error("IntervalForestRegressor: the forest is not fitted.");
	}
	return *model_;
}

std::size_t IntervalForestRegressor::nMembers() const {
	return model_ ? model_->members.size() : 0;
}

void IntervalForestRegressor::checkCompatible(const core::SeriesBatch &batch) const {
	if (batch.empty()) {
		throw std::invalid_argument("IntervalForestRegressor: cannot predict an empty batch.");
	}
	const auto &fitted = model();
	if (batch.nChannels() != fitted.n_channels) {
		throw core::ShapeMismatchError("Expected " + std::to_string(fitted.n_channels) + " channel(s), got " +
		                               std::to_string(batch.nChannels()) + ".");
	}
	if (fitted.equal_length) {
		if (!batch.isEqualLength() || batch.minTimepoints() != fitted.n_timepoints) {
			throw core::ShapeMismatchError("Expected series of exactly " + std::to_string(fitted.n_timepoints) +
			                               " timepoints, got lengths " + std::to_string(batch.minTimepoints()) +
			                               " to " + std::to_string(batch.maxTimepoints()) + ".");
		}
	} else if (batch.minTimepoints() < fitted.n_timepoints) {
		throw core::ShapeMismatchError("Expected series of at least " + std::to_string(fitted.n_timepoints) +
		                               " timepoints, got " + std::to_string(batch.minTimepoints()) + ".");
	}
}

std::vector<std::vector<double>> IntervalForestRegressor::predictPerMember(const core::SeriesBatch &batch) const {
	checkCompatible(batch);
	const auto &fitted = model();
	const auto representations = representationsOf(batch);

	std::vector<std::vector<double>> predictions(fitted.members.size());
	utils::WorkerPool pool(config_.n_jobs);
	for (std::size_t m = 0; m < fitted.members.size(); ++m) {
		pool.submit([&, m]() { predictions[m] = fitted.members[m].predict(*extractor_, representations); });
	}
	pool.joinBatch();
	return predictions;
}

std::vector<double> IntervalForestRegressor::predict(const core::SeriesBatch &batch) const {
	const auto per_member = predictPerMember(batch);
	std::vector<double> mean(batch.nCases(), 0.0);
	for (const auto &member_predictions : per_member) {
		for (std::size_t c = 0; c < mean.size(); ++c) {
			mean[c] += member_predictions[c];
		}
	}
	for (auto &value : mean) {
		value /= static_cast<double>(per_member.size());
	}
	return mean;
}

utils::AccuracyMetrics IntervalForestRegressor::score(const core::SeriesBatch &batch,
                                                      const std::vector<double> &targets) const {
	return utils::Metrics::evaluate(targets, predict(batch));
}

std::vector<utils::AccuracyMetrics> IntervalForestRegressor::scoreMembers(const core::SeriesBatch &batch,
                                                                          const std::vector<double> &targets) const {
	return utils::Metrics::evaluateRows(targets, predictPerMember(batch));
}

IntervalForestRegressorBuilder &IntervalForestRegressorBuilder::withConfig(ForestConfig config) {
	config_ = std::move(config);
	return *this;
}

IntervalForestRegressorBuilder &IntervalForestRegressorBuilder::withNEstimators(std::size_t n_estimators) {
	config_.n_estimators = n_estimators;
	return *this;
}

IntervalForestRegressorBuilder &IntervalForestRegressorBuilder::withIntervals(interval::IntervalCount count) {
	config_.n_intervals = {std::move(count)};
	return *this;
}

IntervalForestRegressorBuilder &
IntervalForestRegressorBuilder::withIntervals(std::vector<interval::IntervalCount> per_representation) {
	config_.n_intervals = std::move(per_representation);
	return *this;
}

IntervalForestRegressorBuilder &IntervalForestRegressorBuilder::withMinIntervalLength(interval::LengthBound length) {
	config_.min_interval_length = {length};
	return *this;
}

IntervalForestRegressorBuilder &
IntervalForestRegressorBuilder::withMinIntervalLength(std::vector<interval::LengthBound> per_representation) {
	config_.min_interval_length = std::move(per_representation);
	return *this;
}

IntervalForestRegressorBuilder &IntervalForestRegressorBuilder::withMaxIntervalLength(interval::LengthBound length) {
	config_.max_interval_length = {length};
	return *this;
}

IntervalForestRegressorBuilder &
IntervalForestRegressorBuilder::withMaxIntervalLength(std::vector<interval::LengthBound> per_representation) {
	config_.max_interval_length = std::move(per_representation);
	return *this;
}

IntervalForestRegressorBuilder &
IntervalForestRegressorBuilder::withAttSubsampleSize(interval::AttributeSubsample subsample) {
	config_.att_subsample_size = {subsample};
	return *this;
}

IntervalForestRegressorBuilder &
IntervalForestRegressorBuilder::withAttSubsampleSize(std::vector<interval::AttributeSubsample> per_representation) {
	config_.att_subsample_size = std::move(per_representation);
	return *this;
}

IntervalForestRegressorBuilder &IntervalForestRegressorBuilder::withTimeLimit(std::chrono::milliseconds limit) {
	config_.time_limit = limit;
	return *this;
}

IntervalForestRegressorBuilder &
IntervalForestRegressorBuilder::withContractMaxNEstimators(std::size_t max_estimators) {
	config_.contract_max_n_estimators = max_estimators;
	return *this;
}

IntervalForestRegressorBuilder &IntervalForestRegressorBuilder::withRandomSeed(std::uint32_t seed) {
	config_.random_seed = seed;
	return *this;
}

IntervalForestRegressorBuilder &IntervalForestRegressorBuilder::withNJobs(int n_jobs) {
	config_.n_jobs = n_jobs;
	return *this;
}

IntervalForestRegressorBuilder &IntervalForestRegressorBuilder::withReplaceNan(double value) {
	config_.replace_nan = value;
	return *this;
}

IntervalForestRegressorBuilder &
IntervalForestRegressorBuilder::withSeriesTransformers(std::vector<transform::SeriesTransformerPtr> transformers) {
	config_.series_transformers = std::move(transformers);
	return *this;
}

IntervalForestRegressorBuilder &IntervalForestRegressorBuilder::withMaxExtraMembers(std::size_t max_extra) {
	config_.max_extra_members = max_extra;
	return *this;
}

IntervalForestRegressorBuilder &IntervalForestRegressorBuilder::withBaseLearner(learners::RegressorPtr learner) {
	config_.base_learner = std::move(learner);
	return *this;
}

IntervalForestRegressorBuilder &
IntervalForestRegressorBuilder::withAttributes(std::shared_ptr<const features::FeatureRegistry> registry) {
	config_.attributes = std::move(registry);
	return *this;
}

std::unique_ptr<IntervalForestRegressor> IntervalForestRegressorBuilder::build() {
	return std::unique_ptr<IntervalForestRegressor>(new IntervalForestRegressor(config_));
}

IntervalForestRegressorBuilder makeCanonicalIntervalForest() {
	IntervalForestRegressorBuilder builder;
	builder.withAttributes(features::FeatureRegistry::Canonical())
	    .withAttSubsampleSize(interval::AttributeSubsample::Count(8))
	    .withIntervals(interval::IntervalCount::Sqrt())
	    .withMinIntervalLength(interval::LengthBound::Absolute(3))
	    .withMaxIntervalLength(interval::LengthBound::Unbounded())
	    .withBaseLearner(learners::RegressorPtr(learners::RegressionTreeBuilder().build()));
	return builder;
}

} // namespace tsregress::forest
