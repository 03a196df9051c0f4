#pragma once

#include "tsregress/core/feature_table.hpp"
#include "tsregress/core/series_batch.hpp"
#include "tsregress/forest/forest_config.hpp"
#include "tsregress/interval/attribute_subsampler.hpp"
#include "tsregress/interval/interval_feature_extractor.hpp"
#include "tsregress/interval/interval_sampler.hpp"
#include "tsregress/learners/iregressor.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace tsregress::forest {

/**
 * @struct EnsembleMember
 * @brief One fitted unit of the forest: its geometry and its learner.
 *
 * Blocks are ordered by representation and fix the member's column layout, so
 * the same blocks are replayed unchanged at predict time.
 */
struct EnsembleMember {
	/// Candidate index the member was built for.
	std::size_t index = 0;
	/// Seed of the successful attempt.
	std::uint32_t seed = 0;
	std::size_t attempts = 1;
	std::vector<interval::IntervalBlock> blocks;
	std::unique_ptr<learners::IRegressor> learner;

	/// Cases left out of the member's bootstrap and the bootstrap learner's predictions for them.
	std::vector<std::size_t> oob_cases;
	std::vector<double> oob_predictions;

	std::size_t nIntervals() const;
	std::size_t nColumns() const;

	/// Predicts one value per case of the given representations.
	std::vector<double> predict(const interval::IntervalFeatureExtractor &extractor,
	                            const std::vector<core::SeriesBatch> &representations) const;
};

/**
 * @class MemberBuilder
 * @brief Builds ensemble members against data and geometry resolved once per fit.
 *
 * A builder is shared read-only by every worker; build() keeps all of its
 * mutable state local, so members can be built concurrently.
 */
class MemberBuilder {
public:
	/**
	 * @param representations The training cases, one batch per series transformer.
	 * @param targets One target per case.
	 * @param geometry Resolved sampling bounds, one per representation.
	 * @throws core::ConfigurationError If the attribute subsample cannot be satisfied.
	 */
	MemberBuilder(const std::vector<core::SeriesBatch> &representations, const std::vector<double> &targets,
	              std::vector<interval::ResolvedGeometry> geometry, const ForestConfig &config);

	/**
	 * @brief Samples, extracts and fits one member.
	 *
	 * A failed learner fit is retried once with geometry resampled from a seed
	 * derived from @p seed.
	 *
	 * @param out_of_bag Also fit a bootstrap learner and record its out-of-bag predictions.
	 * @throws core::MemberBuildError If the retry fails as well.
	 */
	EnsembleMember build(std::size_t member_index, std::uint32_t seed, bool out_of_bag = false) const;

	const interval::IntervalFeatureExtractor &extractor() const {
		return extractor_;
	}

	const std::vector<interval::ResolvedGeometry> &geometry() const {
		return geometry_;
	}

	/// Seed of member @p member_index: (s == 0 ? 255 : s) * 37 * (index + 1) mod (2^31 - 1).
	static std::uint32_t MemberSeed(std::uint32_t master_seed, std::size_t member_index);

	/// Seed of retry @p attempt (1-based) of a member.
	static std::uint32_t RetrySeed(std::uint32_t member_seed, std::size_t attempt);

	static constexpr std::size_t kMaxAttempts = 2;

private:
	EnsembleMember attempt(std::size_t member_index, std::uint32_t seed, bool out_of_bag) const;

	const std::vector<core::SeriesBatch> &representations_;
	const std::vector<double> &targets_;
	std::vector<interval::ResolvedGeometry> geometry_;
	std::vector<interval::AttributeSubsampler> subsamplers_;
	interval::IntervalFeatureExtractor extractor_;
	learners::RegressorPtr prototype_;
};

} // namespace tsregress::forest
