#pragma once

#include "tsregress/features/feature_types.hpp"
#include "tsregress/interval/attribute_subsampler.hpp"
#include "tsregress/interval/interval_sampler.hpp"
#include "tsregress/learners/iregressor.hpp"
#include "tsregress/transform/series_transformer.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tsregress::forest {

/**
 * @struct ForestConfig
 * @brief Configuration of an interval forest regressor.
 *
 * The per-representation lists (interval counts, length bounds and attribute
 * subsample sizes) hold either one entry, shared by every representation, or
 * exactly one entry per series transformer.
 */
struct ForestConfig {
	/// Members built when no time limit is set.
	std::size_t n_estimators = 200;

	std::vector<interval::IntervalCount> n_intervals {interval::IntervalCount::Sqrt()};
	std::vector<interval::LengthBound> min_interval_length {interval::LengthBound::Absolute(3)};
	std::vector<interval::LengthBound> max_interval_length {interval::LengthBound::Unbounded()};
	std::vector<interval::AttributeSubsample> att_subsample_size {interval::AttributeSubsample::All()};

	/// Wall-clock build budget; overrides n_estimators when set.
	std::optional<std::chrono::milliseconds> time_limit;
	std::size_t contract_max_n_estimators = 500;

	/// Drawn from std::random_device on every fit when unset.
	std::optional<std::uint32_t> random_seed;

	/// Concurrent member builds; -1 uses every hardware thread.
	int n_jobs = 1;

	/// Substitute for non-finite attribute values.
	double replace_nan = 0.0;

	std::vector<transform::SeriesTransformerPtr> series_transformers = transform::DefaultRepresentations();

	/// Extra candidate members tried after member build failures.
	std::size_t max_extra_members = 10;

	/// Cloned once per member; a default regression tree when null.
	learners::RegressorPtr base_learner;

	/// The canonical battery when null.
	std::shared_ptr<const features::FeatureRegistry> attributes;

	/**
	 * @brief Checks every structural constraint that does not depend on the data.
	 * @throws core::ConfigurationError On the first violated constraint.
	 */
	void validate() const;

	std::size_t nRepresentations() const {
		return series_transformers.size();
	}

	const interval::IntervalCount &intervalsFor(std::size_t representation) const;
	const interval::LengthBound &minLengthFor(std::size_t representation) const;
	const interval::LengthBound &maxLengthFor(std::size_t representation) const;
	const interval::AttributeSubsample &attSubsampleFor(std::size_t representation) const;

	/// The configured registry, or the canonical battery.
	std::shared_ptr<const features::FeatureRegistry> attributeRegistry() const;

	/// The configured learner, or a fresh default regression tree.
	learners::RegressorPtr baseLearner() const;
};

/// A scalar option value.
using OptionScalar = std::variant<std::int64_t, double, std::string>;

using OptionList = std::vector<OptionScalar>;

/// An option value: None, a scalar, a list of scalars, or one list per representation.
using OptionValue =
    std::variant<std::monostate, std::int64_t, double, std::string, OptionList, std::vector<OptionList>>;

using OptionMap = std::map<std::string, OptionValue>;

/**
 * @brief Builds a configuration from named options.
 *
 * Recognised names: n_estimators, n_intervals, min_interval_length,
 * max_interval_length, att_subsample_size, time_limit (seconds),
 * contract_max_n_estimators, random_seed, n_jobs, replace_nan and
 * max_extra_members. A flat list given for n_intervals is summed into one count
 * shared by every representation; a list of lists gives one count per
 * representation, each inner list summed. Lists given for the length bounds and
 * att_subsample_size hold one entry per representation.
 * Integers give absolute lengths and counts, doubles give proportions, and
 * "inf" leaves max_interval_length unbounded.
 *
 * @throws core::ConfigurationError On unknown names or badly typed values.
 */
ForestConfig configFromOptions(const OptionMap &options, ForestConfig base = ForestConfig());

} // namespace tsregress::forest
