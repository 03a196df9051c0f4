#pragma once

#include "tsregress/core/feature_table.hpp"
#include "tsregress/core/series_batch.hpp"
#include "tsregress/features/feature_types.hpp"
#include "tsregress/interval/attribute_subsampler.hpp"
#include "tsregress/interval/interval_sampler.hpp"
#include <cstddef>
#include <memory>
#include <vector>

namespace tsregress::interval {

/**
 * @struct IntervalBlock
 * @brief The intervals and attributes a member uses on one representation.
 */
struct IntervalBlock {
	std::size_t representation = 0;
	std::vector<IntervalSpec> intervals;
	AttributeSelection attributes;

	std::size_t nColumns() const {
		return intervals.size() * attributes.size();
	}
};

/**
 * @class IntervalFeatureExtractor
 * @brief Turns series into a feature table by applying attributes to interval slices.
 *
 * Columns are laid out block by block, intervals outer and attributes inner.
 * Every non-finite attribute value is replaced with the configured sentinel as
 * soon as it is computed.
 */
class IntervalFeatureExtractor {
public:
	/// @throws std::invalid_argument If @p registry is null.
	IntervalFeatureExtractor(std::shared_ptr<const features::FeatureRegistry> registry, double replace_nan = 0.0);

	const features::FeatureRegistry &registry() const {
		return *registry_;
	}

	double replaceNan() const {
		return replace_nan_;
	}

	/**
	 * @brief Extracts one representation.
	 *
	 * The representation index carried by the intervals is not consulted; every interval
	 * is read from @p batch.
	 *
	 * @throws core::ShapeMismatchError If an interval falls outside a case.
	 */
	core::FeatureTable extract(const core::SeriesBatch &batch, const std::vector<IntervalSpec> &intervals,
	                           const AttributeSelection &attributes) const;

	/**
	 * @brief Extracts every block from its representation of the same cases.
	 * @param representations One batch per representation, all with the same cases.
	 */
	core::FeatureTable extract(const std::vector<core::SeriesBatch> &representations,
	                           const std::vector<IntervalBlock> &blocks) const;

private:
	void extractInto(const core::SeriesBatch &batch, const std::vector<IntervalSpec> &intervals,
	                 const AttributeSelection &attributes, core::FeatureTable &table, std::size_t column_offset) const;

	std::shared_ptr<const features::FeatureRegistry> registry_;
	double replace_nan_;
};

} // namespace tsregress::interval
