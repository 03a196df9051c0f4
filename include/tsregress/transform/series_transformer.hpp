#pragma once

#include "tsregress/core/series_batch.hpp"
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace tsregress::transform {

/**
 * @class SeriesTransformer
 * @brief A stateless view of a series batch ("representation").
 *
 * A transformer maps every channel of every case independently, so the same
 * instance can be shared by all members of a forest and applied at fit and at
 * predict time.
 */
class SeriesTransformer {
public:
	virtual ~SeriesTransformer() = default;

	virtual std::string getName() const = 0;

	/// Length of a transformed channel of @p n_timepoints samples; 0 when the view is undefined.
	virtual std::size_t outputLength(std::size_t n_timepoints) const = 0;

	virtual std::vector<double> transform(const std::vector<double> &channel) const = 0;

	/**
	 * @brief Applies the view to every channel of every case.
	 * @throws core::ShapeMismatchError If a case is too short for this view.
	 */
	virtual core::SeriesBatch transformBatch(const core::SeriesBatch &batch) const;
};

using SeriesTransformerPtr = std::shared_ptr<const SeriesTransformer>;

class Identity final : public SeriesTransformer {
public:
	std::string getName() const override {
		return "Identity";
	}

	std::size_t outputLength(std::size_t n_timepoints) const override {
		return n_timepoints;
	}

	std::vector<double> transform(const std::vector<double> &channel) const override;
	core::SeriesBatch transformBatch(const core::SeriesBatch &batch) const override;
};

/// x[t+1] - x[t]; one sample shorter than the input.
class FirstDifference final : public SeriesTransformer {
public:
	std::string getName() const override {
		return "FirstDifference";
	}

	std::size_t outputLength(std::size_t n_timepoints) const override {
		return n_timepoints < 2 ? 0 : n_timepoints - 1;
	}

	std::vector<double> transform(const std::vector<double> &channel) const override;
};

/**
 * @class Periodogram
 * @brief Magnitude spectrum of the channel zero-padded to the next power of two.
 *
 * Only the first half of the spectrum (frequencies below Nyquist) is kept.
 */
class Periodogram final : public SeriesTransformer {
public:
	std::string getName() const override {
		return "Periodogram";
	}

	std::size_t outputLength(std::size_t n_timepoints) const override;

	std::vector<double> transform(const std::vector<double> &channel) const override;
};

std::vector<SeriesTransformerPtr> DefaultRepresentations();

} // namespace tsregress::transform
