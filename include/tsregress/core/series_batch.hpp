#pragma once

#include <cstddef>
#include <stdexcept>
#include <vector>

namespace tsregress::core {

/**
 * @class SeriesBatch
 * @brief An immutable collection of (possibly multivariate) time series cases.
 *
 * Every case holds the same number of channels and every channel of a case has
 * the same number of timepoints. Different cases may differ in length, in which
 * case the batch is reported as unequal-length.
 */
class SeriesBatch {
public:
	using Value = double;
	using Channel = std::vector<Value>;
	using Case = std::vector<Channel>;

	SeriesBatch() = default;

	/**
	 * @brief Constructs a batch from cases laid out as [case][channel][timepoint].
	 * @throws std::invalid_argument If channel counts differ between cases, a case
	 *         has channels of different lengths, or any channel is empty.
	 */
	explicit SeriesBatch(std::vector<Case> cases);

	/// Builds a univariate batch, one row per case.
	static SeriesBatch fromUnivariate(std::vector<Channel> rows);

	/**
	 * @brief Builds an equal-length batch from a contiguous case-major buffer.
	 * @param values Buffer of size n_cases * n_channels * n_timepoints.
	 */
	static SeriesBatch fromContiguous(const std::vector<Value> &values, std::size_t n_cases, std::size_t n_channels,
	                                  std::size_t n_timepoints);

	std::size_t nCases() const noexcept {
		return cases_.size();
	}

	std::size_t nChannels() const noexcept {
		return n_channels_;
	}

	bool empty() const noexcept {
		return cases_.empty();
	}

	/// Number of timepoints of a single case.
	std::size_t nTimepoints(std::size_t case_index) const;

	std::size_t minTimepoints() const noexcept {
		return min_timepoints_;
	}

	std::size_t maxTimepoints() const noexcept {
		return max_timepoints_;
	}

	bool isEqualLength() const noexcept {
		return min_timepoints_ == max_timepoints_;
	}

	const Case &operator[](std::size_t case_index) const {
		return cases_[case_index];
	}

	const Case &at(std::size_t case_index) const;

	const Channel &channel(std::size_t case_index, std::size_t channel_index) const;

	/// Returns a new batch holding the given cases in the given order.
	SeriesBatch select(const std::vector<std::size_t> &case_indices) const;

private:
	void validate();

	std::vector<Case> cases_;
	std::size_t n_channels_ = 0;
	std::size_t min_timepoints_ = 0;
	std::size_t max_timepoints_ = 0;
};

} // namespace tsregress::core
