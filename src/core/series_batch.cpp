#include "tsregress/core/series_batch.hpp"

#include <algorithm>
#include <limits>
#include <string>
#include <utility>

namespace tsregress::core {

SeriesBatch::SeriesBatch(std::vector<Case> cases) : cases_(std::move(cases)) {
	validate();
}

SeriesBatch SeriesBatch::fromUnivariate(std::vector<Channel> rows) {
	std::vector<Case> cases;
	cases.reserve(rows.size());
	for (auto &row : rows) {
		Case single;
		single.push_back(std::move(row));
		cases.push_back(std::move(single));
	}
	return SeriesBatch(std::move(cases));
}

SeriesBatch SeriesBatch::fromContiguous(const std::vector<Value> &values, std::size_t n_cases,
                                        std::size_t n_channels, std::size_t n_timepoints) {
	if (values.size() != n_cases * n_channels * n_timepoints) {
		throw std::invalid_argument("SeriesBatch: buffer size " + std::to_string(values.size()) +
		                            " does not match " + std::to_string(n_cases) + " x " +
		                            std::to_string(n_channels) + " x " + std::to_string(n_timepoints));
	}
	std::vector<Case> cases(n_cases, Case(n_channels));
	auto it = values.begin();
	for (auto &series_case : cases) {
		for (auto &channel : series_case) {
			channel.assign(it, it + static_cast<std::ptrdiff_t>(n_timepoints));
			it += static_cast<std::ptrdiff_t>(n_timepoints);
		}
	}
	return SeriesBatch(std::move(cases));
}

void SeriesBatch::validate() {
	if (cases_.empty()) {
		n_channels_ = 0;
		min_timepoints_ = 0;
		max_timepoints_ = 0;
		return;
	}

	n_channels_ = cases_.front().size();
	if (n_channels_ == 0) {
		throw std::invalid_argument("SeriesBatch: cases must have at least one channel.");
	}

	min_timepoints_ = std::numeric_limits<std::size_t>::max();
	max_timepoints_ = 0;
	for (std::size_t i = 0; i < cases_.size(); ++i) {
		const auto &series_case = cases_[i];
		if (series_case.size() != n_channels_) {
			throw std::invalid_argument("SeriesBatch: case " + std::to_string(i) + " has " +
			                            std::to_string(series_case.size()) + " channels, expected " +
			                            std::to_string(n_channels_) + ".");
		}
		const std::size_t length = series_case.front().size();
		if (length == 0) {
			throw std::invalid_argument("SeriesBatch: case " + std::to_string(i) + " is empty.");
		}
		for (const auto &channel : series_case) {
			if (channel.size() != length) {
				throw std::invalid_argument("SeriesBatch: channels of case " + std::to_string(i) +
				                            " differ in length.");
			}
		}
		min_timepoints_ = std::min(min_timepoints_, length);
		max_timepoints_ = std::max(max_timepoints_, length);
	}
}

std::size_t SeriesBatch::nTimepoints(std::size_t case_index) const {
	return at(case_index).front().size();
}

const SeriesBatch::Case &SeriesBatch::at(std::size_t case_index) const {
	if (case_index >= cases_.size()) {
		throw std::out_of_range("SeriesBatch: case index out of range.");
	}
	return cases_[case_index];
}

const SeriesBatch::Channel &SeriesBatch::channel(std::size_t case_index, std::size_t channel_index) const {
	const auto &series_case = at(case_index);
	if (channel_index >= series_case.size()) {
		throw std::out_of_range("SeriesBatch: channel index out of range.");
	}
	return series_case[channel_index];
}

SeriesBatch SeriesBatch::select(const std::vector<std::size_t> &case_indices) const {
	std::vector<Case> selected;
	selected.reserve(case_indices.size());
	for (auto index : case_indices) {
		selected.push_back(at(index));
	}
	return SeriesBatch(std::move(selected));
}

} // namespace tsregress::core
