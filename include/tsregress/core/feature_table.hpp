#pragma once

#include <Eigen/Dense>
#include <cstddef>
#include <stdexcept>
#include <utility>
#include <vector>

namespace tsregress::core {

/**
 * @class FeatureTable
 * @brief Derived numeric matrix handed to a base learner.
 *
 * Rows are cases, columns are one scalar per (interval, attribute) pair. The
 * table never holds non-finite values once produced by the feature extractor.
 */
class FeatureTable {
public:
	using Matrix = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

	FeatureTable() = default;

	FeatureTable(std::size_t rows, std::size_t cols)
	    : values_(Matrix::Zero(static_cast<Eigen::Index>(rows), static_cast<Eigen::Index>(cols))) {
	}

	explicit FeatureTable(Matrix values) : values_(std::move(values)) {
	}

	std::size_t rows() const noexcept {
		return static_cast<std::size_t>(values_.rows());
	}

	std::size_t cols() const noexcept {
		return static_cast<std::size_t>(values_.cols());
	}

	double operator()(std::size_t row, std::size_t col) const {
		return values_(static_cast<Eigen::Index>(row), static_cast<Eigen::Index>(col));
	}

	double &operator()(std::size_t row, std::size_t col) {
		return values_(static_cast<Eigen::Index>(row), static_cast<Eigen::Index>(col));
	}

	const Matrix &values() const noexcept {
		return values_;
	}

	Matrix &values() noexcept {
		return values_;
	}

	/// Copies the given rows, in order, into a new table.
	FeatureTable selectRows(const std::vector<std::size_t> &row_indices) const {
		Matrix selected(static_cast<Eigen::Index>(row_indices.size()), values_.cols());
		for (std::size_t i = 0; i < row_indices.size(); ++i) {
			if (row_indices[i] >= rows()) {
				throw std::out_of_range("FeatureTable: row index out of range.");
			}
			selected.row(static_cast<Eigen::Index>(i)) = values_.row(static_cast<Eigen::Index>(row_indices[i]));
		}
		return FeatureTable(std::move(selected));
	}

private:
	Matrix values_;
};

} // namespace tsregress::core
