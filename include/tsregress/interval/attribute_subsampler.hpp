#pragma once

#include "tsregress/features/feature_types.hpp"
#include <cstddef>
#include <random>
#include <string>
#include <variant>
#include <vector>

namespace tsregress::interval {

/// Indices into a FeatureRegistry, in column order.
using AttributeSelection = std::vector<std::size_t>;

/**
 * @class AttributeSubsample
 * @brief How many attributes a member draws: all, a count, or a proportion.
 */
class AttributeSubsample {
public:
	AttributeSubsample() = default;

	AttributeSubsample(std::size_t count) : value_(count) {
	}

	/// @throws core::ConfigurationError If @p count is not positive.
	AttributeSubsample(int count);

	AttributeSubsample(double) = delete;

	static AttributeSubsample All() {
		return AttributeSubsample();
	}

	static AttributeSubsample Count(std::size_t count) {
		return AttributeSubsample(count);
	}

	/// @throws core::ConfigurationError If @p proportion is not in (0, 1].
	static AttributeSubsample Proportion(double proportion);

	bool isAll() const {
		return std::holds_alternative<std::monostate>(value_);
	}

	/**
	 * @brief Number of attributes drawn from a set of @p n_available.
	 * @throws core::ConfigurationError If the request exceeds the set or resolves to zero.
	 */
	std::size_t resolve(std::size_t n_available) const;

	std::string toString() const;

private:
	std::variant<std::monostate, std::size_t, double> value_;
};

/**
 * @class AttributeSubsampler
 * @brief Draws a member's attribute selection without replacement.
 *
 * With AttributeSubsample::All the full registry is returned in registration
 * order and the generator is left untouched. Otherwise the registry indices are
 * shuffled and the first k are kept, in their shuffled order.
 */
class AttributeSubsampler {
public:
	/// @throws core::ConfigurationError If @p subsample cannot be satisfied by the registry.
	AttributeSubsampler(const features::FeatureRegistry &registry, AttributeSubsample subsample);

	std::size_t selectionSize() const {
		return selection_size_;
	}

	AttributeSelection subsample(std::mt19937 &rng) const;

private:
	std::size_t n_available_;
	std::size_t selection_size_;
	bool take_all_;
};

} // namespace tsregress::interval
