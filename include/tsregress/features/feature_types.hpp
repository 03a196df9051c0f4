#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tsregress::features {

using Series = std::vector<double>;

struct FeatureCache;

/// A pure attribute: maps one interval slice to a single scalar.
using FeatureCalculatorFn = std::function<double(const Series &, FeatureCache &)>;

struct FeatureDefinition {
	std::string name;
	FeatureCalculatorFn calculator;
};

/**
 * @class FeatureRegistry
 * @brief Explicit, ordered table of named interval attributes.
 *
 * Registration order is the identity of an attribute: forests store attribute
 * selections as indices into this table, so a registry must not be modified
 * once a forest has been fitted with it.
 */
class FeatureRegistry {
public:
	FeatureRegistry() = default;

	/// The canonical interval battery: catch22 followed by mean, std and slope.
	static std::shared_ptr<const FeatureRegistry> Canonical();

	/// The 22 catch22 descriptors only.
	static std::shared_ptr<const FeatureRegistry> Catch22();

	/**
	 * @brief Appends a named attribute.
	 * @throws core::ConfigurationError If the name is empty or taken, or the function is empty.
	 */
	void Register(std::string name, FeatureCalculatorFn calculator);

	const FeatureDefinition *Find(std::string_view name) const;
	std::optional<std::size_t> IndexOf(std::string_view name) const;

	const FeatureDefinition &At(std::size_t index) const;

	std::size_t Size() const {
		return features_.size();
	}

	std::vector<std::string> Names() const;

	/// Evaluates a single attribute on a slice, sharing derived values through @p cache.
	double Compute(std::size_t index, const Series &series, FeatureCache &cache) const;

	/// Evaluates every registered attribute on a slice, in registration order.
	std::vector<double> ComputeAll(const Series &series) const;

private:
	std::vector<FeatureDefinition> features_;
};

} // namespace tsregress::features
