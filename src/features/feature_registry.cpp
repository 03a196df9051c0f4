#include "tsregress/core/errors.hpp"
#include "tsregress/features/feature_calculators.hpp"
#include "tsregress/features/feature_math.hpp"
#include "tsregress/features/feature_types.hpp"
#include <algorithm>
#include <stdexcept>

namespace tsregress::features {

std::shared_ptr<const FeatureRegistry> FeatureRegistry::Canonical() {
	static const std::shared_ptr<const FeatureRegistry> registry = [] {
		auto instance = std::make_shared<FeatureRegistry>();
		RegisterCanonicalFeatures(*instance);
		return instance;
	}();
	return registry;
}

std::shared_ptr<const FeatureRegistry> FeatureRegistry::Catch22() {
	static const std::shared_ptr<const FeatureRegistry> registry = [] {
		auto instance = std::make_shared<FeatureRegistry>();
		RegisterCatch22Features(*instance);
		return instance;
	}();
	return registry;
}

void FeatureRegistry::Register(std::string name, FeatureCalculatorFn calculator) {
	if (name.empty()) {
		throw core::ConfigurationError("FeatureRegistry: attribute name must not be empty.");
	}
	if (!calculator) {
		throw core::ConfigurationError("FeatureRegistry: attribute '" + name + "' has no calculator.");
	}
	if (Find(name)) {
		throw core::ConfigurationError("FeatureRegistry: attribute '" + name + "' is already registered.");
	}
	features_.push_back(FeatureDefinition {std::move(name), std::move(calculator)});
}

const FeatureDefinition *FeatureRegistry::Find(std::string_view name) const {
	auto it = std::find_if(features_.begin(), features_.end(),
	                       [&](const FeatureDefinition &definition) { return definition.name == name; });
	return it == features_.end() ? nullptr : &*it;
}

std::optional<std::size_t> FeatureRegistry::IndexOf(std::string_view name) const {
	for (std::size_t i = 0; i < features_.size(); ++i) {
		if (features_[i].name == name) {
			return i;
		}
	}
	return std::nullopt;
}

const FeatureDefinition &FeatureRegistry::At(std::size_t index) const {
	if (index >= features_.size()) {
		throw std::out_of_range("FeatureRegistry: attribute index out of range.");
	}
	return features_[index];
}

std::vector<std::string> FeatureRegistry::Names() const {
	std::vector<std::string> names;
	names.reserve(features_.size());
	for (const auto &definition : features_) {
		names.push_back(definition.name);
	}
	return names;
}

double FeatureRegistry::Compute(std::size_t index, const Series &series, FeatureCache &cache) const {
	return At(index).calculator(series, cache);
}

std::vector<double> FeatureRegistry::ComputeAll(const Series &series) const {
	FeatureCache cache(series);
	std::vector<double> values;
	values.reserve(features_.size());
	for (const auto &definition : features_) {
		values.push_back(definition.calculator(series, cache));
	}
	return values;
}

} // namespace tsregress::features
