#include "tsregress/forest/forest_config.hpp"
#include "tsregress/core/errors.hpp"
#include "tsregress/learners/regression_tree.hpp"
#include <cmath>
#include <limits>

namespace tsregress::forest {

namespace {

template <typename T>
const T &PerRepresentation(const std::vector<T> &values, std::size_t representation, const char *name) {
	if (values.size() == 1) {
		return values.front();
	}
	if (representation >= values.size()) {
		throw core::ConfigurationError(std::string(name) + " has no entry for representation " +
		                               std::to_string(representation) + ".");
	}
	return values[representation];
}

template <typename T>
void ValidatePerRepresentation(const std::vector<T> &values, std::size_t n_representations, const char *name) {
	if (values.empty()) {
		throw core::ConfigurationError(std::string(name) + " must not be empty.");
	}
	if (values.size() != 1 && values.size() != n_representations) {
		throw core::ConfigurationError(std::string(name) + " has " + std::to_string(values.size()) +
		                               " entries for " + std::to_string(n_representations) +
		                               " series representations.");
	}
}

std::string Describe(const OptionValue &value) {
	switch (value.index()) {
	case 0:
		return "None";
	case 1:
		return "an integer";
	case 2:
		return "a double";
	case 3:
		return "a string";
	case 4:
		return "a list";
	default:
		return "a list of lists";
	}
}

[[noreturn]] void BadOption(const std::string &key, const OptionValue &value, const std::string &expected) {
	throw core::ConfigurationError("Option '" + key + "' expects " + expected + ", got " + Describe(value) + ".");
}

std::int64_t GetInteger(const std::string &key, const OptionValue &value) {
	if (const auto *integer = std::get_if<std::int64_t>(&value)) {
		return *integer;
	}
	BadOption(key, value, "an integer");
}

std::size_t GetCount(const std::string &key, const OptionValue &value, std::int64_t minimum) {
	const auto integer = GetInteger(key, value);
	if (integer < minimum) {
		throw core::ConfigurationError("Option '" + key + "' must be at least " + std::to_string(minimum) + ".");
	}
	return static_cast<std::size_t>(integer);
}

double GetNumber(const std::string &key, const OptionValue &value) {
	if (const auto *real = std::get_if<double>(&value)) {
		return *real;
	}
	if (const auto *integer = std::get_if<std::int64_t>(&value)) {
		return static_cast<double>(*integer);
	}
	BadOption(key, value, "a number");
}

OptionList AsList(const OptionValue &value) {
	if (const auto *list = std::get_if<OptionList>(&value)) {
		return *list;
	}
	if (const auto *integer = std::get_if<std::int64_t>(&value)) {
		return {*integer};
	}
	if (const auto *real = std::get_if<double>(&value)) {
		return {*real};
	}
	if (const auto *text = std::get_if<std::string>(&value)) {
		return {*text};
	}
	return {};
}

interval::IntervalCount ParseIntervalCount(const std::string &key, const OptionValue &value) {
	std::vector<interval::IntervalCount::Term> terms;
	if (std::holds_alternative<std::vector<OptionList>>(value)) {
		BadOption(key, value, "an integer, \"sqrt\", \"sqrt-div\" or a list of those");
	}
	for (const auto &scalar : AsList(value)) {
		if (const auto *integer = std::get_if<std::int64_t>(&scalar)) {
			if (*integer < 0) {
				throw core::ConfigurationError("Option '" + key + "' must not be negative.");
			}
			terms.emplace_back(static_cast<std::size_t>(*integer));
		} else if (const auto *text = std::get_if<std::string>(&scalar); text && *text == "sqrt") {
			terms.emplace_back(interval::IntervalCountRule::Sqrt);
		} else if (text && *text == "sqrt-div") {
			terms.emplace_back(interval::IntervalCountRule::SqrtDiv);
		} else {
			BadOption(key, value, "an integer, \"sqrt\", \"sqrt-div\" or a list of those");
		}
	}
	if (terms.empty()) {
		BadOption(key, value, "an integer, \"sqrt\", \"sqrt-div\" or a list of those");
	}
	return interval::IntervalCount(std::move(terms));
}

std::vector<interval::IntervalCount> ParseIntervalCounts(const std::string &key, const OptionValue &value) {
	const auto *per_representation = std::get_if<std::vector<OptionList>>(&value);
	if (!per_representation) {
		return {ParseIntervalCount(key, value)};
	}
	std::vector<interval::IntervalCount> counts;
	for (const auto &list : *per_representation) {
		counts.push_back(ParseIntervalCount(key, list));
	}
	if (counts.empty()) {
		BadOption(key, value, "at least one count per representation");
	}
	return counts;
}

interval::LengthBound ParseLengthBound(const std::string &key, const OptionScalar &scalar) {
	if (const auto *integer = std::get_if<std::int64_t>(&scalar)) {
		if (*integer < 0) {
			throw core::ConfigurationError("Option '" + key + "' must not be negative.");
		}
		return interval::LengthBound::Absolute(static_cast<std::size_t>(*integer));
	}
	if (const auto *real = std::get_if<double>(&scalar)) {
		if (std::isinf(*real) && *real > 0) {
			return interval::LengthBound::Unbounded();
		}
		return interval::LengthBound::Proportion(*real);
	}
	if (std::get<std::string>(scalar) == "inf") {
		return interval::LengthBound::Unbounded();
	}
	throw core::ConfigurationError("Option '" + key + "' expects an integer, a proportion or \"inf\".");
}

std::vector<interval::LengthBound> ParseLengthBounds(const std::string &key, const OptionValue &value) {
	if (std::holds_alternative<std::monostate>(value)) {
		BadOption(key, value, "a length");
	}
	std::vector<interval::LengthBound> bounds;
	for (const auto &scalar : AsList(value)) {
		bounds.push_back(ParseLengthBound(key, scalar));
	}
	if (bounds.empty()) {
		BadOption(key, value, "a length or a list of lengths");
	}
	return bounds;
}

interval::AttributeSubsample ParseAttributeSubsample(const std::string &key, const OptionScalar &scalar) {
	if (const auto *integer = std::get_if<std::int64_t>(&scalar)) {
		if (*integer <= 0) {
			throw core::ConfigurationError("Option '" + key + "' must be positive.");
		}
		return interval::AttributeSubsample::Count(static_cast<std::size_t>(*integer));
	}
	if (const auto *real = std::get_if<double>(&scalar)) {
		return interval::AttributeSubsample::Proportion(*real);
	}
	throw core::ConfigurationError("Option '" + key + "' expects an integer, a proportion or None.");
}

std::vector<interval::AttributeSubsample> ParseAttributeSubsamples(const std::string &key, const OptionValue &value) {
	if (std::holds_alternative<std::monostate>(value)) {
		return {interval::AttributeSubsample::All()};
	}
	if (std::holds_alternative<std::vector<OptionList>>(value)) {
		BadOption(key, value, "an integer, a proportion, None or a list of those");
	}
	std::vector<interval::AttributeSubsample> subsamples;
	for (const auto &scalar : AsList(value)) {
		subsamples.push_back(ParseAttributeSubsample(key, scalar));
	}
	return subsamples;
}

} // namespace

void ForestConfig::validate() const {
	if (n_estimators == 0) {
		throw core::ConfigurationError("n_estimators must be at least 1.");
	}
	if (contract_max_n_estimators == 0) {
		throw core::ConfigurationError("contract_max_n_estimators must be at least 1.");
	}
	if (time_limit && time_limit->count() < 0) {
		throw core::ConfigurationError("time_limit must not be negative.");
	}
	if (n_jobs == 0 || n_jobs < -1) {
		throw core::ConfigurationError("n_jobs must be positive or -1.");
	}
	if (!std::isfinite(replace_nan)) {
		throw core::ConfigurationError("replace_nan must be a finite number.");
	}
	if (series_transformers.empty()) {
		throw core::ConfigurationError("At least one series transformer is required.");
	}
	for (const auto &transformer : series_transformers) {
		if (!transformer) {
			throw core::ConfigurationError("series_transformers must not contain null entries.");
		}
	}

	const auto n_reps = nRepresentations();
	ValidatePerRepresentation(n_intervals, n_reps, "n_intervals");
	ValidatePerRepresentation(min_interval_length, n_reps, "min_interval_length");
	ValidatePerRepresentation(max_interval_length, n_reps, "max_interval_length");
	ValidatePerRepresentation(att_subsample_size, n_reps, "att_subsample_size");

	for (const auto &count : n_intervals) {
		if (count.terms().empty()) {
			throw core::ConfigurationError("n_intervals entries need at least one term.");
		}
	}

	// Bounds given in the same unit can be compared without the data.
	for (std::size_t rep = 0; rep < n_reps; ++rep) {
		const auto &min_length = minLengthFor(rep);
		const auto &max_length = maxLengthFor(rep);
		if (!min_length.isUnbounded() && !max_length.isUnbounded() &&
		    min_length.isProportion() == max_length.isProportion()) {
			const std::size_t reference = 1000000;
			if (min_length.resolve(reference) > max_length.resolve(reference)) {
				throw core::ConfigurationError("min_interval_length " + min_length.toString() +
				                               " exceeds max_interval_length " + max_length.toString() + ".");
			}
		}
		if (min_length.isUnbounded()) {
			throw core::ConfigurationError("min_interval_length must be bounded.");
		}
	}

	const auto registry = attributeRegistry();
	for (std::size_t rep = 0; rep < n_reps; ++rep) {
		attSubsampleFor(rep).resolve(registry->Size());
	}
}

const interval::IntervalCount &ForestConfig::intervalsFor(std::size_t representation) const {
	return PerRepresentation(n_intervals, representation, "n_intervals");
}

const interval::LengthBound &ForestConfig::minLengthFor(std::size_t representation) const {
	return PerRepresentation(min_interval_length, representation, "min_interval_length");
}

const interval::LengthBound &ForestConfig::maxLengthFor(std::size_t representation) const {
	return PerRepresentation(max_interval_length, representation, "max_interval_length");
}

const interval::AttributeSubsample &ForestConfig::attSubsampleFor(std::size_t representation) const {
	return PerRepresentation(att_subsample_size, representation, "att_subsample_size");
}

std::shared_ptr<const features::FeatureRegistry> ForestConfig::attributeRegistry() const {
	return attributes ? attributes : features::FeatureRegistry::Canonical();
}

learners::RegressorPtr ForestConfig::baseLearner() const {
	if (base_learner) {
		return base_learner;
	}
	return learners::RegressorPtr(learners::RegressionTreeBuilder().build());
}

ForestConfig configFromOptions(const OptionMap &options, ForestConfig base) {
	ForestConfig config = std::move(base);
	for (const auto &[key, value] : options) {
		if (key == "n_estimators") {
			config.n_estimators = GetCount(key, value, 1);
		} else if (key == "n_intervals") {
			config.n_intervals = ParseIntervalCounts(key, value);
		} else if (key == "min_interval_length") {
			config.min_interval_length = ParseLengthBounds(key, value);
		} else if (key == "max_interval_length") {
			config.max_interval_length = ParseLengthBounds(key, value);
		} else if (key == "att_subsample_size") {
			config.att_subsample_size = ParseAttributeSubsamples(key, value);
		} else if (key == "time_limit") {
			if (std::holds_alternative<std::monostate>(value)) {
				config.time_limit.reset();
				continue;
			}
			const double seconds = GetNumber(key, value);
			if (!std::isfinite(seconds) || seconds < 0) {
				throw core::ConfigurationError("Option 'time_limit' must be a non-negative number of seconds.");
			}
			config.time_limit = std::chrono::milliseconds(static_cast<std::int64_t>(std::llround(seconds * 1000.0)));
		} else if (key == "contract_max_n_estimators") {
			config.contract_max_n_estimators = GetCount(key, value, 1);
		} else if (key == "random_seed") {
			if (std::holds_alternative<std::monostate>(value)) {
				config.random_seed.reset();
				continue;
			}
			const auto seed = GetInteger(key, value);
			if (seed < 0 || seed > std::numeric_limits<std::uint32_t>::max()) {
				throw core::ConfigurationError("Option 'random_seed' must fit in 32 unsigned bits.");
			}
			config.random_seed = static_cast<std::uint32_t>(seed);
		} else if (key == "n_jobs") {
			const auto jobs = GetInteger(key, value);
			if (jobs == 0 || jobs < -1 || jobs > std::numeric_limits<int>::max()) {
				throw core::ConfigurationError("Option 'n_jobs' must be positive or -1.");
			}
			config.n_jobs = static_cast<int>(jobs);
		} else if (key == "replace_nan") {
			config.replace_nan = GetNumber(key, value);
		} else if (key == "max_extra_members") {
			config.max_extra_members = GetCount(key, value, 0);
		} else {
			throw core::ConfigurationError("Unknown option '" + key + "'.");
		}
	}
	config.validate();
	return config;
}

} // namespace tsregress::forest
