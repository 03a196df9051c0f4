#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace tsregress::core {

/**
 * @class ConfigurationError
 * @brief Raised when forest parameters resolve to invalid bounds.
 *
 * Configuration is validated eagerly, before any interval is sampled, so this
 * error never surfaces from inside a member build.
 */
class ConfigurationError : public std::invalid_argument {
public:
	explicit ConfigurationError(const std::string &message) : std::invalid_argument(message) {
	}
};

/**
 * @class ShapeMismatchError
 * @brief Raised when predict-time input does not match the fitted geometry.
 */
class ShapeMismatchError : public std::invalid_argument {
public:
	explicit ShapeMismatchError(const std::string &message) : std::invalid_argument(message) {
	}
};

/**
 * @class MemberBuildError
 * @brief Raised when an ensemble member cannot be fitted after its retry.
 */
class MemberBuildError : public std::runtime_error {
public:
	MemberBuildError(const std::string &message, std::size_t member_index, std::size_t attempts)
	    : std::runtime_error(message), member_index_(member_index), attempts_(attempts) {
	}

	std::size_t memberIndex() const noexcept {
		return member_index_;
	}

	std::size_t attempts() const noexcept {
		return attempts_;
	}

private:
	std::size_t member_index_;
	std::size_t attempts_;
};

} // namespace tsregress::core
