#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace regimear::core {

/**
 * @brief Raised for malformed model parameters (order, delay, thresholds, ...).
 *
 * Derives from std::invalid_argument so callers that only care about bad
 * input can catch the standard type.
 */
class ConfigurationError : public std::invalid_argument {
public:
	explicit ConfigurationError(const std::string &message) : std::invalid_argument(message) {
	}
};

/**
 * @brief Raised when a (delay, thresholds) candidate leaves a regime with
 *        fewer rows than the configured minimum.
 */
class InvalidRegimeError : public std::runtime_error {
public:
	InvalidRegimeError(int regime, std::size_t count, std::size_t required)
	    : std::runtime_error("Regime " + std::to_string(regime) + " has too few observations (" +
	                         std::to_string(count) + " < " + std::to_string(required) +
	                         "): threshold values may need to be adjusted"),
	      regime_(regime), count_(count), required_(required) {
	}

	int regime() const {
		return regime_;
	}
	std::size_t count() const {
		return count_;
	}
	std::size_t required() const {
		return required_;
	}

private:
	int regime_;
	std::size_t count_;
	std::size_t required_;
};

/// Singular or near-singular Gram matrix while scoring or fitting a partition.
class NumericDegeneracyError : public std::runtime_error {
public:
	explicit NumericDegeneracyError(const std::string &message) : std::runtime_error(message) {
	}
};

/// No admissible (delay, threshold) candidate exists for a search phase.
class HyperparameterSearchError : public std::runtime_error {
public:
	explicit HyperparameterSearchError(const std::string &message) : std::runtime_error(message) {
	}
};

} // namespace regimear::core
