#pragma once
// EvaluationErrors.hpp
// Exceptions raised while building or evaluating a single configuration.
// The permutation driver catches these per configuration and records a failed row.

#include <stdexcept>
#include <string>

class EvaluationError : public std::runtime_error {
public:
    explicit EvaluationError(const std::string& message) : std::runtime_error(message) {}
};

// A weight profile with a negative coefficient
class InvalidProfile : public EvaluationError {
public:
    explicit InvalidProfile(const std::string& message) : EvaluationError("InvalidProfile: " + message) {}
};

// Unknown weighting scheme or similarity tag
class InvalidConfiguration : public EvaluationError {
public:
    explicit InvalidConfiguration(const std::string& message) : EvaluationError("InvalidConfiguration: " + message) {}
};

// Malformed sweep settings file
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};
