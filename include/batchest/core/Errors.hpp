#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace batchest {

// Malformed construction arguments or options. Never retried.
class ConfigurationError : public std::runtime_error {
public:
  explicit ConfigurationError(const std::string& message) : std::runtime_error(message) {}
};

// Fatal numerical failure (non-PD covariance, singular Jacobian or factor)
// at a given sample. Aborts the run.
class NumericalPreconditionError : public std::runtime_error {
public:
  NumericalPreconditionError(std::size_t sampleIndex, const std::string& message)
      : std::runtime_error(message + " (sample " + std::to_string(sampleIndex) + ")"),
        sample(sampleIndex) {}

  std::size_t sampleIndex() const { return sample; }

private:
  std::size_t sample = 0;
};

// Thrown by user model callables. The library never catches it.
class ModelEvaluationError : public std::runtime_error {
public:
  explicit ModelEvaluationError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace batchest
