#pragma once

#include <cstddef>

#include "batchest/core/Types.hpp"

namespace batchest {

// Running innovation-statistic summary for filter consistency checks.
// A correctly specified linear-Gaussian filter yields statistics that are
// chi-square distributed with nz degrees of freedom (mean nz).
class InnovationMetrics {
public:
  explicit InnovationMetrics(double bound = 0.0) : boundValue(bound) {}

  void update(double statistic);
  // Adds every finite entry of an innovation history; NaN slots are skipped.
  void update(const Vector& history);

  std::size_t count() const { return sampleCount; }
  double last() const { return lastValue; }
  double bound() const { return boundValue; }
  double mean() const;
  // Fraction of samples at or below bound().
  double fractionWithinBound() const;

private:
  double boundValue = 0.0;
  double sum = 0.0;
  double lastValue = 0.0;
  std::size_t withinBound = 0;
  std::size_t sampleCount = 0;
};

} // namespace batchest
