#include "batchest/core/InnovationMetrics.hpp"

#include <cmath>

namespace batchest {

void InnovationMetrics::update(double statistic) {
  lastValue = statistic;
  sum += statistic;
  if (statistic <= boundValue) {
    ++withinBound;
  }
  ++sampleCount;
}

void InnovationMetrics::update(const Vector& history) {
  for (Eigen::Index i = 0; i < history.size(); ++i) {
    if (std::isfinite(history(i))) {
      update(history(i));
    }
  }
}

double InnovationMetrics::mean() const {
  if (sampleCount == 0) {
    return 0.0;
  }
  return sum / static_cast<double>(sampleCount);
}

double InnovationMetrics::fractionWithinBound() const {
  if (sampleCount == 0) {
    return 0.0;
  }
  return static_cast<double>(withinBound) / static_cast<double>(sampleCount);
}

} // namespace batchest
