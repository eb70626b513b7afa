#pragma once

#include <cstddef>
#include <memory>
#include <random>

#include "batchest/core/Estimator.hpp"

namespace batchest {

// x(k+1) = F x(k) + Gamma v(k),  z(k) = H x(k) + w(k),
// v ~ N(0, Q), w ~ N(0, R), x(0) ~ N(initialMean, initialCovariance).
struct LinearGaussianScenario_t {
  Matrix F;
  Matrix Gamma;
  Matrix H;
  Matrix Q;
  Matrix R;
  Vector initialMean;
  Matrix initialCovariance;
  std::size_t samples = 0;
  double samplePeriod = 1.0;
  double initialTime = 0.0;
  // When false the truth starts exactly at initialMean.
  bool sampleInitialState = true;
};

struct SimulatedRun_t {
  TimeHistory_t history;
  VectorList truth; // samples + 1 states, truth[0] at initialTime
};

// Zero-mean Gaussian draw with covariance `cov` (positive semi-definite).
Vector sampleGaussian(const Matrix& cov, std::mt19937& rng);

SimulatedRun_t simulateLinearGaussian(const LinearGaussianScenario_t& scenario, std::mt19937& rng);

// Discrete linear problem for `scenario` over `history`.
std::shared_ptr<BatchProblem_t> makeLinearProblem(const LinearGaussianScenario_t& scenario, TimeHistory_t history);

} // namespace batchest
