#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "batchest/core/Models.hpp"
#include "batchest/core/Types.hpp"

namespace batchest {

// Smallest accepted number of RK4 substeps per sample interval.
constexpr int kMinIntegrationSubsteps = 5;

// Recorded (or simulated) data. Entry j of `times` and `measurements` belongs
// to sample j + 1; entry j of `controls` acts over the interval from sample j
// to sample j + 1. Sample 0 sits at `initialTime`. `controls` may be left empty
// when the model takes no control input.
struct TimeHistory_t {
  double initialTime = 0.0;
  std::vector<double> times;
  VectorList controls;
  VectorList measurements;

  std::size_t sampleCount() const { return measurements.size(); }
};

// Everything a batch run consumes. Shared read-only between runs.
struct BatchProblem_t {
  DynamicsModel_t dynamics;
  MeasurementModel_t measurement;
  Vector initialMean;
  Matrix initialCovariance;
  TimeHistory_t history;
  Matrix processNoise;     // Q, nv x nv
  Matrix measurementNoise; // R, nz x nz
};

// Recognized estimator options.
struct EstimatorOptions_t {
  // RK4 substeps per sample interval, used only for continuous dynamics.
  // Unset selects the estimator default (LKF 10, ESRIF 20). Must be >= 5.
  std::optional<int> integrationSubsteps;
  // Sample at which the initial mean and covariance apply. 0 starts from
  // scratch; k0 > 0 warm-starts from sample k0 at time times[k0 - 1].
  std::size_t startIndex = 0;
};

struct Dimensions_t {
  int nx = 0;
  int nv = 0;
  int nz = 0;
  int nu = 0;
  std::size_t kmax = 0;
};

// Mean and covariance at one sample.
struct StateSnapshot_t {
  Vector mean;
  Matrix covariance;
};

template <typename State>
struct UpdateResult_t {
  State state;
  double innovationStatistic = 0.0;
};

// Checks shapes, callables and history alignment. Throws ConfigurationError.
Dimensions_t validateProblem(const BatchProblem_t& problem, const EstimatorOptions_t& options);

// Substep count after applying the default. Throws ConfigurationError below
// kMinIntegrationSubsteps.
int resolveIntegrationSubsteps(const EstimatorOptions_t& options, int defaultSubsteps);

// Control acting over k -> k + 1 (empty vector when the problem has none).
Vector controlAt(const BatchProblem_t& problem, std::size_t k);

// Time of sample k.
double sampleTime(const TimeHistory_t& history, std::size_t k);

// a-priori state and the sensitivities F, Gamma for k -> k + 1, from the RK4
// integrator (continuous dynamics) or the discrete model directly. Model output
// shapes are checked against `dims`.
DiscreteTransition_t propagateDynamics(const BatchProblem_t& problem,
                                       const Dimensions_t& dims,
                                       const Vector& xk,
                                       std::size_t k,
                                       double tk,
                                       double tkp1,
                                       int substeps);

// Predicted measurement and H at sample k, shape-checked against `dims`.
MeasurementPrediction_t predictMeasurement(const BatchProblem_t& problem,
                                           const Dimensions_t& dims,
                                           const Vector& x,
                                           std::size_t k);

} // namespace batchest
