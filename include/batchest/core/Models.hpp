#pragma once

#include <cstddef>
#include <functional>
#include <string>

#include "batchest/core/Types.hpp"

namespace batchest {

// How the dynamics relate to the sampled measurements.
enum class TimingMode_e {
  kContinuousDynamics, // "CD": continuous dynamics, discrete measurements
  kDiscrete            // "DD": fully discrete
};

// Continuous dynamics evaluated at (t, x, u, v).
// derivative = f(t, x, u, v); A = df/dx and D = df/dv are filled only when
// requested by the caller.
struct ContinuousDerivative_t {
  Vector derivative;
  Matrix A;
  Matrix D;
};

// Result of a discrete transition, or of discretizing continuous dynamics over
// one sample interval.
struct DiscreteTransition_t {
  Vector state;
  Matrix F;
  Matrix Gamma;
};

// Predicted measurement and its Jacobian.
struct MeasurementPrediction_t {
  Vector z;
  Matrix H;
};

using ContinuousDynamics_t =
    std::function<ContinuousDerivative_t(double t, const Vector& x, const Vector& u, const Vector& v, bool withJacobians)>;
using DiscreteDynamics_t =
    std::function<DiscreteTransition_t(const Vector& x, const Vector& u, const Vector& v, std::size_t k)>;
using MeasurementModel_t = std::function<MeasurementPrediction_t(const Vector& x, std::size_t k)>;

// Dynamics handle. Only the callable matching `timing` is used.
struct DynamicsModel_t {
  TimingMode_e timing = TimingMode_e::kDiscrete;
  ContinuousDynamics_t continuous;
  DiscreteDynamics_t discrete;
};

// Accepts "CD"/"DD" (any case) and the long names "continuous"/"discrete".
TimingMode_e parseTimingMode(const std::string& value);
const char* toString(TimingMode_e timing);

// x(k+1) = F x(k) + B u(k) + Gamma v(k). An empty B ignores the control.
DiscreteDynamics_t makeLinearDiscreteDynamics(const Matrix& F, const Matrix& Gamma, const Matrix& B = Matrix());

// xdot = A x + B u + D v. An empty B ignores the control.
ContinuousDynamics_t makeLinearContinuousDynamics(const Matrix& A, const Matrix& D, const Matrix& B = Matrix());

// z = H x.
MeasurementModel_t makeLinearMeasurement(const Matrix& H);

DynamicsModel_t makeDiscreteModel(DiscreteDynamics_t dynamics);
DynamicsModel_t makeContinuousModel(ContinuousDynamics_t dynamics);

} // namespace batchest
