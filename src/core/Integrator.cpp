#include "batchest/core/Integrator.hpp"

#include <string>
#include <utility>

#include "batchest/core/Errors.hpp"

namespace batchest {

namespace {

// Augmented RK4 state: x with its sensitivities.
struct Augmented_t {
  Vector x;
  Matrix phi;
  Matrix gamma;
};

Augmented_t axpy(const Augmented_t& base, double h, const Augmented_t& slope, bool withSensitivities) {
  Augmented_t out;
  out.x = base.x + h * slope.x;
  if (withSensitivities) {
    out.phi = base.phi + h * slope.phi;
    out.gamma = base.gamma + h * slope.gamma;
  }
  return out;
}

Augmented_t evaluate(const ContinuousDynamics_t& dynamics,
                     double t,
                     const Augmented_t& y,
                     const Vector& u,
                     const Vector& v,
                     bool withSensitivities) {
  const ContinuousDerivative_t d = dynamics(t, y.x, u, v, withSensitivities);
  if (d.derivative.size() != y.x.size()) {
    throw ConfigurationError("discretizeRk4: derivative has size " + std::to_string(d.derivative.size()) +
                             ", expected " + std::to_string(y.x.size()));
  }
  Augmented_t slope;
  slope.x = d.derivative;
  if (withSensitivities) {
    if (d.A.rows() != y.x.size() || d.A.cols() != y.x.size() || d.D.rows() != y.x.size() ||
        d.D.cols() != v.size()) {
      throw ConfigurationError("discretizeRk4: dynamics Jacobians A/D have inconsistent dimensions");
    }
    slope.phi = d.A * y.phi;
    slope.gamma = d.A * y.gamma + d.D;
  }
  return slope;
}

} // namespace

DiscreteTransition_t discretizeRk4(const ContinuousDynamics_t& dynamics,
                                   const Vector& x,
                                   const Vector& u,
                                   const Vector& v,
                                   double t0,
                                   double t1,
                                   int substeps,
                                   bool withSensitivities) {
  if (!dynamics) {
    throw ConfigurationError("discretizeRk4: continuous dynamics callable is not set");
  }
  if (substeps <= 0) {
    throw ConfigurationError("discretizeRk4: substeps must be positive");
  }

  const int nx = static_cast<int>(x.size());
  const int nv = static_cast<int>(v.size());
  Augmented_t y;
  y.x = x;
  if (withSensitivities) {
    y.phi = Matrix::Identity(nx, nx);
    y.gamma = Matrix::Zero(nx, nv);
  }

  const double h = (t1 - t0) / substeps;
  double t = t0;
  for (int i = 0; i < substeps; ++i) {
    const Augmented_t k1 = evaluate(dynamics, t, y, u, v, withSensitivities);
    const Augmented_t k2 = evaluate(dynamics, t + 0.5 * h, axpy(y, 0.5 * h, k1, withSensitivities), u, v, withSensitivities);
    const Augmented_t k3 = evaluate(dynamics, t + 0.5 * h, axpy(y, 0.5 * h, k2, withSensitivities), u, v, withSensitivities);
    const Augmented_t k4 = evaluate(dynamics, t + h, axpy(y, h, k3, withSensitivities), u, v, withSensitivities);

    y.x += (h / 6.0) * (k1.x + 2.0 * k2.x + 2.0 * k3.x + k4.x);
    if (withSensitivities) {
      y.phi += (h / 6.0) * (k1.phi + 2.0 * k2.phi + 2.0 * k3.phi + k4.phi);
      y.gamma += (h / 6.0) * (k1.gamma + 2.0 * k2.gamma + 2.0 * k3.gamma + k4.gamma);
    }
    t = t0 + (i + 1) * h;
  }

  DiscreteTransition_t out;
  out.state = std::move(y.x);
  if (withSensitivities) {
    out.F = std::move(y.phi);
    out.Gamma = std::move(y.gamma);
  }
  return out;
}

} // namespace batchest
