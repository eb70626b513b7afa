#include "batchest/core/Models.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

#include "batchest/core/Errors.hpp"

namespace batchest {

namespace {

std::string toLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

void checkControlInput(const Matrix& B, const Vector& u, const char* who) {
  if (B.size() > 0 && B.cols() != u.size()) {
    throw ConfigurationError(std::string(who) + ": control size " + std::to_string(u.size()) +
                             " does not match B with " + std::to_string(B.cols()) + " columns");
  }
}

} // namespace

TimingMode_e parseTimingMode(const std::string& value) {
  const std::string lowered = toLower(value);
  if (lowered == "cd" || lowered == "continuous") {
    return TimingMode_e::kContinuousDynamics;
  }
  if (lowered == "dd" || lowered == "discrete") {
    return TimingMode_e::kDiscrete;
  }
  throw ConfigurationError("Incorrect flag for the dynamics-measurement models: '" + value + "'");
}

const char* toString(TimingMode_e timing) {
  switch (timing) {
    case TimingMode_e::kContinuousDynamics:
      return "CD";
    case TimingMode_e::kDiscrete:
      return "DD";
  }
  return "unknown";
}

DiscreteDynamics_t makeLinearDiscreteDynamics(const Matrix& F, const Matrix& Gamma, const Matrix& B) {
  if (F.rows() != F.cols() || Gamma.rows() != F.rows() || (B.size() > 0 && B.rows() != F.rows())) {
    throw ConfigurationError("makeLinearDiscreteDynamics: inconsistent F/Gamma/B dimensions");
  }
  return [F, Gamma, B](const Vector& x, const Vector& u, const Vector& v, std::size_t /*k*/) {
    checkControlInput(B, u, "makeLinearDiscreteDynamics");
    DiscreteTransition_t out;
    out.state = F * x + Gamma * v;
    if (B.size() > 0) {
      out.state += B * u;
    }
    out.F = F;
    out.Gamma = Gamma;
    return out;
  };
}

ContinuousDynamics_t makeLinearContinuousDynamics(const Matrix& A, const Matrix& D, const Matrix& B) {
  if (A.rows() != A.cols() || D.rows() != A.rows() || (B.size() > 0 && B.rows() != A.rows())) {
    throw ConfigurationError("makeLinearContinuousDynamics: inconsistent A/D/B dimensions");
  }
  return [A, D, B](double /*t*/, const Vector& x, const Vector& u, const Vector& v, bool withJacobians) {
    checkControlInput(B, u, "makeLinearContinuousDynamics");
    ContinuousDerivative_t out;
    out.derivative = A * x + D * v;
    if (B.size() > 0) {
      out.derivative += B * u;
    }
    if (withJacobians) {
      out.A = A;
      out.D = D;
    }
    return out;
  };
}

MeasurementModel_t makeLinearMeasurement(const Matrix& H) {
  return [H](const Vector& x, std::size_t /*k*/) {
    return MeasurementPrediction_t{H * x, H};
  };
}

DynamicsModel_t makeDiscreteModel(DiscreteDynamics_t dynamics) {
  DynamicsModel_t model;
  model.timing = TimingMode_e::kDiscrete;
  model.discrete = std::move(dynamics);
  return model;
}

DynamicsModel_t makeContinuousModel(ContinuousDynamics_t dynamics) {
  DynamicsModel_t model;
  model.timing = TimingMode_e::kContinuousDynamics;
  model.continuous = std::move(dynamics);
  return model;
}

} // namespace batchest
