#include "batchest/core/Estimator.hpp"

#include <string>

#include "batchest/core/Errors.hpp"
#include "batchest/core/Integrator.hpp"

namespace batchest {

namespace {

std::string shape(const Matrix& m) {
  return std::to_string(m.rows()) + "x" + std::to_string(m.cols());
}

} // namespace

Dimensions_t validateProblem(const BatchProblem_t& problem, const EstimatorOptions_t& options) {
  Dimensions_t dims;
  const TimeHistory_t& history = problem.history;

  switch (problem.dynamics.timing) {
    case TimingMode_e::kContinuousDynamics:
      if (!problem.dynamics.continuous) {
        throw ConfigurationError("continuous dynamics (CD) selected but no continuous model is set");
      }
      break;
    case TimingMode_e::kDiscrete:
      if (!problem.dynamics.discrete) {
        throw ConfigurationError("discrete dynamics (DD) selected but no discrete model is set");
      }
      break;
    default:
      throw ConfigurationError("Incorrect flag for the dynamics-measurement models");
  }
  if (!problem.measurement) {
    throw ConfigurationError("measurement model is not set");
  }

  dims.nx = static_cast<int>(problem.initialMean.size());
  if (dims.nx == 0) {
    throw ConfigurationError("initial mean is empty");
  }
  if (problem.initialCovariance.rows() != dims.nx || problem.initialCovariance.cols() != dims.nx) {
    throw ConfigurationError("initial covariance is " + shape(problem.initialCovariance) + ", expected " +
                             std::to_string(dims.nx) + "x" + std::to_string(dims.nx));
  }
  if (problem.processNoise.rows() != problem.processNoise.cols()) {
    throw ConfigurationError("process noise covariance must be square, got " + shape(problem.processNoise));
  }
  dims.nv = static_cast<int>(problem.processNoise.rows());

  dims.kmax = history.sampleCount();
  if (history.times.size() != dims.kmax) {
    throw ConfigurationError("time history has " + std::to_string(history.times.size()) + " entries, expected " +
                             std::to_string(dims.kmax));
  }
  if (!history.controls.empty() && history.controls.size() != dims.kmax) {
    throw ConfigurationError("control history has " + std::to_string(history.controls.size()) +
                             " entries, expected " + std::to_string(dims.kmax));
  }

  dims.nz = static_cast<int>(problem.measurementNoise.rows());
  if (problem.measurementNoise.rows() != problem.measurementNoise.cols() || dims.nz == 0) {
    throw ConfigurationError("measurement noise covariance must be non-empty and square, got " +
                             shape(problem.measurementNoise));
  }
  for (std::size_t j = 0; j < dims.kmax; ++j) {
    if (history.measurements[j].size() != dims.nz) {
      throw ConfigurationError("measurement " + std::to_string(j) + " has size " +
                               std::to_string(history.measurements[j].size()) + ", expected " +
                               std::to_string(dims.nz));
    }
  }

  if (!history.controls.empty()) {
    dims.nu = static_cast<int>(history.controls.front().size());
    for (std::size_t j = 0; j < history.controls.size(); ++j) {
      if (history.controls[j].size() != dims.nu) {
        throw ConfigurationError("control " + std::to_string(j) + " has size " +
                                 std::to_string(history.controls[j].size()) + ", expected " +
                                 std::to_string(dims.nu));
      }
    }
  }

  double previous = history.initialTime;
  for (std::size_t j = 0; j < dims.kmax; ++j) {
    if (!(history.times[j] >= previous)) {
      throw ConfigurationError("time history must be non-decreasing and start at or after the initial time (entry " +
                               std::to_string(j) + ")");
    }
    previous = history.times[j];
  }

  if (options.startIndex > dims.kmax) {
    throw ConfigurationError("start index " + std::to_string(options.startIndex) + " exceeds the sample count " +
                             std::to_string(dims.kmax));
  }
  return dims;
}

int resolveIntegrationSubsteps(const EstimatorOptions_t& options, int defaultSubsteps) {
  const int substeps = options.integrationSubsteps.value_or(defaultSubsteps);
  if (substeps < kMinIntegrationSubsteps) {
    throw ConfigurationError("Number of Runge-Kutta substeps must be at least " +
                             std::to_string(kMinIntegrationSubsteps) + ", got " + std::to_string(substeps));
  }
  return substeps;
}

Vector controlAt(const BatchProblem_t& problem, std::size_t k) {
  if (problem.history.controls.empty()) {
    return Vector();
  }
  return problem.history.controls[k];
}

double sampleTime(const TimeHistory_t& history, std::size_t k) {
  return k == 0 ? history.initialTime : history.times[k - 1];
}

DiscreteTransition_t propagateDynamics(const BatchProblem_t& problem,
                                       const Dimensions_t& dims,
                                       const Vector& xk,
                                       std::size_t k,
                                       double tk,
                                       double tkp1,
                                       int substeps) {
  const Vector uk = controlAt(problem, k);
  const Vector vk = Vector::Zero(dims.nv);

  DiscreteTransition_t out;
  switch (problem.dynamics.timing) {
    case TimingMode_e::kContinuousDynamics:
      out = discretizeRk4(problem.dynamics.continuous, xk, uk, vk, tk, tkp1, substeps, true);
      break;
    case TimingMode_e::kDiscrete:
      out = problem.dynamics.discrete(xk, uk, vk, k);
      break;
    default:
      throw ConfigurationError("Incorrect flag for the dynamics-measurement models");
  }

  if (out.state.size() != dims.nx || out.F.rows() != dims.nx || out.F.cols() != dims.nx ||
      out.Gamma.rows() != dims.nx || out.Gamma.cols() != dims.nv) {
    throw ConfigurationError("dynamics model returned state " + std::to_string(out.state.size()) + ", F " +
                             shape(out.F) + ", Gamma " + shape(out.Gamma) + " at sample " + std::to_string(k));
  }
  return out;
}

MeasurementPrediction_t predictMeasurement(const BatchProblem_t& problem,
                                           const Dimensions_t& dims,
                                           const Vector& x,
                                           std::size_t k) {
  MeasurementPrediction_t out = problem.measurement(x, k);
  if (out.z.size() != dims.nz || out.H.rows() != dims.nz || out.H.cols() != dims.nx) {
    throw ConfigurationError("measurement model returned z " + std::to_string(out.z.size()) + ", H " +
                             shape(out.H) + " at sample " + std::to_string(k));
  }
  return out;
}

} // namespace batchest
