#include "batchest/core/LKF.hpp"

#include <utility>

#include "batchest/core/Errors.hpp"
#include "batchest/core/LinearAlgebra.hpp"
#include "batchest/core/Logger.hpp"

namespace batchest {

LKF::LKF(std::shared_ptr<const BatchProblem_t> problemInput, const EstimatorOptions_t& options)
    : problem(std::move(problemInput)) {
  if (!problem) {
    throw ConfigurationError("LKF: problem is not set");
  }
  dims = validateProblem(*problem, options);
  substeps = resolveIntegrationSubsteps(options, kDefaultIntegrationSubsteps);

  requirePositiveSemiDefinite(problem->initialCovariance, "initial covariance P0", options.startIndex);
  choleskyLower(problem->processNoise, "process noise covariance Q", options.startIndex);
  choleskyLower(problem->measurementNoise, "measurement noise covariance R", options.startIndex);

  if (auto logger = Logger::GetClass(kName)) {
    logger->info("LKF: timing {} substeps {} nx {} nv {} nz {} samples {}",
                 toString(problem->dynamics.timing), substeps, dims.nx, dims.nv, dims.nz, dims.kmax);
  }
}

LKF::State LKF::initialState() const {
  return State{problem->initialMean, problem->initialCovariance};
}

LKF::Prior LKF::propagate(const State& posterior, std::size_t k, double tk, double tkp1) const {
  const DiscreteTransition_t transition =
      propagateDynamics(*problem, dims, posterior.mean, k, tk, tkp1, substeps);

  Prior prior;
  prior.mean = transition.state;
  prior.covariance = transition.F * posterior.covariance * transition.F.transpose() +
                     transition.Gamma * problem->processNoise * transition.Gamma.transpose();
  return prior;
}

UpdateResult_t<LKF::State> LKF::update(const Prior& prior, std::size_t kp1) const {
  const MeasurementPrediction_t predicted = predictMeasurement(*problem, dims, prior.mean, kp1);
  const Matrix& H = predicted.H;
  const Vector& z = problem->history.measurements[kp1 - 1];

  const Vector innovation = z - predicted.z;
  const Matrix S = H * prior.covariance * H.transpose() + problem->measurementNoise;
  const Matrix PHt = prior.covariance * H.transpose();

  Eigen::LLT<Matrix> sChol(S);
  if (sChol.info() != Eigen::Success) {
    throw NumericalPreconditionError(kp1, "LKF: innovation covariance S is not invertible");
  }
  // W = Pbar H^T S^-1, solved as S W^T = H Pbar.
  const Matrix W = sChol.solve(PHt.transpose()).transpose();

  UpdateResult_t<State> result;
  result.state.mean = prior.mean + W * innovation;
  result.state.covariance = prior.covariance - W * S * W.transpose();
  result.innovationStatistic = innovation.dot(sChol.solve(innovation));

  if (!result.state.mean.allFinite() || !result.state.covariance.allFinite()) {
    throw NumericalPreconditionError(kp1, "LKF: non-finite posterior");
  }
  return result;
}

StateSnapshot_t LKF::readout(const State& posterior, std::size_t /*k*/) const {
  return posterior;
}

} // namespace batchest
