#include "batchest/sim/LinearGaussianSimulator.hpp"

#include <utility>

#include "batchest/core/Errors.hpp"
#include "batchest/core/Logger.hpp"
#include "batchest/core/Models.hpp"

namespace batchest {

Vector sampleGaussian(const Matrix& cov, std::mt19937& rng) {
  const Eigen::Index n = cov.rows();
  std::normal_distribution<double> dist(0.0, 1.0);
  Vector z(n);
  for (Eigen::Index i = 0; i < n; ++i) {
    z(i) = dist(rng);
  }
  if (n == 0) {
    return z;
  }
  // Eigen square root so that singular covariances are accepted.
  Eigen::SelfAdjointEigenSolver<Matrix> eig(cov);
  if (eig.info() != Eigen::Success) {
    throw ConfigurationError("sampleGaussian: eigenvalue decomposition failed");
  }
  const Vector root = eig.eigenvalues().cwiseMax(0.0).cwiseSqrt();
  return eig.eigenvectors() * root.asDiagonal() * z;
}

SimulatedRun_t simulateLinearGaussian(const LinearGaussianScenario_t& scenario, std::mt19937& rng) {
  const Eigen::Index nx = scenario.initialMean.size();
  if (scenario.F.rows() != nx || scenario.F.cols() != nx || scenario.Gamma.rows() != nx ||
      scenario.Gamma.cols() != scenario.Q.rows() || scenario.H.cols() != nx ||
      scenario.H.rows() != scenario.R.rows()) {
    throw ConfigurationError("simulateLinearGaussian: inconsistent scenario dimensions");
  }

  SimulatedRun_t run;
  run.history.initialTime = scenario.initialTime;
  run.truth.reserve(scenario.samples + 1);

  Vector x = scenario.initialMean;
  if (scenario.sampleInitialState) {
    x += sampleGaussian(scenario.initialCovariance, rng);
  }
  run.truth.push_back(x);

  for (std::size_t k = 0; k < scenario.samples; ++k) {
    x = scenario.F * x + scenario.Gamma * sampleGaussian(scenario.Q, rng);
    run.truth.push_back(x);
    run.history.times.push_back(scenario.initialTime + static_cast<double>(k + 1) * scenario.samplePeriod);
    run.history.measurements.push_back(scenario.H * x + sampleGaussian(scenario.R, rng));
  }

  if (auto logger = Logger::GetClass("Simulator")) {
    logger->debug("Simulated {} samples nx {} nz {}", scenario.samples, nx, scenario.H.rows());
  }
  return run;
}

std::shared_ptr<BatchProblem_t> makeLinearProblem(const LinearGaussianScenario_t& scenario, TimeHistory_t history) {
  auto problem = std::make_shared<BatchProblem_t>();
  problem->dynamics = makeDiscreteModel(makeLinearDiscreteDynamics(scenario.F, scenario.Gamma));
  problem->measurement = makeLinearMeasurement(scenario.H);
  problem->initialMean = scenario.initialMean;
  problem->initialCovariance = scenario.initialCovariance;
  problem->history = std::move(history);
  problem->processNoise = scenario.Q;
  problem->measurementNoise = scenario.R;
  return problem;
}

} // namespace batchest
