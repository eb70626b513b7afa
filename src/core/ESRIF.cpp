#include "batchest/core/ESRIF.hpp"

#include <utility>

#include "batchest/core/Errors.hpp"
#include "batchest/core/LinearAlgebra.hpp"
#include "batchest/core/Logger.hpp"

namespace batchest {

namespace {

const BatchProblem_t& requireProblem(const std::shared_ptr<const BatchProblem_t>& problem) {
  if (!problem) {
    throw ConfigurationError("ESRIF: problem is not set");
  }
  return *problem;
}

} // namespace

ESRIF::ESRIF(std::shared_ptr<const BatchProblem_t> problemInput, const EstimatorOptions_t& options)
    : problem(std::move(problemInput)),
      dims(validateProblem(requireProblem(problem), options)),
      substeps(resolveIntegrationSubsteps(options, kDefaultIntegrationSubsteps)),
      startIndex(options.startIndex),
      noise(problem->processNoise, problem->measurementNoise, options.startIndex) {
  whitenedHistory.reserve(dims.kmax);
  for (const Vector& z : problem->history.measurements) {
    whitenedHistory.push_back(noise.whiten(z));
  }

  const Matrix p0Cholesky = choleskyLower(problem->initialCovariance, "initial covariance P0", startIndex);
  initialRxx = triangularize(invertLowerTriangular(p0Cholesky));

  if (auto logger = Logger::GetClass(kName)) {
    logger->info("ESRIF: timing {} substeps {} nx {} nv {} nz {} samples {}",
                 toString(problem->dynamics.timing), substeps, dims.nx, dims.nv, dims.nz, dims.kmax);
  }
}

ESRIF::State ESRIF::initialState() const {
  return State{initialRxx, initialRxx * problem->initialMean};
}

ESRIF::Prior ESRIF::propagate(const State& posterior, std::size_t k, double tk, double tkp1) const {
  const Vector xhat = posterior.Rxx.triangularView<Eigen::Upper>().solve(posterior.zeta);
  const DiscreteTransition_t transition = propagateDynamics(*problem, dims, xhat, k, tk, tkp1, substeps);

  Eigen::FullPivLU<Matrix> fLu(transition.F);
  if (!fLu.isInvertible()) {
    throw NumericalPreconditionError(k, "ESRIF: state transition Jacobian F is singular");
  }
  // Rxx F^-1 via F^T X^T = Rxx^T. The solve is evaluated before transposing.
  const Matrix RxxFinvT = fLu.transpose().solve(posterior.Rxx.transpose());
  const Matrix RxxFinv = RxxFinvT.transpose();

  const int nv = dims.nv;
  const int nx = dims.nx;
  Matrix big = Matrix::Zero(nv + nx, nv + nx);
  big.topLeftCorner(nv, nv) = noise.processInformationRoot();
  big.bottomLeftCorner(nx, nv) = -RxxFinv * transition.Gamma;
  big.bottomRightCorner(nx, nx) = RxxFinv;

  Vector rhs = Vector::Zero(nv + nx);
  rhs.tail(nx) = RxxFinv * transition.state;

  Eigen::HouseholderQR<Matrix> qr(big);
  const Vector transformed = qr.householderQ().adjoint() * rhs;

  Prior prior;
  prior.xbar = transition.state;
  prior.Rbar = qr.matrixQR().bottomRightCorner(nx, nx).triangularView<Eigen::Upper>();
  prior.zetabar = transformed.tail(nx);
  return prior;
}

UpdateResult_t<ESRIF::State> ESRIF::update(const Prior& prior, std::size_t kp1) const {
  const MeasurementPrediction_t predicted = predictMeasurement(*problem, dims, prior.xbar, kp1);
  const int nx = dims.nx;
  const int nz = dims.nz;

  const Matrix Ha = noise.whiten(predicted.H);
  const Vector zEkf = whitenedHistory[kp1 - 1] - noise.whiten(predicted.z) + Ha * prior.xbar;

  Matrix stacked(nx + nz, nx);
  stacked.topRows(nx) = prior.Rbar;
  stacked.bottomRows(nz) = Ha;
  Vector rhs(nx + nz);
  rhs.head(nx) = prior.zetabar;
  rhs.tail(nz) = zEkf;

  Eigen::HouseholderQR<Matrix> qr(stacked);
  const Vector transformed = qr.householderQ().adjoint() * rhs;

  UpdateResult_t<State> result;
  result.state.Rxx = qr.matrixQR().topRows(nx).triangularView<Eigen::Upper>();
  result.state.zeta = transformed.head(nx);
  const Vector residual = transformed.tail(nz);
  result.innovationStatistic = residual.squaredNorm();

  if (!isNonsingularTriangular(result.state.Rxx)) {
    throw NumericalPreconditionError(kp1, "ESRIF: posterior information factor is singular");
  }
  return result;
}

StateSnapshot_t ESRIF::readout(const State& posterior, std::size_t k) const {
  if (!isNonsingularTriangular(posterior.Rxx)) {
    throw NumericalPreconditionError(k, "ESRIF: information factor is singular");
  }
  StateSnapshot_t snapshot;
  snapshot.mean = posterior.Rxx.triangularView<Eigen::Upper>().solve(posterior.zeta);
  const Matrix RxxInv = invertUpperTriangular(posterior.Rxx);
  snapshot.covariance = RxxInv * RxxInv.transpose();
  return snapshot;
}

} // namespace batchest
