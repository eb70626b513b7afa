#include "batchest/core/NoiseModel.hpp"

#include "batchest/core/LinearAlgebra.hpp"

namespace batchest {

SquareRootNoiseModel::SquareRootNoiseModel(const Matrix& processNoise,
                                           const Matrix& measurementNoise,
                                           std::size_t sampleIndex) {
  const Matrix processCholesky = choleskyLower(processNoise, "process noise covariance Q", sampleIndex);
  processRoot = invertLowerTriangular(processCholesky);

  measurementCholesky = choleskyLower(measurementNoise, "measurement noise covariance R", sampleIndex);
  whiteningRoot = measurementCholesky.transpose();
  whiteningInvTr = invertLowerTriangular(measurementCholesky);
}

// Forward substitution with L_R rather than a product with the cached inverse.
Vector SquareRootNoiseModel::whiten(const Vector& z) const {
  return measurementCholesky.triangularView<Eigen::Lower>().solve(z);
}

Matrix SquareRootNoiseModel::whiten(const Matrix& H) const {
  return measurementCholesky.triangularView<Eigen::Lower>().solve(H);
}

Vector SquareRootNoiseModel::unwhiten(const Vector& za) const {
  return measurementCholesky.triangularView<Eigen::Lower>() * za;
}

} // namespace batchest
