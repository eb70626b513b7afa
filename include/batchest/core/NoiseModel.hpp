#pragma once

#include <cstddef>

#include "batchest/core/Types.hpp"

namespace batchest {

// Square-root forms of the process and measurement noise, computed once.
//
//   processInformationRoot   Rvv = L_Q^-1,   Rvv^T Rvv = Q^-1
//   whitening                Ra  = L_R^T,    Ra^T Ra = R   (upper triangular)
//   whiteningInverseTranspose    Ra^-T = L_R^-1
//
// A measurement z becomes za = Ra^-T z, whose noise has identity covariance.
class SquareRootNoiseModel {
public:
  // Throws NumericalPreconditionError (reported at `sampleIndex`) when Q or R
  // is not symmetric positive definite.
  SquareRootNoiseModel(const Matrix& processNoise, const Matrix& measurementNoise, std::size_t sampleIndex = 0);

  const Matrix& processInformationRoot() const { return processRoot; }
  const Matrix& whitening() const { return whiteningRoot; }
  const Matrix& whiteningInverseTranspose() const { return whiteningInvTr; }

  Vector whiten(const Vector& z) const;
  Matrix whiten(const Matrix& H) const;
  Vector unwhiten(const Vector& za) const;

  int processDim() const { return static_cast<int>(processRoot.rows()); }
  int measurementDim() const { return static_cast<int>(whiteningRoot.rows()); }

private:
  Matrix processRoot;
  Matrix whiteningRoot;
  Matrix whiteningInvTr;
  Matrix measurementCholesky; // L_R
};

} // namespace batchest
