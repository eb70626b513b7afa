#include "batchest/core/LinearAlgebra.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include "batchest/core/Errors.hpp"

namespace batchest {

bool isSymmetric(const Matrix& m, double tol) {
  if (m.rows() != m.cols()) {
    return false;
  }
  const double scale = std::max(1.0, m.norm());
  return (m - m.transpose()).norm() <= tol * scale;
}

Matrix choleskyLower(const Matrix& m, const std::string& what, std::size_t sampleIndex) {
  if (m.rows() != m.cols() || m.rows() == 0) {
    throw NumericalPreconditionError(sampleIndex, what + " must be a non-empty square matrix");
  }
  if (!m.allFinite() || !isSymmetric(m)) {
    throw NumericalPreconditionError(sampleIndex, what + " is not symmetric");
  }
  Eigen::LLT<Matrix> llt(m);
  if (llt.info() != Eigen::Success) {
    throw NumericalPreconditionError(sampleIndex, what + " is not positive definite");
  }
  return llt.matrixL();
}

void requirePositiveSemiDefinite(const Matrix& m, const std::string& what, std::size_t sampleIndex, double tol) {
  if (m.rows() != m.cols()) {
    throw NumericalPreconditionError(sampleIndex, what + " must be square");
  }
  if (m.size() == 0) {
    return;
  }
  if (!m.allFinite() || !isSymmetric(m)) {
    throw NumericalPreconditionError(sampleIndex, what + " is not symmetric");
  }
  Eigen::SelfAdjointEigenSolver<Matrix> eig(m, Eigen::EigenvaluesOnly);
  if (eig.info() != Eigen::Success) {
    throw NumericalPreconditionError(sampleIndex, what + ": eigenvalue decomposition failed");
  }
  const Vector& values = eig.eigenvalues();
  const double scale = std::max(1.0, values.cwiseAbs().maxCoeff());
  if (values.minCoeff() < -tol * scale) {
    throw NumericalPreconditionError(sampleIndex, what + " is not positive semi-definite");
  }
}

Matrix invertLowerTriangular(const Matrix& lower) {
  return lower.triangularView<Eigen::Lower>().solve(Matrix::Identity(lower.rows(), lower.cols()));
}

Matrix invertUpperTriangular(const Matrix& upper) {
  return upper.triangularView<Eigen::Upper>().solve(Matrix::Identity(upper.rows(), upper.cols()));
}

Matrix triangularize(const Matrix& m) {
  Eigen::HouseholderQR<Matrix> qr(m);
  const Eigen::Index n = m.cols();
  return qr.matrixQR().topRows(n).triangularView<Eigen::Upper>();
}

bool isNonsingularTriangular(const Matrix& r) {
  if (r.rows() != r.cols() || r.rows() == 0) {
    return false;
  }
  const Vector diag = r.diagonal().cwiseAbs();
  if (!diag.allFinite()) {
    return false;
  }
  const double threshold = static_cast<double>(r.rows()) * std::numeric_limits<double>::epsilon() * diag.maxCoeff();
  return diag.minCoeff() > threshold;
}

} // namespace batchest
