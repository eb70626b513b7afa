#pragma once

#include <cstddef>
#include <string>

#include "batchest/core/Types.hpp"

namespace batchest {

// Relative symmetry test: |M - M^T| <= tol * max(1, |M|).
bool isSymmetric(const Matrix& m, double tol = 1e-10);

// Lower Cholesky factor L with L L^T = m. Throws NumericalPreconditionError
// naming `what` and `sampleIndex` when m is not square, symmetric and positive
// definite.
Matrix choleskyLower(const Matrix& m, const std::string& what, std::size_t sampleIndex);

// Throws NumericalPreconditionError unless m is square, symmetric and has no
// eigenvalue below -tol * max(1, largest |eigenvalue|).
void requirePositiveSemiDefinite(const Matrix& m, const std::string& what, std::size_t sampleIndex, double tol = 1e-12);

// Inverse of a lower-triangular matrix by forward substitution.
Matrix invertLowerTriangular(const Matrix& lower);

// Inverse of an upper-triangular matrix by back substitution.
Matrix invertUpperTriangular(const Matrix& upper);

// Square upper-triangular T with T^T T = m^T m, obtained by an orthogonal
// (Householder) transform of m.
Matrix triangularize(const Matrix& m);

// True when every diagonal entry of the triangular `r` is finite and larger in
// magnitude than n * eps * max |diag|.
bool isNonsingularTriangular(const Matrix& r);

} // namespace batchest
