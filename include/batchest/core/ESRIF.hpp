#pragma once

#include <cstddef>
#include <memory>

#include "batchest/core/Estimator.hpp"
#include "batchest/core/NoiseModel.hpp"

namespace batchest {

// Square-root information state: upper-triangular Rxx with Rxx^T Rxx = P^-1,
// and zeta = Rxx * mean.
struct InformationState_t {
  Matrix Rxx;
  Vector zeta;
};

// a-priori information state at k + 1 plus the propagated mean that the
// measurement model is linearized about.
struct InformationPrior_t {
  Vector xbar;
  Matrix Rbar;
  Vector zetabar;
};

// Extended square-root information filter.
//
// Propagation QR-factors
//
//   [ Rvv                0          ]      [ 0                ]
//   [ -Rxx F^-1 Gamma    Rxx F^-1   ]  and [ Rxx F^-1 xbar    ]
//
// and keeps the bottom-right block / tail as the a-priori (Rbar, zetabar).
// The update QR-factors [Rbar; Ra^-T H] against
// [zetabar; za - Ra^-T zbar + Ra^-T H xbar]; the bottom nz entries of the
// transformed vector are the whitened residual whose squared norm is the
// innovation statistic. No covariance is formed on the recurrence path.
class ESRIF {
public:
  using State = InformationState_t;
  using Prior = InformationPrior_t;

  static constexpr const char* kName = "ESRIF";
  static constexpr int kDefaultIntegrationSubsteps = 20;

  // Q, R and P0 must be symmetric positive definite; failures throw
  // NumericalPreconditionError here, before any propagation.
  ESRIF(std::shared_ptr<const BatchProblem_t> problem, const EstimatorOptions_t& options);

  const Dimensions_t& dimensions() const { return dims; }
  int integrationSubsteps() const { return substeps; }
  const SquareRootNoiseModel& noiseModel() const { return noise; }
  // Measurement history in whitened coordinates.
  const VectorList& whitenedMeasurements() const { return whitenedHistory; }

  State initialState() const;
  Prior propagate(const State& posterior, std::size_t k, double tk, double tkp1) const;
  UpdateResult_t<State> update(const Prior& prior, std::size_t kp1) const;
  // Mean by back substitution, covariance as Rxx^-1 Rxx^-T.
  StateSnapshot_t readout(const State& posterior, std::size_t k) const;

private:
  std::shared_ptr<const BatchProblem_t> problem;
  Dimensions_t dims;
  int substeps = kDefaultIntegrationSubsteps;
  std::size_t startIndex = 0;
  SquareRootNoiseModel noise;
  VectorList whitenedHistory;
  Matrix initialRxx;
};

} // namespace batchest
