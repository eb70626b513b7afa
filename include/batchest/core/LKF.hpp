#pragma once

#include <cstddef>
#include <memory>

#include "batchest/core/Estimator.hpp"

namespace batchest {

// Linear / extended Kalman filter in covariance form.
//
// Propagation: Pbar = F P F^T + Gamma Q Gamma^T.
// Update:      S = H Pbar H^T + R, W = Pbar H^T S^-1,
//              xhat = xbar + W nu, P = Pbar - W S W^T, nis = nu^T S^-1 nu.
//
// P0 may be singular (positive semi-definite); Q and R must be positive
// definite.
class LKF {
public:
  using State = StateSnapshot_t;
  using Prior = StateSnapshot_t;

  static constexpr const char* kName = "LKF";
  static constexpr int kDefaultIntegrationSubsteps = 10;

  LKF(std::shared_ptr<const BatchProblem_t> problem, const EstimatorOptions_t& options);

  const Dimensions_t& dimensions() const { return dims; }
  int integrationSubsteps() const { return substeps; }

  State initialState() const;
  Prior propagate(const State& posterior, std::size_t k, double tk, double tkp1) const;
  UpdateResult_t<State> update(const Prior& prior, std::size_t kp1) const;
  StateSnapshot_t readout(const State& posterior, std::size_t k) const;

private:
  std::shared_ptr<const BatchProblem_t> problem;
  Dimensions_t dims;
  int substeps = kDefaultIntegrationSubsteps;
};

} // namespace batchest
