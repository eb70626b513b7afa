#pragma once

#include <cstddef>
#include <exception>
#include <limits>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "batchest/core/Errors.hpp"
#include "batchest/core/Estimator.hpp"
#include "batchest/core/Logger.hpp"

namespace batchest {

// Output histories of one batch run. Slots that were never written hold NaN.
struct BatchResult_t {
  Matrix meanHistory;                   // nx x (kmax + 1)
  std::vector<Matrix> covarianceHistory; // kmax + 1 entries, nx x nx
  Vector innovationHistory;             // kmax; entry j belongs to sample j + 1
  std::size_t startIndex = 0;
  bool complete = false;
};

// Runs the shared propagate/update recurrence over a whole history.
//
// `Estimator` provides:
//   using State; using Prior;
//   static constexpr const char* kName;
//   Estimator(std::shared_ptr<const BatchProblem_t>, const EstimatorOptions_t&);
//   const Dimensions_t& dimensions() const;
//   State initialState() const;
//   Prior propagate(const State&, std::size_t k, double tk, double tkp1) const;
//   UpdateResult_t<State> update(const Prior&, std::size_t kp1) const;
//   StateSnapshot_t readout(const State&, std::size_t k) const;
//
// Setup errors surface from the constructor, before any propagation.
template <typename Estimator>
class BatchFilter {
public:
  BatchFilter(std::shared_ptr<const BatchProblem_t> problemInput, EstimatorOptions_t optionsInput = {})
      : problem(std::move(problemInput)), options(std::move(optionsInput)), estimatorImpl(makeEstimator()) {}

  // Allocates the output buffers and stores the initial snapshot at the start
  // index.
  void initialize() {
    const Dimensions_t& dims = estimatorImpl.dimensions();
    const double nan = std::numeric_limits<double>::quiet_NaN();
    output = BatchResult_t{};
    output.meanHistory = Matrix::Constant(dims.nx, static_cast<Eigen::Index>(dims.kmax + 1), nan);
    output.covarianceHistory.assign(dims.kmax + 1, Matrix::Constant(dims.nx, dims.nx, nan));
    output.innovationHistory = Vector::Constant(static_cast<Eigen::Index>(dims.kmax), nan);
    output.startIndex = options.startIndex;

    output.meanHistory.col(static_cast<Eigen::Index>(options.startIndex)) = problem->initialMean;
    output.covarianceHistory[options.startIndex] = problem->initialCovariance;
    initialized = true;
  }

  // Executes the recurrence from the start index to the last sample. Any
  // error ends the run; `result().complete` then stays false.
  const BatchResult_t& run() {
    initialize();
    const Dimensions_t& dims = estimatorImpl.dimensions();
    const auto logger = Logger::GetClass(Estimator::kName);
    if (logger) {
      logger->info("{} run: nx {} nv {} nz {} samples {} start {}",
                   Estimator::kName, dims.nx, dims.nv, dims.nz, dims.kmax, options.startIndex);
    }

    try {
      typename Estimator::State state = estimatorImpl.initialState();
      double tk = sampleTime(problem->history, options.startIndex);
      for (std::size_t k = options.startIndex; k < dims.kmax; ++k) {
        const std::size_t kp1 = k + 1;
        const double tkp1 = sampleTime(problem->history, kp1);

        const typename Estimator::Prior prior = estimatorImpl.propagate(state, k, tk, tkp1);
        UpdateResult_t<typename Estimator::State> posterior = estimatorImpl.update(prior, kp1);
        StateSnapshot_t snapshot = estimatorImpl.readout(posterior.state, kp1);

        output.meanHistory.col(static_cast<Eigen::Index>(kp1)) = snapshot.mean;
        output.covarianceHistory[kp1] = std::move(snapshot.covariance);
        output.innovationHistory(static_cast<Eigen::Index>(k)) = posterior.innovationStatistic;

        if (logger && (kp1 % kLogEvery) == 0) {
          logger->debug("{} sample {} t {:.6f} nis {:.4e} trace(P) {:.4e}",
                        Estimator::kName, kp1, tkp1, posterior.innovationStatistic,
                        output.covarianceHistory[kp1].trace());
        }

        state = std::move(posterior.state);
        tk = tkp1;
      }
    } catch (const std::exception& ex) {
      if (logger) {
        logger->error("{} run aborted: {}", Estimator::kName, ex.what());
      }
      throw;
    }

    output.complete = true;
    if (logger) {
      logger->info("{} run complete after {} samples", Estimator::kName, dims.kmax - options.startIndex);
    }
    return output;
  }

  const BatchResult_t& result() const { return output; }
  bool isInitialized() const { return initialized; }
  const Estimator& estimator() const { return estimatorImpl; }
  const Dimensions_t& dimensions() const { return estimatorImpl.dimensions(); }

private:
  static constexpr std::size_t kLogEvery = 50;

  Estimator makeEstimator() const {
    if (!problem) {
      throw ConfigurationError(std::string(Estimator::kName) + ": problem is not set");
    }
    try {
      return Estimator(problem, options);
    } catch (const std::exception& ex) {
      if (auto logger = Logger::GetClass(Estimator::kName)) {
        logger->error("{} setup failed: {}", Estimator::kName, ex.what());
      }
      throw;
    }
  }

  std::shared_ptr<const BatchProblem_t> problem;
  EstimatorOptions_t options;
  Estimator estimatorImpl;
  BatchResult_t output;
  bool initialized = false;
};

// Convenience wrapper: builds a BatchFilter and runs it.
template <typename Estimator>
BatchResult_t runBatch(std::shared_ptr<const BatchProblem_t> problem, EstimatorOptions_t options = {}) {
  BatchFilter<Estimator> filter(std::move(problem), std::move(options));
  return filter.run();
}

} // namespace batchest
