#include <cmath>
#include <memory>
#include <thread>

#include <gtest/gtest.h>

#include "batchest/core/BatchFilter.hpp"
#include "batchest/core/ESRIF.hpp"
#include "batchest/core/Errors.hpp"
#include "batchest/core/LKF.hpp"

namespace {

std::shared_ptr<batchest::BatchProblem_t> makeContinuousProblem(std::size_t samples) {
  batchest::Matrix A(2, 2);
  A << 0.0, 1.0, -1.0, -0.3;
  batchest::Matrix D(2, 1);
  D << 0.0, 1.0;
  batchest::Matrix H(1, 2);
  H << 1.0, 0.0;

  auto problem = std::make_shared<batchest::BatchProblem_t>();
  problem->dynamics = batchest::makeContinuousModel(batchest::makeLinearContinuousDynamics(A, D));
  problem->measurement = batchest::makeLinearMeasurement(H);
  problem->initialMean = batchest::Vector::Zero(2);
  problem->initialCovariance = batchest::Matrix::Identity(2, 2);
  problem->processNoise = batchest::Matrix::Constant(1, 1, 0.02);
  problem->measurementNoise = batchest::Matrix::Constant(1, 1, 0.1);
  problem->history.initialTime = 1.0;
  for (std::size_t j = 0; j < samples; ++j) {
    const double t = 1.0 + 0.3 * static_cast<double>(j + 1);
    problem->history.times.push_back(t);
    problem->history.measurements.push_back(batchest::Vector::Constant(1, std::cos(t)));
  }
  return problem;
}

template <typename Estimator>
void expectWarmStartContinuesScratchRun() {
  const auto problem = makeContinuousProblem(12);
  const batchest::BatchResult_t scratch = batchest::runBatch<Estimator>(problem);

  const std::size_t start = 4;
  auto warmProblem = std::make_shared<batchest::BatchProblem_t>(*problem);
  warmProblem->initialMean = scratch.meanHistory.col(static_cast<Eigen::Index>(start));
  warmProblem->initialCovariance = scratch.covarianceHistory[start];
  batchest::EstimatorOptions_t options;
  options.startIndex = start;
  const batchest::BatchResult_t warm = batchest::runBatch<Estimator>(warmProblem, options);

  ASSERT_TRUE(warm.complete);
  EXPECT_EQ(warm.startIndex, start);
  for (std::size_t k = 0; k < start; ++k) {
    EXPECT_TRUE(warm.meanHistory.col(static_cast<Eigen::Index>(k)).hasNaN());
    EXPECT_TRUE(std::isnan(warm.innovationHistory(static_cast<Eigen::Index>(k))));
  }
  for (std::size_t k = start; k <= 12; ++k) {
    const auto col = static_cast<Eigen::Index>(k);
    EXPECT_TRUE(warm.meanHistory.col(col).isApprox(scratch.meanHistory.col(col), 1e-9)) << "sample " << k;
    EXPECT_TRUE(warm.covarianceHistory[k].isApprox(scratch.covarianceHistory[k], 1e-9)) << "sample " << k;
  }
}

} // namespace

TEST(BatchFilterTests, InitializeStoresOnlyTheInitialSnapshot) {
  const auto problem = makeContinuousProblem(6);
  batchest::BatchFilter<batchest::LKF> filter(problem);
  EXPECT_FALSE(filter.isInitialized());
  EXPECT_EQ(filter.estimator().integrationSubsteps(), batchest::LKF::kDefaultIntegrationSubsteps);
  EXPECT_EQ(filter.dimensions().kmax, 6u);
  EXPECT_EQ(filter.dimensions().nu, 0);
  filter.initialize();

  const batchest::BatchResult_t& result = filter.result();
  EXPECT_TRUE(filter.isInitialized());
  EXPECT_FALSE(result.complete);
  ASSERT_EQ(result.meanHistory.cols(), 7);
  ASSERT_EQ(result.covarianceHistory.size(), 7u);
  ASSERT_EQ(result.innovationHistory.size(), 6);
  EXPECT_TRUE(result.meanHistory.col(0).isZero());
  EXPECT_TRUE(result.covarianceHistory[0].isApprox(problem->initialCovariance));
  EXPECT_TRUE(result.meanHistory.col(1).hasNaN());
  EXPECT_TRUE(result.innovationHistory.hasNaN());
}

TEST(BatchFilterTests, ZeroSamplesPerformsNoRecurrence) {
  auto problem = makeContinuousProblem(0);
  int calls = 0;
  const batchest::ContinuousDynamics_t inner = problem->dynamics.continuous;
  problem->dynamics.continuous = [&calls, inner](double t, const batchest::Vector& x, const batchest::Vector& u,
                                                 const batchest::Vector& v, bool withJacobians) {
    ++calls;
    return inner(t, x, u, v, withJacobians);
  };

  const batchest::BatchResult_t lkf = batchest::runBatch<batchest::LKF>(problem);
  const batchest::BatchResult_t esrif = batchest::runBatch<batchest::ESRIF>(problem);
  for (const batchest::BatchResult_t* result : {&lkf, &esrif}) {
    EXPECT_TRUE(result->complete);
    ASSERT_EQ(result->meanHistory.cols(), 1);
    ASSERT_EQ(result->covarianceHistory.size(), 1u);
    EXPECT_EQ(result->innovationHistory.size(), 0);
    EXPECT_TRUE(result->covarianceHistory[0].isApprox(problem->initialCovariance));
  }
  EXPECT_EQ(calls, 0);
}

TEST(BatchFilterTests, WarmStartLkfContinuesScratchRun) {
  expectWarmStartContinuesScratchRun<batchest::LKF>();
}

TEST(BatchFilterTests, WarmStartEsrifContinuesScratchRun) {
  expectWarmStartContinuesScratchRun<batchest::ESRIF>();
}

TEST(BatchFilterTests, RejectsMalformedConfiguration) {
  auto problem = makeContinuousProblem(5);
  batchest::EstimatorOptions_t options;
  options.startIndex = 6;
  EXPECT_THROW(batchest::runBatch<batchest::LKF>(problem, options), batchest::ConfigurationError);

  problem = makeContinuousProblem(5);
  problem->history.times.pop_back();
  EXPECT_THROW(batchest::runBatch<batchest::ESRIF>(problem), batchest::ConfigurationError);

  problem = makeContinuousProblem(5);
  problem->history.measurements[2] = batchest::Vector::Zero(2);
  EXPECT_THROW(batchest::runBatch<batchest::LKF>(problem), batchest::ConfigurationError);

  problem = makeContinuousProblem(5);
  problem->history.times[3] = 0.5;
  EXPECT_THROW(batchest::runBatch<batchest::LKF>(problem), batchest::ConfigurationError);

  problem = makeContinuousProblem(5);
  problem->dynamics.timing = batchest::TimingMode_e::kDiscrete;
  EXPECT_THROW(batchest::runBatch<batchest::LKF>(problem), batchest::ConfigurationError);

  problem = makeContinuousProblem(5);
  problem->dynamics.timing = static_cast<batchest::TimingMode_e>(7);
  EXPECT_THROW(batchest::runBatch<batchest::ESRIF>(problem), batchest::ConfigurationError);

  EXPECT_THROW(batchest::parseTimingMode("XD"), batchest::ConfigurationError);
  EXPECT_EQ(batchest::parseTimingMode("cd"), batchest::TimingMode_e::kContinuousDynamics);
  EXPECT_EQ(batchest::parseTimingMode("DD"), batchest::TimingMode_e::kDiscrete);
}

TEST(BatchFilterTests, ModelFailureAbortsRunAndLeavesLaterSlotsUnset) {
  auto problem = makeContinuousProblem(8);
  const batchest::MeasurementModel_t inner = problem->measurement;
  problem->measurement = [inner](const batchest::Vector& x, std::size_t k) {
    if (k == 3) {
      throw batchest::ModelEvaluationError("sensor model undefined at sample 3");
    }
    return inner(x, k);
  };

  batchest::BatchFilter<batchest::LKF> filter(problem);
  EXPECT_THROW(filter.run(), batchest::ModelEvaluationError);
  const batchest::BatchResult_t& result = filter.result();
  EXPECT_FALSE(result.complete);
  EXPECT_TRUE(result.meanHistory.col(2).allFinite());
  for (Eigen::Index k = 3; k < result.meanHistory.cols(); ++k) {
    EXPECT_TRUE(result.meanHistory.col(k).hasNaN()) << "sample " << k;
  }
}

TEST(BatchFilterTests, IndependentRunsShareReadOnlyProblem) {
  const std::shared_ptr<const batchest::BatchProblem_t> problem = makeContinuousProblem(30);
  batchest::BatchResult_t first;
  batchest::BatchResult_t second;
  std::thread a([&] { first = batchest::runBatch<batchest::ESRIF>(problem); });
  std::thread b([&] { second = batchest::runBatch<batchest::ESRIF>(problem); });
  a.join();
  b.join();

  ASSERT_TRUE(first.complete);
  ASSERT_TRUE(second.complete);
  EXPECT_EQ(first.meanHistory, second.meanHistory);
  EXPECT_EQ(first.innovationHistory, second.innovationHistory);
}
