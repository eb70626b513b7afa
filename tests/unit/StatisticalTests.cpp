#include <cstddef>
#include <limits>
#include <memory>
#include <random>

#include <gtest/gtest.h>

#include "batchest/core/BatchFilter.hpp"
#include "batchest/core/ESRIF.hpp"
#include "batchest/core/InnovationMetrics.hpp"
#include "batchest/core/LKF.hpp"
#include "batchest/sim/LinearGaussianSimulator.hpp"

namespace {

// 95th percentile of chi-square with one degree of freedom.
constexpr double kChiSquare1At95 = 3.841458820694124;

batchest::LinearGaussianScenario_t makeConstantVelocityScenario(std::size_t samples) {
  batchest::LinearGaussianScenario_t scenario;
  scenario.F = batchest::Matrix(2, 2);
  scenario.F << 1.0, 1.0, 0.0, 1.0;
  scenario.Gamma = batchest::Matrix(2, 1);
  scenario.Gamma << 0.5, 1.0;
  scenario.H = batchest::Matrix(1, 2);
  scenario.H << 1.0, 0.0;
  scenario.Q = batchest::Matrix::Constant(1, 1, 0.01);
  scenario.R = batchest::Matrix::Constant(1, 1, 1.0);
  scenario.initialMean = batchest::Vector(2);
  scenario.initialMean << 0.0, 1.0;
  scenario.initialCovariance = batchest::Matrix::Identity(2, 2);
  scenario.samples = samples;
  return scenario;
}

// Static state: F = I with no effective process noise.
batchest::LinearGaussianScenario_t makeStaticScenario(std::size_t samples) {
  batchest::LinearGaussianScenario_t scenario;
  scenario.F = batchest::Matrix::Identity(3, 3);
  scenario.Gamma = batchest::Matrix::Zero(3, 1);
  scenario.H = batchest::Matrix(2, 3);
  scenario.H << 1.0, 0.0, 1.0, 0.0, 1.0, -1.0;
  scenario.Q = batchest::Matrix::Constant(1, 1, 1.0);
  scenario.R = batchest::Matrix::Identity(2, 2) * 0.5;
  scenario.initialMean = batchest::Vector::Zero(3);
  scenario.initialCovariance = batchest::Matrix::Identity(3, 3) * 10.0;
  scenario.samples = samples;
  return scenario;
}

void expectTraceNonIncreasing(const batchest::BatchResult_t& result) {
  ASSERT_TRUE(result.complete);
  for (std::size_t k = 1; k < result.covarianceHistory.size(); ++k) {
    EXPECT_LE(result.covarianceHistory[k].trace(), result.covarianceHistory[k - 1].trace() * (1.0 + 1e-12))
        << "trace grew at sample " << k;
  }
}

} // namespace

TEST(StatisticalTests, UncertaintyShrinksWithoutProcessNoise) {
  const batchest::LinearGaussianScenario_t scenario = makeStaticScenario(40);
  std::mt19937 rng(11);
  const batchest::SimulatedRun_t run = batchest::simulateLinearGaussian(scenario, rng);

  expectTraceNonIncreasing(batchest::runBatch<batchest::ESRIF>(batchest::makeLinearProblem(scenario, run.history)));

  expectTraceNonIncreasing(batchest::runBatch<batchest::LKF>(batchest::makeLinearProblem(scenario, run.history)));
}

TEST(StatisticalTests, InnovationStatisticIsChiSquareCalibrated) {
  const batchest::LinearGaussianScenario_t scenario = makeConstantVelocityScenario(50);
  std::mt19937 rng(2024);
  batchest::InnovationMetrics lkfMetrics(kChiSquare1At95);
  batchest::InnovationMetrics esrifMetrics(kChiSquare1At95);

  for (int trial = 0; trial < 200; ++trial) {
    const batchest::SimulatedRun_t run = batchest::simulateLinearGaussian(scenario, rng);
    const std::shared_ptr<const batchest::BatchProblem_t> problem =
        batchest::makeLinearProblem(scenario, run.history);
    lkfMetrics.update(batchest::runBatch<batchest::LKF>(problem).innovationHistory);
    if (trial % 10 == 0) {
      esrifMetrics.update(batchest::runBatch<batchest::ESRIF>(problem).innovationHistory);
    }
  }

  ASSERT_EQ(lkfMetrics.count(), 10000u);
  EXPECT_NEAR(lkfMetrics.mean(), 1.0, 0.1);
  EXPECT_GE(lkfMetrics.fractionWithinBound(), 0.93);
  EXPECT_LE(lkfMetrics.fractionWithinBound(), 0.97);

  ASSERT_EQ(esrifMetrics.count(), 1000u);
  EXPECT_NEAR(esrifMetrics.mean(), 1.0, 0.2);
  EXPECT_GE(esrifMetrics.fractionWithinBound(), 0.9);
}

TEST(StatisticalTests, MetricsSkipUnsetSlots) {
  batchest::InnovationMetrics metrics(2.0);
  batchest::Vector history(4);
  history << 1.0, std::numeric_limits<double>::quiet_NaN(), 3.0, 0.5;
  metrics.update(history);
  EXPECT_EQ(metrics.count(), 3u);
  EXPECT_DOUBLE_EQ(metrics.mean(), 1.5);
  EXPECT_DOUBLE_EQ(metrics.last(), 0.5);
  EXPECT_NEAR(metrics.fractionWithinBound(), 2.0 / 3.0, 1e-12);
}
