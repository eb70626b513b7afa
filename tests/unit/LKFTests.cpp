#include <memory>

#include <gtest/gtest.h>

#include "batchest/core/BatchFilter.hpp"
#include "batchest/core/Errors.hpp"
#include "batchest/core/LKF.hpp"

namespace {

std::shared_ptr<batchest::BatchProblem_t> makeScalarProblem(int* dynamicsCalls = nullptr) {
  auto problem = std::make_shared<batchest::BatchProblem_t>();
  const batchest::DiscreteDynamics_t linear = batchest::makeLinearDiscreteDynamics(
      batchest::Matrix::Constant(1, 1, 0.9), batchest::Matrix::Constant(1, 1, 1.0));
  problem->dynamics = batchest::makeDiscreteModel(
      [linear, dynamicsCalls](const batchest::Vector& x, const batchest::Vector& u, const batchest::Vector& v,
                              std::size_t k) {
        if (dynamicsCalls != nullptr) {
          ++*dynamicsCalls;
        }
        return linear(x, u, v, k);
      });
  problem->measurement = batchest::makeLinearMeasurement(batchest::Matrix::Constant(1, 1, 2.0));
  problem->initialMean = batchest::Vector::Constant(1, 1.0);
  problem->initialCovariance = batchest::Matrix::Constant(1, 1, 2.0);
  problem->processNoise = batchest::Matrix::Constant(1, 1, 0.5);
  problem->measurementNoise = batchest::Matrix::Constant(1, 1, 0.25);
  for (int j = 0; j < 5; ++j) {
    problem->history.times.push_back(j + 1.0);
    problem->history.measurements.push_back(batchest::Vector::Constant(1, 1.5 - 0.2 * j));
  }
  return problem;
}

} // namespace

TEST(LKFTests, ScalarStepMatchesRiccatiRecursion) {
  const auto problem = makeScalarProblem();
  batchest::LKF lkf(problem, {});
  const batchest::LKF::State initial = lkf.initialState();

  const batchest::LKF::Prior prior = lkf.propagate(initial, 0, 0.0, 1.0);
  EXPECT_NEAR(prior.mean(0), 0.9, 1e-12);
  EXPECT_NEAR(prior.covariance(0, 0), 0.81 * 2.0 + 0.5, 1e-12);

  const auto posterior = lkf.update(prior, 1);
  const double pbar = 0.81 * 2.0 + 0.5;
  const double s = 4.0 * pbar + 0.25;
  const double nu = 1.5 - 2.0 * 0.9;
  EXPECT_NEAR(posterior.state.mean(0), 0.9 + pbar * 2.0 / s * nu, 1e-12);
  EXPECT_NEAR(posterior.state.covariance(0, 0), pbar - pbar * pbar * 4.0 / s, 1e-12);
  EXPECT_NEAR(posterior.innovationStatistic, nu * nu / s, 1e-12);
}

TEST(LKFTests, DefaultsToTenSubsteps) {
  batchest::LKF lkf(makeScalarProblem(), {});
  EXPECT_EQ(lkf.integrationSubsteps(), 10);
}

TEST(LKFTests, SubstepBoundary) {
  const auto problem = makeScalarProblem();
  batchest::EstimatorOptions_t options;
  options.integrationSubsteps = 5;
  EXPECT_NO_THROW((batchest::BatchFilter<batchest::LKF>(problem, options)));

  options.integrationSubsteps = 4;
  EXPECT_THROW((batchest::BatchFilter<batchest::LKF>(problem, options)), batchest::ConfigurationError);
}

TEST(LKFTests, RejectsSingularProcessNoiseBeforePropagation) {
  int calls = 0;
  auto problem = makeScalarProblem(&calls);
  problem->processNoise = batchest::Matrix::Zero(1, 1);
  try {
    batchest::runBatch<batchest::LKF>(problem);
    FAIL() << "expected NumericalPreconditionError";
  } catch (const batchest::NumericalPreconditionError& ex) {
    EXPECT_EQ(ex.sampleIndex(), 0u);
  }
  EXPECT_EQ(calls, 0);
}

TEST(LKFTests, AcceptsSingularInitialCovariance) {
  auto problem = makeScalarProblem();
  problem->initialCovariance = batchest::Matrix::Zero(1, 1);
  const batchest::BatchResult_t result = batchest::runBatch<batchest::LKF>(problem);
  EXPECT_TRUE(result.complete);
  EXPECT_TRUE(result.meanHistory.allFinite());
}

TEST(LKFTests, RejectsIndefiniteNoiseBeforePropagation) {
  int calls = 0;
  auto problem = makeScalarProblem(&calls);
  problem->processNoise = batchest::Matrix::Constant(1, 1, -0.5);
  EXPECT_THROW((batchest::BatchFilter<batchest::LKF>(problem, {})), batchest::NumericalPreconditionError);

  problem->processNoise = batchest::Matrix::Constant(1, 1, 0.5);
  problem->measurementNoise = batchest::Matrix::Zero(1, 1);
  EXPECT_THROW((batchest::BatchFilter<batchest::LKF>(problem, {})), batchest::NumericalPreconditionError);
  EXPECT_EQ(calls, 0);
}

TEST(LKFTests, RejectsAsymmetricInitialCovariance) {
  auto problem = std::make_shared<batchest::BatchProblem_t>(*makeScalarProblem());
  problem->initialMean = batchest::Vector::Zero(2);
  problem->initialCovariance = batchest::Matrix(2, 2);
  problem->initialCovariance << 1.0, 0.5, 0.0, 1.0;
  problem->dynamics = batchest::makeDiscreteModel(batchest::makeLinearDiscreteDynamics(
      batchest::Matrix::Identity(2, 2), batchest::Matrix::Constant(2, 1, 1.0)));
  problem->measurement = batchest::makeLinearMeasurement(batchest::Matrix::Constant(1, 2, 1.0));
  try {
    batchest::BatchFilter<batchest::LKF> filter(problem, {});
    FAIL() << "expected NumericalPreconditionError";
  } catch (const batchest::NumericalPreconditionError& ex) {
    EXPECT_EQ(ex.sampleIndex(), 0u);
  }
}
