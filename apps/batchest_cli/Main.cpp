#include <fmt/core.h>

#include <algorithm>
#include <cstdint>
#include <exception>
#include <fstream>
#include <memory>
#include <random>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

#include "batchest/core/BatchFilter.hpp"
#include "batchest/core/ESRIF.hpp"
#include "batchest/core/Errors.hpp"
#include "batchest/core/EstimatorConfig.hpp"
#include "batchest/core/InnovationMetrics.hpp"
#include "batchest/core/LKF.hpp"
#include "batchest/core/Logger.hpp"
#include "batchest/data/AsciiHistorySource.hpp"
#include "batchest/sim/LinearGaussianSimulator.hpp"

namespace {

// chi-square(1) 95% quantile, used for the single-measurement summary.
constexpr double kChiSquare1Dof95 = 3.841458820694124;

constexpr const char* kUsage =
    "Usage: batchest_cli [--config <path>] [--dataset <path>] [--filter <lkf|esrif|both>]\n";

struct CommandLine_t {
  std::string configPath = "config/default.json";
  std::string datasetPath;
  std::string filterType; // empty: take filter.type from the config
  bool showHelp = false;
};

// Every flag except --help takes exactly one value.
CommandLine_t readCommandLine(int argc, char** argv) {
  CommandLine_t cmd;
  for (int i = 1; i < argc; ++i) {
    const std::string flag = argv[i];
    if (flag == "--help" || flag == "-h") {
      cmd.showHelp = true;
      continue;
    }
    std::string* target = nullptr;
    if (flag == "--config") {
      target = &cmd.configPath;
    } else if (flag == "--dataset") {
      target = &cmd.datasetPath;
    } else if (flag == "--filter") {
      target = &cmd.filterType;
    } else {
      throw batchest::ConfigurationError("unknown option '" + flag + "'");
    }
    if (i + 1 >= argc) {
      throw batchest::ConfigurationError(flag + " needs a value");
    }
    *target = argv[++i];
  }
  if (!cmd.filterType.empty() && cmd.filterType != "both") {
    batchest::parseEstimatorType(cmd.filterType);
  }
  return cmd;
}

nlohmann::json readConfigFile(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw batchest::ConfigurationError("cannot open config file " + path);
  }
  try {
    return nlohmann::json::parse(file);
  } catch (const nlohmann::json::parse_error& ex) {
    throw batchest::ConfigurationError(path + ": " + ex.what());
  }
}

// Linear scenario from the "model", "noise", "initial" and "dataset" sections.
batchest::LinearGaussianScenario_t parseScenario(const nlohmann::json& config) {
  const nlohmann::json modelNode = config.value("model", nlohmann::json::object());
  const nlohmann::json noiseNode = config.value("noise", nlohmann::json::object());
  const nlohmann::json initialNode = config.value("initial", nlohmann::json::object());
  const nlohmann::json datasetNode = config.value("dataset", nlohmann::json::object());

  batchest::LinearGaussianScenario_t scenario;
  scenario.H = batchest::parseMatrix(modelNode.value("H", nlohmann::json()), "model.H");
  scenario.Q = batchest::parseMatrix(noiseNode.value("Q", nlohmann::json()), "noise.Q");
  scenario.R = batchest::parseMatrix(noiseNode.value("R", nlohmann::json()), "noise.R");
  scenario.initialMean = batchest::parseVector(initialNode.value("mean", nlohmann::json()), "initial.mean");
  scenario.initialCovariance =
      batchest::parseMatrix(initialNode.value("covariance", nlohmann::json()), "initial.covariance");
  scenario.initialTime = initialNode.value("time", 0.0);
  scenario.samples = datasetNode.value("samples", static_cast<std::size_t>(100));
  scenario.samplePeriod = datasetNode.value("samplePeriod", 1.0);
  return scenario;
}

std::shared_ptr<batchest::BatchProblem_t> buildProblem(const nlohmann::json& config, const std::string& datasetPath) {
  const nlohmann::json modelNode = config.value("model", nlohmann::json::object());
  const nlohmann::json datasetNode = config.value("dataset", nlohmann::json::object());
  const batchest::TimingMode_e timing = batchest::parseTimingMode(modelNode.value("timing", "DD"));
  batchest::LinearGaussianScenario_t scenario = parseScenario(config);

  batchest::TimeHistory_t history;
  if (!datasetPath.empty()) {
    const int nu = datasetNode.value("controlDim", 0);
    batchest::AsciiHistorySource source(datasetPath, nu, static_cast<int>(scenario.H.rows()));
    if (!source.good()) {
      throw batchest::ConfigurationError("Failed to open dataset: " + datasetPath);
    }
    history = source.readAll(scenario.initialTime);
  } else {
    if (timing != batchest::TimingMode_e::kDiscrete) {
      throw batchest::ConfigurationError("simulated datasets need discrete (DD) models; set dataset.path");
    }
    scenario.F = batchest::parseMatrix(modelNode.value("F", nlohmann::json()), "model.F");
    scenario.Gamma = batchest::parseMatrix(modelNode.value("Gamma", nlohmann::json()), "model.Gamma");
    std::mt19937 rng(datasetNode.value("seed", static_cast<std::uint32_t>(42)));
    history = batchest::simulateLinearGaussian(scenario, rng).history;
    if (auto logger = batchest::Logger::Get()) {
      logger->info("Simulated {} samples (seed {})", history.sampleCount(), datasetNode.value("seed", 42));
    }
  }

  auto problem = std::make_shared<batchest::BatchProblem_t>();
  problem->measurement = batchest::makeLinearMeasurement(scenario.H);
  if (timing == batchest::TimingMode_e::kContinuousDynamics) {
    const batchest::Matrix A = batchest::parseMatrix(modelNode.value("A", nlohmann::json()), "model.A");
    const batchest::Matrix D = batchest::parseMatrix(modelNode.value("D", nlohmann::json()), "model.D");
    batchest::Matrix B;
    if (modelNode.contains("B")) {
      B = batchest::parseMatrix(modelNode["B"], "model.B");
    }
    problem->dynamics = batchest::makeContinuousModel(batchest::makeLinearContinuousDynamics(A, D, B));
  } else {
    const batchest::Matrix F = batchest::parseMatrix(modelNode.value("F", nlohmann::json()), "model.F");
    const batchest::Matrix Gamma = batchest::parseMatrix(modelNode.value("Gamma", nlohmann::json()), "model.Gamma");
    batchest::Matrix B;
    if (modelNode.contains("B")) {
      B = batchest::parseMatrix(modelNode["B"], "model.B");
    }
    problem->dynamics = batchest::makeDiscreteModel(batchest::makeLinearDiscreteDynamics(F, Gamma, B));
  }
  problem->initialMean = scenario.initialMean;
  problem->initialCovariance = scenario.initialCovariance;
  problem->history = std::move(history);
  problem->processNoise = scenario.Q;
  problem->measurementNoise = scenario.R;
  return problem;
}

void printSummary(const char* name, const batchest::BatchResult_t& result, int nz) {
  batchest::InnovationMetrics metrics(nz == 1 ? kChiSquare1Dof95 : 0.0);
  metrics.update(result.innovationHistory);
  const auto last = static_cast<Eigen::Index>(result.covarianceHistory.size() - 1);
  const batchest::Vector finalMean = result.meanHistory.col(last);

  std::string meanText;
  for (Eigen::Index i = 0; i < finalMean.size(); ++i) {
    meanText += fmt::format("{}{:.6f}", i == 0 ? "" : ", ", finalMean(i));
  }
  fmt::print("{}: final mean [{}] trace(P) {:.6e}\n", name, meanText, result.covarianceHistory.back().trace());
  fmt::print("{}: innovation statistic mean {:.4f} over {} samples (expected {})\n", name, metrics.mean(),
             metrics.count(), nz);
  if (nz == 1) {
    fmt::print("{}: {:.1f}% of samples within the 95% bound\n", name, 100.0 * metrics.fractionWithinBound());
  }
}

} // namespace

int main(int argc, char** argv) {
  batchest::Logger::Initialize();
  CommandLine_t cmd;
  try {
    cmd = readCommandLine(argc, argv);
  } catch (const batchest::ConfigurationError& ex) {
    fmt::print("batchest_cli: {}\n{}", ex.what(), kUsage);
    return 2;
  }
  if (cmd.showHelp) {
    fmt::print("{}", kUsage);
    return 0;
  }

  try {
    const nlohmann::json config = readConfigFile(cmd.configPath);
    batchest::Logger::Configure(batchest::parseLoggingConfig(config.value("logging", nlohmann::json())));
    if (auto logger = batchest::Logger::Get()) {
      logger->info("batchest_cli using config: {}", cmd.configPath);
    }

    const nlohmann::json datasetNode = config.value("dataset", nlohmann::json::object());
    std::string datasetPath = datasetNode.value("path", "");
    if (!cmd.datasetPath.empty()) {
      datasetPath = cmd.datasetPath;
    }

    const nlohmann::json filterNode = config.value("filter", nlohmann::json::object());
    std::string filterType = filterNode.value("type", "both");
    if (!cmd.filterType.empty()) {
      filterType = cmd.filterType;
    }
    const batchest::EstimatorOptions_t options =
        batchest::parseEstimatorOptions(filterNode.value("params", nlohmann::json()));

    const std::shared_ptr<const batchest::BatchProblem_t> problem = buildProblem(config, datasetPath);
    const int nz = static_cast<int>(problem->measurementNoise.rows());

    if (filterType == "both") {
      const batchest::BatchResult_t lkf = batchest::runBatch<batchest::LKF>(problem, options);
      const batchest::BatchResult_t esrif = batchest::runBatch<batchest::ESRIF>(problem, options);
      printSummary("LKF", lkf, nz);
      printSummary("ESRIF", esrif, nz);
      double maxDiff = 0.0;
      for (Eigen::Index k = static_cast<Eigen::Index>(options.startIndex); k < lkf.meanHistory.cols(); ++k) {
        maxDiff = std::max(maxDiff, (lkf.meanHistory.col(k) - esrif.meanHistory.col(k)).cwiseAbs().maxCoeff());
      }
      fmt::print("max |LKF - ESRIF| mean difference {:.3e}\n", maxDiff);
    } else if (batchest::parseEstimatorType(filterType) == batchest::EstimatorType_e::kLkf) {
      printSummary("LKF", batchest::runBatch<batchest::LKF>(problem, options), nz);
    } else {
      printSummary("ESRIF", batchest::runBatch<batchest::ESRIF>(problem, options), nz);
    }
  } catch (const std::exception& ex) {
    if (auto logger = batchest::Logger::Get()) {
      logger->error("batchest_cli failed: {}", ex.what());
    } else {
      fmt::print("batchest_cli failed: {}\n", ex.what());
    }
    return 1;
  }

  if (auto logger = batchest::Logger::Get()) {
    logger->info("batchest_cli done");
  } else {
    fmt::print("batchest_cli done\n");
  }
  return 0;
}
