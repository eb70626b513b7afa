#include "batchest/core/EstimatorConfig.hpp"

#include <cstddef>
#include <string>

#include "batchest/core/Errors.hpp"
#include "batchest/core/Logger.hpp"

namespace batchest {

namespace {

const nlohmann::json& requireObject(const nlohmann::json& node, const std::string& name) {
  if (!node.is_object()) {
    throw ConfigurationError(name + " must be an object");
  }
  return node;
}

void readFlag(const nlohmann::json& node, const char* key, const std::string& section, bool& out) {
  auto it = node.find(key);
  if (it == node.end()) {
    return;
  }
  if (!it->is_boolean()) {
    throw ConfigurationError(section + "." + key + " must be true or false");
  }
  out = it->get<bool>();
}

void readSize(const nlohmann::json& node, const char* key, const std::string& section, std::size_t& out) {
  auto it = node.find(key);
  if (it == node.end()) {
    return;
  }
  if (!it->is_number_unsigned() || it->get<std::size_t>() == 0) {
    throw ConfigurationError(section + "." + key + " must be a positive integer");
  }
  out = it->get<std::size_t>();
}

void readText(const nlohmann::json& node, const char* key, const std::string& section, std::string& out) {
  auto it = node.find(key);
  if (it == node.end()) {
    return;
  }
  if (!it->is_string() || it->get<std::string>().empty()) {
    throw ConfigurationError(section + "." + key + " must be a non-empty string");
  }
  out = it->get<std::string>();
}

} // namespace

EstimatorType_e parseEstimatorType(const std::string& value) {
  if (value == "lkf" || value == "ekf") {
    return EstimatorType_e::kLkf;
  }
  if (value == "esrif" || value == "srif") {
    return EstimatorType_e::kEsrif;
  }
  throw ConfigurationError("unknown estimator type '" + value + "'");
}

const char* toString(EstimatorType_e type) {
  switch (type) {
    case EstimatorType_e::kLkf:
      return "lkf";
    case EstimatorType_e::kEsrif:
      return "esrif";
  }
  return "unknown";
}

EstimatorOptions_t parseEstimatorOptions(const nlohmann::json& params) {
  EstimatorOptions_t options;
  if (params.is_null()) {
    return options;
  }
  if (!params.is_object()) {
    throw ConfigurationError("estimator params must be an object");
  }

  auto substepsIt = params.find("integrationSubsteps");
  if (substepsIt != params.end()) {
    if (!substepsIt->is_number_integer()) {
      throw ConfigurationError("integrationSubsteps must be an integer");
    }
    options.integrationSubsteps = substepsIt->get<int>();
  }

  auto startIt = params.find("startIndex");
  if (startIt != params.end()) {
    if (!startIt->is_number_integer() || startIt->get<long long>() < 0) {
      throw ConfigurationError("startIndex must be a non-negative integer");
    }
    options.startIndex = startIt->get<std::size_t>();
  }

  for (auto it = params.begin(); it != params.end(); ++it) {
    if (it.key() != "integrationSubsteps" && it.key() != "startIndex") {
      if (auto logger = Logger::Get()) {
        logger->warn("EstimatorConfig: ignoring unknown option '{}'", it.key());
      }
    }
  }
  return options;
}

LoggingConfig_t parseLoggingConfig(const nlohmann::json& node) {
  LoggingConfig_t config;
  if (node.is_null()) {
    return config;
  }
  requireObject(node, "logging");
  readFlag(node, "enabled", "logging", config.enabled);
  std::string level;
  readText(node, "level", "logging", level);
  if (!level.empty()) {
    config.level = Logger::ParseLevel(level);
  }

  if (node.contains("file")) {
    const nlohmann::json& fileNode = requireObject(node["file"], "logging.file");
    readFlag(fileNode, "enabled", "logging.file", config.file.enabled);
    readText(fileNode, "path", "logging.file", config.file.path);
    readSize(fileNode, "maxSizeBytes", "logging.file", config.file.maxSizeBytes);
    readSize(fileNode, "maxFiles", "logging.file", config.file.maxFiles);
  }
  if (node.contains("classLogs")) {
    const nlohmann::json& classNode = requireObject(node["classLogs"], "logging.classLogs");
    readFlag(classNode, "enabled", "logging.classLogs", config.classLogs.enabled);
    readText(classNode, "directory", "logging.classLogs", config.classLogs.directory);
    readSize(classNode, "maxSizeBytes", "logging.classLogs", config.classLogs.maxSizeBytes);
    readSize(classNode, "maxFiles", "logging.classLogs", config.classLogs.maxFiles);
  }
  return config;
}

Matrix parseMatrix(const nlohmann::json& node, const std::string& name) {
  if (node.is_number()) {
    return Matrix::Constant(1, 1, node.get<double>());
  }
  if (!node.is_array() || node.empty()) {
    throw ConfigurationError(name + " must be a non-empty array of rows");
  }
  const auto rows = static_cast<Eigen::Index>(node.size());
  // A flat array is a single row.
  if (!node[0].is_array()) {
    const Vector row = parseVector(node, name);
    return row.transpose();
  }
  const auto cols = static_cast<Eigen::Index>(node[0].size());
  Matrix m(rows, cols);
  for (Eigen::Index r = 0; r < rows; ++r) {
    const nlohmann::json& rowNode = node[static_cast<std::size_t>(r)];
    if (!rowNode.is_array() || static_cast<Eigen::Index>(rowNode.size()) != cols) {
      throw ConfigurationError(name + ": row " + std::to_string(r) + " must have " + std::to_string(cols) +
                               " entries");
    }
    for (Eigen::Index c = 0; c < cols; ++c) {
      const nlohmann::json& value = rowNode[static_cast<std::size_t>(c)];
      if (!value.is_number()) {
        throw ConfigurationError(name + ": entry (" + std::to_string(r) + ", " + std::to_string(c) +
                                 ") is not a number");
      }
      m(r, c) = value.get<double>();
    }
  }
  return m;
}

Vector parseVector(const nlohmann::json& node, const std::string& name) {
  if (node.is_number()) {
    return Vector::Constant(1, node.get<double>());
  }
  if (!node.is_array()) {
    throw ConfigurationError(name + " must be an array of numbers");
  }
  Vector v(static_cast<Eigen::Index>(node.size()));
  for (std::size_t i = 0; i < node.size(); ++i) {
    if (!node[i].is_number()) {
      throw ConfigurationError(name + ": entry " + std::to_string(i) + " is not a number");
    }
    v(static_cast<Eigen::Index>(i)) = node[i].get<double>();
  }
  return v;
}

} // namespace batchest
