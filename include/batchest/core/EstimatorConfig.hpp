#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "batchest/core/Estimator.hpp"
#include "batchest/core/Logger.hpp"

namespace batchest {

enum class EstimatorType_e {
  kLkf,
  kEsrif
};

// "lkf"/"ekf" or "esrif"/"srif". Throws ConfigurationError otherwise.
EstimatorType_e parseEstimatorType(const std::string& value);
const char* toString(EstimatorType_e type);

// Reads "integrationSubsteps" and "startIndex" from a params object. Absent
// keys keep their defaults; keys of the wrong type throw ConfigurationError.
EstimatorOptions_t parseEstimatorOptions(const nlohmann::json& params);

// Reads the "logging" section: enabled, level, file {enabled, path,
// maxSizeBytes, maxFiles}, classLogs {enabled, directory, maxSizeBytes,
// maxFiles}. Absent keys keep the LoggingConfig_t defaults.
LoggingConfig_t parseLoggingConfig(const nlohmann::json& node);

// Nested numeric arrays. A scalar is read as a 1x1 matrix / 1-vector.
Matrix parseMatrix(const nlohmann::json& node, const std::string& name);
Vector parseVector(const nlohmann::json& node, const std::string& name);

} // namespace batchest
