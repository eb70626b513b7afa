#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include <spdlog/common.h>
#include <spdlog/logger.h>

namespace batchest {

// Rotating file shared with the console logger.
struct FileSinkConfig_t {
  bool enabled = false;
  std::string path = "logs/batchest.log";
  std::size_t maxSizeBytes = 5 * 1024 * 1024;
  std::size_t maxFiles = 3;
};

// One rotating file per named component ("LKF", "ESRIF", "AsciiHistorySource").
struct ClassSinkConfig_t {
  bool enabled = false;
  std::string directory = "logs/components";
  std::size_t maxSizeBytes = 2 * 1024 * 1024;
  std::size_t maxFiles = 2;
};

struct LoggingConfig_t {
  bool enabled = true;
  spdlog::level::level_enum level = spdlog::level::info;
  FileSinkConfig_t file;
  ClassSinkConfig_t classLogs;
};

// Process-wide logging facade. All calls are thread-safe. Get and GetClass
// return nullptr while logging is disabled.
class Logger {
 public:
  static void Initialize();
  // Replaces the whole configuration and rebuilds the sinks once.
  static void Configure(const LoggingConfig_t& config);
  static LoggingConfig_t Current();
  static std::shared_ptr<spdlog::logger> Get();
  static std::shared_ptr<spdlog::logger> GetClass(const std::string& name);
  // trace, debug, info, warn/warning, error/err, critical, off.
  // Throws ConfigurationError for anything else.
  static spdlog::level::level_enum ParseLevel(const std::string& value);
};

} // namespace batchest
