#include "batchest/core/Logger.hpp"

#include <filesystem>
#include <mutex>
#include <unordered_map>
#include <utility>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "batchest/core/Errors.hpp"

namespace batchest {

namespace {

constexpr const char* kRootName = "batchest";
constexpr const char* kPattern = "[%H:%M:%S.%e] [%^%l%$] [%n] %v";

// Guards every global below. Estimator runs on separate threads share them.
std::recursive_mutex gMutex;
std::shared_ptr<spdlog::logger> gLogger;
LoggingConfig_t gConfig{};
std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> gClassLoggers;

const std::pair<const char*, spdlog::level::level_enum> kLevelNames[] = {
    {"trace", spdlog::level::trace}, {"debug", spdlog::level::debug},   {"info", spdlog::level::info},
    {"warn", spdlog::level::warn},   {"warning", spdlog::level::warn},  {"error", spdlog::level::err},
    {"err", spdlog::level::err},     {"critical", spdlog::level::critical}, {"off", spdlog::level::off},
};

void BuildLogger() {
  spdlog::drop(kRootName);
  gLogger.reset();
  if (!gConfig.enabled) {
    return;
  }

  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

  std::string fileSinkError;
  if (gConfig.file.enabled) {
    const std::filesystem::path logPath(gConfig.file.path);
    if (logPath.has_parent_path()) {
      std::error_code ec;
      std::filesystem::create_directories(logPath.parent_path(), ec);
    }
    try {
      sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          gConfig.file.path, gConfig.file.maxSizeBytes, gConfig.file.maxFiles));
    } catch (const spdlog::spdlog_ex& ex) {
      fileSinkError = ex.what();
    }
  }

  gLogger = std::make_shared<spdlog::logger>(kRootName, sinks.begin(), sinks.end());
  gLogger->set_pattern(kPattern);
  gLogger->set_level(gConfig.level);
  spdlog::register_logger(gLogger);

  if (!fileSinkError.empty()) {
    gLogger->warn("Logger: file sink '{}' unavailable, logging to stdout only: {}", gConfig.file.path, fileSinkError);
  }
}

std::shared_ptr<spdlog::logger> BuildClassLogger(const std::string& name) {
  const std::filesystem::path dir(gConfig.classLogs.directory);
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  const std::filesystem::path path = dir / (name + ".log");
  try {
    auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        path.string(), gConfig.classLogs.maxSizeBytes, gConfig.classLogs.maxFiles);
    auto logger = std::make_shared<spdlog::logger>(name, sink);
    logger->set_pattern(kPattern);
    logger->set_level(gConfig.level);
    spdlog::drop(name);
    spdlog::register_logger(logger);
    return logger;
  } catch (const spdlog::spdlog_ex& ex) {
    if (gLogger) {
      gLogger->warn("Logger: class sink '{}' unavailable: {}", path.string(), ex.what());
    }
    return nullptr;
  }
}

} // namespace

void Logger::Initialize() {
  std::lock_guard<std::recursive_mutex> lock(gMutex);
  if (!gLogger && gConfig.enabled) {
    BuildLogger();
  }
}

void Logger::Configure(const LoggingConfig_t& config) {
  std::lock_guard<std::recursive_mutex> lock(gMutex);
  gConfig = config;
  gClassLoggers.clear();
  BuildLogger();
}

LoggingConfig_t Logger::Current() {
  std::lock_guard<std::recursive_mutex> lock(gMutex);
  return gConfig;
}

std::shared_ptr<spdlog::logger> Logger::Get() {
  std::lock_guard<std::recursive_mutex> lock(gMutex);
  if (!gConfig.enabled) {
    return nullptr;
  }
  if (!gLogger) {
    BuildLogger();
  }
  return gLogger;
}

// Falls back to the root logger when component sinks are off or cannot be
// opened.
std::shared_ptr<spdlog::logger> Logger::GetClass(const std::string& name) {
  std::lock_guard<std::recursive_mutex> lock(gMutex);
  if (!gConfig.enabled || !gConfig.classLogs.enabled) {
    return Get();
  }
  auto it = gClassLoggers.find(name);
  if (it != gClassLoggers.end()) {
    return it->second;
  }
  auto logger = BuildClassLogger(name);
  if (logger) {
    gClassLoggers[name] = logger;
    return logger;
  }
  return Get();
}

spdlog::level::level_enum Logger::ParseLevel(const std::string& value) {
  for (const auto& entry : kLevelNames) {
    if (value == entry.first) {
      return entry.second;
    }
  }
  throw ConfigurationError("unknown log level '" + value + "'");
}

} // namespace batchest
