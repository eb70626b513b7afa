#include "batchest/data/AsciiHistorySource.hpp"

#include <sstream>
#include <utility>

#include "batchest/core/Errors.hpp"
#include "batchest/core/Logger.hpp"

namespace batchest {

AsciiHistorySource::AsciiHistorySource(const std::string& pathInput, int controlDimInput, int measurementDimInput)
    : fileStream(pathInput), path(pathInput), controlDim(controlDimInput), measurementDim(measurementDimInput) {
  if (controlDim < 0 || measurementDim <= 0) {
    throw ConfigurationError("AsciiHistorySource: need nu >= 0 and nz > 0");
  }
  if (auto logger = Logger::GetClass("AsciiHistorySource")) {
    logger->info("AsciiHistorySource opening {} (nu {} nz {})", path, controlDim, measurementDim);
  }
}

bool AsciiHistorySource::good() const {
  return fileStream.good();
}

bool AsciiHistorySource::next(HistorySample_t& out) {
  std::string line;
  while (std::getline(fileStream, line)) {
    ++lineNumber;
    const auto first = line.find_first_not_of(" \t\r");
    if (first == std::string::npos || line[first] == '#') {
      continue;
    }

    std::istringstream iss(line);
    HistorySample_t sample;
    sample.control = Vector::Zero(controlDim);
    sample.measurement = Vector::Zero(measurementDim);
    bool ok = static_cast<bool>(iss >> sample.time);
    for (int i = 0; ok && i < controlDim; ++i) {
      ok = static_cast<bool>(iss >> sample.control(i));
    }
    for (int i = 0; ok && i < measurementDim; ++i) {
      ok = static_cast<bool>(iss >> sample.measurement(i));
    }
    std::string trailing;
    if (ok && (iss >> trailing)) {
      ok = false;
    }

    if (!ok) {
      ++invalidLineCount;
      if (invalidLineCount == 1 || invalidLineCount % 100 == 0) {
        if (auto logger = Logger::Get()) {
          logger->warn("Skipping invalid history line {} in {} ({} errors so far).", lineNumber, path,
                       invalidLineCount);
        }
      }
      continue;
    }

    out = std::move(sample);
    return true;
  }
  return false;
}

TimeHistory_t AsciiHistorySource::readAll(double initialTime) {
  TimeHistory_t history;
  history.initialTime = initialTime;
  HistorySample_t sample;
  while (next(sample)) {
    history.times.push_back(sample.time);
    if (controlDim > 0) {
      history.controls.push_back(sample.control);
    }
    history.measurements.push_back(sample.measurement);
  }
  if (auto logger = Logger::GetClass("AsciiHistorySource")) {
    logger->info("AsciiHistorySource read {} samples ({} invalid lines) from {}", history.sampleCount(),
                 invalidLineCount, path);
  }
  return history;
}

} // namespace batchest
