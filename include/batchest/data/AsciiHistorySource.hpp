#pragma once

#include <cstddef>
#include <fstream>
#include <string>

#include "batchest/core/Estimator.hpp"

namespace batchest {

// One line of a recorded history.
struct HistorySample_t {
  double time = 0.0;
  Vector control;
  Vector measurement;
};

// Reads a whitespace-separated history, one sample per line:
//   t u_1 .. u_nu z_1 .. z_nz
// Blank lines and lines starting with '#' are skipped. Malformed lines are
// counted and skipped.
class AsciiHistorySource {
public:
  AsciiHistorySource(const std::string& path, int controlDim, int measurementDim);

  bool next(HistorySample_t& out);
  bool good() const;
  std::size_t invalidLines() const { return invalidLineCount; }

  // Reads every remaining sample. Controls are left empty when nu is 0.
  TimeHistory_t readAll(double initialTime = 0.0);

private:
  std::ifstream fileStream;
  std::string path;
  int controlDim = 0;
  int measurementDim = 0;
  std::size_t lineNumber = 0;
  std::size_t invalidLineCount = 0;
};

} // namespace batchest
