#pragma once

#include <vector>

#include <Eigen/Dense>

namespace batchest {
using Vector = Eigen::VectorXd;
using Matrix = Eigen::MatrixXd;
using VectorList = std::vector<Vector>;
} // namespace batchest
