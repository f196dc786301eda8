#pragma once

// Intellisense gives false positives with Eigen+ARM
#if __INTELLISENSE__
#undef __ARM_NEON
#undef __ARM_NEON__
#endif

#ifdef DEBUG
#define EIGEN_INITIALIZE_MATRICES_BY_NAN
#endif

#include <Eigen/Dense>

#include <numeric>

using Index = Eigen::Index;

namespace pr {

// Observations are stored one per row, features one per column
using Matrix = Eigen::MatrixXd;
using Vector = Eigen::VectorXd;
using Array = Eigen::ArrayXd;

} // namespace pr
