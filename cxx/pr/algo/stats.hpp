#pragma once

#include "../types.hpp"

// Statistical Utilities. Observations are rows, features are columns.

namespace pr {

auto ColumnMean(Eigen::Ref<Matrix const> const &X) -> Vector;
auto Center(Eigen::Ref<Matrix const> const &X, Eigen::Ref<Vector const> const &mean) -> Matrix;
auto Covariance(Eigen::Ref<Matrix const> const &X, bool const demean = true) -> Matrix; // Biased, divides by rows
auto AllFinite(Eigen::Ref<Matrix const> const &X) -> bool;

} // namespace pr
