#include "stats.hpp"

#include "../errors.hpp"

namespace pr {

auto ColumnMean(Eigen::Ref<Matrix const> const &X) -> Vector
{
  if (X.rows() == 0) { throw InvalidInput("Stats", "Cannot take the mean of zero observations"); }
  return X.colwise().mean().transpose();
}

auto Center(Eigen::Ref<Matrix const> const &X, Eigen::Ref<Vector const> const &mean) -> Matrix
{
  if (X.cols() != mean.rows()) {
    throw DimensionMismatch("Stats", "Data had {} features but the mean has {}", X.cols(), mean.rows());
  }
  Matrix centered = X.rowwise() - mean.transpose();
  return centered;
}

auto Covariance(Eigen::Ref<Matrix const> const &X, bool const demean) -> Matrix
{
  if (X.rows() == 0) { throw InvalidInput("Stats", "Cannot form a covariance from zero observations"); }
  double const m = X.rows();
  if (demean) {
    Matrix const dm = Center(X, ColumnMean(X));
    return (dm.transpose() * dm) / m;
  } else {
    return (X.transpose() * X) / m;
  }
}

auto AllFinite(Eigen::Ref<Matrix const> const &X) -> bool { return X.allFinite(); }

} // namespace pr
