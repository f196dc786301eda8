#include "pca.hpp"

#include "algo/stats.hpp"
#include "errors.hpp"
#include "log/debug.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <limits>

namespace pr {

Reducer::Reducer(Index const p)
  : Reducer(p, Opts{.solver = Solver::Eig, .normalizeSigns = true})
{
}

Reducer::Reducer(Index const p, Opts const &opts)
  : p_{p}
  , opts_{opts}
{
  if (p_ < 1) { throw InvalidConfiguration("PCA", "Number of components must be at least 1, was {}", p_); }
}

auto Reducer::fit(Eigen::Ref<Matrix const> const &X) -> Reducer &
{
  Index const m = X.rows();
  Index const n = X.cols();
  if (m < 1 || n < 1) { throw InvalidInput("PCA", "Data must have at least one row and column, was {}x{}", m, n); }
  if (p_ > n) { throw DimensionMismatch("PCA", "Requested {} components but data only has {} features", p_, n); }
  if (!AllFinite(X)) { throw InvalidInput("PCA", "Data contains non-finite values"); }

  Log::Print("PCA", "Fitting {} samples of {} features", m, n);
  auto const   start = Log::Now();
  Vector       mean = ColumnMean(X);
  Matrix const centered = Center(X, mean);
  Matrix const C = Covariance(centered, false);
  if (Log::IsDebugging()) { Log::Dump("covariance", C); }

  Spectrum spectrum = DecomposeSymmetric(C, opts_.solver);
  if (opts_.normalizeSigns) { NormalizeSigns(spectrum.U); }

  // Nothing below can throw, so a failure above leaves the previous fit untouched
  mean_ = std::move(mean);
  U_ = std::move(spectrum.U);
  S_ = std::move(spectrum.S);
  samples_ = m;
  fitted_ = true;
  Log::Print("PCA", "Fit took {}. Largest eigenvalue {}", Log::ToNow(start), S_(0));
  return *this;
}

auto Reducer::restore(Eigen::Ref<Vector const> const &mean,
                      Eigen::Ref<Matrix const> const &basis,
                      Eigen::Ref<Array const> const  &values,
                      Index const                     samples) -> Reducer &
{
  Index const n = mean.rows();
  if (n < 1) { throw InvalidInput("PCA", "Restored mean was empty"); }
  if (basis.rows() != n || basis.cols() != n) {
    throw DimensionMismatch("PCA", "Restored basis was {}x{}, expected {}x{}", basis.rows(), basis.cols(), n, n);
  }
  if (values.rows() != n) { throw DimensionMismatch("PCA", "Restored {} eigenvalues, expected {}", values.rows(), n); }
  if (p_ > n) { throw DimensionMismatch("PCA", "Requested {} components but model only has {} features", p_, n); }
  if (!mean.allFinite() || !basis.allFinite() || !values.allFinite()) {
    throw InvalidInput("PCA", "Restored model contains non-finite values");
  }
  if ((values < 0.).any()) { throw InvalidInput("PCA", "Restored eigenvalues must be non-negative"); }
  for (Index ii = 1; ii < n; ii++) {
    if (values(ii) > values(ii - 1)) { throw InvalidInput("PCA", "Restored eigenvalues must be in descending order"); }
  }
  if (samples < 1) { throw InvalidInput("PCA", "Restored sample count must be positive, was {}", samples); }

  mean_ = mean;
  U_ = basis;
  S_ = values;
  samples_ = samples;
  fitted_ = true;
  Log::Print("PCA", "Restored model with {} features", n);
  return *this;
}

void Reducer::checkFitted(std::string const &op) const
{
  if (!fitted_) { throw NotFitted("PCA", "Cannot {} before the model has been fitted", op); }
}

auto Reducer::project(Eigen::Ref<Matrix const> const &X) const -> Matrix
{
  checkFitted("project");
  if (X.cols() != features()) { throw DimensionMismatch("PCA", "Data has {} features, model has {}", X.cols(), features()); }
  return X * U_.leftCols(p_);
}

auto Reducer::inverse(Eigen::Ref<Matrix const> const &Xr) const -> Matrix
{
  checkFitted("invert");
  if (Xr.cols() != p_) { throw DimensionMismatch("PCA", "Reduced data has {} components, model has {}", Xr.cols(), p_); }
  return Xr * U_.leftCols(p_).transpose();
}

auto Reducer::transform(Eigen::Ref<Matrix const> const &X) const -> Matrix
{
  checkFitted("transform");
  if (X.cols() != features()) { throw DimensionMismatch("PCA", "Data has {} features, model has {}", X.cols(), features()); }
  return (X.rowwise() - mean_.transpose()) * U_.leftCols(p_);
}

auto Reducer::reconstruct(Eigen::Ref<Matrix const> const &Xr) const -> Matrix
{
  Matrix recon = inverse(Xr);
  recon.rowwise() += mean_.transpose();
  return recon;
}

auto Reducer::hasVariance() const -> bool
{
  checkFitted("check the variance");
  // Centering constant data leaves round-off of up to max(m, n) * eps * |mean| in each entry
  double const tol = std::numeric_limits<double>::epsilon() * std::max(samples_, features());
  return S_.sum() > tol * tol * std::max(mean_.squaredNorm(), std::numeric_limits<double>::min());
}

auto Reducer::explainedVariance() const -> double { return explainedVariance(p_); }

auto Reducer::explainedVariance(Index const q) const -> double
{
  checkFitted("calculate explained variance");
  if (q < 1 || q > features()) {
    throw DimensionMismatch("PCA", "Explained variance requested for {} components, must be 1-{}", q, features());
  }
  if (!hasVariance()) { throw InvalidState("PCA", "Total variance is zero, explained variance is undefined"); }
  return S_.head(q).sum() / S_.sum();
}

auto Reducer::cumulativeVariance() const -> Array
{
  checkFitted("calculate explained variance");
  if (!hasVariance()) { throw InvalidState("PCA", "Total variance is zero, explained variance is undefined"); }
  Array cumsum(S_.rows());
  std::partial_sum(S_.begin(), S_.end(), cumsum.begin());
  cumsum /= cumsum(cumsum.rows() - 1);
  return cumsum;
}

auto Reducer::fitted() const -> bool { return fitted_; }
auto Reducer::components() const -> Index { return p_; }
auto Reducer::features() const -> Index { return mean_.rows(); }
auto Reducer::samples() const -> Index { return samples_; }
auto Reducer::options() const -> Opts const & { return opts_; }

auto Reducer::mean() const -> Vector const &
{
  checkFitted("get the mean");
  return mean_;
}

auto Reducer::basis() const -> Matrix const &
{
  checkFitted("get the basis");
  return U_;
}

auto Reducer::reducedBasis() const -> Matrix
{
  checkFitted("get the basis");
  return U_.leftCols(p_);
}

auto Reducer::eigenvalues() const -> Array const &
{
  checkFitted("get the eigenvalues");
  return S_;
}

} // namespace pr
