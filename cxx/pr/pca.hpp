#pragma once

#include "algo/decomp.hpp"
#include "types.hpp"

namespace pr {

/*
 * Principal Component Analysis of an observation matrix (one observation per row, one feature per column).
 *
 * fit() centers a copy of the data, forms the biased covariance and decomposes it. The resulting basis holds all n
 * eigenvectors in descending order of eigenvalue, the first p of which span the reduced space.
 *
 * project() and inverse() apply the reduced basis to whatever they are given and do not touch the mean, callers
 * that want centering handled for them should use transform() and reconstruct() instead.
 */
struct Reducer
{
  struct Opts
  {
    Solver solver;
    bool   normalizeSigns;
  };

  Reducer(Index const p);
  Reducer(Index const p, Opts const &opts);

  auto fit(Eigen::Ref<Matrix const> const &X) -> Reducer &;
  auto restore(Eigen::Ref<Vector const> const &mean,
               Eigen::Ref<Matrix const> const &basis,
               Eigen::Ref<Array const> const  &values,
               Index const                     samples) -> Reducer &;

  auto project(Eigen::Ref<Matrix const> const &X) const -> Matrix;
  auto inverse(Eigen::Ref<Matrix const> const &Xr) const -> Matrix;
  auto transform(Eigen::Ref<Matrix const> const &X) const -> Matrix;
  auto reconstruct(Eigen::Ref<Matrix const> const &Xr) const -> Matrix;

  // False when the fitted data was constant up to round-off, when explained variance is undefined
  auto hasVariance() const -> bool;
  auto explainedVariance() const -> double;
  auto explainedVariance(Index const q) const -> double; // Fraction of the total variance in the first q components
  auto cumulativeVariance() const -> Array;

  auto fitted() const -> bool;
  auto components() const -> Index;
  auto features() const -> Index;
  auto samples() const -> Index;
  auto mean() const -> Vector const &;
  auto basis() const -> Matrix const &;
  auto reducedBasis() const -> Matrix;
  auto eigenvalues() const -> Array const &;
  auto options() const -> Opts const &;

private:
  void checkFitted(std::string const &op) const;

  Index  p_;
  Opts   opts_;
  bool   fitted_ = false;
  Index  samples_ = 0;
  Vector mean_;
  Matrix U_;
  Array  S_;
};

} // namespace pr
