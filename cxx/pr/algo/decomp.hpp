#pragma once

#include "../types.hpp"

// Wrappers for dynamic decomps so only compile once

namespace pr {

template <typename Scalar = double> struct Eig
{
  using Matrix = Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic>;
  using RealArray = Eigen::Array<typename Eigen::NumTraits<Scalar>::Real, Eigen::Dynamic, 1>;
  Eig(Eigen::Ref<Matrix const> const &gramian); // Eigenvalues are returned in descending order
  Matrix    P;
  RealArray V;
};

template <typename Scalar = double> struct SVD
{
  using Matrix = Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic>;
  using RealArray = Eigen::Array<typename Eigen::NumTraits<Scalar>::Real, Eigen::Dynamic, 1>;
  SVD(Eigen::Ref<Matrix const> const &mat); // Left singular vectors only
  Matrix    U;
  RealArray S;
};

enum struct Solver
{
  Eig,
  SVD
};

/*
 * Eigen-decomposition of a symmetric positive semi-definite matrix, C = U diag(S) U^T.
 * S is sorted descending and clamped at zero, U has orthonormal columns in the same order.
 */
struct Spectrum
{
  Matrix U;
  Array  S;
};

auto DecomposeSymmetric(Eigen::Ref<Matrix const> const &C, Solver const solver = Solver::Eig) -> Spectrum;

// Flip each column so its largest magnitude entry is positive
void NormalizeSigns(Matrix &U);

} // namespace pr
