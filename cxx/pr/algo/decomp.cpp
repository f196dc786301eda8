#include "decomp.hpp"

#include "../errors.hpp"
#include "../log/log.hpp"

#include <Eigen/Eigenvalues>
#include <Eigen/SVD>

namespace pr {

template <typename S> Eig<S>::Eig(Eigen::Ref<Matrix const> const &g)
{
  if (g.rows() != g.cols()) {
    throw DimensionMismatch("Eig", "This is for self-adjoint Eigensystems, matrix was {}x{}", g.rows(), g.cols());
  }
  Eigen::SelfAdjointEigenSolver<Matrix> eig(g);
  if (eig.info() != Eigen::Success) { throw DecompositionFailed("Eig", "Eigensolver did not converge"); }
  V = eig.eigenvalues().reverse();
  P = eig.eigenvectors().rowwise().reverse();
}
template struct Eig<double>;

template <typename S> SVD<S>::SVD(Eigen::Ref<Matrix const> const &mat)
{
  Eigen::BDCSVD<Matrix> const svd(mat, Eigen::ComputeThinU);
  if (svd.info() != Eigen::Success) { throw DecompositionFailed("SVD", "SVD did not converge"); }
  S = svd.singularValues();
  U = svd.matrixU();
}
template struct SVD<double>;

auto DecomposeSymmetric(Eigen::Ref<Matrix const> const &C, Solver const solver) -> Spectrum
{
  if (C.rows() != C.cols()) { throw DimensionMismatch("Decomp", "Matrix must be square, was {}x{}", C.rows(), C.cols()); }
  if (C.size() == 0) { throw InvalidInput("Decomp", "Cannot decompose an empty matrix"); }
  if (!C.allFinite()) { throw InvalidInput("Decomp", "Matrix contains non-finite entries"); }

  auto const start = Log::Now();
  Spectrum   spectrum;
  switch (solver) {
  case Solver::Eig: {
    Eig<double> const eig(C);
    spectrum.U = eig.P;
    spectrum.S = eig.V;
  } break;
  case Solver::SVD: {
    // For a symmetric PSD matrix the left singular vectors are the eigenvectors
    SVD<double> const svd(C);
    spectrum.U = svd.U;
    spectrum.S = svd.S;
  } break;
  }
  if (!spectrum.U.allFinite() || !spectrum.S.allFinite()) {
    throw DecompositionFailed("Decomp", "Decomposition produced non-finite values");
  }
  Index const negative = (spectrum.S < 0.).count();
  if (negative) { Log::Debug("Decomp", "Clamping {} negative eigenvalues, smallest {}", negative, spectrum.S.minCoeff()); }
  spectrum.S = spectrum.S.max(0.);
  Log::Debug("Decomp", "{}x{} {} decomposition took {}", C.rows(), C.cols(), solver == Solver::Eig ? "Eig" : "SVD",
             Log::ToNow(start));
  return spectrum;
}

void NormalizeSigns(Matrix &U)
{
  for (Index ic = 0; ic < U.cols(); ic++) {
    Index ir = 0;
    U.col(ic).cwiseAbs().maxCoeff(&ir);
    if (U(ir, ic) < 0.) { U.col(ic) *= -1.; }
  }
}

} // namespace pr
