#include "pr/algo/decomp.hpp"
#include "pr/algo/stats.hpp"
#include "pr/errors.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include <limits>

using namespace pr;
using namespace Catch;

TEST_CASE("decomp", "[decomp]")
{
  Index const nvar = 16;
  Index const nsamp = 128;

  Matrix const data = Matrix::Random(nsamp, nvar);
  Matrix const cov = Covariance(data);

  SECTION("Eig")
  {
    Eig<double> eig(cov);
    for (Index ii = 0; ii < nvar - 1; ii++) {
      CHECK(eig.V(ii) >= eig.V(ii + 1));
    }
    Matrix const recon = eig.P * eig.V.matrix().asDiagonal() * eig.P.transpose();
    CHECK((recon - cov).norm() == Approx(0.).margin(1.e-10));
  }

  SECTION("SVD of a covariance matches its eigenvalues")
  {
    SVD<double> svd(cov);
    Eig<double> eig(cov);
    REQUIRE(svd.S.rows() == nvar);
    for (Index ii = 0; ii < nvar; ii++) {
      CHECK(svd.S(ii) == Approx(eig.V(ii)).margin(1.e-10));
    }
    Matrix const UtU = svd.U.transpose() * svd.U;
    CHECK((UtU - Matrix::Identity(nvar, nvar)).cwiseAbs().maxCoeff() < 1.e-9);
  }

  SECTION("Symmetric")
  {
    auto const solver = GENERATE(Solver::Eig, Solver::SVD);
    auto const spectrum = DecomposeSymmetric(cov, solver);
    REQUIRE(spectrum.U.rows() == nvar);
    REQUIRE(spectrum.U.cols() == nvar);
    REQUIRE(spectrum.S.rows() == nvar);
    Matrix const UtU = spectrum.U.transpose() * spectrum.U;
    CHECK((UtU - Matrix::Identity(nvar, nvar)).cwiseAbs().maxCoeff() < 1.e-9);
    Matrix const recon = spectrum.U * spectrum.S.matrix().asDiagonal() * spectrum.U.transpose();
    CHECK((recon - cov).norm() == Approx(0.).margin(1.e-10));
    CHECK(spectrum.S.minCoeff() >= 0.);
  }

  SECTION("Known spectrum")
  {
    Matrix C(3, 3);
    C << 1., 0., 0., //
      0., 5., 0.,    //
      0., 0., 3.;
    auto const spectrum = DecomposeSymmetric(C);
    CHECK(spectrum.S(0) == Approx(5.));
    CHECK(spectrum.S(1) == Approx(3.));
    CHECK(spectrum.S(2) == Approx(1.));
    CHECK(std::abs(spectrum.U(1, 0)) == Approx(1.));
    CHECK(std::abs(spectrum.U(2, 1)) == Approx(1.));
  }

  SECTION("Negative eigenvalues are clamped")
  {
    Matrix C = Matrix::Zero(2, 2);
    C(0, 0) = 1.;
    C(1, 1) = -1.e-14;
    auto const spectrum = DecomposeSymmetric(C, Solver::Eig);
    CHECK(spectrum.S(0) == Approx(1.));
    CHECK(spectrum.S(1) == 0.);
  }

  SECTION("Errors")
  {
    CHECK_THROWS_AS(DecomposeSymmetric(Matrix::Random(3, 4)), DimensionMismatch);
    CHECK_THROWS_AS(DecomposeSymmetric(Matrix(0, 0)), InvalidInput);
    Matrix bad = cov;
    bad(2, 3) = std::numeric_limits<double>::quiet_NaN();
    CHECK_THROWS_AS(DecomposeSymmetric(bad), InvalidInput);
    CHECK_THROWS_AS(Eig<double>(Matrix::Random(3, 4)), DimensionMismatch);
  }

  SECTION("Sign normalization")
  {
    Matrix U(3, 2);
    U << 0.1, -0.2, //
      -0.9, 0.9,    //
      0.3, 0.1;
    NormalizeSigns(U);
    CHECK(U(1, 0) == Approx(0.9));
    CHECK(U(0, 0) == Approx(-0.1));
    CHECK(U(1, 1) == Approx(0.9));
    CHECK(U(0, 1) == Approx(-0.2));
  }
}
