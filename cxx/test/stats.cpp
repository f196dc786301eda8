#include "pr/algo/stats.hpp"
#include "pr/errors.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <limits>

using namespace pr;
using namespace Catch;

TEST_CASE("Statistics", "[stats]")
{
  Matrix X(4, 2);
  X << 1., 10., //
    2., 20.,    //
    3., 30.,    //
    6., 40.;

  SECTION("Mean")
  {
    auto const mean = ColumnMean(X);
    REQUIRE(mean.rows() == 2);
    CHECK(mean(0) == Approx(3.));
    CHECK(mean(1) == Approx(25.));
    CHECK_THROWS_AS(ColumnMean(Matrix(0, 2)), InvalidInput);
  }

  SECTION("Center")
  {
    Matrix const copy = X;
    auto const   centered = Center(X, ColumnMean(X));
    CHECK(centered.colwise().sum().cwiseAbs().maxCoeff() == Approx(0.).margin(1.e-12));
    CHECK(centered(3, 0) == Approx(3.));
    CHECK((X - copy).cwiseAbs().maxCoeff() == 0.);
    CHECK_THROWS_AS(Center(X, Vector::Zero(3)), DimensionMismatch);
  }

  SECTION("Covariance is biased")
  {
    auto const C = Covariance(X);
    REQUIRE(C.rows() == 2);
    REQUIRE(C.cols() == 2);
    // Deviations (-2,-1,0,3) and (-15,-5,5,15)
    CHECK(C(0, 0) == Approx(14. / 4.));
    CHECK(C(1, 1) == Approx(500. / 4.));
    CHECK(C(0, 1) == Approx(80. / 4.));
    CHECK(C(1, 0) == Approx(C(0, 1)));
  }

  SECTION("Covariance without demeaning")
  {
    auto const C = Covariance(X, false);
    CHECK(C(0, 0) == Approx(50. / 4.));
    CHECK(C(0, 1) == Approx(380. / 4.));
  }

  SECTION("Finite")
  {
    CHECK(AllFinite(X));
    X(0, 1) = std::numeric_limits<double>::infinity();
    CHECK_FALSE(AllFinite(X));
    X(0, 1) = std::numeric_limits<double>::quiet_NaN();
    CHECK_FALSE(AllFinite(X));
  }
}
