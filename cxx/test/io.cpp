#include "pr/io/model.hpp"
#include "pr/io/reader.hpp"
#include "pr/io/writer.hpp"
#include "pr/log/debug.hpp"
#include "pr/log/log.hpp"

#include <algorithm>
#include <filesystem>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

using namespace pr;
using namespace Catch;

TEST_CASE("IO", "[io]")
{
  Index const  m = 7, n = 3;
  Matrix const X = Matrix::Random(m, n);

  SECTION("Matrix")
  {
    std::filesystem::path const fname("test-matrix.h5");
    { // Use destructor to ensure it is written
      HD5::Writer writer(fname);
      writer.writeMatrix(HD5::Keys::Data, X, HD5::Dims::Observations);
    }
    CHECK(std::filesystem::exists(fname));
    HD5::Reader reader(fname);
    CHECK(reader.exists(HD5::Keys::Data));
    CHECK_FALSE(reader.exists(HD5::Keys::Basis));
    CHECK(reader.dimensions(HD5::Keys::Data) == std::vector<Index>{m, n});
    CHECK(reader.listNames(HD5::Keys::Data) == std::vector<std::string>{"sample", "feature"});
    auto const check = reader.readMatrix(HD5::Keys::Data);
    REQUIRE(check.rows() == m);
    REQUIRE(check.cols() == n);
    CHECK((check - X).cwiseAbs().maxCoeff() == 0.);
    CHECK_THROWS_AS(reader.readVector(HD5::Keys::Data), Log::Failure);
    CHECK_THROWS_AS(reader.readMatrix("missing"), Log::Failure);
    std::filesystem::remove(fname);
  }

  SECTION("Vectors, strings and meta-data")
  {
    std::filesystem::path const fname("test-misc.h5");
    Vector const                v = Vector::LinSpaced(n, 1., 3.);
    std::vector<std::string>    strings{"one", "two", "three"};
    {
      HD5::Writer writer(fname);
      writer.writeVector(HD5::Keys::Mean, v, HD5::Dims::Mean);
      writer.writeStrings(HD5::Keys::Log, strings);
      writer.writeMeta({{"alpha", 1.5f}, {"beta", -2.f}});
    }
    HD5::Reader reader(fname);
    CHECK(reader.dimensions(HD5::Keys::Mean) == std::vector<Index>{n});
    auto const vcheck = reader.readVector(HD5::Keys::Mean);
    CHECK((vcheck - v).cwiseAbs().maxCoeff() == 0.);
    auto const column = reader.readMatrix(HD5::Keys::Mean);
    CHECK(column.rows() == n);
    CHECK(column.cols() == 1);
    CHECK(reader.readStrings(HD5::Keys::Log) == strings);
    auto const meta = reader.readMeta();
    REQUIRE(meta.size() == 2);
    CHECK(meta.at("alpha") == 1.5f);
    CHECK(meta.at("beta") == -2.f);
    auto const datasets = reader.list();
    CHECK(std::find(datasets.begin(), datasets.end(), HD5::Keys::Meta) == datasets.end());
    CHECK(datasets.size() == 2);
    CHECK_THROWS_AS(reader.readIndex(HD5::Keys::Mean), Log::Failure);
    std::filesystem::remove(fname);
  }

  SECTION("Model")
  {
    std::filesystem::path const fname("test-model.h5");
    Reducer                     reducer(2);
    reducer.fit(X);
    {
      HD5::Writer writer(fname);
      HD5::WriteModel(writer, reducer);
    }
    HD5::Reader reader(fname);
    CHECK(reader.dimensions(HD5::Keys::Basis) == std::vector<Index>{n, n});
    auto const meta = reader.readMeta();
    CHECK(meta.at("components") == 2.f);
    CHECK(meta.at("features") == static_cast<float>(n));
    CHECK(meta.count("samples") == 0);
    CHECK(reader.readIndex(HD5::Keys::Samples) == m);
    CHECK(meta.at("explained") == Approx(reducer.explainedVariance()).epsilon(1.e-6));

    auto const restored = HD5::ReadModel(reader);
    CHECK(restored.components() == 2);
    CHECK(restored.samples() == m);
    CHECK((restored.project(X) - reducer.project(X)).cwiseAbs().maxCoeff() == 0.);
    CHECK((restored.transform(X) - reducer.transform(X)).cwiseAbs().maxCoeff() == 0.);

    auto const wider = HD5::ReadModel(reader, 3);
    CHECK(wider.components() == 3);
    CHECK_THROWS_AS(HD5::ReadModel(reader, 4), Log::Failure);
    std::filesystem::remove(fname);
  }

  SECTION("Model of constant data")
  {
    std::filesystem::path const fname("test-flat.h5");
    Reducer                     flat(1);
    flat.fit(Matrix::Constant(m, n, 0.1));
    {
      HD5::Writer writer(fname);
      HD5::WriteModel(writer, flat);
    }
    HD5::Reader reader(fname);
    CHECK(reader.readMeta().at("explained") == 0.f);
    CHECK_FALSE(HD5::ReadModel(reader).hasVariance());
    std::filesystem::remove(fname);
  }

  SECTION("Sample counts beyond float precision")
  {
    std::filesystem::path const fname("test-samples.h5");
    Index const                 samples = (1L << 25) + 1;
    Reducer                     reducer(1);
    reducer.fit(X);
    Reducer big(1);
    big.restore(reducer.mean(), reducer.basis(), reducer.eigenvalues(), samples);
    {
      HD5::Writer writer(fname);
      HD5::WriteModel(writer, big);
    }
    HD5::Reader reader(fname);
    CHECK(HD5::ReadModel(reader).samples() == samples);
    std::filesystem::remove(fname);
  }

  SECTION("Deflate levels")
  {
    std::filesystem::path const fname("test-deflate.h5");
    Matrix const                tall = Matrix::Random(40000, 5);
    auto const                  level = GENERATE(0, 2, 9);
    HD5::SetDeflate(level);
    {
      HD5::Writer writer(fname);
      writer.writeMatrix(HD5::Keys::Data, tall, HD5::Dims::Observations);
    }
    HD5::SetDeflate(2);
    HD5::Reader reader(fname);
    CHECK((reader.readMatrix() - tall).cwiseAbs().maxCoeff() == 0.);
    CHECK_THROWS_AS(HD5::SetDeflate(10), Log::Failure);
    std::filesystem::remove(fname);
  }

  SECTION("Debug file")
  {
    std::string const fname("test-debug.h5");
    Log::SetDebugFile(fname);
    REQUIRE(Log::IsDebugging());
    Reducer reducer(1);
    reducer.fit(X);
    reducer.fit(X);
    Log::EndDebugging();
    CHECK_FALSE(Log::IsDebugging());
    HD5::Reader reader(fname);
    CHECK(reader.exists("covariance"));
    CHECK(reader.exists("covariance-1"));
    CHECK(reader.dimensions("covariance") == std::vector<Index>{n, n});
    std::filesystem::remove(fname);
  }

  SECTION("Missing files")
  {
    CHECK_THROWS_AS(HD5::Reader("does-not-exist.h5"), Log::Failure);
    CHECK_THROWS_AS(HD5::Writer("does-not-exist.h5", true), Log::Failure);
  }
}
