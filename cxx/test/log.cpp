#include "pr/errors.hpp"
#include "pr/log/log.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <regex>

using namespace pr;
using namespace Catch;

TEST_CASE("Log", "[log]")
{
  Log::SetDisplayLevel(Log::Display::None);
  Log::ClearSaved();

  SECTION("Entries are formatted and saved")
  {
    Log::Print("PCA", "Fitting {} samples", 42);
    Log::Debug("Decomp", "Hidden {}", 1.5);
    Log::Warn("HD5", "Careful");
    auto const &saved = Log::Saved();
    REQUIRE(saved.size() == 3);
    CHECK(std::regex_match(saved[0], std::regex(R"(\[\d\d:\d\d:\d\d\] \[PCA   \] Fitting 42 samples)")));
    CHECK(std::regex_match(saved[1], std::regex(R"(\[\d\d:\d\d:\d\d\] \[Decomp\] Hidden 1\.5)")));
    CHECK(std::regex_match(saved[2], std::regex(R"(\[\d\d:\d\d:\d\d\] \[HD5   \] Careful)")));
    Log::ClearSaved();
    CHECK(Log::Saved().empty());
  }

  SECTION("Categories are recovered from entries")
  {
    Log::Print("PCA", "one");
    Log::Print("Decomp", "two");
    Log::Print("LongCategory", "three");
    auto const &saved = Log::Saved();
    REQUIRE(saved.size() == 3);
    CHECK(Log::Category(saved[0]) == "PCA");
    CHECK(Log::Category(saved[1]) == "Decomp");
    CHECK(Log::Category(saved[2]) == "LongCategory");
  }

  SECTION("Foreign entries have no category")
  {
    CHECK(Log::Category("") == "");
    CHECK(Log::Category("short") == "");
    CHECK(Log::Category("[12:00:00]") == "");
    CHECK(Log::Category("[12:00:00] [PCA") == "");
    CHECK(Log::Category("not a log entry at all, but long") == "");
    CHECK(Log::Category("[12:00:00] [      ] blank") == "");
  }

  SECTION("Failures carry their category")
  {
    try {
      throw DimensionMismatch("PCA", "Expected {} got {}", 3, 4);
    } catch (Log::Failure const &f) {
      CHECK(f.category == "PCA");
      CHECK(std::regex_match(f.what(), std::regex(R"(\[\d\d:\d\d:\d\d\] \[PCA   \] Expected 3 got 4)")));
      Log::Fail(f);
      REQUIRE(Log::Saved().size() == 1);
      CHECK(Log::Saved()[0] == f.what());
      CHECK(Log::Category(Log::Saved()[0]) == "PCA");
    }
  }

  SECTION("Display level")
  {
    Log::SetDisplayLevel(Log::Display::High);
    CHECK(Log::IsHigh());
    Log::SetDisplayLevel(Log::Display::Low);
    CHECK_FALSE(Log::IsHigh());
    CHECK(Log::CurrentLevel() == Log::Display::Low);
    Log::SetDisplayLevel(Log::Display::None);
  }

  SECTION("Timing")
  {
    auto const start = Log::Now();
    CHECK_THAT(Log::ToNow(start), Matchers::EndsWith(" ms") || Matchers::EndsWith(" s"));
  }
}
