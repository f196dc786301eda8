#pragma once

#include <chrono>
#include <fmt/color.h>
#include <fmt/ranges.h>
#include <fmt/std.h>
#include <stdexcept>
#include <string>
#include <vector>

namespace pr {
namespace Log {

/*
 * Every entry is kept in memory so it can be embedded in output files. Entries whose level is at or below the
 * display level are also echoed to stderr.
 */
enum struct Display
{
  None = 0,
  Low = 1,
  High = 2
};

void SetDisplayLevel(Display const l);
auto CurrentLevel() -> Display;
auto IsHigh() -> bool;

// Entries look like "[HH:MM:SS] [PCA   ] message"
auto Format(std::string const &category, fmt::string_view fstr, fmt::format_args args) -> std::string;
auto Category(std::string const &entry) -> std::string; // Empty if entry is not formatted as above
void Record(std::string const &entry, Display const level, fmt::text_style const &style = {});
auto Saved() -> std::vector<std::string> const &;
void ClearSaved();
void End();

template <typename... Args> inline void Print(std::string const &category, fmt::format_string<Args...> fstr, Args &&...args)
{
  Record(Format(category, fstr, fmt::make_format_args(args...)), Display::Low);
}

template <typename... Args> inline void Debug(std::string const &category, fmt::format_string<Args...> fstr, Args &&...args)
{
  Record(Format(category, fstr, fmt::make_format_args(args...)), Display::High);
}

template <typename... Args> inline void Warn(std::string const &category, fmt::format_string<Args...> fstr, Args &&...args)
{
  Record(Format(category, fstr, fmt::make_format_args(args...)), Display::None, fmt::fg(fmt::terminal_color::bright_yellow));
}

struct Failure : std::runtime_error
{
  template <typename... Args>
  Failure(std::string const &cat, fmt::format_string<Args...> fs, Args &&...args)
    : std::runtime_error(Format(cat, fs, fmt::make_format_args(args...)))
    , category{cat}
  {
  }

  std::string category;
};

inline void Fail(Failure const &f) { Record(f.what(), Display::None, fmt::fg(fmt::terminal_color::bright_red)); }

using Time = std::chrono::steady_clock::time_point;
auto Now() -> Time;
auto ToNow(Time const t) -> std::string;

} // namespace Log
} // namespace pr
