#include "log.hpp"

#include "debug.hpp"

#include <ctime>
#include <fmt/chrono.h>
#include <mutex>

namespace pr {
namespace Log {

namespace {
Display                  display = Display::None;
std::mutex               entriesMutex;
std::vector<std::string> entries;
} // namespace

void SetDisplayLevel(Display const l) { display = l; }
auto CurrentLevel() -> Display { return display; }
auto IsHigh() -> bool { return display == Display::High; }

auto Format(std::string const &category, fmt::string_view fstr, fmt::format_args args) -> std::string
{
  return fmt::format("[{:%H:%M:%S}] [{:<6}] {}", fmt::localtime(std::time(nullptr)), category, fmt::vformat(fstr, args));
}

auto Category(std::string const &entry) -> std::string
{
  // "[HH:MM:SS] [" is 12 characters
  if (entry.size() < 14 || entry[0] != '[' || entry.compare(9, 3, "] [") != 0) { return {}; }
  auto const close = entry.find(']', 12);
  if (close == std::string::npos) { return {}; }
  auto const last = entry.find_last_not_of(' ', close - 1);
  if (last == std::string::npos || last < 12) { return {}; }
  return entry.substr(12, last - 11);
}

void Record(std::string const &entry, Display const level, fmt::text_style const &style)
{
  std::scoped_lock lock(entriesMutex);
  entries.push_back(entry);
  if (level <= display) { fmt::print(stderr, style, "{}\n", entry); }
}

auto Saved() -> std::vector<std::string> const & { return entries; }

void ClearSaved()
{
  std::scoped_lock lock(entriesMutex);
  entries.clear();
}

void End()
{
  EndDebugging();
  display = Display::None;
}

auto Now() -> Time { return std::chrono::steady_clock::now(); }

auto ToNow(Time const t) -> std::string
{
  std::chrono::duration<double> const elapsed = std::chrono::steady_clock::now() - t;
  if (elapsed.count() < 1.) {
    return fmt::format("{:.1f} ms", 1.e3 * elapsed.count());
  } else if (elapsed.count() < 120.) {
    return fmt::format("{:.2f} s", elapsed.count());
  } else {
    return fmt::format("{:.1f} min", elapsed.count() / 60.);
  }
}

} // namespace Log
} // namespace pr
