#include "log.hpp"

#include "debug.hpp"
#include "fmt/chrono.h"

#include <cstdio>
#include <ctime>
#include <mutex>
#include <unistd.h>

namespace pn {
namespace Log {

namespace {
Display                  display = Display::None;
std::mutex               entriesMutex;
std::vector<std::string> entries;
bool                     overwrite = false; // Ephemeral display on a terminal
} // namespace

void SetDisplayLevel(Display const l)
{
  display = l;
  overwrite = (display == Display::Ephemeral) && isatty(fileno(stderr));
  // Leave the command line alone, the first entry overwrites this blank line instead
  if (overwrite) { fmt::print(stderr, "\n"); }
}

namespace detail {
auto Format(std::string const &category, fmt::string_view fstr, fmt::format_args args) -> std::string
{
  return fmt::format("[{:%H:%M:%S}] [{:<6}] {}", fmt::localtime(std::time(nullptr)), category, fmt::vformat(fstr, args));
}

void Emit(Display const level, fmt::text_style const style, std::string &&entry)
{
  std::scoped_lock lock(entriesMutex);
  if (display >= level) {
    if (overwrite) { fmt::print(stderr, "\033[A\33[2K\r"); }
    fmt::print(stderr, style, "{}\n", entry);
  }
  entries.push_back(std::move(entry));
}
} // namespace detail

void Fail(Failure const &f) { detail::Emit(Display::None, fmt::fg(fmt::terminal_color::bright_red), f.what()); }

auto Saved() -> std::vector<std::string>
{
  std::scoped_lock lock(entriesMutex);
  return entries;
}

void End()
{
  EndDebugging();
  display = Display::None;
  overwrite = false;
}

auto Now() -> Time { return std::chrono::steady_clock::now(); }

auto ToNow(Time const t) -> std::string
{
  auto const ms = std::chrono::duration_cast<std::chrono::milliseconds>(Now() - t);
  if (ms < std::chrono::seconds(1)) { return fmt::format("{} ms", ms.count()); }
  std::chrono::hh_mm_ss const hms(ms);
  if (hms.hours().count() > 0) {
    return fmt::format("{}h {}m {}s", hms.hours().count(), hms.minutes().count(), hms.seconds().count());
  } else if (hms.minutes().count() > 0) {
    return fmt::format("{}m {}s", hms.minutes().count(), hms.seconds().count());
  } else {
    return fmt::format("{}.{:03} s", hms.seconds().count(), hms.subseconds().count());
  }
}

} // namespace Log
} // namespace pn
