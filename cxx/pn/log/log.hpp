#pragma once

#define FMT_DEPRECATED_OSTREAM

#include <chrono>
#include <fmt/color.h>
#include <fmt/ostream.h>
#include <fmt/ranges.h>
#include <fmt/std.h>
#include <stdexcept>
#include <string>
#include <vector>

namespace pn {
namespace Log {

// Higher levels show more. Warnings and failures are shown at every level, including None
enum struct Display
{
  None = 0,
  Ephemeral = 1, // Only the most recent entry stays on screen
  Low = 2,
  High = 3
};

using Time = std::chrono::steady_clock::time_point;

void SetDisplayLevel(Display const l);

namespace detail {
auto Format(std::string const &category, fmt::string_view fstr, fmt::format_args args) -> std::string;
void Emit(Display const level, fmt::text_style const style, std::string &&entry);
} // namespace detail

//! Progress messages
template <typename... Args> void Print(std::string const &category, fmt::format_string<Args...> fstr, Args &&...args)
{
  detail::Emit(Display::Ephemeral, fmt::text_style(), detail::Format(category, fstr, fmt::make_format_args(args...)));
}

template <typename... Args> void Debug(std::string const &category, fmt::format_string<Args...> fstr, Args &&...args)
{
  detail::Emit(Display::High, fmt::text_style(), detail::Format(category, fstr, fmt::make_format_args(args...)));
}

template <typename... Args> void Warn(std::string const &category, fmt::format_string<Args...> fstr, Args &&...args)
{
  detail::Emit(Display::None, fmt::fg(fmt::terminal_color::bright_yellow),
               detail::Format(category, fstr, fmt::make_format_args(args...)));
}

/*
 * Base of every error pn throws. The message is formatted like a log entry, so Fail() can add it to the log as is.
 */
struct Failure : std::runtime_error
{
  template <typename... Args>
  Failure(std::string const &category, fmt::format_string<Args...> fstr, Args &&...args)
    : std::runtime_error(detail::Format(category, fstr, fmt::make_format_args(args...)))
  {
  }
};

void Fail(Failure const &f);

//! Every entry so far, whether it was displayed or not. Commands store these in their output files
auto Saved() -> std::vector<std::string>;
void End();

auto Now() -> Time;
auto ToNow(Time const t) -> std::string;

} // namespace Log
} // namespace pn
