#pragma once

#include <cstdio>
#include <format>
#include <string>
#include <string_view>
#include <unistd.h>

namespace caprouter::cli::fmt {

namespace ansi {

inline constexpr std::string_view kReset = "\033[0m";
inline constexpr std::string_view kGreen = "\033[32m";
inline constexpr std::string_view kRed = "\033[31m";
inline constexpr std::string_view kYellow = "\033[33m";

// Escapes only when stdout is a terminal, so --json output and pipes stay
// clean.
inline auto paint(std::string_view text, std::string_view color)
    -> std::string {
  static const bool tty = ::isatty(::fileno(stdout)) != 0;
  if (!tty || text.empty()) {
    return std::string(text);
  }
  return std::format("{}{}{}", color, text, kReset);
}

inline auto green(std::string_view text) -> std::string {
  return paint(text, kGreen);
}
inline auto red(std::string_view text) -> std::string {
  return paint(text, kRed);
}
inline auto yellow(std::string_view text) -> std::string {
  return paint(text, kYellow);
}

} // namespace ansi

/// Green check or red cross.
inline auto outcome(bool ok) -> std::string {
  return ok ? ansi::green("✓") : ansi::red("✗");
}

/// " cached coalesced" style suffix for the served-from flags that are set.
inline auto served_flags(bool cached, bool coalesced, bool deduplicated)
    -> std::string {
  std::string flags;
  if (cached) {
    flags += " cached";
  }
  if (coalesced) {
    flags += " coalesced";
  }
  if (deduplicated) {
    flags += " deduplicated";
  }
  return ansi::yellow(flags);
}

} // namespace caprouter::cli::fmt
