#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <string>

namespace caprouter {

// Monotonic clock for every decision (breakers, TTLs, gaps, queue waits).
using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

} // namespace caprouter

namespace caprouter::util {

// Formats time point to ISO 8601 with milliseconds (YYYY-MM-DDTHH:MM:SS.mmmZ)
[[nodiscard]] inline auto
format_iso8601(std::chrono::system_clock::time_point tp) -> std::string {
  if (tp == std::chrono::system_clock::time_point{})
    return {};
  auto const ms_tp = std::chrono::floor<std::chrono::milliseconds>(tp);
  return std::format("{:%Y-%m-%dT%H:%M:%S}Z", ms_tp);
}

[[nodiscard]] inline auto format_timestamp() -> std::string {
  return format_iso8601(std::chrono::system_clock::now());
}

[[nodiscard]] inline auto
to_unix_millis(std::chrono::system_clock::time_point tp) -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

[[nodiscard]] inline auto now_unix_millis() -> std::int64_t {
  return to_unix_millis(std::chrono::system_clock::now());
}

[[nodiscard]] inline auto elapsed_ms(TimePoint from, TimePoint to)
    -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(to - from)
      .count();
}

} // namespace caprouter::util
