#pragma once

#include <chrono>
#include <cmath>
#include <random>

namespace caprouter::util {

/// Delay before retry number `attempt + 1` (attempt is 1-based):
/// base * 2^(attempt-1) plus uniform jitter in [0, jitter_ratio * that].
template <typename URNG>
[[nodiscard]] auto backoff_delay(int attempt, std::chrono::milliseconds base,
                                 double jitter_ratio, URNG &rng)
    -> std::chrono::milliseconds {
  const int exponent = attempt < 1 ? 0 : (attempt > 31 ? 30 : attempt - 1);
  const double nominal =
      static_cast<double>(base.count()) * std::ldexp(1.0, exponent);
  double jitter = 0.0;
  if (jitter_ratio > 0.0 && nominal > 0.0) {
    std::uniform_real_distribution<double> dist(0.0, jitter_ratio * nominal);
    jitter = dist(rng);
  }
  return std::chrono::milliseconds(
      static_cast<std::chrono::milliseconds::rep>(std::floor(nominal + jitter)));
}

} // namespace caprouter::util
