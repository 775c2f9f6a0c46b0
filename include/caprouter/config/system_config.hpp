#pragma once

#include "caprouter/core/constants.hpp"

#include <cstddef>
#include <string>

namespace caprouter {

struct LogConfig {
  std::string level{"info"};
  std::string file;

  auto operator==(const LogConfig &) const -> bool = default;
};

struct BreakerConfig {
  int failure_threshold{breaker::kFailureThreshold};
  int cooldown_ms{static_cast<int>(breaker::kCooldown.count())};
  int stale_after_ms{static_cast<int>(breaker::kStaleAfter.count())};

  auto operator==(const BreakerConfig &) const -> bool = default;
};

struct RetryConfig {
  int max_attempts{retry::kMaxAttempts};
  int base_delay_ms{static_cast<int>(retry::kBaseDelay.count())};
  double jitter_ratio{retry::kJitterRatio};
  int attempt_timeout_ms{static_cast<int>(retry::kAttemptTimeout.count())};

  auto operator==(const RetryConfig &) const -> bool = default;
};

struct CacheConfig {
  std::size_t capacity{cache::kCapacity};
  int initial_ttl_ms{static_cast<int>(cache::kInitialTtl.count())};
  int min_ttl_ms{static_cast<int>(cache::kMinTtl.count())};
  int max_ttl_ms{static_cast<int>(cache::kMaxTtl.count())};
  int dedup_ttl_ms{static_cast<int>(cache::kDedupTtl.count())};
  std::size_t dedup_capacity{cache::kDedupCapacity};

  auto operator==(const CacheConfig &) const -> bool = default;
};

struct SchedulerConfig {
  int max_concurrency{scheduling::kMaxConcurrency};

  auto operator==(const SchedulerConfig &) const -> bool = default;
};

struct PrefetchConfig {
  bool enabled{true};
  int max_gap_ms{static_cast<int>(prefetch::kMaxGap.count())};
  double probability_threshold{prefetch::kProbabilityThreshold};
  bool warm_cache{true};
  std::size_t max_sources{prefetch::kMaxSources};

  auto operator==(const PrefetchConfig &) const -> bool = default;
};

struct PolicyConfig {
  double fallback_cost_factor{policy::kFallbackCostFactor};
  double fallback_latency_factor{policy::kFallbackLatencyFactor};
  double cost_warning_ratio{policy::kCostWarningRatio};

  auto operator==(const PolicyConfig &) const -> bool = default;
};

struct SystemConfig {
  LogConfig log;
  BreakerConfig breaker;
  RetryConfig retry;
  CacheConfig cache;
  SchedulerConfig scheduler;
  PrefetchConfig prefetch;
  PolicyConfig policy;

  auto operator==(const SystemConfig &) const -> bool = default;
};

} // namespace caprouter
