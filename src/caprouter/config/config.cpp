#include "caprouter/config/config.hpp"
#include "caprouter/config/toml_util.hpp"

#include "caprouter/core/error.hpp"
#include "caprouter/util/log.hpp"

#include <boost/lexical_cast.hpp>

#include <cstdlib>
#include <string>
#include <string_view>

namespace caprouter {
namespace detail {

struct LogToml {
  std::string level{"info"};
  std::string file;
};

struct BreakerToml {
  int failure_threshold{breaker::kFailureThreshold};
  int cooldown_ms{static_cast<int>(breaker::kCooldown.count())};
  int stale_after_ms{static_cast<int>(breaker::kStaleAfter.count())};
};

struct RetryToml {
  int max_attempts{retry::kMaxAttempts};
  int base_delay_ms{static_cast<int>(retry::kBaseDelay.count())};
  double jitter_ratio{retry::kJitterRatio};
  int attempt_timeout_ms{static_cast<int>(retry::kAttemptTimeout.count())};
};

struct CacheToml {
  std::size_t capacity{cache::kCapacity};
  int initial_ttl_ms{static_cast<int>(cache::kInitialTtl.count())};
  int min_ttl_ms{static_cast<int>(cache::kMinTtl.count())};
  int max_ttl_ms{static_cast<int>(cache::kMaxTtl.count())};
  int dedup_ttl_ms{static_cast<int>(cache::kDedupTtl.count())};
  std::size_t dedup_capacity{cache::kDedupCapacity};
};

struct SchedulerToml {
  int max_concurrency{scheduling::kMaxConcurrency};
};

struct PrefetchToml {
  bool enabled{true};
  int max_gap_ms{static_cast<int>(prefetch::kMaxGap.count())};
  double probability_threshold{prefetch::kProbabilityThreshold};
  bool warm_cache{true};
  std::size_t max_sources{prefetch::kMaxSources};
};

struct PolicyToml {
  double fallback_cost_factor{policy::kFallbackCostFactor};
  double fallback_latency_factor{policy::kFallbackLatencyFactor};
  double cost_warning_ratio{policy::kCostWarningRatio};
};

struct SystemToml {
  LogToml log{};
  BreakerToml breaker{};
  RetryToml retry{};
  CacheToml cache{};
  SchedulerToml scheduler{};
  PrefetchToml prefetch{};
  PolicyToml policy{};
};

} // namespace detail
} // namespace caprouter

namespace glz {
template <> struct meta<caprouter::detail::LogToml> {
  using T = caprouter::detail::LogToml;
  static constexpr auto value = object("level", &T::level, "file", &T::file);
};

template <> struct meta<caprouter::detail::BreakerToml> {
  using T = caprouter::detail::BreakerToml;
  static constexpr auto value =
      object("failure_threshold", &T::failure_threshold, "cooldown_ms",
             &T::cooldown_ms, "stale_after_ms", &T::stale_after_ms);
};

template <> struct meta<caprouter::detail::RetryToml> {
  using T = caprouter::detail::RetryToml;
  static constexpr auto value =
      object("max_attempts", &T::max_attempts, "base_delay_ms",
             &T::base_delay_ms, "jitter_ratio", &T::jitter_ratio,
             "attempt_timeout_ms", &T::attempt_timeout_ms);
};

template <> struct meta<caprouter::detail::CacheToml> {
  using T = caprouter::detail::CacheToml;
  static constexpr auto value = object(
      "capacity", &T::capacity, "initial_ttl_ms", &T::initial_ttl_ms,
      "min_ttl_ms", &T::min_ttl_ms, "max_ttl_ms", &T::max_ttl_ms,
      "dedup_ttl_ms", &T::dedup_ttl_ms, "dedup_capacity", &T::dedup_capacity);
};

template <> struct meta<caprouter::detail::SchedulerToml> {
  using T = caprouter::detail::SchedulerToml;
  static constexpr auto value =
      object("max_concurrency", &T::max_concurrency);
};

template <> struct meta<caprouter::detail::PrefetchToml> {
  using T = caprouter::detail::PrefetchToml;
  static constexpr auto value =
      object("enabled", &T::enabled, "max_gap_ms", &T::max_gap_ms,
             "probability_threshold", &T::probability_threshold, "warm_cache",
             &T::warm_cache, "max_sources", &T::max_sources);
};

template <> struct meta<caprouter::detail::PolicyToml> {
  using T = caprouter::detail::PolicyToml;
  static constexpr auto value =
      object("fallback_cost_factor", &T::fallback_cost_factor,
             "fallback_latency_factor", &T::fallback_latency_factor,
             "cost_warning_ratio", &T::cost_warning_ratio);
};

template <> struct meta<caprouter::detail::SystemToml> {
  using T = caprouter::detail::SystemToml;
  static constexpr auto value =
      object("log", &T::log, "breaker", &T::breaker, "retry", &T::retry,
             "cache", &T::cache, "scheduler", &T::scheduler, "prefetch",
             &T::prefetch, "policy", &T::policy);
};
} // namespace glz

namespace caprouter {
namespace {

auto apply_env_overrides(SystemConfig &cfg) -> void {
  if (const char *v = std::getenv("CAPROUTER_LOG_LEVEL"); v != nullptr) {
    cfg.log.level = v;
  }
  if (const char *v = std::getenv("CAPROUTER_MAX_CONCURRENCY"); v != nullptr) {
    cfg.scheduler.max_concurrency = boost::lexical_cast<int>(v);
  }
  if (const char *v = std::getenv("CAPROUTER_RETRY_MAX_ATTEMPTS");
      v != nullptr) {
    cfg.retry.max_attempts = boost::lexical_cast<int>(v);
  }
  if (const char *v = std::getenv("CAPROUTER_BREAKER_THRESHOLD");
      v != nullptr) {
    cfg.breaker.failure_threshold = boost::lexical_cast<int>(v);
  }
  if (const char *v = std::getenv("CAPROUTER_BREAKER_COOLDOWN_MS");
      v != nullptr) {
    cfg.breaker.cooldown_ms = boost::lexical_cast<int>(v);
  }
}

[[nodiscard]] auto convert_toml(std::string_view toml_text,
                                std::string_view source)
    -> Result<SystemConfig> {
  auto raw_result =
      toml_util::parse_toml<detail::SystemToml>(toml_text, source);
  if (!raw_result)
    return fail(raw_result.error());
  auto &raw = *raw_result;

  SystemConfig cfg{};
  cfg.log.level = std::move(raw.log.level);
  cfg.log.file = std::move(raw.log.file);

  cfg.breaker.failure_threshold = raw.breaker.failure_threshold;
  cfg.breaker.cooldown_ms = raw.breaker.cooldown_ms;
  cfg.breaker.stale_after_ms = raw.breaker.stale_after_ms;

  cfg.retry.max_attempts = raw.retry.max_attempts;
  cfg.retry.base_delay_ms = raw.retry.base_delay_ms;
  cfg.retry.jitter_ratio = raw.retry.jitter_ratio;
  cfg.retry.attempt_timeout_ms = raw.retry.attempt_timeout_ms;

  cfg.cache.capacity = raw.cache.capacity;
  cfg.cache.initial_ttl_ms = raw.cache.initial_ttl_ms;
  cfg.cache.min_ttl_ms = raw.cache.min_ttl_ms;
  cfg.cache.max_ttl_ms = raw.cache.max_ttl_ms;
  cfg.cache.dedup_ttl_ms = raw.cache.dedup_ttl_ms;
  cfg.cache.dedup_capacity = raw.cache.dedup_capacity;

  cfg.scheduler.max_concurrency = raw.scheduler.max_concurrency;

  cfg.prefetch.enabled = raw.prefetch.enabled;
  cfg.prefetch.max_gap_ms = raw.prefetch.max_gap_ms;
  cfg.prefetch.probability_threshold = raw.prefetch.probability_threshold;
  cfg.prefetch.warm_cache = raw.prefetch.warm_cache;
  cfg.prefetch.max_sources = raw.prefetch.max_sources;

  cfg.policy.fallback_cost_factor = raw.policy.fallback_cost_factor;
  cfg.policy.fallback_latency_factor = raw.policy.fallback_latency_factor;
  cfg.policy.cost_warning_ratio = raw.policy.cost_warning_ratio;

  apply_env_overrides(cfg);

  std::string reason;
  if (auto valid = ConfigLoader::validate(cfg, &reason); !valid) {
    log::error("{}: invalid configuration: {}", source, reason);
    return fail(valid.error());
  }
  return ok(std::move(cfg));
}

} // namespace

auto ConfigLoader::validate(const SystemConfig &cfg, std::string *reason)
    -> Result<void> {
  auto reject = [&](std::string_view why) -> Result<void> {
    if (reason) {
      *reason = why;
    }
    return fail(Error::InvalidArgument);
  };

  if (cfg.breaker.failure_threshold <= 0) {
    return reject("breaker.failure_threshold must be positive");
  }
  if (cfg.breaker.cooldown_ms <= 0 || cfg.breaker.stale_after_ms <= 0) {
    return reject("breaker cooldown and stale window must be positive");
  }
  if (cfg.retry.max_attempts <= 0) {
    return reject("retry.max_attempts must be positive");
  }
  if (cfg.retry.base_delay_ms < 0 || cfg.retry.attempt_timeout_ms <= 0) {
    return reject("retry delays must be non-negative and timeout positive");
  }
  if (cfg.retry.jitter_ratio < 0.0 || cfg.retry.jitter_ratio > 1.0) {
    return reject("retry.jitter_ratio must lie in [0, 1]");
  }
  if (cfg.cache.capacity == 0 || cfg.cache.dedup_capacity == 0) {
    return reject("cache capacities must be positive");
  }
  if (cfg.cache.min_ttl_ms <= 0 || cfg.cache.min_ttl_ms > cfg.cache.max_ttl_ms) {
    return reject("cache.min_ttl_ms must be positive and not exceed "
                  "cache.max_ttl_ms");
  }
  if (cfg.cache.initial_ttl_ms < cfg.cache.min_ttl_ms ||
      cfg.cache.initial_ttl_ms > cfg.cache.max_ttl_ms) {
    return reject("cache.initial_ttl_ms must lie within the TTL bounds");
  }
  if (cfg.cache.dedup_ttl_ms <= 0) {
    return reject("cache.dedup_ttl_ms must be positive");
  }
  if (cfg.scheduler.max_concurrency <= 0) {
    return reject("scheduler.max_concurrency must be positive");
  }
  if (cfg.prefetch.max_gap_ms <= 0 || cfg.prefetch.max_sources == 0) {
    return reject("prefetch gap and source bound must be positive");
  }
  if (cfg.prefetch.probability_threshold < 0.0 ||
      cfg.prefetch.probability_threshold > 1.0) {
    return reject("prefetch.probability_threshold must lie in [0, 1]");
  }
  if (cfg.policy.fallback_cost_factor < 1.0 ||
      cfg.policy.fallback_latency_factor < 1.0) {
    return reject("policy fallback factors must be at least 1");
  }
  if (cfg.policy.cost_warning_ratio <= 0.0 ||
      cfg.policy.cost_warning_ratio > 1.0) {
    return reject("policy.cost_warning_ratio must lie in (0, 1]");
  }
  return ok();
}

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<SystemConfig> {
  auto text = toml_util::read_file(path);
  if (!text) {
    return fail(text.error());
  }
  return load(*text, path);
}

auto ConfigLoader::load_from_string(std::string_view toml_str)
    -> Result<SystemConfig> {
  return load(toml_str, "<inline config>");
}

auto ConfigLoader::load(std::string_view toml_str, std::string_view source)
    -> Result<SystemConfig> {
  try {
    return convert_toml(toml_str, source);
  } catch (const boost::bad_lexical_cast &e) {
    log::error("Invalid numeric environment override: {}", e.what());
    return fail(Error::ParseError);
  } catch (const std::exception &e) {
    log::error("{}: failed to load router configuration: {}", source,
               e.what());
    return fail(Error::ParseError);
  }
}

} // namespace caprouter
