#pragma once

#include "caprouter/config/system_config.hpp"
#include "caprouter/router/invocation.hpp"
#include "caprouter/util/bounded_cache.hpp"
#include "caprouter/util/string_hash.hpp"
#include "caprouter/util/time.hpp"

#include <ankerl/unordered_dense.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace caprouter {

struct AdaptiveTtl {
  std::chrono::milliseconds ttl{cache::kInitialTtl};
  std::uint64_t hits{0};
  std::uint64_t misses{0};
};

struct ResponseCacheStats {
  std::size_t entries{0};
  std::size_t tracked_capabilities{0};
  std::uint64_t hits{0};
  std::uint64_t misses{0};

  [[nodiscard]] auto hit_rate() const noexcept -> double {
    const auto total = hits + misses;
    return total == 0 ? 0.0
                      : static_cast<double>(hits) / static_cast<double>(total);
  }
};

// Successful invocation results keyed by canonical (capability, inputs),
// each stored with the capability's current adaptive TTL. Every lookup feeds
// the per-capability hit/miss counters that tune that TTL:
//   > kMinSamples hits   and hit ratio  > 0.8  -> ttl * 1.2 (capped)
//   > kMinSamples misses and miss ratio > 0.5  -> ttl * 0.8 (floored)
class ResponseCache {
public:
  explicit ResponseCache(CacheConfig config = {});

  [[nodiscard]] auto get(const std::string &key, const CapabilityId &capability,
                         TimePoint now = Clock::now())
      -> std::optional<InvocationResult>;

  /// Failures are ignored.
  auto put(const std::string &key, const InvocationResult &result,
           TimePoint now = Clock::now()) -> void;

  [[nodiscard]] auto ttl_for(const CapabilityId &capability) const
      -> std::chrono::milliseconds;
  [[nodiscard]] auto adaptive(const CapabilityId &capability) const
      -> const AdaptiveTtl *;

  auto sweep(TimePoint now = Clock::now()) -> std::size_t;
  auto clear() -> void;

  [[nodiscard]] auto stats() const -> ResponseCacheStats;
  [[nodiscard]] auto adaptive_json() const -> JsonValue;

private:
  auto record(const CapabilityId &capability, bool hit) -> void;

  CacheConfig config_;
  util::BoundedCache<std::string, InvocationResult, StringHash, StringEqual>
      entries_;
  ankerl::unordered_dense::map<CapabilityId, AdaptiveTtl> ttl_;
  std::uint64_t hits_{0};
  std::uint64_t misses_{0};
};

} // namespace caprouter
