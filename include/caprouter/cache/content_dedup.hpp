#pragma once

#include "caprouter/config/system_config.hpp"
#include "caprouter/router/invocation.hpp"
#include "caprouter/util/bounded_cache.hpp"
#include "caprouter/util/string_hash.hpp"
#include "caprouter/util/time.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace caprouter {

// Short-lived results of completed calls, keyed by a content hash, that soak
// up bursts of identical requests arriving just after a call finished.
class ContentDedupCache {
public:
  explicit ContentDedupCache(CacheConfig config = {});

  /// First 16 hex chars of SHA-256 over {"cap", "inputs"}.
  [[nodiscard]] static auto content_hash(const InvocationRequest &request)
      -> std::string;

  /// Hits come back with `metadata.deduplicated` set.
  [[nodiscard]] auto get(const std::string &hash, TimePoint now = Clock::now())
      -> std::optional<InvocationResult>;

  /// Failures are ignored. A zero ttl uses the configured default.
  auto put(const std::string &hash, const InvocationResult &result,
           TimePoint now = Clock::now(),
           std::chrono::milliseconds ttl = std::chrono::milliseconds::zero())
      -> void;

  auto sweep(TimePoint now = Clock::now()) -> std::size_t;
  auto clear() -> void { entries_.clear(); }

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return entries_.size();
  }
  [[nodiscard]] auto hits() const noexcept -> std::uint64_t { return hits_; }

private:
  std::chrono::milliseconds default_ttl_;
  util::BoundedCache<std::string, InvocationResult, StringHash, StringEqual>
      entries_;
  std::uint64_t hits_{0};
};

} // namespace caprouter
