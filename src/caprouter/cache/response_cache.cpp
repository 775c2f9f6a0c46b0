#include "caprouter/cache/response_cache.hpp"

#include "caprouter/core/constants.hpp"

#include <algorithm>

namespace caprouter {

namespace {

auto scale(std::chrono::milliseconds ttl, double factor)
    -> std::chrono::milliseconds {
  return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(
      static_cast<double>(ttl.count()) * factor));
}

} // namespace

ResponseCache::ResponseCache(CacheConfig config)
    : config_(config), entries_(config.capacity) {}

auto ResponseCache::record(const CapabilityId &capability, bool hit) -> void {
  auto [it, inserted] = ttl_.try_emplace(capability);
  auto &data = it->second;
  if (inserted) {
    data.ttl = std::chrono::milliseconds(config_.initial_ttl_ms);
  }
  const auto min_ttl = std::chrono::milliseconds(config_.min_ttl_ms);
  const auto max_ttl = std::chrono::milliseconds(config_.max_ttl_ms);

  if (hit) {
    ++data.hits;
    const auto ratio = static_cast<double>(data.hits) /
                       static_cast<double>(data.hits + data.misses);
    if (data.hits > cache::kMinSamples && ratio > cache::kGrowHitRatio) {
      data.ttl = std::min(scale(data.ttl, cache::kGrowFactor), max_ttl);
    }
  } else {
    ++data.misses;
    const auto ratio = static_cast<double>(data.misses) /
                       static_cast<double>(data.hits + data.misses);
    if (data.misses > cache::kMinSamples && ratio > cache::kShrinkMissRatio) {
      data.ttl = std::max(scale(data.ttl, cache::kShrinkFactor), min_ttl);
    }
  }
}

auto ResponseCache::get(const std::string &key, const CapabilityId &capability,
                        TimePoint now) -> std::optional<InvocationResult> {
  auto *entry = entries_.get(key, now);
  if (entry == nullptr) {
    ++misses_;
    record(capability, false);
    return std::nullopt;
  }
  ++hits_;
  record(capability, true);
  return *entry;
}

auto ResponseCache::put(const std::string &key, const InvocationResult &result,
                        TimePoint now) -> void {
  if (!result.success) {
    return;
  }
  entries_.put(key, result, now, ttl_for(result.capability_id));
}

auto ResponseCache::ttl_for(const CapabilityId &capability) const
    -> std::chrono::milliseconds {
  auto it = ttl_.find(capability);
  return it == ttl_.end() ? std::chrono::milliseconds(config_.initial_ttl_ms)
                          : it->second.ttl;
}

auto ResponseCache::adaptive(const CapabilityId &capability) const
    -> const AdaptiveTtl * {
  auto it = ttl_.find(capability);
  return it == ttl_.end() ? nullptr : &it->second;
}

auto ResponseCache::sweep(TimePoint now) -> std::size_t {
  return entries_.sweep(now);
}

auto ResponseCache::clear() -> void { entries_.clear(); }

auto ResponseCache::stats() const -> ResponseCacheStats {
  return ResponseCacheStats{.entries = entries_.size(),
                            .tracked_capabilities = ttl_.size(),
                            .hits = hits_,
                            .misses = misses_};
}

auto ResponseCache::adaptive_json() const -> JsonValue {
  JsonValue arr = std::vector<JsonValue>{};
  for (const auto &[id, data] : ttl_) {
    const auto total = data.hits + data.misses;
    const double rate =
        total == 0 ? 0.0
                   : static_cast<double>(data.hits) / static_cast<double>(total);
    arr.get_array().emplace_back(
        JsonValue{{"capability_id", id.str()},
                  {"ttl_ms", static_cast<std::int64_t>(data.ttl.count())},
                  {"hits", static_cast<std::int64_t>(data.hits)},
                  {"misses", static_cast<std::int64_t>(data.misses)},
                  {"hit_rate", rate}});
  }
  return arr;
}

} // namespace caprouter
