#include "caprouter/cache/content_dedup.hpp"

#include "caprouter/util/digest.hpp"

namespace caprouter {

namespace {
constexpr std::size_t kHashChars = 16;
}

ContentDedupCache::ContentDedupCache(CacheConfig config)
    : default_ttl_(config.dedup_ttl_ms), entries_(config.dedup_capacity) {}

auto ContentDedupCache::content_hash(const InvocationRequest &request)
    -> std::string {
  const JsonValue content{{"cap", request.capability_id.str()},
                          {"inputs", JsonValue{request.inputs}}};
  return util::sha256_prefix(dump_json(content), kHashChars);
}

auto ContentDedupCache::get(const std::string &hash, TimePoint now)
    -> std::optional<InvocationResult> {
  auto *entry = entries_.get(hash, now);
  if (entry == nullptr) {
    return std::nullopt;
  }
  ++hits_;
  auto result = *entry;
  result.metadata.deduplicated = true;
  return result;
}

auto ContentDedupCache::put(const std::string &hash,
                            const InvocationResult &result, TimePoint now,
                            std::chrono::milliseconds ttl) -> void {
  if (!result.success) {
    return;
  }
  entries_.put(hash, result, now, ttl > ttl.zero() ? ttl : default_ttl_);
}

auto ContentDedupCache::sweep(TimePoint now) -> std::size_t {
  return entries_.sweep(now);
}

} // namespace caprouter
