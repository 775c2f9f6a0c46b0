#pragma once

#include "caprouter/core/constants.hpp"
#include "caprouter/util/time.hpp"

#include <ankerl/unordered_dense.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <utility>
#include <vector>

namespace caprouter::util {

enum class EvictionPolicy : std::uint8_t { OldestInsert, LeastRecentlyUsed };

// Capacity-bounded map with optional per-entry expiry. When a new key would
// exceed capacity, expired entries go first, then a batch of
// `evict_fraction * capacity` victims chosen by the eviction policy.
// References returned by get()/emplace_or_get() are invalidated by the next
// insertion or erase.
template <typename K, typename V, typename Hash = ankerl::unordered_dense::hash<K>,
          typename KeyEqual = std::equal_to<K>>
class BoundedCache {
  struct Entry {
    V value;
    std::optional<TimePoint> expires_at;
    TimePoint last_access;
    std::uint64_t seq{0};
  };

public:
  explicit BoundedCache(std::size_t capacity,
                        EvictionPolicy policy = EvictionPolicy::OldestInsert,
                        double evict_fraction = cache::kEvictFraction)
      : capacity_(std::max<std::size_t>(capacity, 1)), policy_(policy),
        evict_fraction_(evict_fraction) {}

  auto put(const K &key, V value, TimePoint now,
           std::optional<Clock::duration> ttl = std::nullopt) -> V & {
    std::optional<TimePoint> expires;
    if (ttl) {
      expires = now + *ttl;
    }
    if (auto it = entries_.find(key); it != entries_.end()) {
      it->second.value = std::move(value);
      it->second.expires_at = expires;
      it->second.last_access = now;
      it->second.seq = ++seq_;
      return it->second.value;
    }
    make_room(now);
    auto [it, _] = entries_.emplace(
        key, Entry{std::move(value), expires, now, ++seq_});
    return it->second.value;
  }

  /// Live entry or nullptr; an expired entry is erased on the way out.
  [[nodiscard]] auto get(const K &key, TimePoint now) -> V * {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
      return nullptr;
    }
    if (it->second.expires_at && *it->second.expires_at <= now) {
      entries_.erase(it);
      return nullptr;
    }
    it->second.last_access = now;
    return &it->second.value;
  }

  /// Lookup without expiry check or access bookkeeping.
  [[nodiscard]] auto peek(const K &key) const -> const V * {
    auto it = entries_.find(key);
    return it == entries_.end() ? nullptr : &it->second.value;
  }

  [[nodiscard]] auto expires_at(const K &key) const
      -> std::optional<TimePoint> {
    auto it = entries_.find(key);
    return it == entries_.end() ? std::nullopt : it->second.expires_at;
  }

  /// Existing value (expiry ignored), or a default-constructed one inserted
  /// without expiry.
  auto emplace_or_get(const K &key, TimePoint now) -> V & {
    if (auto it = entries_.find(key); it != entries_.end()) {
      it->second.last_access = now;
      return it->second.value;
    }
    make_room(now);
    auto [it, _] =
        entries_.emplace(key, Entry{V{}, std::nullopt, now, ++seq_});
    return it->second.value;
  }

  auto erase(const K &key) -> bool { return entries_.erase(key) > 0; }

  template <typename Pred> auto erase_if(Pred &&pred) -> std::size_t {
    std::vector<K> victims;
    for (const auto &[key, entry] : entries_) {
      if (pred(key, entry.value)) {
        victims.push_back(key);
      }
    }
    for (const auto &key : victims) {
      entries_.erase(key);
    }
    return victims.size();
  }

  /// Removes every expired entry.
  auto sweep(TimePoint now) -> std::size_t {
    std::vector<K> victims;
    for (const auto &[key, entry] : entries_) {
      if (entry.expires_at && *entry.expires_at <= now) {
        victims.push_back(key);
      }
    }
    for (const auto &key : victims) {
      entries_.erase(key);
    }
    return victims.size();
  }

  template <typename Fn> auto for_each(Fn &&fn) const -> void {
    for (const auto &[key, entry] : entries_) {
      fn(key, entry.value);
    }
  }

  auto clear() -> void { entries_.clear(); }

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return entries_.size();
  }
  [[nodiscard]] auto empty() const noexcept -> bool { return entries_.empty(); }
  [[nodiscard]] auto capacity() const noexcept -> std::size_t {
    return capacity_;
  }

private:
  auto make_room(TimePoint now) -> void {
    if (entries_.size() < capacity_) {
      return;
    }
    sweep(now);
    if (entries_.size() < capacity_) {
      return;
    }

    const auto batch = std::max<std::size_t>(
        1, static_cast<std::size_t>(
               std::ceil(static_cast<double>(capacity_) * evict_fraction_)));

    std::vector<std::pair<std::uint64_t, K>> order;
    order.reserve(entries_.size());
    for (const auto &[key, entry] : entries_) {
      const auto rank =
          policy_ == EvictionPolicy::OldestInsert
              ? entry.seq
              : static_cast<std::uint64_t>(
                    entry.last_access.time_since_epoch().count());
      order.emplace_back(rank, key);
    }
    const auto n = std::min(batch, order.size());
    std::ranges::partial_sort(order, order.begin() + static_cast<std::ptrdiff_t>(n),
                              {}, &std::pair<std::uint64_t, K>::first);
    for (std::size_t i = 0; i < n; ++i) {
      entries_.erase(order[i].second);
    }
  }

  ankerl::unordered_dense::map<K, Entry, Hash, KeyEqual> entries_;
  std::size_t capacity_;
  EvictionPolicy policy_;
  double evict_fraction_;
  std::uint64_t seq_{0};
};

} // namespace caprouter::util
