#include "caprouter/resilience/bulkhead.hpp"

#include "caprouter/util/log.hpp"

#include <algorithm>

namespace caprouter {

auto BulkheadRegistry::acquire(const std::string &name, int max_concurrent)
    -> task<void> {
  auto &pool = pools_[name];
  pool.max_concurrent = std::max(max_concurrent, 1);
  if (pool.active < pool.max_concurrent) {
    ++pool.active;
    co_return;
  }

  auto slot = std::make_shared<util::AsyncEvent>(executor_);
  pool.waiters.push_back(slot);
  log::debug("Bulkhead {} full ({} active), {} waiting", name, pool.active,
             pool.waiters.size());
  // The releasing side transfers its slot; `active` is unchanged.
  co_await slot->wait();
}

auto BulkheadRegistry::release(const std::string &name) -> void {
  auto it = pools_.find(name);
  if (it == pools_.end()) {
    return;
  }
  auto &pool = it->second;
  if (!pool.waiters.empty()) {
    auto next = std::move(pool.waiters.front());
    pool.waiters.pop_front();
    next->set();
    return;
  }
  if (pool.active > 0) {
    --pool.active;
  }
}

auto BulkheadRegistry::stats(const std::string &name) const
    -> std::optional<BulkheadStats> {
  auto it = pools_.find(name);
  if (it == pools_.end()) {
    return std::nullopt;
  }
  return BulkheadStats{.active = it->second.active,
                       .max_concurrent = it->second.max_concurrent,
                       .queued = it->second.waiters.size()};
}

} // namespace caprouter
