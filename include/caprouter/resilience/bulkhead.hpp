#pragma once

#include "caprouter/core/coroutine.hpp"
#include "caprouter/util/async_event.hpp"

#include <ankerl/unordered_dense.h>
#include <boost/asio/any_io_executor.hpp>

#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace caprouter {

struct BulkheadStats {
  int active{0};
  int max_concurrent{0};
  std::size_t queued{0};
};

// Named pools with independent concurrency ceilings. Work beyond a pool's
// ceiling waits FIFO in that pool only; a released slot is handed straight to
// the oldest waiter.
class BulkheadRegistry {
public:
  explicit BulkheadRegistry(boost::asio::any_io_executor executor)
      : executor_(std::move(executor)) {}

  template <typename T>
  auto run(std::string name, int max_concurrent, task<T> work) -> task<T> {
    co_await acquire(name, max_concurrent);
    SlotGuard guard{this, name};
    co_return co_await std::move(work);
  }

  [[nodiscard]] auto stats(const std::string &name) const
      -> std::optional<BulkheadStats>;

  [[nodiscard]] auto pool_count() const noexcept -> std::size_t {
    return pools_.size();
  }

private:
  struct Pool {
    int active{0};
    int max_concurrent{1};
    std::deque<std::shared_ptr<util::AsyncEvent>> waiters;
  };

  struct SlotGuard {
    BulkheadRegistry *owner;
    std::string name;
    ~SlotGuard() { owner->release(name); }
  };

  auto acquire(const std::string &name, int max_concurrent) -> task<void>;
  auto release(const std::string &name) -> void;

  boost::asio::any_io_executor executor_;
  ankerl::unordered_dense::map<std::string, Pool> pools_;
};

} // namespace caprouter
