#pragma once

#include "caprouter/core/coroutine.hpp"
#include "caprouter/router/invocation.hpp"
#include "caprouter/util/async_event.hpp"
#include "caprouter/util/enum.hpp"
#include "caprouter/util/time.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/describe/enum.hpp>

#include <array>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <tuple>

namespace caprouter {

// Underlying value is the dispatch rank: lower goes first.
enum class Priority : std::uint8_t { Critical, High, Normal, Low };
BOOST_DESCRIBE_ENUM(Priority, Critical, High, Normal, Low)
CAPROUTER_DEFINE_ENUM_SERDE(Priority, Priority::Normal)

inline constexpr std::size_t kPriorityCount = util::enum_count<Priority>;

/// One-step promotion for a request that has waited `waited`:
/// low -> normal at 5s, normal -> high at 10s, high -> critical at 15s.
/// Reported only; the live queue is never re-sorted.
[[nodiscard]] auto escalate(Priority priority, std::chrono::milliseconds waited)
    -> Priority;

struct SchedulerStats {
  std::size_t queued{0};
  std::size_t active{0};
  int max_concurrency{0};
  std::uint64_t dispatched{0};
  std::array<std::size_t, kPriorityCount> by_priority{};
  std::array<std::size_t, kPriorityCount> escalated_by_priority{};
};

// Bounds concurrent dispatches and orders waiting work by
// (priority rank, enqueue time, arrival sequence). Draining is posted, so a
// burst of enqueues from one handler is fully ordered before any dispatch.
// Running work is never preempted.
class PriorityScheduler {
public:
  using Dispatcher = std::function<task<InvocationResult>(InvocationRequest)>;

  PriorityScheduler(boost::asio::any_io_executor executor, int max_concurrency,
                    Dispatcher dispatcher);

  PriorityScheduler(const PriorityScheduler &) = delete;
  PriorityScheduler &operator=(const PriorityScheduler &) = delete;

  [[nodiscard]] auto enqueue(InvocationRequest request, Priority priority)
      -> task<InvocationResult>;

  [[nodiscard]] auto stats(TimePoint now = Clock::now()) const
      -> SchedulerStats;

  [[nodiscard]] auto queued() const noexcept -> std::size_t {
    return queue_.size();
  }
  [[nodiscard]] auto active() const noexcept -> int { return active_; }

private:
  using Completion = util::SharedResult<InvocationResult>;
  using Key = std::tuple<std::uint8_t, TimePoint, std::uint64_t>;

  struct Entry {
    InvocationRequest request;
    Priority priority{Priority::Normal};
    TimePoint enqueued_at;
    std::shared_ptr<Completion> done;
  };

  auto schedule_drain() -> void;
  auto drain() -> void;
  auto run(Entry entry) -> spawn_task;

  boost::asio::any_io_executor executor_;
  int max_concurrency_;
  Dispatcher dispatcher_;
  std::map<Key, Entry> queue_;
  int active_{0};
  std::uint64_t seq_{0};
  std::uint64_t dispatched_{0};
  bool drain_posted_{false};
};

} // namespace caprouter
