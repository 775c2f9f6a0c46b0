#include "caprouter/scheduler/priority_scheduler.hpp"

#include "caprouter/core/constants.hpp"
#include "caprouter/core/error.hpp"
#include "caprouter/util/log.hpp"

#include <boost/asio/post.hpp>

#include <algorithm>
#include <utility>

namespace caprouter {

auto escalate(Priority priority, std::chrono::milliseconds waited)
    -> Priority {
  switch (priority) {
  case Priority::Low:
    return waited >= scheduling::kEscalateLow ? Priority::Normal : priority;
  case Priority::Normal:
    return waited >= scheduling::kEscalateNormal ? Priority::High : priority;
  case Priority::High:
    return waited >= scheduling::kEscalateHigh ? Priority::Critical : priority;
  case Priority::Critical:
    return priority;
  }
  return priority;
}

PriorityScheduler::PriorityScheduler(boost::asio::any_io_executor executor,
                                     int max_concurrency,
                                     Dispatcher dispatcher)
    : executor_(std::move(executor)),
      max_concurrency_(std::max(max_concurrency, 1)),
      dispatcher_(std::move(dispatcher)) {}

auto PriorityScheduler::enqueue(InvocationRequest request, Priority priority)
    -> task<InvocationResult> {
  auto done = std::make_shared<Completion>(executor_);
  const auto now = Clock::now();
  queue_.emplace(Key{std::to_underlying(priority), now, ++seq_},
                 Entry{.request = std::move(request),
                       .priority = priority,
                       .enqueued_at = now,
                       .done = done});
  schedule_drain();
  co_return co_await done->get();
}

auto PriorityScheduler::schedule_drain() -> void {
  if (drain_posted_) {
    return;
  }
  drain_posted_ = true;
  boost::asio::post(executor_, [this] {
    drain_posted_ = false;
    drain();
  });
}

auto PriorityScheduler::drain() -> void {
  while (active_ < max_concurrency_ && !queue_.empty()) {
    auto node = queue_.extract(queue_.begin());
    ++active_;
    ++dispatched_;
    log::trace("Dispatching {} ({}), {} active, {} queued",
               node.mapped().request.capability_id,
               to_string_view(node.mapped().priority), active_, queue_.size());
    co_spawn(executor_, run(std::move(node.mapped())),
             DiscardSink{"scheduled invocation"});
  }
}

auto PriorityScheduler::run(Entry entry) -> spawn_task {
  InvocationResult result;
  try {
    result = co_await dispatcher_(entry.request);
  } catch (const std::exception &e) {
    log::error("Scheduled invocation of {} threw: {}",
               entry.request.capability_id, e.what());
    result = InvocationResult::failure(generate_request_id(),
                                       entry.request.capability_id,
                                       make_error_code(Error::Unknown),
                                       e.what());
  }
  --active_;
  entry.done->publish(std::move(result));
  schedule_drain();
}

auto PriorityScheduler::stats(TimePoint now) const -> SchedulerStats {
  SchedulerStats s{.queued = queue_.size(),
                   .active = static_cast<std::size_t>(active_),
                   .max_concurrency = max_concurrency_,
                   .dispatched = dispatched_};
  for (const auto &[_, entry] : queue_) {
    ++s.by_priority[std::to_underlying(entry.priority)];
    const auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(
        now - entry.enqueued_at);
    ++s.escalated_by_priority[std::to_underlying(
        escalate(entry.priority, waited))];
  }
  return s;
}

} // namespace caprouter
