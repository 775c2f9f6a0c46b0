#pragma once

#include "caprouter/core/coroutine.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/as_tuple.hpp>
#include <boost/asio/steady_timer.hpp>

#include <optional>
#include <stdexcept>
#include <utility>

namespace caprouter::util {

// One-shot broadcast event for coroutines on a single executor. Waiters park
// on a timer that never expires; set() cancels it, waking every waiter.
class AsyncEvent {
public:
  explicit AsyncEvent(boost::asio::any_io_executor executor)
      : timer_(std::move(executor),
               boost::asio::steady_timer::time_point::max()) {}

  AsyncEvent(const AsyncEvent &) = delete;
  AsyncEvent &operator=(const AsyncEvent &) = delete;

  auto set() -> void {
    if (set_) {
      return;
    }
    set_ = true;
    timer_.cancel();
  }

  [[nodiscard]] auto is_set() const noexcept -> bool { return set_; }

  auto wait() -> task<void> {
    while (!set_) {
      auto [ec] = co_await timer_.async_wait(
          boost::asio::as_tuple(boost::asio::use_awaitable));
      (void)ec;
    }
  }

private:
  boost::asio::steady_timer timer_;
  bool set_{false};
};

// A value published once and read by any number of waiters.
template <typename T> class SharedResult {
public:
  explicit SharedResult(boost::asio::any_io_executor executor)
      : ready_(std::move(executor)) {}

  auto publish(T value) -> void {
    if (value_) {
      return;
    }
    value_ = std::move(value);
    ready_.set();
  }

  [[nodiscard]] auto ready() const noexcept -> bool { return value_.has_value(); }

  auto get() -> task<T> {
    co_await ready_.wait();
    if (!value_) {
      throw std::logic_error("shared result woken without a value");
    }
    co_return *value_;
  }

private:
  AsyncEvent ready_;
  std::optional<T> value_;
};

} // namespace caprouter::util
