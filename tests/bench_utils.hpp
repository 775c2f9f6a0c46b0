#pragma once

#include "caprouter/core/coroutine.hpp"
#include "caprouter/io/context.hpp"

#include <benchmark/benchmark.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_future.hpp>

namespace caprouter::bench {

constexpr int kSmallSize = 10;
constexpr int kMediumSize = 100;
constexpr int kLargeSize = 1000;

// Owns an io_context and drives one coroutine at a time to completion on the
// benchmark thread. Exceptions from the coroutine propagate to the caller.
class IoDriver {
public:
  [[nodiscard]] auto io() noexcept -> io::IoContext & { return io_; }

  template <typename T> auto run(task<T> t) -> T {
    auto fut = boost::asio::co_spawn(io_, std::move(t), boost::asio::use_future);
    io_.restart();
    io_.run();
    return fut.get();
  }

private:
  io::IoContext io_;
};

} // namespace caprouter::bench
