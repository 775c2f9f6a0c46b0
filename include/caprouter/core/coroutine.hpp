#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <exception>

namespace caprouter {

template <typename T = void> using task = boost::asio::awaitable<T>;

/// Convenience alias for fire-and-forget coroutines.
using spawn_task = task<void>;

using boost::asio::co_spawn;
using boost::asio::detached;
using boost::asio::use_awaitable;

/// Completion token for background work: failures are logged by the caller
/// supplied hook and then dropped, never rethrown into the io_context.
struct DiscardSink {
  const char *what{"background task"};
  auto operator()(std::exception_ptr ep) const noexcept -> void;
};

} // namespace caprouter
