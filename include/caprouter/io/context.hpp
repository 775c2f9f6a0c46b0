#pragma once

#include "caprouter/core/coroutine.hpp"

#include <boost/asio/io_context.hpp>

#include <chrono>

namespace caprouter::io {

/// IoContext is directly boost::asio::io_context.
using IoContext = boost::asio::io_context;

/// Suspends the calling coroutine on its own executor. A cancelled timer
/// resumes early without throwing.
[[nodiscard]] auto async_sleep(std::chrono::milliseconds duration)
    -> spawn_task;

} // namespace caprouter::io
