#pragma once

#include "caprouter/config/system_config.hpp"
#include "caprouter/core/coroutine.hpp"
#include "caprouter/executor/executor.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <random>
#include <string_view>

namespace caprouter {

struct AttemptSample {
  bool success{false};
  std::int64_t latency_ms{0};
};

/// Errors that will not change on retry (unknown capability, bad inputs).
[[nodiscard]] auto is_non_retryable_error(std::string_view message) -> bool;

// Runs one executor call with bounded retries. Every attempt races a
// deadline; the loser of the race is abandoned, never cancelled, and a late
// completion is dropped.
class RetryEngine {
public:
  using AttemptObserver =
      std::function<void(const CapabilityId &, const AttemptSample &)>;

  explicit RetryEngine(RetryConfig config = {});
  RetryEngine(RetryConfig config, std::uint64_t seed);

  /// Called after every attempt, including timed-out ones.
  auto set_attempt_observer(AttemptObserver observer) -> void {
    observer_ = std::move(observer);
  }

  /// `max_attempts <= 0` uses the configured default.
  [[nodiscard]] auto execute_with_retry(std::shared_ptr<IExecutor> executor,
                                        ExecutionContext ctx,
                                        int max_attempts = 0)
      -> task<ExecutionResult>;

  [[nodiscard]] auto config() const noexcept -> const RetryConfig & {
    return config_;
  }

private:
  [[nodiscard]] auto attempt_with_deadline(std::shared_ptr<IExecutor> executor,
                                           ExecutionContext ctx,
                                           int attempt)
      -> task<ExecutionResult>;

  [[nodiscard]] auto next_delay(int attempt) -> std::chrono::milliseconds;

  RetryConfig config_;
  std::mt19937_64 rng_;
  AttemptObserver observer_;
};

} // namespace caprouter
