#include "caprouter/resilience/retry.hpp"

#include "caprouter/io/context.hpp"
#include "caprouter/util/backoff.hpp"
#include "caprouter/util/log.hpp"

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>

#include <format>
#include <optional>
#include <string>

namespace caprouter {

namespace {

struct AttemptRace {
  explicit AttemptRace(boost::asio::any_io_executor ex) : timer(std::move(ex)) {}

  boost::asio::steady_timer timer;
  std::optional<ExecutionResult> result;
  bool abandoned{false};
};

auto run_attempt(std::shared_ptr<IExecutor> executor, ExecutionContext ctx,
                 std::shared_ptr<AttemptRace> race) -> spawn_task {
  const auto capability = ctx.capability_id;
  ExecutionResult result;
  try {
    result = co_await executor->execute(std::move(ctx));
  } catch (const std::exception &e) {
    result = ExecutionResult::failure(std::string(executor->name()), e.what());
  }
  if (race->abandoned) {
    log::debug("Ignoring late completion of {} on {}", capability,
               executor->name());
    co_return;
  }
  race->result = std::move(result);
  race->timer.cancel();
}

} // namespace

auto is_non_retryable_error(std::string_view message) -> bool {
  return message.find("not found") != std::string_view::npos ||
         message.find("Missing required") != std::string_view::npos;
}

RetryEngine::RetryEngine(RetryConfig config)
    : RetryEngine(config, std::random_device{}()) {}

RetryEngine::RetryEngine(RetryConfig config, std::uint64_t seed)
    : config_(config), rng_(seed) {}

auto RetryEngine::next_delay(int attempt) -> std::chrono::milliseconds {
  return util::backoff_delay(attempt,
                             std::chrono::milliseconds(config_.base_delay_ms),
                             config_.jitter_ratio, rng_);
}

auto RetryEngine::attempt_with_deadline(std::shared_ptr<IExecutor> executor,
                                        ExecutionContext ctx, int attempt)
    -> task<ExecutionResult> {
  auto ex = co_await boost::asio::this_coro::executor;
  auto race = std::make_shared<AttemptRace>(ex);
  const auto timeout = std::chrono::milliseconds(config_.attempt_timeout_ms);
  race->timer.expires_after(timeout);

  co_spawn(ex, run_attempt(executor, std::move(ctx), race),
           DiscardSink{"executor attempt"});

  if (!race->result) {
    auto [ec] = co_await race->timer.async_wait(
        boost::asio::as_tuple(boost::asio::use_awaitable));
    (void)ec;
  }
  if (race->result) {
    co_return std::move(*race->result);
  }

  race->abandoned = true;
  co_return ExecutionResult::failure(
      std::string(executor->name()),
      std::format("Timeout after {}ms on attempt {}", timeout.count(),
                  attempt));
}

auto RetryEngine::execute_with_retry(std::shared_ptr<IExecutor> executor,
                                     ExecutionContext ctx, int max_attempts)
    -> task<ExecutionResult> {
  const int attempts = max_attempts > 0 ? max_attempts : config_.max_attempts;
  std::string last_error{"Unknown error"};

  for (int attempt = 1; attempt <= attempts; ++attempt) {
    auto result = co_await attempt_with_deadline(executor, ctx, attempt);
    if (observer_) {
      observer_(ctx.capability_id,
                AttemptSample{.success = result.success,
                              .latency_ms = result.metadata.execution_time_ms});
    }

    const auto error = result.error.value_or("");
    if (result.success || is_non_retryable_error(error)) {
      result.metadata.attempts = attempt;
      co_return result;
    }

    last_error = error.empty() ? std::string{"Unknown error"} : error;
    log::debug("Attempt {}/{} for {} failed: {}", attempt, attempts,
               ctx.capability_id, last_error);

    if (attempt < attempts) {
      co_await io::async_sleep(next_delay(attempt));
    }
  }

  log::warn("{} failed after {} attempts: {}", ctx.capability_id, attempts,
            last_error);
  auto terminal = ExecutionResult::failure(
      std::string(executor->name()),
      std::format("Execution failed after {} attempts: {}", attempts,
                  last_error));
  terminal.metadata.cost_actual = 0.0;
  terminal.metadata.note = std::format("Failed after {} retry attempts", attempts);
  terminal.metadata.attempts = attempts;
  co_return terminal;
}

} // namespace caprouter
