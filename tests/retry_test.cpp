#include "caprouter/resilience/retry.hpp"
#include "caprouter/util/backoff.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <random>

using namespace caprouter;
using namespace std::chrono_literals;
using caprouter::test::ScriptedExecutor;
using caprouter::test::run_coro;

namespace {

auto fast_retry(int attempts = 3, int timeout_ms = 1000) -> RetryEngine {
  return RetryEngine(RetryConfig{.max_attempts = attempts,
                                 .base_delay_ms = 1,
                                 .jitter_ratio = 0.0,
                                 .attempt_timeout_ms = timeout_ms},
                     42);
}

auto ctx_for(std::string_view id) -> ExecutionContext {
  return ExecutionContext{.capability_id = CapabilityId{id},
                          .inputs = {},
                          .preferences = std::nullopt,
                          .request_id = RequestId{"req_test"},
                          .timestamp = 0};
}

} // namespace

TEST(RetryTest, SucceedsFirstTime) {
  auto engine = fast_retry();
  auto exec = std::make_shared<ScriptedExecutor>();
  auto result = run_coro(engine.execute_with_retry(exec, ctx_for("cap.a")));
  EXPECT_TRUE(result.success);
  EXPECT_EQ(result.metadata.attempts, 1);
  EXPECT_EQ(exec->calls, 1);
}

TEST(RetryTest, RecoversAfterTransientFailures) {
  auto engine = fast_retry();
  auto exec = std::make_shared<ScriptedExecutor>();
  exec->fail_first = 2;
  auto result = run_coro(engine.execute_with_retry(exec, ctx_for("cap.a")));
  EXPECT_TRUE(result.success);
  EXPECT_EQ(result.metadata.attempts, 3);
  EXPECT_EQ(exec->calls, 3);
}

TEST(RetryTest, ExhaustionReportsLastError) {
  auto engine = fast_retry();
  auto exec = std::make_shared<ScriptedExecutor>();
  exec->always_fail = true;
  auto result = run_coro(engine.execute_with_retry(exec, ctx_for("cap.a")));
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error,
            "Execution failed after 3 attempts: upstream unavailable");
  EXPECT_EQ(result.metadata.attempts, 3);
  EXPECT_EQ(result.metadata.cost_actual, 0.0);
  EXPECT_EQ(result.metadata.note, "Failed after 3 retry attempts");
  EXPECT_EQ(exec->calls, 3);
}

TEST(RetryTest, NonRetryableErrorStopsImmediately) {
  auto engine = fast_retry();
  auto exec = std::make_shared<ScriptedExecutor>();
  exec->always_fail = true;
  exec->error = "Missing required input: base_token";
  auto result = run_coro(engine.execute_with_retry(exec, ctx_for("cap.a")));
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, "Missing required input: base_token");
  EXPECT_EQ(exec->calls, 1);
}

TEST(RetryTest, ExplicitAttemptCountOverridesDefault) {
  auto engine = fast_retry(5);
  auto exec = std::make_shared<ScriptedExecutor>();
  exec->always_fail = true;
  auto result =
      run_coro(engine.execute_with_retry(exec, ctx_for("cap.a"), 1));
  EXPECT_EQ(exec->calls, 1);
  EXPECT_EQ(result.error,
            "Execution failed after 1 attempts: upstream unavailable");
}

TEST(RetryTest, SlowAttemptTimesOut) {
  auto engine = fast_retry(1, 30);
  auto exec = std::make_shared<ScriptedExecutor>();
  exec->latency = 200ms;
  auto result = run_coro(engine.execute_with_retry(exec, ctx_for("cap.a")));
  EXPECT_FALSE(result.success);
  ASSERT_TRUE(result.error.has_value());
  EXPECT_NE(result.error->find("Timeout after 30ms"), std::string::npos);
}

TEST(RetryTest, ObserverSeesEveryAttempt) {
  auto engine = fast_retry();
  int observed = 0;
  int successes = 0;
  engine.set_attempt_observer(
      [&](const CapabilityId &id, const AttemptSample &sample) {
        EXPECT_EQ(id.value(), "cap.a");
        ++observed;
        successes += sample.success ? 1 : 0;
      });
  auto exec = std::make_shared<ScriptedExecutor>();
  exec->fail_first = 1;
  auto result = run_coro(engine.execute_with_retry(exec, ctx_for("cap.a")));
  EXPECT_TRUE(result.success);
  EXPECT_EQ(observed, 2);
  EXPECT_EQ(successes, 1);
}

TEST(RetryTest, NonRetryableClassification) {
  EXPECT_TRUE(is_non_retryable_error("Capability cap.x not found"));
  EXPECT_TRUE(is_non_retryable_error("Missing required input: address"));
  EXPECT_FALSE(is_non_retryable_error("upstream unavailable"));
  EXPECT_FALSE(is_non_retryable_error(""));
}

TEST(BackoffTest, DoublesWithoutJitter) {
  std::mt19937_64 rng(1);
  EXPECT_EQ(util::backoff_delay(1, 1000ms, 0.0, rng), 1000ms);
  EXPECT_EQ(util::backoff_delay(2, 1000ms, 0.0, rng), 2000ms);
  EXPECT_EQ(util::backoff_delay(3, 1000ms, 0.0, rng), 4000ms);
}

TEST(BackoffTest, JitterStaysWithinBound) {
  std::mt19937_64 rng(7);
  for (int attempt = 1; attempt <= 4; ++attempt) {
    const auto nominal = 100ms * (1 << (attempt - 1));
    for (int i = 0; i < 50; ++i) {
      auto delay = util::backoff_delay(attempt, 100ms, 0.3, rng);
      EXPECT_GE(delay, nominal);
      EXPECT_LE(delay.count(), nominal.count() + nominal.count() * 3 / 10);
    }
  }
}
