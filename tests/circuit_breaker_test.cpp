#include "caprouter/resilience/circuit_breaker.hpp"

#include "gtest/gtest.h"

using namespace caprouter;
using namespace std::chrono_literals;

namespace {

auto bank() -> CircuitBreakerBank {
  return CircuitBreakerBank(BreakerConfig{
      .failure_threshold = 3, .cooldown_ms = 1000, .stale_after_ms = 2000});
}

auto fail_n(CircuitBreakerBank &b, const CapabilityId &id, int n,
            TimePoint at) -> void {
  for (int i = 0; i < n; ++i) {
    b.record_result(id, false, at);
  }
}

} // namespace

TEST(CircuitBreakerTest, UnknownCapabilityIsAllowed) {
  auto b = bank();
  EXPECT_TRUE(b.check_allowed(CapabilityId{"cap.a"}).allowed);
  EXPECT_EQ(b.size(), 0u);
}

TEST(CircuitBreakerTest, OpensAtThreshold) {
  auto b = bank();
  const CapabilityId id{"cap.a"};
  const auto t0 = Clock::now();

  fail_n(b, id, 2, t0);
  EXPECT_EQ(b.state(id)->state, BreakerState::Closed);
  EXPECT_TRUE(b.check_allowed(id, t0).allowed);

  b.record_result(id, false, t0);
  EXPECT_EQ(b.state(id)->state, BreakerState::Open);

  auto decision = b.check_allowed(id, t0 + 100ms);
  EXPECT_FALSE(decision.allowed);
  EXPECT_EQ(decision.reason,
            "Circuit breaker open for cap.a. Too many failures. Retry after 1s");
  EXPECT_EQ(decision.retry_after, 900ms);
}

TEST(CircuitBreakerTest, SuccessResetsFailureCount) {
  auto b = bank();
  const CapabilityId id{"cap.a"};
  const auto t0 = Clock::now();
  fail_n(b, id, 2, t0);
  b.record_result(id, true, t0);
  fail_n(b, id, 2, t0);
  EXPECT_EQ(b.state(id)->state, BreakerState::Closed);
  EXPECT_EQ(b.state(id)->failures, 2);
}

TEST(CircuitBreakerTest, HalfOpenOnlyAfterCooldown) {
  auto b = bank();
  const CapabilityId id{"cap.a"};
  const auto t0 = Clock::now();
  fail_n(b, id, 3, t0);

  EXPECT_FALSE(b.check_allowed(id, t0 + 1000ms).allowed);
  EXPECT_EQ(b.state(id)->state, BreakerState::Open);

  EXPECT_TRUE(b.check_allowed(id, t0 + 1001ms).allowed);
  EXPECT_EQ(b.state(id)->state, BreakerState::HalfOpen);
}

TEST(CircuitBreakerTest, HalfOpenSuccessCloses) {
  auto b = bank();
  const CapabilityId id{"cap.a"};
  const auto t0 = Clock::now();
  fail_n(b, id, 3, t0);
  ASSERT_TRUE(b.check_allowed(id, t0 + 2s).allowed);

  b.record_result(id, true, t0 + 2s);
  EXPECT_EQ(b.state(id)->state, BreakerState::Closed);
  EXPECT_EQ(b.state(id)->failures, 0);
}

TEST(CircuitBreakerTest, HalfOpenFailureReopensAndRestartsCooldown) {
  auto b = bank();
  const CapabilityId id{"cap.a"};
  const auto t0 = Clock::now();
  fail_n(b, id, 3, t0);
  ASSERT_TRUE(b.check_allowed(id, t0 + 2s).allowed);

  b.record_result(id, false, t0 + 2s);
  EXPECT_EQ(b.state(id)->state, BreakerState::Open);
  EXPECT_FALSE(b.check_allowed(id, t0 + 2500ms).allowed);
  EXPECT_TRUE(b.check_allowed(id, t0 + 3001ms).allowed);
}

TEST(CircuitBreakerTest, ResetClosesExistingBreaker) {
  auto b = bank();
  const CapabilityId id{"cap.a"};
  fail_n(b, id, 3, Clock::now());
  EXPECT_TRUE(b.reset(id));
  EXPECT_EQ(b.state(id)->state, BreakerState::Closed);
  EXPECT_TRUE(b.check_allowed(id).allowed);
  EXPECT_FALSE(b.reset(CapabilityId{"cap.none"}));
}

TEST(CircuitBreakerTest, CleanupDropsHealthyAndStaleEntries) {
  auto b = bank();
  const auto t0 = Clock::now();
  b.record_result(CapabilityId{"cap.healthy"}, true, t0);
  b.record_result(CapabilityId{"cap.recent"}, false, t0 + 2500ms);
  b.record_result(CapabilityId{"cap.stale"}, false, t0);

  EXPECT_EQ(b.cleanup(t0 + 3s), 2u);
  EXPECT_EQ(b.size(), 1u);
  EXPECT_NE(b.state(CapabilityId{"cap.recent"}), nullptr);
}

TEST(CircuitBreakerTest, DashboardCountsStates) {
  auto b = bank();
  const auto t0 = Clock::now();
  fail_n(b, CapabilityId{"cap.open"}, 3, t0);
  fail_n(b, CapabilityId{"cap.half"}, 3, t0 - 5s);
  (void)b.check_allowed(CapabilityId{"cap.half"}, t0);
  b.record_result(CapabilityId{"cap.closed"}, false, t0);

  auto dash = b.dashboard();
  EXPECT_EQ(dash.open, 1u);
  EXPECT_EQ(dash.half_open, 1u);
  EXPECT_EQ(dash.closed, 1u);
}
