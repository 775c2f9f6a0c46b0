#include "caprouter/router/orchestrator.hpp"
#include "caprouter/telemetry/health_monitor.hpp"
#include "caprouter/telemetry/metrics.hpp"
#include "caprouter/telemetry/usage_signal.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <memory>
#include <string>
#include <vector>

using namespace caprouter;
using namespace std::chrono_literals;
using caprouter::test::make_capability;
using caprouter::test::run_coro;
using caprouter::test::ScriptedExecutor;

namespace {

auto price_request(std::string_view token = "SOL") -> InvocationRequest {
  return InvocationRequest{.capability_id = CapabilityId{"cap.price.lookup.v1"},
                           .inputs = {{"base_token", std::string{token}}},
                           .preferences = std::nullopt};
}

auto swap_request() -> InvocationRequest {
  return InvocationRequest{
      .capability_id = CapabilityId{"cap.swap.execute.v1"},
      .inputs = {{"input_token", "SOL"}, {"output_token", "USDC"}},
      .preferences = std::nullopt};
}

} // namespace

class OrchestratorTest : public ::testing::Test {
protected:
  void SetUp() override {
    config_.retry = RetryConfig{.max_attempts = 1,
                                .base_delay_ms = 1,
                                .jitter_ratio = 0.0,
                                .attempt_timeout_ms = 2000};
    config_.breaker = BreakerConfig{
        .failure_threshold = 3, .cooldown_ms = 100, .stale_after_ms = 50};

    registry_ = std::make_shared<InMemoryRegistry>();
    registry_->add(make_capability("cap.price.lookup.v1", {"base_token"}));
    registry_->add(
        make_capability("cap.swap.execute.v1", {"input_token", "output_token"}));
    executor_ = std::make_shared<ScriptedExecutor>();
  }

  auto build(Collaborators collaborators = {}) -> Orchestrator & {
    ExecutorSet executors;
    executors.add(executor_);
    orch_ = std::make_unique<Orchestrator>(io_, config_, registry_,
                                           std::move(executors),
                                           std::move(collaborators));
    return *orch_;
  }

  template <typename T> auto run(task<T> t) -> T {
    return run_coro(io_, std::move(t));
  }

  auto sleep(std::chrono::milliseconds d) -> void {
    run_coro(io_, io::async_sleep(d));
  }

  io::IoContext io_;
  Config config_;
  std::shared_ptr<InMemoryRegistry> registry_;
  std::shared_ptr<ScriptedExecutor> executor_;
  std::unique_ptr<Orchestrator> orch_;
};

TEST_F(OrchestratorTest, UnknownCapability) {
  auto &orch = build();
  auto result = run(orch.invoke(InvocationRequest{
      .capability_id = CapabilityId{"cap.missing.v1"}}));
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, "Capability cap.missing.v1 not found");
  EXPECT_EQ(result.error_code, make_error_code(Error::CapabilityNotFound));
  EXPECT_TRUE(result.request_id.value().starts_with("req_"));
  EXPECT_EQ(executor_->calls, 0);
}

TEST_F(OrchestratorTest, MissingRequiredInput) {
  auto &orch = build();
  auto result = run(orch.invoke(InvocationRequest{
      .capability_id = CapabilityId{"cap.swap.execute.v1"},
      .inputs = {{"input_token", "SOL"}}}));
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, "Missing required input: output_token");
  EXPECT_EQ(result.error_code, make_error_code(Error::MissingRequiredInput));
  EXPECT_EQ(executor_->calls, 0);
  // Caller errors never reach the breaker.
  EXPECT_EQ(orch.breakers().size(), 0u);
}

TEST_F(OrchestratorTest, SuccessfulInvocation) {
  auto &orch = build();
  executor_->cost = 0.0002;
  auto result = run(orch.invoke(price_request()));
  ASSERT_TRUE(result.success) << result.error.value_or("");
  EXPECT_EQ(result.capability_id.value(), "cap.price.lookup.v1");
  EXPECT_EQ((*result.outputs)["echo"]["base_token"].get<std::string>(), "SOL");
  EXPECT_EQ(result.metadata.execution.executor, "scripted");
  EXPECT_EQ(result.metadata.execution.attempts, 1);
  EXPECT_EQ(result.metadata.privacy_level, 0);
  EXPECT_FALSE(result.metadata.cached);
  EXPECT_FALSE(result.metadata.economic_hints.has_value());

  auto score = orch.health_score(CapabilityId{"cap.price.lookup.v1"});
  ASSERT_TRUE(score.has_value());
  EXPECT_EQ(score->success_rate, 100);
  EXPECT_EQ(score->total_calls, 1u);
  EXPECT_FALSE(orch.health_score(CapabilityId{"cap.swap.execute.v1"}));
}

TEST_F(OrchestratorTest, RepeatedCallIsServedFromCache) {
  auto &orch = build();
  auto first = run(orch.invoke(price_request()));
  auto second = run(orch.invoke(price_request()));
  ASSERT_TRUE(second.success);
  EXPECT_TRUE(second.metadata.cached);
  EXPECT_NE(first.request_id, second.request_id);
  EXPECT_EQ(executor_->calls, 1);

  // A cache hit leaves the breaker untouched.
  const CapabilityId id{"cap.price.lookup.v1"};
  orch.breakers().record_result(id, false);
  orch.breakers().record_result(id, false);
  ASSERT_NE(orch.breakers().state(id), nullptr);
  const int failures = orch.breakers().state(id)->failures;
  ASSERT_EQ(failures, 2);
  auto third = run(orch.invoke(price_request()));
  EXPECT_TRUE(third.metadata.cached);
  EXPECT_EQ(orch.breakers().state(id)->failures, failures);
  EXPECT_EQ(executor_->calls, 1);

  auto other = run(orch.invoke(price_request("BONK")));
  EXPECT_FALSE(other.metadata.cached);
  EXPECT_EQ(executor_->calls, 2);
}

TEST_F(OrchestratorTest, FailuresAreNotCached) {
  auto &orch = build();
  executor_->fail_first = 1;
  auto first = run(orch.invoke(price_request()));
  EXPECT_FALSE(first.success);
  EXPECT_EQ(first.error_code, make_error_code(Error::ExecutionFailed));
  auto second = run(orch.invoke(price_request()));
  EXPECT_TRUE(second.success);
  EXPECT_FALSE(second.metadata.cached);
  EXPECT_EQ(executor_->calls, 2);
}

TEST_F(OrchestratorTest, RetriesExhaustedErrorCode) {
  config_.retry.max_attempts = 2;
  auto &orch = build();
  executor_->always_fail = true;
  auto result = run(orch.invoke(price_request()));
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error_code, make_error_code(Error::RetriesExhausted));
  EXPECT_EQ(result.error,
            "Execution failed after 2 attempts: upstream unavailable");
  EXPECT_EQ(executor_->calls, 2);
}

TEST_F(OrchestratorTest, HealthScoreCountsEveryAttempt) {
  config_.retry.max_attempts = 3;
  auto &orch = build();
  executor_->always_fail = true;
  auto result = run(orch.invoke(price_request()));
  EXPECT_FALSE(result.success);
  EXPECT_EQ(executor_->calls, 3);

  auto score = orch.health_score(CapabilityId{"cap.price.lookup.v1"});
  ASSERT_TRUE(score.has_value());
  EXPECT_EQ(score->total_calls, 3u);
  EXPECT_EQ(score->success_rate, 0);
}

TEST_F(OrchestratorTest, ConcurrentIdenticalCallsCoalesce) {
  auto &orch = build();
  executor_->latency = 20ms;
  auto batch = run(orch.batch_invoke({price_request(), price_request()}));
  ASSERT_EQ(batch.results.size(), 2u);
  EXPECT_TRUE(batch.success);
  EXPECT_EQ(executor_->calls, 1);
  EXPECT_FALSE(batch.results[0].metadata.coalesced);
  EXPECT_TRUE(batch.results[1].metadata.coalesced);
  EXPECT_NE(batch.results[0].request_id, batch.results[1].request_id);
}

TEST_F(OrchestratorTest, BatchKeepsRequestOrder) {
  auto &orch = build();
  executor_->latency = 10ms;
  auto batch = run(orch.batch_invoke(
      {price_request("SOL"), swap_request(),
       InvocationRequest{.capability_id = CapabilityId{"cap.missing.v1"}}}));
  ASSERT_EQ(batch.results.size(), 3u);
  EXPECT_FALSE(batch.success);
  EXPECT_EQ(batch.results[0].capability_id.value(), "cap.price.lookup.v1");
  EXPECT_EQ(batch.results[1].capability_id.value(), "cap.swap.execute.v1");
  EXPECT_TRUE(batch.results[1].success);
  EXPECT_EQ(batch.results[2].error_code,
            make_error_code(Error::CapabilityNotFound));
  EXPECT_GE(batch.parallelism_benefit_ms, 0);

  auto json = to_json(batch);
  EXPECT_EQ(json["results"].get_array().size(), 3u);
}

TEST_F(OrchestratorTest, EmptyBatchSucceeds) {
  auto &orch = build();
  auto batch = run(orch.batch_invoke({}));
  EXPECT_TRUE(batch.success);
  EXPECT_TRUE(batch.results.empty());
}

TEST_F(OrchestratorTest, BreakerOpensThenRecovers) {
  auto &orch = build();
  executor_->always_fail = true;
  for (int i = 0; i < 3; ++i) {
    EXPECT_FALSE(run(orch.invoke(price_request())).success);
  }
  EXPECT_EQ(executor_->calls, 3);

  auto rejected = run(orch.invoke(price_request()));
  EXPECT_FALSE(rejected.success);
  EXPECT_EQ(rejected.error_code, make_error_code(Error::CircuitOpen));
  EXPECT_TRUE(rejected.metadata.circuit_open);
  ASSERT_TRUE(rejected.metadata.retry_after_ms.has_value());
  EXPECT_LE(*rejected.metadata.retry_after_ms, 100);
  EXPECT_TRUE(rejected.error->starts_with(
      "Circuit breaker open for cap.price.lookup.v1"));
  EXPECT_EQ(executor_->calls, 3);
  EXPECT_EQ(orch.health_check()["status"].get<std::string>(), "degraded");

  sleep(150ms);
  executor_->always_fail = false;
  auto probe = run(orch.invoke(price_request()));
  EXPECT_TRUE(probe.success);
  EXPECT_EQ(orch.breakers().state(CapabilityId{"cap.price.lookup.v1"})->state,
            BreakerState::Closed);
  EXPECT_EQ(orch.health_check()["status"].get<std::string>(), "healthy");
}

TEST_F(OrchestratorTest, ManualBreakerReset) {
  auto &orch = build();
  executor_->always_fail = true;
  for (int i = 0; i < 3; ++i) {
    (void)run(orch.invoke(price_request()));
  }
  EXPECT_TRUE(orch.reset_circuit_breaker(CapabilityId{"cap.price.lookup.v1"}));
  EXPECT_FALSE(orch.reset_circuit_breaker(CapabilityId{"cap.none"}));
  executor_->always_fail = false;
  EXPECT_TRUE(run(orch.invoke(price_request())).success);
}

TEST_F(OrchestratorTest, NoMatchingExecutor) {
  ExecutorSet executors;
  executors.add(std::make_shared<ScriptedExecutor>("swap-only", "swap"));
  Orchestrator orch(io_, config_, registry_, std::move(executors));
  auto result = run_coro(io_, orch.invoke(price_request()));
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, "No suitable executor found");
  EXPECT_EQ(result.error_code, make_error_code(Error::NoExecutor));
}

TEST_F(OrchestratorTest, DeduplicatedInvoke) {
  auto &orch = build();
  auto first = run(orch.deduplicated_invoke(price_request()));
  auto second = run(orch.deduplicated_invoke(price_request()));
  EXPECT_TRUE(first.success);
  EXPECT_FALSE(first.metadata.deduplicated);
  EXPECT_TRUE(second.metadata.deduplicated);
  EXPECT_EQ(executor_->calls, 1);
  EXPECT_EQ(orch.status()["cache"]["dedup_hits"].get<std::int64_t>(), 1);
}

TEST_F(OrchestratorTest, QueuedAndIsolatedInvocations) {
  auto &orch = build();
  auto queued = run(orch.queued_invoke(price_request(), Priority::High));
  EXPECT_TRUE(queued.success);
  EXPECT_EQ(orch.scheduler().stats().dispatched, 1u);

  auto isolated = run(orch.isolated_invoke("pricing", 2, swap_request()));
  EXPECT_TRUE(isolated.success);
  EXPECT_EQ(orch.bulkheads().pool_count(), 1u);
  EXPECT_EQ(orch.bulkheads().stats("pricing")->active, 0);
}

TEST_F(OrchestratorTest, PrefetchWarmsPredictedCapability) {
  auto &orch = build();
  const AgentId agent{"agent-a"};

  ASSERT_TRUE(run(orch.invoke_with_prefetch(agent, price_request())).success);
  ASSERT_TRUE(run(orch.invoke_with_prefetch(agent, swap_request())).success);
  EXPECT_EQ(executor_->calls, 2);

  auto next = orch.predicted_next(CapabilityId{"cap.price.lookup.v1"});
  ASSERT_EQ(next.size(), 1u);
  EXPECT_EQ(next[0].capability_id.value(), "cap.swap.execute.v1");

  orch.cache().clear();
  ASSERT_TRUE(run(orch.invoke_with_prefetch(agent, price_request())).success);
  // The price call plus the background warm-up of the swap.
  EXPECT_EQ(executor_->calls, 4);

  auto warmed = run(orch.invoke(swap_request()));
  EXPECT_TRUE(warmed.metadata.cached);
  EXPECT_EQ(executor_->calls, 4);
}

TEST_F(OrchestratorTest, PrefetchWithoutWarmingOnlyPlans) {
  config_.prefetch.warm_cache = false;
  auto &orch = build();
  const AgentId agent{"agent-a"};
  (void)run(orch.invoke_with_prefetch(agent, price_request()));
  (void)run(orch.invoke_with_prefetch(agent, swap_request()));
  orch.cache().clear();
  (void)run(orch.invoke_with_prefetch(agent, price_request()));
  EXPECT_EQ(executor_->calls, 3);
  EXPECT_EQ(orch.predicted_next(CapabilityId{"cap.price.lookup.v1"}).size(), 1u);
}

TEST_F(OrchestratorTest, RecommendationsReflectFailures) {
  auto &orch = build();
  executor_->fail_first = 2;
  (void)run(orch.invoke(price_request("A")));
  (void)run(orch.invoke(price_request("B")));
  auto recs = orch.recommendations(CapabilityId{"cap.price.lookup.v1"});
  ASSERT_FALSE(recs.performance_tips.empty());
  EXPECT_EQ(recs.performance_tips.front(),
            "This capability has 2 recent failures - consider error handling");
}

TEST_F(OrchestratorTest, CollaboratorsReceiveOutcomes) {
  auto health = std::make_shared<CapabilityHealthMonitor>();
  auto metrics = std::make_shared<InMemoryMetrics>();
  auto settlement = std::make_shared<UsageSignalEmitter>();
  auto &orch = build(Collaborators{
      .health = health, .metrics = metrics, .settlement = settlement});
  executor_->cost = 0.0003;

  auto result = run(orch.invoke(price_request()));
  ASSERT_TRUE(result.success);
  ASSERT_TRUE(result.metadata.chain_signal.has_value());
  EXPECT_EQ(result.metadata.chain_signal->request_id, result.request_id.str());
  EXPECT_EQ(result.metadata.chain_signal->cost, 0.0003);

  EXPECT_EQ(health->event_count(), 1u);
  EXPECT_EQ(metrics->counters(CapabilityId{"cap.price.lookup.v1"}).calls, 1u);
  EXPECT_EQ(settlement->stats().total, 1u);

  // Cache hits do not report again.
  (void)run(orch.invoke(price_request()));
  EXPECT_EQ(settlement->stats().total, 1u);
}

TEST_F(OrchestratorTest, ConfidentialCapabilityGetsHints) {
  auto doc = make_capability("cap.document.parse.v1", {"document_url"},
                             ExecutionMode::Confidential);
  doc.economics.cost_hint = 0.01;
  doc.economics.privacy_cash_compatible = true;
  doc.economics.x402 = PaymentSignalTerms{.enabled = true};
  registry_->add(doc);
  auto &orch = build();

  auto result = run(orch.invoke(InvocationRequest{
      .capability_id = CapabilityId{"cap.document.parse.v1"},
      .inputs = {{"document_url", "ipfs://doc"}}}));
  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.metadata.privacy_level, 2);
  ASSERT_TRUE(result.metadata.economic_hints.has_value());
  ASSERT_TRUE(result.metadata.economic_hints->x402.has_value());
  EXPECT_DOUBLE_EQ(result.metadata.economic_hints->x402->suggested_amount, 0.01);
  EXPECT_TRUE(result.metadata.economic_hints->privacy_cash.has_value());
}

TEST_F(OrchestratorTest, PolicyExecutionDispatchesThroughInvoke) {
  auto &orch = build();
  auto result = run(orch.execute_with_policy(PolicyExecutionRequest{
      .agent_id = AgentId{"agent-a"},
      .capability_type = "swap",
      .inputs = {{"input_token", "SOL"}, {"output_token", "USDC"}},
      .policy = {.max_cost = 0.002}}));
  ASSERT_TRUE(result.success) << result.error.value_or("");
  EXPECT_EQ(result.route_used->id, "jupiter");
  EXPECT_TRUE(verify_proof(result.proof));
  EXPECT_EQ(executor_->calls, 1);

  auto json = to_json(result);
  EXPECT_EQ(json["proof_hash"].get<std::string>(), result.proof.digest);
}

TEST_F(OrchestratorTest, StatusReport) {
  auto &orch = build();
  (void)run(orch.invoke(price_request()));
  (void)run(orch.invoke(price_request()));

  auto status = orch.status();
  EXPECT_EQ(status["capabilities_registered"].get<std::int64_t>(), 2);
  EXPECT_EQ(status["executors"].get_array().size(), 1u);
  EXPECT_EQ(status["cache"]["entries"].get<std::int64_t>(), 1);
  EXPECT_EQ(status["cache"]["hits"].get<std::int64_t>(), 1);
  EXPECT_EQ(status["cache"]["in_flight"].get<std::int64_t>(), 0);
  EXPECT_EQ(status["queue"]["by_priority"]["critical"].get<std::int64_t>(), 0);
  EXPECT_EQ(status["circuit_breakers"]["cap.price.lookup.v1"]["state"]
                .get<std::string>(),
            "closed");
}

TEST_F(OrchestratorTest, HealthCheckWithoutCapabilities) {
  registry_ = std::make_shared<InMemoryRegistry>();
  auto &orch = build();
  auto health = orch.health_check();
  EXPECT_EQ(health["status"].get<std::string>(), "unhealthy");
  EXPECT_EQ(health["capabilities"].get<std::int64_t>(), 0);
}

TEST_F(OrchestratorTest, MaintenanceSweepsExpiredState) {
  auto &orch = build();
  (void)run(orch.deduplicated_invoke(price_request(), 10ms));
  sleep(60ms);
  // Expired dedup entry plus the clean breaker for the price capability.
  EXPECT_GE(orch.perform_maintenance(), 2u);
  EXPECT_EQ(orch.status()["cache"]["dedup_entries"].get<std::int64_t>(), 0);
  EXPECT_EQ(orch.breakers().size(), 0u);
}
