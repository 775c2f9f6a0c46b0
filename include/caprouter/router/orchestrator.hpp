#pragma once

#include "caprouter/cache/coalescer.hpp"
#include "caprouter/cache/content_dedup.hpp"
#include "caprouter/cache/response_cache.hpp"
#include "caprouter/config/config.hpp"
#include "caprouter/core/coroutine.hpp"
#include "caprouter/executor/executor.hpp"
#include "caprouter/io/context.hpp"
#include "caprouter/learning/dependency_learner.hpp"
#include "caprouter/learning/prefetcher.hpp"
#include "caprouter/policy/policy_router.hpp"
#include "caprouter/registry/registry.hpp"
#include "caprouter/resilience/bulkhead.hpp"
#include "caprouter/resilience/circuit_breaker.hpp"
#include "caprouter/resilience/retry.hpp"
#include "caprouter/router/invocation.hpp"
#include "caprouter/scheduler/priority_scheduler.hpp"
#include "caprouter/telemetry/health_monitor.hpp"
#include "caprouter/telemetry/metrics.hpp"
#include "caprouter/telemetry/usage_signal.hpp"
#include "caprouter/util/bounded_cache.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace caprouter {

// Sinks the dispatch path reports to. Any of them may be null.
struct Collaborators {
  std::shared_ptr<IHealthMonitor> health;
  std::shared_ptr<IMetricsCollector> metrics;
  std::shared_ptr<ISettlementEmitter> settlement;
};

struct BatchResult {
  bool success{false};
  std::vector<InvocationResult> results;
  std::int64_t total_time_ms{0};
  // Sum of per-call execution time minus wall time, floored at zero.
  std::int64_t parallelism_benefit_ms{0};
};

struct HealthScore {
  int success_rate{0}; // percent
  std::int64_t avg_latency_ms{0};
  std::uint64_t total_calls{0};
};

// Single dispatch point for capability invocations. Owns every piece of
// shared dispatch state; all methods must run on the io_context it was built
// with.
//
// invoke() order:
//   response cache -> in-flight coalescer -> registry lookup -> input check
//   -> circuit breaker -> executor selection -> retry engine -> breaker and
//   health bookkeeping -> economic hints -> settlement signal -> cache fill
class Orchestrator {
public:
  Orchestrator(io::IoContext &io, Config config,
               std::shared_ptr<IRegistry> registry, ExecutorSet executors,
               Collaborators collaborators = {});

  Orchestrator(const Orchestrator &) = delete;
  Orchestrator &operator=(const Orchestrator &) = delete;

  /// Never throws; every failure comes back as a result.
  [[nodiscard]] auto invoke(InvocationRequest request)
      -> task<InvocationResult>;

  [[nodiscard]] auto batch_invoke(std::vector<InvocationRequest> requests)
      -> task<BatchResult>;

  [[nodiscard]] auto queued_invoke(InvocationRequest request,
                                   Priority priority = Priority::Normal)
      -> task<InvocationResult>;

  /// `ttl` of zero uses the configured dedup TTL.
  [[nodiscard]] auto deduplicated_invoke(
      InvocationRequest request,
      std::chrono::milliseconds ttl = std::chrono::milliseconds::zero())
      -> task<InvocationResult>;

  /// Learns the caller's call sequence, invokes, then warms likely follow-ups
  /// in the background.
  [[nodiscard]] auto invoke_with_prefetch(const AgentId &caller,
                                          InvocationRequest request)
      -> task<InvocationResult>;

  /// Runs inside a named bulkhead pool with its own concurrency ceiling.
  [[nodiscard]] auto isolated_invoke(std::string pool, int max_concurrent,
                                     InvocationRequest request)
      -> task<InvocationResult>;

  [[nodiscard]] auto execute_with_policy(PolicyExecutionRequest request)
      -> task<PolicyExecutionResult>;

  [[nodiscard]] auto recommendations(const CapabilityId &capability) const
      -> Recommendations;
  [[nodiscard]] auto predicted_next(const CapabilityId &capability,
                                    std::size_t n = 3) const
      -> std::vector<Prediction>;

  [[nodiscard]] auto status() const -> JsonValue;
  [[nodiscard]] auto health_check() const -> JsonValue;
  [[nodiscard]] auto health_score(const CapabilityId &capability) const
      -> std::optional<HealthScore>;

  auto reset_circuit_breaker(const CapabilityId &capability) -> bool;
  auto cleanup_circuit_breakers() -> std::size_t;

  /// Sweeps expired cache, dedup and prefetch entries and stale breakers.
  auto perform_maintenance() -> std::size_t;

  [[nodiscard]] auto breakers() noexcept -> CircuitBreakerBank & {
    return breakers_;
  }
  [[nodiscard]] auto cache() noexcept -> ResponseCache & { return cache_; }
  [[nodiscard]] auto learner() noexcept -> DependencyLearner & {
    return learner_;
  }
  [[nodiscard]] auto prefetcher() noexcept -> Prefetcher & {
    return prefetcher_;
  }
  [[nodiscard]] auto scheduler() noexcept -> PriorityScheduler & {
    return scheduler_;
  }
  [[nodiscard]] auto bulkheads() noexcept -> BulkheadRegistry & {
    return bulkheads_;
  }
  [[nodiscard]] auto policies() noexcept -> PolicyRouter & { return policy_; }
  [[nodiscard]] auto config() const noexcept -> const Config & {
    return config_;
  }

private:
  struct ScoreEntry {
    std::uint64_t successes{0};
    std::uint64_t total{0};
    double avg_latency_ms{0.0};
  };

  auto dispatch(const InvocationRequest &request, const std::string &key)
      -> task<InvocationResult>;
  auto emit_signal(InvocationResult &result, std::int64_t timestamp)
      -> task<void>;
  auto update_health_score(const CapabilityId &capability, bool success,
                           std::int64_t latency_ms) -> void;
  auto schedule_prefetch(const CapabilityId &capability) -> void;
  auto warm(CapabilityId capability, Inputs inputs) -> spawn_task;

  io::IoContext &io_;
  Config config_;
  std::shared_ptr<IRegistry> registry_;
  ExecutorSet executors_;
  Collaborators collaborators_;

  CircuitBreakerBank breakers_;
  RetryEngine retry_;
  ResponseCache cache_;
  Coalescer coalescer_;
  ContentDedupCache dedup_;
  DependencyLearner learner_;
  Prefetcher prefetcher_;
  BulkheadRegistry bulkheads_;
  PriorityScheduler scheduler_;
  PolicyRouter policy_;
  util::BoundedCache<CapabilityId, ScoreEntry> scores_;
};

[[nodiscard]] auto to_json(const BatchResult &batch) -> JsonValue;
[[nodiscard]] auto to_json(const PolicyExecutionResult &result) -> JsonValue;

} // namespace caprouter
