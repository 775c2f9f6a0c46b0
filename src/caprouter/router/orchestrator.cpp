#include "caprouter/router/orchestrator.hpp"

#include "caprouter/core/constants.hpp"
#include "caprouter/telemetry/economics.hpp"
#include "caprouter/util/log.hpp"
#include "caprouter/util/time.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <utility>

namespace caprouter {

namespace {

auto record_metrics(std::shared_ptr<IMetricsCollector> metrics,
                    CapabilityId capability, bool success,
                    std::int64_t latency_ms, double cost) -> spawn_task {
  metrics->record_invocation(capability, success, latency_ms, cost);
  co_return;
}

auto run_batch_item(Orchestrator *self, InvocationRequest request,
                    std::shared_ptr<util::SharedResult<InvocationResult>> slot)
    -> spawn_task {
  slot->publish(co_await self->invoke(std::move(request)));
}

auto failure_code(const ExecutionResult &exec) -> std::error_code {
  if (exec.metadata.attempts > 1) {
    return make_error_code(Error::RetriesExhausted);
  }
  return make_error_code(Error::ExecutionFailed);
}

auto strings_json(const std::vector<std::string> &items) -> JsonValue {
  JsonValue arr = std::vector<JsonValue>{};
  for (const auto &s : items) {
    arr.get_array().emplace_back(s);
  }
  return arr;
}

} // namespace

Orchestrator::Orchestrator(io::IoContext &io, Config config,
                           std::shared_ptr<IRegistry> registry,
                           ExecutorSet executors, Collaborators collaborators)
    : io_(io), config_(std::move(config)), registry_(std::move(registry)),
      executors_(std::move(executors)),
      collaborators_(std::move(collaborators)), breakers_(config_.breaker),
      retry_(config_.retry), cache_(config_.cache),
      coalescer_(io.get_executor()), dedup_(config_.cache),
      learner_(config_.prefetch), prefetcher_(config_.prefetch),
      bulkheads_(io.get_executor()),
      scheduler_(io.get_executor(), config_.scheduler.max_concurrency,
                 [this](InvocationRequest r) { return invoke(std::move(r)); }),
      policy_([this](InvocationRequest r) { return invoke(std::move(r)); },
              config_.policy),
      scores_(limits::kHealthScores, util::EvictionPolicy::LeastRecentlyUsed) {
  // Health scores count attempts, so a retried call contributes one sample
  // per try.
  retry_.set_attempt_observer(
      [this](const CapabilityId &capability, const AttemptSample &sample) {
        update_health_score(capability, sample.success, sample.latency_ms);
      });
}

auto Orchestrator::invoke(InvocationRequest request)
    -> task<InvocationResult> {
  const auto key = canonical_key(request.capability_id.value(), request.inputs);

  if (auto hit = cache_.get(key, request.capability_id)) {
    hit->request_id = generate_request_id();
    hit->metadata.cached = true;
    log::trace("Cache hit for {}", request.capability_id);
    co_return std::move(*hit);
  }

  if (auto pending = coalescer_.join(key)) {
    log::debug("Joining in-flight call to {}", request.capability_id);
    auto shared = co_await pending->get();
    shared.request_id = generate_request_id();
    shared.metadata.coalesced = true;
    co_return shared;
  }

  coalescer_.begin(key);
  InvocationResult result;
  try {
    result = co_await dispatch(request, key);
  } catch (const std::exception &e) {
    log::error("Dispatch of {} threw: {}", request.capability_id, e.what());
    result = InvocationResult::failure(generate_request_id(),
                                       request.capability_id,
                                       make_error_code(Error::Unknown),
                                       e.what());
  }
  coalescer_.finish(key, result);
  co_return result;
}

auto Orchestrator::dispatch(const InvocationRequest &request,
                            const std::string &key) -> task<InvocationResult> {
  auto request_id = generate_request_id();
  const auto timestamp = util::now_unix_millis();
  const auto &id = request.capability_id;

  const auto *capability = registry_->get_capability(id);
  if (capability == nullptr) {
    co_return InvocationResult::failure(
        std::move(request_id), id, make_error_code(Error::CapabilityNotFound),
        std::format("Capability {} not found", id));
  }

  if (auto missing = first_missing_input(*capability, request.inputs)) {
    co_return InvocationResult::failure(
        std::move(request_id), id,
        make_error_code(Error::MissingRequiredInput),
        std::format("Missing required input: {}", *missing));
  }

  if (auto decision = breakers_.check_allowed(id); !decision.allowed) {
    log::debug("Rejected {}: {}", id, decision.reason);
    auto rejected = InvocationResult::failure(
        std::move(request_id), id, make_error_code(Error::CircuitOpen),
        std::move(decision.reason));
    rejected.metadata.circuit_open = true;
    rejected.metadata.retry_after_ms = decision.retry_after.count();
    co_return rejected;
  }

  auto executor = executors_.select(id);
  if (!executor) {
    co_return InvocationResult::failure(std::move(request_id), id,
                                        make_error_code(Error::NoExecutor),
                                        "No suitable executor found");
  }

  ExecutionContext ctx{.capability_id = id,
                       .inputs = request.inputs,
                       .preferences = request.preferences,
                       .request_id = request_id,
                       .timestamp = timestamp};
  auto exec = co_await retry_.execute_with_retry(executor, std::move(ctx));

  breakers_.record_result(id, exec.success);

  const auto latency = exec.metadata.execution_time_ms;
  if (collaborators_.health) {
    collaborators_.health->record(HealthEvent{.capability_id = id,
                                              .timestamp = Clock::now(),
                                              .success = exec.success,
                                              .latency_ms = latency,
                                              .error = exec.error});
  }
  if (collaborators_.metrics) {
    co_spawn(io_,
             record_metrics(collaborators_.metrics, id, exec.success, latency,
                            exec.metadata.cost_actual.value_or(0.0)),
             DiscardSink{"metrics"});
  }

  InvocationResult result;
  result.success = exec.success;
  result.request_id = std::move(request_id);
  result.capability_id = id;
  result.outputs = std::move(exec.outputs);
  result.error = exec.error;
  if (!exec.success) {
    result.error_code = failure_code(exec);
  }
  if (auto hints = build_economic_hints(*capability, exec); !hints.empty()) {
    result.metadata.economic_hints = std::move(hints);
  }
  result.metadata.execution = std::move(exec.metadata);
  result.metadata.privacy_level =
      capability->mode == ExecutionMode::Confidential ? 2 : 0;

  co_await emit_signal(result, timestamp);

  if (result.success) {
    cache_.put(key, result);
    learner_.remember_inputs(id, request.inputs);
  }
  co_return result;
}

auto Orchestrator::emit_signal(InvocationResult &result, std::int64_t timestamp)
    -> task<void> {
  if (!collaborators_.settlement) {
    co_return;
  }
  UsageSignalParams params{.capability_id = result.capability_id.str(),
                           .request_id = result.request_id.str(),
                           .timestamp = timestamp,
                           .success = result.success,
                           .cost = result.metadata.execution.cost_actual};
  try {
    auto signal = co_await collaborators_.settlement->emit(std::move(params));
    if (signal) {
      result.metadata.chain_signal = std::move(*signal);
    } else {
      log::warn("Usage signal for {} not emitted: {}", result.request_id,
                signal.error().message());
    }
  } catch (const std::exception &e) {
    log::warn("Usage signal for {} failed: {}", result.request_id, e.what());
  }
}

auto Orchestrator::batch_invoke(std::vector<InvocationRequest> requests)
    -> task<BatchResult> {
  const auto started = Clock::now();

  std::vector<std::shared_ptr<util::SharedResult<InvocationResult>>> slots;
  slots.reserve(requests.size());
  for (auto &request : requests) {
    auto slot =
        std::make_shared<util::SharedResult<InvocationResult>>(io_.get_executor());
    co_spawn(io_, run_batch_item(this, std::move(request), slot),
             DiscardSink{"batch item"});
    slots.push_back(std::move(slot));
  }

  BatchResult batch;
  batch.results.reserve(slots.size());
  std::int64_t sequential_ms = 0;
  for (auto &slot : slots) {
    auto r = co_await slot->get();
    sequential_ms += r.metadata.execution.execution_time_ms;
    batch.results.push_back(std::move(r));
  }

  batch.success = std::ranges::all_of(
      batch.results, [](const InvocationResult &r) { return r.success; });
  batch.total_time_ms = util::elapsed_ms(started, Clock::now());
  batch.parallelism_benefit_ms =
      std::max<std::int64_t>(0, sequential_ms - batch.total_time_ms);
  co_return batch;
}

auto Orchestrator::queued_invoke(InvocationRequest request, Priority priority)
    -> task<InvocationResult> {
  co_return co_await scheduler_.enqueue(std::move(request), priority);
}

auto Orchestrator::deduplicated_invoke(InvocationRequest request,
                                       std::chrono::milliseconds ttl)
    -> task<InvocationResult> {
  const auto hash = ContentDedupCache::content_hash(request);
  if (auto hit = dedup_.get(hash)) {
    co_return std::move(*hit);
  }
  auto result = co_await invoke(std::move(request));
  dedup_.put(hash, result, Clock::now(), ttl);
  co_return result;
}

auto Orchestrator::invoke_with_prefetch(const AgentId &caller,
                                        InvocationRequest request)
    -> task<InvocationResult> {
  const auto capability = request.capability_id;
  learner_.observe(caller, capability);

  auto result = co_await invoke(std::move(request));
  learner_.record_usage(capability, result.metadata.execution.execution_time_ms);

  if (result.success) {
    schedule_prefetch(capability);
  }
  co_return result;
}

auto Orchestrator::schedule_prefetch(const CapabilityId &capability) -> void {
  for (const auto &prediction : prefetcher_.plan(learner_, capability)) {
    log::debug("Prefetch candidate {} after {} (p={:.2f})",
               prediction.capability_id, capability, prediction.probability);
    if (!config_.prefetch.warm_cache) {
      continue;
    }
    const auto *inputs = learner_.remembered_inputs(prediction.capability_id);
    if (inputs == nullptr) {
      continue;
    }
    co_spawn(io_, warm(prediction.capability_id, *inputs),
             DiscardSink{"prefetch"});
  }
}

auto Orchestrator::warm(CapabilityId capability, Inputs inputs) -> spawn_task {
  auto result = co_await invoke(
      InvocationRequest{.capability_id = capability, .inputs = std::move(inputs)});
  if (!result.success) {
    log::debug("Prefetch of {} failed: {}", capability,
               result.error.value_or("unknown"));
  }
}

auto Orchestrator::isolated_invoke(std::string pool, int max_concurrent,
                                   InvocationRequest request)
    -> task<InvocationResult> {
  co_return co_await bulkheads_.run(std::move(pool), max_concurrent,
                                    invoke(std::move(request)));
}

auto Orchestrator::execute_with_policy(PolicyExecutionRequest request)
    -> task<PolicyExecutionResult> {
  co_return co_await policy_.execute_with_policy(std::move(request));
}

auto Orchestrator::recommendations(const CapabilityId &capability) const
    -> Recommendations {
  const auto *breaker = breakers_.state(capability);
  return learner_.recommendations(capability,
                                  breaker != nullptr ? breaker->failures : 0);
}

auto Orchestrator::predicted_next(const CapabilityId &capability,
                                  std::size_t n) const
    -> std::vector<Prediction> {
  return learner_.predicted_next(capability, n);
}

auto Orchestrator::update_health_score(const CapabilityId &capability,
                                       bool success, std::int64_t latency_ms)
    -> void {
  auto &score = scores_.emplace_or_get(capability, Clock::now());
  ++score.total;
  if (success) {
    ++score.successes;
  }
  const auto n = static_cast<double>(score.total);
  score.avg_latency_ms =
      (score.avg_latency_ms * (n - 1.0) + static_cast<double>(latency_ms)) / n;
}

auto Orchestrator::health_score(const CapabilityId &capability) const
    -> std::optional<HealthScore> {
  const auto *score = scores_.peek(capability);
  if (score == nullptr || score->total == 0) {
    return std::nullopt;
  }
  return HealthScore{
      .success_rate = static_cast<int>(
          std::lround(static_cast<double>(score->successes) /
                      static_cast<double>(score->total) * 100.0)),
      .avg_latency_ms = std::llround(score->avg_latency_ms),
      .total_calls = score->total,
  };
}

auto Orchestrator::reset_circuit_breaker(const CapabilityId &capability)
    -> bool {
  const bool found = breakers_.reset(capability);
  if (found) {
    log::info("Circuit breaker for {} reset", capability);
  }
  return found;
}

auto Orchestrator::cleanup_circuit_breakers() -> std::size_t {
  return breakers_.cleanup();
}

auto Orchestrator::perform_maintenance() -> std::size_t {
  const auto now = Clock::now();
  const auto cleaned = cache_.sweep(now) + dedup_.sweep(now) +
                       prefetcher_.sweep(now) + breakers_.cleanup(now);
  if (cleaned > 0) {
    log::debug("Maintenance removed {} entries", cleaned);
  }
  return cleaned;
}

auto Orchestrator::status() const -> JsonValue {
  const auto now = Clock::now();

  JsonValue breakers = JsonValue::object_t{};
  for (const auto &snap : breakers_.snapshot(now)) {
    JsonValue entry{{"state", std::string{to_string_view(snap.state)}},
                    {"failures", static_cast<std::int64_t>(snap.failures)},
                    {"recovery_percent",
                     static_cast<std::int64_t>(snap.recovery_percent)}};
    entry["ms_since_last_failure"] =
        snap.ms_since_last_failure ? JsonValue{*snap.ms_since_last_failure}
                                   : JsonValue{};
    breakers[snap.capability_id.str()] = std::move(entry);
  }

  const auto cache_stats = cache_.stats();
  const auto queue = scheduler_.stats(now);
  const auto learned = learner_.stats();

  JsonValue by_priority = JsonValue::object_t{};
  for (const auto p : util::enum_values<Priority>()) {
    by_priority[std::string{to_string_view(p)}] = static_cast<std::int64_t>(
        queue.by_priority[std::to_underlying(p)]);
  }

  return JsonValue{
      {"executors", strings_json(executors_.names())},
      {"circuit_breakers", std::move(breakers)},
      {"capabilities_registered",
       static_cast<std::int64_t>(registry_->capability_count())},
      {"cache",
       JsonValue{{"entries", static_cast<std::int64_t>(cache_stats.entries)},
                 {"hits", static_cast<std::int64_t>(cache_stats.hits)},
                 {"misses", static_cast<std::int64_t>(cache_stats.misses)},
                 {"hit_rate", cache_stats.hit_rate()},
                 {"adaptive_ttl", cache_.adaptive_json()},
                 {"dedup_entries", static_cast<std::int64_t>(dedup_.size())},
                 {"dedup_hits", static_cast<std::int64_t>(dedup_.hits())},
                 {"in_flight",
                  static_cast<std::int64_t>(coalescer_.in_flight())}}},
      {"queue",
       JsonValue{{"queued", static_cast<std::int64_t>(queue.queued)},
                 {"active", static_cast<std::int64_t>(queue.active)},
                 {"max_concurrency",
                  static_cast<std::int64_t>(queue.max_concurrency)},
                 {"dispatched", static_cast<std::int64_t>(queue.dispatched)},
                 {"by_priority", std::move(by_priority)}}},
      {"learner",
       JsonValue{{"sources", static_cast<std::int64_t>(learned.sources)},
                 {"edges", static_cast<std::int64_t>(learned.edges)},
                 {"callers", static_cast<std::int64_t>(learned.callers)},
                 {"usage_patterns",
                  static_cast<std::int64_t>(learned.usage_patterns)}}},
      {"bulkhead_pools", static_cast<std::int64_t>(bulkheads_.pool_count())},
  };
}

auto Orchestrator::health_check() const -> JsonValue {
  const auto dash = breakers_.dashboard();
  std::string_view overall = "healthy";
  if (dash.open > 0) {
    overall = "degraded";
  }
  if (executors_.size() == 0 || registry_->capability_count() == 0) {
    overall = "unhealthy";
  }
  return JsonValue{
      {"status", std::string{overall}},
      {"timestamp", util::format_timestamp()},
      {"executors", static_cast<std::int64_t>(executors_.size())},
      {"capabilities",
       static_cast<std::int64_t>(registry_->capability_count())},
      {"circuit_breakers",
       JsonValue{{"closed", static_cast<std::int64_t>(dash.closed)},
                 {"open", static_cast<std::int64_t>(dash.open)},
                 {"half_open", static_cast<std::int64_t>(dash.half_open)}}},
      {"queue_depth", static_cast<std::int64_t>(scheduler_.queued())},
  };
}

auto to_json(const BatchResult &batch) -> JsonValue {
  JsonValue results = std::vector<JsonValue>{};
  for (const auto &r : batch.results) {
    results.get_array().push_back(to_json(r));
  }
  return JsonValue{{"success", batch.success},
                   {"results", std::move(results)},
                   {"total_time_ms", batch.total_time_ms},
                   {"parallelism_benefit_ms", batch.parallelism_benefit_ms}};
}

auto to_json(const PolicyExecutionResult &result) -> JsonValue {
  JsonValue out{{"success", result.success},
                {"execution_time_ms", result.execution_time_ms},
                {"cost_actual", result.cost_actual},
                {"proof", to_json(result.proof)},
                {"proof_hash", result.proof.digest},
                {"warnings", strings_json(result.warnings)},
                {"fallback_available", result.fallback_available}};
  if (result.outputs) {
    out["outputs"] = *result.outputs;
  }
  if (result.error) {
    out["error"] = *result.error;
  }
  if (result.route_used) {
    out["route_used"] = to_json(*result.route_used);
  }
  if (result.request_id) {
    out["request_id"] = result.request_id->str();
  }
  return out;
}

} // namespace caprouter
