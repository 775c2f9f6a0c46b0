#include "caprouter/telemetry/metrics.hpp"

namespace caprouter {

namespace {

auto bump(InvocationCounters &c, bool success, std::int64_t latency_ms,
          double cost) -> void {
  ++c.calls;
  c.successes += success ? 1 : 0;
  c.total_latency_ms += latency_ms;
  c.total_cost += cost;
}

auto counters_json(const InvocationCounters &c) -> JsonValue {
  const auto avg =
      c.calls > 0 ? c.total_latency_ms / static_cast<std::int64_t>(c.calls) : 0;
  return JsonValue{{"calls", static_cast<std::int64_t>(c.calls)},
                   {"successes", static_cast<std::int64_t>(c.successes)},
                   {"avg_latency_ms", avg},
                   {"total_cost", c.total_cost}};
}

} // namespace

auto InMemoryMetrics::record_invocation(const CapabilityId &id, bool success,
                                        std::int64_t latency_ms, double cost)
    -> void {
  bump(per_capability_[id], success, latency_ms, cost);
  bump(totals_, success, latency_ms, cost);
}

auto InMemoryMetrics::counters(const CapabilityId &id) const
    -> InvocationCounters {
  auto it = per_capability_.find(id);
  return it == per_capability_.end() ? InvocationCounters{} : it->second;
}

auto InMemoryMetrics::to_json() const -> JsonValue {
  JsonValue by_cap = JsonValue::object_t{};
  for (const auto &[id, c] : per_capability_) {
    by_cap[id.str()] = counters_json(c);
  }
  return JsonValue{{"totals", counters_json(totals_)},
                   {"capabilities", std::move(by_cap)}};
}

} // namespace caprouter
