#include "caprouter/router/invocation.hpp"

namespace caprouter {

auto to_json(const ExecutionMetadata &meta) -> JsonValue {
  JsonValue out{{"executor", meta.executor},
                {"execution_time_ms", meta.execution_time_ms}};
  if (meta.cost_actual) {
    out["cost_actual"] = *meta.cost_actual;
  }
  if (meta.currency) {
    out["currency"] = *meta.currency;
  }
  if (meta.provider_used) {
    out["provider_used"] = *meta.provider_used;
  }
  if (meta.privacy_level) {
    out["privacy_level"] = static_cast<std::int64_t>(*meta.privacy_level);
  }
  if (meta.note) {
    out["note"] = *meta.note;
  }
  if (meta.attempts > 0) {
    out["attempts"] = static_cast<std::int64_t>(meta.attempts);
  }
  return out;
}

auto to_json(const InvocationResult &result) -> JsonValue {
  const auto &m = result.metadata;
  JsonValue meta{{"execution", to_json(m.execution)},
                 {"chain_signal", nullptr}};
  if (m.economic_hints && !m.economic_hints->empty()) {
    meta["economic_hints"] = to_json(*m.economic_hints);
  }
  if (m.chain_signal) {
    meta["chain_signal"] = to_json(*m.chain_signal);
  }
  if (m.privacy_level) {
    meta["privacy_level"] = static_cast<std::int64_t>(*m.privacy_level);
  }
  if (m.cached) {
    meta["cached"] = true;
  }
  if (m.coalesced) {
    meta["coalesced"] = true;
  }
  if (m.deduplicated) {
    meta["deduplicated"] = true;
  }
  if (m.circuit_open) {
    meta["circuit_breaker"] = "open";
  }
  if (m.retry_after_ms) {
    meta["retry_after_ms"] = *m.retry_after_ms;
  }

  JsonValue out{{"success", result.success},
                {"request_id", result.request_id.str()},
                {"capability_id", result.capability_id.str()},
                {"metadata", std::move(meta)}};
  if (result.outputs) {
    out["outputs"] = *result.outputs;
  }
  if (result.error) {
    out["error"] = *result.error;
  }
  return out;
}

} // namespace caprouter
