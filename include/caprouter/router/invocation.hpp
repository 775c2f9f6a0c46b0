#pragma once

#include "caprouter/executor/executor.hpp"
#include "caprouter/telemetry/signals.hpp"
#include "caprouter/util/id.hpp"
#include "caprouter/util/json.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <system_error>

namespace caprouter {

struct InvocationRequest {
  CapabilityId capability_id;
  Inputs inputs;
  std::optional<ExecutionPreferences> preferences;
};

struct InvocationMetadata {
  ExecutionMetadata execution;
  std::optional<EconomicHints> economic_hints;
  std::optional<UsageSignal> chain_signal;
  std::optional<int> privacy_level;
  bool cached{false};
  bool coalesced{false};
  bool deduplicated{false};
  bool circuit_open{false};
  std::optional<std::int64_t> retry_after_ms;
};

struct InvocationResult {
  bool success{false};
  RequestId request_id;
  CapabilityId capability_id;
  std::optional<JsonValue> outputs;
  std::optional<std::string> error;
  std::error_code error_code;
  InvocationMetadata metadata;

  /// Failure result carrying both the error kind and the caller-facing text.
  [[nodiscard]] static auto failure(RequestId request_id,
                                    CapabilityId capability_id,
                                    std::error_code ec, std::string message)
      -> InvocationResult {
    InvocationResult r;
    r.request_id = std::move(request_id);
    r.capability_id = std::move(capability_id);
    r.error_code = ec;
    r.error = std::move(message);
    return r;
  }
};

[[nodiscard]] auto to_json(const ExecutionMetadata &meta) -> JsonValue;
[[nodiscard]] auto to_json(const InvocationResult &result) -> JsonValue;

} // namespace caprouter
