#pragma once

#include "caprouter/core/coroutine.hpp"
#include "caprouter/registry/capability.hpp"
#include "caprouter/util/id.hpp"
#include "caprouter/util/json.hpp"

#include <ankerl/unordered_dense.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace caprouter {

struct ExecutionPreferences {
  std::optional<double> max_cost;
  bool privacy_required{false};
  bool latency_priority{false};
  std::vector<std::string> preferred_providers;
  std::optional<int> privacy_level;
  std::optional<ExecutionMode> execution_mode;
};

struct ExecutionContext {
  CapabilityId capability_id;
  Inputs inputs;
  std::optional<ExecutionPreferences> preferences;
  RequestId request_id;
  std::int64_t timestamp{0}; // unix ms
};

struct ExecutionMetadata {
  std::string executor;
  std::int64_t execution_time_ms{0};
  std::optional<double> cost_actual;
  std::optional<std::string> currency;
  std::optional<std::string> provider_used;
  std::optional<int> privacy_level;
  std::optional<std::string> note;
  int attempts{0};
};

struct ExecutionResult {
  bool success{false};
  std::optional<JsonValue> outputs;
  std::optional<std::string> error;
  ExecutionMetadata metadata;

  [[nodiscard]] static auto failure(std::string executor, std::string error)
      -> ExecutionResult {
    ExecutionResult r;
    r.error = std::move(error);
    r.metadata.executor = std::move(executor);
    return r;
  }
};

class IExecutor {
public:
  virtual ~IExecutor() = default;

  [[nodiscard]] virtual auto name() const -> std::string_view = 0;

  [[nodiscard]] virtual auto can_execute(const CapabilityId &id) const
      -> bool = 0;

  /// 0 = public ... 3 = fully private.
  [[nodiscard]] virtual auto privacy_level() const -> int { return 0; }

  /// Failures are reported in the result, never thrown.
  virtual auto execute(ExecutionContext ctx) -> task<ExecutionResult> = 0;
};

// Executors in priority order; the first whose predicate accepts a capability
// wins. Resolutions are memoised until the set changes.
class ExecutorSet {
public:
  auto add(std::shared_ptr<IExecutor> executor) -> void;

  [[nodiscard]] auto select(const CapabilityId &id) const
      -> std::shared_ptr<IExecutor>;

  [[nodiscard]] auto names() const -> std::vector<std::string>;
  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return executors_.size();
  }

private:
  std::vector<std::shared_ptr<IExecutor>> executors_;
  // Index into executors_, or npos when nothing matched.
  mutable ankerl::unordered_dense::map<CapabilityId, std::size_t> resolved_;
};

} // namespace caprouter
