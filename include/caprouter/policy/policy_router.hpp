#pragma once

#include "caprouter/config/system_config.hpp"
#include "caprouter/core/coroutine.hpp"
#include "caprouter/policy/compliance_proof.hpp"
#include "caprouter/policy/policy.hpp"
#include "caprouter/router/invocation.hpp"
#include "caprouter/util/id.hpp"
#include "caprouter/util/string_hash.hpp"
#include "caprouter/util/time.hpp"

#include <ankerl/unordered_dense.h>

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace caprouter {

struct PolicyExecutionRequest {
  AgentId agent_id;
  std::string capability_type; // route catalog key, e.g. "swap"
  Inputs inputs;
  RouteConstraints policy;
  std::optional<std::string> counterparty;
  bool fallbacks{false};
};

struct PolicyExecutionResult {
  bool success{false};
  std::optional<JsonValue> outputs;
  std::optional<std::string> error;
  std::error_code error_code;
  std::optional<Route> route_used;
  std::optional<RequestId> request_id;
  std::int64_t execution_time_ms{0};
  double cost_actual{0.0};
  ComplianceProof proof;
  std::vector<std::string> warnings;
  bool fallback_available{false};
};

// Picks the cheapest catalog route that satisfies a caller's policy, runs it
// through the dispatch path and records every decision in a compliance proof.
class PolicyRouter {
public:
  using Invoker = std::function<task<InvocationResult>(InvocationRequest)>;

  PolicyRouter(Invoker invoker, PolicyConfig config = {});

  auto register_policy(const AgentId &agent, AgentPolicy policy) -> void;
  [[nodiscard]] auto policy(const AgentId &agent) const -> const AgentPolicy *;

  /// Valid with no findings when the agent has no registered policy.
  [[nodiscard]] auto validate(const AgentId &agent,
                              const ProposedParameters &proposed) const
      -> PolicyValidation;

  auto register_route(const std::string &capability_type, Route route) -> void;
  [[nodiscard]] auto routes(std::string_view capability_type) const
      -> std::vector<Route>;

  [[nodiscard]] auto select_route(std::string_view capability_type,
                                  const RouteConstraints &constraints) const
      -> std::optional<Route>;

  auto execute_with_policy(PolicyExecutionRequest request)
      -> task<PolicyExecutionResult>;

private:
  auto execute_route(Route route, const PolicyExecutionRequest &request,
                     std::vector<ProofStep> steps, TimePoint started)
      -> task<PolicyExecutionResult>;

  Invoker invoker_;
  PolicyConfig config_;
  ankerl::unordered_dense::map<AgentId, AgentPolicy> policies_;
  ankerl::unordered_dense::map<std::string, std::vector<Route>,
                               StringHash, StringEqual>
      catalog_;
};

} // namespace caprouter
