#include "caprouter/policy/policy_router.hpp"

#include "caprouter/util/log.hpp"
#include "caprouter/util/time.hpp"

#include <algorithm>
#include <format>

namespace caprouter {

namespace {

auto seed_catalog() -> std::vector<std::pair<std::string, Route>> {
  return {
      {"swap",
       Route{.id = "jupiter",
             .capability_id = CapabilityId{"cap.swap.execute.v1"},
             .plugins = {"dex"},
             .privacy = PrivacyTier::None,
             .estimated_cost = 0.001,
             .estimated_latency_ms = 500}},
      {"swap",
       Route{.id = "private-swap",
             .capability_id = CapabilityId{"cap.arcium.mpc.v1"},
             .plugins = {"privacy", "dex"},
             .privacy = PrivacyTier::High,
             .estimated_cost = 0.005,
             .estimated_latency_ms = 2000}},
      {"price",
       Route{.id = "public-price",
             .capability_id = CapabilityId{"cap.price.lookup.v1"},
             .plugins = {"oracle"},
             .privacy = PrivacyTier::None,
             .estimated_cost = 0.0001,
             .estimated_latency_ms = 200}},
  };
}

auto join(const std::vector<std::string> &items, std::string_view sep)
    -> std::string {
  std::string out;
  for (const auto &item : items) {
    if (!out.empty()) {
      out += sep;
    }
    out += item;
  }
  return out;
}

} // namespace

PolicyRouter::PolicyRouter(Invoker invoker, PolicyConfig config)
    : invoker_(std::move(invoker)), config_(config) {
  for (auto &[type, route] : seed_catalog()) {
    register_route(type, std::move(route));
  }
}

auto PolicyRouter::register_policy(const AgentId &agent, AgentPolicy policy)
    -> void {
  policies_.insert_or_assign(agent, std::move(policy));
}

auto PolicyRouter::policy(const AgentId &agent) const -> const AgentPolicy * {
  auto it = policies_.find(agent);
  return it == policies_.end() ? nullptr : &it->second;
}

auto PolicyRouter::validate(const AgentId &agent,
                            const ProposedParameters &proposed) const
    -> PolicyValidation {
  const auto *p = policy(agent);
  if (p == nullptr) {
    return {};
  }
  return check_policy(*p, proposed, config_);
}

auto PolicyRouter::register_route(const std::string &capability_type,
                                  Route route) -> void {
  auto &routes = catalog_[capability_type];
  auto it = std::ranges::find(routes, route.id, &Route::id);
  if (it != routes.end()) {
    *it = std::move(route);
  } else {
    routes.push_back(std::move(route));
  }
}

auto PolicyRouter::routes(std::string_view capability_type) const
    -> std::vector<Route> {
  auto it = catalog_.find(capability_type);
  return it == catalog_.end() ? std::vector<Route>{} : it->second;
}

auto PolicyRouter::select_route(std::string_view capability_type,
                                const RouteConstraints &constraints) const
    -> std::optional<Route> {
  auto it = catalog_.find(capability_type);
  if (it == catalog_.end()) {
    return std::nullopt;
  }
  const Route *best = nullptr;
  for (const auto &route : it->second) {
    if (!route_complies(route, constraints)) {
      continue;
    }
    if (best == nullptr || route.estimated_cost < best->estimated_cost) {
      best = &route;
    }
  }
  if (best == nullptr) {
    return std::nullopt;
  }
  return *best;
}

auto PolicyRouter::execute_with_policy(PolicyExecutionRequest request)
    -> task<PolicyExecutionResult> {
  const auto started = Clock::now();
  std::vector<ProofStep> steps;

  // The request's own bounds are what the caller commits to, so those are
  // checked against the registered policy.
  auto validation = validate(request.agent_id,
                             ProposedParameters{
                                 .privacy = request.policy.privacy,
                                 .estimated_cost = request.policy.max_cost,
                                 .slippage = request.policy.max_slippage,
                                 .counterparty = request.counterparty,
                             });
  steps.push_back({"policy_validation", validation.valid, to_json(validation)});

  if (!validation.valid) {
    log::warn("Policy rejected for agent {}: {}", request.agent_id,
              join(validation.violations, ", "));
    PolicyExecutionResult out;
    out.error = std::format("Policy violations: {}",
                            join(validation.violations, ", "));
    out.error_code = make_error_code(Error::PolicyViolation);
    out.proof = make_compliance_proof(std::move(steps));
    out.warnings = std::move(validation.warnings);
    out.fallback_available = true;
    co_return out;
  }

  auto route = select_route(request.capability_type, request.policy);
  steps.push_back({"route_selection", route.has_value(),
                   route ? to_json(*route) : JsonValue{}});
  if (route) {
    co_return co_await execute_route(std::move(*route), request,
                                     std::move(steps), started);
  }

  if (request.fallbacks) {
    if (auto fallback = select_route(request.capability_type,
                                     relax(request.policy, config_))) {
      log::info("Using relaxed route {} for agent {}", fallback->id,
                request.agent_id);
      steps.push_back({"fallback_route", true, to_json(*fallback)});
      co_return co_await execute_route(std::move(*fallback), request,
                                       std::move(steps), started);
    }
  }

  PolicyExecutionResult out;
  out.error = "No compliant route found";
  out.error_code = make_error_code(Error::NoCompliantRoute);
  out.proof = make_compliance_proof(std::move(steps));
  out.warnings = std::move(validation.warnings);
  co_return out;
}

auto PolicyRouter::execute_route(Route route,
                                 const PolicyExecutionRequest &request,
                                 std::vector<ProofStep> steps,
                                 TimePoint started)
    -> task<PolicyExecutionResult> {
  InvocationRequest invocation{.capability_id = route.capability_id,
                               .inputs = request.inputs};
  for (const auto &[key, value] : route.params) {
    invocation.inputs.insert_or_assign(key, value);
  }

  auto result = co_await invoker_(std::move(invocation));
  steps.push_back({"execution", result.success,
                   JsonValue{{"request_id", result.request_id.str()}}});

  PolicyExecutionResult out;
  out.success = result.success;
  out.outputs = std::move(result.outputs);
  out.error = std::move(result.error);
  out.error_code = result.error_code;
  out.request_id = std::move(result.request_id);
  out.execution_time_ms = util::elapsed_ms(started, Clock::now());
  out.cost_actual = result.metadata.execution.cost_actual.value_or(0.0);
  out.route_used = std::move(route);
  out.proof = make_compliance_proof(std::move(steps));
  co_return out;
}

} // namespace caprouter
