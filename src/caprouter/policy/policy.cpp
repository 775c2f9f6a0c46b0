#include "caprouter/policy/policy.hpp"

#include <algorithm>
#include <cmath>
#include <format>

namespace caprouter {

namespace {

auto contains(const std::vector<std::string> &list, std::string_view value)
    -> bool {
  return std::ranges::find(list, value) != list.end();
}

auto string_array(const std::vector<std::string> &items) -> JsonValue {
  JsonValue arr = std::vector<JsonValue>{};
  for (const auto &s : items) {
    arr.get_array().emplace_back(s);
  }
  return arr;
}

} // namespace

auto check_policy(const AgentPolicy &policy, const ProposedParameters &proposed,
                  const PolicyConfig &config) -> PolicyValidation {
  PolicyValidation out;

  if (policy.privacy && proposed.privacy && *proposed.privacy < *policy.privacy) {
    out.violations.push_back(std::format("Privacy level {} below required {}",
                                         to_string_view(*proposed.privacy),
                                         to_string_view(*policy.privacy)));
  }

  if (policy.max_cost && proposed.estimated_cost) {
    const double cost = *proposed.estimated_cost;
    const double ceiling = *policy.max_cost;
    if (cost > ceiling) {
      out.violations.push_back(
          std::format("Estimated cost {} exceeds budget {}", cost, ceiling));
    } else if (cost > ceiling * config.cost_warning_ratio) {
      out.warnings.push_back(
          std::format("Cost approaching budget limit ({}%)",
                      std::llround(cost / ceiling * 100.0)));
    }
  }

  if (policy.max_slippage && proposed.slippage &&
      *proposed.slippage > *policy.max_slippage) {
    out.violations.push_back(std::format("Slippage {}% exceeds max {}%",
                                         *proposed.slippage,
                                         *policy.max_slippage));
  }

  if (proposed.counterparty) {
    const auto &cp = *proposed.counterparty;
    if (contains(policy.blocked_counterparties, cp)) {
      out.violations.push_back(std::format("Counterparty {} is blocked", cp));
    }
    if (!policy.trusted_counterparties.empty() &&
        !contains(policy.trusted_counterparties, cp)) {
      out.warnings.push_back(
          std::format("Counterparty {} not in trusted list", cp));
    }
  }

  if (policy.max_latency_ms && proposed.estimated_latency_ms &&
      *proposed.estimated_latency_ms > *policy.max_latency_ms) {
    out.warnings.push_back(
        std::format("Estimated latency {}ms exceeds preference {}ms",
                    *proposed.estimated_latency_ms, *policy.max_latency_ms));
  }

  out.valid = out.violations.empty();
  return out;
}

auto route_complies(const Route &route, const RouteConstraints &c) -> bool {
  if (c.privacy && route.privacy < *c.privacy) {
    return false;
  }
  if (c.max_cost && route.estimated_cost > *c.max_cost) {
    return false;
  }
  if (c.max_latency_ms && route.estimated_latency_ms > *c.max_latency_ms) {
    return false;
  }
  if (contains(c.excluded_routes, route.id)) {
    return false;
  }
  if (!c.preferred_routes.empty() && !contains(c.preferred_routes, route.id)) {
    return false;
  }
  return true;
}

auto relax(RouteConstraints constraints, const PolicyConfig &config)
    -> RouteConstraints {
  if (constraints.max_cost) {
    *constraints.max_cost *= config.fallback_cost_factor;
  }
  if (constraints.max_latency_ms) {
    constraints.max_latency_ms = std::llround(
        static_cast<double>(*constraints.max_latency_ms) *
        config.fallback_latency_factor);
  }
  return constraints;
}

auto to_json(const PolicyValidation &validation) -> JsonValue {
  return JsonValue{{"valid", validation.valid},
                   {"violations", string_array(validation.violations)},
                   {"warnings", string_array(validation.warnings)}};
}

auto to_json(const Route &route) -> JsonValue {
  return JsonValue{
      {"id", route.id},
      {"capability_id", route.capability_id.str()},
      {"plugins", string_array(route.plugins)},
      {"privacy_level", std::string{to_string_view(route.privacy)}},
      {"estimated_cost", route.estimated_cost},
      {"estimated_latency_ms", route.estimated_latency_ms},
      {"params", JsonValue{route.params}},
  };
}

} // namespace caprouter
