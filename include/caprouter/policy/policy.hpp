#pragma once

#include "caprouter/config/system_config.hpp"
#include "caprouter/util/enum.hpp"
#include "caprouter/util/json.hpp"

#include <boost/describe/enum.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace caprouter {

enum class PrivacyTier : std::uint8_t { None, Low, Medium, High };
BOOST_DESCRIBE_ENUM(PrivacyTier, None, Low, Medium, High)
CAPROUTER_DEFINE_ENUM_SERDE(PrivacyTier, PrivacyTier::None)

// Bounds a route must satisfy. Shared by registered agent policies and the
// per-request policy of a policy-checked execution.
struct RouteConstraints {
  std::optional<PrivacyTier> privacy;
  std::optional<double> max_cost;
  std::optional<double> max_slippage;
  std::optional<std::int64_t> max_latency_ms;
  std::vector<std::string> preferred_routes;
  std::vector<std::string> excluded_routes;
};

struct AgentPolicy : RouteConstraints {
  std::vector<std::string> trusted_counterparties;
  std::vector<std::string> blocked_counterparties;
};

struct ProposedParameters {
  std::optional<PrivacyTier> privacy;
  std::optional<double> estimated_cost;
  std::optional<double> slippage;
  std::optional<std::string> counterparty;
  std::optional<std::int64_t> estimated_latency_ms;
};

struct PolicyValidation {
  bool valid{true};
  std::vector<std::string> violations;
  std::vector<std::string> warnings;
};

struct Route {
  std::string id;
  CapabilityId capability_id;
  std::vector<std::string> plugins;
  PrivacyTier privacy{PrivacyTier::None};
  double estimated_cost{0.0};
  std::int64_t estimated_latency_ms{0};
  Inputs params;
};

/// Every violated constraint is reported; none short-circuits the others.
[[nodiscard]] auto check_policy(const AgentPolicy &policy,
                                const ProposedParameters &proposed,
                                const PolicyConfig &config = {})
    -> PolicyValidation;

[[nodiscard]] auto route_complies(const Route &route,
                                  const RouteConstraints &constraints) -> bool;

/// Cost and latency ceilings scaled by the fallback factors.
[[nodiscard]] auto relax(RouteConstraints constraints,
                         const PolicyConfig &config) -> RouteConstraints;

[[nodiscard]] auto to_json(const PolicyValidation &validation) -> JsonValue;
[[nodiscard]] auto to_json(const Route &route) -> JsonValue;

} // namespace caprouter
