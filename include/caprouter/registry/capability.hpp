#pragma once

#include "caprouter/util/enum.hpp"
#include "caprouter/util/id.hpp"

#include <boost/describe/enum.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace caprouter {

enum class ExecutionMode : std::uint8_t { Public, Confidential };
BOOST_DESCRIBE_ENUM(ExecutionMode, Public, Confidential)
CAPROUTER_DEFINE_ENUM_SERDE(ExecutionMode, ExecutionMode::Public)

enum class LatencyHint : std::uint8_t { Low, Medium, High };
BOOST_DESCRIBE_ENUM(LatencyHint, Low, Medium, High)
CAPROUTER_DEFINE_ENUM_SERDE(LatencyHint, LatencyHint::Medium)

struct PaymentSignalTerms {
  bool enabled{false};
  bool settlement_optional{true};
  std::vector<std::string> payment_methods{"SOL", "USDC", "credits"};
};

struct CapabilityEconomics {
  double cost_hint{0.0};
  std::string currency{"SOL"};
  std::optional<PaymentSignalTerms> x402;
  bool privacy_cash_compatible{false};
};

// Registry record for one capability. Only the fields the dispatch core reads
// are modelled; schemas beyond the required-input list stay with the registry.
struct Capability {
  CapabilityId id;
  std::string name;
  std::string description;
  std::string version{"1.0.0"};
  std::vector<std::string> required_inputs;
  ExecutionMode mode{ExecutionMode::Public};
  CapabilityEconomics economics;
  LatencyHint latency_hint{LatencyHint::Medium};
  double reliability_hint{0.99};
  std::vector<std::string> tags;
};

} // namespace caprouter
