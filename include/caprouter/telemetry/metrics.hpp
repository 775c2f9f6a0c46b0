#pragma once

#include "caprouter/util/id.hpp"
#include "caprouter/util/json.hpp"

#include <ankerl/unordered_dense.h>

#include <cstdint>

namespace caprouter {

class IMetricsCollector {
public:
  virtual ~IMetricsCollector() = default;
  virtual auto record_invocation(const CapabilityId &id, bool success,
                                 std::int64_t latency_ms, double cost)
      -> void = 0;
};

struct InvocationCounters {
  std::uint64_t calls{0};
  std::uint64_t successes{0};
  std::int64_t total_latency_ms{0};
  double total_cost{0.0};
};

class InMemoryMetrics final : public IMetricsCollector {
public:
  auto record_invocation(const CapabilityId &id, bool success,
                         std::int64_t latency_ms, double cost)
      -> void override;

  [[nodiscard]] auto counters(const CapabilityId &id) const
      -> InvocationCounters;
  [[nodiscard]] auto totals() const noexcept -> const InvocationCounters & {
    return totals_;
  }
  [[nodiscard]] auto to_json() const -> JsonValue;

private:
  ankerl::unordered_dense::map<CapabilityId, InvocationCounters> per_capability_;
  InvocationCounters totals_;
};

} // namespace caprouter
