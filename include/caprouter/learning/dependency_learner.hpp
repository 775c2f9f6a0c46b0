#pragma once

#include "caprouter/config/system_config.hpp"
#include "caprouter/util/bounded_cache.hpp"
#include "caprouter/util/id.hpp"
#include "caprouter/util/json.hpp"
#include "caprouter/util/time.hpp"

#include <ankerl/unordered_dense.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace caprouter {

struct DependencyEdge {
  std::uint64_t weight{0};
  double avg_gap_ms{0.0};
};

struct Prediction {
  CapabilityId capability_id;
  double probability{0.0}; // weight / sum of outgoing weights
  std::chrono::milliseconds avg_gap{0};
};

struct UsagePattern {
  std::uint64_t count{0};
  TimePoint last_used{};
  double avg_latency_ms{0.0};
};

struct Recommendations {
  struct Next {
    CapabilityId capability_id;
    int confidence{0}; // percent
  };
  struct Popular {
    CapabilityId capability_id;
    std::uint64_t usage_count{0};
  };
  std::vector<Next> next_capabilities;
  std::vector<Popular> popular_capabilities;
  std::vector<std::string> performance_tips;
};

struct LearnerStats {
  std::size_t sources{0};
  std::size_t edges{0};
  std::size_t callers{0};
  std::size_t usage_patterns{0};
};

// Learns which capability a caller tends to invoke next. An edge a->b is
// strengthened when the same caller invokes b within `max_gap` of a (a != b).
// Edges only grow; memory is bounded by evicting whole source entries.
class DependencyLearner {
public:
  explicit DependencyLearner(PrefetchConfig config = {});

  auto observe(const AgentId &caller, const CapabilityId &capability,
               TimePoint now = Clock::now()) -> void;

  [[nodiscard]] auto predicted_next(const CapabilityId &capability,
                                    std::size_t n) const
      -> std::vector<Prediction>;

  [[nodiscard]] auto edge(const CapabilityId &from,
                          const CapabilityId &to) const
      -> std::optional<DependencyEdge>;

  auto record_usage(const CapabilityId &capability, std::int64_t latency_ms,
                    TimePoint now = Clock::now()) -> void;
  [[nodiscard]] auto usage(const CapabilityId &capability) const
      -> const UsagePattern *;

  /// `breaker_failures` is the capability's current breaker failure count.
  [[nodiscard]] auto recommendations(const CapabilityId &capability,
                                     int breaker_failures) const
      -> Recommendations;

  /// Last inputs that succeeded for a capability; used to warm the cache.
  auto remember_inputs(const CapabilityId &capability, const Inputs &inputs,
                       TimePoint now = Clock::now()) -> void;
  [[nodiscard]] auto remembered_inputs(const CapabilityId &capability) const
      -> const Inputs *;

  [[nodiscard]] auto stats() const -> LearnerStats;

private:
  struct LastCall {
    CapabilityId capability;
    TimePoint at{};
  };
  using Successors = ankerl::unordered_dense::map<CapabilityId, DependencyEdge>;

  PrefetchConfig config_;
  util::BoundedCache<AgentId, LastCall> last_call_;
  util::BoundedCache<CapabilityId, Successors> graph_;
  util::BoundedCache<CapabilityId, UsagePattern> usage_;
  util::BoundedCache<CapabilityId, Inputs> inputs_;
};

[[nodiscard]] auto to_json(const Recommendations &recs) -> JsonValue;

} // namespace caprouter
