#include "caprouter/learning/dependency_learner.hpp"

#include "caprouter/core/constants.hpp"

#include <algorithm>
#include <cmath>
#include <format>

namespace caprouter {

namespace {
constexpr double kSlowLatencyMs = 500.0;
constexpr std::uint64_t kBatchHintCalls = 10;
constexpr std::size_t kNextShown = 3;
constexpr std::size_t kPopularShown = 5;
} // namespace

DependencyLearner::DependencyLearner(PrefetchConfig config)
    : config_(config), last_call_(config.max_sources),
      graph_(config.max_sources),
      usage_(limits::kUsagePatterns, util::EvictionPolicy::LeastRecentlyUsed),
      inputs_(limits::kRememberedInputs,
              util::EvictionPolicy::LeastRecentlyUsed) {}

auto DependencyLearner::observe(const AgentId &caller,
                                const CapabilityId &capability, TimePoint now)
    -> void {
  if (const auto *last = last_call_.peek(caller);
      last != nullptr && last->capability != capability) {
    const auto gap = std::chrono::duration_cast<std::chrono::milliseconds>(
        now - last->at);
    if (gap < std::chrono::milliseconds(config_.max_gap_ms)) {
      const auto from = last->capability;
      auto &edge = graph_.emplace_or_get(from, now)[capability];
      const auto w = static_cast<double>(edge.weight);
      edge.avg_gap_ms =
          (edge.avg_gap_ms * w + static_cast<double>(gap.count())) / (w + 1.0);
      ++edge.weight;
    }
  }
  last_call_.put(caller, LastCall{capability, now}, now);
}

auto DependencyLearner::predicted_next(const CapabilityId &capability,
                                       std::size_t n) const
    -> std::vector<Prediction> {
  const auto *successors = graph_.peek(capability);
  if (successors == nullptr || successors->empty() || n == 0) {
    return {};
  }

  std::uint64_t total = 0;
  for (const auto &[_, edge] : *successors) {
    total += edge.weight;
  }
  if (total == 0) {
    return {};
  }

  std::vector<Prediction> out;
  out.reserve(successors->size());
  for (const auto &[id, edge] : *successors) {
    out.push_back(Prediction{
        .capability_id = id,
        .probability =
            static_cast<double>(edge.weight) / static_cast<double>(total),
        .avg_gap = std::chrono::milliseconds(std::llround(edge.avg_gap_ms)),
    });
  }
  std::ranges::stable_sort(out, std::greater<>{}, &Prediction::probability);
  if (out.size() > n) {
    out.resize(n);
  }
  return out;
}

auto DependencyLearner::edge(const CapabilityId &from,
                             const CapabilityId &to) const
    -> std::optional<DependencyEdge> {
  const auto *successors = graph_.peek(from);
  if (successors == nullptr) {
    return std::nullopt;
  }
  auto it = successors->find(to);
  if (it == successors->end()) {
    return std::nullopt;
  }
  return it->second;
}

auto DependencyLearner::record_usage(const CapabilityId &capability,
                                     std::int64_t latency_ms, TimePoint now)
    -> void {
  auto &pattern = usage_.emplace_or_get(capability, now);
  const auto n = static_cast<double>(pattern.count);
  pattern.avg_latency_ms =
      (pattern.avg_latency_ms * n + static_cast<double>(latency_ms)) /
      (n + 1.0);
  ++pattern.count;
  pattern.last_used = now;
}

auto DependencyLearner::usage(const CapabilityId &capability) const
    -> const UsagePattern * {
  return usage_.peek(capability);
}

auto DependencyLearner::recommendations(const CapabilityId &capability,
                                        int breaker_failures) const
    -> Recommendations {
  Recommendations recs;

  for (const auto &p : predicted_next(capability, kNextShown)) {
    recs.next_capabilities.push_back(
        {p.capability_id, static_cast<int>(std::lround(p.probability * 100.0))});
  }

  usage_.for_each([&](const CapabilityId &id, const UsagePattern &pattern) {
    recs.popular_capabilities.push_back({id, pattern.count});
  });
  std::ranges::stable_sort(recs.popular_capabilities, std::greater<>{},
                           &Recommendations::Popular::usage_count);
  if (recs.popular_capabilities.size() > kPopularShown) {
    recs.popular_capabilities.resize(kPopularShown);
  }

  const auto *pattern = usage_.peek(capability);
  if (pattern != nullptr && pattern->avg_latency_ms > kSlowLatencyMs) {
    recs.performance_tips.push_back(
        std::format("Consider caching results - avg latency is {}ms",
                    std::llround(pattern->avg_latency_ms)));
  }
  if (breaker_failures > 0) {
    recs.performance_tips.push_back(
        std::format("This capability has {} recent failures - consider error "
                    "handling",
                    breaker_failures));
  }
  if (pattern != nullptr && pattern->count > kBatchHintCalls) {
    recs.performance_tips.emplace_back(
        "High usage detected - consider using batch endpoint for better "
        "performance");
  }
  return recs;
}

auto DependencyLearner::remember_inputs(const CapabilityId &capability,
                                        const Inputs &inputs, TimePoint now)
    -> void {
  inputs_.put(capability, inputs, now);
}

auto DependencyLearner::remembered_inputs(const CapabilityId &capability) const
    -> const Inputs * {
  return inputs_.peek(capability);
}

auto DependencyLearner::stats() const -> LearnerStats {
  LearnerStats s{.sources = graph_.size(),
                 .callers = last_call_.size(),
                 .usage_patterns = usage_.size()};
  graph_.for_each([&](const CapabilityId &, const Successors &successors) {
    s.edges += successors.size();
  });
  return s;
}

auto to_json(const Recommendations &recs) -> JsonValue {
  JsonValue next = std::vector<JsonValue>{};
  for (const auto &n : recs.next_capabilities) {
    next.get_array().emplace_back(
        JsonValue{{"id", n.capability_id.str()},
                  {"confidence", static_cast<std::int64_t>(n.confidence)}});
  }
  JsonValue popular = std::vector<JsonValue>{};
  for (const auto &p : recs.popular_capabilities) {
    popular.get_array().emplace_back(
        JsonValue{{"id", p.capability_id.str()},
                  {"usage_count", static_cast<std::int64_t>(p.usage_count)}});
  }
  JsonValue tips = std::vector<JsonValue>{};
  for (const auto &t : recs.performance_tips) {
    tips.get_array().emplace_back(t);
  }
  return JsonValue{{"next_capabilities", std::move(next)},
                   {"popular_capabilities", std::move(popular)},
                   {"performance_tips", std::move(tips)}};
}

} // namespace caprouter
