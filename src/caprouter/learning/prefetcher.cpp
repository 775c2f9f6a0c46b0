#include "caprouter/learning/prefetcher.hpp"

#include "caprouter/core/constants.hpp"

#include <algorithm>

namespace caprouter {

Prefetcher::Prefetcher(PrefetchConfig config)
    : config_(config), pending_(config.max_sources) {}

auto Prefetcher::plan(const DependencyLearner &learner,
                      const CapabilityId &capability, TimePoint now)
    -> std::vector<Prediction> {
  std::vector<Prediction> planned;
  if (!config_.enabled) {
    return planned;
  }
  for (auto &p : learner.predicted_next(capability, prefetch::kPredictions)) {
    if (p.probability <= config_.probability_threshold) {
      continue;
    }
    if (mark(p.capability_id, p.avg_gap, now)) {
      planned.push_back(std::move(p));
    }
  }
  return planned;
}

auto Prefetcher::mark(const CapabilityId &capability, Clock::duration hold,
                      TimePoint now) -> bool {
  if (pending_.get(capability, now) != nullptr) {
    return false;
  }
  // A zero gap still holds the slot until the next tick.
  hold = std::max<Clock::duration>(hold, std::chrono::milliseconds(1));
  pending_.put(capability, now, now, hold);
  return true;
}

auto Prefetcher::is_pending(const CapabilityId &capability, TimePoint now)
    -> bool {
  return pending_.get(capability, now) != nullptr;
}

auto Prefetcher::pending(TimePoint now) -> std::vector<CapabilityId> {
  pending_.sweep(now);
  std::vector<CapabilityId> out;
  out.reserve(pending_.size());
  pending_.for_each(
      [&](const CapabilityId &id, const TimePoint &) { out.push_back(id); });
  return out;
}

auto Prefetcher::sweep(TimePoint now) -> std::size_t {
  return pending_.sweep(now);
}

} // namespace caprouter
