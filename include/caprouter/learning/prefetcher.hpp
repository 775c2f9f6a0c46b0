#pragma once

#include "caprouter/config/system_config.hpp"
#include "caprouter/learning/dependency_learner.hpp"
#include "caprouter/util/bounded_cache.hpp"
#include "caprouter/util/id.hpp"
#include "caprouter/util/time.hpp"

#include <vector>

namespace caprouter {

// Tracks speculative follow-up calls so the same prediction is not warmed
// twice while an earlier one is still pending.
class Prefetcher {
public:
  explicit Prefetcher(PrefetchConfig config = {});

  /// Predictions above the probability threshold that were not already
  /// pending; each returned capability is marked pending for its avg_gap.
  [[nodiscard]] auto plan(const DependencyLearner &learner,
                          const CapabilityId &capability,
                          TimePoint now = Clock::now())
      -> std::vector<Prediction>;

  /// False when an unexpired entry already exists.
  auto mark(const CapabilityId &capability, Clock::duration hold,
            TimePoint now = Clock::now()) -> bool;
  [[nodiscard]] auto is_pending(const CapabilityId &capability,
                                TimePoint now = Clock::now()) -> bool;
  [[nodiscard]] auto pending(TimePoint now = Clock::now())
      -> std::vector<CapabilityId>;
  auto sweep(TimePoint now = Clock::now()) -> std::size_t;

  [[nodiscard]] auto config() const noexcept -> const PrefetchConfig & {
    return config_;
  }

private:
  PrefetchConfig config_;
  util::BoundedCache<CapabilityId, TimePoint> pending_;
};

} // namespace caprouter
