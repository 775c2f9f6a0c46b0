#pragma once

#include "caprouter/config/system_config.hpp"
#include "caprouter/util/enum.hpp"
#include "caprouter/util/id.hpp"
#include "caprouter/util/time.hpp"

#include <ankerl/unordered_dense.h>
#include <boost/describe/enum.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace caprouter {

enum class BreakerState : std::uint8_t { Closed, Open, HalfOpen };
BOOST_DESCRIBE_ENUM(BreakerState, Closed, Open, HalfOpen)
CAPROUTER_DEFINE_ENUM_SERDE(BreakerState, BreakerState::Closed)

struct CircuitBreakerState {
  int failures{0};
  std::optional<TimePoint> last_failure;
  BreakerState state{BreakerState::Closed};
};

struct BreakerDecision {
  bool allowed{true};
  std::string reason;
  std::chrono::milliseconds retry_after{0};
};

struct BreakerSnapshot {
  CapabilityId capability_id;
  BreakerState state{BreakerState::Closed};
  int failures{0};
  std::optional<std::int64_t> ms_since_last_failure;
  int recovery_percent{100};
};

struct BreakerDashboard {
  std::size_t closed{0};
  std::size_t open{0};
  std::size_t half_open{0};
};

// One breaker per capability, created on its first recorded outcome.
//   closed    -> open       after `failure_threshold` consecutive failures
//   open      -> half_open  lazily, at the first check after `cooldown`
//   half_open -> closed     on the next success
//   half_open -> open       on the next failure (cooldown restarts)
// Checks on a half-open breaker are admitted; the first outcome decides.
class CircuitBreakerBank {
public:
  explicit CircuitBreakerBank(BreakerConfig config = {});

  [[nodiscard]] auto check_allowed(const CapabilityId &id,
                                   TimePoint now = Clock::now())
      -> BreakerDecision;

  auto record_result(const CapabilityId &id, bool success,
                     TimePoint now = Clock::now()) -> void;

  /// Returns false when no breaker exists for `id`.
  auto reset(const CapabilityId &id) -> bool;

  /// Drops closed breakers with no failures and breakers whose last failure
  /// is older than `stale_after`.
  auto cleanup(TimePoint now = Clock::now()) -> std::size_t;

  [[nodiscard]] auto state(const CapabilityId &id) const
      -> const CircuitBreakerState *;

  [[nodiscard]] auto snapshot(TimePoint now = Clock::now()) const
      -> std::vector<BreakerSnapshot>;

  [[nodiscard]] auto dashboard() const -> BreakerDashboard;

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return breakers_.size();
  }

  [[nodiscard]] auto config() const noexcept -> const BreakerConfig & {
    return config_;
  }

private:
  BreakerConfig config_;
  ankerl::unordered_dense::map<CapabilityId, CircuitBreakerState> breakers_;
};

} // namespace caprouter
