#include "caprouter/resilience/circuit_breaker.hpp"

#include "caprouter/util/log.hpp"

#include <algorithm>
#include <format>

namespace caprouter {

namespace {

auto cooldown_of(const BreakerConfig &cfg) -> std::chrono::milliseconds {
  return std::chrono::milliseconds(cfg.cooldown_ms);
}

} // namespace

CircuitBreakerBank::CircuitBreakerBank(BreakerConfig config)
    : config_(config) {}

auto CircuitBreakerBank::check_allowed(const CapabilityId &id, TimePoint now)
    -> BreakerDecision {
  auto it = breakers_.find(id);
  if (it == breakers_.end() || it->second.state != BreakerState::Open) {
    return {};
  }

  auto &breaker = it->second;
  const auto cooldown = cooldown_of(config_);
  const auto elapsed =
      breaker.last_failure
          ? std::chrono::duration_cast<std::chrono::milliseconds>(
                now - *breaker.last_failure)
          : cooldown + std::chrono::milliseconds(1);

  if (elapsed > cooldown) {
    breaker.state = BreakerState::HalfOpen;
    log::info("Circuit breaker for {} half-open after {}ms", id,
              elapsed.count());
    return {};
  }

  const auto remaining = cooldown - elapsed;
  const auto retry_secs = (remaining.count() + 999) / 1000;
  return BreakerDecision{
      .allowed = false,
      .reason = std::format(
          "Circuit breaker open for {}. Too many failures. Retry after {}s",
          id, retry_secs),
      .retry_after = remaining,
  };
}

auto CircuitBreakerBank::record_result(const CapabilityId &id, bool success,
                                       TimePoint now) -> void {
  auto &breaker = breakers_[id];
  if (success) {
    if (breaker.state != BreakerState::Closed) {
      log::info("Circuit breaker for {} closed", id);
    }
    breaker.failures = 0;
    breaker.state = BreakerState::Closed;
    return;
  }

  ++breaker.failures;
  breaker.last_failure = now;
  if (breaker.state == BreakerState::HalfOpen ||
      (breaker.state == BreakerState::Closed &&
       breaker.failures >= config_.failure_threshold)) {
    breaker.state = BreakerState::Open;
    log::warn("Circuit breaker for {} opened after {} failures", id,
              breaker.failures);
  }
}

auto CircuitBreakerBank::reset(const CapabilityId &id) -> bool {
  auto it = breakers_.find(id);
  if (it == breakers_.end()) {
    return false;
  }
  it->second = CircuitBreakerState{};
  log::info("Circuit breaker for {} manually reset", id);
  return true;
}

auto CircuitBreakerBank::cleanup(TimePoint now) -> std::size_t {
  const auto stale_after = std::chrono::milliseconds(config_.stale_after_ms);
  std::vector<CapabilityId> victims;
  for (const auto &[id, breaker] : breakers_) {
    const bool clean =
        breaker.state == BreakerState::Closed && breaker.failures == 0;
    const bool stale =
        breaker.last_failure && now - *breaker.last_failure > stale_after;
    if (clean || stale) {
      victims.push_back(id);
    }
  }
  for (const auto &id : victims) {
    breakers_.erase(id);
  }
  if (!victims.empty()) {
    log::debug("Circuit breaker cleanup removed {} entries", victims.size());
  }
  return victims.size();
}

auto CircuitBreakerBank::state(const CapabilityId &id) const
    -> const CircuitBreakerState * {
  auto it = breakers_.find(id);
  return it == breakers_.end() ? nullptr : &it->second;
}

auto CircuitBreakerBank::snapshot(TimePoint now) const
    -> std::vector<BreakerSnapshot> {
  const auto cooldown = cooldown_of(config_);
  std::vector<BreakerSnapshot> out;
  out.reserve(breakers_.size());
  for (const auto &[id, breaker] : breakers_) {
    BreakerSnapshot snap{.capability_id = id,
                         .state = breaker.state,
                         .failures = breaker.failures};
    if (breaker.last_failure) {
      snap.ms_since_last_failure = util::elapsed_ms(*breaker.last_failure, now);
    }
    switch (breaker.state) {
    case BreakerState::Open: {
      const auto elapsed = snap.ms_since_last_failure.value_or(0);
      snap.recovery_percent = static_cast<int>(std::clamp<std::int64_t>(
          elapsed * 100 / std::max<std::int64_t>(cooldown.count(), 1), 0,
          100));
      break;
    }
    case BreakerState::HalfOpen:
      snap.recovery_percent = 50;
      break;
    case BreakerState::Closed:
      snap.recovery_percent = 100;
      break;
    }
    out.push_back(std::move(snap));
  }
  return out;
}

auto CircuitBreakerBank::dashboard() const -> BreakerDashboard {
  BreakerDashboard d;
  for (const auto &[_, breaker] : breakers_) {
    switch (breaker.state) {
    case BreakerState::Closed:
      ++d.closed;
      break;
    case BreakerState::Open:
      ++d.open;
      break;
    case BreakerState::HalfOpen:
      ++d.half_open;
      break;
    }
  }
  return d;
}

} // namespace caprouter
