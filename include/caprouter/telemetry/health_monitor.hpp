#pragma once

#include "caprouter/core/constants.hpp"
#include "caprouter/util/enum.hpp"
#include "caprouter/util/id.hpp"
#include "caprouter/util/json.hpp"
#include "caprouter/util/time.hpp"

#include <boost/describe/enum.hpp>

#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace caprouter {

struct HealthEvent {
  CapabilityId capability_id;
  TimePoint timestamp;
  bool success{false};
  std::int64_t latency_ms{0};
  std::optional<std::string> error;
};

class IHealthMonitor {
public:
  virtual ~IHealthMonitor() = default;
  virtual auto record(HealthEvent event) -> void = 0;
};

enum class HealthStatus : std::uint8_t { Healthy, Degraded, Unhealthy, Unknown };
BOOST_DESCRIBE_ENUM(HealthStatus, Healthy, Degraded, Unhealthy, Unknown)
CAPROUTER_DEFINE_ENUM_SERDE(HealthStatus, HealthStatus::Unknown)

enum class ProviderStatus : std::uint8_t { Up, Degraded, Down };
BOOST_DESCRIBE_ENUM(ProviderStatus, Up, Degraded, Down)
CAPROUTER_DEFINE_ENUM_SERDE(ProviderStatus, ProviderStatus::Up)

struct HealthReport {
  CapabilityId capability_id;
  HealthStatus status{HealthStatus::Unknown};
  double success_rate_1h{0.0};  // percent
  double success_rate_24h{0.0}; // percent
  std::int64_t latency_p50_ms{0};
  std::int64_t latency_p95_ms{0};
  std::int64_t latency_p99_ms{0};
  std::size_t invocations_1h{0};
  std::size_t invocations_24h{0};
  std::optional<TimePoint> last_success;
  std::optional<TimePoint> last_failure;
  std::map<std::string, std::size_t> error_types;
  ProviderStatus provider_status{ProviderStatus::Up};
  std::string recommendation;
};

struct SystemHealth {
  HealthStatus overall{HealthStatus::Healthy};
  std::size_t healthy{0};
  std::size_t degraded{0};
  std::size_t unhealthy{0};
  std::size_t invocations_1h{0};
  double avg_success_rate_1h{0.0};
  std::int64_t avg_latency_ms{0};
  std::vector<std::pair<std::string, std::size_t>> top_errors;
};

struct SafetyVerdict {
  bool safe{true};
  std::string reason;
};

// Keeps the most recent events and derives per-capability health on demand.
class CapabilityHealthMonitor final : public IHealthMonitor {
public:
  explicit CapabilityHealthMonitor(
      std::size_t max_events = limits::kHealthEvents);

  auto record(HealthEvent event) -> void override;

  [[nodiscard]] auto report(const CapabilityId &id,
                            TimePoint now = Clock::now()) const
      -> HealthReport;
  [[nodiscard]] auto reports(TimePoint now = Clock::now()) const
      -> std::vector<HealthReport>;
  [[nodiscard]] auto system_health(TimePoint now = Clock::now()) const
      -> SystemHealth;
  [[nodiscard]] auto is_safe_to_use(const CapabilityId &id,
                                    TimePoint now = Clock::now()) const
      -> SafetyVerdict;

  [[nodiscard]] auto event_count() const noexcept -> std::size_t {
    return events_.size();
  }

private:
  std::size_t max_events_;
  std::deque<HealthEvent> events_;
};

[[nodiscard]] auto to_json(const HealthReport &report) -> JsonValue;
[[nodiscard]] auto to_json(const SystemHealth &health) -> JsonValue;

} // namespace caprouter
