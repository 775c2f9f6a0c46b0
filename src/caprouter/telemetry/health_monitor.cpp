#include "caprouter/telemetry/health_monitor.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <functional>
#include <set>

namespace caprouter {

namespace {

constexpr double kSuccessRateWarning = 0.95;
constexpr double kSuccessRateCritical = 0.80;
constexpr std::int64_t kLatencyCriticalMs = 5000;
constexpr std::size_t kProviderWindow = 10;

auto percentile(const std::vector<std::int64_t> &sorted, int p)
    -> std::int64_t {
  if (sorted.empty()) {
    return 0;
  }
  const auto rank = static_cast<std::int64_t>(
      std::ceil(static_cast<double>(p) / 100.0 *
                static_cast<double>(sorted.size()))) -
                    1;
  return sorted[static_cast<std::size_t>(std::max<std::int64_t>(0, rank))];
}

auto round_tenth(double v) -> double { return std::round(v * 10.0) / 10.0; }

} // namespace

CapabilityHealthMonitor::CapabilityHealthMonitor(std::size_t max_events)
    : max_events_(std::max<std::size_t>(max_events, 1)) {}

auto CapabilityHealthMonitor::record(HealthEvent event) -> void {
  events_.push_back(std::move(event));
  while (events_.size() > max_events_) {
    events_.pop_front();
  }
}

auto CapabilityHealthMonitor::report(const CapabilityId &id,
                                     TimePoint now) const -> HealthReport {
  using namespace std::chrono_literals;
  HealthReport r{.capability_id = id};

  std::size_t total = 0;
  std::size_t ok_1h = 0;
  std::size_t ok_24h = 0;
  std::vector<std::int64_t> latencies;
  std::vector<bool> recent_1h;

  for (const auto &e : events_) {
    if (e.capability_id != id) {
      continue;
    }
    ++total;
    const auto age = now - e.timestamp;
    if (age < 1h) {
      ++r.invocations_1h;
      ok_1h += e.success ? 1 : 0;
      recent_1h.push_back(e.success);
    }
    if (age < 24h) {
      ++r.invocations_24h;
      ok_24h += e.success ? 1 : 0;
      latencies.push_back(e.latency_ms);
    }
    if (e.success) {
      r.last_success = e.timestamp;
    } else {
      r.last_failure = e.timestamp;
      ++r.error_types[e.error.value_or("unknown")];
    }
  }

  if (total == 0) {
    r.recommendation = "No data available yet";
    return r;
  }

  const double rate_1h =
      r.invocations_1h > 0 ? static_cast<double>(ok_1h) /
                                 static_cast<double>(r.invocations_1h)
                           : 0.0;
  const double rate_24h =
      r.invocations_24h > 0 ? static_cast<double>(ok_24h) /
                                  static_cast<double>(r.invocations_24h)
                            : 0.0;

  std::ranges::sort(latencies);
  r.latency_p50_ms = percentile(latencies, 50);
  r.latency_p95_ms = percentile(latencies, 95);
  r.latency_p99_ms = percentile(latencies, 99);
  r.success_rate_1h = round_tenth(rate_1h * 100.0);
  r.success_rate_24h = round_tenth(rate_24h * 100.0);

  r.status = HealthStatus::Healthy;
  r.recommendation = "Capability is operating normally";
  if (rate_1h < kSuccessRateCritical) {
    r.status = HealthStatus::Unhealthy;
    r.recommendation =
        "High failure rate detected. Consider using alternative capability.";
  } else if (rate_1h < kSuccessRateWarning) {
    r.status = HealthStatus::Degraded;
    r.recommendation = "Elevated failure rate. Monitor closely.";
  } else if (r.latency_p95_ms > kLatencyCriticalMs) {
    r.status = HealthStatus::Degraded;
    r.recommendation = "High latency detected. Expect slower responses.";
  }

  const auto window = std::min(recent_1h.size(), kProviderWindow);
  const auto recent_failures = static_cast<std::size_t>(std::count(
      recent_1h.end() - static_cast<std::ptrdiff_t>(window), recent_1h.end(),
      false));
  if (recent_failures >= 8) {
    r.provider_status = ProviderStatus::Down;
  } else if (recent_failures >= 3) {
    r.provider_status = ProviderStatus::Degraded;
  }
  return r;
}

auto CapabilityHealthMonitor::reports(TimePoint now) const
    -> std::vector<HealthReport> {
  std::set<CapabilityId> ids;
  for (const auto &e : events_) {
    ids.insert(e.capability_id);
  }
  std::vector<HealthReport> out;
  out.reserve(ids.size());
  for (const auto &id : ids) {
    out.push_back(report(id, now));
  }
  return out;
}

auto CapabilityHealthMonitor::system_health(TimePoint now) const
    -> SystemHealth {
  SystemHealth h;
  const auto all = reports(now);
  double rate_sum = 0.0;
  std::int64_t latency_sum = 0;
  std::map<std::string, std::size_t> errors;

  for (const auto &r : all) {
    switch (r.status) {
    case HealthStatus::Healthy:
      ++h.healthy;
      break;
    case HealthStatus::Degraded:
      ++h.degraded;
      break;
    case HealthStatus::Unhealthy:
      ++h.unhealthy;
      break;
    case HealthStatus::Unknown:
      break;
    }
    h.invocations_1h += r.invocations_1h;
    rate_sum += r.success_rate_1h;
    latency_sum += r.latency_p50_ms;
    for (const auto &[err, count] : r.error_types) {
      errors[err] += count;
    }
  }

  if (!all.empty()) {
    const auto n = static_cast<double>(all.size());
    h.avg_success_rate_1h = round_tenth(rate_sum / n);
    h.avg_latency_ms = static_cast<std::int64_t>(
        std::llround(static_cast<double>(latency_sum) / n));
  }

  h.top_errors.assign(errors.begin(), errors.end());
  std::ranges::stable_sort(h.top_errors, std::greater<>{},
                           &std::pair<std::string, std::size_t>::second);
  if (h.top_errors.size() > 5) {
    h.top_errors.resize(5);
  }

  if (h.unhealthy > 0) {
    h.overall = HealthStatus::Unhealthy;
  } else if (h.degraded > 0) {
    h.overall = HealthStatus::Degraded;
  }
  return h;
}

auto CapabilityHealthMonitor::is_safe_to_use(const CapabilityId &id,
                                             TimePoint now) const
    -> SafetyVerdict {
  const auto r = report(id, now);
  switch (r.status) {
  case HealthStatus::Unknown:
    return {true, "No health data available - proceed with caution"};
  case HealthStatus::Unhealthy:
    return {false, "Capability is unhealthy: " + r.recommendation};
  default:
    break;
  }
  if (r.provider_status == ProviderStatus::Down) {
    return {false, "Provider appears to be down"};
  }
  if (r.status == HealthStatus::Degraded) {
    return {true, "Capability is degraded: " + r.recommendation};
  }
  return {true, "Capability is healthy"};
}

auto to_json(const HealthReport &report) -> JsonValue {
  JsonValue errors = JsonValue::object_t{};
  for (const auto &[err, count] : report.error_types) {
    errors[err] = static_cast<std::int64_t>(count);
  }
  return JsonValue{
      {"capability_id", report.capability_id.str()},
      {"status", std::string(to_string_view(report.status))},
      {"success_rate_1h", report.success_rate_1h},
      {"success_rate_24h", report.success_rate_24h},
      {"latency_p50_ms", report.latency_p50_ms},
      {"latency_p95_ms", report.latency_p95_ms},
      {"latency_p99_ms", report.latency_p99_ms},
      {"invocations_1h", static_cast<std::int64_t>(report.invocations_1h)},
      {"invocations_24h", static_cast<std::int64_t>(report.invocations_24h)},
      {"error_types", std::move(errors)},
      {"provider_status", std::string(to_string_view(report.provider_status))},
      {"recommendation", report.recommendation},
  };
}

auto to_json(const SystemHealth &health) -> JsonValue {
  JsonValue top = std::vector<JsonValue>{};
  for (const auto &[err, count] : health.top_errors) {
    top.get_array().emplace_back(JsonValue{
        {"error", err}, {"count", static_cast<std::int64_t>(count)}});
  }
  return JsonValue{
      {"overall_status", std::string(to_string_view(health.overall))},
      {"healthy_capabilities", static_cast<std::int64_t>(health.healthy)},
      {"degraded_capabilities", static_cast<std::int64_t>(health.degraded)},
      {"unhealthy_capabilities", static_cast<std::int64_t>(health.unhealthy)},
      {"total_invocations_1h", static_cast<std::int64_t>(health.invocations_1h)},
      {"avg_success_rate_1h", health.avg_success_rate_1h},
      {"avg_latency_ms", health.avg_latency_ms},
      {"top_errors", std::move(top)},
  };
}

} // namespace caprouter
