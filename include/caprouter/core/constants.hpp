#pragma once

#include <chrono>
#include <cstddef>

namespace caprouter {

namespace breaker {
constexpr int kFailureThreshold = 5;
constexpr auto kCooldown = std::chrono::milliseconds(30000);
constexpr auto kStaleAfter = kCooldown * 2;
} // namespace breaker

namespace retry {
constexpr int kMaxAttempts = 3;
constexpr auto kBaseDelay = std::chrono::milliseconds(1000);
constexpr double kJitterRatio = 0.3;
constexpr auto kAttemptTimeout = std::chrono::milliseconds(30000);
} // namespace retry

namespace cache {
constexpr std::size_t kCapacity = 1000;
constexpr auto kInitialTtl = std::chrono::milliseconds(5000);
constexpr auto kMinTtl = std::chrono::milliseconds(1000);
constexpr auto kMaxTtl = std::chrono::milliseconds(60000);
constexpr double kGrowFactor = 1.2;
constexpr double kShrinkFactor = 0.8;
constexpr double kGrowHitRatio = 0.8;
constexpr double kShrinkMissRatio = 0.5;
constexpr int kMinSamples = 10;
constexpr auto kDedupTtl = std::chrono::milliseconds(5000);
constexpr std::size_t kDedupCapacity = 500;
constexpr double kEvictFraction = 0.2;
} // namespace cache

namespace scheduling {
constexpr int kMaxConcurrency = 10;
constexpr auto kEscalateLow = std::chrono::milliseconds(5000);
constexpr auto kEscalateNormal = std::chrono::milliseconds(10000);
constexpr auto kEscalateHigh = std::chrono::milliseconds(15000);
} // namespace scheduling

namespace prefetch {
constexpr auto kMaxGap = std::chrono::milliseconds(30000);
constexpr double kProbabilityThreshold = 0.3;
constexpr std::size_t kPredictions = 2;
constexpr std::size_t kMaxSources = 1000;
} // namespace prefetch

namespace policy {
constexpr double kFallbackCostFactor = 1.5;
constexpr double kFallbackLatencyFactor = 2.0;
constexpr double kCostWarningRatio = 0.8;
} // namespace policy

namespace limits {
constexpr std::size_t kHealthScores = 200;
constexpr std::size_t kUsagePatterns = 100;
constexpr std::size_t kHealthEvents = 10000;
constexpr std::size_t kRememberedInputs = 500;
} // namespace limits

} // namespace caprouter
