#pragma once

#include "caprouter/core/coroutine.hpp"
#include "caprouter/core/error.hpp"
#include "caprouter/telemetry/signals.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace caprouter {

class ISettlementEmitter {
public:
  virtual ~ISettlementEmitter() = default;
  /// Awaited by the orchestrator; an error leaves the result's signal empty.
  virtual auto emit(UsageSignalParams params) -> task<Result<UsageSignal>> = 0;
};

struct UsageSignalStats {
  std::uint64_t total{0};
  std::uint64_t successful{0};
  std::uint64_t failed{0};
  double total_cost{0.0};
  std::map<std::string, std::uint64_t> by_capability;

  /// Top `n` capabilities by signal count.
  [[nodiscard]] auto top(std::size_t n) const
      -> std::vector<std::pair<std::string, std::uint64_t>>;
};

// Builds usage commitments locally and logs them; no chain I/O.
class UsageSignalEmitter final : public ISettlementEmitter {
public:
  auto emit(UsageSignalParams params) -> task<Result<UsageSignal>> override;

  [[nodiscard]] auto stats() const noexcept -> const UsageSignalStats & {
    return stats_;
  }

private:
  UsageSignalStats stats_;
};

} // namespace caprouter
