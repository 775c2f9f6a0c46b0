#include "caprouter/telemetry/usage_signal.hpp"

#include "caprouter/util/id.hpp"
#include "caprouter/util/log.hpp"

#include <algorithm>

namespace caprouter {

auto UsageSignalStats::top(std::size_t n) const
    -> std::vector<std::pair<std::string, std::uint64_t>> {
  std::vector<std::pair<std::string, std::uint64_t>> out(by_capability.begin(),
                                                         by_capability.end());
  std::ranges::stable_sort(out, [](const auto &a, const auto &b) {
    return a.second > b.second;
  });
  if (out.size() > n) {
    out.resize(n);
  }
  return out;
}

auto UsageSignalEmitter::emit(UsageSignalParams params)
    -> task<Result<UsageSignal>> {
  if (params.capability_id.empty() || params.request_id.empty()) {
    co_return fail(Error::InvalidArgument);
  }

  UsageSignal signal;
  signal.signal_id = generate_prefixed_id("signal");
  signal.commitment_hash = usage_commitment(params);
  signal.capability_id = params.capability_id;
  signal.request_id = params.request_id;
  signal.timestamp = params.timestamp;
  signal.success = params.success;
  signal.cost = params.cost;

  ++stats_.total;
  if (params.success) {
    ++stats_.successful;
  } else {
    ++stats_.failed;
  }
  stats_.total_cost += params.cost.value_or(0.0);
  ++stats_.by_capability[params.capability_id];

  log::debug("Usage commitment {} for {} on {}: {}", signal.signal_id,
             signal.capability_id, signal.network,
             signal.commitment_hash.substr(0, 16));
  co_return signal;
}

} // namespace caprouter
