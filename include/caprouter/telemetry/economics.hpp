#pragma once

#include "caprouter/executor/executor.hpp"
#include "caprouter/registry/capability.hpp"
#include "caprouter/telemetry/signals.hpp"

namespace caprouter {

/// x402 hint when the capability enables payment signals; privacy-cash note
/// when it is compatible and runs confidentially. Amounts prefer the actual
/// cost over the capability's hint.
[[nodiscard]] auto build_economic_hints(const Capability &capability,
                                        const ExecutionResult &result)
    -> EconomicHints;

} // namespace caprouter
