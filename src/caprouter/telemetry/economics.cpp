#include "caprouter/telemetry/economics.hpp"

namespace caprouter {

auto build_economic_hints(const Capability &capability,
                          const ExecutionResult &result) -> EconomicHints {
  const auto &econ = capability.economics;
  // A zero actual cost falls back to the hint as well.
  const double amount = result.metadata.cost_actual.value_or(0.0) != 0.0
                            ? *result.metadata.cost_actual
                            : econ.cost_hint;

  EconomicHints hints;
  if (econ.x402 && econ.x402->enabled) {
    hints.x402 =
        make_x402_hint(amount, econ.currency, econ.x402->settlement_optional);
  }
  if (econ.privacy_cash_compatible &&
      capability.mode == ExecutionMode::Confidential) {
    hints.privacy_cash = make_privacy_cash_note(amount, econ.currency);
  }
  return hints;
}

} // namespace caprouter
