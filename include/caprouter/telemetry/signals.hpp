#pragma once

#include "caprouter/util/json.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace caprouter {

struct X402Hint {
  std::string version{"0.1.0"};
  std::string payment_type{"x402"};
  std::string ephemeral_payer;
  double suggested_amount{0.0};
  std::string currency;
  bool settlement_optional{true};
  std::vector<std::string> payment_methods;
  std::string hint_id;
  std::int64_t timestamp{0};
};

struct PrivacyCashNote {
  std::string version{"0.1.0"};
  std::string payment_type{"privacy-cash"};
  std::string note_reference;
  std::string amount_commitment;
  std::string currency;
  std::string nullifier_hint;
  std::string note_id;
  std::int64_t timestamp{0};
  std::string custody{"non-custodial"};
};

struct EconomicHints {
  std::optional<X402Hint> x402;
  std::optional<PrivacyCashNote> privacy_cash;

  [[nodiscard]] auto empty() const noexcept -> bool {
    return !x402 && !privacy_cash;
  }
};

[[nodiscard]] auto make_x402_hint(double amount, std::string currency,
                                  bool settlement_optional) -> X402Hint;
[[nodiscard]] auto verify_x402_hint(const X402Hint &hint) -> bool;

[[nodiscard]] auto make_privacy_cash_note(double amount, std::string currency)
    -> PrivacyCashNote;
[[nodiscard]] auto verify_privacy_cash_note(const PrivacyCashNote &note)
    -> bool;

struct UsageSignalParams {
  std::string capability_id;
  std::string request_id;
  std::int64_t timestamp{0};
  bool success{false};
  std::optional<double> cost;
};

struct UsageSignal {
  std::string signal_id;
  std::string capability_id;
  std::string request_id;
  std::int64_t timestamp{0};
  bool success{false};
  std::optional<double> cost;
  std::string commitment_hash;
  std::string network{"solana-devnet"};
  std::string version{"0.1.0"};
  std::string signal_type{"usage-commitment"};
  bool verifiable{true};
  bool settlement_ready{false};
};

/// SHA-256 over the canonical JSON of the params.
[[nodiscard]] auto usage_commitment(const UsageSignalParams &params)
    -> std::string;
[[nodiscard]] auto verify_usage_signal(const UsageSignal &signal,
                                       const UsageSignalParams &params)
    -> bool;

[[nodiscard]] auto to_json(const X402Hint &hint) -> JsonValue;
[[nodiscard]] auto to_json(const PrivacyCashNote &note) -> JsonValue;
[[nodiscard]] auto to_json(const EconomicHints &hints) -> JsonValue;
[[nodiscard]] auto to_json(const UsageSignal &signal) -> JsonValue;

} // namespace caprouter
