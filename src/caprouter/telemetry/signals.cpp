#include "caprouter/telemetry/signals.hpp"

#include "caprouter/util/digest.hpp"
#include "caprouter/util/time.hpp"

#include <format>

namespace caprouter {

auto make_x402_hint(double amount, std::string currency,
                    bool settlement_optional) -> X402Hint {
  X402Hint hint;
  hint.ephemeral_payer =
      std::format("ephemeral_{}", util::random_hex(32).substr(0, 44));
  hint.suggested_amount = amount;
  hint.currency = std::move(currency);
  hint.settlement_optional = settlement_optional;
  hint.payment_methods = {"SOL", "USDC", "credits"};
  hint.hint_id = std::format("hint_{}", util::random_hex(8));
  hint.timestamp = util::now_unix_millis();
  return hint;
}

auto verify_x402_hint(const X402Hint &hint) -> bool {
  return hint.version == "0.1.0" && hint.payment_type == "x402" &&
         hint.ephemeral_payer.starts_with("ephemeral_") &&
         hint.suggested_amount >= 0.0;
}

auto make_privacy_cash_note(double amount, std::string currency)
    -> PrivacyCashNote {
  PrivacyCashNote note;
  note.note_id = util::random_hex(16);
  note.amount_commitment =
      util::sha256_hex(std::format("{}{}", amount, util::random_hex(32)));
  note.timestamp = util::now_unix_millis();
  note.nullifier_hint = util::sha256_hex(
      std::format("nullifier_{}_{}", note.note_id, note.timestamp));
  note.note_reference = std::format("privacy_note_{}", note.note_id);
  note.currency = std::move(currency);
  return note;
}

auto verify_privacy_cash_note(const PrivacyCashNote &note) -> bool {
  return note.version == "0.1.0" && note.payment_type == "privacy-cash" &&
         note.custody == "non-custodial" &&
         note.note_reference.starts_with("privacy_note_");
}

auto usage_commitment(const UsageSignalParams &params) -> std::string {
  JsonValue data{{"capability_id", params.capability_id},
                 {"request_id", params.request_id},
                 {"timestamp", params.timestamp},
                 {"success", params.success}};
  if (params.cost) {
    data["cost"] = *params.cost;
  }
  return util::sha256_hex(dump_json(data));
}

auto verify_usage_signal(const UsageSignal &signal,
                         const UsageSignalParams &params) -> bool {
  return usage_commitment(params) == signal.commitment_hash;
}

auto to_json(const X402Hint &hint) -> JsonValue {
  JsonValue methods = std::vector<JsonValue>{};
  for (const auto &m : hint.payment_methods) {
    methods.get_array().emplace_back(m);
  }
  return JsonValue{{"version", hint.version},
                   {"payment_type", hint.payment_type},
                   {"ephemeral_payer", hint.ephemeral_payer},
                   {"suggested_amount", hint.suggested_amount},
                   {"currency", hint.currency},
                   {"settlement_optional", hint.settlement_optional},
                   {"payment_methods", std::move(methods)},
                   {"hint_id", hint.hint_id},
                   {"timestamp", hint.timestamp}};
}

auto to_json(const PrivacyCashNote &note) -> JsonValue {
  return JsonValue{{"version", note.version},
                   {"payment_type", note.payment_type},
                   {"note_reference", note.note_reference},
                   {"amount_commitment", note.amount_commitment},
                   {"currency", note.currency},
                   {"nullifier_hint", note.nullifier_hint},
                   {"note_id", note.note_id},
                   {"timestamp", note.timestamp},
                   {"custody", note.custody}};
}

auto to_json(const EconomicHints &hints) -> JsonValue {
  JsonValue out = JsonValue::object_t{};
  if (hints.x402) {
    out["x402"] = to_json(*hints.x402);
  }
  if (hints.privacy_cash) {
    out["privacy_cash"] = to_json(*hints.privacy_cash);
  }
  return out;
}

auto to_json(const UsageSignal &signal) -> JsonValue {
  JsonValue out{{"signal_id", signal.signal_id},
                {"capability_id", signal.capability_id},
                {"request_id", signal.request_id},
                {"timestamp", signal.timestamp},
                {"success", signal.success},
                {"commitment_hash", signal.commitment_hash},
                {"network", signal.network},
                {"version", signal.version},
                {"metadata",
                 JsonValue{{"signal_type", signal.signal_type},
                           {"verifiable", signal.verifiable},
                           {"settlement_ready", signal.settlement_ready}}}};
  if (signal.cost) {
    out["cost"] = *signal.cost;
  }
  return out;
}

} // namespace caprouter
