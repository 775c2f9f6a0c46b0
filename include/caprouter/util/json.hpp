#pragma once

#include "caprouter/core/error.hpp"

#include <glaze/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace caprouter {

using JsonValue = glz::generic_json<glz::num_mode::i64>;

// Ordered key -> value mapping, so its JSON encoding is canonical.
using Inputs = JsonValue::object_t;

[[nodiscard]] inline auto dump_json(const JsonValue &value) -> std::string {
  auto out = glz::write_json(value);
  return out ? *out : "null";
}

[[nodiscard]] inline auto dump_json(const Inputs &inputs) -> std::string {
  return dump_json(JsonValue{inputs});
}

[[nodiscard]] inline auto parse_json(std::string_view input)
    -> Result<JsonValue> {
  JsonValue value{};
  constexpr auto kOpts = glz::opts{.null_terminated = false};
  if (auto ec = glz::read<kOpts>(value, input); ec) {
    return fail(Error::ParseError);
  }
  return ok(std::move(value));
}

[[nodiscard]] inline auto json_number(const JsonValue &value)
    -> std::optional<double> {
  if (value.holds<std::int64_t>()) {
    return static_cast<double>(value.get<std::int64_t>());
  }
  if (value.holds<double>()) {
    return value.get<double>();
  }
  return std::nullopt;
}

[[nodiscard]] inline auto json_string(const JsonValue &value)
    -> std::optional<std::string> {
  if (value.is_string()) {
    return value.get<std::string>();
  }
  return std::nullopt;
}

/// `capability_id:<canonical inputs>`; shared by the response cache and the
/// in-flight coalescer.
[[nodiscard]] inline auto canonical_key(std::string_view capability_id,
                                        const Inputs &inputs) -> std::string {
  std::string key{capability_id};
  key.push_back(':');
  key += dump_json(inputs);
  return key;
}

} // namespace caprouter
