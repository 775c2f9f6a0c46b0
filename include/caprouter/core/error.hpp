#pragma once

#include <array>
#include <concepts>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

namespace caprouter {

enum class Error : std::uint8_t {
  Success,
  CapabilityNotFound,
  MissingRequiredInput,
  ExecutionFailed,
  Timeout,
  RetriesExhausted,
  CircuitOpen,
  NoExecutor,
  PolicyViolation,
  NoCompliantRoute,
  InvalidArgument,
  ParseError,
  FileNotFound,
  NotFound,
  Cancelled,
  Unknown,
};

class ErrorCategory : public std::error_category {
  static constexpr std::array<std::string_view, 16> messages = {
      "success",
      "capability not found",
      "missing required input",
      "execution failed",
      "timeout",
      "retries exhausted",
      "circuit breaker open",
      "no suitable executor",
      "policy violation",
      "no compliant route",
      "invalid argument",
      "parse error",
      "file not found",
      "not found",
      "cancelled",
      "unknown error",
  };

public:
  [[nodiscard]] auto name() const noexcept -> const char * override {
    return "caprouter";
  }

  [[nodiscard]] auto message(int ev) const -> std::string override {
    auto idx = static_cast<std::size_t>(ev);
    if (idx >= std::size(messages)) {
      return "unrecognized error";
    }
    return std::string{messages.at(idx)};
  }
};

inline auto error_category() -> const ErrorCategory & {
  static const ErrorCategory instance;
  return instance;
}

inline auto make_error_code(Error e) -> std::error_code {
  return {std::to_underlying(e), error_category()};
}

// Caller errors are never retried and never count against a breaker.
[[nodiscard]] inline auto is_caller_error(std::error_code ec) noexcept
    -> bool {
  return ec == make_error_code(Error::CapabilityNotFound) ||
         ec == make_error_code(Error::MissingRequiredInput) ||
         ec == make_error_code(Error::InvalidArgument);
}

[[nodiscard]] inline auto is_transient(std::error_code ec) noexcept -> bool {
  return ec == make_error_code(Error::ExecutionFailed) ||
         ec == make_error_code(Error::Timeout);
}

template <typename T>
concept ResultValue = std::destructible<T> || std::is_void_v<T>;

template <typename T> using Result = std::expected<T, std::error_code>;

template <typename T>
  requires ResultValue<std::decay_t<T>>
[[nodiscard]] constexpr auto ok(T &&value) -> Result<std::decay_t<T>> {
  return std::forward<T>(value);
}

[[nodiscard]] constexpr auto ok() -> Result<void> { return {}; }

[[nodiscard]] inline auto fail(Error e) -> std::unexpected<std::error_code> {
  return std::unexpected{make_error_code(e)};
}

[[nodiscard]] inline auto fail(std::error_code ec)
    -> std::unexpected<std::error_code> {
  return std::unexpected{ec};
}

} // namespace caprouter

template <> struct std::is_error_code_enum<caprouter::Error> : std::true_type {};
