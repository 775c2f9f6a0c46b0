#pragma once

#include <compare>
#include <format>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace caprouter {

// Phantom type tags for type-safe ID disambiguation
struct CapabilityTag {};
struct RequestTag {};
struct AgentTag {};

template <typename Tag> class TypedId {
public:
  explicit TypedId(std::string value) : value_(std::move(value)) {}
  explicit TypedId(std::string_view value) : value_(value) {}
  explicit TypedId(const char *value) : value_(value ? value : "") {}

  TypedId() = default;

  [[nodiscard]] auto value() const noexcept -> std::string_view {
    return value_;
  }
  [[nodiscard]] auto str() const noexcept -> const std::string & {
    return value_;
  }

  [[nodiscard]] friend auto operator<=>(const TypedId &lhs,
                                        const TypedId &rhs) = default;
  [[nodiscard]] friend auto operator==(const TypedId &lhs, const TypedId &rhs)
      -> bool = default;

  [[nodiscard]] friend auto operator==(const TypedId &lhs,
                                       std::string_view rhs) noexcept -> bool {
    return lhs.value_ == rhs;
  }

  [[nodiscard]] auto empty() const noexcept -> bool { return value_.empty(); }

private:
  std::string value_;
};

using CapabilityId = TypedId<CapabilityTag>;
using RequestId = TypedId<RequestTag>;
using AgentId = TypedId<AgentTag>;

template <typename Tag>
inline auto operator<<(std::ostream &os, const TypedId<Tag> &id)
    -> std::ostream & {
  return os << id.value();
}

namespace detail {
[[nodiscard]] auto generate_short_hex() -> std::string;
} // namespace detail

/// `req_<epoch ms hex><random hex>`; unique per process, not cryptographic.
[[nodiscard]] auto generate_request_id() -> RequestId;

/// Generic `<prefix>_<epoch ms hex><random hex>` identifier.
[[nodiscard]] auto generate_prefixed_id(std::string_view prefix)
    -> std::string;

} // namespace caprouter

// `is_avalanching` tells ankerl::unordered_dense::hash to delegate to
// std::hash instead of hashing the std::string object bytes.
template <typename Tag> struct std::hash<caprouter::TypedId<Tag>> {
  using is_avalanching = void;
  auto operator()(const caprouter::TypedId<Tag> &id) const noexcept
      -> std::size_t {
    return std::hash<std::string_view>{}(id.value());
  }
};

template <typename Tag>
struct std::formatter<caprouter::TypedId<Tag>>
    : std::formatter<std::string_view> {
  auto format(const caprouter::TypedId<Tag> &id, auto &ctx) const {
    return std::formatter<std::string_view>::format(id.value(), ctx);
  }
};
