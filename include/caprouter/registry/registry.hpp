#pragma once

#include "caprouter/registry/capability.hpp"
#include "caprouter/util/json.hpp"

#include <ankerl/unordered_dense.h>

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace caprouter {

class IRegistry {
public:
  virtual ~IRegistry() = default;

  [[nodiscard]] virtual auto get_capability(const CapabilityId &id) const
      -> const Capability * = 0;

  [[nodiscard]] virtual auto capability_count() const -> std::size_t = 0;
};

class InMemoryRegistry final : public IRegistry {
public:
  /// Replaces any capability already registered under the same id.
  auto add(Capability capability) -> void;
  auto remove(const CapabilityId &id) -> bool;

  [[nodiscard]] auto get_capability(const CapabilityId &id) const
      -> const Capability * override;
  [[nodiscard]] auto capability_count() const -> std::size_t override;

  [[nodiscard]] auto ids() const -> std::vector<CapabilityId>;

private:
  ankerl::unordered_dense::map<CapabilityId, Capability> capabilities_;
};

/// First required field absent from `inputs`, in declaration order.
[[nodiscard]] auto first_missing_input(const Capability &capability,
                                       const Inputs &inputs)
    -> std::optional<std::string_view>;

} // namespace caprouter
