#include "caprouter/registry/registry.hpp"

namespace caprouter {

auto InMemoryRegistry::add(Capability capability) -> void {
  auto id = capability.id;
  capabilities_.insert_or_assign(std::move(id), std::move(capability));
}

auto InMemoryRegistry::remove(const CapabilityId &id) -> bool {
  return capabilities_.erase(id) > 0;
}

auto InMemoryRegistry::get_capability(const CapabilityId &id) const
    -> const Capability * {
  auto it = capabilities_.find(id);
  return it == capabilities_.end() ? nullptr : &it->second;
}

auto InMemoryRegistry::capability_count() const -> std::size_t {
  return capabilities_.size();
}

auto InMemoryRegistry::ids() const -> std::vector<CapabilityId> {
  std::vector<CapabilityId> out;
  out.reserve(capabilities_.size());
  for (const auto &[id, _] : capabilities_) {
    out.push_back(id);
  }
  return out;
}

auto first_missing_input(const Capability &capability, const Inputs &inputs)
    -> std::optional<std::string_view> {
  for (const auto &field : capability.required_inputs) {
    if (!inputs.contains(field)) {
      return std::string_view{field};
    }
  }
  return std::nullopt;
}

} // namespace caprouter
