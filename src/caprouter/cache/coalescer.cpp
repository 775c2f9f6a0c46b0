#include "caprouter/cache/coalescer.hpp"

namespace caprouter {

auto Coalescer::join(const std::string &key) const -> std::shared_ptr<Pending> {
  auto it = pending_.find(key);
  return it == pending_.end() ? nullptr : it->second;
}

auto Coalescer::begin(const std::string &key) -> std::shared_ptr<Pending> {
  auto [it, inserted] = pending_.try_emplace(key);
  if (inserted) {
    it->second = std::make_shared<Pending>(executor_);
  }
  return it->second;
}

auto Coalescer::finish(const std::string &key, const InvocationResult &result)
    -> void {
  auto it = pending_.find(key);
  if (it == pending_.end()) {
    return;
  }
  auto pending = std::move(it->second);
  pending_.erase(it);
  pending->publish(result);
}

} // namespace caprouter
