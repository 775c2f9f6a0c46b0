#include "caprouter/executor/executor.hpp"

namespace caprouter {

namespace {
constexpr std::size_t kNoMatch = static_cast<std::size_t>(-1);
}

auto ExecutorSet::add(std::shared_ptr<IExecutor> executor) -> void {
  if (!executor) {
    return;
  }
  executors_.push_back(std::move(executor));
  resolved_.clear();
}

auto ExecutorSet::select(const CapabilityId &id) const
    -> std::shared_ptr<IExecutor> {
  auto it = resolved_.find(id);
  if (it == resolved_.end()) {
    std::size_t index = kNoMatch;
    for (std::size_t i = 0; i < executors_.size(); ++i) {
      if (executors_[i]->can_execute(id)) {
        index = i;
        break;
      }
    }
    it = resolved_.emplace(id, index).first;
  }
  return it->second == kNoMatch ? nullptr : executors_[it->second];
}

auto ExecutorSet::names() const -> std::vector<std::string> {
  std::vector<std::string> out;
  out.reserve(executors_.size());
  for (const auto &executor : executors_) {
    out.emplace_back(executor->name());
  }
  return out;
}

} // namespace caprouter
