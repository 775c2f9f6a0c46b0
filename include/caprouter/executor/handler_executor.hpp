#pragma once

#include "caprouter/executor/executor.hpp"

#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace caprouter {

struct HandlerOutput {
  JsonValue outputs;
  std::optional<double> cost;
  std::optional<std::string> provider;
};

// In-process executor: capability ids are matched by substring against the
// registered patterns, in registration order. A handler signals failure by
// throwing; the message becomes the result's error.
class HandlerExecutor final : public IExecutor {
public:
  using Handler = std::function<task<HandlerOutput>(const ExecutionContext &)>;

  HandlerExecutor(std::string name, ExecutionMode mode);

  auto register_handler(std::string pattern, Handler handler) -> void;

  [[nodiscard]] auto name() const -> std::string_view override {
    return name_;
  }
  [[nodiscard]] auto can_execute(const CapabilityId &id) const
      -> bool override;
  [[nodiscard]] auto privacy_level() const -> int override;

  auto execute(ExecutionContext ctx) -> task<ExecutionResult> override;

private:
  [[nodiscard]] auto find(const CapabilityId &id) const -> const Handler *;

  std::string name_;
  ExecutionMode mode_;
  std::vector<std::pair<std::string, Handler>> handlers_;
};

} // namespace caprouter
