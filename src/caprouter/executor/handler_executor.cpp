#include "caprouter/executor/handler_executor.hpp"

#include "caprouter/util/log.hpp"
#include "caprouter/util/time.hpp"

#include <exception>
#include <format>

namespace caprouter {

HandlerExecutor::HandlerExecutor(std::string name, ExecutionMode mode)
    : name_(std::move(name)), mode_(mode) {}

auto HandlerExecutor::register_handler(std::string pattern, Handler handler)
    -> void {
  handlers_.emplace_back(std::move(pattern), std::move(handler));
}

auto HandlerExecutor::find(const CapabilityId &id) const -> const Handler * {
  for (const auto &[pattern, handler] : handlers_) {
    if (id.value().find(pattern) != std::string_view::npos) {
      return &handler;
    }
  }
  return nullptr;
}

auto HandlerExecutor::can_execute(const CapabilityId &id) const -> bool {
  return find(id) != nullptr;
}

auto HandlerExecutor::privacy_level() const -> int {
  return mode_ == ExecutionMode::Confidential ? 2 : 0;
}

auto HandlerExecutor::execute(ExecutionContext ctx) -> task<ExecutionResult> {
  const auto start = Clock::now();
  const auto *handler = find(ctx.capability_id);
  if (handler == nullptr) {
    co_return ExecutionResult::failure(
        name_, std::format("Capability {} not supported by {}",
                           ctx.capability_id, name_));
  }

  ExecutionResult result;
  result.metadata.executor = name_;
  result.metadata.privacy_level = privacy_level();
  try {
    auto out = co_await (*handler)(ctx);
    result.success = true;
    result.outputs = std::move(out.outputs);
    result.metadata.cost_actual = out.cost;
    result.metadata.provider_used = std::move(out.provider);
  } catch (const std::exception &e) {
    log::debug("{} failed {}: {}", name_, ctx.capability_id, e.what());
    result.success = false;
    result.error = e.what();
  }
  result.metadata.execution_time_ms = util::elapsed_ms(start, Clock::now());
  co_return result;
}

} // namespace caprouter
