#include "caprouter/core/coroutine.hpp"

#include "caprouter/util/log.hpp"

#include <exception>

namespace caprouter {

auto DiscardSink::operator()(std::exception_ptr ep) const noexcept -> void {
  if (!ep) {
    return;
  }
  try {
    std::rethrow_exception(ep);
  } catch (const std::exception &e) {
    log::warn("{} failed: {}", what, e.what());
  } catch (...) {
    log::warn("{} failed with a non-standard exception", what);
  }
}

} // namespace caprouter
