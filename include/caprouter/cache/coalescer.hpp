#pragma once

#include "caprouter/router/invocation.hpp"
#include "caprouter/util/async_event.hpp"
#include "caprouter/util/string_hash.hpp"

#include <ankerl/unordered_dense.h>
#include <boost/asio/any_io_executor.hpp>

#include <memory>
#include <string>

namespace caprouter {

// At most one in-flight execution per coalescing key. Later arrivals join the
// pending result instead of dispatching again.
class Coalescer {
public:
  using Pending = util::SharedResult<InvocationResult>;

  explicit Coalescer(boost::asio::any_io_executor executor)
      : executor_(std::move(executor)) {}

  /// The pending result for `key`, or nullptr when nothing is in flight.
  [[nodiscard]] auto join(const std::string &key) const
      -> std::shared_ptr<Pending>;

  /// Registers a new in-flight execution; replaces nothing if one exists.
  auto begin(const std::string &key) -> std::shared_ptr<Pending>;

  /// Publishes to every waiter and forgets the key.
  auto finish(const std::string &key, const InvocationResult &result) -> void;

  [[nodiscard]] auto in_flight() const noexcept -> std::size_t {
    return pending_.size();
  }

private:
  boost::asio::any_io_executor executor_;
  ankerl::unordered_dense::map<std::string, std::shared_ptr<Pending>,
                               StringHash, StringEqual>
      pending_;
};

} // namespace caprouter
