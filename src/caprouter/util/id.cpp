#include "caprouter/util/id.hpp"

#include <chrono>
#include <cstdint>
#include <format>
#include <random>

namespace caprouter {

namespace detail {

auto generate_short_hex() -> std::string {
  thread_local std::mt19937_64 gen(std::random_device{}());
  thread_local std::uniform_int_distribution<std::uint32_t> dis;
  return std::format("{:08x}", dis(gen));
}

} // namespace detail

auto generate_prefixed_id(std::string_view prefix) -> std::string {
  const auto now_ms = static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
  return std::format("{}_{:x}{}", prefix, now_ms, detail::generate_short_hex());
}

auto generate_request_id() -> RequestId {
  return RequestId{generate_prefixed_id("req")};
}

} // namespace caprouter
