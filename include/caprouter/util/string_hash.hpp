#pragma once

#include <ankerl/unordered_dense.h>

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace caprouter {

// Heterogeneous-lookup hash for string-keyed dense maps: cache and coalescer
// keys can be probed with a string_view without building a std::string.
// Delegates to ankerl's wyhash, which already avalanches.
struct StringHash {
  using is_transparent = void;
  using is_avalanching = void;

  [[nodiscard]] auto operator()(std::string_view sv) const noexcept
      -> std::uint64_t {
    return ankerl::unordered_dense::hash<std::string_view>{}(sv);
  }
};

using StringEqual = std::equal_to<>;

} // namespace caprouter
