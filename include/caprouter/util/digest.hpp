#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace caprouter::util {

/// Lower-case hex SHA-256 of `data` (64 chars).
[[nodiscard]] auto sha256_hex(std::string_view data) -> std::string;

/// First `chars` hex characters of the SHA-256 of `data`.
[[nodiscard]] auto sha256_prefix(std::string_view data, std::size_t chars)
    -> std::string;

/// `bytes` bytes from the OpenSSL CSPRNG, hex encoded.
[[nodiscard]] auto random_hex(std::size_t bytes) -> std::string;

} // namespace caprouter::util
