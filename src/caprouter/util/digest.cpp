#include "caprouter/util/digest.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <array>
#include <stdexcept>
#include <vector>

namespace caprouter::util {

namespace {

constexpr char kHex[] = "0123456789abcdef";

auto to_hex(const unsigned char *data, std::size_t len) -> std::string {
  std::string out;
  out.reserve(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out.push_back(kHex[data[i] >> 4]);
    out.push_back(kHex[data[i] & 0x0f]);
  }
  return out;
}

} // namespace

auto sha256_hex(std::string_view data) -> std::string {
  std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
  unsigned int len = 0;
  if (EVP_Digest(data.data(), data.size(), digest.data(), &len, EVP_sha256(),
                 nullptr) != 1) {
    throw std::runtime_error("EVP_Digest(sha256) failed");
  }
  return to_hex(digest.data(), len);
}

auto sha256_prefix(std::string_view data, std::size_t chars) -> std::string {
  auto hex = sha256_hex(data);
  if (chars < hex.size()) {
    hex.resize(chars);
  }
  return hex;
}

auto random_hex(std::size_t bytes) -> std::string {
  std::vector<unsigned char> buf(bytes);
  if (bytes > 0 &&
      RAND_bytes(buf.data(), static_cast<int>(buf.size())) != 1) {
    throw std::runtime_error("RAND_bytes failed");
  }
  return to_hex(buf.data(), buf.size());
}

} // namespace caprouter::util
