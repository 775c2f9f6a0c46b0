#pragma once

#include "caprouter/core/error.hpp"
#include "caprouter/util/log.hpp"

#include <glaze/toml.hpp>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>

namespace caprouter::toml_util {

/// Whole file as text. A missing path or a directory is FileNotFound.
[[nodiscard]] inline auto read_file(std::string_view path)
    -> Result<std::string> {
  const std::filesystem::path fs_path{path};
  std::error_code ec;
  if (!std::filesystem::is_regular_file(fs_path, ec)) {
    log::error("Router config {} is not a readable file", path);
    return fail(Error::FileNotFound);
  }
  std::ifstream in(fs_path, std::ios::binary);
  if (!in) {
    log::error("Cannot open router config {}", path);
    return fail(Error::FileNotFound);
  }
  return ok(std::string((std::istreambuf_iterator<char>(in)),
                        std::istreambuf_iterator<char>()));
}

/// Reads TOML into the raw mirror struct T. Unknown keys are ignored so a
/// newer file still loads; `source` names the document in diagnostics.
template <typename T>
[[nodiscard]] auto parse_toml(std::string_view text, std::string_view source)
    -> Result<T> {
  T raw{};
  constexpr auto kOpts =
      glz::opts{.format = glz::TOML, .error_on_unknown_keys = false};
  if (auto ec = glz::read<kOpts>(raw, text); ec) {
    log::error("{}: TOML parse error: {}", source,
               glz::format_error(ec, text));
    return fail(Error::ParseError);
  }
  return ok(std::move(raw));
}

} // namespace caprouter::toml_util
