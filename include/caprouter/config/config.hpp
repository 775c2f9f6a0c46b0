#pragma once

#include "caprouter/config/system_config.hpp"
#include "caprouter/core/error.hpp"

#include <string>
#include <string_view>

namespace caprouter {

using Config = SystemConfig;

class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<SystemConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view toml_str)
      -> Result<SystemConfig>;

  /// Range checks shared by the loader and the CLI `validate` command.
  /// `reason` receives the first failed check.
  [[nodiscard]] static auto validate(const SystemConfig &cfg,
                                     std::string *reason = nullptr)
      -> Result<void>;

private:
  [[nodiscard]] static auto load(std::string_view toml_str,
                                 std::string_view source)
      -> Result<SystemConfig>;
};

} // namespace caprouter
