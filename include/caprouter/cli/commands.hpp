#pragma once

#include <string>

namespace caprouter::cli {

struct ValidateOptions {
  std::string config_file;
  bool json{false};
};

struct DemoOptions {
  std::string config_file;
  std::string log_level;
  int calls{5};
  bool json{false};
};

auto cmd_validate(const ValidateOptions &opts) -> int;
auto cmd_demo(const DemoOptions &opts) -> int;

} // namespace caprouter::cli
