#include "caprouter/cli/commands.hpp"
#include "caprouter/cli/formatting.hpp"
#include "caprouter/config/config.hpp"
#include "caprouter/util/json.hpp"
#include "caprouter/util/log.hpp"

#include <print>

namespace caprouter::cli {

auto cmd_validate(const ValidateOptions &opts) -> int {
  log::set_output_stderr();

  // Range-check failures are logged by the loader with the offending key.
  auto res = ConfigLoader::load_from_file(opts.config_file);
  const bool valid = res.has_value();
  const std::string reason = valid ? std::string{} : res.error().message();

  if (opts.json) {
    JsonValue out{{"file", opts.config_file}, {"valid", valid}};
    if (!valid) {
      out["error"] = reason;
    }
    std::println("{}", dump_json(out));
  } else if (valid) {
    std::println("{} {} - {}", fmt::outcome(true), opts.config_file,
                 fmt::ansi::green("Valid"));
  } else {
    std::println("{} {} - {}", fmt::outcome(false), opts.config_file,
                 fmt::ansi::red(reason));
  }
  return valid ? 0 : 1;
}

} // namespace caprouter::cli
