#include "caprouter/cli/commands.hpp"
#include "caprouter/util/log.hpp"

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <string>

namespace {
auto default_config() -> std::string {
  if (const char *env = std::getenv("CAPROUTER_CONFIG"); env && *env) {
    return env;
  }
  return {};
}
} // namespace

int main(int argc, char *argv[]) {
  caprouter::log::set_output_stderr();
  caprouter::log::set_level(caprouter::log::Level::Warn);

  CLI::App app{"caprouter", "Capability invocation router"};
  app.require_subcommand(1);
  app.footer("\nExamples:\n"
             "  caprouter validate -c caprouter.toml\n"
             "  caprouter demo -c caprouter.toml --calls 10 --json\n"
             "\nTip: Set CAPROUTER_CONFIG=caprouter.toml to skip -c on "
             "every command.");

  const std::string env_config = default_config();

  caprouter::cli::ValidateOptions validate_opts;
  auto *validate =
      app.add_subcommand("validate", "Validate a router configuration file");
  validate_opts.config_file = env_config;
  auto *validate_cfg =
      validate
          ->add_option("-c,--config", validate_opts.config_file,
                       "Router config file")
          ->check(CLI::ExistingFile);
  if (env_config.empty())
    validate_cfg->required();
  validate->add_flag("--json", validate_opts.json, "Output JSON");
  validate->callback([&validate_opts]() {
    std::exit(caprouter::cli::cmd_validate(validate_opts));
  });

  caprouter::cli::DemoOptions demo_opts;
  auto *demo = app.add_subcommand(
      "demo", "Drive a simulated capability catalog through the router");
  demo_opts.config_file = env_config;
  demo->add_option("-c,--config", demo_opts.config_file,
                   "Router config file (defaults when omitted)")
      ->check(CLI::ExistingFile);
  demo->add_option("--calls", demo_opts.calls,
                   "Repeated lookups of the same price")
      ->check(CLI::Range(1, 1000));
  demo->add_option("--log-level", demo_opts.log_level,
                   "Log level override: trace|debug|info|warn|error");
  demo->add_flag("--json", demo_opts.json,
                 "Print only the final JSON report");
  demo->callback(
      [&demo_opts]() { std::exit(caprouter::cli::cmd_demo(demo_opts)); });

  CLI11_PARSE(app, argc, argv);
  return 0;
}
