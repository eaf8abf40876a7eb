#include "flowcore/cli/commands.hpp"
#include "flowcore/util/log.hpp"

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <string>

namespace {
auto default_config() -> std::string {
  if (const char *env = std::getenv("FLOWCORE_CONFIG"); env && *env) {
    return env;
  }
  return {};
}
} // namespace

int main(int argc, char *argv[]) {
  flowcore::log::set_output_stderr();
  flowcore::log::set_level(flowcore::log::Level::Warn);

  CLI::App app{"flowcore", "Workflow orchestration engine"};
  app.require_subcommand(1);
  app.footer("\nExamples:\n"
             "  flowcore validate pipeline.toml\n"
             "  flowcore run pipeline.toml -c flowcore.toml --context "
             "'{\"x\": 5}'\n"
             "\nTip: Set FLOWCORE_CONFIG=flowcore.toml to skip -c.");

  const std::string env_config = default_config();

  flowcore::cli::ValidateOptions validate_opts;
  validate_opts.config_file = env_config;
  auto *validate = app.add_subcommand(
      "validate", "Validate a workflow definition and print its step graph");
  validate->add_option("file", validate_opts.file, "Workflow TOML file")
      ->required()
      ->check(CLI::ExistingFile);
  validate
      ->add_option("-c,--config", validate_opts.config_file,
                   "System config file (step defaults)")
      ->check(CLI::ExistingFile);
  validate->add_flag("--json", validate_opts.json, "Output JSON");
  validate->callback([&validate_opts]() {
    std::exit(flowcore::cli::cmd_validate(validate_opts));
  });

  flowcore::cli::RunOptions run_opts;
  run_opts.config_file = env_config;
  auto *run = app.add_subcommand(
      "run", "Execute a workflow with the built-in shell and noop runners");
  run->add_option("file", run_opts.file, "Workflow TOML file")
      ->required()
      ->check(CLI::ExistingFile);
  run->add_option("-c,--config", run_opts.config_file, "System config file")
      ->check(CLI::ExistingFile);
  run->add_option("--context", run_opts.context,
                  "JSON object merged over the workflow context");
  run->add_option("--log-level", run_opts.log_level,
                  "Log level override: trace|debug|info|warn|error");
  run->add_option("--timeout", run_opts.timeout_sec,
                  "Cancel the workflow after this many seconds");
  run->add_flag("--json", run_opts.json, "Output JSON");
  run->callback(
      [&run_opts]() { std::exit(flowcore::cli::cmd_run(run_opts)); });

  CLI11_PARSE(app, argc, argv);
  return 0;
}
