#include "ciforge/cli/commands.hpp"
#include "ciforge/util/log.hpp"

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <string>

namespace {
auto default_config() -> std::string {
  if (const char *env = std::getenv("CIFORGE_CONFIG"); env && *env) {
    return env;
  }
  return {};
}
} // namespace

int main(int argc, char *argv[]) {
  // Keep non-serve CLI output clean by default.
  ciforge::log::set_output_stderr();
  ciforge::log::set_level(ciforge::log::Level::Warn);

  CLI::App app{"ciforge", "A build pipeline orchestrator"};
  app.require_subcommand(1);
  app.footer("\nExamples:\n"
             "  ciforge validate pipelines/\n"
             "  ciforge run pipelines/build.toml --branch main --sha 1a2b3c4\n"
             "  ciforge serve -c ciforge.toml\n"
             "\nTip: Set CIFORGE_CONFIG=ciforge.toml to skip -c on every "
             "command.");

  const std::string env_config = default_config();

  ciforge::cli::ValidateOptions validate_opts;
  auto *validate =
      app.add_subcommand("validate", "Validate pipeline definition files");
  validate
      ->add_option("files", validate_opts.files,
                   "Definition files or directories of *.toml files")
      ->required();
  validate->add_flag("--json", validate_opts.json, "Output JSON");
  validate->callback([&validate_opts]() {
    std::exit(ciforge::cli::cmd_validate(validate_opts));
  });

  ciforge::cli::RunOptions run_opts;
  auto *run = app.add_subcommand("run", "Run one pipeline locally and wait");
  run->footer("\nExamples:\n"
              "  ciforge run build.toml --branch feature/x --sha 1a2b3c4\n"
              "  ciforge run build.toml --event-file event.json --json");
  run_opts.config_file = env_config;
  run->add_option("-c,--config", run_opts.config_file, "System config file")
      ->check(CLI::ExistingFile);
  run->add_option("definition", run_opts.definition_file,
                  "Pipeline definition file")
      ->required()
      ->check(CLI::ExistingFile);
  auto *event_file =
      run->add_option("--event-file", run_opts.event_file,
                      "JSON event {repository, branch, commit_sha, "
                      "event_type}")
          ->check(CLI::ExistingFile);
  run->add_option("--repo", run_opts.repository, "Repository name")
      ->excludes(event_file);
  run->add_option("--branch", run_opts.branch, "Branch name")
      ->excludes(event_file);
  run->add_option("--sha", run_opts.commit_sha, "Commit SHA (7-40 hex)")
      ->excludes(event_file);
  run->add_option("--event", run_opts.event, "push | pull_request")
      ->excludes(event_file);
  run->add_option("--timeout", run_opts.timeout_sec,
                  "Seconds to wait before cancelling the run (0 = no limit)");
  run->add_flag("--json", run_opts.json, "Output the final run as JSON");
  run->add_flag("-q,--quiet", run_opts.quiet, "Do not echo step output");
  run->callback([&run_opts]() { std::exit(ciforge::cli::cmd_run(run_opts)); });

  ciforge::cli::ServeOptions serve_opts;
  auto *serve = app.add_subcommand(
      "serve", "Accept webhook events and run matching pipelines");
  serve_opts.config_file = env_config;
  serve->add_option("-c,--config", serve_opts.config_file, "System config file")
      ->check(CLI::ExistingFile);
  serve->add_option("--definitions", serve_opts.definitions_dir,
                    "Directory of pipeline definitions (overrides config)");
  serve->add_option("--port", serve_opts.port, "Webhook port override")
      ->check(CLI::Range(0, 65535));
  serve->add_option("--log-file", serve_opts.log_file, "Log file path");
  serve->add_option("--log-level", serve_opts.log_level,
                    "Log level override: trace|debug|info|warn|error");
  serve->add_flag("--no-intake", serve_opts.no_intake,
                  "Do not start the webhook server");
  serve->callback(
      [&serve_opts]() { std::exit(ciforge::cli::cmd_serve(serve_opts)); });

  CLI11_PARSE(app, argc, argv);
  return 0;
}
