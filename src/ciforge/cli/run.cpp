#include "ciforge/app/application.hpp"
#include "ciforge/cli/commands.hpp"
#include "ciforge/cli/formatting.hpp"
#include "ciforge/config/config.hpp"
#include "ciforge/config/toml_util.hpp"
#include "ciforge/intake/event_intake.hpp"
#include "ciforge/pipeline/definition_loader.hpp"
#include "ciforge/scheduler/scheduler.hpp"
#include "ciforge/status/status_json.hpp"
#include "ciforge/util/json.hpp"
#include "ciforge/util/log.hpp"

#include <chrono>
#include <print>
#include <string_view>

namespace ciforge::cli {

namespace {

constexpr std::string_view kPlaceholderSha =
    "0000000000000000000000000000000000000000";
constexpr auto kCancelGrace = std::chrono::seconds{10};
constexpr auto kUnboundedWait = std::chrono::hours{24 * 365};

auto load_config(const RunOptions &opts) -> Result<SystemConfig> {
  auto cfg = opts.config_file.empty()
                 ? ConfigLoader::load_defaults()
                 : ConfigLoader::load_from_file(opts.config_file);
  if (!cfg) {
    return cfg;
  }
  // One-shot runs take no external events and render status on the console.
  cfg->intake.enabled = false;
  cfg->intake.definitions_dir.clear();
  cfg->status.log_updates = false;
  if (opts.config_file.empty()) {
    cfg->log.level = "warn";
  }
  return cfg;
}

auto build_event(const RunOptions &opts, std::string &diagnostic)
    -> Result<TriggerEvent> {
  intake::RawEvent raw;
  if (opts.event_file) {
    auto text = toml_util::read_file(*opts.event_file);
    if (!text) {
      diagnostic = std::format("cannot read event file {}", *opts.event_file);
      return fail(text.error());
    }
    auto parsed = intake::parse_event_json(*text);
    if (!parsed) {
      diagnostic = "event file is not a valid event JSON document";
      return fail(parsed.error());
    }
    raw = std::move(*parsed);
  } else {
    raw = intake::RawEvent{
        .repository = opts.repository,
        .branch = opts.branch,
        .commit_sha = opts.commit_sha.empty() ? std::string(kPlaceholderSha)
                                              : opts.commit_sha,
        .event_type = opts.event,
    };
  }
  return intake::normalize(raw, &diagnostic);
}

auto console_sink(bool quiet) -> std::shared_ptr<CallbackStatusSink> {
  auto on_status = [](const StatusUpdate &u) {
    switch (u.scope) {
    case StatusScope::Run:
      std::println("{} run {} {}", fmt::ansi::bold("==>"), u.run_id,
                   fmt::colorize_status(u.status));
      break;
    case StatusScope::Job:
      std::println("{} job {} {}", fmt::ansi::bold("-->"), u.job.value_or(""),
                   fmt::colorize_status(u.status));
      break;
    case StatusScope::Step:
      if (u.status == "running") {
        std::println("    {} {}", fmt::ansi::dim("$"), u.step.value_or(""));
      } else if (u.status != "succeeded") {
        std::println("    step {} {} (exit {})", u.step.value_or(""),
                     fmt::colorize_status(u.status), u.exit_code.value_or(-1));
      }
      break;
    }
  };
  CallbackStatusSink::OutputCallback on_output;
  if (!quiet) {
    on_output = [](const OutputChunk &chunk) {
      std::print(chunk.stream == OutputStream::Stderr ? stderr : stdout, "{}",
                 chunk.data);
    };
  }
  return std::make_shared<CallbackStatusSink>(std::move(on_status),
                                              std::move(on_output));
}

auto print_summary(const Run &run) -> void {
  std::println("");
  fmt::Table table({{"JOB", 24}, {"STATUS", 10}, {"REASON", 20},
                    {"STEPS", 6, true}, {"DURATION", 10, true}});
  table.print_header();
  for (const auto &job : run.jobs()) {
    table.print_row({
        job.job_name,
        fmt::colorize_status(to_string_view(job.status)),
        job.reason == FailureReason::None
            ? std::string("-")
            : std::string(to_string_view(job.reason)),
        std::to_string(job.steps.size()),
        fmt::format_elapsed(job.started_at, job.finished_at),
    });
  }
  std::println("\nRun {} {} in {}", run.id(),
               fmt::colorize_status(to_string_view(run.status())),
               fmt::format_elapsed(run.created_at(), run.finished_at()));
}

} // namespace

auto cmd_run(const RunOptions &opts) -> int {
  log::set_output_stderr();

  std::string diagnostic;
  auto definition =
      DefinitionLoader::load_from_file(opts.definition_file, &diagnostic);
  if (!definition) {
    std::println(stderr, "Error: {}: {}", opts.definition_file,
                 diagnostic.empty() ? definition.error().message()
                                    : diagnostic);
    return 2;
  }

  auto event = build_event(opts, diagnostic);
  if (!event) {
    std::println(stderr, "Error: invalid event: {}",
                 diagnostic.empty() ? event.error().message() : diagnostic);
    return 2;
  }
  if (!definition->matches(*event)) {
    log::warn("Pipeline '{}' triggers do not match {} to {}; running anyway",
              definition->name, to_string_view(event->event_type),
              event->branch);
  }

  auto config = load_config(opts);
  if (!config) {
    std::println(stderr, "Error: {}", config.error().message());
    return 2;
  }

  Application app(std::move(*config));
  if (!opts.json) {
    app.reporter().add_sink(console_sink(opts.quiet));
  }
  if (auto r = app.init(); !r) {
    std::println(stderr, "Error: {}", r.error().message());
    return 1;
  }

  auto shared = std::make_shared<const PipelineDefinition>(
      std::move(*definition));
  auto id = app.scheduler().submit(*event, shared);
  if (!id) {
    std::println(stderr, "Error: run rejected: {}", id.error().message());
    return 1;
  }

  const auto timeout = opts.timeout_sec > 0
                           ? std::chrono::milliseconds(
                                 std::chrono::seconds(opts.timeout_sec))
                           : std::chrono::milliseconds(kUnboundedWait);
  auto run = app.scheduler().wait(*id, timeout);
  if (!run && run.error() == make_error_code(Error::Timeout)) {
    std::println(stderr, "Run {} did not finish within {}s, cancelling", *id,
                 opts.timeout_sec);
    if (auto r = app.scheduler().cancel(*id); !r) {
      log::warn("Cancel failed: {}", r.error().message());
    }
    run = app.scheduler().wait(*id, kCancelGrace);
  }
  if (!run) {
    std::println(stderr, "Error: {}", run.error().message());
    return 1;
  }

  if (opts.json) {
    std::println("{}", dump_json(to_json(*run)));
  } else {
    print_summary(*run);
  }
  app.stop();
  return run->status() == RunStatus::Succeeded ? 0 : 1;
}

} // namespace ciforge::cli
