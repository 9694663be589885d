#include "ciforge/app/application.hpp"

#include "ciforge/core/runtime.hpp"
#include "ciforge/intake/event_intake.hpp"
#include "ciforge/intake/webhook_server.hpp"
#include "ciforge/pipeline/definition_store.hpp"
#include "ciforge/scheduler/scheduler.hpp"
#include "ciforge/util/log.hpp"

#include <algorithm>
#include <filesystem>

namespace ciforge {

Application::Application(SystemConfig config)
    : config_(std::move(config)),
      store_(std::make_unique<DefinitionStore>()) {}

Application::~Application() { stop(); }

auto Application::init() -> Result<void> {
  log::set_level(config_.log.level);
  if (!config_.log.file.empty() && !log::set_output_file(config_.log.file)) {
    log::error("Failed to open log file: {}", config_.log.file);
    return fail(Error::FileNotFound);
  }

  if (config_.status.log_updates) {
    reporter_.add_sink(
        std::make_shared<LogStatusSink>(config_.status.log_output));
  }
  if (!config_.status.json_lines_file.empty()) {
    auto sink = JsonLinesStatusSink::open(config_.status.json_lines_file);
    if (!sink) {
      log::error("Failed to open status file '{}': {}",
                 config_.status.json_lines_file, sink.error().message());
      return fail(sink.error());
    }
    reporter_.add_sink(std::move(*sink));
  }

  if (!config_.intake.definitions_dir.empty()) {
    auto loaded = store_->load_directory(config_.intake.definitions_dir);
    if (!loaded) {
      log::error("Failed to load pipeline definitions from '{}': {}",
                 config_.intake.definitions_dir, loaded.error().message());
      return fail(loaded.error());
    }
    for (const auto &failure : store_->failures()) {
      log::warn("Skipped definition {}: {}", failure.file,
                failure.diagnostic.empty() ? failure.error.message()
                                           : failure.diagnostic);
    }
    log::info("Loaded {} pipeline definition(s) from {}", *loaded,
              config_.intake.definitions_dir);
  }

  runtime_ = std::make_unique<Runtime>(
      static_cast<unsigned>(std::max(0, config_.scheduler.threads)));
  if (auto r = runtime_->start(); !r) {
    log::error("Failed to start runtime: {}", r.error().message());
    return fail(r.error());
  }

  scheduler_ = std::make_unique<Scheduler>(
      *runtime_, reporter_, SchedulerOptions::from_config(config_));
  intake_ = std::make_unique<intake::EventIntake>(*store_, *scheduler_);
  return ok();
}

auto Application::start() -> Result<void> {
  if (!scheduler_) {
    return fail(Error::InvalidState);
  }
  if (!config_.intake.enabled) {
    return ok();
  }
  webhook_ = std::make_unique<http::WebhookServer>(
      *runtime_, *intake_, *scheduler_,
      http::WebhookServerOptions{.max_body_bytes =
                                     config_.intake.max_body_bytes});
  return webhook_->start(config_.intake.host, config_.intake.port);
}

auto Application::stop() noexcept -> void {
  if (stopped_ || !runtime_) {
    return;
  }
  stopped_ = true;
  try {
    if (webhook_) {
      webhook_->stop();
    }
    if (scheduler_) {
      scheduler_->shutdown();
    }
  } catch (const std::exception &e) {
    log::error("Error during shutdown: {}", e.what());
  }
  runtime_->stop();
  webhook_.reset();
  intake_.reset();
  scheduler_.reset();
  runtime_.reset();
  log::flush();
}

auto Application::scheduler() -> Scheduler & { return *scheduler_; }

auto Application::event_intake() -> intake::EventIntake & { return *intake_; }

auto Application::webhook_port() const -> std::uint16_t {
  return webhook_ ? webhook_->port() : 0;
}

} // namespace ciforge
