#include "ciforge/app/application.hpp"
#include "ciforge/cli/commands.hpp"
#include "ciforge/config/config.hpp"
#include "ciforge/pipeline/definition_store.hpp"
#include "ciforge/util/log.hpp"
#include "ciforge/util/signals.hpp"

#include <filesystem>
#include <print>
#include <string>

namespace ciforge::cli {
namespace {

auto load_config_or_print(const std::string &path) -> Result<SystemConfig> {
  auto res = path.empty() ? ConfigLoader::load_defaults()
                          : ConfigLoader::load_from_file(path);
  return res.or_else([&](std::error_code ec) -> Result<SystemConfig> {
    std::println(stderr, "Error: {}", ec.message());
    return fail(ec);
  });
}

// Relative definition directories are resolved against the config file.
auto resolve_definitions_dir(const std::string &dir,
                             const std::string &config_file) -> std::string {
  std::filesystem::path defs{dir};
  if (defs.empty() || defs.is_absolute()) {
    return dir;
  }
  std::filesystem::path base = std::filesystem::current_path();
  if (!config_file.empty()) {
    auto cfg_path = std::filesystem::absolute(config_file);
    if (!cfg_path.parent_path().empty()) {
      base = cfg_path.parent_path();
    }
  }
  return std::filesystem::weakly_canonical(base / defs).string();
}

} // namespace

auto cmd_serve(const ServeOptions &opts) -> int {
  auto config_res = load_config_or_print(opts.config_file);
  if (!config_res) {
    return 1;
  }
  auto config = std::move(*config_res);

  if (opts.definitions_dir) {
    config.intake.definitions_dir = *opts.definitions_dir;
  } else {
    config.intake.definitions_dir = resolve_definitions_dir(
        config.intake.definitions_dir, opts.config_file);
  }
  if (opts.log_level) {
    config.log.level = *opts.log_level;
  }
  if (opts.log_file) {
    config.log.file = *opts.log_file;
  }
  if (opts.port) {
    config.intake.port = static_cast<std::uint16_t>(*opts.port);
  }
  config.intake.enabled = !opts.no_intake;

  Application app(std::move(config));
  if (auto r = app.init(); !r) {
    log::error("Initialization failed: {}", r.error().message());
    return 1;
  }
  if (app.store().size() == 0) {
    log::warn("No pipeline definitions loaded; every event will be rejected");
  }
  if (auto r = app.start(); !r) {
    log::error("Failed to start: {}", r.error().message());
    return 1;
  }

  setup_signal_handlers();
  const auto &cfg = app.config();
  if (cfg.intake.enabled) {
    log::info("ciforge serving on {}:{} ({} pipelines)", cfg.intake.host,
              app.webhook_port(), app.store().size());
  } else {
    log::info("ciforge started without intake ({} pipelines)",
              app.store().size());
  }

  wait_for_shutdown();
  log::info("Shutdown requested");
  app.stop();
  log::info("ciforge stopped.");
  return 0;
}

} // namespace ciforge::cli
