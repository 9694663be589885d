#include "ciforge/config/config.hpp"
#include "ciforge/config/toml_util.hpp"

#include "ciforge/util/log.hpp"

#include <boost/lexical_cast.hpp>

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>

namespace ciforge {
namespace detail {

struct SchedulerToml {
  int max_concurrent_runs{4};
  int max_runs_per_branch{2};
  int retention{200};
  int infra_max_retries{2};
  std::int64_t infra_retry_backoff_ms{1000};
  std::int64_t runner_acquire_timeout_sec{600};
  int threads{0};
};

struct RunnersToml {
  int count{4};
  std::string workspace_root;
};

struct IntakeToml {
  bool enabled{true};
  std::string host{"127.0.0.1"};
  std::uint16_t port{8090};
  std::string definitions_dir{"./pipelines"};
  std::uint64_t max_body_bytes{1024 * 1024};
};

struct StatusToml {
  bool log_updates{true};
  bool log_output{false};
  std::string json_lines_file;
  std::uint64_t max_step_output_bytes{1024 * 1024};
};

struct LogToml {
  std::string level{"info"};
  std::string file;
};

struct SystemToml {
  SchedulerToml scheduler{};
  RunnersToml runners{};
  IntakeToml intake{};
  StatusToml status{};
  LogToml log{};
};

} // namespace detail
} // namespace ciforge

namespace glz {
template <> struct meta<ciforge::detail::SchedulerToml> {
  using T = ciforge::detail::SchedulerToml;
  static constexpr auto value = object(
      "max_concurrent_runs", &T::max_concurrent_runs, "max_runs_per_branch",
      &T::max_runs_per_branch, "retention", &T::retention, "infra_max_retries",
      &T::infra_max_retries, "infra_retry_backoff_ms",
      &T::infra_retry_backoff_ms, "runner_acquire_timeout_sec",
      &T::runner_acquire_timeout_sec, "threads", &T::threads);
};

template <> struct meta<ciforge::detail::RunnersToml> {
  using T = ciforge::detail::RunnersToml;
  static constexpr auto value =
      object("count", &T::count, "workspace_root", &T::workspace_root);
};

template <> struct meta<ciforge::detail::IntakeToml> {
  using T = ciforge::detail::IntakeToml;
  static constexpr auto value =
      object("enabled", &T::enabled, "host", &T::host, "port", &T::port,
             "definitions_dir", &T::definitions_dir, "max_body_bytes",
             &T::max_body_bytes);
};

template <> struct meta<ciforge::detail::StatusToml> {
  using T = ciforge::detail::StatusToml;
  static constexpr auto value =
      object("log_updates", &T::log_updates, "log_output", &T::log_output,
             "json_lines_file", &T::json_lines_file, "max_step_output_bytes",
             &T::max_step_output_bytes);
};

template <> struct meta<ciforge::detail::LogToml> {
  using T = ciforge::detail::LogToml;
  static constexpr auto value = object("level", &T::level, "file", &T::file);
};

template <> struct meta<ciforge::detail::SystemToml> {
  using T = ciforge::detail::SystemToml;
  static constexpr auto value =
      object("scheduler", &T::scheduler, "runners", &T::runners, "intake",
             &T::intake, "status", &T::status, "log", &T::log);
};
} // namespace glz

namespace ciforge {
namespace {

[[nodiscard]] auto env_flag(std::string_view v) -> bool {
  return v == "1" || v == "true" || v == "yes" || v == "on";
}

// Throws boost::bad_lexical_cast on malformed numbers; the public entry
// points convert that into ParseError.
auto apply_env_overrides(SystemConfig &cfg) -> void {
  if (const char *v = std::getenv("CIFORGE_MAX_CONCURRENT_RUNS"); v) {
    cfg.scheduler.max_concurrent_runs = boost::lexical_cast<int>(v);
  }
  if (const char *v = std::getenv("CIFORGE_MAX_RUNS_PER_BRANCH"); v) {
    cfg.scheduler.max_runs_per_branch = boost::lexical_cast<int>(v);
  }
  if (const char *v = std::getenv("CIFORGE_RETENTION"); v) {
    cfg.scheduler.retention = boost::lexical_cast<int>(v);
  }
  if (const char *v = std::getenv("CIFORGE_INFRA_MAX_RETRIES"); v) {
    cfg.scheduler.infra_max_retries = boost::lexical_cast<int>(v);
  }
  if (const char *v = std::getenv("CIFORGE_THREADS"); v) {
    cfg.scheduler.threads = boost::lexical_cast<int>(v);
  }
  if (const char *v = std::getenv("CIFORGE_RUNNER_COUNT"); v) {
    cfg.runners.count = boost::lexical_cast<int>(v);
  }
  if (const char *v = std::getenv("CIFORGE_WORKSPACE_ROOT"); v) {
    cfg.runners.workspace_root = v;
  }
  if (const char *v = std::getenv("CIFORGE_INTAKE_ENABLED"); v) {
    cfg.intake.enabled = env_flag(v);
  }
  if (const char *v = std::getenv("CIFORGE_INTAKE_HOST"); v) {
    cfg.intake.host = v;
  }
  if (const char *v = std::getenv("CIFORGE_INTAKE_PORT"); v) {
    cfg.intake.port = boost::lexical_cast<std::uint16_t>(v);
  }
  if (const char *v = std::getenv("CIFORGE_DEFINITIONS_DIR"); v) {
    cfg.intake.definitions_dir = v;
  }
  if (const char *v = std::getenv("CIFORGE_STATUS_FILE"); v) {
    cfg.status.json_lines_file = v;
  }
  if (const char *v = std::getenv("CIFORGE_LOG_LEVEL"); v) {
    cfg.log.level = v;
  }
  if (const char *v = std::getenv("CIFORGE_LOG_FILE"); v) {
    cfg.log.file = v;
  }
}

// Retry backoff doubles up to 1024x its base; both bounds keep timer
// deadlines representable in steady_clock nanoseconds.
constexpr std::chrono::milliseconds kMaxInfraRetryBackoff =
    std::chrono::hours{1};
constexpr std::chrono::seconds kMaxRunnerAcquireTimeout =
    std::chrono::hours{30 * 24};

[[nodiscard]] auto validate(const SystemConfig &cfg) -> Result<void> {
  const auto &s = cfg.scheduler;
  if (s.max_concurrent_runs <= 0 || s.max_runs_per_branch <= 0 ||
      s.retention <= 0 || s.infra_max_retries < 0 ||
      s.infra_retry_backoff.count() < 0 ||
      s.infra_retry_backoff > kMaxInfraRetryBackoff ||
      s.runner_acquire_timeout.count() <= 0 ||
      s.runner_acquire_timeout > kMaxRunnerAcquireTimeout || s.threads < 0) {
    log::error("Invalid [scheduler] configuration");
    return fail(Error::ParseError);
  }
  if (cfg.runners.count <= 0) {
    log::error("Invalid [runners] configuration: count must be positive");
    return fail(Error::ParseError);
  }
  if (cfg.intake.max_body_bytes == 0) {
    log::error("Invalid [intake] configuration: max_body_bytes is zero");
    return fail(Error::ParseError);
  }
  return ok();
}

[[nodiscard]] auto convert_toml(std::string_view toml_text)
    -> Result<SystemConfig> {
  auto raw_result = toml_util::parse_toml<detail::SystemToml>(toml_text);
  if (!raw_result)
    return fail(raw_result.error());
  auto &raw = *raw_result;

  SystemConfig cfg{};
  cfg.scheduler.max_concurrent_runs = raw.scheduler.max_concurrent_runs;
  cfg.scheduler.max_runs_per_branch = raw.scheduler.max_runs_per_branch;
  cfg.scheduler.retention = raw.scheduler.retention;
  cfg.scheduler.infra_max_retries = raw.scheduler.infra_max_retries;
  cfg.scheduler.infra_retry_backoff =
      std::chrono::milliseconds{raw.scheduler.infra_retry_backoff_ms};
  cfg.scheduler.runner_acquire_timeout =
      std::chrono::seconds{raw.scheduler.runner_acquire_timeout_sec};
  cfg.scheduler.threads = raw.scheduler.threads;

  cfg.runners.count = raw.runners.count;
  cfg.runners.workspace_root = std::move(raw.runners.workspace_root);

  cfg.intake.enabled = raw.intake.enabled;
  cfg.intake.host = std::move(raw.intake.host);
  cfg.intake.port = raw.intake.port;
  cfg.intake.definitions_dir = std::move(raw.intake.definitions_dir);
  cfg.intake.max_body_bytes =
      static_cast<std::size_t>(raw.intake.max_body_bytes);

  cfg.status.log_updates = raw.status.log_updates;
  cfg.status.log_output = raw.status.log_output;
  cfg.status.json_lines_file = std::move(raw.status.json_lines_file);
  cfg.status.max_step_output_bytes =
      static_cast<std::size_t>(raw.status.max_step_output_bytes);

  cfg.log.level = std::move(raw.log.level);
  cfg.log.file = std::move(raw.log.file);

  apply_env_overrides(cfg);
  if (auto r = validate(cfg); !r) {
    return fail(r.error());
  }
  return ok(std::move(cfg));
}

} // namespace

auto ConfigLoader::load_from_file(const std::filesystem::path &path)
    -> Result<SystemConfig> {
  auto text = toml_util::read_file(path);
  if (!text) {
    log::error("Cannot read config file {}", path.string());
    return fail(text.error());
  }
  return load_from_string(*text);
}

auto ConfigLoader::load_from_string(std::string_view toml_str)
    -> Result<SystemConfig> {
  try {
    return convert_toml(toml_str);
  } catch (const boost::bad_lexical_cast &e) {
    log::error("Invalid CIFORGE_* environment override: {}", e.what());
    return fail(Error::ParseError);
  }
}

auto ConfigLoader::load_defaults() -> Result<SystemConfig> {
  SystemConfig cfg{};
  try {
    apply_env_overrides(cfg);
  } catch (const boost::bad_lexical_cast &e) {
    log::error("Invalid CIFORGE_* environment override: {}", e.what());
    return fail(Error::ParseError);
  }
  if (auto r = validate(cfg); !r) {
    return fail(r.error());
  }
  return ok(std::move(cfg));
}

} // namespace ciforge
