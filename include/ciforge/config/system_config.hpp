#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace ciforge {

struct SchedulerConfig {
  int max_concurrent_runs{4};
  int max_runs_per_branch{2};
  int retention{200}; // terminal runs kept queryable
  int infra_max_retries{2};
  std::chrono::milliseconds infra_retry_backoff{1000};
  std::chrono::seconds runner_acquire_timeout{600};
  int threads{0}; // 0 = hardware_concurrency

  auto operator==(const SchedulerConfig &) const -> bool = default;
};

struct RunnersConfig {
  int count{4};
  std::string workspace_root; // empty = process cwd

  auto operator==(const RunnersConfig &) const -> bool = default;
};

struct IntakeConfig {
  bool enabled{true};
  std::string host{"127.0.0.1"};
  std::uint16_t port{8090};
  std::string definitions_dir{"./pipelines"};
  std::size_t max_body_bytes{1024 * 1024};

  auto operator==(const IntakeConfig &) const -> bool = default;
};

struct StatusConfig {
  bool log_updates{true};
  bool log_output{false};
  std::string json_lines_file;
  std::size_t max_step_output_bytes{1024 * 1024};

  auto operator==(const StatusConfig &) const -> bool = default;
};

struct LogConfig {
  std::string level{"info"};
  std::string file;

  auto operator==(const LogConfig &) const -> bool = default;
};

struct SystemConfig {
  SchedulerConfig scheduler;
  RunnersConfig runners;
  IntakeConfig intake;
  StatusConfig status;
  LogConfig log;

  auto operator==(const SystemConfig &) const -> bool = default;
};

} // namespace ciforge
