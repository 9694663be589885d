#pragma once

#include <optional>
#include <string>
#include <vector>

namespace ciforge::cli {

struct ValidateOptions {
  std::vector<std::string> files; // files or directories of *.toml
  bool json{false};
};

struct RunOptions {
  std::string config_file;
  std::string definition_file;
  std::string repository{"local"};
  std::string branch{"main"};
  std::string commit_sha;
  std::string event{"push"};
  std::optional<std::string> event_file; // JSON event, replaces the flags
  int timeout_sec{0};                    // 0 = wait until the run ends
  bool json{false};
  bool quiet{false}; // do not echo step output
};

struct ServeOptions {
  std::string config_file;
  std::optional<std::string> log_file;
  std::optional<std::string> log_level;
  std::optional<std::string> definitions_dir;
  std::optional<int> port;
  bool no_intake{false};
};

[[nodiscard]] auto cmd_validate(const ValidateOptions &opts) -> int;
[[nodiscard]] auto cmd_run(const RunOptions &opts) -> int;
[[nodiscard]] auto cmd_serve(const ServeOptions &opts) -> int;

} // namespace ciforge::cli
