#pragma once

#include "ciforge/core/cancellation.hpp"
#include "ciforge/core/coroutine.hpp"
#include "ciforge/pipeline/pipeline_definition.hpp"
#include "ciforge/status/status.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace ciforge {

inline constexpr int kExitCodeTimeout = 124;
inline constexpr int kExitCodeCancelled = 130;
inline constexpr int kExitCodeNotFound = 127;

struct StepCommand {
  StepType type{StepType::Shell};
  std::string command;
  std::string working_dir;  // empty = inherit
  EnvMap env;               // merged over the process environment
  std::size_t max_output_bytes{1024 * 1024};
};

struct StepProcessResult {
  int exit_code{-1};
  bool timed_out{false};
  bool cancelled{false};
  /// The process never started (fork/exec failure, bad working dir).
  bool spawn_failed{false};
  std::string error;
  std::string output;
  bool output_truncated{false};
  std::chrono::milliseconds duration{0};
};

using OutputHandler =
    std::move_only_function<void(OutputStream stream, std::string_view data)>;

/// Runs one step command to completion in its own process group. The
/// whole group receives SIGKILL when `deadline` passes or `token` fires.
/// `on_output` sees every chunk as it is read from the pipes.
[[nodiscard]] auto run_step_process(StepCommand cmd,
                                    std::chrono::steady_clock::time_point deadline,
                                    CancellationToken token,
                                    OutputHandler on_output)
    -> task<StepProcessResult>;

} // namespace ciforge
