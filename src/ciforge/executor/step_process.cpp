#include "ciforge/executor/step_process.hpp"

#include "ciforge/core/asio_awaitable.hpp"
#include "ciforge/executor/executor_utils.hpp"
#include "ciforge/util/log.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/readable_pipe.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/process/v2/environment.hpp>
#include <boost/process/v2/process.hpp>
#include <boost/process/v2/start_dir.hpp>
#include <boost/process/v2/stdio.hpp>

#include <array>
#include <cerrno>
#include <csignal>
#include <filesystem>
#include <format>
#include <memory>
#include <optional>
#include <signal.h>
#include <string>
#include <unistd.h>
#include <utility>
#include <vector>

namespace ciforge {

namespace {

namespace bp = boost::process::v2;

inline constexpr std::size_t kReadBufferSize = 4096;
inline constexpr std::size_t kInitialOutputReserve = 8192;
// How long pipes may stay open after the process itself exited (a
// backgrounded grandchild can hold them).
inline constexpr std::chrono::milliseconds kPipeDrainGrace{2000};

[[nodiscard]] auto build_process_env(const EnvMap &custom)
    -> bp::process_environment {
  std::vector<bp::environment::key_value_pair> env_vec;
  env_vec.reserve(64);

  for (const auto &entry : bp::environment::current()) {
    auto key_sv = entry.key();
    if (custom.contains(std::string_view(key_sv.data(), key_sv.size()))) {
      continue;
    }
    env_vec.emplace_back(entry);
  }
  for (const auto &[k, v] : custom) {
    env_vec.emplace_back(bp::environment::key{k}, bp::environment::value{v});
  }
  return bp::process_environment(std::move(env_vec));
}

/// Launcher initializer: the child leads a new process group so a kill
/// reaches everything the step spawned.
struct new_process_group {
  template <typename Launcher, typename Path>
  auto on_exec_setup(Launcher &, const Path &, const char *const *&)
      -> bp::error_code {
    if (::setpgid(0, 0) != 0) {
      return bp::error_code(errno, boost::system::system_category());
    }
    return {};
  }
};

struct ProcessState {
  pid_t pid{-1};
  bool exited{false};
  bool timed_out{false};
  bool cancelled{false};
  int open_pipes{2};
  boost::asio::steady_timer *drain_timer{nullptr};

  auto kill_group() const noexcept -> void {
    if (pid <= 0 || exited) {
      return;
    }
    (void)::kill(-pid, SIGKILL);
    (void)::kill(pid, SIGKILL);
  }
};

struct OutputCollector {
  StepProcessResult *result;
  OutputHandler *on_output;
  std::size_t max_bytes;

  auto append(OutputStream stream, std::string_view data) -> void {
    if (*on_output) {
      (*on_output)(stream, data);
    }
    auto &out = result->output;
    if (out.size() >= max_bytes) {
      result->output_truncated = true;
      return;
    }
    const auto room = max_bytes - out.size();
    if (data.size() > room) {
      result->output_truncated = true;
      data = data.substr(0, room);
    }
    out.append(data);
  }
};

[[nodiscard]] auto read_pipe(boost::asio::readable_pipe &pipe,
                             OutputStream stream, OutputCollector &collector,
                             std::shared_ptr<ProcessState> state)
    -> task<void> {
  std::array<char, kReadBufferSize> buffer{};
  for (;;) {
    auto [ec, bytes] = co_await pipe.async_read_some(
        boost::asio::buffer(buffer.data(), buffer.size()), use_nothrow);
    if (bytes > 0) {
      collector.append(stream, std::string_view(buffer.data(), bytes));
    }
    if (ec) {
      break;
    }
  }
  if (--state->open_pipes == 0 && state->drain_timer) {
    state->drain_timer->cancel();
  }
}

[[nodiscard]] auto wait_process(bp::process &proc,
                                boost::asio::readable_pipe &stdout_pipe,
                                boost::asio::readable_pipe &stderr_pipe,
                                boost::asio::steady_timer &deadline_timer,
                                std::shared_ptr<ProcessState> state)
    -> task<std::optional<int>> {
  auto [ec, exit_code] = co_await proc.async_wait(use_nothrow);
  state->exited = true;
  deadline_timer.cancel();

  if (state->open_pipes > 0) {
    boost::asio::steady_timer drain_timer(co_await boost::asio::this_coro::executor,
                                          kPipeDrainGrace);
    state->drain_timer = &drain_timer;
    (void)co_await drain_timer.async_wait(use_nothrow);
    state->drain_timer = nullptr;
    if (state->open_pipes > 0) {
      log::warn("pid {} exited but its output pipes stayed open; closing",
                state->pid);
      boost::system::error_code ignored;
      stdout_pipe.close(ignored);
      stderr_pipe.close(ignored);
    }
  }

  if (ec) {
    log::error("Waiting for pid {} failed: {}", state->pid, ec.message());
    co_return std::nullopt;
  }
  co_return exit_code;
}

struct Invocation {
  std::string executable;
  std::vector<std::string> args;
};

[[nodiscard]] auto resolve_invocation(const StepCommand &cmd)
    -> Result<Invocation> {
  if (cmd.type == StepType::Shell) {
    return ok(Invocation{.executable = "/bin/sh", .args = {"-c", cmd.command}});
  }
  auto argv = split_command_line(cmd.command);
  if (!argv) {
    return fail(argv.error());
  }
  Invocation inv;
  const auto &program = argv->front();
  if (program.find('/') != std::string::npos) {
    inv.executable = program;
  } else {
    inv.executable = bp::environment::find_executable(program).string();
  }
  if (inv.executable.empty()) {
    return fail(Error::NotFound);
  }
  inv.args.assign(std::next(argv->begin()), argv->end());
  return ok(std::move(inv));
}

} // namespace

auto run_step_process(StepCommand cmd,
                      std::chrono::steady_clock::time_point deadline,
                      CancellationToken token, OutputHandler on_output)
    -> task<StepProcessResult> {
  const auto started = std::chrono::steady_clock::now();
  StepProcessResult result;
  result.output.reserve(kInitialOutputReserve);
  auto finish = [&]() -> StepProcessResult {
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    return std::move(result);
  };

  if (token.is_cancelled()) {
    result.cancelled = true;
    result.exit_code = kExitCodeCancelled;
    co_return finish();
  }
  if (started >= deadline) {
    result.timed_out = true;
    result.exit_code = kExitCodeTimeout;
    co_return finish();
  }

  auto invocation = resolve_invocation(cmd);
  if (!invocation) {
    result.exit_code = kExitCodeNotFound;
    result.error =
        invocation.error() == make_error_code(Error::NotFound)
            ? std::format("executable not found: {}", cmd_preview(cmd.command))
            : std::format("cannot split command: {}", cmd_preview(cmd.command));
    co_return finish();
  }
  if (!cmd.working_dir.empty()) {
    std::error_code fs_ec;
    if (!std::filesystem::is_directory(cmd.working_dir, fs_ec)) {
      result.exit_code = 1;
      result.error =
          std::format("working directory does not exist: {}", cmd.working_dir);
      co_return finish();
    }
  }

  auto ex = co_await boost::asio::this_coro::executor;
  boost::asio::readable_pipe stdout_pipe(ex);
  boost::asio::readable_pipe stderr_pipe(ex);

  std::optional<bp::process> proc;
  try {
    auto stdio =
        bp::process_stdio{.in = nullptr, .out = stdout_pipe, .err = stderr_pipe};
    auto env = build_process_env(cmd.env);
    if (cmd.working_dir.empty()) {
      proc.emplace(ex, invocation->executable, invocation->args,
                   std::move(stdio), std::move(env), new_process_group{});
    } else {
      proc.emplace(ex, invocation->executable, invocation->args,
                   std::move(stdio), bp::process_start_dir{cmd.working_dir},
                   std::move(env), new_process_group{});
    }
  } catch (const std::exception &e) {
    log::error("Failed to spawn '{}': {}", cmd_preview(cmd.command), e.what());
    result.spawn_failed = true;
    result.exit_code = -1;
    result.error = e.what();
    co_return finish();
  }

  auto state = std::make_shared<ProcessState>();
  state->pid = proc->id();
  log::debug("step process started pid={} cmd='{}'", state->pid,
             cmd_preview(cmd.command));

  boost::asio::steady_timer deadline_timer(ex, deadline);
  deadline_timer.async_wait([state](const boost::system::error_code &ec) {
    if (!ec && !state->exited) {
      state->timed_out = true;
      state->kill_group();
    }
  });
  auto registration = token.on_cancel([state] {
    state->cancelled = true;
    state->kill_group();
  });

  OutputCollector collector{.result = &result,
                            .on_output = &on_output,
                            .max_bytes = cmd.max_output_bytes};
  using namespace awaitable_ops;
  auto exit_code = co_await (
      read_pipe(stdout_pipe, OutputStream::Stdout, collector, state) &&
      read_pipe(stderr_pipe, OutputStream::Stderr, collector, state) &&
      wait_process(*proc, stdout_pipe, stderr_pipe, deadline_timer, state));
  registration.reset();

  if (state->timed_out) {
    result.timed_out = true;
    result.exit_code = kExitCodeTimeout;
    result.error = "killed after job timeout";
  } else if (state->cancelled) {
    result.cancelled = true;
    result.exit_code = kExitCodeCancelled;
    result.error = "killed on cancellation";
  } else if (exit_code) {
    result.exit_code = *exit_code;
  } else {
    result.spawn_failed = true;
    result.exit_code = -1;
    result.error = "lost track of the step process";
  }

  log::debug("step process finished pid={} exit_code={} timed_out={} "
             "cancelled={}",
             state->pid, result.exit_code, result.timed_out, result.cancelled);
  co_return finish();
}

} // namespace ciforge
