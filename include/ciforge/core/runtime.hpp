#pragma once

#include "ciforge/core/coroutine.hpp"
#include "ciforge/core/error.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/use_future.hpp>

#include <atomic>
#include <exception>
#include <optional>
#include <thread>
#include <utility>
#include <vector>

namespace ciforge {

using Strand = boost::asio::strand<boost::asio::any_io_executor>;

namespace detail {
/// Completion handler for detached coroutines: an escaped exception is
/// logged instead of silently dropped.
auto report_detached_exception(std::exception_ptr ep) noexcept -> void;
} // namespace detail

/// A single io_context driven by a fixed set of worker threads. Components
/// that need serialized state carve a strand out of it.
class Runtime {
public:
  explicit Runtime(unsigned num_threads = 0);
  ~Runtime() noexcept;

  Runtime(const Runtime &) = delete;
  Runtime &operator=(const Runtime &) = delete;

  [[nodiscard]] auto start() -> Result<void>;
  auto stop() noexcept -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool;

  [[nodiscard]] auto thread_count() const noexcept -> unsigned {
    return num_threads_;
  }

  [[nodiscard]] auto context() noexcept -> boost::asio::io_context & {
    return ctx_;
  }

  [[nodiscard]] auto executor() -> boost::asio::any_io_executor {
    return ctx_.get_executor();
  }

  [[nodiscard]] auto make_strand() -> Strand {
    return boost::asio::make_strand(executor());
  }

  /// True when called from one of this runtime's worker threads.
  [[nodiscard]] auto in_runtime_thread() const noexcept -> bool;

  template <typename T> auto spawn(task<T> coro) -> void {
    co_spawn(ctx_.get_executor(), std::move(coro),
             [](std::exception_ptr ep, auto &&...) {
               detail::report_detached_exception(ep);
             });
  }

  template <typename Executor, typename T>
  auto spawn_on(const Executor &ex, task<T> coro) -> void {
    co_spawn(ex, std::move(coro), [](std::exception_ptr ep, auto &&...) {
      detail::report_detached_exception(ep);
    });
  }

  template <typename F> auto post(F &&fn) -> void {
    boost::asio::post(ctx_.get_executor(), std::forward<F>(fn));
  }

private:
  auto run_worker() noexcept -> void;

  unsigned num_threads_;
  boost::asio::io_context ctx_;
  std::optional<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
      work_guard_;
  std::vector<std::jthread> threads_;
  std::atomic<bool> running_{false};
};

/// Runs a coroutine on `ex` and blocks the calling thread for its result.
/// Must not be called from a thread that `ex` needs to make progress.
template <typename Executor, typename T>
auto block_on(const Executor &ex, task<T> coro) -> T {
  return co_spawn(ex, std::move(coro), boost::asio::use_future).get();
}

} // namespace ciforge
