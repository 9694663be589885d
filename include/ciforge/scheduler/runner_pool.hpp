#pragma once

#include "ciforge/core/cancellation.hpp"
#include "ciforge/core/coroutine.hpp"
#include "ciforge/core/error.hpp"
#include "ciforge/util/id.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <deque>
#include <filesystem>
#include <list>
#include <memory>
#include <optional>

namespace ciforge {

class RunnerPool;

/// Exclusive use of one runner; released back to the pool on destruction.
class RunnerLease {
public:
  RunnerLease() = default;
  RunnerLease(RunnerPool *pool, RunnerId id, std::filesystem::path workspace)
      : pool_(pool), id_(std::move(id)), workspace_(std::move(workspace)) {}
  ~RunnerLease();

  RunnerLease(RunnerLease &&other) noexcept;
  auto operator=(RunnerLease &&other) noexcept -> RunnerLease &;
  RunnerLease(const RunnerLease &) = delete;
  auto operator=(const RunnerLease &) -> RunnerLease & = delete;

  [[nodiscard]] auto id() const noexcept -> const RunnerId & { return id_; }
  /// Working directory for steps that do not set one; empty means the
  /// process cwd.
  [[nodiscard]] auto workspace() const noexcept
      -> const std::filesystem::path & {
    return workspace_;
  }
  [[nodiscard]] auto valid() const noexcept -> bool { return pool_ != nullptr; }

  auto release() noexcept -> void;

private:
  RunnerPool *pool_{nullptr};
  RunnerId id_;
  std::filesystem::path workspace_;
};

struct RunnerPoolOptions {
  int runner_count{4};
  std::filesystem::path workspace_root; // empty = process cwd
};

/// Bounded set of runners handed out first-come first-served. All members
/// must be used from the executor passed at construction (the scheduler
/// strand); leases must not outlive the pool.
class RunnerPool {
public:
  RunnerPool(boost::asio::any_io_executor executor, RunnerPoolOptions options);
  ~RunnerPool();

  RunnerPool(const RunnerPool &) = delete;
  auto operator=(const RunnerPool &) -> RunnerPool & = delete;

  /// Waits up to `timeout` for a free runner. Fails with Timeout when none
  /// frees up in time and with Cancelled when `token` fires first.
  [[nodiscard]] auto acquire(CancellationToken token,
                             std::chrono::milliseconds timeout)
      -> task<Result<RunnerLease>>;

  [[nodiscard]] auto capacity() const noexcept -> std::size_t {
    return capacity_;
  }
  [[nodiscard]] auto available() const noexcept -> std::size_t {
    return free_.size();
  }
  [[nodiscard]] auto waiting() const noexcept -> std::size_t {
    return waiters_.size();
  }

private:
  friend class RunnerLease;

  struct Waiter {
    explicit Waiter(const boost::asio::any_io_executor &ex) : timer(ex) {}
    boost::asio::steady_timer timer;
    std::optional<RunnerId> granted;
    bool cancelled{false};
  };

  auto release(const RunnerId &id) noexcept -> void;
  [[nodiscard]] auto make_lease(RunnerId id) -> RunnerLease;

  boost::asio::any_io_executor executor_;
  RunnerPoolOptions options_;
  std::size_t capacity_;
  std::deque<RunnerId> free_;
  std::list<std::shared_ptr<Waiter>> waiters_;
};

} // namespace ciforge
