#include "ciforge/scheduler/runner_pool.hpp"

#include "ciforge/core/asio_awaitable.hpp"
#include "ciforge/util/log.hpp"

#include <algorithm>
#include <system_error>

namespace ciforge {

RunnerLease::~RunnerLease() { release(); }

RunnerLease::RunnerLease(RunnerLease &&other) noexcept
    : pool_(std::exchange(other.pool_, nullptr)), id_(std::move(other.id_)),
      workspace_(std::move(other.workspace_)) {}

auto RunnerLease::operator=(RunnerLease &&other) noexcept -> RunnerLease & {
  if (this != &other) {
    release();
    pool_ = std::exchange(other.pool_, nullptr);
    id_ = std::move(other.id_);
    workspace_ = std::move(other.workspace_);
  }
  return *this;
}

auto RunnerLease::release() noexcept -> void {
  if (auto *pool = std::exchange(pool_, nullptr); pool) {
    pool->release(id_);
  }
}

RunnerPool::RunnerPool(boost::asio::any_io_executor executor,
                       RunnerPoolOptions options)
    : executor_(std::move(executor)), options_(std::move(options)),
      capacity_(static_cast<std::size_t>(std::max(1, options_.runner_count))) {
  for (std::size_t i = 0; i < capacity_; ++i) {
    auto id = make_runner_id(i);
    if (!options_.workspace_root.empty()) {
      std::error_code ec;
      std::filesystem::create_directories(options_.workspace_root / id.str(),
                                          ec);
      if (ec) {
        log::warn("Cannot create workspace for {}: {}", id, ec.message());
      }
    }
    free_.push_back(std::move(id));
  }
}

RunnerPool::~RunnerPool() {
  for (const auto &waiter : waiters_) {
    waiter->cancelled = true;
    waiter->timer.cancel();
  }
}

auto RunnerPool::make_lease(RunnerId id) -> RunnerLease {
  std::filesystem::path workspace;
  if (!options_.workspace_root.empty()) {
    workspace = options_.workspace_root / id.str();
  }
  return RunnerLease{this, std::move(id), std::move(workspace)};
}

auto RunnerPool::acquire(CancellationToken token,
                         std::chrono::milliseconds timeout)
    -> task<Result<RunnerLease>> {
  if (token.is_cancelled()) {
    co_return fail(Error::Cancelled);
  }
  // Queued waiters go first even if a runner is momentarily free.
  if (!free_.empty() && waiters_.empty()) {
    auto id = std::move(free_.front());
    free_.pop_front();
    co_return ok(make_lease(std::move(id)));
  }

  auto waiter = std::make_shared<Waiter>(executor_);
  waiter->timer.expires_after(timeout);
  waiters_.push_back(waiter);
  log::debug("Waiting for a runner ({} waiting, {} free)", waiters_.size(),
             free_.size());

  auto registration = token.on_cancel([weak = std::weak_ptr<Waiter>(waiter)] {
    if (auto w = weak.lock()) {
      w->cancelled = true;
      w->timer.cancel();
    }
  });

  (void)co_await waiter->timer.async_wait(use_nothrow);
  registration.reset();

  if (waiter->granted) {
    co_return ok(make_lease(std::move(*waiter->granted)));
  }
  std::erase(waiters_, waiter);
  if (waiter->cancelled) {
    co_return fail(Error::Cancelled);
  }
  co_return fail(Error::Timeout);
}

auto RunnerPool::release(const RunnerId &id) noexcept -> void {
  // Skip waiters whose wait already ended; they will leave the queue when
  // their coroutine resumes.
  while (!waiters_.empty()) {
    auto waiter = std::move(waiters_.front());
    waiters_.pop_front();
    if (waiter->cancelled) {
      continue;
    }
    waiter->granted = id;
    waiter->timer.cancel();
    return;
  }
  free_.push_back(id);
}

} // namespace ciforge
