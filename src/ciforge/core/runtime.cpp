#include "ciforge/core/runtime.hpp"

#include "ciforge/util/log.hpp"

#include <algorithm>
#include <exception>
#include <thread>

namespace ciforge {

namespace {
thread_local const Runtime *t_current_runtime = nullptr;
} // namespace

namespace detail {
auto report_detached_exception(std::exception_ptr ep) noexcept -> void {
  if (!ep) {
    return;
  }
  try {
    std::rethrow_exception(ep);
  } catch (const std::exception &e) {
    log::error("Detached coroutine terminated with exception: {}", e.what());
  } catch (...) {
    log::error("Detached coroutine terminated with a non-standard exception");
  }
}
} // namespace detail

Runtime::Runtime(unsigned num_threads)
    : num_threads_(num_threads == 0
                       ? std::max(2U, std::thread::hardware_concurrency())
                       : num_threads),
      ctx_(static_cast<int>(num_threads_)) {}

Runtime::~Runtime() noexcept { stop(); }

auto Runtime::start() -> Result<void> {
  if (running_.exchange(true))
    return ok();

  log::debug("Starting runtime with {} threads", num_threads_);
  ctx_.restart();
  work_guard_.emplace(boost::asio::make_work_guard(ctx_));
  threads_.reserve(num_threads_);
  for (unsigned i = 0; i < num_threads_; ++i) {
    threads_.emplace_back([this] { run_worker(); });
  }
  return ok();
}

auto Runtime::stop() noexcept -> void {
  if (!running_.exchange(false))
    return;

  work_guard_.reset();
  ctx_.stop();
  // std::jthread joins on destruction
  threads_.clear();
  log::debug("Runtime stopped");
}

auto Runtime::is_running() const noexcept -> bool {
  return running_.load(std::memory_order_acquire);
}

auto Runtime::in_runtime_thread() const noexcept -> bool {
  return t_current_runtime == this;
}

auto Runtime::run_worker() noexcept -> void {
  t_current_runtime = this;
  for (;;) {
    try {
      ctx_.run();
      break;
    } catch (const std::exception &e) {
      log::error("Runtime worker caught exception: {}", e.what());
    }
  }
  t_current_runtime = nullptr;
}

} // namespace ciforge
