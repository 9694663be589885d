#include "ciforge/util/signals.hpp"

#include <atomic>
#include <csignal>

namespace ciforge {

namespace {
std::atomic<bool> g_shutdown_requested{false};

void signal_handler(int) { request_shutdown(); }
} // namespace

void request_shutdown() noexcept {
  g_shutdown_requested.store(true, std::memory_order_release);
  g_shutdown_requested.notify_all();
}

auto shutdown_requested() noexcept -> bool {
  return g_shutdown_requested.load(std::memory_order_acquire);
}

void setup_signal_handlers() {
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);
  std::signal(SIGPIPE, SIG_IGN);
}

void wait_for_shutdown() {
  g_shutdown_requested.wait(false, std::memory_order_acquire);
}

} // namespace ciforge
