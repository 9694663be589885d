#pragma once

namespace ciforge {

/// Routes SIGINT and SIGTERM to request_shutdown() and ignores SIGPIPE.
void setup_signal_handlers();
/// Blocks until a shutdown has been requested.
void wait_for_shutdown();
void request_shutdown() noexcept;
[[nodiscard]] auto shutdown_requested() noexcept -> bool;

} // namespace ciforge
