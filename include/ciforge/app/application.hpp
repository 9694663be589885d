#pragma once

#include "ciforge/config/system_config.hpp"
#include "ciforge/core/error.hpp"
#include "ciforge/status/status_reporter.hpp"

#include <cstdint>
#include <memory>

namespace ciforge {

class DefinitionStore;
class Runtime;
class Scheduler;
namespace intake {
class EventIntake;
}
namespace http {
class WebhookServer;
}

// Application facade - wires runtime, definitions, scheduler, intake and
// status sinks together from one SystemConfig.
class Application {
public:
  explicit Application(SystemConfig config);
  ~Application();

  Application(const Application &) = delete;
  auto operator=(const Application &) -> Application & = delete;

  [[nodiscard]] auto config() const noexcept -> const SystemConfig & {
    return config_;
  }

  /// Applies logging settings, opens status sinks, loads the definitions
  /// directory (when configured) and starts the runtime and scheduler.
  [[nodiscard]] auto init() -> Result<void>;
  /// Starts the webhook server when intake is enabled.
  [[nodiscard]] auto start() -> Result<void>;
  /// Stops intake, cancels active runs and joins the runtime.
  auto stop() noexcept -> void;

  /// Sinks added here must be added before init().
  [[nodiscard]] auto reporter() noexcept -> StatusReporter & {
    return reporter_;
  }
  [[nodiscard]] auto store() noexcept -> DefinitionStore & { return *store_; }
  [[nodiscard]] auto scheduler() -> Scheduler &;
  [[nodiscard]] auto event_intake() -> intake::EventIntake &;
  [[nodiscard]] auto webhook_port() const -> std::uint16_t;

private:
  SystemConfig config_;
  StatusReporter reporter_;
  std::unique_ptr<DefinitionStore> store_;
  std::unique_ptr<Runtime> runtime_;
  std::unique_ptr<Scheduler> scheduler_;
  std::unique_ptr<intake::EventIntake> intake_;
  std::unique_ptr<http::WebhookServer> webhook_;
  bool stopped_{false};
};

} // namespace ciforge
