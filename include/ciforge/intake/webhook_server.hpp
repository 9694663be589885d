#pragma once

#include "ciforge/core/coroutine.hpp"
#include "ciforge/core/error.hpp"
#include "ciforge/intake/http_types.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string_view>

namespace ciforge {
class Runtime;
class Scheduler;
namespace intake {
class EventIntake;
}
} // namespace ciforge

namespace ciforge::http {

struct WebhookServerOptions {
  std::size_t max_body_bytes{1024 * 1024};
};

/// HTTP ingress for trigger events and run queries.
///
///   POST   /events      202 with run ids; 400 malformed; 409 concurrency
///                       exceeded; 422 no pipeline matched
///   GET    /runs        run summaries
///   GET    /runs/<id>   full run document
///   DELETE /runs/<id>   request cancellation
///   GET    /health
class WebhookServer {
public:
  WebhookServer(Runtime &runtime, intake::EventIntake &events,
                Scheduler &scheduler, WebhookServerOptions options = {});
  ~WebhookServer();

  WebhookServer(const WebhookServer &) = delete;
  auto operator=(const WebhookServer &) -> WebhookServer & = delete;

  /// Binds and starts accepting. Port 0 picks a free port; see port().
  [[nodiscard]] auto start(std::string_view host, std::uint16_t port)
      -> Result<void>;
  auto stop() -> void;

  [[nodiscard]] auto is_running() const -> bool;
  [[nodiscard]] auto port() const -> std::uint16_t;

  /// Routes one request. Used by the connection loop and directly by tests.
  [[nodiscard]] auto handle(HttpRequest request) -> task<HttpResponse>;

private:
  struct Impl;
  std::shared_ptr<Impl> impl_;
};

} // namespace ciforge::http
