#include "ciforge/intake/webhook_server.hpp"

#include "ciforge/core/asio_awaitable.hpp"
#include "ciforge/core/runtime.hpp"
#include "ciforge/intake/event_intake.hpp"
#include "ciforge/scheduler/scheduler.hpp"
#include "ciforge/status/status_json.hpp"
#include "ciforge/util/json.hpp"
#include "ciforge/util/log.hpp"

#include <boost/asio/cancel_after.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/socket_base.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/url/parse.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <vector>

namespace ciforge::http {

namespace {
constexpr auto kHttpIoTimeout = std::chrono::seconds(30);
constexpr std::uint32_t kParserHeaderLimit = 64 * 1024;
constexpr std::string_view kRunsPrefix = "/runs/";

namespace beast = boost::beast;
namespace beast_http = beast::http;

using BeastRequest = beast_http::request<beast_http::string_body>;
using BeastResponse = beast_http::response<beast_http::string_body>;

auto to_method(beast_http::verb verb) noexcept -> HttpMethod {
  switch (verb) {
  case beast_http::verb::get:
    return HttpMethod::GET;
  case beast_http::verb::post:
    return HttpMethod::POST;
  case beast_http::verb::put:
    return HttpMethod::PUT;
  case beast_http::verb::delete_:
    return HttpMethod::DELETE;
  case beast_http::verb::head:
    return HttpMethod::HEAD;
  default:
    return HttpMethod::OTHER;
  }
}

auto to_request(BeastRequest &msg) -> HttpRequest {
  HttpRequest out;
  out.method = to_method(msg.method());

  std::string target(msg.target());
  if (auto parsed = boost::urls::parse_origin_form(target); parsed) {
    out.path = std::string(parsed->encoded_path());
    if (auto query = parsed->encoded_query(); !query.empty()) {
      out.query_string.assign(query.data(), query.size());
    }
  } else {
    out.path = std::move(target);
  }

  for (const auto &field : msg.base()) {
    out.headers.emplace(field.name_string(), field.value());
  }
  out.body = std::move(msg.body());
  return out;
}

auto to_beast_response(HttpResponse resp, unsigned version, bool keep_alive)
    -> BeastResponse {
  BeastResponse out{static_cast<beast_http::status>(resp.status), version};
  out.keep_alive(keep_alive);
  for (const auto &[k, v] : resp.headers) {
    out.set(k, v);
  }
  out.body() = std::move(resp.body);
  out.prepare_payload();
  return out;
}

auto outcome_json(const intake::IntakeOutcome &outcome) -> JsonValue {
  JsonValue obj{{"pipeline", outcome.pipeline}};
  if (outcome.run_id) {
    obj.get_object().emplace("run_id", outcome.run_id->str());
  } else {
    obj.get_object().emplace("error", outcome.error.message());
  }
  return obj;
}

// Status for a submission none of whose pipelines accepted the event.
auto rejection_status(const std::vector<intake::IntakeOutcome> &outcomes)
    -> HttpStatus {
  auto any = [&](Error e) {
    return std::ranges::any_of(outcomes, [e](const auto &o) {
      return o.error == make_error_code(e);
    });
  };
  if (any(Error::ConcurrencyExceeded)) {
    return HttpStatus::Conflict;
  }
  if (any(Error::ShuttingDown)) {
    return HttpStatus::ServiceUnavailable;
  }
  if (any(Error::NoMatchingPipeline)) {
    return HttpStatus::UnprocessableEntity;
  }
  return HttpStatus::InternalServerError;
}

} // namespace

struct WebhookServer::Impl {
  Runtime &runtime;
  intake::EventIntake &event_intake;
  Scheduler &scheduler;
  WebhookServerOptions options;
  boost::asio::ip::tcp::acceptor acceptor;
  std::atomic<bool> running{false};
  std::atomic<std::uint16_t> bound_port{0};

  Impl(Runtime &rt, intake::EventIntake &in, Scheduler &sched,
       WebhookServerOptions opts)
      : runtime(rt), event_intake(in), scheduler(sched), options(opts),
        acceptor(rt.context()) {}

  auto post_event(const HttpRequest &req) -> task<HttpResponse> {
    if (req.body.size() > options.max_body_bytes) {
      co_return HttpResponse::error(HttpStatus::PayloadTooLarge,
                                    "request body too large");
    }
    auto raw = intake::parse_event_json(req.body);
    if (!raw) {
      co_return HttpResponse::error(HttpStatus::BadRequest,
                                    "malformed event JSON");
    }
    std::string diagnostic;
    auto event = intake::normalize(*raw, &diagnostic);
    if (!event) {
      co_return HttpResponse::error(HttpStatus::BadRequest, diagnostic);
    }

    auto outcomes = co_await event_intake.async_ingest(std::move(*event));
    if (!outcomes) {
      if (outcomes.error() == make_error_code(Error::NoMatchingPipeline)) {
        co_return HttpResponse::error(HttpStatus::UnprocessableEntity,
                                      "no pipeline matches the event");
      }
      co_return HttpResponse::error(HttpStatus::InternalServerError,
                                    outcomes.error().message());
    }

    JsonValue runs = std::vector<JsonValue>{};
    for (const auto &outcome : *outcomes) {
      runs.get_array().push_back(outcome_json(outcome));
    }
    const bool accepted = std::ranges::any_of(
        *outcomes, &intake::IntakeOutcome::accepted);
    const auto status =
        accepted ? HttpStatus::Accepted : rejection_status(*outcomes);
    co_return HttpResponse::json(dump_json(JsonValue{{"runs", runs}}),
                                 status);
  }

  auto list_runs() -> task<HttpResponse> {
    auto summaries = co_await scheduler.async_list_runs();
    JsonValue runs = std::vector<JsonValue>{};
    for (const auto &summary : summaries) {
      runs.get_array().push_back(to_json(summary));
    }
    co_return HttpResponse::json(dump_json(JsonValue{{"runs", runs}}));
  }

  auto get_run(RunId id) -> task<HttpResponse> {
    auto run = co_await scheduler.async_snapshot(std::move(id));
    if (!run) {
      co_return HttpResponse::error(HttpStatus::NotFound, "run not found");
    }
    co_return HttpResponse::json(dump_json(to_json(*run)));
  }

  auto cancel_run(RunId id) -> task<HttpResponse> {
    auto res = co_await scheduler.async_cancel(id);
    if (!res) {
      if (res.error() == make_error_code(Error::NotFound)) {
        co_return HttpResponse::error(HttpStatus::NotFound, "run not found");
      }
      co_return HttpResponse::error(HttpStatus::InternalServerError,
                                    res.error().message());
    }
    co_return HttpResponse::json(
        dump_json(JsonValue{{"run_id", id.str()}, {"cancel_requested", true}}),
        HttpStatus::Accepted);
  }

  auto handle(HttpRequest req) -> task<HttpResponse> {
    const std::string_view path = req.path;
    if (path == "/health") {
      if (req.method != HttpMethod::GET) {
        co_return HttpResponse::error(HttpStatus::MethodNotAllowed,
                                      "method not allowed");
      }
      co_return HttpResponse::json(
          dump_json(JsonValue{{"status", "healthy"}}));
    }
    if (path == "/events") {
      if (req.method != HttpMethod::POST) {
        co_return HttpResponse::error(HttpStatus::MethodNotAllowed,
                                      "method not allowed");
      }
      co_return co_await post_event(req);
    }
    if (path == "/runs") {
      if (req.method != HttpMethod::GET) {
        co_return HttpResponse::error(HttpStatus::MethodNotAllowed,
                                      "method not allowed");
      }
      co_return co_await list_runs();
    }
    if (path.starts_with(kRunsPrefix)) {
      auto id = path.substr(kRunsPrefix.size());
      if (id.empty() || id.contains('/')) {
        co_return HttpResponse::error(HttpStatus::NotFound, "not found");
      }
      switch (req.method) {
      case HttpMethod::GET:
        co_return co_await get_run(RunId{id});
      case HttpMethod::DELETE:
        co_return co_await cancel_run(RunId{id});
      default:
        co_return HttpResponse::error(HttpStatus::MethodNotAllowed,
                                      "method not allowed");
      }
    }
    co_return HttpResponse::error(HttpStatus::NotFound, "not found");
  }

  // `self` keeps the Impl alive for as long as the connection is open.
  auto handle_connection([[maybe_unused]] std::shared_ptr<Impl> self,
                         boost::asio::ip::tcp::socket socket) -> spawn_task {
    beast::flat_buffer buffer;
    try {
      while (running.load(std::memory_order_acquire)) {
        beast_http::request_parser<beast_http::string_body> parser;
        parser.header_limit(kParserHeaderLimit);
        parser.body_limit(options.max_body_bytes);

        auto [read_ec, read_n] = co_await beast_http::async_read(
            socket, buffer, parser,
            boost::asio::cancel_after(kHttpIoTimeout, use_nothrow));
        (void)read_n;
        if (read_ec == beast_http::error::body_limit) {
          auto resp = to_beast_response(
              HttpResponse::error(HttpStatus::PayloadTooLarge,
                                  "request body too large"),
              11, false);
          auto [write_ec, written] = co_await beast_http::async_write(
              socket, resp,
              boost::asio::cancel_after(kHttpIoTimeout, use_nothrow));
          (void)write_ec;
          (void)written;
          break;
        }
        if (read_ec) {
          if (read_ec != boost::asio::error::eof &&
              read_ec != beast::error::timeout &&
              read_ec != beast_http::error::end_of_stream) {
            log::warn("HTTP read failed: {}", read_ec.message());
          }
          break;
        }

        auto beast_req = parser.release();
        const auto version = beast_req.version();
        const bool keep_alive = beast_req.keep_alive();
        auto req = to_request(beast_req);
        log::debug("HTTP request: {} {}", req.method, req.path);

        auto resp = co_await handle(std::move(req));
        log::debug("HTTP response: {}", resp.status);
        auto beast_resp = to_beast_response(std::move(resp), version,
                                            keep_alive);
        auto [write_ec, written] = co_await beast_http::async_write(
            socket, beast_resp,
            boost::asio::cancel_after(kHttpIoTimeout, use_nothrow));
        (void)written;
        if (write_ec) {
          log::warn("HTTP write failed: {}", write_ec.message());
          break;
        }
        if (!keep_alive) {
          break;
        }
      }
    } catch (const std::exception &e) {
      log::error("Exception in connection handler: {}", e.what());
    }

    boost::system::error_code ec;
    socket.shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
  }

  auto accept_loop(std::shared_ptr<Impl> self) -> spawn_task {
    while (running.load(std::memory_order_acquire)) {
      boost::asio::ip::tcp::socket socket(runtime.context());
      auto [accept_ec] = co_await acceptor.async_accept(socket, use_nothrow);
      if (accept_ec) {
        if (running && accept_ec != boost::asio::error::operation_aborted) {
          log::error("Accept failed: {}", accept_ec.message());
        }
        break;
      }
      boost::system::error_code nodelay_ec;
      socket.set_option(boost::asio::ip::tcp::no_delay(true), nodelay_ec);
      runtime.spawn(handle_connection(self, std::move(socket)));
    }
  }
};

WebhookServer::WebhookServer(Runtime &runtime, intake::EventIntake &events,
                             Scheduler &scheduler,
                             WebhookServerOptions options)
    : impl_(std::make_shared<Impl>(runtime, events, scheduler, options)) {}

WebhookServer::~WebhookServer() { stop(); }

auto WebhookServer::start(std::string_view host, std::uint16_t port)
    -> Result<void> {
  if (impl_->running.load()) {
    return fail(Error::InvalidState);
  }

  boost::system::error_code ec;
  boost::asio::ip::address bind_address;
  if (host.empty() || host == "0.0.0.0") {
    bind_address = boost::asio::ip::address_v4::any();
  } else {
    bind_address = boost::asio::ip::make_address(std::string(host), ec);
  }
  if (ec) {
    log::error("Invalid host address '{}': {}", host, ec.message());
    return fail(Error::InvalidArgument);
  }

  auto &acceptor = impl_->acceptor;
  const boost::asio::ip::tcp::endpoint endpoint{bind_address, port};
  acceptor.open(endpoint.protocol(), ec);
  if (ec) {
    log::error("Failed to open acceptor: {}", ec.message());
    return fail(Error::InfrastructureError);
  }
  acceptor.set_option(boost::asio::socket_base::reuse_address(true), ec);
  if (ec) {
    log::warn("Failed to set SO_REUSEADDR: {}", ec.message());
    ec.clear();
  }
  acceptor.bind(endpoint, ec);
  if (!ec) {
    acceptor.listen(boost::asio::socket_base::max_listen_connections, ec);
  }
  if (ec) {
    log::error("Failed to listen on {}:{}: {}", host, port, ec.message());
    boost::system::error_code close_ec;
    acceptor.close(close_ec);
    return fail(Error::InfrastructureError);
  }

  impl_->bound_port = acceptor.local_endpoint(ec).port();
  impl_->running = true;
  log::info("Webhook server listening on {}:{}", host, impl_->bound_port.load());
  impl_->runtime.spawn(impl_->accept_loop(impl_));
  return ok();
}

auto WebhookServer::stop() -> void {
  if (!impl_->running.exchange(false)) {
    return;
  }
  log::info("Stopping webhook server...");
  boost::asio::post(impl_->acceptor.get_executor(), [impl = impl_] {
    boost::system::error_code ec;
    impl->acceptor.cancel(ec);
    impl->acceptor.close(ec);
  });
}

auto WebhookServer::is_running() const -> bool {
  return impl_->running.load();
}

auto WebhookServer::port() const -> std::uint16_t {
  return impl_->bound_port.load();
}

auto WebhookServer::handle(HttpRequest request) -> task<HttpResponse> {
  co_return co_await impl_->handle(std::move(request));
}

} // namespace ciforge::http
