#pragma once

#include <cstdint>
#include <format>
#include <map>
#include <string>
#include <string_view>

namespace ciforge::http {

enum class HttpMethod : std::uint8_t { GET, POST, PUT, DELETE, HEAD, OTHER };

[[nodiscard]] constexpr auto to_string_view(HttpMethod method) noexcept
    -> std::string_view {
  switch (method) {
  case HttpMethod::GET:
    return "GET";
  case HttpMethod::POST:
    return "POST";
  case HttpMethod::PUT:
    return "PUT";
  case HttpMethod::DELETE:
    return "DELETE";
  case HttpMethod::HEAD:
    return "HEAD";
  case HttpMethod::OTHER:
    break;
  }
  return "OTHER";
}

// Only the codes the webhook endpoints answer with.
enum class HttpStatus : std::uint16_t {
  Ok = 200,
  Accepted = 202,
  BadRequest = 400,
  NotFound = 404,
  MethodNotAllowed = 405,
  Conflict = 409,
  PayloadTooLarge = 413,
  UnprocessableEntity = 422,
  InternalServerError = 500,
  ServiceUnavailable = 503
};

using HttpHeaders = std::map<std::string, std::string, std::less<>>;

/// Transport-independent request; the server fills it from Beast messages
/// and tests build it directly.
struct HttpRequest {
  HttpMethod method{HttpMethod::GET};
  std::string path;
  std::string query_string;
  HttpHeaders headers;
  std::string body;
};

struct HttpResponse {
  HttpStatus status{HttpStatus::Ok};
  HttpHeaders headers;
  std::string body;

  /// JSON body with `Content-Type: application/json`.
  [[nodiscard]] static auto json(std::string body,
                                 HttpStatus status = HttpStatus::Ok)
      -> HttpResponse;
  /// `{"error": message}`.
  [[nodiscard]] static auto error(HttpStatus status, std::string_view message)
      -> HttpResponse;
};

} // namespace ciforge::http

template <>
struct std::formatter<ciforge::http::HttpMethod>
    : std::formatter<std::string_view> {
  auto format(ciforge::http::HttpMethod method, auto &ctx) const {
    return std::formatter<std::string_view>::format(
        ciforge::http::to_string_view(method), ctx);
  }
};

template <>
struct std::formatter<ciforge::http::HttpStatus>
    : std::formatter<std::uint16_t> {
  auto format(ciforge::http::HttpStatus status, auto &ctx) const {
    return std::formatter<std::uint16_t>::format(
        static_cast<std::uint16_t>(status), ctx);
  }
};
