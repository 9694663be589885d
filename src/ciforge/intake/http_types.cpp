#include "ciforge/intake/http_types.hpp"

#include "ciforge/util/json.hpp"

namespace ciforge::http {

auto HttpResponse::json(std::string body, HttpStatus status) -> HttpResponse {
  return HttpResponse{.status = status,
                      .headers = {{"Content-Type", "application/json"}},
                      .body = std::move(body)};
}

auto HttpResponse::error(HttpStatus status, std::string_view message)
    -> HttpResponse {
  return json(dump_json(JsonValue{{"error", std::string(message)}}), status);
}

} // namespace ciforge::http
