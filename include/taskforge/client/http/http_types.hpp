#pragma once

#include "taskforge/core/error.hpp"
#include "taskforge/util/string_hash.hpp"

#include <cstdint>
#include <format>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace taskforge::http {

// Only GET and POST endpoints exist on either side of the coordinator. Other
// verbs are kept distinct so the router answers them with 404.
enum class HttpMethod : std::uint8_t { GET, POST, Other };

[[nodiscard]] constexpr auto to_string_view(HttpMethod method) noexcept
    -> std::string_view {
  switch (method) {
  case HttpMethod::GET:
    return "GET";
  case HttpMethod::POST:
    return "POST";
  case HttpMethod::Other:
    break;
  }
  return "OTHER";
}

// Codes the API layer emits. Executor replies can hold any value.
enum class HttpStatus : std::uint16_t {
  Ok = 200,
  BadRequest = 400,
  Unauthorized = 401,
  NotFound = 404,
  Conflict = 409,
  InternalServerError = 500,
  ServiceUnavailable = 503
};

using HttpHeaders = std::unordered_map<std::string, std::string, StringHash,
                                       StringEqual>;

using Body = std::vector<uint8_t>;

[[nodiscard]] inline auto body_view(const Body &body) noexcept
    -> std::string_view {
  return {reinterpret_cast<const char *>(body.data()), body.size()};
}

/// Decoded `?a=1&b=2` pairs. A malformed query string yields no parameters.
class QueryParams {
public:
  explicit QueryParams(std::string_view query_string);

  [[nodiscard]] auto get(std::string_view key) const -> Result<std::string>;

private:
  HttpHeaders params_;
};

struct HttpRequest {
  HttpMethod method{HttpMethod::GET};
  std::string path;
  std::string query_string;
  int version_major{1};
  int version_minor{1};
  HttpHeaders headers;
  Body body;
  // {task_id}-style captures, filled when a pattern route matches.
  mutable HttpHeaders path_params;

  /// Case-insensitive field lookup.
  [[nodiscard]] auto header(std::string_view key) const -> Result<std::string>;
  [[nodiscard]] auto is_websocket_upgrade() const -> bool;
  [[nodiscard]] auto path_param(std::string_view key) const
      -> Result<std::string>;
  [[nodiscard]] auto body_as_string() const -> std::string_view {
    return body_view(body);
  }
};

struct HttpResponse {
  HttpStatus status{HttpStatus::Ok};
  HttpHeaders headers;
  Body body;

  [[nodiscard]] static auto json(std::string text,
                                 HttpStatus status = HttpStatus::Ok)
      -> HttpResponse;
  [[nodiscard]] static auto empty(HttpStatus status) -> HttpResponse;

  [[nodiscard]] auto body_as_string() const -> std::string_view {
    return body_view(body);
  }
  [[nodiscard]] auto is_success() const -> bool {
    const auto code = static_cast<std::uint16_t>(status);
    return code >= 200 && code < 300;
  }
};

} // namespace taskforge::http

template <>
struct std::formatter<taskforge::http::HttpMethod>
    : std::formatter<std::string_view> {
  auto format(taskforge::http::HttpMethod method, auto &ctx) const {
    return std::formatter<std::string_view>::format(to_string_view(method),
                                                    ctx);
  }
};

template <>
struct std::formatter<taskforge::http::HttpStatus>
    : std::formatter<std::uint16_t> {
  auto format(taskforge::http::HttpStatus status, auto &ctx) const {
    return std::formatter<std::uint16_t>::format(
        static_cast<std::uint16_t>(status), ctx);
  }
};
