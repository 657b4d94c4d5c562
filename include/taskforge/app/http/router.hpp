#pragma once

#include "taskforge/client/http/http_types.hpp"
#include "taskforge/core/coroutine.hpp"

#include <functional>
#include <memory>
#include <string>

namespace taskforge::http {

using RouteHandler =
    std::move_only_function<taskforge::task<HttpResponse>(HttpRequest)>;

// Exact-path routes are looked up by hash; patterns with `{name}` segments
// are matched segment by segment and bind their values into
// HttpRequest::path_params.
class Router {
public:
  Router();
  ~Router();

  Router(const Router &) = delete;
  auto operator=(const Router &) -> Router & = delete;

  auto add_route(HttpMethod method, std::string path, RouteHandler handler)
      -> void;

  auto get(std::string path, RouteHandler handler) -> void;
  auto post(std::string path, RouteHandler handler) -> void;

  [[nodiscard]] auto route(HttpRequest req) -> taskforge::task<HttpResponse>;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace taskforge::http
