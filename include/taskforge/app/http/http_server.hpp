#pragma once

#include "taskforge/app/http/websocket.hpp"
#include "taskforge/client/http/http_types.hpp"
#include "taskforge/core/coroutine.hpp"
#include "taskforge/core/error.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string_view>

namespace taskforge {
class Runtime;
}

namespace taskforge::http {

class Router;

using WebSocketHandler = std::move_only_function<spawn_task(
    std::shared_ptr<IWebSocketConnection> connection, HttpRequest upgrade)>;

class HttpServer {
public:
  explicit HttpServer(Runtime &runtime);
  ~HttpServer();

  HttpServer(const HttpServer &) = delete;
  auto operator=(const HttpServer &) -> HttpServer & = delete;

  auto router() -> Router &;
  auto set_websocket_handler(WebSocketHandler handler) -> void;

  /// Binds synchronously so the caller learns about address errors; the
  /// accept loops then run on the runtime shards.
  auto start(std::string_view host, uint16_t port, bool reuse_port = false)
      -> Result<void>;
  auto stop() -> void;

  [[nodiscard]] auto is_running() const -> bool;

private:
  struct Impl;
  std::shared_ptr<Impl> impl_;
};

} // namespace taskforge::http
