#pragma once

#include "taskforge/client/http/http_types.hpp"
#include "taskforge/core/coroutine.hpp"
#include "taskforge/live/live_channel.hpp"
#include "taskforge/util/id.hpp"

#include <boost/asio/generic/stream_protocol.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <string>

namespace taskforge {
class Runtime;
} // namespace taskforge

namespace taskforge::http {

enum class WebSocketOpCode : std::uint8_t {
  Continuation = 0x0,
  Text = 0x1,
  Binary = 0x2,
  Close = 0x8,
  Ping = 0x9,
  Pong = 0xA
};

using FrameCallback =
    std::move_only_function<void(WebSocketOpCode, std::span<const std::byte>)>;

class IWebSocketConnection {
public:
  virtual ~IWebSocketConnection() = default;

  virtual auto send_text(std::string text) -> spawn_task = 0;
  virtual auto send_close() -> spawn_task = 0;
  virtual auto handle_frames(FrameCallback on_message) -> spawn_task = 0;
  [[nodiscard]] virtual auto is_closed() const -> bool = 0;
  [[nodiscard]] virtual auto fd() const -> int = 0;
  virtual auto force_close() -> void = 0;
};

/// Server side of an upgraded connection. Writes are serialised through a
/// per-connection queue drained on the socket's executor.
class WebSocketConnection
    : public IWebSocketConnection,
      public std::enable_shared_from_this<WebSocketConnection> {
public:
  WebSocketConnection(boost::asio::generic::stream_protocol::socket socket,
                      HttpRequest upgrade_request);
  /// Performs the handshake itself; used for pre-connected socket pairs.
  explicit WebSocketConnection(
      boost::asio::generic::stream_protocol::socket socket);
  ~WebSocketConnection() override;

  WebSocketConnection(const WebSocketConnection &) = delete;
  auto operator=(const WebSocketConnection &) -> WebSocketConnection & = delete;

  auto send_text(std::string text) -> spawn_task override;
  auto send_close() -> spawn_task override;
  auto handle_frames(FrameCallback on_message) -> spawn_task override;

  [[nodiscard]] auto is_closed() const -> bool override;
  [[nodiscard]] auto fd() const -> int override;
  auto force_close() -> void override;

private:
  struct Impl;
  std::shared_ptr<Impl> impl_;
};

// Live channel that fans task events out to WebSocket observers. Every
// connection is subscribed to exactly one task room and is owned by the shard
// that accepted it; publish() posts to each shard and never blocks.
class WebSocketHub final : public LiveChannel {
public:
  static constexpr std::size_t kMaxPendingMessages = 256;

  explicit WebSocketHub(Runtime &runtime);
  ~WebSocketHub() override;

  WebSocketHub(const WebSocketHub &) = delete;
  auto operator=(const WebSocketHub &) -> WebSocketHub & = delete;

  /// Must run on a runtime shard; the connection stays bound to it.
  auto add_connection(std::shared_ptr<IWebSocketConnection> conn,
                      TaskId room) -> void;
  auto remove_connection(int fd) -> void;

  auto publish(const LiveEvent &event) -> void override;

  [[nodiscard]] auto connection_count() const -> std::size_t;
  /// Messages discarded because an observer's queue was full.
  [[nodiscard]] auto dropped_messages() const -> std::uint64_t;
  auto close_all() -> void;

private:
  struct Impl;
  std::shared_ptr<Impl> impl_;
};

} // namespace taskforge::http
