#include "taskforge/app/http/websocket.hpp"

#include "taskforge/core/asio_awaitable.hpp"
#include "taskforge/core/constants.hpp"
#include "taskforge/core/runtime.hpp"
#include "taskforge/util/json.hpp"
#include "taskforge/util/log.hpp"

#include <boost/asio/associated_executor.hpp>
#include <boost/asio/async_result.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include <atomic>
#include <deque>
#include <format>
#include <optional>
#include <utility>
#include <variant>
#include <vector>

namespace taskforge::http {

namespace {

namespace beast = boost::beast;
namespace beast_http = beast::http;
namespace beast_ws = beast::websocket;

using WsStream =
    beast_ws::stream<boost::asio::generic::stream_protocol::socket>;
using UpgradeRequest = beast_http::request<beast_http::empty_body>;

struct WriteText {
  std::string payload;
};
struct WriteClose {};
using WriteRequest = std::variant<WriteText, WriteClose>;

auto to_upgrade_request(const HttpRequest &request) -> UpgradeRequest {
  UpgradeRequest out;
  out.method(beast_http::verb::get);
  out.version(request.version_major * 10 + request.version_minor);
  out.target(request.query_string.empty()
                 ? request.path
                 : std::format("{}?{}", request.path, request.query_string));
  for (const auto &[name, value] : request.headers) {
    out.set(name, value);
  }
  return out;
}

} // namespace

struct WebSocketConnection::Impl
    : std::enable_shared_from_this<WebSocketConnection::Impl> {
  WsStream ws;
  beast::flat_buffer read_buffer;
  std::optional<UpgradeRequest> upgrade_request;
  std::atomic<bool> accepted{false};
  std::atomic<bool> closed{false};
  int fd_num{-1};
  std::vector<std::move_only_function<void()>> accept_waiters;
  std::deque<WriteRequest> pending_writes;
  bool write_in_flight{false};

  Impl(boost::asio::generic::stream_protocol::socket socket,
       std::optional<UpgradeRequest> req)
      : ws(std::move(socket)), upgrade_request(std::move(req)),
        fd_num(ws.next_layer().native_handle()) {
    ws.auto_fragment(false);
    ws.read_message_max(http_limits::kWsMessageLimit);
    ws.set_option(
        beast_ws::stream_base::timeout::suggested(beast::role_type::server));
    ws.set_option(
        beast_ws::stream_base::decorator([](beast_ws::response_type &res) {
          res.set(beast_http::field::server, "TaskForge");
        }));
  }

  auto mark_closed() -> void {
    closed.store(true, std::memory_order_release);
    notify_waiters();
  }

  // Suspends until the handshake has finished (or failed).
  auto wait_for_accept() -> spawn_task {
    auto ws_ex = ws.get_executor();
    co_await boost::asio::async_initiate<const boost::asio::use_awaitable_t<>,
                                         void()>(
        [self = shared_from_this(), ws_ex](auto handler) mutable {
          auto caller_ex = boost::asio::get_associated_executor(handler);
          boost::asio::post(ws_ex, [self, caller_ex,
                                    handler = std::move(handler)]() mutable {
            if (self->accepted.load(std::memory_order_acquire) ||
                self->closed.load(std::memory_order_acquire)) {
              boost::asio::post(caller_ex, std::move(handler));
              return;
            }
            self->accept_waiters.emplace_back(
                [h = std::move(handler), caller_ex]() mutable {
                  boost::asio::post(caller_ex, std::move(h));
                });
          });
        },
        boost::asio::use_awaitable);
  }

  auto notify_waiters() -> void {
    auto waiters = std::move(accept_waiters);
    accept_waiters.clear();
    for (auto &fn : waiters) {
      fn();
    }
  }

  static auto drain_writes(std::shared_ptr<Impl> self) -> spawn_task {
    while (!self->closed.load(std::memory_order_acquire) &&
           !self->pending_writes.empty()) {
      auto req = std::move(self->pending_writes.front());
      self->pending_writes.pop_front();

      if (std::holds_alternative<WriteClose>(req)) {
        auto close_res = as_result(co_await self->ws.async_close(
            beast_ws::close_code::normal, use_nothrow));
        if (!close_res &&
            close_res.error() != make_error_code(beast_ws::error::closed)) {
          log::debug("WebSocket close failed: {}",
                     close_res.error().message());
        }
        self->mark_closed();
        break;
      }

      auto &payload = std::get<WriteText>(req).payload;
      self->ws.text(true);
      auto write_res = as_result(co_await self->ws.async_write(
          boost::asio::buffer(payload), use_nothrow));
      if (!write_res) {
        log::debug("WebSocket write failed: fd={} err={}", self->fd_num,
                   write_res.error().message());
        self->mark_closed();
        break;
      }
    }
    self->write_in_flight = false;
  }

  static auto enqueue(std::shared_ptr<Impl> self, WriteRequest req) -> void {
    auto ex = self->ws.get_executor();
    boost::asio::post(ex, [self = std::move(self), req = std::move(req),
                           ex]() mutable {
      if (self->closed.load(std::memory_order_acquire)) {
        return;
      }
      self->pending_writes.emplace_back(std::move(req));
      if (self->write_in_flight) {
        return;
      }
      self->write_in_flight = true;
      boost::asio::co_spawn(ex, drain_writes(std::move(self)),
                            boost::asio::detached);
    });
  }
};

WebSocketConnection::WebSocketConnection(
    boost::asio::generic::stream_protocol::socket socket,
    HttpRequest upgrade_request)
    : impl_(std::make_shared<Impl>(std::move(socket),
                                   to_upgrade_request(upgrade_request))) {}

WebSocketConnection::WebSocketConnection(
    boost::asio::generic::stream_protocol::socket socket)
    : impl_(std::make_shared<Impl>(std::move(socket), std::nullopt)) {}

WebSocketConnection::~WebSocketConnection() = default;

auto WebSocketConnection::send_text(std::string text) -> spawn_task {
  auto impl = impl_;
  if (!impl->accepted.load(std::memory_order_acquire)) {
    co_await impl->wait_for_accept();
  }
  if (impl->closed.load(std::memory_order_acquire)) {
    co_return;
  }
  Impl::enqueue(std::move(impl), WriteText{std::move(text)});
}

auto WebSocketConnection::send_close() -> spawn_task {
  auto impl = impl_;
  if (impl->closed.load(std::memory_order_acquire)) {
    co_return;
  }
  Impl::enqueue(std::move(impl), WriteClose{});
}

auto WebSocketConnection::handle_frames(FrameCallback on_message)
    -> spawn_task {
  auto self = shared_from_this();
  auto impl = impl_;

  if (!impl->accepted.load(std::memory_order_acquire)) {
    Result<void> accept_res;
    if (impl->upgrade_request) {
      auto req = std::move(*impl->upgrade_request);
      impl->upgrade_request.reset();
      accept_res =
          as_result(co_await impl->ws.async_accept(std::move(req), use_nothrow));
    } else {
      accept_res = as_result(co_await impl->ws.async_accept(use_nothrow));
    }
    if (!accept_res) {
      log::debug("WebSocket accept failed: {}", accept_res.error().message());
      impl->mark_closed();
      co_return;
    }
    impl->accepted.store(true, std::memory_order_release);
    impl->notify_waiters();
  }

  while (!impl->closed.load(std::memory_order_acquire)) {
    auto read_res =
        as_result(co_await impl->ws.async_read(impl->read_buffer, use_nothrow));
    if (!read_res) {
      if (read_res.error() == make_error_code(beast_ws::error::closed)) {
        on_message(WebSocketOpCode::Close, {});
      } else {
        log::debug("WebSocket read failed: fd={} err={}", impl->fd_num,
                   read_res.error().message());
      }
      impl->mark_closed();
      break;
    }

    const auto size = boost::asio::buffer_size(impl->read_buffer.data());
    std::vector<std::byte> payload(size);
    boost::asio::buffer_copy(boost::asio::buffer(payload.data(), size),
                             impl->read_buffer.data());
    impl->read_buffer.consume(size);

    const auto opcode =
        impl->ws.got_text() ? WebSocketOpCode::Text : WebSocketOpCode::Binary;
    try {
      on_message(opcode, payload);
    } catch (const std::exception &e) {
      log::warn("WebSocket frame handler threw: {}", e.what());
      impl->mark_closed();
      break;
    }
  }
}

auto WebSocketConnection::is_closed() const -> bool {
  return !impl_ || impl_->closed.load(std::memory_order_acquire);
}

auto WebSocketConnection::fd() const -> int {
  return impl_ ? impl_->fd_num : -1;
}

auto WebSocketConnection::force_close() -> void {
  auto impl = impl_;
  if (!impl || impl->closed.exchange(true, std::memory_order_acq_rel)) {
    return;
  }
  boost::system::error_code ec;
  impl->ws.next_layer().cancel(ec);
  impl->ws.next_layer().close(ec);
  impl->notify_waiters();
}

struct WebSocketHub::Impl : std::enable_shared_from_this<WebSocketHub::Impl> {
  struct Observer {
    std::shared_ptr<IWebSocketConnection> conn;
    TaskId room;
    std::deque<std::string> pending;
    std::uint64_t dropped{0};
    bool sending{false};
  };

  // Touched only by the owning shard.
  struct ShardLocal {
    std::vector<std::shared_ptr<Observer>> observers;
  };

  Runtime &runtime;
  std::vector<ShardLocal> shards;
  std::atomic<std::size_t> total_connections{0};
  std::atomic<std::uint64_t> total_dropped{0};

  explicit Impl(Runtime &rt) : runtime(rt), shards(rt.shard_count()) {}

  static auto drain(std::shared_ptr<Observer> observer) -> spawn_task {
    while (!observer->conn->is_closed() && !observer->pending.empty()) {
      auto msg = std::move(observer->pending.front());
      observer->pending.pop_front();
      co_await observer->conn->send_text(std::move(msg));
    }
    observer->sending = false;
  }

  auto prune(ShardLocal &local) -> void {
    const auto removed = std::erase_if(
        local.observers, [](const std::shared_ptr<Observer> &o) {
          return !o || !o->conn || o->conn->is_closed();
        });
    if (removed > 0) {
      total_connections.fetch_sub(removed, std::memory_order_relaxed);
    }
  }

  auto deliver_on_shard(shard_id sid, TaskId room, const std::string &text)
      -> void {
    auto &local = shards[sid];
    prune(local);
    for (auto &observer : local.observers) {
      if (observer->room != room) {
        continue;
      }
      if (observer->pending.size() >= kMaxPendingMessages) {
        observer->pending.pop_front();
        ++observer->dropped;
        total_dropped.fetch_add(1, std::memory_order_relaxed);
        if ((observer->dropped & (observer->dropped - 1)) == 0) {
          log::warn("WebSocket slow observer fd={} task={} dropped={}",
                    observer->conn->fd(), room, observer->dropped);
        }
      }
      observer->pending.push_back(text);
      if (!observer->sending) {
        observer->sending = true;
        runtime.spawn_on(sid, drain(observer));
      }
    }
  }
};

WebSocketHub::WebSocketHub(Runtime &runtime)
    : impl_(std::make_shared<Impl>(runtime)) {}

WebSocketHub::~WebSocketHub() = default;

auto WebSocketHub::add_connection(std::shared_ptr<IWebSocketConnection> conn,
                                  TaskId room) -> void {
  const shard_id sid = impl_->runtime.current_shard();
  if (sid == kInvalidShard) {
    log::error("WebSocketHub::add_connection called off-shard; dropping fd={}",
               conn->fd());
    conn->force_close();
    return;
  }
  impl_->shards[sid].observers.push_back(std::make_shared<Impl::Observer>(
      Impl::Observer{.conn = std::move(conn), .room = room}));
  impl_->total_connections.fetch_add(1, std::memory_order_relaxed);
}

auto WebSocketHub::remove_connection(int fd) -> void {
  const shard_id sid = impl_->runtime.current_shard();
  if (sid == kInvalidShard) {
    return;
  }
  const auto removed = std::erase_if(
      impl_->shards[sid].observers,
      [fd](const std::shared_ptr<Impl::Observer> &o) {
        return o->conn->fd() == fd;
      });
  if (removed > 0) {
    impl_->total_connections.fetch_sub(removed, std::memory_order_relaxed);
  }
}

auto WebSocketHub::publish(const LiveEvent &event) -> void {
  if (impl_->total_connections.load(std::memory_order_relaxed) == 0) {
    return;
  }
  auto text = dump_json(to_json(event));
  for (unsigned i = 0; i < impl_->runtime.shard_count(); ++i) {
    impl_->runtime.post_to(
        i, [self = impl_->shared_from_this(), i, room = event.task_id, text] {
          self->deliver_on_shard(i, room, text);
        });
  }
}

auto WebSocketHub::connection_count() const -> std::size_t {
  return impl_->total_connections.load(std::memory_order_relaxed);
}

auto WebSocketHub::dropped_messages() const -> std::uint64_t {
  return impl_->total_dropped.load(std::memory_order_relaxed);
}

auto WebSocketHub::close_all() -> void {
  for (unsigned i = 0; i < impl_->runtime.shard_count(); ++i) {
    impl_->runtime.post_to(i, [self = impl_, i] {
      auto observers = std::move(self->shards[i].observers);
      self->shards[i].observers.clear();
      self->total_connections.fetch_sub(observers.size(),
                                        std::memory_order_relaxed);
      for (auto &o : observers) {
        if (o && o->conn) {
          o->conn->force_close();
        }
      }
    });
  }
}

} // namespace taskforge::http
