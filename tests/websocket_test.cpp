#include "taskforge/app/http/websocket.hpp"
#include "taskforge/core/coroutine.hpp"
#include "taskforge/core/runtime.hpp"
#include "taskforge/util/json.hpp"

#include <array>
#include <atomic>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <future>
#include <mutex>
#include <optional>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <vector>

#include "test_utils.hpp"
#include "gtest/gtest.h"

using namespace taskforge;
using namespace taskforge::http;
using namespace std::chrono_literals;

namespace {

// In-memory observer. While `blocked` is set every send parks, which is how
// a client that stopped reading looks from the hub's side.
class FakeConnection final : public IWebSocketConnection {
public:
  explicit FakeConnection(int fd) : fd_(fd) {}

  auto send_text(std::string text) -> spawn_task override {
    auto ex = co_await boost::asio::this_coro::executor;
    boost::asio::steady_timer timer(ex);
    while (blocked.load()) {
      timer.expires_after(1ms);
      co_await timer.async_wait(boost::asio::use_awaitable);
    }
    std::scoped_lock lock(mu_);
    sent_.push_back(std::move(text));
  }

  auto send_close() -> spawn_task override {
    closed_ = true;
    co_return;
  }

  auto handle_frames(FrameCallback) -> spawn_task override { co_return; }

  [[nodiscard]] auto is_closed() const -> bool override { return closed_; }
  [[nodiscard]] auto fd() const -> int override { return fd_; }
  auto force_close() -> void override { closed_ = true; }

  [[nodiscard]] auto sent() const -> std::vector<std::string> {
    std::scoped_lock lock(mu_);
    return sent_;
  }

  std::atomic<bool> blocked{false};

private:
  int fd_;
  std::atomic<bool> closed_{false};
  mutable std::mutex mu_;
  std::vector<std::string> sent_;
};

auto chunk_event(std::int64_t task, std::string content) -> LiveEvent {
  return LiveEvent{.type = LiveEventType::Chunk,
                   .task_id = TaskId{task},
                   .subtask_id = SubtaskId{task * 10},
                   .offset = 0,
                   .content = std::move(content)};
}

auto content_of(std::string_view text) -> std::string {
  auto parsed = test::body_json(text);
  return json::string_at(parsed, "content").value_or("");
}

// === Raw client side of a socketpair ===

auto masked_frame(WebSocketOpCode opcode, std::string_view payload)
    -> std::vector<std::byte> {
  std::vector<std::byte> frame;
  frame.push_back(static_cast<std::byte>(0x80 | std::to_underlying(opcode)));
  frame.push_back(static_cast<std::byte>(0x80 | payload.size()));
  const std::array<std::byte, 4> mask{std::byte{0x01}, std::byte{0x02},
                                      std::byte{0x03}, std::byte{0x04}};
  frame.insert(frame.end(), mask.begin(), mask.end());
  for (std::size_t i = 0; i < payload.size(); ++i) {
    frame.push_back(static_cast<std::byte>(payload[i]) ^ mask[i % 4]);
  }
  return frame;
}

auto recv_exact(int fd, std::span<std::byte> buf) -> bool {
  std::size_t off = 0;
  while (off < buf.size()) {
    auto n = ::recv(fd, buf.data() + off, buf.size() - off, 0);
    if (n <= 0) {
      return false;
    }
    off += static_cast<std::size_t>(n);
  }
  return true;
}

// Server frames are unmasked; payloads here stay below 64 KiB.
auto read_text_frame(int fd) -> std::optional<std::string> {
  std::array<std::byte, 2> hdr{};
  if (!recv_exact(fd, hdr)) {
    return std::nullopt;
  }
  std::size_t len = std::to_integer<std::uint8_t>(hdr[1]) & 0x7F;
  if (len == 126) {
    std::array<std::byte, 2> ext{};
    if (!recv_exact(fd, ext)) {
      return std::nullopt;
    }
    len = (std::to_integer<std::size_t>(ext[0]) << 8) |
          std::to_integer<std::size_t>(ext[1]);
  }
  std::vector<std::byte> payload(len);
  if (len > 0 && !recv_exact(fd, payload)) {
    return std::nullopt;
  }
  return std::string(reinterpret_cast<const char *>(payload.data()), len);
}

auto readable_within(int fd, std::chrono::milliseconds timeout) -> bool {
  pollfd pfd{.fd = fd, .events = POLLIN, .revents = 0};
  return ::poll(&pfd, 1, static_cast<int>(timeout.count())) > 0 &&
         (pfd.revents & POLLIN) != 0;
}

auto client_handshake(int fd) -> bool {
  const std::string request = "GET /ws?task_id=1 HTTP/1.1\r\n"
                              "Host: localhost\r\n"
                              "Upgrade: websocket\r\n"
                              "Connection: Upgrade\r\n"
                              "Sec-WebSocket-Key: dGhlIHNhbXBsZSBub25jZQ==\r\n"
                              "Sec-WebSocket-Version: 13\r\n"
                              "\r\n";
  if (::send(fd, request.data(), request.size(), 0) !=
      static_cast<ssize_t>(request.size())) {
    return false;
  }
  // read up to the end of the 101 response headers
  std::string response;
  char c = 0;
  while (!response.ends_with("\r\n\r\n")) {
    if (::recv(fd, &c, 1, 0) != 1) {
      return false;
    }
    response.push_back(c);
  }
  return response.starts_with("HTTP/1.1 101");
}

} // namespace

class WebSocketHubTest : public ::testing::Test {
protected:
  void SetUp() override {
    ASSERT_TRUE(runtime_.start());
    hub_ = std::make_unique<WebSocketHub>(runtime_);
  }

  void TearDown() override {
    hub_->close_all();
    runtime_.stop();
  }

  auto on_shard(std::move_only_function<void()> fn) -> void {
    std::promise<void> done;
    auto fut = done.get_future();
    runtime_.post_to(0, [&fn, &done] {
      fn();
      done.set_value();
    });
    fut.get();
  }

  auto attach(std::shared_ptr<IWebSocketConnection> conn, std::int64_t room)
      -> void {
    on_shard([&] { hub_->add_connection(std::move(conn), TaskId{room}); });
  }

  Runtime runtime_{1};
  std::unique_ptr<WebSocketHub> hub_;
};

TEST_F(WebSocketHubTest, StartsEmpty) {
  EXPECT_EQ(hub_->connection_count(), 0u);
  EXPECT_EQ(hub_->dropped_messages(), 0u);
  // publishing with no observers is a no-op
  hub_->publish(chunk_event(1, "x"));
}

TEST_F(WebSocketHubTest, DeliversOnlyToTheTaskRoom) {
  auto watcher = std::make_shared<FakeConnection>(101);
  auto other = std::make_shared<FakeConnection>(102);
  attach(watcher, 1);
  attach(other, 2);
  EXPECT_EQ(hub_->connection_count(), 2u);

  hub_->publish(chunk_event(1, "hello"));
  hub_->publish(chunk_event(1, "world"));

  ASSERT_TRUE(test::poll_until([&] { return watcher->sent().size() == 2; },
                               2s));
  auto sent = watcher->sent();
  EXPECT_EQ(content_of(sent[0]), "hello");
  EXPECT_EQ(content_of(sent[1]), "world");
  auto first = test::body_json(sent[0]);
  EXPECT_EQ(json::string_at(first, "event"), "chunk");
  EXPECT_EQ(json::int_at(first, "task_id"), 1);
  EXPECT_EQ(json::int_at(first, "subtask_id"), 10);

  test::sleep_ms(50ms);
  EXPECT_TRUE(other->sent().empty());
}

TEST_F(WebSocketHubTest, OffShardRegistrationIsRefused) {
  auto conn = std::make_shared<FakeConnection>(7);
  hub_->add_connection(conn, TaskId{1});
  EXPECT_TRUE(conn->is_closed());
  EXPECT_EQ(hub_->connection_count(), 0u);
}

TEST_F(WebSocketHubTest, RemoveByFd) {
  attach(std::make_shared<FakeConnection>(11), 1);
  attach(std::make_shared<FakeConnection>(12), 1);
  on_shard([&] { hub_->remove_connection(11); });
  EXPECT_EQ(hub_->connection_count(), 1u);
  on_shard([&] { hub_->remove_connection(999); });
  EXPECT_EQ(hub_->connection_count(), 1u);
}

TEST_F(WebSocketHubTest, ClosedObserversArePruned) {
  auto gone = std::make_shared<FakeConnection>(21);
  auto alive = std::make_shared<FakeConnection>(22);
  attach(gone, 3);
  attach(alive, 3);
  gone->force_close();

  hub_->publish(chunk_event(3, "after"));
  ASSERT_TRUE(test::poll_until([&] { return alive->sent().size() == 1; }, 2s));
  EXPECT_TRUE(gone->sent().empty());
  EXPECT_EQ(hub_->connection_count(), 1u);
}

TEST_F(WebSocketHubTest, SlowObserverKeepsNewestMessages) {
  auto slow = std::make_shared<FakeConnection>(31);
  slow->blocked = true;
  attach(slow, 4);

  constexpr int kMessages = 300;
  for (int i = 0; i < kMessages; ++i) {
    hub_->publish(chunk_event(4, std::to_string(i)));
  }
  // every publish is posted; wait until the shard has handled them all
  on_shard([] {});
  slow->blocked = false;

  ASSERT_TRUE(test::poll_until(
      [&] {
        auto sent = slow->sent();
        return !sent.empty() && content_of(sent.back()) == "299";
      },
      5s));
  auto sent = slow->sent();
  // one message may already have been in flight when the queue filled up
  EXPECT_GE(sent.size(), WebSocketHub::kMaxPendingMessages);
  EXPECT_LE(sent.size(), WebSocketHub::kMaxPendingMessages + 1);
  EXPECT_EQ(hub_->dropped_messages(), kMessages - sent.size());

  int previous = -1;
  for (const auto &text : sent) {
    int value = std::stoi(content_of(text));
    EXPECT_GT(value, previous);
    previous = value;
  }
}

TEST_F(WebSocketHubTest, CloseAllForceClosesObservers) {
  auto a = std::make_shared<FakeConnection>(41);
  auto b = std::make_shared<FakeConnection>(42);
  attach(a, 5);
  attach(b, 6);
  hub_->close_all();
  ASSERT_TRUE(test::poll_until(
      [&] { return a->is_closed() && b->is_closed(); }, 2s));
  EXPECT_EQ(hub_->connection_count(), 0u);
}

class WebSocketConnectionTest : public WebSocketHubTest {
protected:
  struct Pair {
    int client_fd{-1};
    std::shared_ptr<WebSocketConnection> server;
  };

  auto make_pair() -> Pair {
    int fds[2]{};
    if (::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) != 0) {
      return {};
    }
    boost::asio::generic::stream_protocol::socket socket(
        runtime_.executor_for(0));
    boost::system::error_code ec;
    socket.assign(boost::asio::generic::stream_protocol(AF_UNIX, SOCK_STREAM),
                  fds[0], ec);
    if (ec) {
      ::close(fds[0]);
      ::close(fds[1]);
      return {};
    }
    return Pair{.client_fd = fds[1],
                .server =
                    std::make_shared<WebSocketConnection>(std::move(socket))};
  }
};

TEST_F(WebSocketConnectionTest, PublishedEventReachesClient) {
  auto pair = make_pair();
  ASSERT_GE(pair.client_fd, 0);

  std::atomic<bool> done{false};
  runtime_.spawn_on(0, [](std::shared_ptr<WebSocketConnection> conn,
                          std::atomic<bool> &flag) -> spawn_task {
    co_await conn->handle_frames([](WebSocketOpCode, std::span<const std::byte>) {});
    flag = true;
  }(pair.server, done));
  ASSERT_TRUE(client_handshake(pair.client_fd));

  attach(pair.server, 9);
  hub_->publish(chunk_event(9, "live"));
  hub_->publish(chunk_event(8, "elsewhere"));

  ASSERT_TRUE(readable_within(pair.client_fd, 2000ms));
  auto text = read_text_frame(pair.client_fd);
  ASSERT_TRUE(text.has_value());
  EXPECT_EQ(content_of(*text), "live");
  EXPECT_FALSE(readable_within(pair.client_fd, 100ms));

  auto close = masked_frame(WebSocketOpCode::Close, "");
  ASSERT_EQ(::send(pair.client_fd, close.data(), close.size(), 0),
            static_cast<ssize_t>(close.size()));
  ::shutdown(pair.client_fd, SHUT_WR);
  EXPECT_TRUE(test::poll_until([&] { return done.load(); }, 2s));
  EXPECT_TRUE(pair.server->is_closed());
  ::close(pair.client_fd);
}

TEST_F(WebSocketConnectionTest, ClientTextFramesReachTheCallback) {
  auto pair = make_pair();
  ASSERT_GE(pair.client_fd, 0);

  std::promise<std::string> received;
  auto fut = received.get_future();
  runtime_.spawn_on(0, [](std::shared_ptr<WebSocketConnection> conn,
                          std::promise<std::string> &out) -> spawn_task {
    bool delivered = false;
    co_await conn->handle_frames(
        [&](WebSocketOpCode opcode, std::span<const std::byte> payload) {
          if (opcode == WebSocketOpCode::Text && !delivered) {
            delivered = true;
            out.set_value(std::string(
                reinterpret_cast<const char *>(payload.data()),
                payload.size()));
          }
        });
  }(pair.server, received));
  ASSERT_TRUE(client_handshake(pair.client_fd));

  auto frame = masked_frame(WebSocketOpCode::Text, "ping-me");
  ASSERT_EQ(::send(pair.client_fd, frame.data(), frame.size(), 0),
            static_cast<ssize_t>(frame.size()));
  ASSERT_EQ(fut.wait_for(2s), std::future_status::ready);
  EXPECT_EQ(fut.get(), "ping-me");

  pair.server->force_close();
  ::close(pair.client_fd);
}
