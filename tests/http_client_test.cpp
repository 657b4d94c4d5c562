#include "taskforge/client/executor_manager_client.hpp"
#include "taskforge/client/http/http_client.hpp"
#include "taskforge/client/http/http_types.hpp"

#include <boost/asio/buffers_iterator.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/streambuf.hpp>
#include <boost/asio/write.hpp>

#include <atomic>
#include <format>
#include <string>
#include <thread>

#include "test_utils.hpp"
#include "gtest/gtest.h"

using namespace taskforge;
using namespace taskforge::http;

namespace {

TEST(ParseHttpUrlTest, HostPortAndTarget) {
  auto url = parse_http_url("http://manager.local:8001/executor-manager/"
                            "tasks/cancel?force=1");
  ASSERT_TRUE(url.has_value());
  EXPECT_EQ(url->host, "manager.local");
  EXPECT_EQ(url->port, 8001);
  EXPECT_EQ(url->target, "/executor-manager/tasks/cancel?force=1");
}

TEST(ParseHttpUrlTest, Defaults) {
  auto url = parse_http_url("http://10.0.0.5");
  ASSERT_TRUE(url.has_value());
  EXPECT_EQ(url->host, "10.0.0.5");
  EXPECT_EQ(url->port, 80);
  EXPECT_EQ(url->target, "/");
}

TEST(ParseHttpUrlTest, RejectsOtherSchemesAndGarbage) {
  for (auto text : {"https://example.com/x", "ftp://example.com", "not a url",
                    "http://", "http://host:0/x", ""}) {
    auto url = parse_http_url(text);
    ASSERT_FALSE(url.has_value()) << text;
    EXPECT_TRUE(is(url.error(), Error::InvalidUrl)) << text;
  }
}

TEST(HttpTypesTest, QueryParams) {
  QueryParams params("limit=5&task_ids=1,2,3&empty=");
  EXPECT_EQ(params.get("limit").value_or(""), "5");
  EXPECT_EQ(params.get("task_ids").value_or(""), "1,2,3");
  EXPECT_EQ(params.get("empty").value_or("x"), "");
  EXPECT_FALSE(params.get("missing").has_value());
  EXPECT_FALSE(QueryParams("").get("limit").has_value());
}

TEST(HttpTypesTest, HeaderLookupIgnoresCase) {
  HttpRequest req;
  req.headers.emplace("Content-Type", "application/json");
  req.headers.emplace("Upgrade", "WebSocket");
  req.headers.emplace("Connection", "keep-alive, Upgrade");
  EXPECT_EQ(req.header("content-type").value_or(""), "application/json");
  EXPECT_FALSE(req.header("x-missing").has_value());
  EXPECT_TRUE(req.is_websocket_upgrade());
}

TEST(HttpTypesTest, ResponseHelpers) {
  auto resp = HttpResponse::json(R"({"ok":true})");
  EXPECT_EQ(resp.status, HttpStatus::Ok);
  EXPECT_EQ(resp.body_as_string(), R"({"ok":true})");
  EXPECT_TRUE(resp.is_success());
  EXPECT_EQ(resp.headers.at("Content-Type"), "application/json");
  EXPECT_FALSE(HttpResponse::empty(HttpStatus::NotFound).is_success());
  EXPECT_EQ(std::format("{} {}", HttpMethod::POST, HttpStatus::Conflict),
            "POST 409");
}

// One-shot HTTP server on a background thread: captures the request body and
// answers with a fixed status.
class OneShotServer {
public:
  explicit OneShotServer(int status)
      : acceptor_(io_, {boost::asio::ip::make_address("127.0.0.1"), 0}),
        status_(status) {
    port_ = acceptor_.local_endpoint().port();
    thread_ = std::jthread([this] { serve(); });
  }

  [[nodiscard]] auto port() const -> std::uint16_t { return port_; }
  [[nodiscard]] auto url(std::string_view path) const -> std::string {
    return std::format("http://127.0.0.1:{}{}", port_, path);
  }

  auto wait() -> void { thread_.join(); }
  std::string head;
  std::string body;

private:
  auto serve() -> void {
    boost::system::error_code ec;
    boost::asio::ip::tcp::socket socket(io_);
    acceptor_.accept(socket, ec);
    if (ec) {
      return;
    }
    boost::asio::streambuf buf;
    auto header_len = boost::asio::read_until(socket, buf, "\r\n\r\n", ec);
    if (ec) {
      return;
    }
    std::string data(boost::asio::buffers_begin(buf.data()),
                     boost::asio::buffers_end(buf.data()));
    head = data.substr(0, header_len);
    body = data.substr(header_len);

    std::size_t content_length = 0;
    if (auto pos = head.find("Content-Length: "); pos != std::string::npos) {
      content_length = std::stoul(head.substr(pos + 16));
    } else if (auto lower = head.find("content-length: ");
               lower != std::string::npos) {
      content_length = std::stoul(head.substr(lower + 16));
    }
    if (body.size() < content_length) {
      std::string rest(content_length - body.size(), '\0');
      boost::asio::read(socket, boost::asio::buffer(rest), ec);
      body += rest;
    }

    auto reply = std::format("HTTP/1.1 {} X\r\nContent-Length: 2\r\n"
                             "Content-Type: application/json\r\n"
                             "Connection: close\r\n\r\n{{}}",
                             status_);
    boost::asio::write(socket, boost::asio::buffer(reply), ec);
  }

  boost::asio::io_context io_;
  boost::asio::ip::tcp::acceptor acceptor_;
  int status_;
  std::uint16_t port_{0};
  std::jthread thread_;
};

auto forward() -> CancelForward {
  return CancelForward{.task_id = TaskId{11},
                       .subtask_id = SubtaskId{22},
                       .executor_name = "executor-abc"};
}

TEST(ExecutorManagerClientTest, DisabledWithoutUrl) {
  ExecutorManagerClient client({});
  EXPECT_FALSE(client.enabled());
  EXPECT_TRUE(test::run_coro(client.cancel(forward())).has_value());
}

TEST(ExecutorManagerClientTest, PostsCancelPayload) {
  OneShotServer server(200);
  ExecutorManagerClient client(
      {.cancel_url = server.url("/executor-manager/tasks/cancel"),
       .timeout_ms = 2000});
  ASSERT_TRUE(client.enabled());

  auto r = test::run_coro(client.cancel(forward()));
  server.wait();
  ASSERT_TRUE(r.has_value()) << r.error().message();

  EXPECT_TRUE(server.head.starts_with(
      "POST /executor-manager/tasks/cancel HTTP/1.1"));
  auto body = test::body_json(server.body);
  EXPECT_EQ(json::int_at(body, "task_id"), 11);
  EXPECT_EQ(json::int_at(body, "subtask_id"), 22);
  EXPECT_EQ(json::string_at(body, "executor_name"), "executor-abc");
}

TEST(ExecutorManagerClientTest, NonSuccessIsProtocolError) {
  OneShotServer server(500);
  ExecutorManagerClient client(
      {.cancel_url = server.url("/cancel"), .timeout_ms = 2000});
  auto r = test::run_coro(client.cancel(forward()));
  server.wait();
  ASSERT_FALSE(r.has_value());
  EXPECT_TRUE(is(r.error(), Error::ProtocolError));
}

TEST(ExecutorManagerClientTest, InvalidUrlFailsFast) {
  ExecutorManagerClient client({.cancel_url = "https://secure/cancel"});
  auto r = test::run_coro(client.cancel(forward()));
  ASSERT_FALSE(r.has_value());
  EXPECT_TRUE(is(r.error(), Error::InvalidUrl));
}

TEST(ExecutorManagerClientTest, UnreachableManagerFails) {
  auto port = test::pick_unused_tcp_port();
  ASSERT_TRUE(port.has_value());
  ExecutorManagerClient client(
      {.cancel_url = std::format("http://127.0.0.1:{}/cancel", *port),
       .timeout_ms = 500});
  EXPECT_FALSE(test::run_coro(client.cancel(forward())).has_value());
}

} // namespace
