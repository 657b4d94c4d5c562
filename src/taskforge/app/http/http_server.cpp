#include "taskforge/app/http/http_server.hpp"

#include "taskforge/app/http/router.hpp"
#include "taskforge/core/asio_awaitable.hpp"
#include "taskforge/core/constants.hpp"
#include "taskforge/core/runtime.hpp"
#include "taskforge/util/log.hpp"

#include <boost/asio/cancel_after.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/socket_base.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/url/parse.hpp>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <sys/socket.h>
#include <unistd.h>
#include <vector>

namespace taskforge::http {

namespace {
namespace beast = boost::beast;
namespace beast_http = beast::http;
using tcp = boost::asio::ip::tcp;

auto to_method(beast_http::verb verb) noexcept -> HttpMethod {
  switch (verb) {
  case beast_http::verb::get:
    return HttpMethod::GET;
  case beast_http::verb::post:
    return HttpMethod::POST;
  default:
    return HttpMethod::Other;
  }
}

auto to_request(beast_http::request<beast_http::vector_body<uint8_t>> &&msg)
    -> HttpRequest {
  HttpRequest out;
  out.method = to_method(msg.method());
  out.version_major = static_cast<int>(msg.version() / 10);
  out.version_minor = static_cast<int>(msg.version() % 10);

  std::string target(msg.target());
  if (auto parsed = boost::urls::parse_origin_form(target); parsed) {
    out.path = std::string(parsed->encoded_path());
    out.query_string = std::string(parsed->encoded_query());
  } else {
    out.path = std::move(target);
  }

  for (const auto &field : msg.base()) {
    out.headers.emplace(field.name_string(), field.value());
  }
  out.body = std::move(msg.body());
  return out;
}

auto to_beast_response(HttpResponse &&resp, unsigned version, bool keep_alive)
    -> beast_http::response<beast_http::vector_body<uint8_t>> {
  beast_http::response<beast_http::vector_body<uint8_t>> out{
      static_cast<beast_http::status>(resp.status), version};
  out.keep_alive(keep_alive);
  out.set(beast_http::field::server, "TaskForge");
  out.set(beast_http::field::cache_control, "no-store");
  for (const auto &[k, v] : resp.headers) {
    out.set(k, v);
  }
  out.body() = std::move(resp.body);
  out.prepare_payload();
  return out;
}

auto open_acceptor(tcp::acceptor &acceptor, const tcp::endpoint &endpoint,
                   bool reuse_port) -> Result<void> {
  boost::system::error_code ec;
  acceptor.open(endpoint.protocol(), ec);
  if (ec) {
    log::error("Failed to open acceptor: {}", ec.message());
    return fail(ec);
  }
  acceptor.set_option(boost::asio::socket_base::reuse_address(true), ec);
  if (ec) {
    log::warn("Failed to set SO_REUSEADDR: {}", ec.message());
  }
#ifdef SO_REUSEPORT
  if (reuse_port) {
    int one = 1;
    if (::setsockopt(acceptor.native_handle(), SOL_SOCKET, SO_REUSEPORT, &one,
                     sizeof(one)) < 0) {
      auto err = std::error_code(errno, std::system_category());
      log::error("Failed to set SO_REUSEPORT: {}", err.message());
      return fail(err);
    }
  }
#else
  if (reuse_port) {
    log::error("SO_REUSEPORT is not supported on this platform");
    return fail(Error::InvalidArgument);
  }
#endif
  acceptor.bind(endpoint, ec);
  if (ec) {
    log::error("Failed to bind {}:{}: {}", endpoint.address().to_string(),
               endpoint.port(), ec.message());
    return fail(ec);
  }
  acceptor.listen(boost::asio::socket_base::max_listen_connections, ec);
  if (ec) {
    log::error("Failed to listen on {}:{}: {}",
               endpoint.address().to_string(), endpoint.port(), ec.message());
    return fail(ec);
  }
  return ok();
}

} // namespace

struct HttpServer::Impl : std::enable_shared_from_this<HttpServer::Impl> {
  Runtime &runtime;
  Router router;
  WebSocketHandler ws_handler;
  // acceptors[i] lives on shard i's io_context; null when shard i does not
  // accept.
  std::vector<std::shared_ptr<tcp::acceptor>> acceptors;
  std::atomic<bool> running{false};
  std::atomic<unsigned> next_shard{0};

  explicit Impl(Runtime &rt) : runtime(rt), acceptors(rt.shard_count()) {}

  auto upgrade(tcp::socket socket, HttpRequest req) -> spawn_task {
    if (!ws_handler) {
      log::warn("WebSocket upgrade for {} but no handler set", req.path);
      co_return;
    }
    boost::system::error_code ec;
    int family = AF_INET;
    if (auto local = socket.local_endpoint(ec); !ec) {
      family = local.protocol().family();
    }
    auto &io = runtime.context_for(runtime.current_shard());
    const int raw_fd = socket.release(ec);
    if (ec || raw_fd < 0) {
      log::warn("WebSocket socket release failed: {}", ec.message());
      co_return;
    }
    boost::asio::generic::stream_protocol::socket ws_socket(io);
    ws_socket.assign(boost::asio::generic::stream_protocol(family, SOCK_STREAM),
                     raw_fd, ec);
    if (ec) {
      log::warn("WebSocket socket assign failed: {}", ec.message());
      ::close(raw_fd);
      co_return;
    }
    auto conn = std::make_shared<WebSocketConnection>(std::move(ws_socket), req);
    co_await ws_handler(std::move(conn), std::move(req));
  }

  static auto handle_connection(std::shared_ptr<Impl> self, tcp::socket socket)
      -> spawn_task {
    const int fd_num = socket.native_handle();
    beast::flat_buffer buffer;

    try {
      while (self->running.load(std::memory_order_acquire)) {
        beast_http::request_parser<beast_http::vector_body<uint8_t>> parser;
        parser.header_limit(http_limits::kHeaderLimit);
        parser.body_limit(http_limits::kBodyLimit);

        auto [read_ec, read_n] = co_await beast_http::async_read(
            socket, buffer, parser,
            boost::asio::cancel_after(timing::kHttpIoTimeout, use_nothrow));
        (void)read_n;
        if (read_ec) {
          if (read_ec != boost::asio::error::eof &&
              read_ec != beast_http::error::end_of_stream &&
              read_ec != boost::asio::error::operation_aborted) {
            log::debug("HTTP read failed: fd={} err={}", fd_num,
                       read_ec.message());
          }
          break;
        }

        auto beast_req = parser.release();
        const auto version = beast_req.version();
        const bool keep_alive = beast_req.keep_alive();
        auto req = to_request(std::move(beast_req));
        log::debug("HTTP {} {} (fd={})", req.method, req.path, fd_num);

        if (req.is_websocket_upgrade()) {
          co_await self->upgrade(std::move(socket), std::move(req));
          co_return;
        }

        auto resp = co_await self->router.route(std::move(req));
        auto beast_resp = to_beast_response(std::move(resp), version,
                                            keep_alive);
        auto [write_ec, written] = co_await beast_http::async_write(
            socket, beast_resp,
            boost::asio::cancel_after(timing::kHttpIoTimeout, use_nothrow));
        (void)written;
        if (write_ec) {
          log::debug("HTTP write failed: fd={} err={}", fd_num,
                     write_ec.message());
          break;
        }
        if (!keep_alive) {
          break;
        }
      }
    } catch (const std::exception &e) {
      log::error("Exception in HTTP connection handler: {}", e.what());
    }

    boost::system::error_code ec;
    socket.shutdown(tcp::socket::shutdown_both, ec);
  }

  static auto accept_loop(std::shared_ptr<Impl> self,
                          std::shared_ptr<tcp::acceptor> acceptor,
                          bool spread) -> spawn_task {
    while (self->running.load(std::memory_order_acquire)) {
      // Without SO_REUSEPORT one acceptor hands sockets out round-robin.
      const shard_id target =
          spread ? self->next_shard.fetch_add(1, std::memory_order_relaxed) %
                       self->runtime.shard_count()
                 : self->runtime.current_shard();
      auto [ec, socket] = co_await acceptor->async_accept(
          self->runtime.context_for(target), use_nothrow);
      if (ec) {
        if (self->running.load(std::memory_order_acquire) &&
            ec != boost::asio::error::operation_aborted) {
          log::error("Accept failed: {}", ec.message());
        }
        break;
      }
      boost::system::error_code opt_ec;
      socket.set_option(tcp::no_delay(true), opt_ec);
      self->runtime.spawn_on(target, handle_connection(self, std::move(socket)));
    }
  }

  auto close_acceptors() -> void {
    for (unsigned i = 0; i < acceptors.size(); ++i) {
      auto acceptor = std::exchange(acceptors[i], nullptr);
      if (!acceptor) {
        continue;
      }
      runtime.post_to(i, [acceptor] {
        boost::system::error_code ec;
        acceptor->cancel(ec);
        acceptor->close(ec);
      });
    }
  }
};

HttpServer::HttpServer(Runtime &runtime)
    : impl_(std::make_shared<Impl>(runtime)) {}

HttpServer::~HttpServer() { stop(); }

auto HttpServer::router() -> Router & { return impl_->router; }

auto HttpServer::set_websocket_handler(WebSocketHandler handler) -> void {
  impl_->ws_handler = std::move(handler);
}

auto HttpServer::start(std::string_view host, uint16_t port, bool reuse_port)
    -> Result<void> {
  if (impl_->running.load(std::memory_order_acquire)) {
    return fail(Error::InvalidState);
  }

  boost::system::error_code addr_ec;
  auto address = host.empty() ? boost::asio::ip::address(
                                    boost::asio::ip::address_v4::any())
                              : boost::asio::ip::make_address(host, addr_ec);
  if (addr_ec) {
    log::error("Invalid listen address '{}': {}", host, addr_ec.message());
    return fail(Error::InvalidArgument);
  }
  const tcp::endpoint endpoint{address, port};

  const unsigned acceptor_count =
      reuse_port ? impl_->runtime.shard_count() : 1U;
  for (unsigned i = 0; i < acceptor_count; ++i) {
    auto acceptor =
        std::make_shared<tcp::acceptor>(impl_->runtime.context_for(i));
    if (auto res = open_acceptor(*acceptor, endpoint, reuse_port); !res) {
      impl_->close_acceptors();
      return fail(res.error());
    }
    impl_->acceptors[i] = std::move(acceptor);
  }

  impl_->running.store(true, std::memory_order_release);
  for (unsigned i = 0; i < acceptor_count; ++i) {
    impl_->runtime.spawn_on(
        i, Impl::accept_loop(impl_, impl_->acceptors[i], !reuse_port));
  }

  log::info("HTTP server listening on {}:{} (acceptors={}, reuse_port={})",
            host, port, acceptor_count, reuse_port);
  return ok();
}

auto HttpServer::stop() -> void {
  if (!impl_->running.exchange(false)) {
    return;
  }
  impl_->close_acceptors();
  log::info("HTTP server stopped");
}

auto HttpServer::is_running() const -> bool {
  return impl_->running.load(std::memory_order_acquire);
}

} // namespace taskforge::http
