#include "taskforge/client/http/http_client.hpp"

#include "taskforge/core/asio_awaitable.hpp"
#include "taskforge/util/log.hpp"

#include <boost/asio/cancel_after.hpp>
#include <boost/asio/connect.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http.hpp>
#include <boost/url/parse.hpp>

#include <string>
#include <utility>

namespace taskforge::http {

namespace {

namespace beast = boost::beast;
namespace beast_http = beast::http;

auto to_verb(HttpMethod method) -> Result<beast_http::verb> {
  switch (method) {
  case HttpMethod::GET:
    return ok(beast_http::verb::get);
  case HttpMethod::POST:
    return ok(beast_http::verb::post);
  case HttpMethod::Other:
    break;
  }
  return fail(Error::InvalidArgument);
}

auto to_response(beast_http::response<beast_http::vector_body<uint8_t>> &&msg)
    -> HttpResponse {
  HttpResponse out;
  out.status = static_cast<HttpStatus>(msg.result_int());
  for (const auto &field : msg.base()) {
    out.headers.emplace(field.name_string(), field.value());
  }
  out.body = std::move(msg.body());
  return out;
}

} // namespace

struct HttpClient::Impl {
  boost::asio::ip::tcp::socket socket;
  std::string host;
  HttpClientConfig config;
  beast::flat_buffer buffer;
};

HttpClient::HttpClient(boost::asio::ip::tcp::socket socket, std::string host,
                       HttpClientConfig config)
    : impl_(std::make_unique<Impl>(Impl{.socket = std::move(socket),
                                        .host = std::move(host),
                                        .config = config,
                                        .buffer = {}})) {}

HttpClient::~HttpClient() { close(); }

auto HttpClient::connect(boost::asio::any_io_executor executor,
                         std::string_view host, uint16_t port,
                         HttpClientConfig config)
    -> task<Result<std::unique_ptr<HttpClient>>> {
  boost::asio::ip::tcp::resolver resolver(executor);
  auto [resolve_ec, endpoints] = co_await resolver.async_resolve(
      std::string(host), std::to_string(port),
      boost::asio::cancel_after(config.connect_timeout, use_nothrow));
  if (resolve_ec) {
    log::debug("Failed to resolve {}:{}: {}", host, port,
               resolve_ec.message());
    co_return fail(Error::InvalidUrl);
  }

  boost::asio::ip::tcp::socket socket(executor);
  auto [connect_ec, endpoint] = co_await boost::asio::async_connect(
      socket, endpoints,
      boost::asio::cancel_after(config.connect_timeout, use_nothrow));
  (void)endpoint;
  if (connect_ec) {
    log::debug("Failed to connect to {}:{}: {}", host, port,
               connect_ec.message());
    co_return fail(connect_ec == boost::asio::error::operation_aborted
                       ? make_error_code(Error::Timeout)
                       : std::error_code(connect_ec));
  }

  co_return ok(std::make_unique<HttpClient>(
      std::move(socket), std::format("{}:{}", host, port), config));
}

auto HttpClient::request(HttpRequest req) -> task<Result<HttpResponse>> {
  if (!is_connected()) {
    co_return fail(Error::InvalidState);
  }
  auto verb = to_verb(req.method);
  if (!verb) {
    co_return fail(verb.error());
  }

  beast_http::request<beast_http::vector_body<uint8_t>> msg{
      *verb,
      req.query_string.empty() ? req.path
                               : std::format("{}?{}", req.path,
                                             req.query_string),
      11};
  msg.set(beast_http::field::host, impl_->host);
  msg.set(beast_http::field::user_agent, "taskforge");
  for (const auto &[k, v] : req.headers) {
    msg.set(k, v);
  }
  msg.body() = std::move(req.body);
  msg.prepare_payload();

  auto [write_ec, written] = co_await beast_http::async_write(
      impl_->socket, msg,
      boost::asio::cancel_after(impl_->config.read_timeout, use_nothrow));
  (void)written;
  if (write_ec) {
    log::debug("HTTP request write failed: {}", write_ec.message());
    co_return fail(std::error_code(write_ec));
  }

  beast_http::response_parser<beast_http::vector_body<uint8_t>> parser;
  parser.body_limit(impl_->config.max_response_size);
  auto [read_ec, read_n] = co_await beast_http::async_read(
      impl_->socket, impl_->buffer, parser,
      boost::asio::cancel_after(impl_->config.read_timeout, use_nothrow));
  (void)read_n;
  if (read_ec) {
    log::debug("HTTP response read failed: {}", read_ec.message());
    co_return fail(read_ec == boost::asio::error::operation_aborted
                       ? make_error_code(Error::Timeout)
                       : std::error_code(read_ec));
  }
  co_return ok(to_response(parser.release()));
}

auto HttpClient::post_json(std::string_view target, std::string_view json)
    -> task<Result<HttpResponse>> {
  HttpRequest req;
  req.method = HttpMethod::POST;
  if (auto q = target.find('?'); q != std::string_view::npos) {
    req.path = std::string(target.substr(0, q));
    req.query_string = std::string(target.substr(q + 1));
  } else {
    req.path = std::string(target);
  }
  req.headers["Content-Type"] = "application/json";
  req.body.assign(json.begin(), json.end());
  co_return co_await request(std::move(req));
}

auto HttpClient::is_connected() const noexcept -> bool {
  return impl_ && impl_->socket.is_open();
}

auto HttpClient::close() -> void {
  if (!impl_) {
    return;
  }
  boost::system::error_code ec;
  impl_->socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
  impl_->socket.close(ec);
}

auto parse_http_url(std::string_view url) -> Result<ParsedUrl> {
  auto parsed = boost::urls::parse_uri(url);
  if (!parsed || parsed->scheme() != "http" || parsed->host().empty()) {
    return fail(Error::InvalidUrl);
  }
  ParsedUrl out;
  out.host = std::string(parsed->host());
  if (parsed->has_port()) {
    out.port = parsed->port_number();
    if (out.port == 0) {
      return fail(Error::InvalidUrl);
    }
  }
  auto path = std::string(parsed->encoded_path());
  out.target = path.empty() ? "/" : path;
  if (parsed->has_query()) {
    out.target += "?";
    out.target += std::string(parsed->encoded_query());
  }
  return ok(std::move(out));
}

} // namespace taskforge::http
