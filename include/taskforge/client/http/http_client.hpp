#pragma once

#include "taskforge/client/http/http_types.hpp"
#include "taskforge/core/coroutine.hpp"
#include "taskforge/core/error.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace taskforge::http {

struct HttpClientConfig {
  std::chrono::milliseconds connect_timeout{5000};
  std::chrono::milliseconds read_timeout{5000};
  std::size_t max_response_size{1024UL * 1024UL};
};

/// Plain-TCP HTTP/1.1 client over one connection.
class HttpClient {
public:
  HttpClient(boost::asio::ip::tcp::socket socket, std::string host,
             HttpClientConfig config = {});
  ~HttpClient();

  HttpClient(const HttpClient &) = delete;
  auto operator=(const HttpClient &) -> HttpClient & = delete;

  static auto connect(boost::asio::any_io_executor executor,
                      std::string_view host, uint16_t port,
                      HttpClientConfig config = {})
      -> task<Result<std::unique_ptr<HttpClient>>>;

  auto request(HttpRequest req) -> task<Result<HttpResponse>>;
  auto post_json(std::string_view target, std::string_view json)
      -> task<Result<HttpResponse>>;

  [[nodiscard]] auto is_connected() const noexcept -> bool;
  auto close() -> void;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

struct ParsedUrl {
  std::string host;
  uint16_t port{80};
  std::string target{"/"}; // path plus query
};

/// Accepts http:// URLs only.
[[nodiscard]] auto parse_http_url(std::string_view url) -> Result<ParsedUrl>;

} // namespace taskforge::http
