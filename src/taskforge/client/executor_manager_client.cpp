#include "taskforge/client/executor_manager_client.hpp"

#include "taskforge/client/http/http_client.hpp"
#include "taskforge/util/json.hpp"
#include "taskforge/util/log.hpp"

#include <boost/asio/this_coro.hpp>

#include <chrono>
#include <utility>

namespace taskforge {

ExecutorManagerClient::ExecutorManagerClient(ExecutorManagerConfig config)
    : config_(std::move(config)) {}

auto ExecutorManagerClient::cancel(const CancelForward &request)
    -> task<Result<void>> {
  if (!enabled()) {
    co_return ok();
  }
  auto url = http::parse_http_url(config_.cancel_url);
  if (!url) {
    log::error("Invalid executor manager cancel URL '{}'", config_.cancel_url);
    co_return fail(url.error());
  }

  const auto timeout = std::chrono::milliseconds(config_.timeout_ms);
  auto executor = co_await boost::asio::this_coro::executor;
  auto client = co_await http::HttpClient::connect(
      executor, url->host, url->port,
      http::HttpClientConfig{.connect_timeout = timeout,
                             .read_timeout = timeout});
  if (!client) {
    log::warn("Executor manager unreachable at {}:{}: {}", url->host,
              url->port, client.error().message());
    co_return fail(client.error());
  }

  const JsonValue body{{"task_id", request.task_id.value()},
                       {"subtask_id", request.subtask_id.value()},
                       {"executor_name", request.executor_name}};
  auto resp = co_await (*client)->post_json(url->target, dump_json(body));
  if (!resp) {
    log::warn("Executor manager cancel failed for {}: {}",
              request.executor_name, resp.error().message());
    co_return fail(resp.error());
  }
  if (!resp->is_success()) {
    log::warn("Executor manager rejected cancel for {}: status={}",
              request.executor_name, resp->status);
    co_return fail(Error::ProtocolError);
  }
  log::info("Cancel forwarded to executor {} (subtask {})",
            request.executor_name, request.subtask_id);
  co_return ok();
}

} // namespace taskforge
