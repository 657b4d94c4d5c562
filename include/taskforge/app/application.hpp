#pragma once

#include "taskforge/config/system_config.hpp"
#include "taskforge/core/coroutine.hpp"
#include "taskforge/core/error.hpp"
#include "taskforge/core/runtime.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_future.hpp>

#include <atomic>
#include <memory>

namespace taskforge {

class ApiServer;
class CoordinatorStore;
class Dispatcher;
class ExecutorManagerClient;
class FastCache;
class ResourceStore;
class StatusAggregator;

namespace http {
class WebSocketHub;
} // namespace http

namespace streaming {
class StreamingIngestor;
} // namespace streaming

// Owns the runtime and every service of one coordinator process and wires
// them together.
class Application {
public:
  explicit Application(SystemConfig config);
  ~Application();

  Application(const Application &) = delete;
  auto operator=(const Application &) -> Application & = delete;

  [[nodiscard]] auto config() const noexcept -> const SystemConfig & {
    return config_;
  }

  // Lifecycle
  [[nodiscard]] auto start() -> Result<void>;
  auto stop() noexcept -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool {
    return running_.load(std::memory_order_acquire);
  }
  /// Opens the store once (creating the schema) and shuts down again.
  [[nodiscard]] auto init_db_only() -> Result<void>;

  // Service access
  [[nodiscard]] auto runtime() -> Runtime & { return runtime_; }
  [[nodiscard]] auto store() -> CoordinatorStore &;
  [[nodiscard]] auto resources() -> ResourceStore &;
  [[nodiscard]] auto dispatcher() -> Dispatcher &;
  [[nodiscard]] auto aggregator() -> StatusAggregator &;
  [[nodiscard]] auto ingestor() -> streaming::StreamingIngestor &;
  [[nodiscard]] auto hub() -> http::WebSocketHub &;
  [[nodiscard]] auto api_server() -> ApiServer *;

  /// Runs `op` on a shard and blocks the calling (non-shard) thread until it
  /// finishes.
  template <typename T> auto sync_wait(task<T> op) -> T {
    auto fut = boost::asio::co_spawn(runtime_.executor_for(0), std::move(op),
                                     boost::asio::use_future);
    return fut.get();
  }

private:
  SystemConfig config_;
  Runtime runtime_;
  std::unique_ptr<CoordinatorStore> store_;
  ResourceStore *resources_{nullptr};
  std::unique_ptr<FastCache> cache_;
  std::unique_ptr<http::WebSocketHub> hub_;
  std::unique_ptr<StatusAggregator> aggregator_;
  std::unique_ptr<streaming::StreamingIngestor> ingestor_;
  std::unique_ptr<Dispatcher> dispatcher_;
  std::unique_ptr<ExecutorManagerClient> executor_manager_;
  std::unique_ptr<ApiServer> api_;
  std::atomic<bool> running_{false};
};

} // namespace taskforge
