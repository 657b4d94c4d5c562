#pragma once

#include "taskforge/config/system_config.hpp"
#include "taskforge/core/error.hpp"

#include <memory>

namespace taskforge {

class Runtime;
class CoordinatorStore;
class Dispatcher;
class StatusAggregator;
class ExecutorManagerClient;

namespace streaming {
class StreamingIngestor;
} // namespace streaming

namespace http {
class Router;
class WebSocketHub;
} // namespace http

/// Components the executor-facing API is served from. All of them must
/// outlive the ApiServer.
struct ApiServices {
  Runtime &runtime;
  CoordinatorStore &store;
  Dispatcher &dispatcher;
  StatusAggregator &aggregator;
  streaming::StreamingIngestor &ingestor;
  ExecutorManagerClient &executor_manager;
  http::WebSocketHub &hub;
};

class ApiServer {
public:
  ApiServer(ApiServices services, ApiConfig config);
  ~ApiServer();

  ApiServer(const ApiServer &) = delete;
  auto operator=(const ApiServer &) -> ApiServer & = delete;

  [[nodiscard]] auto start() -> Result<void>;
  auto stop() -> void;
  [[nodiscard]] auto is_running() const -> bool;

  /// Routes are registered at construction; exposed for in-process callers.
  auto router() -> http::Router &;

private:
  struct Impl;
  std::shared_ptr<Impl> impl_;
};

} // namespace taskforge
