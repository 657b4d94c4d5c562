#include "taskforge/app/application.hpp"

#include "taskforge/app/api/api_server.hpp"
#include "taskforge/app/http/websocket.hpp"
#include "taskforge/cache/memory_cache.hpp"
#include "taskforge/client/executor_manager_client.hpp"
#include "taskforge/dispatch/dispatcher.hpp"
#include "taskforge/status/status_aggregator.hpp"
#include "taskforge/storage/memory_store.hpp"
#include "taskforge/storage/mysql_store.hpp"
#include "taskforge/streaming/streaming_ingestor.hpp"
#include "taskforge/util/log.hpp"

#include <csignal>

namespace taskforge {

Application::Application(SystemConfig config)
    : config_(std::move(config)),
      runtime_(static_cast<unsigned>(config_.runtime.shards)) {
  std::signal(SIGPIPE, SIG_IGN);

  if (config_.storage.backend == StorageBackend::Memory) {
    auto memory = std::make_unique<storage::MemoryStore>();
    resources_ = memory.get();
    store_ = std::move(memory);
  } else {
    auto mysql = std::make_unique<storage::MySQLStore>(runtime_.executor_for(0),
                                                       config_.database);
    resources_ = mysql.get();
    store_ = std::move(mysql);
  }

  cache_ = std::make_unique<cache::MemoryCache>();
  hub_ = std::make_unique<http::WebSocketHub>(runtime_);
  aggregator_ = std::make_unique<StatusAggregator>(*store_);
  ingestor_ = std::make_unique<streaming::StreamingIngestor>(
      runtime_, *store_, *cache_, *hub_, *aggregator_, config_.streaming);
  dispatcher_ =
      std::make_unique<Dispatcher>(*store_, *resources_, config_.dispatcher);
  executor_manager_ =
      std::make_unique<ExecutorManagerClient>(config_.executor_manager);
  api_ = std::make_unique<ApiServer>(
      ApiServices{
          .runtime = runtime_,
          .store = *store_,
          .dispatcher = *dispatcher_,
          .aggregator = *aggregator_,
          .ingestor = *ingestor_,
          .executor_manager = *executor_manager_,
          .hub = *hub_,
      },
      config_.api);
}

Application::~Application() { stop(); }

auto Application::start() -> Result<void> {
  if (running_.exchange(true)) {
    return ok();
  }

  if (auto r = runtime_.start(); !r) {
    running_ = false;
    return fail(r.error());
  }

  if (auto r = sync_wait(store_->open()); !r) {
    log::error("Failed to open {} store: {}",
               to_string_view(config_.storage.backend), r.error().message());
    runtime_.stop();
    running_ = false;
    return fail(r.error());
  }

  ingestor_->start();

  if (auto r = api_->start(); !r) {
    ingestor_->stop();
    sync_wait(store_->close());
    runtime_.stop();
    running_ = false;
    return fail(r.error());
  }

  log::info("Coordinator running with {} shard(s), {} store",
            runtime_.shard_count(), to_string_view(config_.storage.backend));
  return ok();
}

auto Application::stop() noexcept -> void {
  if (!running_.exchange(false)) {
    return;
  }
  api_->stop();
  ingestor_->stop();
  if (store_->is_open()) {
    sync_wait(store_->close());
  }
  runtime_.stop();
}

auto Application::init_db_only() -> Result<void> {
  if (running_.load(std::memory_order_acquire)) {
    return fail(Error::InvalidState);
  }
  if (auto r = runtime_.start(); !r) {
    return fail(r.error());
  }
  auto opened = sync_wait(store_->open());
  if (opened && store_->is_open()) {
    sync_wait(store_->close());
  }
  runtime_.stop();
  return opened;
}

auto Application::store() -> CoordinatorStore & { return *store_; }

auto Application::resources() -> ResourceStore & { return *resources_; }

auto Application::dispatcher() -> Dispatcher & { return *dispatcher_; }

auto Application::aggregator() -> StatusAggregator & { return *aggregator_; }

auto Application::ingestor() -> streaming::StreamingIngestor & {
  return *ingestor_;
}

auto Application::hub() -> http::WebSocketHub & { return *hub_; }

auto Application::api_server() -> ApiServer * { return api_.get(); }

} // namespace taskforge
