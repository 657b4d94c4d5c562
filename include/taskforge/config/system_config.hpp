#pragma once

#include "taskforge/util/enum.hpp"

#include <boost/describe/enum.hpp>

#include <chrono>
#include <cstdint>
#include <string>

namespace taskforge {

struct DatabaseConfig {
  std::string host{"127.0.0.1"};
  uint16_t port{3306};
  std::string username{"taskforge"};
  std::string password{"taskforge"};
  std::string database{"taskforge"};
  uint16_t pool_size{8};
  uint16_t connect_timeout{5}; // seconds

  auto operator==(const DatabaseConfig &) const -> bool = default;
};

struct ApiConfig {
  bool enabled{true};
  uint16_t port{8080};
  std::string host{"127.0.0.1"};
  bool reuse_port{false};

  auto operator==(const ApiConfig &) const -> bool = default;
};

struct LoggingConfig {
  std::string level{"info"};
  std::string file; // empty: stderr

  auto operator==(const LoggingConfig &) const -> bool = default;
};

struct RuntimeConfig {
  int shards{0}; // 0 = hardware_concurrency

  auto operator==(const RuntimeConfig &) const -> bool = default;
};

/// Persistence cadences of the streaming ingestor.
struct StreamingConfig {
  int cache_flush_interval_ms{1000};
  int db_flush_interval_ms{5000};
  int stale_session_timeout_s{3600};
  int stale_sweep_interval_s{300};
  int content_ttl_s{3600};
  int cancel_ttl_s{300};

  [[nodiscard]] auto cache_flush_interval() const {
    return std::chrono::milliseconds(cache_flush_interval_ms);
  }
  [[nodiscard]] auto db_flush_interval() const {
    return std::chrono::milliseconds(db_flush_interval_ms);
  }
  [[nodiscard]] auto stale_session_timeout() const {
    return std::chrono::seconds(stale_session_timeout_s);
  }
  [[nodiscard]] auto stale_sweep_interval() const {
    return std::chrono::seconds(stale_sweep_interval_s);
  }
  [[nodiscard]] auto content_ttl() const {
    return std::chrono::seconds(content_ttl_s);
  }
  [[nodiscard]] auto cancel_ttl() const {
    return std::chrono::seconds(cancel_ttl_s);
  }

  auto operator==(const StreamingConfig &) const -> bool = default;
};

struct DispatcherConfig {
  int default_limit{1};
  int max_limit{100};

  auto operator==(const DispatcherConfig &) const -> bool = default;
};

/// Where cancel requests are forwarded. An empty URL disables forwarding.
struct ExecutorManagerConfig {
  std::string cancel_url;
  int timeout_ms{5000};

  auto operator==(const ExecutorManagerConfig &) const -> bool = default;
};

enum class StorageBackend : std::uint8_t { Mysql, Memory };
BOOST_DESCRIBE_ENUM(StorageBackend, Mysql, Memory)
TASKFORGE_DEFINE_ENUM_SERDE(StorageBackend, StorageBackend::Mysql)

struct StorageConfig {
  StorageBackend backend{StorageBackend::Mysql};

  auto operator==(const StorageConfig &) const -> bool = default;
};

struct SystemConfig {
  DatabaseConfig database;
  ApiConfig api;
  LoggingConfig logging;
  RuntimeConfig runtime;
  StreamingConfig streaming;
  DispatcherConfig dispatcher;
  ExecutorManagerConfig executor_manager;
  StorageConfig storage;

  auto operator==(const SystemConfig &) const -> bool = default;
};

} // namespace taskforge
