#include "taskforge/config/config.hpp"
#include "taskforge/config/toml_util.hpp"

#include "taskforge/util/log.hpp"

#include <boost/lexical_cast.hpp>

#include <cstdlib>
#include <string>
#include <string_view>
#include <type_traits>

namespace glz {

template <> struct meta<taskforge::StorageBackend> {
  using enum taskforge::StorageBackend;
  static constexpr auto value = enumerate("mysql", Mysql, "memory", Memory);
};

template <> struct meta<taskforge::DatabaseConfig> {
  using T = taskforge::DatabaseConfig;
  static constexpr auto value =
      object("host", &T::host, "port", &T::port, "username", &T::username,
             "password", &T::password, "database", &T::database, "pool_size",
             &T::pool_size, "connect_timeout", &T::connect_timeout);
};

template <> struct meta<taskforge::ApiConfig> {
  using T = taskforge::ApiConfig;
  static constexpr auto value =
      object("enabled", &T::enabled, "port", &T::port, "host", &T::host,
             "reuse_port", &T::reuse_port);
};

template <> struct meta<taskforge::LoggingConfig> {
  using T = taskforge::LoggingConfig;
  static constexpr auto value = object("level", &T::level, "file", &T::file);
};

template <> struct meta<taskforge::RuntimeConfig> {
  using T = taskforge::RuntimeConfig;
  static constexpr auto value = object("shards", &T::shards);
};

template <> struct meta<taskforge::StreamingConfig> {
  using T = taskforge::StreamingConfig;
  static constexpr auto value = object(
      "cache_flush_interval_ms", &T::cache_flush_interval_ms,
      "db_flush_interval_ms", &T::db_flush_interval_ms,
      "stale_session_timeout_s", &T::stale_session_timeout_s,
      "stale_sweep_interval_s", &T::stale_sweep_interval_s, "content_ttl_s",
      &T::content_ttl_s, "cancel_ttl_s", &T::cancel_ttl_s);
};

template <> struct meta<taskforge::DispatcherConfig> {
  using T = taskforge::DispatcherConfig;
  static constexpr auto value = object("default_limit", &T::default_limit,
                                       "max_limit", &T::max_limit);
};

template <> struct meta<taskforge::ExecutorManagerConfig> {
  using T = taskforge::ExecutorManagerConfig;
  static constexpr auto value =
      object("cancel_url", &T::cancel_url, "timeout_ms", &T::timeout_ms);
};

template <> struct meta<taskforge::StorageConfig> {
  using T = taskforge::StorageConfig;
  static constexpr auto value = object("backend", &T::backend);
};

template <> struct meta<taskforge::SystemConfig> {
  using T = taskforge::SystemConfig;
  static constexpr auto value =
      object("database", &T::database, "api", &T::api, "logging", &T::logging,
             "runtime", &T::runtime, "streaming", &T::streaming, "dispatcher",
             &T::dispatcher, "executor_manager", &T::executor_manager,
             "storage", &T::storage);
};

} // namespace glz

namespace taskforge {
namespace {

[[nodiscard]] auto parse_flag(std::string_view v) -> bool {
  return v == "1" || v == "true" || v == "yes" || v == "on";
}

template <typename T> auto env_override(const char *name, T &field) -> void {
  const char *v = std::getenv(name);
  if (v == nullptr) {
    return;
  }
  if constexpr (std::is_same_v<T, bool>) {
    field = parse_flag(v);
  } else if constexpr (std::is_same_v<T, std::string>) {
    field = v;
  } else {
    // throws boost::bad_lexical_cast, reported by load_from_string
    field = boost::lexical_cast<T>(v);
  }
}

auto apply_env_overrides(SystemConfig &cfg) -> void {
  env_override("TASKFORGE_DB_HOST", cfg.database.host);
  env_override("TASKFORGE_DB_PORT", cfg.database.port);
  env_override("TASKFORGE_DB_USERNAME", cfg.database.username);
  env_override("TASKFORGE_DB_PASSWORD", cfg.database.password);
  env_override("TASKFORGE_DB_DATABASE", cfg.database.database);
  env_override("TASKFORGE_DB_POOL_SIZE", cfg.database.pool_size);
  env_override("TASKFORGE_DB_CONNECT_TIMEOUT", cfg.database.connect_timeout);

  env_override("TASKFORGE_API_ENABLED", cfg.api.enabled);
  env_override("TASKFORGE_API_HOST", cfg.api.host);
  env_override("TASKFORGE_API_PORT", cfg.api.port);
  env_override("TASKFORGE_API_REUSEPORT", cfg.api.reuse_port);

  env_override("TASKFORGE_LOG_LEVEL", cfg.logging.level);
  env_override("TASKFORGE_LOG_FILE", cfg.logging.file);
  env_override("TASKFORGE_RUNTIME_SHARDS", cfg.runtime.shards);

  env_override("TASKFORGE_STREAMING_CACHE_FLUSH_MS",
               cfg.streaming.cache_flush_interval_ms);
  env_override("TASKFORGE_STREAMING_DB_FLUSH_MS",
               cfg.streaming.db_flush_interval_ms);
  env_override("TASKFORGE_STREAMING_STALE_TIMEOUT_S",
               cfg.streaming.stale_session_timeout_s);

  env_override("TASKFORGE_EXECUTOR_MANAGER_CANCEL_URL",
               cfg.executor_manager.cancel_url);

  if (const char *v = std::getenv("TASKFORGE_STORAGE_BACKEND"); v != nullptr) {
    cfg.storage.backend = parse<StorageBackend>(v);
  }
}

} // namespace

auto ConfigLoader::validate(const SystemConfig &cfg) -> Result<void> {
  const auto &s = cfg.streaming;
  if (cfg.runtime.shards < 0 || cfg.database.pool_size == 0) {
    return fail(Error::InvalidArgument);
  }
  if (s.cache_flush_interval_ms <= 0 || s.db_flush_interval_ms <= 0 ||
      s.stale_session_timeout_s <= 0 || s.stale_sweep_interval_s <= 0 ||
      s.content_ttl_s <= 0 || s.cancel_ttl_s <= 0) {
    return fail(Error::InvalidArgument);
  }
  // durable writes are the expensive ones; they may not outpace the cache
  if (s.db_flush_interval_ms < s.cache_flush_interval_ms) {
    return fail(Error::InvalidArgument);
  }
  if (cfg.dispatcher.default_limit <= 0 ||
      cfg.dispatcher.max_limit < cfg.dispatcher.default_limit) {
    return fail(Error::InvalidArgument);
  }
  if (cfg.executor_manager.timeout_ms <= 0) {
    return fail(Error::InvalidArgument);
  }
  return ok();
}

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<SystemConfig> {
  auto text = toml_util::read_file(path);
  if (!text) {
    log::error("Cannot read config file {}", path);
    return fail(text.error());
  }
  return load_from_string(*text);
}

auto ConfigLoader::load_from_string(std::string_view toml_str)
    -> Result<SystemConfig> {
  SystemConfig cfg{};
  try {
    if (auto parsed = toml_util::parse_toml(toml_str, cfg); !parsed) {
      return fail(parsed.error());
    }
    apply_env_overrides(cfg);
  } catch (const boost::bad_lexical_cast &e) {
    log::error("Invalid TASKFORGE_* environment override: {}", e.what());
    return fail(Error::ParseError);
  }
  if (auto valid = validate(cfg); !valid) {
    log::error("Configuration rejected: {}", valid.error().message());
    return fail(valid.error());
  }
  return ok(std::move(cfg));
}

} // namespace taskforge
