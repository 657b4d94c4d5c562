#include "taskforge/cli/commands.hpp"
#include "taskforge/config/config.hpp"
#include "taskforge/util/json.hpp"
#include "taskforge/util/log.hpp"

#include <cstdint>
#include <print>

namespace taskforge::cli {

auto cmd_validate(const ValidateOptions &opts) -> int {
  log::set_output_stderr();
  auto config_res = ConfigLoader::load_from_file(opts.config_file);

  if (opts.json) {
    JsonValue obj = JsonObject{};
    obj["file"] = opts.config_file;
    obj["valid"] = config_res.has_value();
    if (config_res) {
      obj["storage"] = std::string(to_string_view(config_res->storage.backend));
      obj["api_port"] = static_cast<std::int64_t>(config_res->api.port);
      obj["shards"] = static_cast<std::int64_t>(config_res->runtime.shards);
    } else {
      obj["error"] = config_res.error().message();
    }
    std::println("{}", dump_json(obj));
    return config_res ? 0 : 1;
  }

  if (!config_res) {
    std::println(stderr, "INVALID {}: {}", opts.config_file,
                 config_res.error().message());
    return 1;
  }
  const auto &cfg = *config_res;
  std::println("OK {}", opts.config_file);
  std::println("  storage:  {}", to_string_view(cfg.storage.backend));
  std::println("  database: {}@{}:{}/{}", cfg.database.username,
               cfg.database.host, cfg.database.port, cfg.database.database);
  std::println("  api:      {} {}:{}", cfg.api.enabled ? "on" : "off",
               cfg.api.host, cfg.api.port);
  std::println("  shards:   {}", cfg.runtime.shards);
  if (!cfg.executor_manager.cancel_url.empty()) {
    std::println("  cancel forwarding: {}", cfg.executor_manager.cancel_url);
  }
  return 0;
}

} // namespace taskforge::cli
