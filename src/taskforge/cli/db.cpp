#include "taskforge/app/application.hpp"
#include "taskforge/cli/commands.hpp"
#include "taskforge/config/config.hpp"
#include "taskforge/util/log.hpp"

#include <print>

namespace taskforge::cli {

auto cmd_db_init(const DbOptions &opts) -> int {
  log::set_output_stderr();
  auto config_res = ConfigLoader::load_from_file(opts.config_file);
  if (!config_res) {
    std::println(stderr, "Error: {}: {}", opts.config_file,
                 config_res.error().message());
    return 1;
  }
  if (config_res->storage.backend != StorageBackend::Mysql) {
    std::println(stderr,
                 "Error: db init needs [storage] backend = \"mysql\" (got "
                 "\"{}\")",
                 to_string_view(config_res->storage.backend));
    return 1;
  }

  auto config = std::move(*config_res);
  config.api.enabled = false;
  const auto database = config.database.database;

  Application app(std::move(config));
  if (auto r = app.init_db_only(); !r) {
    std::println(stderr, "Error: {}", r.error().message());
    return 1;
  }
  std::println("Database schema initialized ({}).", database);
  return 0;
}

} // namespace taskforge::cli
