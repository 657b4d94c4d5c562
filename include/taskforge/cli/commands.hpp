#pragma once

#include <optional>
#include <string>

namespace taskforge::cli {

struct ServeStartOptions {
  std::string config_file;
  std::optional<std::string> log_file;
  std::optional<std::string> log_level;
  std::optional<int> shards;
  std::string pid_file;
  bool no_api{false};
  bool daemon{false};
};

struct ServeStopOptions {
  std::string pid_file;
  int timeout_sec{10};
  bool force{false};
};

struct ServeStatusOptions {
  std::string pid_file;
  bool json{false};
};

struct DbOptions {
  std::string config_file;
};

struct ValidateOptions {
  std::string config_file;
  bool json{false};
};

[[nodiscard]] auto cmd_serve_start(const ServeStartOptions &opts) -> int;
[[nodiscard]] auto cmd_serve_stop(const ServeStopOptions &opts) -> int;
[[nodiscard]] auto cmd_serve_status(const ServeStatusOptions &opts) -> int;
[[nodiscard]] auto cmd_db_init(const DbOptions &opts) -> int;
[[nodiscard]] auto cmd_validate(const ValidateOptions &opts) -> int;

} // namespace taskforge::cli
