#include "taskforge/app/application.hpp"
#include "taskforge/cli/commands.hpp"
#include "taskforge/config/config.hpp"
#include "taskforge/util/daemon.hpp"
#include "taskforge/util/json.hpp"
#include "taskforge/util/log.hpp"

#include <algorithm>
#include <chrono>
#include <csignal>
#include <print>
#include <string>

namespace taskforge::cli {

auto cmd_serve_start(const ServeStartOptions &opts) -> int {
  auto config_res = ConfigLoader::load_from_file(opts.config_file);
  if (!config_res) {
    std::println(stderr, "Error: {}: {}", opts.config_file,
                 config_res.error().message());
    return 1;
  }
  auto config = std::move(*config_res);

  if (opts.no_api) {
    config.api.enabled = false;
  }
  if (opts.log_level) {
    config.logging.level = *opts.log_level;
  }
  if (opts.log_file) {
    config.logging.file = *opts.log_file;
  }
  if (opts.shards) {
    config.runtime.shards = std::max(*opts.shards, 0);
  }

  if (opts.daemon && config.logging.file.empty()) {
    std::println(stderr,
                 "Error: --daemon requires a log file ([logging] file or "
                 "--log-file)");
    return 1;
  }
  if (!config.logging.file.empty() &&
      !log::set_output_file(config.logging.file)) {
    std::println(stderr, "Error: Failed to open log file: {}",
                 config.logging.file);
    return 1;
  }

  if (opts.daemon) {
    if (auto r = daemonize(); !r) {
      std::println(stderr, "Error: Failed to daemonize: {}",
                   r.error().message());
      return 1;
    }
  }

  log::set_level(config.logging.level);
  log::start();

  auto pid_guard = PidFileGuard::acquire(opts.pid_file);
  if (!pid_guard) {
    if (pid_guard.error() == make_error_code(Error::AlreadyExists)) {
      log::error("TaskForge is already running (pid file locked: {})",
                 opts.pid_file);
    } else {
      log::error("Failed to acquire pid file '{}': {}", opts.pid_file,
                 pid_guard.error().message());
    }
    log::stop();
    return 1;
  }

  setup_signal_handlers();

  int exit_code = 0;
  {
    Application app(std::move(config));
    if (auto r = app.start(); !r) {
      log::error("Failed to start: {}", r.error().message());
      exit_code = 1;
    } else {
      const auto &cfg = app.config();
      if (cfg.api.enabled) {
        log::info("TaskForge started on {}:{} (pid_file={})", cfg.api.host,
                  cfg.api.port, opts.pid_file);
      } else {
        log::info("TaskForge started without API (pid_file={})",
                  opts.pid_file);
      }
      wait_for_shutdown();
      log::info("Shutdown requested, draining");
      app.stop();
      log::info("TaskForge stopped.");
    }
  }
  log::stop();
  return exit_code;
}

auto cmd_serve_stop(const ServeStopOptions &opts) -> int {
  auto pid_res = read_pid_file(opts.pid_file);
  if (!pid_res) {
    if (pid_res.error() == make_error_code(Error::FileNotFound)) {
      std::println("TaskForge is not running (no pid file: {}).",
                   opts.pid_file);
      return 0;
    }
    std::println(stderr, "Error: Failed to read pid file '{}': {}",
                 opts.pid_file, pid_res.error().message());
    return 1;
  }
  const std::int64_t pid = *pid_res;

  if (!is_process_alive(pid)) {
    if (auto r = remove_pid_file(opts.pid_file); !r) {
      std::println(stderr, "Warning: stale pid file not removed: {}",
                   r.error().message());
    }
    std::println("TaskForge is not running (stale pid file).");
    return 0;
  }

  if (auto r = send_signal(pid, SIGTERM); !r) {
    std::println(stderr, "Error: Failed to send SIGTERM to pid {}: {}", pid,
                 r.error().message());
    return 1;
  }
  const auto timeout = std::chrono::seconds(std::max(opts.timeout_sec, 1));
  if (wait_for_process_exit(pid, timeout)) {
    std::println("TaskForge stopped (pid={}).", pid);
    return 0;
  }
  if (!opts.force) {
    std::println(stderr,
                 "Error: Timed out waiting for pid {} to stop. Retry with "
                 "--force.",
                 pid);
    return 1;
  }

  if (auto r = send_signal(pid, SIGKILL); !r) {
    std::println(stderr, "Error: Failed to send SIGKILL to pid {}: {}", pid,
                 r.error().message());
    return 1;
  }
  if (!wait_for_process_exit(pid, std::chrono::seconds(2))) {
    std::println(stderr, "Error: Process {} did not exit after SIGKILL.", pid);
    return 1;
  }
  if (auto r = remove_pid_file(opts.pid_file); !r) {
    std::println(stderr, "Warning: pid file not removed: {}",
                 r.error().message());
  }
  std::println("TaskForge killed (pid={}).", pid);
  return 0;
}

auto cmd_serve_status(const ServeStatusOptions &opts) -> int {
  std::int64_t pid = 0;
  bool running = false;

  auto pid_res = read_pid_file(opts.pid_file);
  if (pid_res) {
    pid = *pid_res;
    running = is_process_alive(pid);
  } else if (pid_res.error() != make_error_code(Error::FileNotFound)) {
    std::println(stderr, "Error: Failed to read pid file '{}': {}",
                 opts.pid_file, pid_res.error().message());
    return 1;
  }
  const bool stale = pid_res.has_value() && !running;

  if (opts.json) {
    JsonValue obj = JsonObject{};
    obj["running"] = running;
    obj["pid"] = pid;
    obj["stale_pid_file"] = stale;
    obj["pid_file"] = opts.pid_file;
    std::println("{}", dump_json(obj));
    return running ? 0 : 1;
  }

  if (running) {
    std::println("TaskForge is running (pid={}, pid_file={}).", pid,
                 opts.pid_file);
    return 0;
  }
  if (stale) {
    std::println("TaskForge is stopped (stale pid file {}, pid={}).",
                 opts.pid_file, pid);
    return 1;
  }
  std::println("TaskForge is stopped.");
  return 1;
}

} // namespace taskforge::cli
