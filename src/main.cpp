#include "taskforge/cli/commands.hpp"
#include "taskforge/util/daemon.hpp"
#include "taskforge/util/log.hpp"

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <string>

namespace {

auto default_config() -> std::string {
  if (const char *env = std::getenv("TASKFORGE_CONFIG"); env && *env) {
    return env;
  }
  return "system_config.toml";
}

auto add_config_option(CLI::App *cmd, std::string &target) -> void {
  cmd->add_option("-c,--config", target,
                  "System config file (default: $TASKFORGE_CONFIG or "
                  "system_config.toml)")
      ->check(CLI::ExistingFile);
}

} // namespace

int main(int argc, char *argv[]) {
  // Keep non-serve CLI output clean by default.
  taskforge::log::set_output_stderr();
  taskforge::log::set_level(taskforge::log::Level::Warn);

  CLI::App app{"TaskForge", "Executor coordination service"};
  app.require_subcommand(1);
  app.footer("\nExamples:\n"
             "  taskforge serve start -c system_config.toml\n"
             "  taskforge db init -c system_config.toml\n"
             "  taskforge validate-config -c system_config.toml");

  const std::string config = default_config();
  const std::string pid_file{taskforge::kDefaultPidFile};

  auto *serve = app.add_subcommand("serve", "Service lifecycle operations");
  serve->require_subcommand(1);

  taskforge::cli::ServeStartOptions start_opts{.config_file = config,
                                               .pid_file = pid_file};
  auto *start = serve->add_subcommand("start", "Start the coordinator");
  add_config_option(start, start_opts.config_file);
  start->add_option("--log-file", start_opts.log_file,
                    "Log file path (required for --daemon)");
  start->add_option("--log-level", start_opts.log_level,
                    "Log level override: trace|debug|info|warn|error");
  start->add_option("--shards", start_opts.shards,
                    "Number of shards (default: CPU cores)");
  start->add_option("--pid-file", start_opts.pid_file, "Pid file path");
  start->add_flag("--no-api", start_opts.no_api, "Do not serve HTTP");
  start->add_flag("-d,--daemon", start_opts.daemon, "Run as daemon");
  start->callback([&start_opts]() {
    std::exit(taskforge::cli::cmd_serve_start(start_opts));
  });

  taskforge::cli::ServeStopOptions stop_opts{.pid_file = pid_file};
  auto *stop = serve->add_subcommand("stop", "Stop a running coordinator");
  stop->add_option("--pid-file", stop_opts.pid_file, "Pid file path");
  stop->add_option("--timeout", stop_opts.timeout_sec,
                   "Seconds to wait before failing or forcing stop");
  stop->add_flag("--force", stop_opts.force,
                 "Send SIGKILL if graceful stop times out");
  stop->callback([&stop_opts]() {
    std::exit(taskforge::cli::cmd_serve_stop(stop_opts));
  });

  taskforge::cli::ServeStatusOptions status_opts{.pid_file = pid_file};
  auto *status = serve->add_subcommand("status", "Show coordinator status");
  status->add_option("--pid-file", status_opts.pid_file, "Pid file path");
  status->add_flag("--json", status_opts.json, "Output JSON");
  status->callback([&status_opts]() {
    std::exit(taskforge::cli::cmd_serve_status(status_opts));
  });

  auto *db = app.add_subcommand("db", "Database management");
  db->require_subcommand(1);
  taskforge::cli::DbOptions db_init_opts{.config_file = config};
  auto *db_init = db->add_subcommand("init", "Create database and schema");
  add_config_option(db_init, db_init_opts.config_file);
  db_init->callback([&db_init_opts]() {
    std::exit(taskforge::cli::cmd_db_init(db_init_opts));
  });

  taskforge::cli::ValidateOptions validate_opts{.config_file = config};
  auto *validate =
      app.add_subcommand("validate-config", "Check a system config file");
  add_config_option(validate, validate_opts.config_file);
  validate->add_flag("--json", validate_opts.json, "Output JSON");
  validate->callback([&validate_opts]() {
    std::exit(taskforge::cli::cmd_validate(validate_opts));
  });

  CLI11_PARSE(app, argc, argv);
  return 0;
}
