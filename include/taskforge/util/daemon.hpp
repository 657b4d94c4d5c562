#pragma once

#include "taskforge/core/error.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace taskforge {

extern std::atomic<bool> g_shutdown_requested;

inline constexpr std::string_view kDefaultPidFile = "/tmp/taskforge.pid";

/// Exclusive lock on a pid file for the lifetime of the serving process.
class PidFileGuard {
public:
  PidFileGuard() = default;
  ~PidFileGuard();

  PidFileGuard(const PidFileGuard &) = delete;
  auto operator=(const PidFileGuard &) -> PidFileGuard & = delete;
  PidFileGuard(PidFileGuard &&other) noexcept;
  auto operator=(PidFileGuard &&other) noexcept -> PidFileGuard &;

  /// already-exists when another live process holds the lock.
  [[nodiscard]] static auto acquire(std::string_view path)
      -> Result<PidFileGuard>;

private:
  std::string path_;
  std::unique_ptr<void, void (*)(void *)> lock_{nullptr, nullptr};
  bool owns_{false};

  PidFileGuard(std::string path,
               std::unique_ptr<void, void (*)(void *)> lock) noexcept;
  auto release() noexcept -> void;
};

[[nodiscard]] auto daemonize() -> Result<void>;
[[nodiscard]] auto read_pid_file(std::string_view path) -> Result<std::int64_t>;
[[nodiscard]] auto remove_pid_file(std::string_view path) -> Result<void>;
[[nodiscard]] auto is_process_alive(std::int64_t pid) -> bool;
[[nodiscard]] auto send_signal(std::int64_t pid, int signal_no) -> Result<void>;
[[nodiscard]] auto wait_for_process_exit(std::int64_t pid,
                                         std::chrono::milliseconds timeout)
    -> bool;

/// SIGINT and SIGTERM set g_shutdown_requested; SIGPIPE is ignored.
void setup_signal_handlers();
void request_shutdown() noexcept;
void wait_for_shutdown();

} // namespace taskforge
