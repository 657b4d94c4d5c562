#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <format>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

namespace taskforge::log {

enum class Level : std::uint8_t { Trace, Debug, Info, Warn, Error };

inline constexpr std::array<std::string_view, 5> level_names = {
    "trace", "debug", "info", "warn", "error"};

inline constexpr std::array<std::string_view, 5> level_colors = {
    "\o{33}[90m", "\o{33}[36m", "\o{33}[32m", "\o{33}[33m", "\o{33}[31m"};

[[nodiscard]] inline auto level_name(Level level) -> std::string_view {
  return level_names.at(std::to_underlying(level));
}

[[nodiscard]] auto parse_level(std::string_view name) noexcept -> Level;

/// Process-wide asynchronous logger. Producers format on their own thread
/// and hand complete lines to a single writer thread over a bounded
/// channel; when the channel is full the line is written inline on a TTY
/// and dropped otherwise.
class Logger {
public:
  Logger();
  ~Logger();

  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  auto start() -> void;
  auto stop() -> void;

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }
  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }
  [[nodiscard]] auto enabled(Level level) const noexcept -> bool {
    return level >= this->level();
  }

  auto set_output_stderr() -> void;
  /// Empty path switches back to stderr. Returns false if the file cannot
  /// be opened; the previous sink stays active.
  auto set_output_file(std::string_view path) -> bool;

  [[nodiscard]] auto dropped() const noexcept -> std::uint64_t {
    return dropped_.load(std::memory_order_relaxed);
  }

  auto submit(Level level, std::string_view message) -> void;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
  std::atomic<Level> level_{Level::Info};
  std::atomic<std::uint64_t> dropped_{0};
};

auto logger() -> Logger &;

inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}
inline auto set_level(std::string_view name) noexcept -> void {
  logger().set_level(parse_level(name));
}
inline auto set_output_file(std::string_view path) -> bool {
  return logger().set_output_file(path);
}
inline auto set_output_stderr() -> void { logger().set_output_stderr(); }
inline auto start() -> void { logger().start(); }
inline auto stop() -> void { logger().stop(); }

template <typename... Args>
auto write(Level level, std::format_string<Args...> fmt, Args &&...args)
    -> void {
  auto &sink = logger();
  if (!sink.enabled(level)) {
    return;
  }
  sink.submit(level, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
auto trace(std::format_string<Args...> fmt, Args &&...args) -> void {
  write(Level::Trace, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(std::format_string<Args...> fmt, Args &&...args) -> void {
  write(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(std::format_string<Args...> fmt, Args &&...args) -> void {
  write(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(std::format_string<Args...> fmt, Args &&...args) -> void {
  write(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(std::format_string<Args...> fmt, Args &&...args) -> void {
  write(Level::Error, fmt, std::forward<Args>(args)...);
}

} // namespace taskforge::log
