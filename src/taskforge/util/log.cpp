#include "taskforge/util/log.hpp"

#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/system/error_code.hpp>

#include <algorithm>
#include <mutex>
#include <optional>
#include <variant>
#include <vector>

#include <unistd.h>

namespace taskforge::log {

namespace {

constexpr std::size_t kQueueCapacity = 8192;
constexpr std::size_t kWriteBatch = 64;

struct Line {
  std::string text;
};

struct Reopen {
  std::string path; // empty: stderr
};

using Record = std::variant<Line, Reopen>;

auto format_line(Level level, std::string_view message, bool color)
    -> std::string {
  auto now = std::chrono::floor<std::chrono::milliseconds>(
      std::chrono::system_clock::now());
  auto tid = std::hash<std::thread::id>{}(std::this_thread::get_id()) % 1000000;
  if (color) {
    return std::format("[{:%Y-%m-%d %H:%M:%S}] [{}{}\o{33}[0m] [{}] {}\n", now,
                       level_colors.at(std::to_underlying(level)),
                       level_name(level), tid, message);
  }
  return std::format("[{:%Y-%m-%d %H:%M:%S}] [{}] [{}] {}\n", now,
                     level_name(level), tid, message);
}

auto is_tty(FILE *f) -> bool {
  if (f == nullptr) {
    return false;
  }
  int fd = ::fileno(f);
  return fd >= 0 && ::isatty(fd) != 0;
}

} // namespace

auto parse_level(std::string_view name) noexcept -> Level {
  const auto *it = std::ranges::find(level_names, name);
  if (it == level_names.end()) {
    return Level::Info;
  }
  return static_cast<Level>(std::distance(level_names.begin(), it));
}

struct Logger::Impl {
  using Channel = boost::asio::experimental::concurrent_channel<
      boost::asio::io_context::executor_type,
      void(boost::system::error_code, Record)>;

  boost::asio::io_context ctx{1};
  std::atomic<std::shared_ptr<Channel>> channel;
  std::jthread writer;
  std::atomic<bool> running{false};

  // Owned by the writer thread while running, by the caller otherwise.
  std::mutex sink_mu;
  FILE *out{stderr};
  FILE *file{nullptr};
  std::atomic<bool> colored{is_tty(stderr)};

  ~Impl() { close_file(); }

  auto close_file() -> void {
    if (file != nullptr) {
      std::fclose(file);
      file = nullptr;
    }
  }

  auto reopen(const std::string &path) -> bool {
    std::scoped_lock lock(sink_mu);
    if (path.empty()) {
      close_file();
      out = stderr;
      colored.store(is_tty(stderr), std::memory_order_release);
      return true;
    }
    FILE *f = std::fopen(path.c_str(), "a");
    if (f == nullptr) {
      return false;
    }
    std::setvbuf(f, nullptr, _IOLBF, 0);
    close_file();
    file = f;
    out = f;
    colored.store(false, std::memory_order_release);
    return true;
  }

  auto write_now(std::string_view text) -> void {
    std::scoped_lock lock(sink_mu);
    std::fwrite(text.data(), 1, text.size(), out);
    std::fflush(out);
  }

  auto apply(Record &rec, std::string &pending) -> void {
    if (auto *line = std::get_if<Line>(&rec)) {
      pending += line->text;
      return;
    }
    if (!pending.empty()) {
      write_now(pending);
      pending.clear();
    }
    (void)reopen(std::get<Reopen>(rec).path);
  }

  auto run_writer(std::shared_ptr<Channel> ch) -> void {
    std::string pending;
    for (;;) {
      std::optional<Record> first;
      boost::system::error_code recv_ec;
      ch->async_receive([&](boost::system::error_code ec, Record rec) {
        recv_ec = ec;
        if (!ec) {
          first = std::move(rec);
        }
      });
      ctx.restart();
      (void)ctx.run_one();
      if (recv_ec || !first) {
        break;
      }

      apply(*first, pending);
      for (std::size_t n = 1; n < kWriteBatch; ++n) {
        bool got = ch->try_receive([&](boost::system::error_code ec,
                                       Record rec) {
          if (!ec) {
            apply(rec, pending);
          }
        });
        if (!got) {
          break;
        }
      }
      if (!pending.empty()) {
        write_now(pending);
        pending.clear();
      }
    }

    while (ch->try_receive([&](boost::system::error_code ec, Record rec) {
      if (!ec) {
        apply(rec, pending);
      }
    })) {
    }
    if (!pending.empty()) {
      write_now(pending);
    }
  }
};

Logger::Logger() : impl_(std::make_unique<Impl>()) {}

Logger::~Logger() { stop(); }

auto Logger::start() -> void {
  if (impl_->running.exchange(true, std::memory_order_acq_rel)) {
    return;
  }
  impl_->ctx.restart();
  auto ch =
      std::make_shared<Impl::Channel>(impl_->ctx.get_executor(), kQueueCapacity);
  impl_->channel.store(ch, std::memory_order_release);
  impl_->writer =
      std::jthread([impl = impl_.get(), ch] { impl->run_writer(ch); });
}

auto Logger::stop() -> void {
  if (!impl_->running.exchange(false, std::memory_order_acq_rel)) {
    return;
  }
  auto ch = impl_->channel.exchange(nullptr, std::memory_order_acq_rel);
  if (ch) {
    ch->close();
  }
  if (impl_->writer.joinable()) {
    impl_->writer.join();
  }
}

auto Logger::set_output_stderr() -> void { (void)set_output_file({}); }

auto Logger::set_output_file(std::string_view path) -> bool {
  auto ch = impl_->channel.load(std::memory_order_acquire);
  if (!ch) {
    return impl_->reopen(std::string(path));
  }
  if (!path.empty()) {
    // probe before handing the switch to the writer
    FILE *probe = std::fopen(std::string(path).c_str(), "a");
    if (probe == nullptr) {
      return false;
    }
    std::fclose(probe);
  }
  return ch->try_send(boost::system::error_code{},
                      Record{Reopen{std::string(path)}});
}

auto Logger::submit(Level level, std::string_view message) -> void {
  auto text = format_line(level, message,
                          impl_->colored.load(std::memory_order_acquire));
  auto ch = impl_->channel.load(std::memory_order_acquire);
  if (!ch) {
    impl_->write_now(text);
    return;
  }
  if (ch->try_send(boost::system::error_code{}, Record{Line{std::move(text)}})) {
    return;
  }
  // Channel full. Blocking a shard thread on a piped stderr is worse than
  // losing a line.
  if (!impl_->colored.load(std::memory_order_acquire)) {
    dropped_.fetch_add(1, std::memory_order_relaxed);
    return;
  }
  impl_->write_now(format_line(level, message, true));
}

auto logger() -> Logger & {
  static Logger instance;
  return instance;
}

} // namespace taskforge::log
