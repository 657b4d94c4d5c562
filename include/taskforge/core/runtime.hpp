#pragma once

#include "taskforge/core/coroutine.hpp"
#include "taskforge/core/error.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <limits>
#include <memory>
#include <optional>
#include <string_view>
#include <thread>
#include <vector>

namespace taskforge {

using shard_id = unsigned;
inline constexpr shard_id kInvalidShard = std::numeric_limits<shard_id>::max();

/// A fixed set of single-threaded io_contexts. State that belongs to a shard
/// is only touched from that shard's thread; other threads reach it by
/// posting or spawning onto `executor_for(id)`.
class Runtime {
public:
  explicit Runtime(unsigned num_shards = 0);
  ~Runtime() noexcept;

  Runtime(const Runtime &) = delete;
  Runtime &operator=(const Runtime &) = delete;

  [[nodiscard]] auto start() -> Result<void>;
  auto stop() noexcept -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool;

  template <typename T> auto spawn_on(shard_id target, task<T> coro) -> void {
    co_spawn(executor_for(target), std::move(coro), detached);
  }

  /// Round-robin placement for work with no shard affinity.
  template <typename T> auto spawn_external(task<T> coro) -> void {
    auto target = static_cast<shard_id>(
        external_rr_.fetch_add(1, std::memory_order_relaxed) % num_shards_);
    spawn_on(target, std::move(coro));
  }

  template <typename F> auto post_to(shard_id target, F &&fn) -> void {
    boost::asio::post(executor_for(target), std::forward<F>(fn));
  }

  [[nodiscard]] auto executor_for(shard_id id)
      -> boost::asio::io_context::executor_type {
    return contexts_[id % num_shards_]->get_executor();
  }

  [[nodiscard]] auto context_for(shard_id id) -> boost::asio::io_context & {
    return *contexts_[id % num_shards_];
  }

  /// Stable owner shard for a key; the same key always maps to the same shard.
  [[nodiscard]] auto shard_for(std::int64_t key) const noexcept -> shard_id;
  [[nodiscard]] auto shard_for(std::string_view key) const noexcept
      -> shard_id;

  [[nodiscard]] auto shard_count() const noexcept -> unsigned {
    return num_shards_;
  }
  [[nodiscard]] auto current_shard() const noexcept -> shard_id;
  [[nodiscard]] auto is_current_shard(shard_id id) const noexcept -> bool;

private:
  auto run_shard(shard_id id) -> void;

  std::atomic<bool> running_{false};
  unsigned num_shards_;
  std::vector<std::unique_ptr<boost::asio::io_context>> contexts_;
  std::vector<std::optional<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>>
      work_guards_;
  std::vector<std::jthread> threads_;
  std::atomic<std::uint64_t> external_rr_{0};
};

namespace detail {
inline thread_local shard_id current_shard_id = kInvalidShard;
inline thread_local const Runtime *current_runtime = nullptr;
} // namespace detail

} // namespace taskforge
