#include "taskforge/core/runtime.hpp"

#include "taskforge/util/log.hpp"

#include <algorithm>
#include <ranges>

namespace taskforge {

Runtime::Runtime(unsigned num_shards) {
  if (num_shards == 0) {
    num_shards = std::max(1U, std::thread::hardware_concurrency());
  }
  num_shards_ = num_shards;

  contexts_.reserve(num_shards);
  work_guards_.resize(num_shards);
  for ([[maybe_unused]] auto i : std::views::iota(0U, num_shards)) {
    // concurrency hint 1: each context is driven by exactly one thread
    contexts_.emplace_back(std::make_unique<boost::asio::io_context>(1));
  }
}

Runtime::~Runtime() noexcept { stop(); }

auto Runtime::start() -> Result<void> {
  if (running_.exchange(true)) {
    return ok();
  }

  log::debug("Starting runtime with {} shards", num_shards_);

  threads_.reserve(num_shards_);
  for (auto i : std::views::iota(0U, num_shards_)) {
    auto &ctx = *contexts_[i];
    ctx.restart();
    work_guards_[i].emplace(boost::asio::make_work_guard(ctx));
    threads_.emplace_back([this, i] { run_shard(i); });
  }
  return ok();
}

auto Runtime::stop() noexcept -> void {
  if (!running_.exchange(false)) {
    return;
  }
  for (auto i : std::views::iota(0U, num_shards_)) {
    if (work_guards_[i].has_value()) {
      work_guards_[i]->reset();
      work_guards_[i].reset();
    }
    contexts_[i]->stop();
  }
  threads_.clear();
}

auto Runtime::is_running() const noexcept -> bool {
  return running_.load(std::memory_order_acquire);
}

auto Runtime::shard_for(std::int64_t key) const noexcept -> shard_id {
  auto h = std::hash<std::int64_t>{}(key);
  // spread sequential ids; std::hash<int64_t> is the identity on libstdc++
  h ^= h >> 33U;
  h *= 0xff51afd7ed558ccdULL;
  h ^= h >> 33U;
  return static_cast<shard_id>(h % num_shards_);
}

auto Runtime::shard_for(std::string_view key) const noexcept -> shard_id {
  return static_cast<shard_id>(std::hash<std::string_view>{}(key) %
                               num_shards_);
}

auto Runtime::current_shard() const noexcept -> shard_id {
  if (detail::current_runtime != this) {
    return kInvalidShard;
  }
  return detail::current_shard_id;
}

auto Runtime::is_current_shard(shard_id id) const noexcept -> bool {
  return current_shard() == id;
}

auto Runtime::run_shard(shard_id id) -> void {
  detail::current_shard_id = id;
  detail::current_runtime = this;

  for (;;) {
    try {
      contexts_[id]->run();
      break;
    } catch (const std::exception &e) {
      log::error("Shard {} handler threw: {}", id, e.what());
    }
  }

  detail::current_shard_id = kInvalidShard;
  detail::current_runtime = nullptr;
}

} // namespace taskforge
