#include "taskforge/cache/memory_cache.hpp"

namespace taskforge::cache {

MemoryCache::MemoryCache(NowFn now) : now_(std::move(now)) {}

auto MemoryCache::set(std::string key, std::string value,
                      std::chrono::seconds ttl) -> task<Result<void>> {
  if (ttl <= std::chrono::seconds::zero()) {
    co_return fail(Error::InvalidArgument);
  }
  std::scoped_lock lock(mu_);
  entries_.insert_or_assign(std::move(key),
                            Entry{std::move(value), now_() + ttl});
  co_return ok();
}

auto MemoryCache::get(std::string_view key)
    -> task<Result<std::optional<std::string>>> {
  std::scoped_lock lock(mu_);
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    co_return ok(std::optional<std::string>{});
  }
  if (it->second.expires_at <= now_()) {
    entries_.erase(it);
    co_return ok(std::optional<std::string>{});
  }
  co_return ok(std::optional<std::string>{it->second.value});
}

auto MemoryCache::del(std::string_view key) -> task<Result<void>> {
  std::scoped_lock lock(mu_);
  if (auto it = entries_.find(key); it != entries_.end()) {
    entries_.erase(it);
  }
  co_return ok();
}

auto MemoryCache::purge_expired() -> std::size_t {
  std::scoped_lock lock(mu_);
  auto now = now_();
  std::size_t removed = 0;
  for (auto it = entries_.begin(); it != entries_.end();) {
    if (it->second.expires_at <= now) {
      it = entries_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

auto MemoryCache::size() const -> std::size_t {
  std::scoped_lock lock(mu_);
  return entries_.size();
}

} // namespace taskforge::cache
