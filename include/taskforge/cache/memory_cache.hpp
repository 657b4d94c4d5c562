#pragma once

#include "taskforge/cache/fast_cache.hpp"
#include "taskforge/util/string_hash.hpp"

#include <ankerl/unordered_dense.h>

#include <functional>
#include <mutex>

namespace taskforge::cache {

/// Process-local FastCache. Expired entries are invisible to readers and
/// removed lazily on access or by purge_expired().
class MemoryCache final : public FastCache {
public:
  using Clock = std::chrono::steady_clock;
  using NowFn = std::function<Clock::time_point()>;

  explicit MemoryCache(NowFn now = &Clock::now);

  auto set(std::string key, std::string value, std::chrono::seconds ttl)
      -> task<Result<void>> override;
  auto get(std::string_view key)
      -> task<Result<std::optional<std::string>>> override;
  auto del(std::string_view key) -> task<Result<void>> override;

  auto purge_expired() -> std::size_t;
  [[nodiscard]] auto size() const -> std::size_t;

private:
  struct Entry {
    std::string value;
    Clock::time_point expires_at;
  };

  NowFn now_;
  mutable std::mutex mu_;
  ankerl::unordered_dense::map<std::string, Entry, StringHash, StringEqual>
      entries_;
};

} // namespace taskforge::cache
