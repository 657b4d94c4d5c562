#pragma once

#include "taskforge/core/coroutine.hpp"
#include "taskforge/core/error.hpp"

#include <chrono>
#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <string_view>

namespace taskforge {

// Shared key/value store with per-key expiry.
class FastCache {
public:
  virtual ~FastCache() = default;

  virtual auto set(std::string key, std::string value,
                   std::chrono::seconds ttl) -> task<Result<void>> = 0;
  virtual auto get(std::string_view key)
      -> task<Result<std::optional<std::string>>> = 0;
  virtual auto del(std::string_view key) -> task<Result<void>> = 0;
};

namespace cache_keys {

[[nodiscard]] inline auto streaming_content(std::int64_t subtask_id)
    -> std::string {
  return std::format("executor:streaming:{}", subtask_id);
}

[[nodiscard]] inline auto streaming_state(std::int64_t subtask_id)
    -> std::string {
  return std::format("executor:streaming:state:{}", subtask_id);
}

[[nodiscard]] inline auto streaming_thinking(std::int64_t subtask_id)
    -> std::string {
  return std::format("executor:thinking:{}", subtask_id);
}

[[nodiscard]] inline auto streaming_workbench(std::int64_t subtask_id)
    -> std::string {
  return std::format("executor:workbench:{}", subtask_id);
}

[[nodiscard]] inline auto streaming_reasoning(std::int64_t subtask_id)
    -> std::string {
  return std::format("executor:reasoning:{}", subtask_id);
}

[[nodiscard]] inline auto cancel_flag(std::int64_t subtask_id) -> std::string {
  return std::format("executor:cancel:{}", subtask_id);
}

} // namespace cache_keys

} // namespace taskforge
