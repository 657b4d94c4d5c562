#pragma once

#include "taskforge/streaming/workbench.hpp"
#include "taskforge/util/id.hpp"
#include "taskforge/util/json.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace taskforge::streaming {

using SteadyClock = std::chrono::steady_clock;

/// In-flight state of one streaming subtask. Owned by exactly one shard of
/// the ingestor; never shared across threads.
///
/// Offsets count bytes of the UTF-8 buffers, so an offset is always a valid
/// resume position into the cached content.
class StreamingSession {
public:
  StreamingSession(TaskId task_id, SubtaskId subtask_id,
                   SteadyClock::time_point created_at);

  [[nodiscard]] auto task_id() const noexcept -> TaskId { return task_id_; }
  [[nodiscard]] auto subtask_id() const noexcept -> SubtaskId {
    return subtask_id_;
  }

  auto append_content(std::string_view text) -> std::int64_t;
  auto append_reasoning(std::string_view text) -> std::int64_t;
  /// index == size appends, index < size replaces; larger indices append.
  auto upsert_thinking(std::size_t index, JsonValue step) -> void;
  auto apply_workbench(const WorkbenchDelta &delta) -> void;

  [[nodiscard]] auto content() const noexcept -> const std::string & {
    return content_;
  }
  [[nodiscard]] auto offset() const noexcept -> std::int64_t {
    return offset_;
  }
  [[nodiscard]] auto reasoning() const noexcept -> const std::string & {
    return reasoning_;
  }
  [[nodiscard]] auto reasoning_offset() const noexcept -> std::int64_t {
    return reasoning_offset_;
  }
  [[nodiscard]] auto thinking() const noexcept
      -> const std::vector<JsonValue> & {
    return thinking_;
  }
  [[nodiscard]] auto workbench() const noexcept -> const Workbench & {
    return workbench_;
  }

  std::string executor_name;
  int progress{0};

  /// {value, thinking?, workbench?, reasoning_content?, streaming}
  [[nodiscard]] auto projection(bool streaming) const -> JsonValue;

  [[nodiscard]] auto cache_flush_due(SteadyClock::time_point now,
                                     SteadyClock::duration interval) const
      -> bool;
  [[nodiscard]] auto db_flush_due(SteadyClock::time_point now,
                                  SteadyClock::duration interval) const
      -> bool;
  auto mark_cache_flushed(SteadyClock::time_point now) -> void;
  auto mark_db_flushed(SteadyClock::time_point now) -> void;

  /// Most recent flush of either kind, or creation if none yet.
  [[nodiscard]] auto last_flush() const noexcept -> SteadyClock::time_point;

private:
  TaskId task_id_;
  SubtaskId subtask_id_;
  std::string content_;
  std::int64_t offset_{0};
  std::string reasoning_;
  std::int64_t reasoning_offset_{0};
  std::vector<JsonValue> thinking_;
  Workbench workbench_;
  SteadyClock::time_point created_at_;
  std::optional<SteadyClock::time_point> last_cache_flush_;
  std::optional<SteadyClock::time_point> last_db_flush_;
};

} // namespace taskforge::streaming
