#pragma once

#include "taskforge/util/id.hpp"
#include "taskforge/util/json.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace taskforge {

enum class LiveEventType : std::uint8_t {
  Start,
  Chunk,
  Done,
  Error,
  ToolStart,
  ToolDone,
};

[[nodiscard]] auto to_string_view(LiveEventType type) noexcept
    -> std::string_view;

/// Notification pushed to everyone watching a task.
struct LiveEvent {
  LiveEventType type{LiveEventType::Chunk};
  TaskId task_id;
  SubtaskId subtask_id;
  std::optional<std::int64_t> offset;
  std::optional<std::string> content;
  std::optional<JsonValue> result;
};

[[nodiscard]] auto to_json(const LiveEvent &event) -> JsonValue;

// Fan-out to the observers of a task room. publish() never blocks the
// caller; slow observers lose messages rather than stalling ingestion.
class LiveChannel {
public:
  virtual ~LiveChannel() = default;
  virtual auto publish(const LiveEvent &event) -> void = 0;
};

/// Channel with no observers.
class NullLiveChannel final : public LiveChannel {
public:
  auto publish(const LiveEvent &) -> void override {}
};

} // namespace taskforge
