#pragma once

#include "taskforge/core/error.hpp"
#include "taskforge/domain/task.hpp"
#include "taskforge/streaming/workbench.hpp"
#include "taskforge/util/enum.hpp"
#include "taskforge/util/id.hpp"
#include "taskforge/util/json.hpp"

#include <boost/describe/enum.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace taskforge {

enum class StreamEventType : std::uint8_t {
  Start,
  Chunk,
  Thinking,
  Reasoning,
  WorkbenchDelta,
  Status,
  Done,
  Error,
  ToolStart,
  ToolDone,
};
BOOST_DESCRIBE_ENUM(StreamEventType, Start, Chunk, Thinking, Reasoning,
                    WorkbenchDelta, Status, Done, Error, ToolStart, ToolDone)
TASKFORGE_DEFINE_ENUM_SERDE(StreamEventType, StreamEventType::Chunk)

} // namespace taskforge

namespace taskforge::streaming {

/// Raw event as received from a worker.
struct StreamEvent {
  TaskId task_id;
  SubtaskId subtask_id;
  StreamEventType type{StreamEventType::Chunk};
  JsonValue payload{};
  std::string executor_name;
  std::chrono::steady_clock::time_point received_at{
      std::chrono::steady_clock::now()};
};

struct StartBody {};

struct ContentChunk {
  std::string text;
};

struct ReasoningChunk {
  std::string text;
};

struct ThinkingStep {
  std::optional<std::size_t> index; // absent: append
  JsonValue step;
};

struct StatusChange {
  SubtaskStatus status{SubtaskStatus::Running};
  std::optional<int> progress;
  std::optional<std::string> error_message;
  std::optional<JsonValue> result; // keys overlaid on the final projection
};

struct ToolCall {
  bool done{false};
  JsonValue data;
};

using EventBody = std::variant<StartBody, ContentChunk, ReasoningChunk,
                               ThinkingStep, WorkbenchDelta, StatusChange,
                               ToolCall>;

/// Validates a payload against its event type. `done` and `error` are
/// shorthands for COMPLETED and FAILED status changes.
[[nodiscard]] auto decode_event_body(StreamEventType type,
                                     const JsonValue &payload)
    -> Result<EventBody>;

} // namespace taskforge::streaming
