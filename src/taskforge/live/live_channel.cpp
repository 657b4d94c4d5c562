#include "taskforge/live/live_channel.hpp"

#include <array>
#include <utility>

namespace taskforge {

namespace {
constexpr std::array<std::string_view, 6> kLiveEventNames = {
    "start", "chunk", "done", "error", "tool:start", "tool:done"};
} // namespace

auto to_string_view(LiveEventType type) noexcept -> std::string_view {
  return kLiveEventNames.at(std::to_underlying(type));
}

auto to_json(const LiveEvent &event) -> JsonValue {
  JsonValue out{{"event", std::string(to_string_view(event.type))},
                {"task_id", event.task_id.value()},
                {"subtask_id", event.subtask_id.value()}};
  auto &obj = out.get_object();
  if (event.offset) {
    obj["offset"] = *event.offset;
  }
  if (event.content) {
    obj["content"] = *event.content;
  }
  if (event.result) {
    obj["result"] = *event.result;
  }
  return out;
}

} // namespace taskforge
