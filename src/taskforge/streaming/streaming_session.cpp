#include "taskforge/streaming/streaming_session.hpp"

#include <algorithm>

namespace taskforge::streaming {

StreamingSession::StreamingSession(TaskId task_id, SubtaskId subtask_id,
                                   SteadyClock::time_point created_at)
    : task_id_(task_id), subtask_id_(subtask_id), created_at_(created_at) {}

auto StreamingSession::append_content(std::string_view text) -> std::int64_t {
  content_.append(text);
  offset_ += static_cast<std::int64_t>(text.size());
  return offset_;
}

auto StreamingSession::append_reasoning(std::string_view text)
    -> std::int64_t {
  reasoning_.append(text);
  reasoning_offset_ += static_cast<std::int64_t>(text.size());
  return reasoning_offset_;
}

auto StreamingSession::upsert_thinking(std::size_t index, JsonValue step)
    -> void {
  if (index < thinking_.size()) {
    thinking_[index] = std::move(step);
    return;
  }
  thinking_.push_back(std::move(step));
}

auto StreamingSession::apply_workbench(const WorkbenchDelta &delta) -> void {
  workbench_.apply(delta);
}

auto StreamingSession::projection(bool streaming) const -> JsonValue {
  JsonValue out{{"value", content_}};
  auto &obj = out.get_object();
  if (!thinking_.empty()) {
    obj["thinking"] = JsonArray(thinking_.begin(), thinking_.end());
  }
  if (!workbench_.empty()) {
    obj["workbench"] = workbench_.to_json();
  }
  if (!reasoning_.empty()) {
    obj["reasoning_content"] = reasoning_;
  }
  obj["streaming"] = streaming;
  return out;
}

auto StreamingSession::cache_flush_due(SteadyClock::time_point now,
                                       SteadyClock::duration interval) const
    -> bool {
  return !last_cache_flush_ || now - *last_cache_flush_ >= interval;
}

auto StreamingSession::db_flush_due(SteadyClock::time_point now,
                                    SteadyClock::duration interval) const
    -> bool {
  return !last_db_flush_ || now - *last_db_flush_ >= interval;
}

auto StreamingSession::mark_cache_flushed(SteadyClock::time_point now)
    -> void {
  last_cache_flush_ = now;
}

auto StreamingSession::mark_db_flushed(SteadyClock::time_point now) -> void {
  last_db_flush_ = now;
}

auto StreamingSession::last_flush() const noexcept -> SteadyClock::time_point {
  auto last = created_at_;
  if (last_cache_flush_) {
    last = std::max(last, *last_cache_flush_);
  }
  if (last_db_flush_) {
    last = std::max(last, *last_db_flush_);
  }
  return last;
}

} // namespace taskforge::streaming
