#include "taskforge/streaming/stream_event.hpp"

#include <algorithm>

namespace taskforge::streaming {

namespace {

auto decode_text(const JsonValue &payload) -> Result<std::string> {
  if (payload.is_string()) {
    return ok(payload.get_string());
  }
  if (!payload.is_object()) {
    return fail(Error::InvalidArgument);
  }
  const auto *content = json::find(payload, "content");
  if (content == nullptr || content->is_null()) {
    return ok(std::string{});
  }
  if (!content->is_string()) {
    return fail(Error::InvalidArgument);
  }
  return ok(content->get_string());
}

auto decode_status(const JsonValue &payload,
                   std::optional<SubtaskStatus> implied)
    -> Result<StatusChange> {
  if (!payload.is_object() && !payload.is_null()) {
    return fail(Error::InvalidArgument);
  }
  StatusChange out;
  if (implied) {
    out.status = *implied;
  } else {
    auto text = json::string_at(payload, "status");
    if (!text) {
      return fail(Error::InvalidArgument);
    }
    auto parsed = util::try_parse_enum<SubtaskStatus>(*text);
    if (!parsed) {
      return fail(Error::InvalidArgument);
    }
    out.status = *parsed;
  }
  if (auto progress = json::int_at(payload, "progress")) {
    out.progress = static_cast<int>(std::clamp<std::int64_t>(*progress, 0, 100));
  }
  if (auto msg = json::string_at(payload, "error_message")) {
    out.error_message = std::move(msg);
  } else if (auto err = json::string_at(payload, "error")) {
    out.error_message = std::move(err);
  }
  if (const auto *result = json::find(payload, "result");
      result != nullptr && !result->is_null()) {
    if (!result->is_object()) {
      return fail(Error::InvalidArgument);
    }
    out.result = *result;
  }
  return ok(std::move(out));
}

} // namespace

auto decode_event_body(StreamEventType type, const JsonValue &payload)
    -> Result<EventBody> {
  switch (type) {
  case StreamEventType::Start:
    return ok(EventBody{StartBody{}});
  case StreamEventType::Chunk:
    return decode_text(payload).transform(
        [](std::string t) { return EventBody{ContentChunk{std::move(t)}}; });
  case StreamEventType::Reasoning:
    return decode_text(payload).transform(
        [](std::string t) { return EventBody{ReasoningChunk{std::move(t)}}; });
  case StreamEventType::Thinking: {
    if (!payload.is_object()) {
      return fail(Error::InvalidArgument);
    }
    ThinkingStep out;
    if (auto idx = json::int_at(payload, "step_index")) {
      if (*idx < 0) {
        return fail(Error::InvalidArgument);
      }
      out.index = static_cast<std::size_t>(*idx);
    }
    const auto *step = json::find(payload, "step");
    out.step = step != nullptr ? *step : json::object();
    return ok(EventBody{std::move(out)});
  }
  case StreamEventType::WorkbenchDelta: {
    const auto *delta = json::find(payload, "delta");
    return parse_workbench_delta(delta != nullptr ? *delta : payload)
        .transform([](WorkbenchDelta d) { return EventBody{std::move(d)}; });
  }
  case StreamEventType::Status:
    return decode_status(payload, std::nullopt).transform([](StatusChange s) {
      return EventBody{std::move(s)};
    });
  case StreamEventType::Done:
    return decode_status(payload, SubtaskStatus::Completed)
        .transform([](StatusChange s) { return EventBody{std::move(s)}; });
  case StreamEventType::Error:
    return decode_status(payload, SubtaskStatus::Failed)
        .transform([](StatusChange s) { return EventBody{std::move(s)}; });
  case StreamEventType::ToolStart:
  case StreamEventType::ToolDone:
    return ok(EventBody{ToolCall{.done = type == StreamEventType::ToolDone,
                                 .data = payload}});
  }
  return fail(Error::InvalidArgument);
}

} // namespace taskforge::streaming
