#include "taskforge/app/api/api_server.hpp"

#include "taskforge/app/http/http_server.hpp"
#include "taskforge/app/http/router.hpp"
#include "taskforge/app/http/websocket.hpp"
#include "taskforge/client/executor_manager_client.hpp"
#include "taskforge/core/constants.hpp"
#include "taskforge/core/coroutine.hpp"
#include "taskforge/core/error.hpp"
#include "taskforge/core/runtime.hpp"
#include "taskforge/dispatch/dispatcher.hpp"
#include "taskforge/status/status_aggregator.hpp"
#include "taskforge/storage/coordinator_store.hpp"
#include "taskforge/streaming/streaming_ingestor.hpp"
#include "taskforge/util/enum.hpp"
#include "taskforge/util/json.hpp"
#include "taskforge/util/log.hpp"

#include <glaze/glaze.hpp>

#include <charconv>
#include <chrono>
#include <cstdint>
#include <optional>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

namespace taskforge {

using namespace http;

namespace api_dto {

struct SkippedDto {
  std::int64_t task_id{0};
  std::optional<std::int64_t> subtask_id;
  std::string reason;
};

struct DispatchResponseDto {
  std::vector<ExecutionContext> tasks;
  std::vector<SkippedDto> skipped;
};

struct SubtaskUpdatedDto {
  std::int64_t subtask_id{0};
  std::int64_t task_id{0};
  std::string status;
  int progress{0};
  std::string message{"Subtask updated successfully"};
};

struct StreamAckDto {
  bool success{true};
  std::string message;
  std::int64_t offset{0};
};

struct CancelResponseDto {
  std::int64_t task_id{0};
  std::vector<std::int64_t> cancelled;
  int forwarded{0};
};

struct SubtaskViewDto {
  std::int64_t id{0};
  std::int64_t task_id{0};
  std::string title;
  std::string role;
  std::int64_t message_id{0};
  std::string status;
  int progress{0};
  JsonValue result{};
  std::string error_message;
  std::vector<std::int64_t> bot_ids;
  std::string executor_name;
  std::string executor_namespace;
  std::int64_t created_at{0};
  std::int64_t updated_at{0};
  std::int64_t completed_at{0};
};

struct TaskViewDto {
  std::int64_t id{0};
  std::int64_t user_id{0};
  std::string title;
  std::string status;
  int progress{0};
  std::string error_message;
  JsonValue result{};
  std::int64_t team_id{0};
  std::string type;
  std::int64_t created_at{0};
  std::int64_t updated_at{0};
  std::int64_t completed_at{0};
  std::vector<SubtaskViewDto> subtasks;
};

struct StreamSnapshotDto {
  std::int64_t task_id{0};
  std::int64_t subtask_id{0};
  JsonValue projection{};
  std::int64_t offset{0};
  std::int64_t reasoning_offset{0};
  bool live{false};
};

} // namespace api_dto

} // namespace taskforge

namespace glz {

template <> struct meta<taskforge::api_dto::SkippedDto> {
  using T = taskforge::api_dto::SkippedDto;
  static constexpr auto value = object("task_id", &T::task_id, "subtask_id",
                                       &T::subtask_id, "reason", &T::reason);
};

template <> struct meta<taskforge::api_dto::DispatchResponseDto> {
  using T = taskforge::api_dto::DispatchResponseDto;
  static constexpr auto value =
      object("tasks", &T::tasks, "skipped", &T::skipped);
};

template <> struct meta<taskforge::api_dto::SubtaskUpdatedDto> {
  using T = taskforge::api_dto::SubtaskUpdatedDto;
  static constexpr auto value =
      object("subtask_id", &T::subtask_id, "task_id", &T::task_id, "status",
             &T::status, "progress", &T::progress, "message", &T::message);
};

template <> struct meta<taskforge::api_dto::StreamAckDto> {
  using T = taskforge::api_dto::StreamAckDto;
  static constexpr auto value = object("success", &T::success, "message",
                                       &T::message, "offset", &T::offset);
};

template <> struct meta<taskforge::api_dto::CancelResponseDto> {
  using T = taskforge::api_dto::CancelResponseDto;
  static constexpr auto value =
      object("task_id", &T::task_id, "cancelled", &T::cancelled, "forwarded",
             &T::forwarded);
};

template <> struct meta<taskforge::api_dto::SubtaskViewDto> {
  using T = taskforge::api_dto::SubtaskViewDto;
  static constexpr auto value = object(
      "id", &T::id, "task_id", &T::task_id, "title", &T::title, "role",
      &T::role, "message_id", &T::message_id, "status", &T::status,
      "progress", &T::progress, "result", &T::result, "error_message",
      &T::error_message, "bot_ids", &T::bot_ids, "executor_name",
      &T::executor_name, "executor_namespace", &T::executor_namespace,
      "created_at", &T::created_at, "updated_at", &T::updated_at,
      "completed_at", &T::completed_at);
};

template <> struct meta<taskforge::api_dto::TaskViewDto> {
  using T = taskforge::api_dto::TaskViewDto;
  static constexpr auto value = object(
      "id", &T::id, "user_id", &T::user_id, "title", &T::title, "status",
      &T::status, "progress", &T::progress, "error_message", &T::error_message,
      "result", &T::result, "team_id", &T::team_id, "type", &T::type,
      "created_at", &T::created_at, "updated_at", &T::updated_at,
      "completed_at", &T::completed_at, "subtasks", &T::subtasks);
};

template <> struct meta<taskforge::api_dto::StreamSnapshotDto> {
  using T = taskforge::api_dto::StreamSnapshotDto;
  static constexpr auto value =
      object("task_id", &T::task_id, "subtask_id", &T::subtask_id,
             "projection", &T::projection, "offset", &T::offset,
             "reasoning_offset", &T::reasoning_offset, "live", &T::live);
};

} // namespace glz

namespace taskforge {

namespace {

auto status_from_error(const std::error_code &ec) -> HttpStatus {
  if (ec.category() == error_category()) {
    switch (static_cast<Error>(ec.value())) {
    case Error::NotFound:
    case Error::FileNotFound:
      return HttpStatus::NotFound;
    case Error::InvalidArgument:
    case Error::ParseError:
    case Error::InvalidUrl:
      return HttpStatus::BadRequest;
    case Error::Conflict:
    case Error::AlreadyExists:
      return HttpStatus::Conflict;
    case Error::Unauthorized:
      return HttpStatus::Unauthorized;
    case Error::Timeout:
    case Error::SystemNotRunning:
      return HttpStatus::ServiceUnavailable;
    default:
      break;
    }
  }
  return HttpStatus::InternalServerError;
}

auto error_response(HttpStatus status, std::string_view message)
    -> HttpResponse {
  JsonValue body = JsonObject{};
  body["error"] = std::string(message);
  return HttpResponse::json(dump_json(body), status);
}

auto json_response(const JsonValue &j, HttpStatus status = HttpStatus::Ok)
    -> HttpResponse {
  return HttpResponse::json(dump_json(j), status);
}

template <typename T>
auto json_response_glz(const T &value, HttpStatus status = HttpStatus::Ok)
    -> HttpResponse {
  std::string buffer;
  if (auto ec = glz::write_json(value, buffer); ec) {
    log::error("JSON serialization failed for API response");
    return HttpResponse::json(R"({"error":"JSON serialization failed"})",
                              HttpStatus::InternalServerError);
  }
  return HttpResponse::json(std::move(buffer), status);
}

auto to_error_response(const std::error_code &ec) -> HttpResponse {
  return error_response(status_from_error(ec), ec.message());
}

auto unavailable() -> HttpResponse {
  return error_response(HttpStatus::ServiceUnavailable, "Service Unavailable");
}

auto parse_int(std::string_view text) -> std::optional<std::int64_t> {
  while (!text.empty() && text.front() == ' ') {
    text.remove_prefix(1);
  }
  while (!text.empty() && text.back() == ' ') {
    text.remove_suffix(1);
  }
  std::int64_t out{0};
  const auto *end = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(text.data(), end, out);
  if (ec != std::errc{} || ptr != end) {
    return std::nullopt;
  }
  return out;
}

auto parse_body(const HttpRequest &req) -> Result<JsonValue> {
  auto body = req.body_as_string();
  if (body.empty()) {
    return ok(json::object());
  }
  auto parsed = parse_json(body);
  if (!parsed) {
    return fail(Error::ParseError);
  }
  if (!parsed->is_object()) {
    return fail(Error::InvalidArgument);
  }
  return parsed;
}

/// Accepts `[1, 2]` or `"1,2"`.
auto parse_task_ids(const JsonValue &value) -> Result<std::vector<TaskId>> {
  std::vector<TaskId> ids;
  if (value.is_array()) {
    for (const auto &item : value.get_array()) {
      const auto *n = std::get_if<std::int64_t>(&item.data);
      if (n == nullptr) {
        return fail(Error::InvalidArgument);
      }
      ids.emplace_back(*n);
    }
    return ok(std::move(ids));
  }
  if (value.is_string()) {
    for (auto part : value.get_string() | std::views::split(',')) {
      std::string_view token(part.begin(), part.end());
      if (token.find_first_not_of(' ') == std::string_view::npos) {
        continue;
      }
      auto id = parse_int(token);
      if (!id) {
        return fail(Error::InvalidArgument);
      }
      ids.emplace_back(*id);
    }
    return ok(std::move(ids));
  }
  if (value.is_null()) {
    return ok(std::move(ids));
  }
  return fail(Error::InvalidArgument);
}

/// Dispatch parameters come from the JSON body; query parameters fill in
/// anything the body leaves out.
auto parse_claim_request(const HttpRequest &req) -> Result<ClaimRequest> {
  auto body = parse_body(req);
  if (!body) {
    return fail(body.error());
  }
  QueryParams query(req.query_string);
  ClaimRequest request;

  std::optional<std::string> status = json::string_at(*body, "status");
  if (!status) {
    if (auto q = query.get("status")) {
      status = *q;
    }
  }
  if (status) {
    auto parsed = util::try_parse_enum<SubtaskStatus>(*status);
    if (!parsed) {
      return fail(Error::InvalidArgument);
    }
    request.status_filter = *parsed;
  }

  if (auto limit = json::int_at(*body, "limit")) {
    request.limit = static_cast<int>(*limit);
  } else if (auto q = query.get("limit")) {
    auto parsed = parse_int(*q);
    if (!parsed) {
      return fail(Error::InvalidArgument);
    }
    request.limit = static_cast<int>(*parsed);
  }

  const auto *ids = json::find(*body, "task_ids");
  if (ids != nullptr) {
    auto parsed = parse_task_ids(*ids);
    if (!parsed) {
      return fail(parsed.error());
    }
    request.task_ids = std::move(*parsed);
  } else if (auto q = query.get("task_ids")) {
    auto parsed = parse_task_ids(JsonValue{*q});
    if (!parsed) {
      return fail(parsed.error());
    }
    request.task_ids = std::move(*parsed);
  }
  return ok(std::move(request));
}

auto parse_subtask_update(const JsonValue &body) -> Result<SubtaskUpdate> {
  auto id = json::int_at(body, "subtask_id");
  if (!id || *id <= 0) {
    return fail(Error::InvalidArgument);
  }
  SubtaskUpdate update{.subtask_id = SubtaskId{*id}};

  if (const auto *status = json::find(body, "status");
      status != nullptr && !status->is_null()) {
    if (!status->is_string()) {
      return fail(Error::InvalidArgument);
    }
    auto parsed = util::try_parse_enum<SubtaskStatus>(status->get_string());
    if (!parsed) {
      return fail(Error::InvalidArgument);
    }
    update.status = *parsed;
  }
  if (auto progress = json::int_at(body, "progress")) {
    if (*progress < 0 || *progress > 100) {
      return fail(Error::InvalidArgument);
    }
    update.progress = static_cast<int>(*progress);
  }
  if (const auto *result = json::find(body, "result");
      result != nullptr && !result->is_null()) {
    update.result = *result;
  }
  update.error_message = json::string_at(body, "error_message");
  update.executor_name = json::string_at(body, "executor_name");
  update.executor_namespace = json::string_at(body, "executor_namespace");
  update.subtask_title = json::string_at(body, "subtask_title");
  update.task_title = json::string_at(body, "task_title");
  return ok(std::move(update));
}

auto parse_stream_event(const JsonValue &body)
    -> Result<streaming::StreamEvent> {
  auto task_id = json::int_at(body, "task_id");
  auto subtask_id = json::int_at(body, "subtask_id");
  auto event_type = json::string_at(body, "event_type");
  if (!task_id || !subtask_id || !event_type) {
    return fail(Error::InvalidArgument);
  }
  auto type = util::try_parse_enum<StreamEventType>(*event_type);
  if (!type) {
    return fail(Error::InvalidArgument);
  }
  streaming::StreamEvent event{
      .task_id = TaskId{*task_id},
      .subtask_id = SubtaskId{*subtask_id},
      .type = *type,
      .payload = {},
      .executor_name = json::string_at(body, "executor_name").value_or(""),
  };
  if (const auto *payload = json::find(body, "payload")) {
    event.payload = *payload;
  } else {
    event.payload = json::object();
  }
  return ok(std::move(event));
}

auto to_dto(const Subtask &s) -> api_dto::SubtaskViewDto {
  return api_dto::SubtaskViewDto{
      .id = s.id.value(),
      .task_id = s.task_id.value(),
      .title = s.title,
      .role = std::string(to_string_view(s.role)),
      .message_id = s.message_id,
      .status = std::string(to_string_view(s.status)),
      .progress = s.progress,
      .result = s.result,
      .error_message = s.error_message,
      .bot_ids = s.bot_ids,
      .executor_name = s.executor_name,
      .executor_namespace = s.executor_namespace,
      .created_at = s.created_at,
      .updated_at = s.updated_at,
      .completed_at = s.completed_at,
  };
}

auto to_dto(const Task &t, const std::vector<Subtask> &subtasks)
    -> api_dto::TaskViewDto {
  api_dto::TaskViewDto dto{
      .id = t.id.value(),
      .user_id = t.user_id.value(),
      .title = t.title,
      .status = std::string(to_string_view(t.status)),
      .progress = t.progress,
      .error_message = t.error_message,
      .result = t.result,
      .team_id = t.team_id.value(),
      .type = std::string(to_string_view(t.type)),
      .created_at = t.created_at,
      .updated_at = t.updated_at,
      .completed_at = t.completed_at,
      .subtasks = {},
  };
  dto.subtasks.reserve(subtasks.size());
  for (const auto &s : subtasks) {
    dto.subtasks.emplace_back(to_dto(s));
  }
  return dto;
}

auto to_dto(DispatchReport report) -> api_dto::DispatchResponseDto {
  api_dto::DispatchResponseDto dto{.tasks = std::move(report.contexts),
                                   .skipped = {}};
  dto.skipped.reserve(report.skipped.size());
  for (const auto &item : report.skipped) {
    dto.skipped.emplace_back(api_dto::SkippedDto{
        .task_id = item.task_id.value(),
        .subtask_id = item.subtask_id
                          ? std::optional{item.subtask_id.value()}
                          : std::nullopt,
        .reason = std::string(to_string_view(item.reason)),
    });
  }
  return dto;
}

} // namespace

struct ApiServer::Impl : std::enable_shared_from_this<Impl> {
  ApiServices services_;
  ApiConfig config_;
  std::shared_ptr<HttpServer> server_;

  Impl(ApiServices services, ApiConfig config)
      : services_(services), config_(std::move(config)),
        server_(std::make_shared<HttpServer>(services.runtime)) {}

  void init() {
    setup_routes();
    setup_websocket();
  }

  auto cancel_subtasks(TaskId task_id, std::optional<SubtaskId> only)
      -> task<Result<api_dto::CancelResponseDto>> {
    auto parent = co_await services_.store.get_task(task_id);
    if (!parent) {
      co_return fail(parent.error());
    }
    auto subtasks = co_await services_.store.list_subtasks(task_id);
    if (!subtasks) {
      co_return fail(subtasks.error());
    }

    std::vector<const Subtask *> targets;
    for (const auto &s : *subtasks) {
      if (only) {
        if (s.id == *only) {
          targets.push_back(&s);
        }
      } else if (s.role == SubtaskRole::Assistant &&
                 s.status == SubtaskStatus::Running) {
        targets.push_back(&s);
      }
    }
    if (only && targets.empty()) {
      co_return fail(Error::NotFound);
    }

    api_dto::CancelResponseDto dto{.task_id = task_id.value()};
    for (const auto *s : targets) {
      if (auto r = co_await services_.ingestor.request_cancel(s->id); !r) {
        log::warn("Cancel flag for subtask {} not set: {}", s->id,
                  r.error().message());
        continue;
      }
      dto.cancelled.push_back(s->id.value());

      if (!services_.executor_manager.enabled() || s->executor_name.empty()) {
        continue;
      }
      auto forwarded = co_await services_.executor_manager.cancel(
          CancelForward{.task_id = task_id,
                        .subtask_id = s->id,
                        .executor_name = s->executor_name});
      if (forwarded) {
        ++dto.forwarded;
      } else {
        log::warn("Cancel forward for subtask {} ({}) failed: {}", s->id,
                  s->executor_name, forwarded.error().message());
      }
    }
    log::info("Cancel requested for task {}: {} subtask(s), {} forwarded",
              task_id, dto.cancelled.size(), dto.forwarded);
    co_return ok(std::move(dto));
  }

  void setup_websocket() {
    std::weak_ptr<Impl> weak_self = shared_from_this();
    server_->set_websocket_handler(
        [weak_self](std::shared_ptr<IWebSocketConnection> conn,
                    HttpRequest upgrade) -> spawn_task {
          auto self = weak_self.lock();
          if (!self) {
            co_return;
          }
          QueryParams query(upgrade.query_string);
          auto raw = query.get("task_id");
          auto task_id = raw ? parse_int(*raw) : std::nullopt;
          if (!task_id || *task_id <= 0) {
            log::warn("WebSocket upgrade without a valid task_id: {}",
                      upgrade.query_string);
            conn->force_close();
            co_return;
          }

          const int fd_num = conn->fd();
          self->services_.hub.add_connection(conn, TaskId{*task_id});
          log::debug("WebSocket observer fd={} joined task {}", fd_num,
                     *task_id);

          co_await conn->handle_frames(
              [weak_self, fd_num](WebSocketOpCode opcode,
                                  [[maybe_unused]] std::span<const std::byte>
                                      data) {
                auto locked = weak_self.lock();
                if (!locked) {
                  return;
                }
                if (opcode == WebSocketOpCode::Close) {
                  locked->services_.hub.remove_connection(fd_num);
                  log::debug("WebSocket observer fd={} left", fd_num);
                }
              });

          self->services_.hub.remove_connection(fd_num);
        });
  }

  void setup_routes() {
    std::weak_ptr<Impl> weak_self = shared_from_this();
    auto &router = server_->router();

    router.get("/api/health", [](HttpRequest) -> task<HttpResponse> {
      JsonValue body = JsonObject{};
      body["status"] = "healthy";
      co_return json_response(body);
    });

    router.post(
        "/api/executors/tasks/dispatch",
        [weak_self](HttpRequest req) -> task<HttpResponse> {
          auto self = weak_self.lock();
          if (!self) {
            co_return unavailable();
          }
          auto request = parse_claim_request(req);
          if (!request) {
            co_return to_error_response(request.error());
          }
          auto report =
              co_await self->services_.dispatcher.claim(std::move(*request));
          if (!report) {
            co_return to_error_response(report.error());
          }
          for (const auto &warning : report->warnings) {
            log::warn("dispatch: {}", warning);
          }
          co_return json_response_glz(to_dto(std::move(*report)));
        });

    router.post(
        "/api/executors/subtasks/update",
        [weak_self](HttpRequest req) -> task<HttpResponse> {
          auto self = weak_self.lock();
          if (!self) {
            co_return unavailable();
          }
          auto update = parse_body(req).and_then(parse_subtask_update);
          if (!update) {
            co_return to_error_response(update.error());
          }
          auto outcome =
              co_await self->services_.aggregator.apply_update(
                  std::move(*update));
          if (!outcome) {
            co_return to_error_response(outcome.error());
          }
          co_return json_response_glz(api_dto::SubtaskUpdatedDto{
              .subtask_id = outcome->subtask_id.value(),
              .task_id = outcome->task_id.value(),
              .status = std::string(to_string_view(outcome->status)),
              .progress = outcome->progress,
          });
        });

    router.post(
        "/api/executors/streaming/event",
        [weak_self](HttpRequest req) -> task<HttpResponse> {
          auto self = weak_self.lock();
          if (!self) {
            co_return unavailable();
          }
          auto event = parse_body(req).and_then(parse_stream_event);
          if (!event) {
            co_return to_error_response(event.error());
          }
          auto ack =
              co_await self->services_.ingestor.process_event(std::move(*event));
          if (!ack) {
            co_return json_response_glz(
                api_dto::StreamAckDto{.success = false,
                                      .message = ack.error().message(),
                                      .offset = 0},
                status_from_error(ack.error()));
          }
          co_return json_response_glz(api_dto::StreamAckDto{
              .success = ack->success,
              .message = ack->message,
              .offset = ack->offset,
          });
        });

    router.post(
        "/api/executors/tasks/cancel",
        [weak_self](HttpRequest req) -> task<HttpResponse> {
          auto self = weak_self.lock();
          if (!self) {
            co_return unavailable();
          }
          auto body = parse_body(req);
          if (!body) {
            co_return to_error_response(body.error());
          }
          auto task_id = json::int_at(*body, "task_id");
          if (!task_id || *task_id <= 0) {
            co_return error_response(HttpStatus::BadRequest,
                                     "Missing task_id");
          }
          std::optional<SubtaskId> only;
          if (auto sid = json::int_at(*body, "subtask_id")) {
            only = SubtaskId{*sid};
          }
          auto result =
              co_await self->cancel_subtasks(TaskId{*task_id}, only);
          if (!result) {
            co_return to_error_response(result.error());
          }
          co_return json_response_glz(*result);
        });

    router.get(
        "/api/executors/tasks/{task_id}",
        [weak_self](HttpRequest req) -> task<HttpResponse> {
          auto self = weak_self.lock();
          if (!self) {
            co_return unavailable();
          }
          auto raw = req.path_param("task_id");
          auto id = raw ? parse_int(*raw) : std::nullopt;
          if (!id) {
            co_return error_response(HttpStatus::BadRequest,
                                     "Missing task_id");
          }
          auto parent = co_await self->services_.store.get_task(TaskId{*id});
          if (!parent) {
            co_return to_error_response(parent.error());
          }
          auto subtasks =
              co_await self->services_.store.list_subtasks(TaskId{*id});
          if (!subtasks) {
            co_return to_error_response(subtasks.error());
          }
          co_return json_response_glz(to_dto(*parent, *subtasks));
        });

    router.get(
        "/api/executors/subtasks/{subtask_id}/stream",
        [weak_self](HttpRequest req) -> task<HttpResponse> {
          auto self = weak_self.lock();
          if (!self) {
            co_return unavailable();
          }
          auto raw = req.path_param("subtask_id");
          auto id = raw ? parse_int(*raw) : std::nullopt;
          if (!id) {
            co_return error_response(HttpStatus::BadRequest,
                                     "Missing subtask_id");
          }
          auto snap =
              co_await self->services_.ingestor.snapshot(SubtaskId{*id});
          if (!snap) {
            co_return to_error_response(snap.error());
          }
          co_return json_response_glz(api_dto::StreamSnapshotDto{
              .task_id = snap->task_id.value(),
              .subtask_id = snap->subtask_id.value(),
              .projection = std::move(snap->projection),
              .offset = snap->offset,
              .reasoning_offset = snap->reasoning_offset,
              .live = snap->live,
          });
        });
  }

  auto start() -> Result<void> {
    if (!config_.enabled) {
      log::info("API server disabled by configuration");
      return ok();
    }
    if (auto r = server_->start(config_.host, config_.port, config_.reuse_port);
        !r) {
      log::error("API server failed to listen on {}:{}: {}", config_.host,
                 config_.port, r.error().message());
      return fail(r.error());
    }
    log::info("API server listening on {}:{}", config_.host, config_.port);
    return ok();
  }

  void stop() {
    services_.hub.close_all();
    const auto deadline = std::chrono::steady_clock::now() + timing::kWsCloseGrace;
    while (services_.hub.connection_count() > 0 &&
           std::chrono::steady_clock::now() < deadline) {
      std::this_thread::sleep_for(timing::kWsClosePoll);
    }
    server_->stop();
  }

  [[nodiscard]] auto is_running() const -> bool {
    return server_->is_running();
  }
};

ApiServer::ApiServer(ApiServices services, ApiConfig config)
    : impl_(std::make_shared<Impl>(services, std::move(config))) {
  impl_->init();
}

ApiServer::~ApiServer() = default;

auto ApiServer::start() -> Result<void> { return impl_->start(); }

auto ApiServer::stop() -> void { impl_->stop(); }

auto ApiServer::is_running() const -> bool { return impl_->is_running(); }

auto ApiServer::router() -> http::Router & { return impl_->server_->router(); }

} // namespace taskforge
