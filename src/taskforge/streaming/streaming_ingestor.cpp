#include "taskforge/streaming/streaming_ingestor.hpp"

#include "taskforge/util/log.hpp"
#include "taskforge/util/util.hpp"

#include <boost/asio/redirect_error.hpp>

#include <utility>

namespace taskforge::streaming {

namespace {

auto chunk_event(const StreamingSession &s, std::string content = {},
                 std::optional<JsonValue> result = std::nullopt)
    -> LiveEvent {
  return LiveEvent{.type = LiveEventType::Chunk,
                   .task_id = s.task_id(),
                   .subtask_id = s.subtask_id(),
                   .offset = s.offset(),
                   .content = std::move(content),
                   .result = std::move(result)};
}

auto final_projection(const StreamingSession &s, const StatusChange &change)
    -> JsonValue {
  auto out = s.projection(false);
  auto &obj = out.get_object();
  if (change.result && change.result->is_object()) {
    for (const auto &[key, value] : change.result->get_object()) {
      if (key != "streaming") {
        obj[key] = value;
      }
    }
  }
  if (change.error_message && !change.error_message->empty()) {
    obj["error"] = *change.error_message;
  }
  return out;
}

} // namespace

StreamingIngestor::StreamingIngestor(Runtime &runtime, CoordinatorStore &store,
                                     FastCache &cache, LiveChannel &live,
                                     StatusAggregator &aggregator,
                                     StreamingConfig config)
    : runtime_(runtime), store_(store), cache_(cache), live_(live),
      aggregator_(aggregator), config_(config),
      shards_(runtime.shard_count()) {}

StreamingIngestor::~StreamingIngestor() { stop(); }

auto StreamingIngestor::shard_of(SubtaskId id) const noexcept -> shard_id {
  return runtime_.shard_for(id.value());
}

auto StreamingIngestor::start() -> void {
  if (sweeping_.exchange(true)) {
    return;
  }
  for (shard_id sid = 0; sid < shards_.size(); ++sid) {
    runtime_.post_to(sid, [this, sid] {
      shards_[sid].sweep_timer = std::make_unique<boost::asio::steady_timer>(
          runtime_.executor_for(sid));
      runtime_.spawn_on(sid, sweep_loop(sid));
    });
  }
  log::debug("Streaming stale sweep armed on {} shards (every {}s)",
             shards_.size(), config_.stale_sweep_interval_s);
}

auto StreamingIngestor::stop() -> void {
  if (!sweeping_.exchange(false)) {
    return;
  }
  if (!runtime_.is_running()) {
    return;
  }
  for (shard_id sid = 0; sid < shards_.size(); ++sid) {
    runtime_.post_to(sid, [this, sid] {
      if (shards_[sid].sweep_timer) {
        shards_[sid].sweep_timer->cancel();
      }
    });
  }
}

auto StreamingIngestor::sweep_loop(shard_id sid) -> spawn_task {
  auto &timer = *shards_[sid].sweep_timer;
  while (sweeping_.load(std::memory_order_acquire)) {
    timer.expires_after(config_.stale_sweep_interval());
    boost::system::error_code ec;
    co_await timer.async_wait(
        boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    if (ec == boost::asio::error::operation_aborted) {
      co_return;
    }
    if (ec) {
      log::warn("Stale sweep timer on shard {} failed: {}", sid, ec.message());
      co_return;
    }
    co_await sweep_shard(sid, SteadyClock::now());
  }
}

auto StreamingIngestor::cache_write_for(const StreamingSession &session) const
    -> CacheWrite {
  JsonValue state{{"task_id", session.task_id().value()},
                  {"offset", session.offset()},
                  {"reasoning_offset", session.reasoning_offset()},
                  {"updated_at", util::now_millis()}};
  const auto id = session.subtask_id().value();
  CacheWrite out;
  out.entries.emplace_back(cache_keys::streaming_content(id),
                           session.content());
  out.entries.emplace_back(cache_keys::streaming_state(id), dump_json(state));
  if (!session.reasoning().empty()) {
    out.entries.emplace_back(cache_keys::streaming_reasoning(id),
                             session.reasoning());
  }
  if (!session.thinking().empty()) {
    JsonValue steps =
        JsonArray(session.thinking().begin(), session.thinking().end());
    out.entries.emplace_back(cache_keys::streaming_thinking(id),
                             dump_json(steps));
  }
  if (!session.workbench().empty()) {
    out.entries.emplace_back(cache_keys::streaming_workbench(id),
                             dump_json(session.workbench().to_json()));
  }
  return out;
}

auto StreamingIngestor::apply_on_shard(shard_id sid, StreamEvent event,
                                       EventBody body) -> task<Effects> {
  Effects fx{.task_id = event.task_id};

  if (const auto *tool = std::get_if<ToolCall>(&body)) {
    fx.live.push_back(LiveEvent{
        .type = tool->done ? LiveEventType::ToolDone : LiveEventType::ToolStart,
        .task_id = event.task_id,
        .subtask_id = event.subtask_id,
        .result = tool->data});
    co_return fx;
  }

  auto &sessions = shards_[sid].sessions;
  auto [it, created] = sessions.try_emplace(
      event.subtask_id, event.task_id, event.subtask_id, event.received_at);
  auto &session = it->second;
  if (created) {
    log::debug("Streaming session opened for subtask {} (task {})",
               event.subtask_id, event.task_id);
  }
  if (!event.executor_name.empty()) {
    session.executor_name = event.executor_name;
  }

  auto finish = [&](const StatusChange &change) {
    auto result = final_projection(session, change);
    const bool failed = change.status == SubtaskStatus::Failed;
    fx.live.push_back(
        LiveEvent{.type = failed ? LiveEventType::Error : LiveEventType::Done,
                  .task_id = session.task_id(),
                  .subtask_id = session.subtask_id(),
                  .offset = session.offset(),
                  .content = failed ? change.error_message : std::nullopt,
                  .result = result});
    auto progress = change.progress;
    if (change.status == SubtaskStatus::Completed) {
      progress = 100;
    }
    fx.durable = StreamResultWrite{.subtask_id = session.subtask_id(),
                                   .status = change.status,
                                   .result = std::move(result),
                                   .error_message = change.error_message,
                                   .progress = progress,
                                   .require_running = false};
    fx.terminal = true;
  };

  std::visit(
      overloaded{
          [&](const StartBody &) {
            fx.live.push_back(LiveEvent{.type = LiveEventType::Start,
                                        .task_id = session.task_id(),
                                        .subtask_id = session.subtask_id(),
                                        .offset = session.offset()});
            fx.cache = cache_write_for(session);
            session.mark_cache_flushed(event.received_at);
          },
          [&](const ContentChunk &chunk) {
            if (chunk.text.empty()) {
              return;
            }
            session.append_content(chunk.text);
            fx.live.push_back(chunk_event(session, chunk.text));
          },
          [&](const ReasoningChunk &chunk) {
            if (chunk.text.empty()) {
              return;
            }
            session.append_reasoning(chunk.text);
            fx.live.push_back(chunk_event(
                session, {},
                JsonValue{{"reasoning_content", session.reasoning()},
                          {"reasoning_chunk", chunk.text}}));
          },
          [&](const ThinkingStep &step) {
            session.upsert_thinking(step.index.value_or(
                                        session.thinking().size()),
                                    step.step);
            fx.live.push_back(chunk_event(
                session, {},
                JsonValue{{"thinking", JsonArray(session.thinking().begin(),
                                                 session.thinking().end())}}));
          },
          [&](const WorkbenchDelta &delta) {
            session.apply_workbench(delta);
            fx.live.push_back(chunk_event(
                session, {},
                JsonValue{{"workbench", session.workbench().to_json()}}));
          },
          [&](const StatusChange &change) {
            if (change.progress) {
              session.progress = *change.progress;
            }
            if (is_terminal(change.status)) {
              finish(change);
              return;
            }
            fx.live.push_back(chunk_event(
                session, {},
                JsonValue{{"status", std::string{to_string_view(change.status)}},
                          {"progress", session.progress}}));
          },
          [](const ToolCall &) {},
      },
      body);

  fx.offset = session.offset();
  if (fx.terminal) {
    co_return fx;
  }

  const auto now = event.received_at;
  if (!fx.cache &&
      session.cache_flush_due(now, config_.cache_flush_interval())) {
    fx.cache = cache_write_for(session);
    session.mark_cache_flushed(now);
  }
  if (session.db_flush_due(now, config_.db_flush_interval())) {
    fx.durable = StreamResultWrite{.subtask_id = session.subtask_id(),
                                   .status = SubtaskStatus::Running,
                                   .result = session.projection(true),
                                   .progress = session.progress,
                                   .require_running = true};
    session.mark_db_flushed(now);
  }
  co_return fx;
}

auto StreamingIngestor::purge_on_shard(shard_id sid, SubtaskId subtask_id)
    -> task<void> {
  shards_[sid].sessions.erase(subtask_id);
  co_return;
}

auto StreamingIngestor::process_event(StreamEvent event)
    -> task<Result<EventAck>> {
  auto body = decode_event_body(event.type, event.payload);
  if (!body) {
    log::warn("Rejected {} event for subtask {}: {}",
              to_string_view(event.type), event.subtask_id,
              body.error().message());
    co_return fail(body.error());
  }
  if (!event.subtask_id || !event.task_id) {
    co_return fail(Error::InvalidArgument);
  }

  const auto subtask_id = event.subtask_id;
  const auto sid = shard_of(subtask_id);
  auto fx = co_await co_spawn(
      runtime_.executor_for(sid),
      apply_on_shard(sid, std::move(event), std::move(*body)), use_awaitable);
  co_return co_await run_effects(std::move(fx), subtask_id);
}

auto StreamingIngestor::run_effects(Effects fx, SubtaskId subtask_id)
    -> task<Result<EventAck>> {
  for (const auto &ev : fx.live) {
    live_.publish(ev);
  }

  if (fx.cache) {
    for (auto &[key, value] : fx.cache->entries) {
      if (auto res =
              co_await cache_.set(key, std::move(value), config_.content_ttl());
          !res) {
        log::warn("Cache snapshot for subtask {} failed at {}: {}", subtask_id,
                  key, res.error().message());
        break;
      }
    }
  }

  if (!fx.durable) {
    co_return ok(EventAck{.message = "ok", .offset = fx.offset});
  }

  auto written = co_await store_.write_stream_result(*fx.durable);
  if (!fx.terminal) {
    if (!written) {
      log::warn("Periodic save of subtask {} failed: {}", subtask_id,
                written.error().message());
    } else if (!*written) {
      log::debug("Periodic save of subtask {} skipped, row no longer RUNNING",
                 subtask_id);
    }
    co_return ok(EventAck{.message = "ok", .offset = fx.offset});
  }

  if (!written) {
    // Session stays in place so a retried terminal event still has the
    // buffered content.
    log::error("Final save of subtask {} failed: {}", subtask_id,
               written.error().message());
    co_return fail(written.error());
  }

  const auto id = subtask_id.value();
  for (auto key : {cache_keys::streaming_content(id),
                   cache_keys::streaming_state(id),
                   cache_keys::streaming_reasoning(id),
                   cache_keys::streaming_thinking(id),
                   cache_keys::streaming_workbench(id)}) {
    if (auto res = co_await cache_.del(key); !res) {
      log::warn("Failed to drop cache key {}: {}", key, res.error().message());
    }
  }

  const auto sid = shard_of(subtask_id);
  co_await co_spawn(runtime_.executor_for(sid),
                    purge_on_shard(sid, subtask_id), use_awaitable);

  if (auto agg = co_await aggregator_.recompute(fx.task_id); !agg) {
    log::warn("Aggregating task {} after subtask {} finished failed: {}",
              fx.task_id, subtask_id, agg.error().message());
  }
  log::info("Streaming subtask {} finished as {}", subtask_id,
            to_string_view(fx.durable->status));
  co_return ok(EventAck{.message = "ok", .offset = fx.offset});
}

auto StreamingIngestor::snapshot_on_shard(shard_id sid, SubtaskId subtask_id)
    -> task<std::optional<SessionSnapshot>> {
  auto &sessions = shards_[sid].sessions;
  auto it = sessions.find(subtask_id);
  if (it == sessions.end()) {
    co_return std::nullopt;
  }
  const auto &s = it->second;
  co_return SessionSnapshot{.task_id = s.task_id(),
                            .subtask_id = s.subtask_id(),
                            .projection = s.projection(true),
                            .offset = s.offset(),
                            .reasoning_offset = s.reasoning_offset(),
                            .live = true};
}

auto StreamingIngestor::snapshot(SubtaskId subtask_id)
    -> task<Result<SessionSnapshot>> {
  const auto sid = shard_of(subtask_id);
  auto in_memory = co_await co_spawn(runtime_.executor_for(sid),
                                     snapshot_on_shard(sid, subtask_id),
                                     use_awaitable);
  if (in_memory) {
    co_return ok(std::move(*in_memory));
  }

  auto content =
      co_await cache_.get(cache_keys::streaming_content(subtask_id.value()));
  if (!content) {
    co_return fail(content.error());
  }
  if (!*content) {
    co_return fail(Error::NotFound);
  }

  SessionSnapshot out{.subtask_id = subtask_id,
                      .projection = JsonValue{{"value", **content},
                                              {"streaming", true}},
                      .offset = static_cast<std::int64_t>((*content)->size())};
  auto state =
      co_await cache_.get(cache_keys::streaming_state(subtask_id.value()));
  if (state && *state) {
    if (auto parsed = parse_json(**state)) {
      out.task_id = TaskId{json::int_at(*parsed, "task_id").value_or(0)};
      out.offset = json::int_at(*parsed, "offset").value_or(out.offset);
      out.reasoning_offset =
          json::int_at(*parsed, "reasoning_offset").value_or(0);
    }
  }

  auto &projection = out.projection.get_object();
  const auto id = subtask_id.value();
  if (auto thinking = co_await cache_.get(cache_keys::streaming_thinking(id));
      thinking && *thinking) {
    if (auto parsed = parse_json(**thinking); parsed && parsed->is_array()) {
      projection["thinking"] = std::move(*parsed);
    }
  }
  if (auto workbench =
          co_await cache_.get(cache_keys::streaming_workbench(id));
      workbench && *workbench) {
    if (auto parsed = parse_json(**workbench); parsed && parsed->is_object()) {
      projection["workbench"] = std::move(*parsed);
    }
  }
  if (auto reasoning =
          co_await cache_.get(cache_keys::streaming_reasoning(id));
      reasoning && *reasoning) {
    projection["reasoning_content"] = **reasoning;
  }
  co_return ok(std::move(out));
}

auto StreamingIngestor::sweep_shard(shard_id sid, SteadyClock::time_point now)
    -> task<std::size_t> {
  auto &sessions = shards_[sid].sessions;
  const auto timeout = config_.stale_session_timeout();
  std::size_t dropped = 0;
  for (auto it = sessions.begin(); it != sessions.end();) {
    if (now - it->second.last_flush() > timeout) {
      log::info("Dropping stale streaming session for subtask {}", it->first);
      it = sessions.erase(it);
      ++dropped;
    } else {
      ++it;
    }
  }
  co_return dropped;
}

auto StreamingIngestor::sweep_stale(SteadyClock::time_point now)
    -> task<std::size_t> {
  std::size_t total = 0;
  for (shard_id sid = 0; sid < shards_.size(); ++sid) {
    total += co_await co_spawn(runtime_.executor_for(sid),
                               sweep_shard(sid, now), use_awaitable);
  }
  co_return total;
}

auto StreamingIngestor::session_count() -> task<std::size_t> {
  std::size_t total = 0;
  for (shard_id sid = 0; sid < shards_.size(); ++sid) {
    total += co_await co_spawn(
        runtime_.executor_for(sid),
        [this, sid]() -> task<std::size_t> {
          co_return shards_[sid].sessions.size();
        },
        use_awaitable);
  }
  co_return total;
}

auto StreamingIngestor::request_cancel(SubtaskId subtask_id)
    -> task<Result<void>> {
  co_return co_await cache_.set(cache_keys::cancel_flag(subtask_id.value()),
                                "1", config_.cancel_ttl());
}

auto StreamingIngestor::is_cancelled(SubtaskId subtask_id)
    -> task<Result<bool>> {
  auto flag = co_await cache_.get(cache_keys::cancel_flag(subtask_id.value()));
  if (!flag) {
    co_return fail(flag.error());
  }
  co_return ok(flag->has_value());
}

} // namespace taskforge::streaming
