#pragma once

#include "taskforge/cache/fast_cache.hpp"
#include "taskforge/config/system_config.hpp"
#include "taskforge/core/coroutine.hpp"
#include "taskforge/core/error.hpp"
#include "taskforge/core/runtime.hpp"
#include "taskforge/live/live_channel.hpp"
#include "taskforge/status/status_aggregator.hpp"
#include "taskforge/storage/coordinator_store.hpp"
#include "taskforge/streaming/stream_event.hpp"
#include "taskforge/streaming/streaming_session.hpp"

#include <ankerl/unordered_dense.h>
#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace taskforge::streaming {

struct EventAck {
  bool success{true};
  std::string message;
  std::int64_t offset{0};
};

/// Resume point for a reader joining a stream mid-flight.
struct SessionSnapshot {
  TaskId task_id;
  SubtaskId subtask_id;
  JsonValue projection;
  std::int64_t offset{0};
  std::int64_t reasoning_offset{0};
  bool live{false}; // false: rebuilt from the fast cache
};

// Turns worker stream events into buffered session state, live
// notifications, cache snapshots and durable subtask writes.
//
// Sessions are partitioned by subtask id across the runtime shards. Each
// shard's map is only touched on that shard's thread; process_event hops
// there for the state change and performs all I/O after hopping back.
class StreamingIngestor {
public:
  StreamingIngestor(Runtime &runtime, CoordinatorStore &store,
                    FastCache &cache, LiveChannel &live,
                    StatusAggregator &aggregator, StreamingConfig config);
  ~StreamingIngestor();

  StreamingIngestor(const StreamingIngestor &) = delete;
  auto operator=(const StreamingIngestor &) -> StreamingIngestor & = delete;

  /// Arms the per-shard stale sweep timers. The runtime must be running.
  auto start() -> void;
  auto stop() -> void;

  auto process_event(StreamEvent event) -> task<Result<EventAck>>;

  auto snapshot(SubtaskId subtask_id) -> task<Result<SessionSnapshot>>;

  /// Drops sessions whose last flush is older than the stale timeout.
  /// Returns the number of sessions dropped.
  auto sweep_stale(SteadyClock::time_point now) -> task<std::size_t>;

  [[nodiscard]] auto session_count() -> task<std::size_t>;

  auto request_cancel(SubtaskId subtask_id) -> task<Result<void>>;
  auto is_cancelled(SubtaskId subtask_id) -> task<Result<bool>>;

  [[nodiscard]] auto config() const noexcept -> const StreamingConfig & {
    return config_;
  }

private:
  /// Key/value pairs of one cache snapshot: content and state always,
  /// reasoning, thinking and workbench once they hold something.
  struct CacheWrite {
    std::vector<std::pair<std::string, std::string>> entries;
  };

  /// What a shard step decided; carried back to the caller for I/O.
  struct Effects {
    TaskId task_id;
    std::int64_t offset{0};
    std::vector<LiveEvent> live;
    std::optional<CacheWrite> cache;
    std::optional<StreamResultWrite> durable;
    bool terminal{false};
  };

  struct Shard {
    ankerl::unordered_dense::map<SubtaskId, StreamingSession> sessions;
    std::unique_ptr<boost::asio::steady_timer> sweep_timer;
  };

  auto shard_of(SubtaskId id) const noexcept -> shard_id;

  auto apply_on_shard(shard_id sid, StreamEvent event, EventBody body)
      -> task<Effects>;
  auto purge_on_shard(shard_id sid, SubtaskId subtask_id) -> task<void>;
  auto sweep_shard(shard_id sid, SteadyClock::time_point now)
      -> task<std::size_t>;
  auto snapshot_on_shard(shard_id sid, SubtaskId subtask_id)
      -> task<std::optional<SessionSnapshot>>;
  auto sweep_loop(shard_id sid) -> spawn_task;

  auto cache_write_for(const StreamingSession &session) const -> CacheWrite;
  auto run_effects(Effects effects, SubtaskId subtask_id)
      -> task<Result<EventAck>>;

  Runtime &runtime_;
  CoordinatorStore &store_;
  FastCache &cache_;
  LiveChannel &live_;
  StatusAggregator &aggregator_;
  StreamingConfig config_;
  std::vector<Shard> shards_;
  std::atomic<bool> sweeping_{false};
};

} // namespace taskforge::streaming
