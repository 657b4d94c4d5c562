#pragma once

#include "taskforge/core/coroutine.hpp"
#include "taskforge/core/error.hpp"
#include "taskforge/domain/task.hpp"
#include "taskforge/util/id.hpp"
#include "taskforge/util/json.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace taskforge {

/// Durable write produced by the streaming ingestor.
struct StreamResultWrite {
  SubtaskId subtask_id;
  SubtaskStatus status{SubtaskStatus::Running};
  JsonValue result{};
  std::optional<std::string> error_message;
  std::optional<int> progress;
  /// Periodic flushes only land while the row is still RUNNING so a late
  /// flush can never undo a terminal write.
  bool require_running{false};
};

/// Partial write of a subtask. Only set members are written, and only while
/// the row's status still equals `expected_status`.
struct SubtaskPatch {
  SubtaskId id;
  SubtaskStatus expected_status{SubtaskStatus::Pending};
  std::optional<SubtaskStatus> status;
  std::optional<int> progress;
  std::optional<JsonValue> result;
  std::optional<std::string> error_message;
  std::optional<std::string> executor_name;
  std::optional<std::string> executor_namespace;
  std::optional<std::string> title;
};

// Durable store of Task and Subtask rows.
// Implementations: MySQLStore, MemoryStore.
// Every conditional write reports whether it won: `false` means another
// writer changed the row first, which callers treat as a lost race, not an
// error.
class CoordinatorStore {
public:
  virtual ~CoordinatorStore() = default;

  virtual auto open() -> task<Result<void>> = 0;
  virtual auto close() -> task<void> = 0;
  [[nodiscard]] virtual auto is_open() const noexcept -> bool = 0;

  // === Tasks ===
  virtual auto create_task(Task t) -> task<Result<TaskId>> = 0;
  virtual auto get_task(TaskId id) -> task<Result<Task>> = 0;
  /// Newest first.
  virtual auto list_tasks_by_status(TaskStatus status, int limit)
      -> task<Result<std::vector<Task>>> = 0;
  /// Conditional on `t.version`; bumps the version on success.
  virtual auto update_task_versioned(const Task &t) -> task<Result<bool>> = 0;
  virtual auto cas_task_status(TaskId id, TaskStatus expected, TaskStatus next)
      -> task<Result<bool>> = 0;

  // === Subtasks ===
  /// Assigns message_id = max(message_id in task) + 1 when left at 0.
  virtual auto create_subtask(Subtask s) -> task<Result<SubtaskId>> = 0;
  virtual auto get_subtask(SubtaskId id) -> task<Result<Subtask>> = 0;
  /// Sequence order (message_id, created_at).
  virtual auto list_subtasks(TaskId task_id)
      -> task<Result<std::vector<Subtask>>> = 0;
  /// PENDING -> RUNNING; true only for the single caller that flipped it.
  /// NotFound when the row is gone.
  virtual auto claim_subtask(SubtaskId id) -> task<Result<bool>> = 0;
  /// RUNNING -> PENDING for a claim whose dispatch could not complete.
  virtual auto release_subtask(SubtaskId id) -> task<Result<bool>> = 0;
  /// Stamps completed_at on the first terminal status. NotFound when the
  /// row is gone.
  virtual auto patch_subtask(const SubtaskPatch &p) -> task<Result<bool>> = 0;
  virtual auto write_stream_result(const StreamResultWrite &w)
      -> task<Result<bool>> = 0;
};

} // namespace taskforge
