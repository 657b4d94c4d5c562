#pragma once

#include "taskforge/core/coroutine.hpp"
#include "taskforge/core/error.hpp"
#include "taskforge/domain/task.hpp"
#include "taskforge/storage/coordinator_store.hpp"

#include <optional>
#include <span>
#include <string>

namespace taskforge {

/// Partial update of a subtask; unset members leave the row untouched.
struct SubtaskUpdate {
  SubtaskId subtask_id;
  std::optional<SubtaskStatus> status;
  std::optional<int> progress;
  std::optional<JsonValue> result;
  std::optional<std::string> error_message;
  std::optional<std::string> executor_name;
  std::optional<std::string> executor_namespace;
  std::optional<std::string> subtask_title;
  std::optional<std::string> task_title;
};

/// The subtask's own state after the update.
struct SubtaskUpdateOutcome {
  SubtaskId subtask_id;
  TaskId task_id;
  SubtaskStatus status{SubtaskStatus::Running};
  int progress{0};
};

/// Task-level state derived from its ASSISTANT subtasks (given in sequence
/// order). Returns nullopt when there are none, leaving the task as is.
///
///   progress = floor(100 * completed / total)
///   any FAILED     -> FAILED, error and result of the last failed subtask
///   all finished   -> the last subtask's status and result, progress 100
///   otherwise      -> RUNNING with completed_at cleared; a single subtask
///                     lends its own progress, result and error
///
/// CANCELLED subtasks count as finished.
[[nodiscard]] auto derive_task_state(const Task &current,
                                     std::span<const Subtask> assistants,
                                     std::int64_t now_ms)
    -> std::optional<Task>;

/// The conditional store write for `update` against the observed `row`.
/// Once `row` is terminal, progress and non-terminal statuses are dropped.
[[nodiscard]] auto subtask_patch_for(const Subtask &row,
                                     const SubtaskUpdate &update)
    -> SubtaskPatch;

/// Merges set fields of `update` into `row` under the same rules as
/// subtask_patch_for. completed_at is stamped on the first terminal status
/// only.
auto merge_subtask_update(Subtask &row, const SubtaskUpdate &update,
                          std::int64_t now_ms) -> void;

class StatusAggregator {
public:
  static constexpr int kMaxCasAttempts = 8;

  explicit StatusAggregator(CoordinatorStore &store) : store_(store) {}

  /// Re-derives and writes the task aggregate, retrying when a concurrent
  /// writer bumped the task version in between.
  auto recompute(TaskId task_id,
                 std::optional<std::string> task_title = std::nullopt)
      -> task<Result<Task>>;

  /// not-found for a missing subtask; otherwise a conditional patch of the
  /// row (re-read and retried on a lost race), then recompute.
  auto apply_update(SubtaskUpdate update)
      -> task<Result<SubtaskUpdateOutcome>>;

private:
  CoordinatorStore &store_;
};

} // namespace taskforge
