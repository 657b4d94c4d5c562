#pragma once

#include "taskforge/storage/coordinator_store.hpp"
#include "taskforge/storage/resource_store.hpp"

#include <ankerl/unordered_dense.h>

#include <atomic>
#include <mutex>

namespace taskforge::storage {

/// In-process store with the same conditional-update semantics as the SQL
/// backend. All state sits behind one mutex; every method completes
/// without suspending.
class MemoryStore final : public CoordinatorStore, public ResourceStore {
public:
  MemoryStore() = default;

  auto open() -> task<Result<void>> override;
  auto close() -> task<void> override;
  [[nodiscard]] auto is_open() const noexcept -> bool override;

  auto create_task(Task t) -> task<Result<TaskId>> override;
  auto get_task(TaskId id) -> task<Result<Task>> override;
  auto list_tasks_by_status(TaskStatus status, int limit)
      -> task<Result<std::vector<Task>>> override;
  auto update_task_versioned(const Task &t) -> task<Result<bool>> override;
  auto cas_task_status(TaskId id, TaskStatus expected, TaskStatus next)
      -> task<Result<bool>> override;

  auto create_subtask(Subtask s) -> task<Result<SubtaskId>> override;
  auto get_subtask(SubtaskId id) -> task<Result<Subtask>> override;
  auto list_subtasks(TaskId task_id)
      -> task<Result<std::vector<Subtask>>> override;
  auto claim_subtask(SubtaskId id) -> task<Result<bool>> override;
  auto release_subtask(SubtaskId id) -> task<Result<bool>> override;
  auto patch_subtask(const SubtaskPatch &p) -> task<Result<bool>> override;
  auto write_stream_result(const StreamResultWrite &w)
      -> task<Result<bool>> override;

  auto get_by_id(ResourceKind kind, ResourceId id)
      -> task<Result<Resource>> override;
  auto query(ResourceKind kind, ResourceFilter filter)
      -> task<Result<std::vector<Resource>>> override;
  auto upsert(ResourceKind kind, UserId owner, std::string name,
              std::string name_space, JsonValue json)
      -> task<Result<Resource>> override;
  auto soft_delete(ResourceId id) -> task<Result<void>> override;

  auto get_user(UserId id) -> task<Result<User>> override;
  auto upsert_user(User user) -> task<Result<UserId>> override;

  /// Row removal, for exercising the "vanished between select and claim"
  /// path.
  auto erase_subtask(SubtaskId id) -> void;
  auto erase_task(TaskId id) -> void;

private:
  mutable std::mutex mu_;
  std::atomic<bool> open_{false};
  std::int64_t next_task_id_{1};
  std::int64_t next_subtask_id_{1};
  std::int64_t next_resource_id_{1};
  std::int64_t next_user_id_{1};
  std::int64_t clock_ms_{0};
  ankerl::unordered_dense::map<TaskId, Task> tasks_;
  ankerl::unordered_dense::map<SubtaskId, Subtask> subtasks_;
  ankerl::unordered_dense::map<ResourceId, Resource> resources_;
  ankerl::unordered_dense::map<UserId, User> users_;

  auto stamp() -> std::int64_t;
};

} // namespace taskforge::storage
