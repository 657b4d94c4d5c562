#pragma once

#include "taskforge/config/system_config.hpp"
#include "taskforge/storage/coordinator_store.hpp"
#include "taskforge/storage/resource_store.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/mysql/connection_pool.hpp>
#include <boost/mysql/pool_params.hpp>

namespace taskforge::storage {

class MySQLStore final : public CoordinatorStore, public ResourceStore {
public:
  explicit MySQLStore(boost::asio::any_io_executor executor,
                      const DatabaseConfig &config);
  ~MySQLStore() override;

  MySQLStore(const MySQLStore &) = delete;
  MySQLStore &operator=(const MySQLStore &) = delete;

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

  /// Removes every row; test fixtures only.
  auto clear_all() -> task<Result<void>>;

private:
  auto ensure_database_exists() -> task<Result<void>>;
  auto get_connection() -> task<Result<boost::mysql::pooled_connection>>;
  auto ensure_schema(boost::mysql::any_connection &conn) -> task<Result<void>>;
  auto flip_subtask_status(SubtaskId id, SubtaskStatus expected,
                           SubtaskStatus next) -> task<Result<bool>>;

  DatabaseConfig cfg_;
  boost::mysql::connection_pool pool_;
  bool open_{false};
};

} // namespace taskforge::storage
