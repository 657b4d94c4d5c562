#pragma once

#include "taskforge/util/enum.hpp"
#include "taskforge/util/id.hpp"
#include "taskforge/util/json.hpp"

#include <boost/describe/enum.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace taskforge {

enum class TaskStatus : std::uint8_t {
  Pending,
  Running,
  Completed,
  Failed,
  Cancelled,
  Delete,
};
BOOST_DESCRIBE_ENUM(TaskStatus, Pending, Running, Completed, Failed, Cancelled,
                    Delete)
TASKFORGE_DEFINE_ENUM_SERDE_UPPER(TaskStatus, TaskStatus::Pending)

enum class SubtaskStatus : std::uint8_t {
  Pending,
  Running,
  Completed,
  Failed,
  Cancelled,
};
BOOST_DESCRIBE_ENUM(SubtaskStatus, Pending, Running, Completed, Failed,
                    Cancelled)
TASKFORGE_DEFINE_ENUM_SERDE_UPPER(SubtaskStatus, SubtaskStatus::Pending)

enum class SubtaskRole : std::uint8_t { User, Assistant };
BOOST_DESCRIBE_ENUM(SubtaskRole, User, Assistant)
TASKFORGE_DEFINE_ENUM_SERDE_UPPER(SubtaskRole, SubtaskRole::Assistant)

enum class WorkflowMode : std::uint8_t { Parallel, Pipeline };
BOOST_DESCRIBE_ENUM(WorkflowMode, Parallel, Pipeline)
TASKFORGE_DEFINE_ENUM_SERDE(WorkflowMode, WorkflowMode::Parallel)

enum class TaskType : std::uint8_t { Online, Subscription };
BOOST_DESCRIBE_ENUM(TaskType, Online, Subscription)
TASKFORGE_DEFINE_ENUM_SERDE(TaskType, TaskType::Online)

[[nodiscard]] constexpr auto is_terminal(SubtaskStatus s) noexcept -> bool {
  return s == SubtaskStatus::Completed || s == SubtaskStatus::Failed ||
         s == SubtaskStatus::Cancelled;
}

[[nodiscard]] constexpr auto is_terminal(TaskStatus s) noexcept -> bool {
  return s == TaskStatus::Completed || s == TaskStatus::Failed ||
         s == TaskStatus::Cancelled || s == TaskStatus::Delete;
}

/// Repository/workspace the agent operates on, copied into every context.
struct Workspace {
  std::string git_url;
  std::string git_repo;
  std::int64_t git_repo_id{0};
  std::string git_domain;
  std::string branch_name;

  auto operator==(const Workspace &) const -> bool = default;
};

struct Task {
  TaskId id;
  UserId user_id;
  std::string user_name;
  std::string title;
  TaskStatus status{TaskStatus::Pending};
  int progress{0};
  std::string error_message;
  JsonValue result{}; // null until a subtask reports one
  ResourceId team_id;
  Workspace workspace;
  TaskType type{TaskType::Online};
  std::vector<std::string> additional_skills;
  std::string model_id;              // task-level model label
  bool force_override_model{false};  // model_id wins over bot bindings
  std::string force_override_model_type; // "public" | "user" | "group"
  std::int64_t version{0};           // bumped by every aggregate write
  std::int64_t created_at{0};        // epoch ms
  std::int64_t updated_at{0};
  std::int64_t completed_at{0};      // 0 until first terminal state
};

struct Subtask {
  SubtaskId id;
  TaskId task_id;
  UserId user_id;
  std::string title;
  SubtaskRole role{SubtaskRole::Assistant};
  std::int64_t message_id{0};
  SubtaskStatus status{SubtaskStatus::Pending};
  int progress{0};
  std::string prompt; // USER rows only
  JsonValue result{};
  std::string error_message;
  std::vector<std::int64_t> bot_ids;
  std::string executor_name;
  std::string executor_namespace;
  std::int64_t created_at{0};
  std::int64_t updated_at{0};
  std::int64_t completed_at{0};
};

/// Sequence order used everywhere: message_id, then creation time, then id.
[[nodiscard]] inline auto sequence_less(const Subtask &a, const Subtask &b)
    -> bool {
  if (a.message_id != b.message_id) {
    return a.message_id < b.message_id;
  }
  if (a.created_at != b.created_at) {
    return a.created_at < b.created_at;
  }
  return a.id < b.id;
}

[[nodiscard]] constexpr auto task_status_for(SubtaskStatus s) noexcept
    -> TaskStatus {
  switch (s) {
  case SubtaskStatus::Pending:
    return TaskStatus::Pending;
  case SubtaskStatus::Running:
    return TaskStatus::Running;
  case SubtaskStatus::Completed:
    return TaskStatus::Completed;
  case SubtaskStatus::Failed:
    return TaskStatus::Failed;
  case SubtaskStatus::Cancelled:
    return TaskStatus::Cancelled;
  }
  return TaskStatus::Running;
}

} // namespace taskforge
