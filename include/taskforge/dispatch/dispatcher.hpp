#pragma once

#include "taskforge/config/system_config.hpp"
#include "taskforge/core/coroutine.hpp"
#include "taskforge/core/error.hpp"
#include "taskforge/dispatch/execution_context.hpp"
#include "taskforge/domain/resources.hpp"
#include "taskforge/domain/task.hpp"
#include "taskforge/storage/coordinator_store.hpp"
#include "taskforge/storage/resource_store.hpp"
#include "taskforge/util/enum.hpp"

#include <boost/describe/enum.hpp>

#include <optional>
#include <span>
#include <string>
#include <system_error>
#include <vector>

namespace taskforge {

struct ClaimRequest {
  SubtaskStatus status_filter{SubtaskStatus::Pending};
  int limit{0}; // <= 0: configured default
  std::vector<TaskId> task_ids;
};

enum class SkipReason : std::uint8_t {
  TaskNotFound,
  TaskNotActive,
  SubtaskRunning,
  NoMatchingSubtask,
  ClaimLost,
  Vanished,
  Released,
};
BOOST_DESCRIBE_ENUM(SkipReason, TaskNotFound, TaskNotActive, SubtaskRunning,
                    NoMatchingSubtask, ClaimLost, Vanished, Released)
TASKFORGE_DEFINE_ENUM_SERDE(SkipReason, SkipReason::Vanished)

struct SkippedItem {
  TaskId task_id;
  SubtaskId subtask_id; // unset when no subtask was selected
  SkipReason reason{SkipReason::Vanished};
};

struct DispatchReport {
  std::vector<ExecutionContext> contexts;
  std::vector<SkippedItem> skipped;
  std::vector<std::string> warnings; // degraded contexts
};

/// Prompt and neighbours of a subtask within its task's sequence.
struct PromptAggregate {
  std::string prompt;
  bool new_session{false};
  std::optional<SubtaskId> next_subtask_id;
  std::string inherited_executor_name;
  std::string inherited_executor_namespace;
  std::size_t pipeline_index{0}; // ASSISTANT subtasks before the target
};

/// `siblings` must be in sequence order and include `target`.
[[nodiscard]] auto aggregate_prompt(const Subtask &target,
                                    std::span<const Subtask> siblings)
    -> PromptAggregate;

/// Text rendering of a subtask result for the carried-over context.
[[nodiscard]] auto result_text(const JsonValue &result) -> std::string;

inline constexpr std::string_view kSubscriptionPromptSuffix =
    "\n\n<subscription_mode>\n"
    "This is a subscription task (scheduled background task). Note:\n"
    "- Any reply you generate will trigger a notification to the user.\n"
    "- Use the `silent_exit` tool to end the task silently without "
    "notifying the user.\n"
    "</subscription_mode>\n";

// Hands PENDING subtasks to workers. Selection is a plain read; the
// PENDING -> RUNNING flip is a conditional write, so concurrent callers
// (in this process or others) never receive the same subtask.
class Dispatcher {
public:
  Dispatcher(CoordinatorStore &store, ResourceStore &resources,
             DispatcherConfig config);

  auto claim(ClaimRequest request) -> task<Result<DispatchReport>>;

private:
  struct Candidate {
    TaskId task_id;
    SubtaskId subtask_id;
  };

  auto select_targeted(const ClaimRequest &request, DispatchReport &report)
      -> task<Result<std::vector<Candidate>>>;
  auto select_pool(const ClaimRequest &request, int limit,
                   DispatchReport &report)
      -> task<Result<std::vector<Candidate>>>;
  auto first_matching(TaskId task_id, SubtaskStatus status_filter,
                      bool skip_if_running, DispatchReport &report)
      -> task<Result<std::optional<Candidate>>>;

  /// Hands a claimed subtask back (RUNNING -> PENDING) when its context
  /// could not be built, so a later dispatch picks it up again.
  auto abandon_claim(const Candidate &c, bool task_flipped,
                     std::error_code cause) -> task<SkippedItem>;
  auto build_context(const Task &parent, const Subtask &subtask,
                     std::vector<std::string> &warnings)
      -> task<Result<ExecutionContext>>;
  auto resolve_bot(std::int64_t bot_id, const Task &parent,
                   const Subtask &subtask, const TeamMember *member,
                   std::vector<std::string> &warnings)
      -> task<std::optional<ContextBot>>;
  auto resolve_agent_config(JsonValue agent_config, const Task &parent,
                            UserId bot_owner, UserId chat_user)
      -> task<JsonValue>;
  auto find_model_by_type(const std::string &name, const std::string &type,
                          const std::string &name_space, UserId user)
      -> task<Result<Resource>>;

  CoordinatorStore &store_;
  ResourceStore &resources_;
  DispatcherConfig config_;
};

} // namespace taskforge
