#include "taskforge/status/status_aggregator.hpp"

#include "taskforge/util/log.hpp"
#include "taskforge/util/time.hpp"

#include <algorithm>
#include <ranges>
#include <vector>

namespace taskforge {

auto derive_task_state(const Task &current, std::span<const Subtask> assistants,
                       std::int64_t now_ms) -> std::optional<Task> {
  if (assistants.empty()) {
    return std::nullopt;
  }

  const auto total = static_cast<std::int64_t>(assistants.size());
  std::int64_t finished = 0;
  const Subtask *last_failed = nullptr;
  for (const auto &s : assistants) {
    if (s.status == SubtaskStatus::Completed ||
        s.status == SubtaskStatus::Cancelled) {
      ++finished;
    } else if (s.status == SubtaskStatus::Failed) {
      last_failed = &s;
    }
  }

  Task next = current;
  next.progress = static_cast<int>(100 * finished / total);

  if (last_failed != nullptr) {
    next.status = TaskStatus::Failed;
    next.error_message = last_failed->error_message;
    next.result = last_failed->result;
    if (next.completed_at == 0) {
      next.completed_at = now_ms;
    }
  } else if (finished == total) {
    const auto &last = assistants.back();
    next.status = task_status_for(last.status);
    next.result = last.result;
    next.error_message = last.error_message;
    next.progress = 100;
    if (next.completed_at == 0) {
      next.completed_at = now_ms;
    }
  } else {
    next.status = TaskStatus::Running;
    next.completed_at = 0;
    if (total == 1) {
      const auto &only = assistants.front();
      next.progress = only.progress;
      next.result = only.result;
      next.error_message = only.error_message;
    }
  }
  return next;
}

auto subtask_patch_for(const Subtask &row, const SubtaskUpdate &update)
    -> SubtaskPatch {
  SubtaskPatch p{.id = row.id,
                 .expected_status = row.status,
                 .result = update.result,
                 .error_message = update.error_message,
                 .executor_name = update.executor_name,
                 .executor_namespace = update.executor_namespace,
                 .title = update.subtask_title};
  // A finished subtask cannot be reopened by a late progress report.
  const bool settled = is_terminal(row.status);
  if (update.status && !(settled && !is_terminal(*update.status))) {
    p.status = update.status;
  }
  if (update.progress && !settled) {
    p.progress = std::clamp(*update.progress, 0, 100);
  }
  return p;
}

auto merge_subtask_update(Subtask &row, const SubtaskUpdate &update,
                          std::int64_t now_ms) -> void {
  const auto p = subtask_patch_for(row, update);
  if (p.status) {
    row.status = *p.status;
  }
  if (p.progress) {
    row.progress = *p.progress;
  }
  if (p.result) {
    row.result = *p.result;
  }
  if (p.error_message) {
    row.error_message = *p.error_message;
  }
  if (p.executor_name) {
    row.executor_name = *p.executor_name;
  }
  if (p.executor_namespace) {
    row.executor_namespace = *p.executor_namespace;
  }
  if (p.title) {
    row.title = *p.title;
  }
  if (is_terminal(row.status) && row.completed_at == 0) {
    row.completed_at = now_ms;
  }
}

auto StatusAggregator::recompute(TaskId task_id,
                                 std::optional<std::string> task_title)
    -> task<Result<Task>> {
  for (int attempt = 0; attempt < kMaxCasAttempts; ++attempt) {
    auto current = co_await store_.get_task(task_id);
    if (!current) {
      co_return fail(current.error());
    }
    auto subtasks = co_await store_.list_subtasks(task_id);
    if (!subtasks) {
      co_return fail(subtasks.error());
    }

    std::vector<Subtask> assistants;
    std::ranges::copy_if(*subtasks, std::back_inserter(assistants),
                         [](const Subtask &s) {
                           return s.role == SubtaskRole::Assistant;
                         });

    auto derived = derive_task_state(*current, assistants, util::now_millis());
    if (!derived && !task_title) {
      co_return ok(std::move(*current));
    }
    Task next = derived ? std::move(*derived) : *current;
    if (task_title) {
      next.title = *task_title;
    }

    auto written = co_await store_.update_task_versioned(next);
    if (!written) {
      co_return fail(written.error());
    }
    if (*written) {
      ++next.version;
      log::debug("Task {} aggregated to {} ({}%)", task_id,
                 to_string_view(next.status), next.progress);
      co_return ok(std::move(next));
    }
    log::debug("Task {} changed concurrently, re-deriving (attempt {})",
               task_id, attempt + 1);
  }
  log::warn("Task {} aggregate lost {} consecutive races", task_id,
            kMaxCasAttempts);
  co_return fail(Error::Conflict);
}

auto StatusAggregator::apply_update(SubtaskUpdate update)
    -> task<Result<SubtaskUpdateOutcome>> {
  for (int attempt = 0; attempt < kMaxCasAttempts; ++attempt) {
    auto row = co_await store_.get_subtask(update.subtask_id);
    if (!row) {
      co_return fail(row.error());
    }
    auto written =
        co_await store_.patch_subtask(subtask_patch_for(*row, update));
    if (!written) {
      co_return fail(written.error());
    }
    if (!*written) {
      log::debug("Subtask {} changed concurrently, re-reading (attempt {})",
                 update.subtask_id, attempt + 1);
      continue;
    }
    merge_subtask_update(*row, update, util::now_millis());

    auto task_state = co_await recompute(row->task_id, update.task_title);
    if (!task_state) {
      co_return fail(task_state.error());
    }
    co_return ok(SubtaskUpdateOutcome{.subtask_id = row->id,
                                      .task_id = row->task_id,
                                      .status = row->status,
                                      .progress = row->progress});
  }
  log::warn("Subtask {} update lost {} consecutive races", update.subtask_id,
            kMaxCasAttempts);
  co_return fail(Error::Conflict);
}

} // namespace taskforge
