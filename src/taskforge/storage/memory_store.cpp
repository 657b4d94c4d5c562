#include "taskforge/storage/memory_store.hpp"

#include "taskforge/util/time.hpp"

#include <algorithm>
#include <ranges>
#include <utility>

namespace taskforge::storage {

auto MemoryStore::stamp() -> std::int64_t {
  // strictly increasing so "newest first" is well defined within one ms
  clock_ms_ = std::max(clock_ms_ + 1, util::now_millis());
  return clock_ms_;
}

auto MemoryStore::open() -> task<Result<void>> {
  open_.store(true);
  co_return ok();
}

auto MemoryStore::close() -> task<void> {
  open_.store(false);
  co_return;
}

auto MemoryStore::is_open() const noexcept -> bool { return open_.load(); }

auto MemoryStore::create_task(Task t) -> task<Result<TaskId>> {
  std::scoped_lock lock(mu_);
  t.id = TaskId{next_task_id_++};
  t.created_at = t.updated_at = stamp();
  t.version = 0;
  auto id = t.id;
  tasks_.emplace(id, std::move(t));
  co_return ok(id);
}

auto MemoryStore::get_task(TaskId id) -> task<Result<Task>> {
  std::scoped_lock lock(mu_);
  auto it = tasks_.find(id);
  if (it == tasks_.end()) {
    co_return fail(Error::NotFound);
  }
  co_return ok(it->second);
}

auto MemoryStore::list_tasks_by_status(TaskStatus status, int limit)
    -> task<Result<std::vector<Task>>> {
  std::scoped_lock lock(mu_);
  std::vector<Task> out;
  for (const auto &[id, t] : tasks_) {
    if (t.status == status) {
      out.push_back(t);
    }
  }
  std::ranges::sort(out, [](const Task &a, const Task &b) {
    if (a.created_at != b.created_at) {
      return a.created_at > b.created_at;
    }
    return a.id > b.id;
  });
  if (limit >= 0 && std::cmp_less(limit, out.size())) {
    out.resize(static_cast<std::size_t>(limit));
  }
  co_return ok(std::move(out));
}

auto MemoryStore::update_task_versioned(const Task &t) -> task<Result<bool>> {
  std::scoped_lock lock(mu_);
  auto it = tasks_.find(t.id);
  if (it == tasks_.end()) {
    co_return fail(Error::NotFound);
  }
  if (it->second.version != t.version) {
    co_return ok(false);
  }
  auto &row = it->second;
  row.title = t.title;
  row.status = t.status;
  row.progress = t.progress;
  row.error_message = t.error_message;
  row.result = t.result;
  row.completed_at = t.completed_at;
  row.updated_at = stamp();
  ++row.version;
  co_return ok(true);
}

auto MemoryStore::cas_task_status(TaskId id, TaskStatus expected,
                                  TaskStatus next) -> task<Result<bool>> {
  std::scoped_lock lock(mu_);
  auto it = tasks_.find(id);
  if (it == tasks_.end() || it->second.status != expected) {
    co_return ok(false);
  }
  it->second.status = next;
  it->second.updated_at = stamp();
  ++it->second.version;
  co_return ok(true);
}

auto MemoryStore::create_subtask(Subtask s) -> task<Result<SubtaskId>> {
  std::scoped_lock lock(mu_);
  if (!tasks_.contains(s.task_id)) {
    co_return fail(Error::NotFound);
  }
  if (s.message_id == 0) {
    std::int64_t max_id = 0;
    for (const auto &[id, row] : subtasks_) {
      if (row.task_id == s.task_id) {
        max_id = std::max(max_id, row.message_id);
      }
    }
    s.message_id = max_id + 1;
  }
  s.id = SubtaskId{next_subtask_id_++};
  s.created_at = s.updated_at = stamp();
  auto id = s.id;
  subtasks_.emplace(id, std::move(s));
  co_return ok(id);
}

auto MemoryStore::get_subtask(SubtaskId id) -> task<Result<Subtask>> {
  std::scoped_lock lock(mu_);
  auto it = subtasks_.find(id);
  if (it == subtasks_.end()) {
    co_return fail(Error::NotFound);
  }
  co_return ok(it->second);
}

auto MemoryStore::list_subtasks(TaskId task_id)
    -> task<Result<std::vector<Subtask>>> {
  std::scoped_lock lock(mu_);
  std::vector<Subtask> out;
  for (const auto &[id, row] : subtasks_) {
    if (row.task_id == task_id) {
      out.push_back(row);
    }
  }
  std::ranges::sort(out, sequence_less);
  co_return ok(std::move(out));
}

auto MemoryStore::claim_subtask(SubtaskId id) -> task<Result<bool>> {
  std::scoped_lock lock(mu_);
  auto it = subtasks_.find(id);
  if (it == subtasks_.end()) {
    co_return fail(Error::NotFound);
  }
  if (it->second.status != SubtaskStatus::Pending) {
    co_return ok(false);
  }
  it->second.status = SubtaskStatus::Running;
  it->second.updated_at = stamp();
  co_return ok(true);
}

auto MemoryStore::release_subtask(SubtaskId id) -> task<Result<bool>> {
  std::scoped_lock lock(mu_);
  auto it = subtasks_.find(id);
  if (it == subtasks_.end()) {
    co_return fail(Error::NotFound);
  }
  if (it->second.status != SubtaskStatus::Running) {
    co_return ok(false);
  }
  it->second.status = SubtaskStatus::Pending;
  it->second.updated_at = stamp();
  co_return ok(true);
}

auto MemoryStore::patch_subtask(const SubtaskPatch &p) -> task<Result<bool>> {
  std::scoped_lock lock(mu_);
  auto it = subtasks_.find(p.id);
  if (it == subtasks_.end()) {
    co_return fail(Error::NotFound);
  }
  auto &row = it->second;
  if (row.status != p.expected_status) {
    co_return ok(false);
  }
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
  row.updated_at = stamp();
  if (is_terminal(row.status) && row.completed_at == 0) {
    row.completed_at = row.updated_at;
  }
  co_return ok(true);
}

auto MemoryStore::write_stream_result(const StreamResultWrite &w)
    -> task<Result<bool>> {
  std::scoped_lock lock(mu_);
  auto it = subtasks_.find(w.subtask_id);
  if (it == subtasks_.end()) {
    co_return fail(Error::NotFound);
  }
  auto &row = it->second;
  if (w.require_running && row.status != SubtaskStatus::Running) {
    co_return ok(false);
  }
  row.status = w.status;
  row.result = w.result;
  if (w.error_message) {
    row.error_message = *w.error_message;
  }
  if (w.progress) {
    row.progress = *w.progress;
  }
  row.updated_at = stamp();
  if (is_terminal(w.status) && row.completed_at == 0) {
    row.completed_at = row.updated_at;
  }
  co_return ok(true);
}

auto MemoryStore::erase_subtask(SubtaskId id) -> void {
  std::scoped_lock lock(mu_);
  subtasks_.erase(id);
}

auto MemoryStore::erase_task(TaskId id) -> void {
  std::scoped_lock lock(mu_);
  tasks_.erase(id);
  for (auto it = subtasks_.begin(); it != subtasks_.end();) {
    if (it->second.task_id == id) {
      it = subtasks_.erase(it);
    } else {
      ++it;
    }
  }
}

auto MemoryStore::get_by_id(ResourceKind kind, ResourceId id)
    -> task<Result<Resource>> {
  std::scoped_lock lock(mu_);
  auto it = resources_.find(id);
  if (it == resources_.end() || it->second.kind != kind ||
      !it->second.is_active) {
    co_return fail(Error::NotFound);
  }
  co_return ok(it->second);
}

auto MemoryStore::query(ResourceKind kind, ResourceFilter filter)
    -> task<Result<std::vector<Resource>>> {
  std::scoped_lock lock(mu_);
  std::vector<Resource> out;
  for (const auto &[id, r] : resources_) {
    if (r.kind != kind || (filter.active_only && !r.is_active)) {
      continue;
    }
    if (filter.user_id && r.user_id != *filter.user_id) {
      continue;
    }
    if (filter.name && r.name != *filter.name) {
      continue;
    }
    if (filter.name_space && r.name_space != *filter.name_space) {
      continue;
    }
    out.push_back(r);
  }
  std::ranges::sort(out, {}, &Resource::id);
  co_return ok(std::move(out));
}

auto MemoryStore::upsert(ResourceKind kind, UserId owner, std::string name,
                         std::string name_space, JsonValue json)
    -> task<Result<Resource>> {
  std::scoped_lock lock(mu_);
  auto now = stamp();
  for (auto &[id, r] : resources_) {
    if (r.kind == kind && r.user_id == owner && r.name == name &&
        r.name_space == name_space) {
      r.json = std::move(json);
      r.is_active = true;
      r.updated_at = now;
      co_return ok(r);
    }
  }
  Resource r{.id = ResourceId{next_resource_id_++},
             .user_id = owner,
             .kind = kind,
             .name = std::move(name),
             .name_space = std::move(name_space),
             .json = std::move(json),
             .is_active = true,
             .created_at = now,
             .updated_at = now};
  resources_.emplace(r.id, r);
  co_return ok(std::move(r));
}

auto MemoryStore::soft_delete(ResourceId id) -> task<Result<void>> {
  std::scoped_lock lock(mu_);
  auto it = resources_.find(id);
  if (it == resources_.end()) {
    co_return fail(Error::NotFound);
  }
  it->second.is_active = false;
  it->second.updated_at = stamp();
  co_return ok();
}

auto MemoryStore::get_user(UserId id) -> task<Result<User>> {
  std::scoped_lock lock(mu_);
  auto it = users_.find(id);
  if (it == users_.end() || !it->second.is_active) {
    co_return fail(Error::NotFound);
  }
  co_return ok(it->second);
}

auto MemoryStore::upsert_user(User user) -> task<Result<UserId>> {
  std::scoped_lock lock(mu_);
  if (user.id.empty()) {
    user.id = UserId{next_user_id_++};
  } else {
    next_user_id_ = std::max(next_user_id_, user.id.value() + 1);
  }
  auto id = user.id;
  users_.insert_or_assign(id, std::move(user));
  co_return ok(id);
}

} // namespace taskforge::storage
