#include "taskforge/streaming/workbench.hpp"

#include <algorithm>

namespace taskforge::streaming {

namespace {

struct ListDelta {
  std::vector<JsonValue> add;
  std::vector<std::string> remove;
};

auto key_of(const JsonValue &entry, std::string_view key)
    -> std::optional<std::string> {
  return json::string_at(entry, key);
}

auto parse_list_delta(const JsonValue &section, std::string_view key)
    -> Result<ListDelta> {
  if (!section.is_object()) {
    return fail(Error::InvalidArgument);
  }
  ListDelta out;
  if (const auto *add = json::find(section, "add")) {
    if (!add->is_array()) {
      return fail(Error::InvalidArgument);
    }
    for (const auto &entry : add->get_array()) {
      if (!entry.is_object() || !key_of(entry, key)) {
        return fail(Error::InvalidArgument);
      }
      out.add.push_back(entry);
    }
  }
  if (const auto *remove = json::find(section, "remove")) {
    if (!remove->is_array()) {
      return fail(Error::InvalidArgument);
    }
    for (const auto &entry : remove->get_array()) {
      // bare keys are accepted alongside {key: ...} objects
      if (entry.is_string()) {
        out.remove.push_back(entry.get_string());
        continue;
      }
      auto k = key_of(entry, key);
      if (!k) {
        return fail(Error::InvalidArgument);
      }
      out.remove.push_back(std::move(*k));
    }
  }
  return ok(std::move(out));
}

auto merge_list(std::vector<JsonValue> &list, std::vector<JsonValue> add,
                const std::vector<std::string> &remove, std::string_view key)
    -> void {
  for (auto &entry : add) {
    list.push_back(std::move(entry));
  }
  if (remove.empty()) {
    return;
  }
  std::erase_if(list, [&](const JsonValue &entry) {
    auto k = key_of(entry, key);
    return k && std::ranges::find(remove, *k) != remove.end();
  });
}

} // namespace

auto parse_workbench_delta(const JsonValue &delta) -> Result<WorkbenchDelta> {
  if (!delta.is_object()) {
    return fail(Error::InvalidArgument);
  }
  WorkbenchDelta out;
  for (const auto &[key, value] : delta.get_object()) {
    if (key == "file_changes") {
      if (value.is_null()) {
        continue;
      }
      auto files = parse_list_delta(value, kFileKey);
      if (!files) {
        return fail(files.error());
      }
      out.touches_files = true;
      out.files_added = std::move(files->add);
      out.files_removed = std::move(files->remove);
    } else if (key == "git_info") {
      if (value.is_null()) {
        continue;
      }
      if (!value.is_object()) {
        return fail(Error::InvalidArgument);
      }
      out.touches_git = true;
      for (const auto &[gkey, gvalue] : value.get_object()) {
        if (gkey != "task_commits") {
          out.git_fields.insert_or_assign(gkey, gvalue);
          continue;
        }
        auto commits = parse_list_delta(gvalue, kCommitKey);
        if (!commits) {
          return fail(commits.error());
        }
        out.commits_added = std::move(commits->add);
        out.commits_removed = std::move(commits->remove);
      }
    } else if (key == "status") {
      out.status = value;
    } else if (key == "error") {
      out.error = value;
    } else {
      out.extras.insert_or_assign(key, value);
    }
  }
  return ok(std::move(out));
}

auto Workbench::apply(const WorkbenchDelta &delta) -> void {
  if (delta.touches_files) {
    has_files_ = true;
    merge_list(files_, delta.files_added, delta.files_removed, kFileKey);
  }
  if (delta.touches_git) {
    has_git_ = true;
    if (!delta.commits_added.empty() || !delta.commits_removed.empty()) {
      has_commits_ = true;
      merge_list(commits_, delta.commits_added, delta.commits_removed,
                 kCommitKey);
    }
    for (const auto &[key, value] : delta.git_fields) {
      git_fields_.insert_or_assign(key, value);
    }
  }
  if (delta.status) {
    status_ = delta.status;
  }
  if (delta.error) {
    error_ = delta.error;
  }
  for (const auto &[key, value] : delta.extras) {
    extras_.insert_or_assign(key, value);
  }
}

auto Workbench::empty() const noexcept -> bool {
  return !has_files_ && !has_git_ && !status_ && !error_ && extras_.empty();
}

auto Workbench::to_json() const -> JsonValue {
  JsonValue out = extras_;
  auto &obj = out.get_object();
  if (has_files_) {
    obj["file_changes"] = JsonArray(files_.begin(), files_.end());
  }
  if (has_git_) {
    JsonValue git = git_fields_;
    if (has_commits_) {
      git.get_object()["task_commits"] =
          JsonArray(commits_.begin(), commits_.end());
    }
    obj["git_info"] = std::move(git);
  }
  if (status_) {
    obj["status"] = *status_;
  }
  if (error_) {
    obj["error"] = *error_;
  }
  return out;
}

} // namespace taskforge::streaming
