#pragma once

#include "taskforge/core/error.hpp"
#include "taskforge/util/json.hpp"

#include <optional>
#include <string>
#include <vector>

namespace taskforge::streaming {

/// File change entries are identified by `path`; commits by `commit_id`.
inline constexpr std::string_view kFileKey = "path";
inline constexpr std::string_view kCommitKey = "commit_id";

/// Validated form of a workbench_delta payload.
struct WorkbenchDelta {
  std::vector<JsonValue> files_added;
  std::vector<std::string> files_removed;
  std::vector<JsonValue> commits_added;
  std::vector<std::string> commits_removed;
  JsonObject git_fields;    // git_info keys other than task_commits
  bool touches_files{false};
  bool touches_git{false};
  std::optional<JsonValue> status;
  std::optional<JsonValue> error;
  JsonObject extras;        // unrecognised top-level keys, merged per key
};

/// Rejects deltas whose list sections are not {add:[...], remove:[...]}
/// objects or whose entries lack the key field.
[[nodiscard]] auto parse_workbench_delta(const JsonValue &delta)
    -> Result<WorkbenchDelta>;

/// Accumulated side-channel state of a streaming subtask.
class Workbench {
public:
  auto apply(const WorkbenchDelta &delta) -> void;

  [[nodiscard]] auto empty() const noexcept -> bool;
  [[nodiscard]] auto to_json() const -> JsonValue;

  [[nodiscard]] auto file_changes() const -> const std::vector<JsonValue> & {
    return files_;
  }

private:
  std::vector<JsonValue> files_;
  bool has_files_{false};
  std::vector<JsonValue> commits_;
  bool has_commits_{false};
  JsonObject git_fields_;
  bool has_git_{false};
  std::optional<JsonValue> status_;
  std::optional<JsonValue> error_;
  JsonObject extras_;
};

} // namespace taskforge::streaming
