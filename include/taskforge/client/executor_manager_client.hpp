#pragma once

#include "taskforge/config/system_config.hpp"
#include "taskforge/core/coroutine.hpp"
#include "taskforge/core/error.hpp"
#include "taskforge/util/id.hpp"

#include <string>

namespace taskforge {

struct CancelForward {
  TaskId task_id;
  SubtaskId subtask_id;
  std::string executor_name;
};

// Forwards cancel requests to the executor manager that owns the running
// container. Disabled when no cancel URL is configured.
class ExecutorManagerClient {
public:
  explicit ExecutorManagerClient(ExecutorManagerConfig config);

  [[nodiscard]] auto enabled() const noexcept -> bool {
    return !config_.cancel_url.empty();
  }

  /// Posts `{task_id, subtask_id, executor_name}` to the cancel URL; any
  /// non-2xx answer is a ProtocolError.
  auto cancel(const CancelForward &request) -> task<Result<void>>;

private:
  ExecutorManagerConfig config_;
};

} // namespace taskforge
