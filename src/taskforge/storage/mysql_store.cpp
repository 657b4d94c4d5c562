#include "taskforge/storage/mysql_store.hpp"

#include "taskforge/storage/mysql_schema.hpp"
#include "taskforge/util/log.hpp"
#include "taskforge/util/time.hpp"

#include <boost/asio/cancel_after.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/mysql/any_connection.hpp>
#include <boost/mysql/connect_params.hpp>
#include <boost/mysql/format_sql.hpp>
#include <boost/mysql/pipeline.hpp>
#include <boost/mysql/results.hpp>
#include <boost/mysql/with_params.hpp>

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace taskforge::storage {
namespace {

using boost::asio::use_awaitable;

constexpr std::string_view kTaskColumns =
    "id, user_id, user_name, title, status, progress, error_message, result, "
    "team_id, git_url, git_repo, git_repo_id, git_domain, branch_name, type, "
    "additional_skills, model_id, force_override_model, "
    "force_override_model_type, version, created_at, updated_at, completed_at";

constexpr std::string_view kSubtaskColumns =
    "id, task_id, user_id, title, role, message_id, status, progress, prompt, "
    "result, error_message, bot_ids, executor_name, executor_namespace, "
    "created_at, updated_at, completed_at";

constexpr std::string_view kResourceColumns =
    "id, user_id, kind, name, namespace, json, is_active, created_at, "
    "updated_at";

[[nodiscard]] auto split_sql_statements(std::string_view input)
    -> std::vector<std::string> {
  std::vector<std::string> out;
  std::string current;
  bool in_single = false;
  for (char c : input) {
    if (c == '\'') {
      in_single = !in_single;
    }
    if (c == ';' && !in_single) {
      auto first = current.find_first_not_of(" \n\r\t");
      if (first != std::string::npos) {
        out.emplace_back(current.substr(first));
      }
      current.clear();
      continue;
    }
    current.push_back(c);
  }
  if (current.find_first_not_of(" \n\r\t") != std::string::npos) {
    out.emplace_back(std::move(current));
  }
  return out;
}

[[nodiscard]] auto make_pool_params(const DatabaseConfig &cfg)
    -> boost::mysql::pool_params {
  boost::mysql::pool_params params;
  params.server_address.emplace_host_and_port(cfg.host, cfg.port);
  params.username = cfg.username;
  params.password = cfg.password;
  params.database = cfg.database;
  params.initial_size = 1;
  params.max_size = std::max<std::size_t>(1, cfg.pool_size);
  params.thread_safe = true;
  params.connect_timeout = std::chrono::seconds(cfg.connect_timeout);
  params.ssl = boost::mysql::ssl_mode::disable;
  return params;
}

[[nodiscard]] auto as_i64(const boost::mysql::field_view &f) -> std::int64_t {
  if (f.is_int64()) {
    return f.as_int64();
  }
  if (f.is_uint64()) {
    return static_cast<std::int64_t>(f.as_uint64());
  }
  return 0;
}

[[nodiscard]] auto as_sv(const boost::mysql::field_view &f)
    -> std::string_view {
  if (!f.is_string()) {
    return {};
  }
  auto s = f.as_string();
  return std::string_view(s.data(), s.size());
}

[[nodiscard]] auto as_str(const boost::mysql::field_view &f) -> std::string {
  return std::string(as_sv(f));
}

/// Empty text is a null document; corrupt text is logged and read as null.
[[nodiscard]] auto as_json(const boost::mysql::field_view &f,
                           std::string_view column) -> JsonValue {
  auto text = as_sv(f);
  if (text.empty()) {
    return JsonValue{};
  }
  auto parsed = parse_json(text);
  if (!parsed) {
    log::warn("Corrupt JSON in column {}, reading as null", column);
    return JsonValue{};
  }
  return std::move(*parsed);
}

[[nodiscard]] auto json_text(const JsonValue &value) -> std::string {
  return value.is_null() ? std::string{} : dump_json(value);
}

[[nodiscard]] auto string_list_text(const std::vector<std::string> &list)
    -> std::string {
  JsonValue out = JsonArray{};
  for (const auto &s : list) {
    out.get_array().emplace_back(s);
  }
  return dump_json(out);
}

[[nodiscard]] auto string_list_from(const JsonValue &value)
    -> std::vector<std::string> {
  std::vector<std::string> out;
  if (!value.is_array()) {
    return out;
  }
  for (const auto &item : value.get_array()) {
    if (item.is_string()) {
      out.push_back(item.get_string());
    }
  }
  return out;
}

[[nodiscard]] auto bot_ids_text(const std::vector<std::int64_t> &ids)
    -> std::string {
  JsonValue out = JsonArray{};
  for (auto id : ids) {
    out.get_array().emplace_back(id);
  }
  return dump_json(out);
}

[[nodiscard]] auto bot_ids_from(const JsonValue &value)
    -> std::vector<std::int64_t> {
  std::vector<std::int64_t> out;
  if (!value.is_array()) {
    return out;
  }
  for (const auto &item : value.get_array()) {
    if (const auto *i = std::get_if<std::int64_t>(&item.data)) {
      out.push_back(*i);
    }
  }
  return out;
}

[[nodiscard]] auto to_task(const boost::mysql::row_view &row) -> Task {
  return Task{
      .id = TaskId{as_i64(row.at(0))},
      .user_id = UserId{as_i64(row.at(1))},
      .user_name = as_str(row.at(2)),
      .title = as_str(row.at(3)),
      .status = parse<TaskStatus>(as_sv(row.at(4))),
      .progress = static_cast<int>(as_i64(row.at(5))),
      .error_message = as_str(row.at(6)),
      .result = as_json(row.at(7), "tasks.result"),
      .team_id = ResourceId{as_i64(row.at(8))},
      .workspace = Workspace{.git_url = as_str(row.at(9)),
                             .git_repo = as_str(row.at(10)),
                             .git_repo_id = as_i64(row.at(11)),
                             .git_domain = as_str(row.at(12)),
                             .branch_name = as_str(row.at(13))},
      .type = parse<TaskType>(as_sv(row.at(14))),
      .additional_skills = string_list_from(
          as_json(row.at(15), "tasks.additional_skills")),
      .model_id = as_str(row.at(16)),
      .force_override_model = as_i64(row.at(17)) != 0,
      .force_override_model_type = as_str(row.at(18)),
      .version = as_i64(row.at(19)),
      .created_at = as_i64(row.at(20)),
      .updated_at = as_i64(row.at(21)),
      .completed_at = as_i64(row.at(22)),
  };
}

[[nodiscard]] auto to_subtask(const boost::mysql::row_view &row) -> Subtask {
  return Subtask{
      .id = SubtaskId{as_i64(row.at(0))},
      .task_id = TaskId{as_i64(row.at(1))},
      .user_id = UserId{as_i64(row.at(2))},
      .title = as_str(row.at(3)),
      .role = parse<SubtaskRole>(as_sv(row.at(4))),
      .message_id = as_i64(row.at(5)),
      .status = parse<SubtaskStatus>(as_sv(row.at(6))),
      .progress = static_cast<int>(as_i64(row.at(7))),
      .prompt = as_str(row.at(8)),
      .result = as_json(row.at(9), "subtasks.result"),
      .error_message = as_str(row.at(10)),
      .bot_ids = bot_ids_from(as_json(row.at(11), "subtasks.bot_ids")),
      .executor_name = as_str(row.at(12)),
      .executor_namespace = as_str(row.at(13)),
      .created_at = as_i64(row.at(14)),
      .updated_at = as_i64(row.at(15)),
      .completed_at = as_i64(row.at(16)),
  };
}

[[nodiscard]] auto to_resource(const boost::mysql::row_view &row)
    -> Resource {
  return Resource{.id = ResourceId{as_i64(row.at(0))},
                  .user_id = UserId{as_i64(row.at(1))},
                  .kind = parse<ResourceKind>(as_sv(row.at(2))),
                  .name = as_str(row.at(3)),
                  .name_space = as_str(row.at(4)),
                  .json = as_json(row.at(5), "resources.json"),
                  .is_active = as_i64(row.at(6)) != 0,
                  .created_at = as_i64(row.at(7)),
                  .updated_at = as_i64(row.at(8))};
}

template <typename F>
auto mysql_try(F &&f) -> task<typename std::invoke_result_t<F>::value_type> {
  try {
    co_return co_await std::forward<F>(f)();
  } catch (const std::exception &e) {
    log::error("MySQL operation failed: {}", e.what());
    co_return fail(Error::DatabaseQueryFailed);
  }
}

} // namespace

MySQLStore::MySQLStore(boost::asio::any_io_executor executor,
                       const DatabaseConfig &config)
    : cfg_(config), pool_(executor, make_pool_params(config)) {}

MySQLStore::~MySQLStore() { pool_.cancel(); }

auto MySQLStore::ensure_database_exists() -> task<Result<void>> {
  std::string direct_connect_error;
  try {
    boost::mysql::connect_params params;
    params.server_address.emplace_host_and_port(cfg_.host, cfg_.port);
    params.username = cfg_.username;
    params.password = cfg_.password;
    params.database = cfg_.database;
    params.ssl = boost::mysql::ssl_mode::disable;

    boost::mysql::any_connection conn(pool_.get_executor());
    co_await conn.async_connect(
        params, boost::asio::cancel_after(
                    std::chrono::seconds(cfg_.connect_timeout), use_awaitable));
    co_await conn.async_close(use_awaitable);
    co_return ok();
  } catch (const std::exception &e) {
    direct_connect_error = e.what();
  }

  try {
    // First run: connect without a default schema and create it.
    boost::mysql::connect_params params;
    params.server_address.emplace_host_and_port(cfg_.host, cfg_.port);
    params.username = cfg_.username;
    params.password = cfg_.password;
    params.ssl = boost::mysql::ssl_mode::disable;

    boost::mysql::any_connection conn(pool_.get_executor());
    co_await conn.async_connect(
        params, boost::asio::cancel_after(
                    std::chrono::seconds(cfg_.connect_timeout), use_awaitable));

    boost::mysql::results res;
    co_await conn.async_execute(
        boost::mysql::with_params("CREATE DATABASE IF NOT EXISTS {:i}",
                                  cfg_.database),
        res, use_awaitable);
    co_await conn.async_close(use_awaitable);
    co_return ok();
  } catch (const std::exception &e) {
    log::error(
        "MySQL ensure database failed: direct_connect='{}', create_db='{}'",
        direct_connect_error, e.what());
    co_return fail(Error::DatabaseOpenFailed);
  }
}

auto MySQLStore::open() -> task<Result<void>> {
  if (open_) {
    co_return ok();
  }

  if (auto db_res = co_await ensure_database_exists(); !db_res) {
    co_return fail(db_res.error());
  }

  open_ = true;
  pool_.async_run(boost::asio::detached);

  auto conn_res = co_await get_connection();
  if (!conn_res) {
    open_ = false;
    co_return fail(conn_res.error());
  }
  if (auto schema_res = co_await ensure_schema(conn_res->get()); !schema_res) {
    open_ = false;
    co_return fail(schema_res.error());
  }
  conn_res->return_without_reset();

  log::info("MySQL store opened: {}:{} / {}", cfg_.host, cfg_.port,
            cfg_.database);
  co_return ok();
}

auto MySQLStore::close() -> task<void> {
  if (open_) {
    pool_.cancel();
    open_ = false;
  }
  co_return;
}

auto MySQLStore::is_open() const noexcept -> bool { return open_; }

auto MySQLStore::get_connection()
    -> task<Result<boost::mysql::pooled_connection>> {
  if (!open_) {
    co_return fail(Error::SystemNotRunning);
  }
  try {
    auto conn = co_await pool_.async_get_connection(boost::asio::cancel_after(
        std::chrono::seconds(cfg_.connect_timeout), use_awaitable));
    co_return ok(std::move(conn));
  } catch (const std::exception &e) {
    log::error("MySQL get connection failed: {}", e.what());
    co_return fail(Error::DatabaseOpenFailed);
  }
}

auto MySQLStore::ensure_schema(boost::mysql::any_connection &conn)
    -> task<Result<void>> {
  try {
    boost::mysql::pipeline_request req;
    for (const auto &stmt : split_sql_statements(schema::V1_SCHEMA)) {
      req.add_execute(stmt);
    }
    req.add_execute("INSERT IGNORE INTO schema_version(version) VALUES (" +
                    std::to_string(schema::CURRENT_SCHEMA_VERSION) + ")");

    std::vector<boost::mysql::stage_response> stage_responses;
    co_await conn.async_run_pipeline(req, stage_responses, use_awaitable);
    co_return ok();
  } catch (const std::exception &e) {
    log::error("MySQL schema ensure failed: {}", e.what());
    co_return fail(Error::DatabaseOpenFailed);
  }
}

// === Tasks ===

auto MySQLStore::create_task(Task t) -> task<Result<TaskId>> {
  co_return co_await mysql_try([&]() -> task<Result<TaskId>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }
    const auto now = util::now_millis();
    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        boost::mysql::with_params(
            "INSERT INTO tasks(user_id, user_name, title, status, progress, "
            "error_message, result, team_id, git_url, git_repo, git_repo_id, "
            "git_domain, branch_name, type, additional_skills, model_id, "
            "force_override_model, force_override_model_type, version, "
            "created_at, updated_at, completed_at) "
            "VALUES({}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {}, "
            "{}, {}, {}, {}, 0, {}, {}, {})",
            t.user_id.value(), t.user_name, t.title, t.status, t.progress,
            t.error_message, json_text(t.result), t.team_id.value(),
            t.workspace.git_url, t.workspace.git_repo, t.workspace.git_repo_id,
            t.workspace.git_domain, t.workspace.branch_name, t.type,
            string_list_text(t.additional_skills), t.model_id,
            t.force_override_model ? 1 : 0, t.force_override_model_type, now,
            now, t.completed_at),
        res, use_awaitable);
    conn_res->return_without_reset();
    co_return ok(TaskId{static_cast<std::int64_t>(res.last_insert_id())});
  });
}

auto MySQLStore::get_task(TaskId id) -> task<Result<Task>> {
  co_return co_await mysql_try([&]() -> task<Result<Task>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }
    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        boost::mysql::with_params("SELECT {:r} FROM tasks WHERE id = {}",
                                  kTaskColumns, id.value()),
        res, use_awaitable);
    conn_res->return_without_reset();
    if (res.rows().empty()) {
      co_return fail(Error::NotFound);
    }
    co_return ok(to_task(res.rows().at(0)));
  });
}

auto MySQLStore::list_tasks_by_status(TaskStatus status, int limit)
    -> task<Result<std::vector<Task>>> {
  co_return co_await mysql_try([&]() -> task<Result<std::vector<Task>>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }
    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        boost::mysql::with_params("SELECT {:r} FROM tasks WHERE status = {} "
                                  "ORDER BY created_at DESC, id DESC LIMIT {}",
                                  kTaskColumns, status, std::max(limit, 0)),
        res, use_awaitable);
    conn_res->return_without_reset();
    std::vector<Task> out;
    out.reserve(res.rows().size());
    for (auto row : res.rows()) {
      out.push_back(to_task(row));
    }
    co_return ok(std::move(out));
  });
}

auto MySQLStore::update_task_versioned(const Task &t) -> task<Result<bool>> {
  co_return co_await mysql_try([&]() -> task<Result<bool>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }
    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        boost::mysql::with_params(
            "UPDATE tasks SET title = {}, status = {}, progress = {}, "
            "error_message = {}, result = {}, completed_at = {}, "
            "updated_at = {}, version = version + 1 "
            "WHERE id = {} AND version = {}",
            t.title, t.status, t.progress, t.error_message,
            json_text(t.result), t.completed_at, util::now_millis(),
            t.id.value(), t.version),
        res, use_awaitable);
    conn_res->return_without_reset();
    co_return ok(res.affected_rows() == 1);
  });
}

auto MySQLStore::cas_task_status(TaskId id, TaskStatus expected,
                                 TaskStatus next) -> task<Result<bool>> {
  co_return co_await mysql_try([&]() -> task<Result<bool>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }
    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        boost::mysql::with_params(
            "UPDATE tasks SET status = {}, updated_at = {}, "
            "version = version + 1 WHERE id = {} AND status = {}",
            next, util::now_millis(), id.value(), expected),
        res, use_awaitable);
    conn_res->return_without_reset();
    co_return ok(res.affected_rows() == 1);
  });
}

// === Subtasks ===

auto MySQLStore::create_subtask(Subtask s) -> task<Result<SubtaskId>> {
  co_return co_await mysql_try([&]() -> task<Result<SubtaskId>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }
    auto &conn = conn_res->get();
    boost::mysql::results res;
    co_await conn.async_execute("START TRANSACTION", res, use_awaitable);

    // Locking the parent row serialises message_id assignment per task.
    co_await conn.async_execute(
        boost::mysql::with_params("SELECT id FROM tasks WHERE id = {} "
                                  "FOR UPDATE",
                                  s.task_id.value()),
        res, use_awaitable);
    if (res.rows().empty()) {
      co_await conn.async_execute("ROLLBACK", res, use_awaitable);
      conn_res->return_without_reset();
      co_return fail(Error::NotFound);
    }
    if (s.message_id == 0) {
      co_await conn.async_execute(
          boost::mysql::with_params("SELECT COALESCE(MAX(message_id), 0) "
                                    "FROM subtasks WHERE task_id = {}",
                                    s.task_id.value()),
          res, use_awaitable);
      s.message_id = as_i64(res.rows().at(0).at(0)) + 1;
    }

    const auto now = util::now_millis();
    co_await conn.async_execute(
        boost::mysql::with_params(
            "INSERT INTO subtasks(task_id, user_id, title, role, message_id, "
            "status, progress, prompt, result, error_message, bot_ids, "
            "executor_name, executor_namespace, created_at, updated_at, "
            "completed_at) "
            "VALUES({}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {}, "
            "{}, {})",
            s.task_id.value(), s.user_id.value(), s.title, s.role,
            s.message_id, s.status, s.progress, s.prompt, json_text(s.result),
            s.error_message, bot_ids_text(s.bot_ids), s.executor_name,
            s.executor_namespace, now, now, s.completed_at),
        res, use_awaitable);
    const auto id = static_cast<std::int64_t>(res.last_insert_id());

    co_await conn.async_execute("COMMIT", res, use_awaitable);
    conn_res->return_without_reset();
    co_return ok(SubtaskId{id});
  });
}

auto MySQLStore::get_subtask(SubtaskId id) -> task<Result<Subtask>> {
  co_return co_await mysql_try([&]() -> task<Result<Subtask>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }
    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        boost::mysql::with_params("SELECT {:r} FROM subtasks WHERE id = {}",
                                  kSubtaskColumns, id.value()),
        res, use_awaitable);
    conn_res->return_without_reset();
    if (res.rows().empty()) {
      co_return fail(Error::NotFound);
    }
    co_return ok(to_subtask(res.rows().at(0)));
  });
}

auto MySQLStore::list_subtasks(TaskId task_id)
    -> task<Result<std::vector<Subtask>>> {
  co_return co_await mysql_try([&]() -> task<Result<std::vector<Subtask>>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }
    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        boost::mysql::with_params(
            "SELECT {:r} FROM subtasks WHERE task_id = {} "
            "ORDER BY message_id ASC, created_at ASC, id ASC",
            kSubtaskColumns, task_id.value()),
        res, use_awaitable);
    conn_res->return_without_reset();
    std::vector<Subtask> out;
    out.reserve(res.rows().size());
    for (auto row : res.rows()) {
      out.push_back(to_subtask(row));
    }
    co_return ok(std::move(out));
  });
}

auto MySQLStore::claim_subtask(SubtaskId id) -> task<Result<bool>> {
  co_return co_await flip_subtask_status(id, SubtaskStatus::Pending,
                                         SubtaskStatus::Running);
}

auto MySQLStore::release_subtask(SubtaskId id) -> task<Result<bool>> {
  co_return co_await flip_subtask_status(id, SubtaskStatus::Running,
                                         SubtaskStatus::Pending);
}

auto MySQLStore::flip_subtask_status(SubtaskId id, SubtaskStatus expected,
                                     SubtaskStatus next)
    -> task<Result<bool>> {
  co_return co_await mysql_try([&]() -> task<Result<bool>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }
    auto &conn = conn_res->get();
    boost::mysql::results res;
    co_await conn.async_execute(
        boost::mysql::with_params(
            "UPDATE subtasks SET status = {}, updated_at = {} "
            "WHERE id = {} AND status = {}",
            next, util::now_millis(), id.value(), expected),
        res, use_awaitable);
    if (res.affected_rows() == 1) {
      conn_res->return_without_reset();
      co_return ok(true);
    }
    co_await conn.async_execute(
        boost::mysql::with_params("SELECT 1 FROM subtasks WHERE id = {}",
                                  id.value()),
        res, use_awaitable);
    conn_res->return_without_reset();
    if (res.rows().empty()) {
      co_return fail(Error::NotFound);
    }
    co_return ok(false);
  });
}

auto MySQLStore::patch_subtask(const SubtaskPatch &p) -> task<Result<bool>> {
  co_return co_await mysql_try([&]() -> task<Result<bool>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }
    auto &conn = conn_res->get();
    std::optional<std::string_view> status;
    if (p.status) {
      status = to_string_view(*p.status);
    }
    std::optional<std::string> result;
    if (p.result) {
      result = json_text(*p.result);
    }
    const bool terminal = p.status && is_terminal(*p.status);
    const auto now = util::now_millis();
    boost::mysql::results res;
    co_await conn.async_execute(
        boost::mysql::with_params(
            "UPDATE subtasks SET status = COALESCE({}, status), "
            "progress = COALESCE({}, progress), "
            "result = COALESCE({}, result), "
            "error_message = COALESCE({}, error_message), "
            "executor_name = COALESCE({}, executor_name), "
            "executor_namespace = COALESCE({}, executor_namespace), "
            "title = COALESCE({}, title), updated_at = {}, "
            "completed_at = IF({} AND completed_at = 0, {}, completed_at) "
            "WHERE id = {} AND status = {}",
            status, p.progress, result, p.error_message, p.executor_name,
            p.executor_namespace, p.title, now, terminal ? 1 : 0, now,
            p.id.value(), p.expected_status),
        res, use_awaitable);
    if (res.affected_rows() == 1) {
      conn_res->return_without_reset();
      co_return ok(true);
    }
    // affected_rows stays 0 for a matched but unchanged row too
    co_await conn.async_execute(
        boost::mysql::with_params("SELECT status FROM subtasks WHERE id = {}",
                                  p.id.value()),
        res, use_awaitable);
    conn_res->return_without_reset();
    if (res.rows().empty()) {
      co_return fail(Error::NotFound);
    }
    co_return ok(parse<SubtaskStatus>(as_sv(res.rows().at(0).at(0))) ==
                 p.expected_status);
  });
}

auto MySQLStore::write_stream_result(const StreamResultWrite &w)
    -> task<Result<bool>> {
  co_return co_await mysql_try([&]() -> task<Result<bool>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }
    const auto now = util::now_millis();
    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        boost::mysql::with_params(
            "UPDATE subtasks SET status = {}, result = {}, "
            "error_message = COALESCE({}, error_message), "
            "progress = COALESCE({}, progress), updated_at = {}, "
            "completed_at = IF({} AND completed_at = 0, {}, completed_at) "
            "WHERE id = {}{:r}",
            w.status, json_text(w.result), w.error_message, w.progress, now,
            is_terminal(w.status) ? 1 : 0, now, w.subtask_id.value(),
            w.require_running ? " AND status = 'RUNNING'" : ""),
        res, use_awaitable);
    conn_res->return_without_reset();
    if (res.affected_rows() == 1) {
      co_return ok(true);
    }
    if (w.require_running) {
      co_return ok(false);
    }
    co_return fail(Error::NotFound);
  });
}

// === Resources ===

auto MySQLStore::get_by_id(ResourceKind kind, ResourceId id)
    -> task<Result<Resource>> {
  co_return co_await mysql_try([&]() -> task<Result<Resource>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }
    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        boost::mysql::with_params("SELECT {:r} FROM resources WHERE id = {} "
                                  "AND kind = {} AND is_active = 1",
                                  kResourceColumns, id.value(),
                                  to_string_view(kind)),
        res, use_awaitable);
    conn_res->return_without_reset();
    if (res.rows().empty()) {
      co_return fail(Error::NotFound);
    }
    co_return ok(to_resource(res.rows().at(0)));
  });
}

auto MySQLStore::query(ResourceKind kind, ResourceFilter filter)
    -> task<Result<std::vector<Resource>>> {
  co_return co_await mysql_try([&]() -> task<Result<std::vector<Resource>>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }

    boost::mysql::format_context ctx(conn_res->get().format_opts().value());
    boost::mysql::format_sql_to(
        ctx, "SELECT {:r} FROM resources WHERE kind = {}", kResourceColumns,
        to_string_view(kind));
    if (filter.active_only) {
      ctx.append_raw(" AND is_active = 1");
    }
    if (filter.user_id) {
      boost::mysql::format_sql_to(ctx, " AND user_id = {}",
                                  filter.user_id->value());
    }
    if (filter.name) {
      boost::mysql::format_sql_to(ctx, " AND name = {}", *filter.name);
    }
    if (filter.name_space) {
      boost::mysql::format_sql_to(ctx, " AND namespace = {}",
                                  *filter.name_space);
    }
    ctx.append_raw(" ORDER BY id ASC");
    auto sql = std::move(ctx).get().value();

    boost::mysql::results res;
    co_await conn_res->get().async_execute(sql, res, use_awaitable);
    conn_res->return_without_reset();
    std::vector<Resource> out;
    out.reserve(res.rows().size());
    for (auto row : res.rows()) {
      out.push_back(to_resource(row));
    }
    co_return ok(std::move(out));
  });
}

auto MySQLStore::upsert(ResourceKind kind, UserId owner, std::string name,
                        std::string name_space, JsonValue json)
    -> task<Result<Resource>> {
  auto written = co_await mysql_try([&]() -> task<Result<void>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }
    const auto now = util::now_millis();
    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        boost::mysql::with_params(
            "INSERT INTO resources(user_id, kind, name, namespace, json, "
            "is_active, created_at, updated_at) "
            "VALUES({}, {}, {}, {}, {}, 1, {}, {}) "
            "ON DUPLICATE KEY UPDATE json = VALUES(json), is_active = 1, "
            "updated_at = VALUES(updated_at)",
            owner.value(), to_string_view(kind), name, name_space,
            dump_json(json), now, now),
        res, use_awaitable);
    conn_res->return_without_reset();
    co_return ok();
  });
  if (!written) {
    co_return fail(written.error());
  }

  auto rows = co_await query(kind, ResourceFilter{.user_id = owner,
                                                  .name = name,
                                                  .name_space = name_space});
  if (!rows) {
    co_return fail(rows.error());
  }
  if (rows->empty()) {
    co_return fail(Error::NotFound);
  }
  co_return ok(std::move(rows->front()));
}

auto MySQLStore::soft_delete(ResourceId id) -> task<Result<void>> {
  co_return co_await mysql_try([&]() -> task<Result<void>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }
    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        boost::mysql::with_params("UPDATE resources SET is_active = 0, "
                                  "updated_at = {} WHERE id = {}",
                                  util::now_millis(), id.value()),
        res, use_awaitable);
    conn_res->return_without_reset();
    if (res.affected_rows() == 0) {
      co_return fail(Error::NotFound);
    }
    co_return ok();
  });
}

// === Users ===

auto MySQLStore::get_user(UserId id) -> task<Result<User>> {
  co_return co_await mysql_try([&]() -> task<Result<User>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }
    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        boost::mysql::with_params("SELECT id, name, git_info FROM users "
                                  "WHERE id = {} AND is_active = 1",
                                  id.value()),
        res, use_awaitable);
    conn_res->return_without_reset();
    if (res.rows().empty()) {
      co_return fail(Error::NotFound);
    }
    auto row = res.rows().at(0);
    auto git_info = decode_git_info(as_json(row.at(2), "users.git_info"));
    if (!git_info) {
      log::warn("User {} has malformed git_info", id);
    }
    co_return ok(User{.id = UserId{as_i64(row.at(0))},
                      .name = as_str(row.at(1)),
                      .git_info = git_info.value_or(std::vector<GitIdentity>{}),
                      .is_active = true});
  });
}

auto MySQLStore::upsert_user(User user) -> task<Result<UserId>> {
  co_return co_await mysql_try([&]() -> task<Result<UserId>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }
    const auto git_info = dump_json(encode_git_info(user.git_info));
    boost::mysql::results res;
    if (user.id.empty()) {
      co_await conn_res->get().async_execute(
          boost::mysql::with_params("INSERT INTO users(name, git_info, "
                                    "is_active) VALUES({}, {}, {})",
                                    user.name, git_info,
                                    user.is_active ? 1 : 0),
          res, use_awaitable);
      conn_res->return_without_reset();
      co_return ok(UserId{static_cast<std::int64_t>(res.last_insert_id())});
    }
    co_await conn_res->get().async_execute(
        boost::mysql::with_params(
            "INSERT INTO users(id, name, git_info, is_active) "
            "VALUES({}, {}, {}, {}) ON DUPLICATE KEY UPDATE "
            "name = VALUES(name), git_info = VALUES(git_info), "
            "is_active = VALUES(is_active)",
            user.id.value(), user.name, git_info, user.is_active ? 1 : 0),
        res, use_awaitable);
    conn_res->return_without_reset();
    co_return ok(user.id);
  });
}

auto MySQLStore::clear_all() -> task<Result<void>> {
  co_return co_await mysql_try([&]() -> task<Result<void>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }
    boost::mysql::pipeline_request req;
    req.add_execute("DELETE FROM subtasks");
    req.add_execute("DELETE FROM tasks");
    req.add_execute("DELETE FROM resources");
    req.add_execute("DELETE FROM users");
    std::vector<boost::mysql::stage_response> stage_responses;
    co_await conn_res->get().async_run_pipeline(req, stage_responses,
                                                use_awaitable);
    conn_res->return_without_reset();
    co_return ok();
  });
}

} // namespace taskforge::storage
