#pragma once

#include "taskforge/util/json.hpp"

#include <glaze/glaze.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace taskforge {

struct ContextUser {
  std::optional<std::int64_t> id;
  std::optional<std::string> name;
  std::optional<std::string> git_domain;
  std::optional<std::string> git_token;
  std::optional<std::string> git_id;
  std::optional<std::string> git_login;
  std::optional<std::string> git_email;
  std::optional<std::string> user_name;
};

struct ContextBot {
  std::int64_t id{0};
  std::string name;
  std::string shell_type;
  std::string agent_name; // same as shell_type; the name workers key on
  JsonValue agent_config = json::object();
  std::string system_prompt;
  JsonValue mcp_servers = json::object();
  std::vector<std::string> skills;
  std::string role;
  std::string base_image;
};

/// Everything a worker needs to run one claimed subtask.
struct ExecutionContext {
  std::int64_t subtask_id{0};
  std::optional<std::int64_t> subtask_next_id;
  std::int64_t task_id{0};
  std::string type{"online"};
  bool is_subscription{false};
  std::string executor_name;
  std::string executor_namespace;
  std::string subtask_title;
  std::string task_title;
  ContextUser user;
  std::vector<ContextBot> bot;
  std::int64_t team_id{0};
  std::string team_namespace;
  std::string mode{"parallel"};
  std::string git_domain;
  std::string git_repo;
  std::int64_t git_repo_id{0};
  std::string branch_name;
  std::string git_url;
  std::string prompt;
  std::string status;
  int progress{0};
  std::string created_at;
  std::string updated_at;
  bool new_session{false};
  std::vector<std::string> user_selected_skills;
};

} // namespace taskforge

namespace glz {

template <> struct meta<taskforge::ContextUser> {
  using T = taskforge::ContextUser;
  static constexpr auto value =
      object("id", &T::id, "name", &T::name, "git_domain", &T::git_domain,
             "git_token", &T::git_token, "git_id", &T::git_id, "git_login",
             &T::git_login, "git_email", &T::git_email, "user_name",
             &T::user_name);
};

template <> struct meta<taskforge::ContextBot> {
  using T = taskforge::ContextBot;
  static constexpr auto value = object(
      "id", &T::id, "name", &T::name, "shell_type", &T::shell_type,
      "agent_name", &T::agent_name, "agent_config", &T::agent_config,
      "system_prompt", &T::system_prompt, "mcp_servers", &T::mcp_servers,
      "skills", &T::skills, "role", &T::role, "base_image", &T::base_image);
};

template <> struct meta<taskforge::ExecutionContext> {
  using T = taskforge::ExecutionContext;
  static constexpr auto value = object(
      "subtask_id", &T::subtask_id, "subtask_next_id", &T::subtask_next_id,
      "task_id", &T::task_id, "type", &T::type, "is_subscription",
      &T::is_subscription, "executor_name", &T::executor_name,
      "executor_namespace", &T::executor_namespace, "subtask_title",
      &T::subtask_title, "task_title", &T::task_title, "user", &T::user, "bot",
      &T::bot, "team_id", &T::team_id, "team_namespace", &T::team_namespace,
      "mode", &T::mode, "git_domain", &T::git_domain, "git_repo", &T::git_repo,
      "git_repo_id", &T::git_repo_id, "branch_name", &T::branch_name,
      "git_url", &T::git_url, "prompt", &T::prompt, "status", &T::status,
      "progress", &T::progress, "created_at", &T::created_at, "updated_at",
      &T::updated_at, "new_session", &T::new_session, "user_selected_skills",
      &T::user_selected_skills);
};

} // namespace glz
