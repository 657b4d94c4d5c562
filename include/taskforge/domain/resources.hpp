#pragma once

#include "taskforge/core/error.hpp"
#include "taskforge/domain/task.hpp"
#include "taskforge/util/enum.hpp"
#include "taskforge/util/id.hpp"
#include "taskforge/util/json.hpp"

#include <boost/describe/enum.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace taskforge {

enum class ResourceKind : std::uint8_t { Bot, Team, Ghost, Shell, Model };
BOOST_DESCRIBE_ENUM(ResourceKind, Bot, Team, Ghost, Shell, Model)

// Kinds are stored and exchanged in PascalCase ("Bot", "Team", ...).
[[nodiscard]] auto to_string_view(ResourceKind kind) noexcept
    -> std::string_view;
template <>
[[nodiscard]] auto parse<ResourceKind>(std::string_view s) noexcept
    -> ResourceKind;

inline constexpr UserId kPublicOwner{0};
inline constexpr std::string_view kDefaultNamespace = "default";

/// A named, namespaced JSON document owned by the generic resource store.
struct Resource {
  ResourceId id;
  UserId user_id; // kPublicOwner for shared resources
  ResourceKind kind{ResourceKind::Bot};
  std::string name;
  std::string name_space{std::string(kDefaultNamespace)};
  JsonValue json{};
  bool is_active{true};
  std::int64_t created_at{0};
  std::int64_t updated_at{0};
};

struct ResourceRef {
  std::string name;
  std::string name_space{std::string(kDefaultNamespace)};
};

// Typed views decoded from Resource::json at the store boundary. Keys the
// decoder does not recognise are kept in `extras`.

struct GhostSpec {
  std::string system_prompt;
  JsonValue mcp_servers = json::object();
  std::vector<std::string> skills;
  JsonObject extras;
};

struct ShellSpec {
  std::string shell_type;
  std::string base_image;
  JsonObject extras;
};

/// Model selection knobs that may appear inside a model configuration.
struct ModelBinding {
  std::string private_model; // legacy: replace config with this model's
  std::string bind_model;
  std::string bind_model_type; // "public" | "user" | empty
  std::string bind_model_namespace{std::string(kDefaultNamespace)};
};

struct ModelSpec {
  JsonValue model_config = json::object();
  ModelBinding binding;
  JsonObject extras;
};

struct BotSpec {
  ResourceRef ghost_ref;
  ResourceRef shell_ref;
  std::optional<ResourceRef> model_ref;
  JsonObject extras;
};

struct TeamMember {
  ResourceRef bot_ref;
  std::string prompt;
  std::string role;
};

struct TeamSpec {
  std::vector<TeamMember> members;
  WorkflowMode mode{WorkflowMode::Parallel};
  JsonObject extras;
};

struct GitIdentity {
  std::string git_domain;
  std::string git_token;
  std::string git_id;
  std::string git_login;
  std::string git_email;
  std::string user_name;
  std::string type;
};

struct User {
  UserId id;
  std::string name;
  std::vector<GitIdentity> git_info;
  bool is_active{true};
};

[[nodiscard]] auto decode_ghost(const Resource &r) -> Result<GhostSpec>;
[[nodiscard]] auto decode_shell(const Resource &r) -> Result<ShellSpec>;
[[nodiscard]] auto decode_model(const Resource &r) -> Result<ModelSpec>;
[[nodiscard]] auto decode_bot(const Resource &r) -> Result<BotSpec>;
[[nodiscard]] auto decode_team(const Resource &r) -> Result<TeamSpec>;
[[nodiscard]] auto decode_git_info(const JsonValue &list)
    -> Result<std::vector<GitIdentity>>;
[[nodiscard]] auto encode_git_info(const std::vector<GitIdentity> &list)
    -> JsonValue;
[[nodiscard]] auto decode_binding(const JsonValue &model_config)
    -> ModelBinding;

/// Exact domain match wins; otherwise the first identity whose domain
/// contains `domain`. Empty domain selects nothing.
[[nodiscard]] auto match_git_identity(const std::vector<GitIdentity> &list,
                                      std::string_view domain)
    -> std::optional<GitIdentity>;

} // namespace taskforge
