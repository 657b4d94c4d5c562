#include "taskforge/domain/resources.hpp"

#include <algorithm>
#include <array>
#include <initializer_list>

namespace taskforge {

namespace {

constexpr std::array<std::string_view, 5> kKindNames = {"Bot", "Team", "Ghost",
                                                        "Shell", "Model"};

auto spec_of(const Resource &r) -> Result<const JsonValue *> {
  const auto *spec = json::find(r.json, "spec");
  if (spec == nullptr || !spec->is_object()) {
    return fail(Error::ParseError);
  }
  return ok(spec);
}

auto collect_extras(const JsonValue &spec,
                    std::initializer_list<std::string_view> known)
    -> JsonObject {
  JsonObject extras;
  for (const auto &[key, value] : spec.get_object()) {
    if (std::ranges::find(known, std::string_view{key}) == known.end()) {
      extras.emplace(key, value);
    }
  }
  return extras;
}

auto string_or(const JsonValue &obj, std::string_view key,
               std::string fallback = {}) -> std::string {
  return json::string_at(obj, key).value_or(std::move(fallback));
}

auto decode_ref(const JsonValue &spec, std::string_view key)
    -> std::optional<ResourceRef> {
  const auto *ref = json::find(spec, key);
  if (ref == nullptr || !ref->is_object()) {
    return std::nullopt;
  }
  auto name = json::string_at(*ref, "name");
  if (!name || name->empty()) {
    return std::nullopt;
  }
  return ResourceRef{.name = std::move(*name),
                     .name_space = string_or(*ref, "namespace",
                                             std::string(kDefaultNamespace))};
}

auto string_list(const JsonValue *list) -> std::vector<std::string> {
  std::vector<std::string> out;
  if (list == nullptr || !list->is_array()) {
    return out;
  }
  for (const auto &item : list->get_array()) {
    if (item.is_string() && !item.get_string().empty()) {
      out.push_back(item.get_string());
    }
  }
  return out;
}

} // namespace

auto to_string_view(ResourceKind kind) noexcept -> std::string_view {
  return kKindNames.at(std::to_underlying(kind));
}

template <>
auto parse<ResourceKind>(std::string_view s) noexcept -> ResourceKind {
  return util::parse_enum(s, ResourceKind::Bot);
}

auto decode_ghost(const Resource &r) -> Result<GhostSpec> {
  auto spec = spec_of(r);
  if (!spec) {
    return fail(spec.error());
  }
  const auto &s = **spec;
  GhostSpec out;
  out.system_prompt = string_or(s, "systemPrompt");
  if (const auto *mcp = json::find(s, "mcpServers");
      mcp != nullptr && !mcp->is_null()) {
    out.mcp_servers = *mcp;
  }
  out.skills = string_list(json::find(s, "skills"));
  out.extras = collect_extras(s, {"systemPrompt", "mcpServers", "skills"});
  return ok(std::move(out));
}

auto decode_shell(const Resource &r) -> Result<ShellSpec> {
  auto spec = spec_of(r);
  if (!spec) {
    return fail(spec.error());
  }
  const auto &s = **spec;
  ShellSpec out;
  out.shell_type = string_or(s, "shellType");
  out.base_image = string_or(s, "baseImage");
  out.extras = collect_extras(s, {"shellType", "baseImage"});
  return ok(std::move(out));
}

auto decode_binding(const JsonValue &model_config) -> ModelBinding {
  ModelBinding b;
  if (!model_config.is_object()) {
    return b;
  }
  b.private_model = string_or(model_config, "private_model");
  b.bind_model = string_or(model_config, "bind_model");
  b.bind_model_type = string_or(model_config, "bind_model_type");
  b.bind_model_namespace = string_or(model_config, "bind_model_namespace",
                                     std::string(kDefaultNamespace));
  return b;
}

auto decode_model(const Resource &r) -> Result<ModelSpec> {
  auto spec = spec_of(r);
  if (!spec) {
    return fail(spec.error());
  }
  const auto &s = **spec;
  ModelSpec out;
  if (const auto *cfg = json::find(s, "modelConfig")) {
    if (!cfg->is_object()) {
      return fail(Error::ParseError);
    }
    out.model_config = *cfg;
  }
  out.binding = decode_binding(out.model_config);
  out.extras = collect_extras(s, {"modelConfig"});
  return ok(std::move(out));
}

auto decode_bot(const Resource &r) -> Result<BotSpec> {
  auto spec = spec_of(r);
  if (!spec) {
    return fail(spec.error());
  }
  const auto &s = **spec;
  auto ghost = decode_ref(s, "ghostRef");
  auto shell = decode_ref(s, "shellRef");
  if (!ghost || !shell) {
    return fail(Error::ParseError);
  }
  BotSpec out{.ghost_ref = std::move(*ghost),
              .shell_ref = std::move(*shell),
              .model_ref = decode_ref(s, "modelRef"),
              .extras = collect_extras(s, {"ghostRef", "shellRef", "modelRef"})};
  return ok(std::move(out));
}

auto decode_team(const Resource &r) -> Result<TeamSpec> {
  auto spec = spec_of(r);
  if (!spec) {
    return fail(spec.error());
  }
  const auto &s = **spec;
  TeamSpec out;
  if (auto mode = json::string_at(s, "collaborationModel")) {
    auto parsed = util::try_parse_enum<WorkflowMode>(*mode);
    // unknown collaboration models run every bot on the same prompt
    out.mode = parsed.value_or(WorkflowMode::Parallel);
  }
  if (const auto *members = json::find(s, "members")) {
    if (!members->is_array()) {
      return fail(Error::ParseError);
    }
    for (const auto &m : members->get_array()) {
      if (!m.is_object()) {
        return fail(Error::ParseError);
      }
      TeamMember member;
      if (auto ref = decode_ref(m, "botRef")) {
        member.bot_ref = std::move(*ref);
      }
      member.prompt = string_or(m, "prompt");
      member.role = string_or(m, "role");
      out.members.push_back(std::move(member));
    }
  }
  out.extras = collect_extras(s, {"members", "collaborationModel"});
  return ok(std::move(out));
}

auto decode_git_info(const JsonValue &list) -> Result<std::vector<GitIdentity>> {
  std::vector<GitIdentity> out;
  if (list.is_null()) {
    return ok(std::move(out));
  }
  if (!list.is_array()) {
    return fail(Error::ParseError);
  }
  for (const auto &item : list.get_array()) {
    if (!item.is_object()) {
      return fail(Error::ParseError);
    }
    out.push_back(GitIdentity{.git_domain = string_or(item, "git_domain"),
                              .git_token = string_or(item, "git_token"),
                              .git_id = string_or(item, "git_id"),
                              .git_login = string_or(item, "git_login"),
                              .git_email = string_or(item, "git_email"),
                              .user_name = string_or(item, "user_name"),
                              .type = string_or(item, "type")});
  }
  return ok(std::move(out));
}

auto encode_git_info(const std::vector<GitIdentity> &list) -> JsonValue {
  JsonValue out = JsonArray{};
  for (const auto &g : list) {
    out.get_array().emplace_back(JsonValue{{"git_domain", g.git_domain},
                                           {"git_token", g.git_token},
                                           {"git_id", g.git_id},
                                           {"git_login", g.git_login},
                                           {"git_email", g.git_email},
                                           {"user_name", g.user_name},
                                           {"type", g.type}});
  }
  return out;
}

auto match_git_identity(const std::vector<GitIdentity> &list,
                        std::string_view domain)
    -> std::optional<GitIdentity> {
  if (domain.empty()) {
    return std::nullopt;
  }
  auto exact = std::ranges::find_if(
      list, [&](const GitIdentity &g) { return g.git_domain == domain; });
  if (exact != list.end()) {
    return *exact;
  }
  auto partial = std::ranges::find_if(list, [&](const GitIdentity &g) {
    return g.git_domain.find(domain) != std::string::npos;
  });
  if (partial != list.end()) {
    return *partial;
  }
  return std::nullopt;
}

} // namespace taskforge
