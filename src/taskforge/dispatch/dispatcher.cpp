#include "taskforge/dispatch/dispatcher.hpp"

#include "taskforge/util/log.hpp"
#include "taskforge/util/time.hpp"

#include <algorithm>
#include <format>
#include <ranges>

namespace taskforge {

namespace {

auto first_row(Result<std::vector<Resource>> rows) -> Result<Resource> {
  if (!rows) {
    return fail(rows.error());
  }
  if (rows->empty()) {
    return fail(Error::NotFound);
  }
  return ok(std::move(rows->front()));
}

auto iso_time(std::int64_t epoch_ms) -> std::string {
  if (epoch_ms == 0) {
    return {};
  }
  return util::format_iso8601(util::from_unix_millis(epoch_ms));
}

auto to_context_user(const User &user, std::string_view git_domain)
    -> ContextUser {
  ContextUser out{.id = user.id.value(), .name = user.name};
  if (auto git = match_git_identity(user.git_info, git_domain)) {
    out.git_domain = git->git_domain;
    out.git_token = git->git_token;
    out.git_id = git->git_id;
    out.git_login = git->git_login;
    out.git_email = git->git_email;
    out.user_name = git->user_name;
  }
  return out;
}

auto merge_skills(std::vector<std::string> &into,
                  const std::vector<std::string> &extra) -> void {
  for (const auto &skill : extra) {
    if (std::ranges::find(into, skill) == into.end()) {
      into.push_back(skill);
    }
  }
}

} // namespace

auto result_text(const JsonValue &result) -> std::string {
  if (result.is_null()) {
    return {};
  }
  if (result.is_string()) {
    return result.get_string();
  }
  if (auto value = json::string_at(result, "value")) {
    return *value;
  }
  return dump_json(result);
}

auto aggregate_prompt(const Subtask &target, std::span<const Subtask> siblings)
    -> PromptAggregate {
  PromptAggregate out;
  std::string user_prompt;
  std::string previous;

  for (std::size_t i = 0; i < siblings.size(); ++i) {
    const auto &s = siblings[i];
    if (s.role == SubtaskRole::User) {
      user_prompt = s.prompt;
      previous.clear();
      continue;
    }
    if (s.id == target.id) {
      if (i + 1 < siblings.size()) {
        out.next_subtask_id = siblings[i + 1].id;
      }
      break;
    }
    ++out.pipeline_index;
    if (sequence_less(s, target)) {
      previous = result_text(s.result);
      if (!s.executor_name.empty()) {
        out.inherited_executor_name = s.executor_name;
        out.inherited_executor_namespace = s.executor_namespace;
      }
    }
  }

  if (json::bool_at(target.result, "from_stage_confirmation").value_or(false)) {
    out.new_session = true;
    if (auto confirmed = json::string_at(target.result, "confirmed_prompt");
        confirmed && !confirmed->empty()) {
      out.prompt = std::move(*confirmed);
      return out;
    }
  }

  out.prompt = std::move(user_prompt);
  if (!previous.empty()) {
    out.prompt += "\nPrevious execution result: ";
    out.prompt += previous;
  }
  return out;
}

Dispatcher::Dispatcher(CoordinatorStore &store, ResourceStore &resources,
                       DispatcherConfig config)
    : store_(store), resources_(resources), config_(config) {}

auto Dispatcher::first_matching(TaskId task_id, SubtaskStatus status_filter,
                                bool skip_if_running, DispatchReport &report)
    -> task<Result<std::optional<Candidate>>> {
  auto subtasks = co_await store_.list_subtasks(task_id);
  if (!subtasks) {
    if (is(subtasks.error(), Error::NotFound)) {
      report.skipped.push_back(
          {.task_id = task_id, .reason = SkipReason::Vanished});
      co_return ok(std::optional<Candidate>{});
    }
    co_return fail(subtasks.error());
  }

  if (skip_if_running &&
      std::ranges::any_of(*subtasks, [](const Subtask &s) {
        return s.status == SubtaskStatus::Running;
      })) {
    report.skipped.push_back(
        {.task_id = task_id, .reason = SkipReason::SubtaskRunning});
    co_return ok(std::optional<Candidate>{});
  }

  auto it = std::ranges::find_if(*subtasks, [&](const Subtask &s) {
    return s.role == SubtaskRole::Assistant && s.status == status_filter;
  });
  if (it == subtasks->end()) {
    report.skipped.push_back(
        {.task_id = task_id, .reason = SkipReason::NoMatchingSubtask});
    co_return ok(std::optional<Candidate>{});
  }
  co_return ok(std::optional<Candidate>{
      Candidate{.task_id = task_id, .subtask_id = it->id}});
}

auto Dispatcher::select_targeted(const ClaimRequest &request,
                                 DispatchReport &report)
    -> task<Result<std::vector<Candidate>>> {
  std::vector<Candidate> out;
  for (auto task_id : request.task_ids) {
    auto t = co_await store_.get_task(task_id);
    if (!t) {
      if (!is(t.error(), Error::NotFound)) {
        co_return fail(t.error());
      }
      report.skipped.push_back(
          {.task_id = task_id, .reason = SkipReason::TaskNotFound});
      continue;
    }
    if (t->status != TaskStatus::Pending && t->status != TaskStatus::Running) {
      report.skipped.push_back(
          {.task_id = task_id, .reason = SkipReason::TaskNotActive});
      continue;
    }
    auto candidate =
        co_await first_matching(task_id, request.status_filter, true, report);
    if (!candidate) {
      co_return fail(candidate.error());
    }
    if (*candidate) {
      out.push_back(**candidate);
    }
  }
  co_return ok(std::move(out));
}

auto Dispatcher::select_pool(const ClaimRequest &request, int limit,
                             DispatchReport &report)
    -> task<Result<std::vector<Candidate>>> {
  auto tasks = co_await store_.list_tasks_by_status(
      task_status_for(request.status_filter), limit);
  if (!tasks) {
    co_return fail(tasks.error());
  }
  std::vector<Candidate> out;
  for (const auto &t : *tasks) {
    auto candidate =
        co_await first_matching(t.id, request.status_filter, true, report);
    if (!candidate) {
      co_return fail(candidate.error());
    }
    if (*candidate) {
      out.push_back(**candidate);
    }
  }
  co_return ok(std::move(out));
}

auto Dispatcher::claim(ClaimRequest request) -> task<Result<DispatchReport>> {
  int limit = request.limit <= 0 ? config_.default_limit : request.limit;
  limit = std::min(limit, config_.max_limit);

  DispatchReport report;
  auto candidates = request.task_ids.empty()
                        ? co_await select_pool(request, limit, report)
                        : co_await select_targeted(request, report);
  if (!candidates) {
    co_return fail(candidates.error());
  }

  for (const auto &c : *candidates) {
    auto claimed = co_await store_.claim_subtask(c.subtask_id);
    if (!claimed) {
      if (!is(claimed.error(), Error::NotFound)) {
        log::error("Claiming subtask {} failed: {}", c.subtask_id,
                   claimed.error().message());
      }
      report.skipped.push_back({.task_id = c.task_id,
                                .subtask_id = c.subtask_id,
                                .reason = is(claimed.error(), Error::NotFound)
                                              ? SkipReason::Vanished
                                              : SkipReason::ClaimLost});
      continue;
    }
    if (!*claimed) {
      log::debug("Subtask {} was claimed by another dispatcher", c.subtask_id);
      report.skipped.push_back({.task_id = c.task_id,
                                .subtask_id = c.subtask_id,
                                .reason = SkipReason::ClaimLost});
      continue;
    }

    auto flipped = co_await store_.cas_task_status(
        c.task_id, TaskStatus::Pending, TaskStatus::Running);
    if (!flipped) {
      log::warn("Marking task {} RUNNING failed: {}", c.task_id,
                flipped.error().message());
    }
    const bool task_flipped = flipped && *flipped;

    auto t = co_await store_.get_task(c.task_id);
    auto s = t ? co_await store_.get_subtask(c.subtask_id)
               : Result<Subtask>{fail(t.error())};
    auto ctx = s ? co_await build_context(*t, *s, report.warnings)
                 : Result<ExecutionContext>{fail(s.error())};
    if (!ctx) {
      report.skipped.push_back(co_await abandon_claim(c, task_flipped,
                                                      ctx.error()));
      continue;
    }
    report.contexts.push_back(std::move(*ctx));
  }

  log::info("Dispatched {} subtask(s), skipped {}", report.contexts.size(),
            report.skipped.size());
  co_return ok(std::move(report));
}

auto Dispatcher::abandon_claim(const Candidate &c, bool task_flipped,
                               std::error_code cause) -> task<SkippedItem> {
  if (is(cause, Error::NotFound)) {
    co_return SkippedItem{.task_id = c.task_id,
                          .subtask_id = c.subtask_id,
                          .reason = SkipReason::Vanished};
  }
  log::error("Dispatching subtask {} failed, releasing the claim: {}",
             c.subtask_id, cause.message());
  if (auto released = co_await store_.release_subtask(c.subtask_id);
      !released) {
    log::error("Releasing subtask {} failed: {}", c.subtask_id,
               released.error().message());
  }
  if (task_flipped) {
    if (auto reverted = co_await store_.cas_task_status(
            c.task_id, TaskStatus::Running, TaskStatus::Pending);
        !reverted) {
      log::warn("Reverting task {} to PENDING failed: {}", c.task_id,
                reverted.error().message());
    }
  }
  co_return SkippedItem{.task_id = c.task_id,
                        .subtask_id = c.subtask_id,
                        .reason = SkipReason::Released};
}

auto Dispatcher::build_context(const Task &parent, const Subtask &subtask,
                               std::vector<std::string> &warnings)
    -> task<Result<ExecutionContext>> {
  auto siblings = co_await store_.list_subtasks(parent.id);
  if (!siblings) {
    co_return fail(siblings.error());
  }
  auto agg = aggregate_prompt(subtask, *siblings);

  if (agg.new_session && !subtask.result.is_null()) {
    // The confirmation payload is consumed once.
    if (auto res = co_await store_.patch_subtask(
            SubtaskPatch{.id = subtask.id,
                         .expected_status = subtask.status,
                         .result = JsonValue{}});
        !res) {
      log::warn("Clearing confirmation result of subtask {} failed: {}",
                subtask.id, res.error().message());
    }
  }

  ExecutionContext ctx{
      .subtask_id = subtask.id.value(),
      .task_id = parent.id.value(),
      .type = std::string{to_string_view(parent.type)},
      .is_subscription = parent.type == TaskType::Subscription,
      .executor_name = subtask.executor_name,
      .executor_namespace = subtask.executor_namespace,
      .subtask_title = subtask.title,
      .task_title = parent.title,
      .team_id = parent.team_id.value(),
      .git_domain = parent.workspace.git_domain,
      .git_repo = parent.workspace.git_repo,
      .git_repo_id = parent.workspace.git_repo_id,
      .branch_name = parent.workspace.branch_name,
      .git_url = parent.workspace.git_url,
      .prompt = std::move(agg.prompt),
      .status = std::string{to_string_view(subtask.status)},
      .progress = subtask.progress,
      .created_at = iso_time(subtask.created_at),
      .updated_at = iso_time(subtask.updated_at),
      .new_session = agg.new_session,
      .user_selected_skills = parent.additional_skills,
  };
  if (agg.next_subtask_id) {
    ctx.subtask_next_id = agg.next_subtask_id->value();
  }
  if (ctx.executor_name.empty()) {
    ctx.executor_name = agg.inherited_executor_name;
    ctx.executor_namespace = agg.inherited_executor_namespace;
  }

  if (auto user = co_await resources_.get_user(subtask.user_id)) {
    ctx.user = to_context_user(*user, parent.workspace.git_domain);
  } else if (!is(user.error(), Error::NotFound)) {
    warnings.push_back(std::format("subtask {}: user {} unavailable: {}",
                                   subtask.id, subtask.user_id,
                                   user.error().message()));
  }

  TeamSpec team;
  if (parent.team_id) {
    auto team_row = co_await resources_.get_by_id(ResourceKind::Team,
                                                  parent.team_id);
    auto decoded = team_row.and_then(
        [](const Resource &r) { return decode_team(r); });
    if (decoded) {
      team = std::move(*decoded);
      ctx.team_namespace = team_row->name_space;
    } else {
      warnings.push_back(std::format("subtask {}: team {} unusable: {}",
                                     subtask.id, parent.team_id,
                                     decoded.error().message()));
    }
  }
  ctx.mode = std::string{to_string_view(team.mode)};

  for (std::size_t index = 0; index < subtask.bot_ids.size(); ++index) {
    const auto member_index =
        team.mode == WorkflowMode::Pipeline ? agg.pipeline_index : index;
    const TeamMember *member = member_index < team.members.size()
                                   ? &team.members[member_index]
                                   : nullptr;
    auto bot = co_await resolve_bot(subtask.bot_ids[index], parent, subtask,
                                    member, warnings);
    if (!bot) {
      continue;
    }
    merge_skills(bot->skills, parent.additional_skills);
    if (ctx.is_subscription) {
      bot->system_prompt += kSubscriptionPromptSuffix;
    }
    ctx.bot.push_back(std::move(*bot));
  }

  log::debug("Context for subtask {}: {} bot(s), mode {}, prompt {} bytes",
             subtask.id, ctx.bot.size(), ctx.mode, ctx.prompt.size());
  co_return ok(std::move(ctx));
}

auto Dispatcher::resolve_bot(std::int64_t bot_id, const Task &parent,
                             const Subtask &subtask, const TeamMember *member,
                             std::vector<std::string> &warnings)
    -> task<std::optional<ContextBot>> {
  auto row = co_await resources_.get_by_id(ResourceKind::Bot,
                                           ResourceId{bot_id});
  if (!row || !row->is_active) {
    warnings.push_back(
        std::format("subtask {}: bot {} not found", subtask.id, bot_id));
    co_return std::nullopt;
  }
  if (row->user_id != parent.user_id && row->user_id != kPublicOwner) {
    log::warn("Bot {} belongs to user {}, not to task {}'s owner {}", bot_id,
              row->user_id, parent.id, parent.user_id);
    warnings.push_back(std::format("subtask {}: bot {} not found", subtask.id,
                                   bot_id));
    co_return std::nullopt;
  }
  auto spec = decode_bot(*row);
  if (!spec) {
    warnings.push_back(std::format("subtask {}: bot {} is malformed: {}",
                                   subtask.id, bot_id,
                                   spec.error().message()));
    co_return std::nullopt;
  }

  ContextBot out{.id = bot_id, .name = row->name};
  const auto owner = row->user_id;

  auto ghost = (co_await find_named(resources_, ResourceKind::Ghost,
                                    spec->ghost_ref, owner))
                   .and_then([](const Resource &r) { return decode_ghost(r); });
  if (ghost) {
    out.system_prompt = ghost->system_prompt;
    out.mcp_servers = ghost->mcp_servers;
    out.skills = ghost->skills;
  } else {
    warnings.push_back(std::format("bot {}: ghost {} unavailable", bot_id,
                                   spec->ghost_ref.name));
  }

  auto shell = (co_await find_named(resources_, ResourceKind::Shell,
                                    spec->shell_ref, owner))
                   .and_then([](const Resource &r) { return decode_shell(r); });
  if (shell) {
    out.shell_type = shell->shell_type;
    out.agent_name = shell->shell_type;
    out.base_image = shell->base_image;
  } else {
    warnings.push_back(std::format("bot {}: shell {} unavailable", bot_id,
                                   spec->shell_ref.name));
  }

  JsonValue agent_config = json::object();
  if (spec->model_ref) {
    auto model =
        (co_await find_named(resources_, ResourceKind::Model, *spec->model_ref,
                             owner))
            .and_then([](const Resource &r) { return decode_model(r); });
    if (model) {
      agent_config = model->model_config;
      if (!model->binding.private_model.empty()) {
        auto named = first_row(co_await resources_.query(
                                   ResourceKind::Model,
                                   ResourceFilter{
                                       .user_id = kPublicOwner,
                                       .name = model->binding.private_model}))
                         .and_then([](const Resource &r) {
                           return decode_model(r);
                         });
        if (named) {
          agent_config = named->model_config;
        } else {
          log::warn("Bot {}: private model '{}' unavailable, keeping own "
                    "config",
                    bot_id, model->binding.private_model);
        }
      }
    } else {
      warnings.push_back(std::format("bot {}: model {} unavailable", bot_id,
                                     spec->model_ref->name));
    }
  }
  out.agent_config = co_await resolve_agent_config(std::move(agent_config),
                                                   parent, owner,
                                                   subtask.user_id);

  if (member != nullptr) {
    if (!member->prompt.empty()) {
      out.system_prompt += "\n";
      out.system_prompt += member->prompt;
    }
    out.role = member->role;
  }
  co_return out;
}

auto Dispatcher::find_model_by_type(const std::string &name,
                                    const std::string &type,
                                    const std::string &name_space, UserId user)
    -> task<Result<Resource>> {
  if (type == "public") {
    co_return first_row(co_await resources_.query(
        ResourceKind::Model,
        ResourceFilter{.user_id = kPublicOwner,
                       .name = name,
                       .name_space = std::string(kDefaultNamespace)}));
  }
  if (type == "group") {
    co_return first_row(co_await resources_.query(
        ResourceKind::Model,
        ResourceFilter{.name = name, .name_space = name_space}));
  }
  if (type == "user") {
    co_return first_row(co_await resources_.query(
        ResourceKind::Model, ResourceFilter{.user_id = user,
                                            .name = name,
                                            .name_space = name_space}));
  }
  co_return co_await find_named(resources_, ResourceKind::Model,
                                ResourceRef{.name = name}, user);
}

auto Dispatcher::resolve_agent_config(JsonValue agent_config, const Task &parent,
                                      UserId bot_owner, UserId chat_user)
    -> task<JsonValue> {
  if (!agent_config.is_object()) {
    co_return agent_config;
  }

  const auto binding = decode_binding(agent_config);
  std::string name;
  std::string type;
  std::string name_space{kDefaultNamespace};
  UserId lookup_user = bot_owner;

  if (parent.force_override_model && !parent.model_id.empty()) {
    name = parent.model_id;
    type = parent.force_override_model_type;
    lookup_user = chat_user;
  } else {
    name = !binding.bind_model.empty() ? binding.bind_model : parent.model_id;
    type = binding.bind_model_type;
    name_space = binding.bind_model_namespace;
  }
  if (name.empty()) {
    co_return agent_config;
  }

  auto model = (co_await find_model_by_type(name, type, name_space,
                                            lookup_user))
                   .and_then([](const Resource &r) { return decode_model(r); });
  if (!model) {
    log::warn("Model '{}' not resolvable (type={}, namespace={}): {}", name,
              type.empty() ? "any" : type, name_space,
              model.error().message());
    co_return agent_config;
  }
  co_return std::move(model->model_config);
}

} // namespace taskforge
