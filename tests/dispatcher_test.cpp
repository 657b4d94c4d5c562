#include "taskforge/core/runtime.hpp"
#include "taskforge/dispatch/dispatcher.hpp"
#include "taskforge/storage/memory_store.hpp"

#include "test_utils.hpp"

#include <boost/asio/use_future.hpp>
#include <gtest/gtest.h>

#include <algorithm>
#include <functional>
#include <future>
#include <set>

namespace taskforge {
namespace {

using storage::MemoryStore;
using test::assistant_turn;
using test::InterposingStore;
using test::kTestUser;
using test::make_task;
using test::run_coro;
using test::seed_bot;
using test::seed_subtask;
using test::seed_task;
using test::user_turn;

auto sibling(std::int64_t id, SubtaskRole role, std::int64_t message_id)
    -> Subtask {
  Subtask s;
  s.id = SubtaskId{id};
  s.role = role;
  s.message_id = message_id;
  return s;
}

// === Prompt aggregation ===

TEST(AggregatePromptTest, UsesLatestUserTurn) {
  auto u1 = sibling(1, SubtaskRole::User, 1);
  u1.prompt = "hello";
  auto a1 = sibling(2, SubtaskRole::Assistant, 2);
  a1.result = JsonValue{{"value", "hi there"}};
  auto u2 = sibling(3, SubtaskRole::User, 3);
  u2.prompt = "follow up";
  auto a2 = sibling(4, SubtaskRole::Assistant, 4);

  std::vector<Subtask> siblings{u1, a1, u2, a2};
  auto agg = aggregate_prompt(a2, siblings);
  EXPECT_EQ(agg.prompt, "follow up");
  EXPECT_FALSE(agg.new_session);
  EXPECT_FALSE(agg.next_subtask_id.has_value());
}

TEST(AggregatePromptTest, PipelineCarriesPreviousResult) {
  auto u1 = sibling(1, SubtaskRole::User, 1);
  u1.prompt = "build it";
  auto a1 = sibling(2, SubtaskRole::Assistant, 2);
  a1.result = JsonValue{{"value", "stage one"}};
  a1.executor_name = "exec-1";
  a1.executor_namespace = "ns-1";
  auto a2 = sibling(3, SubtaskRole::Assistant, 3);
  auto a3 = sibling(4, SubtaskRole::Assistant, 4);

  std::vector<Subtask> siblings{u1, a1, a2, a3};
  auto agg = aggregate_prompt(a2, siblings);
  EXPECT_EQ(agg.prompt, "build it\nPrevious execution result: stage one");
  EXPECT_EQ(agg.pipeline_index, 1u);
  EXPECT_EQ(agg.inherited_executor_name, "exec-1");
  EXPECT_EQ(agg.inherited_executor_namespace, "ns-1");
  ASSERT_TRUE(agg.next_subtask_id.has_value());
  EXPECT_EQ(*agg.next_subtask_id, SubtaskId{4});
}

TEST(AggregatePromptTest, ConfirmedPromptReplacesAggregation) {
  auto u1 = sibling(1, SubtaskRole::User, 1);
  u1.prompt = "original";
  auto a1 = sibling(2, SubtaskRole::Assistant, 2);
  a1.result = JsonValue{{"from_stage_confirmation", true},
                        {"confirmed_prompt", "edited by the user"}};

  std::vector<Subtask> siblings{u1, a1};
  auto agg = aggregate_prompt(a1, siblings);
  EXPECT_EQ(agg.prompt, "edited by the user");
  EXPECT_TRUE(agg.new_session);
}

TEST(AggregatePromptTest, ConfirmationWithoutPromptFallsBack) {
  auto u1 = sibling(1, SubtaskRole::User, 1);
  u1.prompt = "original";
  auto a1 = sibling(2, SubtaskRole::Assistant, 2);
  a1.result = JsonValue{{"from_stage_confirmation", true}};

  std::vector<Subtask> siblings{u1, a1};
  auto agg = aggregate_prompt(a1, siblings);
  EXPECT_EQ(agg.prompt, "original");
  EXPECT_TRUE(agg.new_session);
}

TEST(ResultTextTest, Renderings) {
  EXPECT_EQ(result_text(JsonValue{}), "");
  EXPECT_EQ(result_text(JsonValue{std::string("plain")}), "plain");
  EXPECT_EQ(result_text(JsonValue{{"value", "v"}}), "v");
  EXPECT_EQ(result_text(JsonValue{{"a", 1}}), R"({"a":1})");
}

// === Claiming ===

class DispatcherTest : public ::testing::Test {
protected:
  auto claim(ClaimRequest request = {}) -> DispatchReport {
    auto r = run_coro(dispatcher_.claim(std::move(request)));
    EXPECT_TRUE(r.has_value()) << r.error().message();
    return r ? std::move(*r) : DispatchReport{};
  }

  auto subtask(SubtaskId id) -> Subtask {
    return test::expect_ok(run_coro(store_.get_subtask(id)), "get_subtask");
  }

  auto task_row(TaskId id) -> Task {
    return test::expect_ok(run_coro(store_.get_task(id)), "get_task");
  }

  auto complete(SubtaskId id, std::string value) -> void {
    auto row = subtask(id);
    auto written = run_coro(store_.patch_subtask(
        SubtaskPatch{.id = id,
                     .expected_status = row.status,
                     .status = SubtaskStatus::Completed,
                     .progress = 100,
                     .result = JsonValue{{"value", std::move(value)}}}));
    ASSERT_TRUE(written.value_or(false));
  }

  /// One user turn plus one pending assistant turn.
  auto seed_chat(std::string prompt, std::vector<std::int64_t> bots,
                 ResourceId team = {}) -> std::pair<TaskId, SubtaskId> {
    auto t = seed_task(store_, make_task("chat", team));
    seed_subtask(store_, user_turn(t, std::move(prompt), 1));
    auto s = seed_subtask(store_, assistant_turn(t, 2, std::move(bots)));
    return {t, s};
  }

  MemoryStore store_;
  Dispatcher dispatcher_{store_, store_, DispatcherConfig{}};
};

TEST_F(DispatcherTest, ClaimBuildsContextAndMarksRunning) {
  auto bot = seed_bot(store_, {.name = "coder",
                               .system_prompt = "You write code.",
                               .skills = {"git"}});
  auto [t, s] = seed_chat("summarize X", {bot.value()});

  auto report = claim();
  ASSERT_EQ(report.contexts.size(), 1u);
  const auto &ctx = report.contexts.front();
  EXPECT_EQ(ctx.subtask_id, s.value());
  EXPECT_EQ(ctx.task_id, t.value());
  EXPECT_EQ(ctx.prompt, "summarize X");
  EXPECT_EQ(ctx.type, "online");
  EXPECT_FALSE(ctx.is_subscription);
  EXPECT_EQ(ctx.mode, "parallel");
  EXPECT_EQ(ctx.status, "RUNNING");
  EXPECT_FALSE(ctx.new_session);
  ASSERT_EQ(ctx.bot.size(), 1u);
  EXPECT_EQ(ctx.bot[0].id, bot.value());
  EXPECT_EQ(ctx.bot[0].name, "coder");
  EXPECT_EQ(ctx.bot[0].shell_type, "ClaudeCode");
  EXPECT_EQ(ctx.bot[0].agent_name, "ClaudeCode");
  EXPECT_EQ(ctx.bot[0].system_prompt, "You write code.");
  EXPECT_EQ(ctx.bot[0].skills, std::vector<std::string>{"git"});
  EXPECT_TRUE(ctx.bot[0].agent_config.is_object());
  EXPECT_TRUE(report.warnings.empty());

  EXPECT_EQ(subtask(s).status, SubtaskStatus::Running);
  EXPECT_EQ(task_row(t).status, TaskStatus::Running);

  auto again = claim();
  EXPECT_TRUE(again.contexts.empty());
}

TEST_F(DispatcherTest, NothingPendingYieldsEmptyReport) {
  auto report = claim();
  EXPECT_TRUE(report.contexts.empty());
  EXPECT_TRUE(report.skipped.empty());
}

TEST_F(DispatcherTest, PoolPrefersNewestTasksWithinLimit) {
  auto bot = seed_bot(store_, {.name = "b"});
  auto [older, s_old] = seed_chat("old", {bot.value()});
  auto [newer, s_new] = seed_chat("new", {bot.value()});

  auto first = claim(ClaimRequest{.limit = 1});
  ASSERT_EQ(first.contexts.size(), 1u);
  EXPECT_EQ(first.contexts[0].subtask_id, s_new.value());

  auto second = claim(ClaimRequest{.limit = 1});
  ASSERT_EQ(second.contexts.size(), 1u);
  EXPECT_EQ(second.contexts[0].subtask_id, s_old.value());
}

TEST_F(DispatcherTest, LimitIsCappedByConfiguredMaximum) {
  Dispatcher capped{store_, store_,
                    DispatcherConfig{.default_limit = 1, .max_limit = 2}};
  auto bot = seed_bot(store_, {.name = "b"});
  for (int i = 0; i < 4; ++i) {
    seed_chat(std::format("job {}", i), {bot.value()});
  }
  auto r = run_coro(capped.claim(ClaimRequest{.limit = 50}));
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->contexts.size(), 2u);

  auto d = run_coro(capped.claim(ClaimRequest{}));
  ASSERT_TRUE(d.has_value());
  EXPECT_EQ(d->contexts.size(), 1u);
}

TEST_F(DispatcherTest, TargetedClaimOnlyTouchesNamedTasks) {
  auto bot = seed_bot(store_, {.name = "b"});
  auto [wanted, s_wanted] = seed_chat("wanted", {bot.value()});
  auto [other, s_other] = seed_chat("other", {bot.value()});
  auto done = seed_task(store_, make_task("done"));
  ASSERT_TRUE(run_coro(
      store_.cas_task_status(done, TaskStatus::Pending, TaskStatus::Completed)));

  auto report = claim(ClaimRequest{
      .limit = 10, .task_ids = {wanted, TaskId{9999}, done}});
  ASSERT_EQ(report.contexts.size(), 1u);
  EXPECT_EQ(report.contexts[0].subtask_id, s_wanted.value());
  EXPECT_EQ(subtask(s_other).status, SubtaskStatus::Pending);

  ASSERT_EQ(report.skipped.size(), 2u);
  EXPECT_EQ(report.skipped[0].task_id, TaskId{9999});
  EXPECT_EQ(report.skipped[0].reason, SkipReason::TaskNotFound);
  EXPECT_EQ(report.skipped[1].task_id, done);
  EXPECT_EQ(report.skipped[1].reason, SkipReason::TaskNotActive);
}

TEST_F(DispatcherTest, PipelineStagesRunInSequence) {
  auto planner = seed_bot(store_, {.name = "planner"});
  auto coder = seed_bot(store_, {.name = "coder"});
  auto team = test::seed_team(
      store_, "squad", WorkflowMode::Pipeline,
      {{.bot = "planner", .prompt = "Plan first.", .role = "planner"},
       {.bot = "coder", .prompt = "Then implement.", .role = "coder"}});

  auto t = seed_task(store_, make_task("feature", team));
  seed_subtask(store_, user_turn(t, "add login", 1));
  auto stage1 = seed_subtask(store_, assistant_turn(t, 2, {planner.value()}));
  auto stage2 = seed_subtask(store_, assistant_turn(t, 3, {coder.value()}));

  auto first = claim();
  ASSERT_EQ(first.contexts.size(), 1u);
  const auto &c1 = first.contexts[0];
  EXPECT_EQ(c1.subtask_id, stage1.value());
  EXPECT_EQ(c1.mode, "pipeline");
  ASSERT_TRUE(c1.subtask_next_id.has_value());
  EXPECT_EQ(*c1.subtask_next_id, stage2.value());
  ASSERT_EQ(c1.bot.size(), 1u);
  EXPECT_EQ(c1.bot[0].role, "planner");
  EXPECT_TRUE(c1.bot[0].system_prompt.ends_with("\nPlan first."));

  // the next stage waits while the first one runs
  auto blocked = claim(ClaimRequest{.task_ids = {t}});
  EXPECT_TRUE(blocked.contexts.empty());
  ASSERT_EQ(blocked.skipped.size(), 1u);
  EXPECT_EQ(blocked.skipped[0].reason, SkipReason::SubtaskRunning);

  complete(stage1, "the plan");

  // later stages are requested by task id while the task is RUNNING
  auto second = claim(ClaimRequest{.task_ids = {t}});
  ASSERT_EQ(second.contexts.size(), 1u);
  const auto &c2 = second.contexts[0];
  EXPECT_EQ(c2.subtask_id, stage2.value());
  EXPECT_EQ(c2.prompt, "add login\nPrevious execution result: the plan");
  EXPECT_FALSE(c2.subtask_next_id.has_value());
  ASSERT_EQ(c2.bot.size(), 1u);
  EXPECT_EQ(c2.bot[0].role, "coder");
  EXPECT_TRUE(c2.bot[0].system_prompt.ends_with("\nThen implement."));
}

TEST_F(DispatcherTest, ParallelMembersFollowBotOrder) {
  auto a = seed_bot(store_, {.name = "alpha", .system_prompt = "A"});
  auto b = seed_bot(store_, {.name = "beta", .system_prompt = "B"});
  auto team = test::seed_team(
      store_, "pair", WorkflowMode::Parallel,
      {{.bot = "alpha", .prompt = "first", .role = "lead"},
       {.bot = "beta", .prompt = "second", .role = "review"}});
  seed_chat("go", {a.value(), b.value()}, team);

  auto report = claim();
  ASSERT_EQ(report.contexts.size(), 1u);
  const auto &bots = report.contexts[0].bot;
  ASSERT_EQ(bots.size(), 2u);
  EXPECT_EQ(bots[0].system_prompt, "A\nfirst");
  EXPECT_EQ(bots[0].role, "lead");
  EXPECT_EQ(bots[1].system_prompt, "B\nsecond");
  EXPECT_EQ(bots[1].role, "review");
  EXPECT_FALSE(report.contexts[0].team_namespace.empty());
}

TEST_F(DispatcherTest, ConfirmedPromptIsConsumedOnce) {
  auto bot = seed_bot(store_, {.name = "b"});
  auto t = seed_task(store_, make_task("staged"));
  seed_subtask(store_, user_turn(t, "draft", 1));
  auto s = assistant_turn(t, 2, {bot.value()});
  s.result = JsonValue{{"from_stage_confirmation", true},
                       {"confirmed_prompt", "final wording"}};
  auto sid = seed_subtask(store_, std::move(s));

  auto report = claim();
  ASSERT_EQ(report.contexts.size(), 1u);
  EXPECT_EQ(report.contexts[0].prompt, "final wording");
  EXPECT_TRUE(report.contexts[0].new_session);
  EXPECT_TRUE(subtask(sid).result.is_null());
}

TEST_F(DispatcherTest, SubscriptionTasksGetNotificationGuidance) {
  auto bot = seed_bot(store_, {.name = "b", .system_prompt = "Watch prices."});
  auto draft = make_task("daily digest");
  draft.type = TaskType::Subscription;
  auto t = seed_task(store_, std::move(draft));
  seed_subtask(store_, user_turn(t, "check", 1));
  seed_subtask(store_, assistant_turn(t, 2, {bot.value()}));

  auto report = claim();
  ASSERT_EQ(report.contexts.size(), 1u);
  const auto &ctx = report.contexts[0];
  EXPECT_TRUE(ctx.is_subscription);
  EXPECT_EQ(ctx.type, "subscription");
  ASSERT_EQ(ctx.bot.size(), 1u);
  EXPECT_EQ(ctx.bot[0].system_prompt,
            std::string("Watch prices.") + std::string(kSubscriptionPromptSuffix));
}

TEST_F(DispatcherTest, TaskSkillsMergeIntoGhostSkills) {
  auto bot = seed_bot(store_, {.name = "b", .skills = {"git", "docker"}});
  auto draft = make_task("skills");
  draft.additional_skills = {"docker", "k8s"};
  auto t = seed_task(store_, std::move(draft));
  seed_subtask(store_, user_turn(t, "deploy", 1));
  seed_subtask(store_, assistant_turn(t, 2, {bot.value()}));

  auto report = claim();
  ASSERT_EQ(report.contexts.size(), 1u);
  const auto &ctx = report.contexts[0];
  EXPECT_EQ(ctx.bot[0].skills,
            (std::vector<std::string>{"git", "docker", "k8s"}));
  EXPECT_EQ(ctx.user_selected_skills,
            (std::vector<std::string>{"docker", "k8s"}));
}

TEST_F(DispatcherTest, GitIdentityMatchesTaskDomain) {
  ASSERT_TRUE(run_coro(store_.upsert_user(User{
      .id = kTestUser,
      .name = "tester",
      .git_info = {{.git_domain = "gitlab.example.com", .git_token = "gl"},
                   {.git_domain = "github.com",
                    .git_token = "gh",
                    .git_login = "octo"}}})));
  auto bot = seed_bot(store_, {.name = "b"});
  auto draft = make_task("repo work");
  draft.workspace.git_domain = "github.com";
  draft.workspace.git_repo = "octo/app";
  auto t = seed_task(store_, std::move(draft));
  seed_subtask(store_, user_turn(t, "fix", 1));
  seed_subtask(store_, assistant_turn(t, 2, {bot.value()}));

  auto report = claim();
  ASSERT_EQ(report.contexts.size(), 1u);
  const auto &ctx = report.contexts[0];
  EXPECT_EQ(ctx.git_repo, "octo/app");
  EXPECT_EQ(ctx.user.id, kTestUser.value());
  EXPECT_EQ(ctx.user.name, "tester");
  EXPECT_EQ(ctx.user.git_token, "gh");
  EXPECT_EQ(ctx.user.git_login, "octo");
}

TEST_F(DispatcherTest, MissingBotDegradesWithWarning) {
  auto [t, s] = seed_chat("hello", {424242});
  auto report = claim();
  ASSERT_EQ(report.contexts.size(), 1u);
  EXPECT_TRUE(report.contexts[0].bot.empty());
  ASSERT_FALSE(report.warnings.empty());
  EXPECT_NE(report.warnings[0].find("424242"), std::string::npos);
}

TEST_F(DispatcherTest, MissingTeamDegradesToParallel) {
  auto bot = seed_bot(store_, {.name = "b"});
  seed_chat("hello", {bot.value()}, ResourceId{777});
  auto report = claim();
  ASSERT_EQ(report.contexts.size(), 1u);
  EXPECT_EQ(report.contexts[0].mode, "parallel");
  EXPECT_EQ(report.contexts[0].bot.size(), 1u);
  EXPECT_FALSE(report.warnings.empty());
}

// === Model resolution ===

TEST_F(DispatcherTest, BoundPublicModelReplacesBotConfig) {
  test::seed_resource(store_, ResourceKind::Model, kPublicOwner, "gpt-x",
                      JsonValue{{"modelConfig",
                                 JsonValue{{"env", JsonValue{{"model", "gpt-x"}}}}}});
  auto bot = seed_bot(store_, {.name = "b",
                               .model_config = JsonValue{
                                   {"bind_model", "gpt-x"},
                                   {"bind_model_type", "public"}}});
  seed_chat("hi", {bot.value()});

  auto report = claim();
  ASSERT_EQ(report.contexts.size(), 1u);
  ASSERT_EQ(report.contexts[0].bot.size(), 1u);
  EXPECT_EQ(json::string_at(report.contexts[0].bot[0].agent_config, "env.model"),
            "gpt-x");
}

TEST_F(DispatcherTest, UnresolvableModelKeepsBotConfig) {
  auto bot = seed_bot(store_, {.name = "b",
                               .model_config = JsonValue{
                                   {"bind_model", "does-not-exist"},
                                   {"env", JsonValue{{"model", "fallback"}}}}});
  seed_chat("hi", {bot.value()});

  auto report = claim();
  ASSERT_EQ(report.contexts.size(), 1u);
  const auto &cfg = report.contexts[0].bot[0].agent_config;
  EXPECT_EQ(json::string_at(cfg, "env.model"), "fallback");
  EXPECT_EQ(json::string_at(cfg, "bind_model"), "does-not-exist");
}

TEST_F(DispatcherTest, PrivateModelNameOnlyMatchesPublicModels) {
  test::seed_resource(store_, ResourceKind::Model, UserId{99}, "m",
                      JsonValue{{"modelConfig",
                                 JsonValue{{"env", JsonValue{{"model", "theirs"}}}}}});
  test::seed_resource(store_, ResourceKind::Model, kPublicOwner, "m",
                      JsonValue{{"modelConfig",
                                 JsonValue{{"env", JsonValue{{"model", "shared"}}}}}});
  auto bot = seed_bot(store_, {.name = "b",
                               .model_config = JsonValue{
                                   {"private_model", "m"},
                                   {"env", JsonValue{{"model", "own"}}}}});
  seed_chat("hi", {bot.value()});

  auto report = claim();
  ASSERT_EQ(report.contexts.size(), 1u);
  ASSERT_EQ(report.contexts[0].bot.size(), 1u);
  EXPECT_EQ(json::string_at(report.contexts[0].bot[0].agent_config, "env.model"),
            "shared");
}

TEST_F(DispatcherTest, PrivateModelOfAnotherUserIsNotUsed) {
  test::seed_resource(store_, ResourceKind::Model, UserId{99}, "m",
                      JsonValue{{"modelConfig",
                                 JsonValue{{"env", JsonValue{{"model", "theirs"}}}}}});
  auto bot = seed_bot(store_, {.name = "b",
                               .model_config = JsonValue{
                                   {"private_model", "m"},
                                   {"env", JsonValue{{"model", "own"}}}}});
  seed_chat("hi", {bot.value()});

  auto report = claim();
  ASSERT_EQ(report.contexts.size(), 1u);
  ASSERT_EQ(report.contexts[0].bot.size(), 1u);
  EXPECT_EQ(json::string_at(report.contexts[0].bot[0].agent_config, "env.model"),
            "own");
}

TEST_F(DispatcherTest, BotOfAnotherUserIsLeftOut) {
  auto mine = seed_bot(store_, {.name = "mine"});
  auto foreign = seed_bot(store_, {.name = "foreign", .owner = UserId{99}});
  seed_chat("hi", {mine.value(), foreign.value()});

  auto report = claim();
  ASSERT_EQ(report.contexts.size(), 1u);
  ASSERT_EQ(report.contexts[0].bot.size(), 1u);
  EXPECT_EQ(report.contexts[0].bot[0].name, "mine");
  EXPECT_FALSE(report.warnings.empty());
}

TEST_F(DispatcherTest, ForcedTaskModelWinsOverBinding) {
  test::seed_resource(store_, ResourceKind::Model, kPublicOwner, "gpt-x",
                      JsonValue{{"modelConfig",
                                 JsonValue{{"env", JsonValue{{"model", "gpt-x"}}}}}});
  test::seed_resource(store_, ResourceKind::Model, kTestUser, "mine",
                      JsonValue{{"modelConfig",
                                 JsonValue{{"env", JsonValue{{"model", "my-model"}}}}}});
  auto bot = seed_bot(store_, {.name = "b",
                               .model_config = JsonValue{
                                   {"bind_model", "gpt-x"},
                                   {"bind_model_type", "public"}}});
  auto draft = make_task("override");
  draft.model_id = "mine";
  draft.force_override_model = true;
  draft.force_override_model_type = "user";
  auto t = seed_task(store_, std::move(draft));
  seed_subtask(store_, user_turn(t, "hi", 1));
  seed_subtask(store_, assistant_turn(t, 2, {bot.value()}));

  auto report = claim();
  ASSERT_EQ(report.contexts.size(), 1u);
  EXPECT_EQ(json::string_at(report.contexts[0].bot[0].agent_config, "env.model"),
            "my-model");
}

// === Races ===

TEST_F(DispatcherTest, ClaimLostToAnotherDispatcherIsSkipped) {
  InterposingStore racing{store_};
  Dispatcher dispatcher{racing, store_, DispatcherConfig{}};
  racing.before_claim = [this](SubtaskId id) {
    ASSERT_TRUE(run_coro(store_.claim_subtask(id)).value_or(false));
  };
  auto bot = seed_bot(store_, {.name = "b"});
  auto [t, s] = seed_chat("hi", {bot.value()});

  auto r = run_coro(dispatcher.claim(ClaimRequest{}));
  ASSERT_TRUE(r.has_value());
  EXPECT_TRUE(r->contexts.empty());
  ASSERT_EQ(r->skipped.size(), 1u);
  EXPECT_EQ(r->skipped[0].subtask_id, s);
  EXPECT_EQ(r->skipped[0].reason, SkipReason::ClaimLost);
}

TEST_F(DispatcherTest, RowsVanishingAfterClaimAreSkipped) {
  InterposingStore racing{store_};
  Dispatcher dispatcher{racing, store_, DispatcherConfig{}};
  auto bot = seed_bot(store_, {.name = "b"});
  auto [t, s] = seed_chat("hi", {bot.value()});
  racing.after_claim = [this, t = t](SubtaskId) { store_.erase_task(t); };

  auto r = run_coro(dispatcher.claim(ClaimRequest{}));
  ASSERT_TRUE(r.has_value());
  EXPECT_TRUE(r->contexts.empty());
  ASSERT_EQ(r->skipped.size(), 1u);
  EXPECT_EQ(r->skipped[0].task_id, t);
  EXPECT_EQ(r->skipped[0].reason, SkipReason::Vanished);
}

TEST_F(DispatcherTest, SubtaskErasedBeforeClaimIsNotDispatched) {
  InterposingStore racing{store_};
  Dispatcher dispatcher{racing, store_, DispatcherConfig{}};
  auto bot = seed_bot(store_, {.name = "b"});
  auto [t, s] = seed_chat("hi", {bot.value()});
  racing.before_claim = [this](SubtaskId id) { store_.erase_subtask(id); };

  auto r = run_coro(dispatcher.claim(ClaimRequest{}));
  ASSERT_TRUE(r.has_value());
  EXPECT_TRUE(r->contexts.empty());
  ASSERT_EQ(r->skipped.size(), 1u);
  EXPECT_EQ(r->skipped[0].subtask_id, s);
  EXPECT_EQ(r->skipped[0].reason, SkipReason::Vanished);
}

TEST_F(DispatcherTest, StoreFailureAfterClaimReleasesTheSubtask) {
  InterposingStore flaky{store_};
  Dispatcher dispatcher{flaky, store_, DispatcherConfig{}};
  auto bot = seed_bot(store_, {.name = "b"});
  auto [t, s] = seed_chat("hi", {bot.value()});
  flaky.after_claim = [&flaky](SubtaskId) {
    flaky.list_subtasks_error = Error::DatabaseQueryFailed;
  };

  auto r = run_coro(dispatcher.claim(ClaimRequest{}));
  ASSERT_TRUE(r.has_value());
  EXPECT_TRUE(r->contexts.empty());
  ASSERT_EQ(r->skipped.size(), 1u);
  EXPECT_EQ(r->skipped[0].subtask_id, s);
  EXPECT_EQ(r->skipped[0].reason, SkipReason::Released);
  EXPECT_EQ(subtask(s).status, SubtaskStatus::Pending);
  EXPECT_EQ(task_row(t).status, TaskStatus::Pending);

  flaky.after_claim = nullptr;
  flaky.list_subtasks_error.reset();
  auto retry = run_coro(dispatcher.claim(ClaimRequest{}));
  ASSERT_TRUE(retry.has_value());
  ASSERT_EQ(retry->contexts.size(), 1u);
  EXPECT_EQ(retry->contexts[0].subtask_id, s.value());
}

TEST_F(DispatcherTest, ConcurrentClaimsNeverShareASubtask) {
  constexpr int kTasks = 24;
  auto bot = seed_bot(store_, {.name = "b"});
  std::set<std::int64_t> pending;
  for (int i = 0; i < kTasks; ++i) {
    pending.insert(seed_chat(std::format("job {}", i), {bot.value()}).second.value());
  }

  Runtime runtime(4);
  ASSERT_TRUE(runtime.start());

  std::vector<std::future<Result<DispatchReport>>> futures;
  for (unsigned i = 0; i < 12; ++i) {
    futures.push_back(co_spawn(runtime.executor_for(i),
                               dispatcher_.claim(ClaimRequest{.limit = 4}),
                               boost::asio::use_future));
  }

  std::multiset<std::int64_t> dispatched;
  for (auto &f : futures) {
    auto report = f.get();
    ASSERT_TRUE(report.has_value());
    for (const auto &ctx : report->contexts) {
      dispatched.insert(ctx.subtask_id);
    }
  }
  runtime.stop();

  // drain whatever lost races left behind
  for (auto report = claim(ClaimRequest{.limit = 100});
       !report.contexts.empty(); report = claim(ClaimRequest{.limit = 100})) {
    for (const auto &ctx : report.contexts) {
      dispatched.insert(ctx.subtask_id);
    }
  }

  EXPECT_EQ(dispatched.size(), static_cast<std::size_t>(kTasks));
  for (auto id : pending) {
    EXPECT_EQ(dispatched.count(id), 1u) << "subtask " << id;
  }
}

} // namespace
} // namespace taskforge
