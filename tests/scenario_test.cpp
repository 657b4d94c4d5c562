#include "taskforge/cache/memory_cache.hpp"
#include "taskforge/core/runtime.hpp"
#include "taskforge/dispatch/dispatcher.hpp"
#include "taskforge/status/status_aggregator.hpp"
#include "taskforge/storage/memory_store.hpp"
#include "taskforge/streaming/streaming_ingestor.hpp"

#include "test_utils.hpp"

#include <gtest/gtest.h>

namespace taskforge {
namespace {

using namespace std::chrono_literals;
using test::body_json;
using test::run_coro;

auto text(std::string s) -> JsonValue { return JsonValue{std::move(s)}; }

// Full in-process flow: a worker claims work, streams output and reports
// completion; the task aggregate follows.
class ScenarioTest : public ::testing::Test {
protected:
  void SetUp() override {
    ASSERT_TRUE(runtime_.start());
    ingestor_.start();
  }

  void TearDown() override {
    ingestor_.stop();
    runtime_.stop();
  }

  auto claim(ClaimRequest request = {}) -> DispatchReport {
    return test::expect_ok(run_coro(dispatcher_.claim(std::move(request))),
                           "claim");
  }

  auto stream(TaskId task_id, SubtaskId subtask, StreamEventType type,
              JsonValue payload = json::object()) -> streaming::EventAck {
    return test::expect_ok(
        run_coro(ingestor_.process_event(streaming::StreamEvent{
            .task_id = task_id,
            .subtask_id = subtask,
            .type = type,
            .payload = std::move(payload),
            .executor_name = "executor-1"})),
        "process_event");
  }

  auto task_row(TaskId id) -> Task {
    return test::expect_ok(run_coro(store_.get_task(id)), "get_task");
  }

  auto subtask_row(SubtaskId id) -> Subtask {
    return test::expect_ok(run_coro(store_.get_subtask(id)), "get_subtask");
  }

  Runtime runtime_{2};
  storage::MemoryStore store_;
  cache::MemoryCache cache_;
  test::RecordingLiveChannel live_;
  StatusAggregator aggregator_{store_};
  streaming::StreamingIngestor ingestor_{runtime_,    store_,
                                         cache_,      live_,
                                         aggregator_, StreamingConfig{}};
  Dispatcher dispatcher_{store_, store_, DispatcherConfig{}};
};

TEST_F(ScenarioTest, ClaimStreamComplete) {
  auto bot = test::seed_bot(store_, {.name = "writer",
                                     .system_prompt = "You summarize."});
  auto team = test::seed_team(store_, "solo", WorkflowMode::Parallel,
                              {{.bot = "writer"}});
  auto tid = test::seed_task(store_, test::make_task("summary", team));
  test::seed_subtask(store_, test::user_turn(tid, "summarize X", 1));
  auto reply =
      test::seed_subtask(store_, test::assistant_turn(tid, 2, {bot.value()}));

  auto report = claim();
  ASSERT_EQ(report.contexts.size(), 1u);
  const auto &ctx = report.contexts.front();
  EXPECT_EQ(ctx.subtask_id, reply.value());
  EXPECT_EQ(ctx.prompt, "summarize X");
  ASSERT_EQ(ctx.bot.size(), 1u);
  EXPECT_EQ(ctx.bot[0].system_prompt, "You summarize.");
  EXPECT_EQ(task_row(tid).status, TaskStatus::Running);
  EXPECT_TRUE(claim().contexts.empty());

  EXPECT_EQ(stream(tid, reply, StreamEventType::Start).offset, 0);
  EXPECT_EQ(stream(tid, reply, StreamEventType::Chunk, text("A")).offset, 1);
  EXPECT_EQ(stream(tid, reply, StreamEventType::Chunk, text("B")).offset, 2);
  stream(tid, reply, StreamEventType::Status,
         body_json(R"({"status":"COMPLETED","result":{"value":"AB"}})"));

  auto sub = subtask_row(reply);
  EXPECT_EQ(sub.status, SubtaskStatus::Completed);
  EXPECT_EQ(json::string_at(sub.result, "value"), "AB");

  auto t = task_row(tid);
  EXPECT_EQ(t.status, TaskStatus::Completed);
  EXPECT_EQ(t.progress, 100);
  EXPECT_NE(t.completed_at, 0);

  auto types = live_.types();
  ASSERT_GE(types.size(), 3u);
  EXPECT_EQ(types.front(), LiveEventType::Start);
  EXPECT_EQ(types.back(), LiveEventType::Done);
}

TEST_F(ScenarioTest, PipelineHandsResultToNextStage) {
  auto drafter = test::seed_bot(store_, {.name = "drafter"});
  auto reviewer = test::seed_bot(store_, {.name = "reviewer"});
  auto team = test::seed_team(
      store_, "chain", WorkflowMode::Pipeline,
      {{.bot = "drafter", .prompt = "draft it"},
       {.bot = "reviewer", .prompt = "review it"}});
  auto tid = test::seed_task(store_, test::make_task("essay", team));
  test::seed_subtask(store_, test::user_turn(tid, "write an essay", 1));
  auto first = test::seed_subtask(
      store_, test::assistant_turn(tid, 2, {drafter.value()}));
  auto second = test::seed_subtask(
      store_, test::assistant_turn(tid, 3, {reviewer.value()}));

  auto stage_one = claim();
  ASSERT_EQ(stage_one.contexts.size(), 1u);
  EXPECT_EQ(stage_one.contexts[0].subtask_id, first.value());
  EXPECT_EQ(stage_one.contexts[0].subtask_next_id, second.value());

  stream(tid, first, StreamEventType::Chunk, text("first draft"));
  stream(tid, first, StreamEventType::Done);
  EXPECT_EQ(subtask_row(first).status, SubtaskStatus::Completed);
  // one of two stages finished
  EXPECT_EQ(task_row(tid).status, TaskStatus::Running);
  EXPECT_EQ(task_row(tid).progress, 50);

  auto stage_two = claim(ClaimRequest{.task_ids = {tid}});
  ASSERT_EQ(stage_two.contexts.size(), 1u);
  const auto &ctx = stage_two.contexts[0];
  EXPECT_EQ(ctx.subtask_id, second.value());
  EXPECT_NE(ctx.prompt.find("Previous execution result: first draft"),
            std::string::npos);

  stream(tid, second, StreamEventType::Chunk, text("looks good"));
  stream(tid, second, StreamEventType::Done);
  auto t = task_row(tid);
  EXPECT_EQ(t.status, TaskStatus::Completed);
  EXPECT_EQ(t.progress, 100);
  EXPECT_EQ(json::string_at(t.result, "value"), "looks good");
}

TEST_F(ScenarioTest, FailedWorkerFailsTask) {
  auto bot = test::seed_bot(store_, {.name = "flaky"});
  auto tid = test::seed_task(store_, test::make_task("doomed"));
  test::seed_subtask(store_, test::user_turn(tid, "try", 1));
  auto reply =
      test::seed_subtask(store_, test::assistant_turn(tid, 2, {bot.value()}));

  ASSERT_EQ(claim().contexts.size(), 1u);
  stream(tid, reply, StreamEventType::Error,
         body_json(R"({"error":"container exited"})"));

  auto t = task_row(tid);
  EXPECT_EQ(t.status, TaskStatus::Failed);
  EXPECT_EQ(t.error_message, "container exited");
}

} // namespace
} // namespace taskforge
