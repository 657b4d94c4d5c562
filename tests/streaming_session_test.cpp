#include "taskforge/streaming/streaming_session.hpp"

#include <gtest/gtest.h>

#include <random>

namespace taskforge::streaming {
namespace {

using namespace std::chrono_literals;

class StreamingSessionTest : public ::testing::Test {
protected:
  SteadyClock::time_point t0_{SteadyClock::now()};
  StreamingSession session_{TaskId{1}, SubtaskId{2}, t0_};
};

TEST_F(StreamingSessionTest, OffsetsAreMonotonicByteCounts) {
  std::mt19937 rng(20241019);
  std::uniform_int_distribution<int> len(1, 50);
  std::uniform_int_distribution<int> letter('a', 'z');

  std::string expected;
  std::int64_t previous = 0;
  for (int i = 0; i < 100; ++i) {
    std::string chunk(static_cast<std::size_t>(len(rng)), ' ');
    for (auto &c : chunk) {
      c = static_cast<char>(letter(rng));
    }
    expected += chunk;
    auto offset = session_.append_content(chunk);
    EXPECT_GT(offset, previous);
    EXPECT_EQ(offset, static_cast<std::int64_t>(expected.size()));
    previous = offset;
  }
  EXPECT_EQ(session_.content(), expected);
  EXPECT_EQ(session_.offset(), static_cast<std::int64_t>(expected.size()));
}

TEST_F(StreamingSessionTest, MultiByteTextCountsBytes) {
  EXPECT_EQ(session_.append_content("\xE4\xBD\xA0\xE5\xA5\xBD"), 6);
  EXPECT_EQ(session_.append_reasoning("ok"), 2);
  EXPECT_EQ(session_.offset(), 6);
}

TEST_F(StreamingSessionTest, ThinkingUpsertReplacesOrAppends) {
  session_.upsert_thinking(0, JsonValue{std::string{"plan"}});
  session_.upsert_thinking(1, JsonValue{std::string{"search"}});
  session_.upsert_thinking(0, JsonValue{std::string{"plan v2"}});
  session_.upsert_thinking(10, JsonValue{std::string{"answer"}});

  ASSERT_EQ(session_.thinking().size(), 3u);
  EXPECT_EQ(session_.thinking()[0].get_string(), "plan v2");
  EXPECT_EQ(session_.thinking()[1].get_string(), "search");
  EXPECT_EQ(session_.thinking()[2].get_string(), "answer");
}

TEST_F(StreamingSessionTest, ProjectionOmitsEmptySections) {
  session_.append_content("hello");
  auto p = session_.projection(true);
  EXPECT_EQ(json::string_at(p, "value"), "hello");
  EXPECT_EQ(json::bool_at(p, "streaming"), true);
  EXPECT_EQ(json::find(p, "thinking"), nullptr);
  EXPECT_EQ(json::find(p, "workbench"), nullptr);
  EXPECT_EQ(json::find(p, "reasoning_content"), nullptr);

  session_.append_reasoning("because");
  session_.upsert_thinking(0, JsonValue{std::string{"step"}});
  p = session_.projection(false);
  EXPECT_EQ(json::bool_at(p, "streaming"), false);
  EXPECT_EQ(json::string_at(p, "reasoning_content"), "because");
  ASSERT_NE(json::find(p, "thinking"), nullptr);
}

TEST_F(StreamingSessionTest, FlushCadence) {
  EXPECT_TRUE(session_.cache_flush_due(t0_, 1s));
  EXPECT_TRUE(session_.db_flush_due(t0_, 5s));

  session_.mark_cache_flushed(t0_);
  session_.mark_db_flushed(t0_);
  EXPECT_FALSE(session_.cache_flush_due(t0_ + 999ms, 1s));
  EXPECT_TRUE(session_.cache_flush_due(t0_ + 1s, 1s));
  EXPECT_FALSE(session_.db_flush_due(t0_ + 4s, 5s));
  EXPECT_TRUE(session_.db_flush_due(t0_ + 5s, 5s));
}

TEST_F(StreamingSessionTest, LastFlushTracksNewestFlush) {
  EXPECT_EQ(session_.last_flush(), t0_);
  session_.mark_db_flushed(t0_ + 3s);
  session_.mark_cache_flushed(t0_ + 2s);
  EXPECT_EQ(session_.last_flush(), t0_ + 3s);
}

} // namespace
} // namespace taskforge::streaming
