#include "taskforge/cache/memory_cache.hpp"

#include "test_utils.hpp"

#include <gtest/gtest.h>

namespace taskforge {
namespace {

using namespace std::chrono_literals;
using cache::MemoryCache;

class MemoryCacheTest : public ::testing::Test {
protected:
  MemoryCache::Clock::time_point now_{MemoryCache::Clock::now()};
  MemoryCache cache_{[this] { return now_; }};

  auto get(std::string_view key) -> std::optional<std::string> {
    auto r = test::run_coro(cache_.get(key));
    EXPECT_TRUE(r.has_value());
    return r ? *r : std::nullopt;
  }
};

TEST_F(MemoryCacheTest, SetThenGet) {
  ASSERT_TRUE(test::run_coro(cache_.set("k", "v", 10s)));
  EXPECT_EQ(get("k"), "v");
  EXPECT_EQ(get("missing"), std::nullopt);
}

TEST_F(MemoryCacheTest, SetOverwritesValueAndExpiry) {
  ASSERT_TRUE(test::run_coro(cache_.set("k", "old", 1s)));
  ASSERT_TRUE(test::run_coro(cache_.set("k", "new", 60s)));
  now_ += 30s;
  EXPECT_EQ(get("k"), "new");
}

TEST_F(MemoryCacheTest, ExpiredEntriesAreInvisible) {
  ASSERT_TRUE(test::run_coro(cache_.set("k", "v", 5s)));
  now_ += 4s;
  EXPECT_EQ(get("k"), "v");
  now_ += 1s;
  EXPECT_EQ(get("k"), std::nullopt);
  EXPECT_EQ(cache_.size(), 0u);
}

TEST_F(MemoryCacheTest, DelRemovesAndToleratesMissingKeys) {
  ASSERT_TRUE(test::run_coro(cache_.set("k", "v", 5s)));
  EXPECT_TRUE(test::run_coro(cache_.del("k")));
  EXPECT_EQ(get("k"), std::nullopt);
  EXPECT_TRUE(test::run_coro(cache_.del("k")));
}

TEST_F(MemoryCacheTest, NonPositiveTtlIsRejected) {
  auto r = test::run_coro(cache_.set("k", "v", 0s));
  ASSERT_FALSE(r.has_value());
  EXPECT_TRUE(is(r.error(), Error::InvalidArgument));
  EXPECT_EQ(cache_.size(), 0u);
}

TEST_F(MemoryCacheTest, PurgeExpiredCountsRemovedEntries) {
  ASSERT_TRUE(test::run_coro(cache_.set("short1", "a", 1s)));
  ASSERT_TRUE(test::run_coro(cache_.set("short2", "b", 2s)));
  ASSERT_TRUE(test::run_coro(cache_.set("long", "c", 100s)));
  now_ += 3s;
  EXPECT_EQ(cache_.purge_expired(), 2u);
  EXPECT_EQ(cache_.size(), 1u);
  EXPECT_EQ(get("long"), "c");
}

TEST(CacheKeysTest, KeyLayout) {
  EXPECT_EQ(cache_keys::streaming_content(42), "executor:streaming:42");
  EXPECT_EQ(cache_keys::streaming_state(42), "executor:streaming:state:42");
  EXPECT_EQ(cache_keys::cancel_flag(42), "executor:cancel:42");
}

} // namespace
} // namespace taskforge
