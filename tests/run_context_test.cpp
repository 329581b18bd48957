// run_context_test.cpp — Tests for MemoCache and the RunContext caches
//
// Values are keyed by (symbol, day, settings subset hash); only an explicit
// invalidate() drops them.

#include <gtest/gtest.h>

#include "backtest/run_context.hpp"
#include "test_candle_helpers.hpp"

#include <stdexcept>
#include <string>

using namespace candle_test_helpers;

// ===========================================================================
// 1. MemoCache
// ===========================================================================
class MemoCacheTest : public ::testing::Test {
protected:
    MemoCache<int> cache;
    int computed = 0;

    int compute() { return ++computed; }
};

TEST_F(MemoCacheTest, SecondLookupIsAHit) {
    CacheKey key{"EURUSD", 10, 7};
    EXPECT_EQ(cache.get_or_compute(key, [&] { return compute(); }), 1);
    EXPECT_EQ(cache.get_or_compute(key, [&] { return compute(); }), 1);
    EXPECT_EQ(computed, 1);
    EXPECT_EQ(cache.hits(), 1u);
    EXPECT_EQ(cache.misses(), 1u);
}

TEST_F(MemoCacheTest, EveryKeyComponentMatters) {
    cache.get_or_compute(CacheKey{"EURUSD", 10, 7}, [&] { return compute(); });
    cache.get_or_compute(CacheKey{"GBPUSD", 10, 7}, [&] { return compute(); });
    cache.get_or_compute(CacheKey{"EURUSD", 11, 7}, [&] { return compute(); });
    cache.get_or_compute(CacheKey{"EURUSD", 10, 8}, [&] { return compute(); });
    EXPECT_EQ(computed, 4);
    EXPECT_EQ(cache.size(), 4u);
}

TEST_F(MemoCacheTest, InvalidateDropsEntries) {
    CacheKey key{"EURUSD", 10, 7};
    cache.get_or_compute(key, [&] { return compute(); });
    cache.invalidate();
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_EQ(cache.find(key), nullptr);
    EXPECT_EQ(cache.get_or_compute(key, [&] { return compute(); }), 2);
}

TEST_F(MemoCacheTest, PutOverwrites) {
    CacheKey key{"EURUSD", 10, 7};
    cache.put(key, 5);
    cache.put(key, 6);
    ASSERT_NE(cache.find(key), nullptr);
    EXPECT_EQ(*cache.find(key), 6);
    EXPECT_EQ(cache.get_or_compute(key, [&] { return compute(); }), 6);
    EXPECT_EQ(computed, 0);
}

// ===========================================================================
// 2. RunContext
// ===========================================================================
class RunContextTest : public ::testing::Test {
protected:
    int64_t day0 = base_day();
    VectorCandleSeries series{zigzag_days(base_day(), 6)};
};

TEST_F(RunContextTest, InvalidSettingsThrow) {
    Settings s;
    s.top_k = 0;
    EXPECT_THROW(RunContext ctx(s), std::invalid_argument);
}

TEST_F(RunContextTest, LevelsAreMemoized) {
    RunContext ctx(zigzag_settings());
    const LevelSet& a = ctx.levels("X", series, day0 + 4);
    const LevelSet& b = ctx.levels("X", series, day0 + 4);
    EXPECT_EQ(&a, &b);
    EXPECT_EQ(ctx.level_cache().hits(), 1u);
    EXPECT_EQ(ctx.level_cache().misses(), 1u);
    EXPECT_FALSE(a.supports.empty());
}

TEST_F(RunContextTest, MapsAreMemoizedPerDay) {
    RunContext ctx(zigzag_settings());
    ctx.direction_map("X", series, day0 + 5);
    ctx.direction_map("X", series, day0 + 5);
    ctx.direction_map("X", series, day0 + 4);
    EXPECT_EQ(ctx.map_cache().size(), 2u);
    EXPECT_EQ(ctx.map_cache().hits(), 1u);
}

TEST_F(RunContextTest, InvalidateClearsBothCaches) {
    RunContext ctx(zigzag_settings());
    ctx.levels("X", series, day0 + 4);
    ctx.direction_map("X", series, day0 + 5);
    ctx.invalidate();
    EXPECT_EQ(ctx.level_cache().size(), 0u);
    EXPECT_EQ(ctx.map_cache().size(), 0u);
}

TEST_F(RunContextTest, StaleEntryIsServedUntilInvalidated) {
    RunContext ctx(zigzag_settings());
    const Settings& s = ctx.settings();
    ctx.map_cache().put(CacheKey{"X", day0 + 5, s.map_hash()}, DirectionMap{});
    EXPECT_TRUE(ctx.direction_map("X", series, day0 + 5).empty());

    ctx.invalidate();
    EXPECT_FALSE(ctx.direction_map("X", series, day0 + 5).empty());
}
