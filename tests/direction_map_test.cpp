// direction_map_test.cpp — Tests for the time-of-day bias map
//
// A slot carries a direction only with enough samples and a majority at or
// above the threshold; equal counts resolve to CALL; flat candles are not
// samples; a day's map never includes that day.

#include <gtest/gtest.h>

#include "backtest/run_context.hpp"
#include "bias/direction_map.hpp"
#include "test_candle_helpers.hpp"

#include <vector>

using namespace candle_test_helpers;

// ===========================================================================
// Helpers
// ===========================================================================
namespace {

// One candle per day at 10:00, up when `ups[d]` is 1, down when 0, flat when 2.
std::vector<Candle> ten_oclock_candles(int64_t first_day, const std::vector<int>& ups) {
    std::vector<Candle> out;
    for (size_t d = 0; d < ups.size(); ++d) {
        int64_t t = at(first_day + static_cast<int64_t>(d), 10, 0);
        if (ups[d] == 1) out.push_back(make_candle(t, 1.0, 1.1));
        else if (ups[d] == 0) out.push_back(make_candle(t, 1.1, 1.0));
        else out.push_back(make_candle(t, 1.0, 1.0));
    }
    return out;
}

std::vector<int64_t> day_range(int64_t first, int n) {
    std::vector<int64_t> days;
    for (int i = 0; i < n; ++i) days.push_back(first + i);
    return days;
}

constexpr int SLOT_10_00 = 600;

}  // namespace

// ===========================================================================
// 1. DirectionMapBuilder thresholds
// ===========================================================================
class DirectionMapBuilderTest : public ::testing::Test {
protected:
    int64_t day0 = base_day();
};

TEST_F(DirectionMapBuilderTest, MajorityAtThresholdIsKept) {
    VectorCandleSeries series(ten_oclock_candles(day0, {1, 1, 1, 0, 0}));
    DirectionMap map = DirectionMapBuilder(5, 3, 0.60).build(series, day_range(day0, 5));
    ASSERT_TRUE(map.at(SLOT_10_00).has_value());
    EXPECT_EQ(*map.at(SLOT_10_00), Direction::CALL);
    EXPECT_EQ(map.size(), 1u);
}

TEST_F(DirectionMapBuilderTest, MajorityJustBelowThresholdIsDropped) {
    VectorCandleSeries series(ten_oclock_candles(day0, {1, 1, 1, 0, 0}));
    DirectionMap map = DirectionMapBuilder(5, 3, 0.61).build(series, day_range(day0, 5));
    EXPECT_FALSE(map.contains(SLOT_10_00));
    EXPECT_TRUE(map.empty());
}

TEST_F(DirectionMapBuilderTest, DownMajorityIsPut) {
    VectorCandleSeries series(ten_oclock_candles(day0, {0, 0, 0, 0, 1}));
    DirectionMap map = DirectionMapBuilder(5, 3, 0.60).build(series, day_range(day0, 5));
    EXPECT_EQ(map.at(SLOT_10_00), Direction::PUT);
}

TEST_F(DirectionMapBuilderTest, TooFewSamplesIsDropped) {
    VectorCandleSeries series(ten_oclock_candles(day0, {1, 1}));
    DirectionMap map = DirectionMapBuilder(5, 3, 0.60).build(series, day_range(day0, 2));
    EXPECT_TRUE(map.empty());
}

TEST_F(DirectionMapBuilderTest, TieResolvesToCall) {
    VectorCandleSeries series(ten_oclock_candles(day0, {1, 0, 1, 0}));
    DirectionMap map = DirectionMapBuilder(5, 3, 0.50).build(series, day_range(day0, 4));
    EXPECT_EQ(DirectionMapBuilder::TIE_DIRECTION, Direction::CALL);
    EXPECT_EQ(map.at(SLOT_10_00), Direction::CALL);

    DirectionMap strict = DirectionMapBuilder(5, 3, 0.60).build(series, day_range(day0, 4));
    EXPECT_TRUE(strict.empty());
}

TEST_F(DirectionMapBuilderTest, FlatCandlesAreNotSamples) {
    // 3 up + 2 flat: only 3 samples, all up.
    VectorCandleSeries series(ten_oclock_candles(day0, {1, 2, 1, 2, 1}));
    auto counts = DirectionMapBuilder(5, 3, 0.60).count(series, day_range(day0, 5));
    ASSERT_EQ(counts.count(SLOT_10_00), 1u);
    EXPECT_EQ(counts.at(SLOT_10_00).up, 3);
    EXPECT_EQ(counts.at(SLOT_10_00).down, 0);

    DirectionMap map = DirectionMapBuilder(5, 4, 0.60).build(series, day_range(day0, 5));
    EXPECT_TRUE(map.empty());
}

TEST_F(DirectionMapBuilderTest, SlotsFloorToStep) {
    // 10:03 belongs to the 10:00 slot with 5-minute steps, the 10:03 slot
    // with 1-minute steps.
    std::vector<Candle> candles;
    for (int d = 0; d < 3; ++d) candles.push_back(make_candle(at(day0 + d, 10, 3), 1.0, 1.1));
    VectorCandleSeries series(candles);

    EXPECT_TRUE(DirectionMapBuilder(5, 3, 0.6).build(series, day_range(day0, 3))
                    .contains(SLOT_10_00));
    EXPECT_TRUE(DirectionMapBuilder(1, 3, 0.6).build(series, day_range(day0, 3))
                    .contains(SLOT_10_00 + 3));
}

TEST_F(DirectionMapBuilderTest, OnlyListedDaysCount) {
    VectorCandleSeries series(ten_oclock_candles(day0, {1, 1, 1, 0, 0, 0, 0}));
    DirectionMap first = DirectionMapBuilder(5, 3, 0.6).build(series, day_range(day0, 3));
    DirectionMap last = DirectionMapBuilder(5, 3, 0.6).build(series, day_range(day0 + 4, 3));
    EXPECT_EQ(first.at(SLOT_10_00), Direction::CALL);
    EXPECT_EQ(last.at(SLOT_10_00), Direction::PUT);
}

// ===========================================================================
// 2. Through RunContext — history strictly before the biased day
// ===========================================================================
class DirectionMapHistoryTest : public ::testing::Test {
protected:
    int64_t day0 = base_day();
};

TEST_F(DirectionMapHistoryTest, BiasedDayIsExcluded) {
    // Five up days, then day 5 is down; the map for day 5 sees only ups.
    VectorCandleSeries series(ten_oclock_candles(day0, {1, 1, 1, 1, 1, 0}));
    RunContext ctx(Settings{});
    const DirectionMap& map = ctx.direction_map("X", series, day0 + 5);
    EXPECT_EQ(map.at(SLOT_10_00), Direction::CALL);
}

TEST_F(DirectionMapHistoryTest, UsesOnlyPredominanceDays) {
    // Ten days: five downs followed by five ups. With 5 predominance days the
    // map for day 10 sees only the ups.
    VectorCandleSeries series(ten_oclock_candles(day0, {0, 0, 0, 0, 0, 1, 1, 1, 1, 1}));
    RunContext ctx(Settings{});
    EXPECT_EQ(ctx.direction_map("X", series, day0 + 10).at(SLOT_10_00), Direction::CALL);

    RunContext wide(Settings{}.with([](Settings& s) { s.predominance_days = 10; }));
    // 5 vs 5 with threshold 0.6 gives no bias.
    EXPECT_FALSE(wide.direction_map("X", series, day0 + 10).contains(SLOT_10_00));
}
