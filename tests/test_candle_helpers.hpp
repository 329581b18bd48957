#pragma once

// Shared test helpers for constructing synthetic candle series and stores.
//
// The "zig-zag" market repeats one 12-candle hourly cycle of 5-minute
// candles: six up candles from BASE to BASE + 6*STEP, then six down candles
// back to BASE. The first up candle carries a lower wick and the first down
// candle an upper wick, so each cycle has exactly one support pivot
// (BASE - WICK) and one resistance pivot (BASE + 6*STEP + WICK). With the
// default zone tolerance every cycle produces two signals, a CALL at the
// cycle start and a PUT at the half hour, and both win on their own candle.

#include "backtest/settings.hpp"
#include "candles/candle.hpp"
#include "candles/candle_series.hpp"
#include "candles/candle_store.hpp"
#include "time_utils.hpp"

#include <algorithm>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace candle_test_helpers {

constexpr int STEP_MINUTES = 5;
constexpr int64_t STEP_SEC = STEP_MINUTES * time_utils::SEC_PER_MIN;
constexpr int CANDLES_PER_DAY = time_utils::MIN_PER_DAY / STEP_MINUTES;   // 288
constexpr int CYCLE = 12;
constexpr int SIGNALS_PER_DAY = 2 * CANDLES_PER_DAY / CYCLE;               // 48

constexpr double BASE = 100.0;
constexpr double STEP = 0.1;
constexpr double WICK = 0.02;

// 2024-03-01
inline int64_t base_day() { return time_utils::days_from_civil(2024, 3, 1); }

inline int64_t at(int64_t day, int hour, int minute) {
    return time_utils::day_start(day) + hour * time_utils::SEC_PER_HOUR +
           minute * time_utils::SEC_PER_MIN;
}

inline Candle make_candle(int64_t time, double open, double close) {
    return Candle{time, open, std::max(open, close), std::min(open, close), close};
}

inline Candle make_candle(int64_t time, double open, double high, double low, double close) {
    return Candle{time, open, high, low, close};
}

// Candle `k` (0-based within the day) of the zig-zag cycle.
inline Candle zigzag_candle(int64_t day, int k) {
    int64_t t = time_utils::day_start(day) + k * STEP_SEC;
    int p = k % CYCLE;
    if (p < CYCLE / 2) {
        double open = BASE + p * STEP;
        Candle c = make_candle(t, open, open + STEP);
        if (p == 0) c.low = BASE - WICK;
        return c;
    }
    double open = BASE + (CYCLE - p) * STEP;
    Candle c = make_candle(t, open, open - STEP);
    if (p == CYCLE / 2) c.high = BASE + 6 * STEP + WICK;
    return c;
}

inline std::vector<Candle> zigzag_days(int64_t first_day, int num_days) {
    std::vector<Candle> out;
    out.reserve(static_cast<size_t>(num_days) * CANDLES_PER_DAY);
    for (int d = 0; d < num_days; ++d) {
        for (int k = 0; k < CANDLES_PER_DAY; ++k) out.push_back(zigzag_candle(first_day + d, k));
    }
    return out;
}

// Every candle flat at `price`: no bias, no pivots, no signals.
inline std::vector<Candle> flat_days(int64_t first_day, int num_days, double price = BASE) {
    std::vector<Candle> out;
    for (int d = 0; d < num_days; ++d) {
        for (int k = 0; k < CANDLES_PER_DAY; ++k) {
            int64_t t = time_utils::day_start(first_day + d) + k * STEP_SEC;
            out.push_back(make_candle(t, price, price));
        }
    }
    return out;
}

inline std::unique_ptr<CandleSeries> vector_series(std::vector<Candle> candles) {
    return std::make_unique<VectorCandleSeries>(std::move(candles));
}

inline CandleStore zigzag_store(const std::vector<std::string>& symbols, int num_days = 30) {
    CandleStore store;
    for (const auto& s : symbols) store.add(s, vector_series(zigzag_days(base_day(), num_days)));
    return store;
}

// Settings tuned to the zig-zag market (pivot window 2, 5-minute slots).
inline Settings zigzag_settings() {
    Settings s;
    s.pivot_window = 2;
    s.step_minutes = STEP_MINUTES;
    return s;
}

}  // namespace candle_test_helpers
