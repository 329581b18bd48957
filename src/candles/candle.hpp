#pragma once

#include <cstdint>

// ---------------------------------------------------------------------------
// Candle — one OHLC record, keyed by its UTC open time (epoch seconds)
// ---------------------------------------------------------------------------
struct Candle {
    int64_t time = 0;
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;

    bool is_up() const { return close > open; }
    bool is_down() const { return close < open; }
};

// ---------------------------------------------------------------------------
// Direction — trade direction of a signal or a time-of-day bias
// ---------------------------------------------------------------------------
enum class Direction { CALL, PUT };

inline const char* to_string(Direction d) {
    return d == Direction::CALL ? "CALL" : "PUT";
}

// True when the candle closed in favour of the direction.
inline bool favours(const Candle& c, Direction d) {
    return d == Direction::CALL ? c.close > c.open : c.close < c.open;
}
