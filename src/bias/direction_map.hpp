#pragma once

#include "candles/candle.hpp"
#include "candles/candle_series.hpp"
#include "time_utils.hpp"

#include <algorithm>
#include <cstdint>
#include <map>
#include <optional>
#include <vector>

// ---------------------------------------------------------------------------
// DirectionMap — time-of-day slot (minute of day) -> predominant direction.
// A missing slot means "no reliable bias".
// ---------------------------------------------------------------------------
class DirectionMap {
public:
    void set(int slot, Direction d) { slots_[slot] = d; }

    std::optional<Direction> at(int slot) const {
        auto it = slots_.find(slot);
        if (it == slots_.end()) return std::nullopt;
        return it->second;
    }

    bool contains(int slot) const { return slots_.count(slot) > 0; }
    size_t size() const { return slots_.size(); }
    bool empty() const { return slots_.empty(); }
    const std::map<int, Direction>& slots() const { return slots_; }

private:
    std::map<int, Direction> slots_;
};

// ---------------------------------------------------------------------------
// DirectionMapBuilder — counts up/down closes per slot over a set of days.
//
// Flat candles (open == close) are ignored. A slot gets a direction when it
// has at least `min_occurrences` samples and the majority side's fraction is
// >= `threshold`. Equal up/down counts resolve to TIE_DIRECTION.
// ---------------------------------------------------------------------------
class DirectionMapBuilder {
public:
    static constexpr Direction TIE_DIRECTION = Direction::CALL;

    struct SlotCount {
        int up = 0;
        int down = 0;
    };

    DirectionMapBuilder(int step_minutes, int min_occurrences, double threshold)
        : step_minutes_(step_minutes), min_occurrences_(min_occurrences),
          threshold_(threshold) {}

    std::map<int, SlotCount> count(const CandleSeries& series,
                                   const std::vector<int64_t>& days) const {
        std::map<int, SlotCount> counts;
        for (int64_t day : days) {
            int64_t start = time_utils::day_start(day);
            auto [first, last] = series.range_indices(start, start + time_utils::SEC_PER_DAY);
            for (size_t i = first; i < last; ++i) {
                Candle c = series.at(i);
                if (c.open == c.close) continue;
                auto& sc = counts[time_utils::slot_of(c.time, step_minutes_)];
                if (c.close > c.open) ++sc.up;
                else ++sc.down;
            }
        }
        return counts;
    }

    DirectionMap build(const CandleSeries& series, const std::vector<int64_t>& days) const {
        DirectionMap map;
        for (const auto& [slot, sc] : count(series, days)) {
            int total = sc.up + sc.down;
            if (total < min_occurrences_) continue;
            Direction majority = sc.up > sc.down   ? Direction::CALL
                                 : sc.down > sc.up ? Direction::PUT
                                                   : TIE_DIRECTION;
            int majority_count = std::max(sc.up, sc.down);
            double fraction = static_cast<double>(majority_count) / static_cast<double>(total);
            if (fraction >= threshold_) map.set(slot, majority);
        }
        return map;
    }

private:
    int step_minutes_;
    int min_occurrences_;
    double threshold_;
};
