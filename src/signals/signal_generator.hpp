#pragma once

#include "backtest/settings.hpp"
#include "bias/direction_map.hpp"
#include "candles/candle.hpp"
#include "candles/candle_series.hpp"
#include "levels/level_clusterer.hpp"
#include "signals/zone_test.hpp"
#include "time_utils.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

// ---------------------------------------------------------------------------
// Signal — an entry at candle time `time`, graded later on that candle
// ---------------------------------------------------------------------------
struct Signal {
    int64_t time = 0;
    Direction direction = Direction::CALL;
    Zone zone = Zone::NONE;
    double level = 0.0;
};

// Extra gate applied after a candidate passes zone and confluence checks.
// Receives the series, the candidate candle index and the direction.
using SignalFilter = std::function<bool(const CandleSeries&, size_t, Direction)>;

// ---------------------------------------------------------------------------
// SignalGenerator — zone test + temporal confluence, per symbol and window
// ---------------------------------------------------------------------------
class SignalGenerator {
public:
    explicit SignalGenerator(const Settings& settings) : s_(settings) {}

    // Direction agreed by all `confluence_steps` slots starting at `ts`, or
    // nullopt if any slot is missing or the slots disagree.
    std::optional<Direction> confluence(const DirectionMap& map, int64_t ts) const {
        std::optional<Direction> agreed;
        for (int k = 0; k < s_.confluence_steps; ++k) {
            int64_t at = ts + static_cast<int64_t>(k) * s_.step_minutes * time_utils::SEC_PER_MIN;
            auto d = map.at(time_utils::slot_of(at, s_.step_minutes));
            if (!d) return std::nullopt;
            if (agreed && *agreed != *d) return std::nullopt;
            agreed = d;
        }
        return agreed;
    }

    // Signals for candles with time in [start, end), in time order.
    std::vector<Signal> generate(const CandleSeries& series, int64_t start, int64_t end,
                                 const LevelSet& levels, const DirectionMap& map,
                                 const SignalFilter& filter = nullptr) const {
        std::vector<Signal> out;
        if (map.empty()) return out;
        ZoneBand band = ZoneBand::from_settings(s_, levels.mean_range_pct);

        auto [first, last] = series.range_indices(start, end);
        for (size_t i = first; i < last; ++i) {
            int64_t t = series.time_at(i);

            auto prev = series.previous(t);
            if (!prev) continue;

            ZoneHit hit = zone_test::classify(prev->close, levels, band, s_.min_zone_strength);
            if (hit.zone == Zone::NONE) continue;

            auto bias = confluence(map, t);
            if (!bias) continue;

            bool call = *bias == Direction::CALL && hit.zone == Zone::SUPPORT;
            bool put = *bias == Direction::PUT && hit.zone == Zone::RESISTANCE;
            if (!call && !put) continue;

            if (filter && !filter(series, i, *bias)) continue;
            out.push_back(Signal{t, *bias, hit.zone, hit.level});
        }
        return out;
    }

private:
    Settings s_;
};
