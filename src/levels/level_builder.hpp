#pragma once

#include "backtest/settings.hpp"
#include "candles/candle_series.hpp"
#include "levels/level_clusterer.hpp"
#include "levels/pivot_detector.hpp"
#include "time_utils.hpp"

#include <cstdint>
#include <utility>
#include <vector>

namespace level_builder {

// Support/resistance levels for `ref_day` from the last `sr_lookback_days`
// days with data up to and including `ref_day`. Reads nothing after it.
inline LevelSet build(const CandleSeries& series, int64_t ref_day, const Settings& s) {
    LevelSet out;
    auto days = series.days_before(ref_day + 1, s.sr_lookback_days);
    if (days.empty()) return out;

    auto candles = series.slice(time_utils::day_start(days.front()),
                                time_utils::day_start(ref_day + 1));
    if (candles.empty()) return out;

    auto pivots = PivotDetector(s.pivot_window).detect(candles);
    LevelClusterer clusterer(s.cluster_tolerance_pct);
    out.supports = clusterer.cluster(std::move(pivots.supports));
    out.resistances = clusterer.cluster(std::move(pivots.resistances));

    double sum = 0.0;
    int n = 0;
    for (const auto& c : candles) {
        if (c.close == 0.0) continue;
        sum += (c.high - c.low) / c.close * 100.0;
        ++n;
    }
    if (n > 0) out.mean_range_pct = sum / n;
    return out;
}

}  // namespace level_builder
