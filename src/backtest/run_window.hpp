#pragma once

#include "candles/candle_store.hpp"
#include "time_utils.hpp"

#include <algorithm>
#include <cstdint>
#include <optional>
#include <vector>

namespace run_window {

constexpr int DEFAULT_DAYS = 10;
constexpr int PREFERRED_DAY_OF_MONTH = 14;

// Most recent day falling on the 14th whose following day has data; else the
// second-to-last day with data. nullopt with fewer than two days.
inline std::optional<int64_t> default_start_day(const CandleStore& store) {
    std::vector<int64_t> days = store.all_days();
    if (days.size() < 2) return std::nullopt;
    for (auto it = days.rbegin(); it != days.rend(); ++it) {
        if (time_utils::day_of_month(*it) == PREFERRED_DAY_OF_MONTH &&
            std::binary_search(days.begin(), days.end(), *it + 1))
            return *it;
    }
    return days[days.size() - 2];
}

// Days with data at or before `start_day`.
inline int days_available(const CandleStore& store, int64_t start_day) {
    int n = 0;
    for (int64_t d : store.all_days()) {
        if (d <= start_day) ++n;
    }
    return n;
}

}  // namespace run_window
