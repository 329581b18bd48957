#pragma once

#include "candles/candle.hpp"

#include <algorithm>
#include <stdexcept>
#include <vector>

// ---------------------------------------------------------------------------
// Pivots — raw extrema prices found in a candle slice
// ---------------------------------------------------------------------------
struct Pivots {
    std::vector<double> resistances;  // pivot highs
    std::vector<double> supports;     // pivot lows
};

// ---------------------------------------------------------------------------
// PivotDetector — local extrema over a symmetric window of `w` candles.
//
// Index i is a resistance pivot when high[i] is strictly above every high in
// [i-w, i) and (i, i+w]; a support pivot when low[i] is strictly below every
// low there. The first and last w candles are never evaluated.
// ---------------------------------------------------------------------------
class PivotDetector {
public:
    explicit PivotDetector(int half_window) : w_(half_window) {
        if (w_ < 1) throw std::invalid_argument("PivotDetector: half window must be >= 1");
    }

    Pivots detect(const std::vector<Candle>& candles) const {
        Pivots out;
        int n = static_cast<int>(candles.size());
        for (int i = w_; i + w_ < n; ++i) {
            bool is_high = true;
            bool is_low = true;
            for (int j = i - w_; j <= i + w_; ++j) {
                if (j == i) continue;
                if (candles[j].high >= candles[i].high) is_high = false;
                if (candles[j].low <= candles[i].low) is_low = false;
                if (!is_high && !is_low) break;
            }
            if (is_high) out.resistances.push_back(candles[i].high);
            if (is_low) out.supports.push_back(candles[i].low);
        }
        return out;
    }

    int half_window() const { return w_; }

private:
    int w_;
};
