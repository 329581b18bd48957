#pragma once

#include <algorithm>
#include <cmath>
#include <vector>

// ---------------------------------------------------------------------------
// Level — representative zone price and the number of pivots behind it
// ---------------------------------------------------------------------------
struct Level {
    double price = 0.0;
    int strength = 0;
};

// ---------------------------------------------------------------------------
// LevelClusterer — greedy single pass over ascending prices.
//
// A price joins the open cluster while its distance to the cluster's running
// mean is within `tolerance_pct` percent of that mean. The result depends
// only on the multiset of inputs, never on their order.
// ---------------------------------------------------------------------------
class LevelClusterer {
public:
    explicit LevelClusterer(double tolerance_pct) : tol_pct_(tolerance_pct) {}

    std::vector<Level> cluster(std::vector<double> prices) const {
        std::vector<Level> levels;
        if (prices.empty()) return levels;
        std::sort(prices.begin(), prices.end());

        double sum = prices[0];
        int count = 1;
        for (size_t i = 1; i < prices.size(); ++i) {
            double mean = sum / count;
            double dist_pct = mean != 0.0 ? std::abs(prices[i] - mean) / std::abs(mean) * 100.0
                                          : std::abs(prices[i] - mean) * 100.0;
            if (dist_pct <= tol_pct_) {
                sum += prices[i];
                ++count;
            } else {
                levels.push_back({sum / count, count});
                sum = prices[i];
                count = 1;
            }
        }
        levels.push_back({sum / count, count});
        return levels;
    }

    double tolerance_pct() const { return tol_pct_; }

private:
    double tol_pct_;
};

// ---------------------------------------------------------------------------
// LevelSet — clustered supports and resistances for one (symbol, day)
// ---------------------------------------------------------------------------
struct LevelSet {
    std::vector<Level> supports;
    std::vector<Level> resistances;
    // Mean (high - low) / close in percent over the candles behind the levels.
    double mean_range_pct = 0.0;
};
