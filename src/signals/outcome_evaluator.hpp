#pragma once

#include "candles/candle.hpp"
#include "candles/candle_series.hpp"
#include "signals/signal_generator.hpp"
#include "time_utils.hpp"

#include <cstdint>
#include <limits>
#include <optional>
#include <vector>

enum class Outcome { WIN_G0, WIN_G1, LOSS, NO_DATA };

inline const char* to_string(Outcome o) {
    switch (o) {
        case Outcome::WIN_G0:  return "WIN_G0";
        case Outcome::WIN_G1:  return "WIN_G1";
        case Outcome::LOSS:    return "LOSS";
        default:               return "NO_DATA";
    }
}

inline bool is_win(Outcome o) { return o == Outcome::WIN_G0 || o == Outcome::WIN_G1; }

// ---------------------------------------------------------------------------
// OutcomeTally — win/loss counts; NO_DATA is tracked but never graded
// ---------------------------------------------------------------------------
struct OutcomeTally {
    int signals = 0;
    int wins_g0 = 0;
    int wins_g1 = 0;
    int losses = 0;
    int no_data = 0;

    int wins() const { return wins_g0 + wins_g1; }
    int evaluated() const { return wins() + losses; }

    double accuracy() const {
        int n = evaluated();
        return n > 0 ? static_cast<double>(wins()) / static_cast<double>(n) : 0.0;
    }

    void add(Outcome o) {
        ++signals;
        switch (o) {
            case Outcome::WIN_G0:  ++wins_g0; break;
            case Outcome::WIN_G1:  ++wins_g1; break;
            case Outcome::LOSS:    ++losses; break;
            case Outcome::NO_DATA: ++no_data; break;
        }
    }

    OutcomeTally& operator+=(const OutcomeTally& o) {
        signals += o.signals;
        wins_g0 += o.wins_g0;
        wins_g1 += o.wins_g1;
        losses += o.losses;
        no_data += o.no_data;
        return *this;
    }
};

// ---------------------------------------------------------------------------
// OutcomeEvaluator — grace rule: the signal candle (G0), then one more
// candle `step_minutes` later (G1). A missing G1 candle is a loss.
// Candles at or after `data_end` are treated as absent.
// ---------------------------------------------------------------------------
class OutcomeEvaluator {
public:
    explicit OutcomeEvaluator(int step_minutes,
                              int64_t data_end = std::numeric_limits<int64_t>::max())
        : step_s_(static_cast<int64_t>(step_minutes) * time_utils::SEC_PER_MIN),
          data_end_(data_end) {}

    Outcome grade(const CandleSeries& series, int64_t ts, Direction d) const {
        auto g0 = ts < data_end_ ? series.at_time(ts) : std::nullopt;
        if (!g0) return Outcome::NO_DATA;
        if (favours(*g0, d)) return Outcome::WIN_G0;

        int64_t next = ts + step_s_;
        auto g1 = next < data_end_ ? series.at_time(next) : std::nullopt;
        if (!g1) return Outcome::LOSS;
        return favours(*g1, d) ? Outcome::WIN_G1 : Outcome::LOSS;
    }

    OutcomeTally grade_all(const CandleSeries& series, const std::vector<Signal>& signals) const {
        OutcomeTally tally;
        for (const auto& sig : signals) tally.add(grade(series, sig.time, sig.direction));
        return tally;
    }

private:
    int64_t step_s_;
    int64_t data_end_;
};
