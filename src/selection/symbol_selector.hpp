#pragma once

#include "backtest/run_context.hpp"
#include "candles/candle_series.hpp"
#include "candles/candle_store.hpp"
#include "signals/outcome_evaluator.hpp"
#include "signals/signal_generator.hpp"
#include "time_utils.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// SymbolHistory — one symbol's replayed trailing performance
// ---------------------------------------------------------------------------
struct SymbolHistory {
    std::string symbol;
    OutcomeTally tally;
    bool qualified = false;
};

struct SelectionReport {
    std::vector<SymbolHistory> histories;   // every symbol, lexicographic
    std::vector<std::string> selected;      // ranked, at most top_k; may be empty
};

namespace trend_filter {

constexpr int SMA_PERIOD = 20;

// Mean close of the SMA_PERIOD candles ending at `last` (inclusive).
inline double sma(const CandleSeries& series, size_t last) {
    double sum = 0.0;
    for (size_t i = last + 1 - SMA_PERIOD; i <= last; ++i) sum += series.at(i).close;
    return sum / SMA_PERIOD;
}

// The prior candle must lean against the trade and the SMA slope must not:
// CALL needs a down prior candle and slope >= 0, PUT an up one and slope <= 0.
inline bool accept(const CandleSeries& series, size_t idx, Direction d) {
    if (idx < static_cast<size_t>(SMA_PERIOD) + 1) return false;
    Candle prev = series.at(idx - 1);
    double slope = sma(series, idx - 1) - sma(series, idx - 2);
    if (d == Direction::CALL) return prev.is_down() && slope >= 0.0;
    return prev.is_up() && slope <= 0.0;
}

}  // namespace trend_filter

// ---------------------------------------------------------------------------
// SymbolSelector — ranks symbols by their own trailing accuracy.
//
// Each symbol is replayed over the `selection_lookback_hours` ending at the
// close of the reference day. Every replayed day uses levels from the day
// before it and a direction map built from days before it, so the replay
// never sees data after the candle being graded.
// ---------------------------------------------------------------------------
class SymbolSelector {
public:
    SymbolHistory replay(RunContext& ctx, const std::string& symbol,
                         const CandleSeries& series, int64_t ref_day) const {
        const Settings& s = ctx.settings();
        SymbolHistory hist;
        hist.symbol = symbol;

        int64_t end = time_utils::day_start(ref_day + 1);
        int64_t start = end - static_cast<int64_t>(s.selection_lookback_hours) *
                                  time_utils::SEC_PER_HOUR;

        SignalGenerator generator(s);
        OutcomeEvaluator evaluator(s.step_minutes, end);

        for (int64_t day = time_utils::day_of(start); day <= ref_day; ++day) {
            if (!series.has_day(day)) continue;
            int64_t w0 = std::max(start, time_utils::day_start(day));
            int64_t w1 = std::min(end, time_utils::day_start(day + 1));

            const LevelSet& levels = ctx.levels(symbol, series, day - 1);
            const DirectionMap& map = ctx.direction_map(symbol, series, day);
            auto signals = generator.generate(series, w0, w1, levels, map,
                                              trend_filter::accept);
            hist.tally += evaluator.grade_all(series, signals);
        }

        hist.qualified = hist.tally.evaluated() >= s.min_hist_signals &&
                         hist.tally.accuracy() >= s.min_hist_accuracy;
        return hist;
    }

    SelectionReport select(RunContext& ctx, const CandleStore& store, int64_t ref_day) const {
        SelectionReport report;
        for (const auto& symbol : store.symbols()) {
            report.histories.push_back(replay(ctx, symbol, store.get(symbol), ref_day));
        }
        report.selected = rank(report.histories, ctx.settings().top_k);
        return report;
    }

    // Qualified symbols by accuracy, then evaluated count, at most top_k.
    // Input order is the final tie-break.
    static std::vector<std::string> rank(const std::vector<SymbolHistory>& histories,
                                         int top_k) {
        std::vector<SymbolHistory> ranked;
        for (const auto& h : histories) {
            if (h.qualified) ranked.push_back(h);
        }
        std::stable_sort(ranked.begin(), ranked.end(),
                         [](const SymbolHistory& a, const SymbolHistory& b) {
                             if (a.tally.accuracy() != b.tally.accuracy())
                                 return a.tally.accuracy() > b.tally.accuracy();
                             return a.tally.evaluated() > b.tally.evaluated();
                         });

        std::vector<std::string> selected;
        size_t k = std::min(ranked.size(), static_cast<size_t>(std::max(top_k, 0)));
        for (size_t i = 0; i < k; ++i) selected.push_back(ranked[i].symbol);
        return selected;
    }
};
