#pragma once

#include "backtest/run_context.hpp"
#include "candles/candle_store.hpp"
#include "selection/symbol_selector.hpp"
#include "signals/outcome_evaluator.hpp"
#include "signals/signal_generator.hpp"
#include "time_utils.hpp"

#include <cstdint>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// GradedSignal — a signal and how it resolved
// ---------------------------------------------------------------------------
struct GradedSignal {
    std::string symbol;
    Signal signal;
    Outcome outcome = Outcome::NO_DATA;
};

// ---------------------------------------------------------------------------
// SymbolDayResult — one traded symbol on one prediction day
// ---------------------------------------------------------------------------
struct SymbolDayResult {
    std::string symbol;
    OutcomeTally tally;
};

// ---------------------------------------------------------------------------
// DayResult — result of a single reference day
// ---------------------------------------------------------------------------
struct DayResult {
    int64_t reference_day = 0;
    int64_t prediction_day = 0;
    std::vector<std::string> selected;
    bool selection_fallback = false;   // no symbol qualified; full universe traded
    std::vector<SymbolDayResult> symbols;
    std::vector<GradedSignal> signals;
    OutcomeTally totals;

    double accuracy() const { return totals.accuracy(); }
    bool has_evaluated() const { return totals.evaluated() > 0; }
    bool meets(double target) const { return has_evaluated() && accuracy() >= target; }
};

// ---------------------------------------------------------------------------
// BacktestResult — ordered day results and their aggregate
// ---------------------------------------------------------------------------
struct BacktestResult {
    std::vector<DayResult> days;
    OutcomeTally totals;
    int active_days = 0;          // days with at least one evaluated signal
    double mean_accuracy = 0.0;   // mean of daily accuracy over active days
};

// ---------------------------------------------------------------------------
// BacktestRunner — selection -> generation -> grading, day by day
// ---------------------------------------------------------------------------
class BacktestRunner {
public:
    explicit BacktestRunner(const CandleStore& store) : store_(store) {}

    // One reference day: select on data <= ref_day, trade ref_day + 1.
    // Does not touch the caches; callers own invalidation.
    DayResult evaluate_day(RunContext& ctx, int64_t ref_day) const {
        const Settings& s = ctx.settings();
        DayResult day{};
        day.reference_day = ref_day;
        day.prediction_day = ref_day + 1;

        auto selection = SymbolSelector{}.select(ctx, store_, ref_day);
        day.selected = selection.selected;
        if (day.selected.empty()) {
            day.selected = store_.symbols();
            day.selection_fallback = true;
        }

        int64_t pred_start = time_utils::day_start(day.prediction_day);
        int64_t pred_end = pred_start + static_cast<int64_t>(s.horizon_hours) *
                                            time_utils::SEC_PER_HOUR;
        SignalGenerator generator(s);
        OutcomeEvaluator evaluator(s.step_minutes,
                                   time_utils::day_start(day.prediction_day + 1));

        for (const auto& symbol : day.selected) {
            const CandleSeries& series = store_.get(symbol);
            const LevelSet& levels = ctx.levels(symbol, series, ref_day);
            const DirectionMap& map = ctx.direction_map(symbol, series, day.prediction_day);

            SymbolDayResult sym{};
            sym.symbol = symbol;
            for (const auto& sig : generator.generate(series, pred_start, pred_end, levels, map)) {
                Outcome o = evaluator.grade(series, sig.time, sig.direction);
                sym.tally.add(o);
                day.signals.push_back(GradedSignal{symbol, sig, o});
            }
            day.totals += sym.tally;
            day.symbols.push_back(std::move(sym));
        }
        return day;
    }

    // Reference days start_day, start_day - 1, ..., start_day - num_days + 1.
    BacktestResult run(RunContext& ctx, int64_t start_day, int num_days) const {
        std::vector<int64_t> ref_days;
        for (int offset = 0; offset < num_days; ++offset) ref_days.push_back(start_day - offset);
        return run_days(ctx, ref_days);
    }

    BacktestResult run_days(RunContext& ctx, const std::vector<int64_t>& ref_days) const {
        std::vector<DayResult> days;
        days.reserve(ref_days.size());
        for (int64_t ref_day : ref_days) {
            ctx.invalidate();
            days.push_back(evaluate_day(ctx, ref_day));
        }
        return aggregate(std::move(days));
    }

    static BacktestResult aggregate(std::vector<DayResult> days) {
        BacktestResult agg{};
        double acc_sum = 0.0;
        for (const auto& day : days) {
            agg.totals += day.totals;
            if (!day.has_evaluated()) continue;
            ++agg.active_days;
            acc_sum += day.accuracy();
        }
        if (agg.active_days > 0) agg.mean_accuracy = acc_sum / agg.active_days;
        agg.days = std::move(days);
        return agg;
    }

    const CandleStore& store() const { return store_; }

private:
    const CandleStore& store_;
};
