#pragma once

#include "backtest/backtest_runner.hpp"
#include "backtest/run_context.hpp"
#include "backtest/settings.hpp"
#include "backtest/success_criteria.hpp"
#include "calibration/parameter_calibrator.hpp"
#include "calibration/parameter_grid.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// CalibrationAttempt — one reset of the adaptive loop
// ---------------------------------------------------------------------------
struct CalibrationAttempt {
    int reset = 0;                 // 1-based
    int64_t failing_day = 0;       // reference day that missed the target
    int64_t calibration_day = 0;   // failing_day - 1
    double failing_accuracy = 0.0;
    int failing_evaluated = 0;
    CalibrationResult calibration;
};

// ---------------------------------------------------------------------------
// ConsistencyResult — outcome of an autotune session
// ---------------------------------------------------------------------------
struct ConsistencyResult {
    BacktestResult run;                       // last (possibly partial) pass
    Settings settings;                        // settings of that pass
    bool consistent = false;
    int resets = 0;
    std::vector<CalibrationAttempt> attempts;
    std::string source = "adaptive";          // "grid_search" | "adaptive"
};

// ---------------------------------------------------------------------------
// ConsistencyOrchestrator — replays the day sequence, recalibrating on the
// day before the first failing day and restarting, until every day meets
// the target or the reset budget runs out.
// ---------------------------------------------------------------------------
class ConsistencyOrchestrator {
public:
    explicit ConsistencyOrchestrator(const BacktestRunner& runner,
                                     size_t max_candidates_per_calibration = 0)
        : runner_(runner), max_candidates_(max_candidates_per_calibration) {}

    ConsistencyResult run(const Settings& initial, int64_t start_day, int num_days,
                          double target, int max_resets) const {
        SuccessCriteria criteria{target};
        ConsistencyResult result{};
        result.settings = initial;

        std::vector<int64_t> ref_days;
        for (int offset = 0; offset < num_days; ++offset) ref_days.push_back(start_day - offset);

        for (;;) {
            RunContext ctx(result.settings);
            std::vector<DayResult> days;
            std::optional<size_t> failing;
            for (size_t i = 0; i < ref_days.size(); ++i) {
                ctx.invalidate();
                days.push_back(runner_.evaluate_day(ctx, ref_days[i]));
                if (!criteria.day_passes(days.back())) {
                    failing = i;
                    break;
                }
            }
            result.run = BacktestRunner::aggregate(std::move(days));

            if (!failing) {
                result.consistent = !ref_days.empty();
                return result;
            }
            if (result.resets >= max_resets) return result;

            const DayResult& bad = result.run.days.back();
            CalibrationAttempt attempt{};
            attempt.reset = result.resets + 1;
            attempt.failing_day = bad.reference_day;
            attempt.calibration_day = bad.reference_day - 1;
            attempt.failing_accuracy = bad.accuracy();
            attempt.failing_evaluated = bad.totals.evaluated();

            ParameterCalibrator calibrator(runner_, max_candidates_);
            attempt.calibration = calibrator.calibrate(
                ParameterGrid::default_calibration(result.settings),
                attempt.calibration_day, target);
            if (attempt.calibration.found) result.settings = attempt.calibration.settings;

            result.attempts.push_back(std::move(attempt));
            ++result.resets;
        }
    }

    // First candidate whose full pass meets the target every day, if any.
    // Each candidate gets a fresh RunContext.
    std::optional<ConsistencyResult> grid_search(const std::vector<Settings>& candidates,
                                                 int64_t start_day, int num_days,
                                                 double target) const {
        SuccessCriteria criteria{target};
        for (const auto& candidate : candidates) {
            if (candidate.problem()) continue;
            RunContext ctx(candidate);
            BacktestResult pass = runner_.run(ctx, start_day, num_days);
            if (!criteria.evaluate(pass).passed) continue;

            ConsistencyResult result{};
            result.run = std::move(pass);
            result.settings = candidate;
            result.consistent = true;
            result.source = "grid_search";
            return result;
        }
        return std::nullopt;
    }

    // The base settings followed by a few combinations that trade fewer,
    // stronger setups.
    static std::vector<Settings> curated_candidates(const Settings& base) {
        return {
            base,
            base.with([](Settings& s) {
                s.predominance_fraction = 0.70;
                s.confluence_steps = 3;
                s.min_zone_strength = 2;
            }),
            base.with([](Settings& s) {
                s.predominance_fraction = 0.65;
                s.predominance_days = 7;
                s.zone_tolerance_pct = 0.20;
                s.min_hist_accuracy = 0.60;
            }),
            base.with([](Settings& s) {
                s.pivot_window = 2;
                s.cluster_tolerance_pct = 0.10;
                s.volatility_tolerance = 0.5;
                s.top_k = 5;
            }),
            base.with([](Settings& s) {
                s.predominance_fraction = 0.70;
                s.min_pred_occurrences = 2;
                s.min_hist_signals = 1;
                s.confluence_steps = 3;
            }),
        };
    }

private:
    const BacktestRunner& runner_;
    size_t max_candidates_;
};

// Curated grid search over the whole window; no adaptive recalibration.
inline std::optional<ConsistencyResult> consistency_grid_search(
        const BacktestRunner& runner, const std::vector<Settings>& candidates,
        int64_t start_day, int num_days, double target) {
    return ConsistencyOrchestrator(runner).grid_search(candidates, start_day, num_days, target);
}
