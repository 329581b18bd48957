#pragma once

#include "backtest/backtest_runner.hpp"
#include "backtest/run_context.hpp"
#include "backtest/settings.hpp"
#include "calibration/parameter_grid.hpp"

#include <cstddef>
#include <cstdint>

// ---------------------------------------------------------------------------
// CalibrationResult — winning (or best seen) candidate of one calibration
// ---------------------------------------------------------------------------
struct CalibrationResult {
    Settings settings;
    double accuracy = 0.0;
    int evaluated = 0;
    bool met_target = false;
    size_t candidates_tried = 0;
    bool found = false;   // false only when every candidate was unusable
};

// ---------------------------------------------------------------------------
// ParameterCalibrator — walks a ParameterGrid in order and stops at the
// first candidate whose single-day pass reaches the target.
//
// Each candidate runs in its own RunContext, so no cached level or map
// computed under one candidate is visible to another.
// ---------------------------------------------------------------------------
class ParameterCalibrator {
public:
    // max_candidates == 0 walks the whole grid.
    explicit ParameterCalibrator(const BacktestRunner& runner, size_t max_candidates = 0)
        : runner_(runner), max_candidates_(max_candidates) {}

    CalibrationResult calibrate(const ParameterGrid& grid, int64_t calib_day,
                                double target) const {
        CalibrationResult best{};
        best.settings = grid.base();

        for (auto it = grid.begin(); it != grid.end(); ++it) {
            if (max_candidates_ > 0 && best.candidates_tried >= max_candidates_) break;
            Settings candidate = *it;
            if (candidate.problem()) continue;
            ++best.candidates_tried;

            RunContext ctx(candidate);
            DayResult day = runner_.evaluate_day(ctx, calib_day);
            int evaluated = day.totals.evaluated();
            double acc = day.accuracy();

            if (day.meets(target)) {
                best.settings = candidate;
                best.accuracy = acc;
                best.evaluated = evaluated;
                best.met_target = true;
                best.found = true;
                return best;
            }
            if (!best.found || better(acc, evaluated, best.accuracy, best.evaluated)) {
                best.settings = candidate;
                best.accuracy = acc;
                best.evaluated = evaluated;
                best.found = true;
            }
        }
        return best;
    }

private:
    // Strictly better only; earlier candidates win ties.
    static bool better(double acc, int evaluated, double best_acc, int best_evaluated) {
        if (acc != best_acc) return acc > best_acc;
        return evaluated > best_evaluated;
    }

    const BacktestRunner& runner_;
    size_t max_candidates_;
};
