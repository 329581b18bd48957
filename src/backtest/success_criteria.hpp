#pragma once

#include "backtest/backtest_runner.hpp"

#include <cstddef>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// Assessment — result of a consistency evaluation over a run
// ---------------------------------------------------------------------------
struct Assessment {
    bool passed = false;
    int days_total = 0;
    int days_passed = 0;
    int days_without_signals = 0;
    int first_failing_index = -1;     // index into BacktestResult::days
    double actual_mean_accuracy = 0.0;

    std::string decision = "NOT CONSISTENT";
};

// ---------------------------------------------------------------------------
// SuccessCriteria — every day must grade at least one signal and reach the
// target accuracy for the run to count as consistent
// ---------------------------------------------------------------------------
struct SuccessCriteria {
    double target_accuracy = 0.70;

    bool day_passes(const DayResult& day) const {
        return day.meets(target_accuracy);
    }

    Assessment evaluate(const BacktestResult& result) const {
        Assessment a{};
        a.days_total = static_cast<int>(result.days.size());
        a.actual_mean_accuracy = result.mean_accuracy;
        for (size_t i = 0; i < result.days.size(); ++i) {
            const auto& day = result.days[i];
            if (!day.has_evaluated()) ++a.days_without_signals;
            if (day_passes(day)) {
                ++a.days_passed;
            } else if (a.first_failing_index < 0) {
                a.first_failing_index = static_cast<int>(i);
            }
        }
        a.passed = a.days_total > 0 && a.days_passed == a.days_total;
        a.decision = a.passed ? "CONSISTENT" : "NOT CONSISTENT";
        return a;
    }
};
