#pragma once

#include "backtest/backtest_runner.hpp"
#include "backtest/settings.hpp"
#include "calibration/consistency_orchestrator.hpp"
#include "time_utils.hpp"

#include <sstream>
#include <string>
#include <vector>

namespace backtest_io {

// Escape a string for JSON output
inline std::string json_escape(const std::string& s) {
    std::string result;
    for (char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n"; break;
            default:   result += c;
        }
    }
    return result;
}

inline void write_tally(std::ostringstream& ss, const OutcomeTally& t) {
    ss << "\"signals\":" << t.signals;
    ss << ",\"wins_g0\":" << t.wins_g0;
    ss << ",\"wins_g1\":" << t.wins_g1;
    ss << ",\"losses\":" << t.losses;
    ss << ",\"no_data\":" << t.no_data;
    ss << ",\"accuracy\":" << t.accuracy();
}

inline std::string to_json(const Settings& s) {
    std::ostringstream ss;
    ss << "{";
    const auto& fields = settings_fields::all();
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) ss << ",";
        ss << "\"" << fields[i].key << "\":" << settings_fields::format_value(fields[i], s);
    }
    ss << "}";
    return ss.str();
}

inline std::string to_json(const DayResult& d) {
    std::ostringstream ss;
    ss << "{";
    ss << "\"reference_day\":\"" << time_utils::format_day(d.reference_day) << "\"";
    ss << ",\"prediction_day\":\"" << time_utils::format_day(d.prediction_day) << "\"";
    ss << ",\"selection_fallback\":" << (d.selection_fallback ? "true" : "false");

    ss << ",\"selected\":[";
    for (size_t i = 0; i < d.selected.size(); ++i) {
        if (i > 0) ss << ",";
        ss << "\"" << json_escape(d.selected[i]) << "\"";
    }
    ss << "],";
    write_tally(ss, d.totals);

    ss << ",\"symbols\":[";
    for (size_t i = 0; i < d.symbols.size(); ++i) {
        if (i > 0) ss << ",";
        ss << "{\"symbol\":\"" << json_escape(d.symbols[i].symbol) << "\",";
        write_tally(ss, d.symbols[i].tally);
        ss << "}";
    }
    ss << "]";

    ss << ",\"trades\":[";
    for (size_t i = 0; i < d.signals.size(); ++i) {
        if (i > 0) ss << ",";
        const auto& g = d.signals[i];
        ss << "{";
        ss << "\"symbol\":\"" << json_escape(g.symbol) << "\"";
        ss << ",\"time\":" << g.signal.time;
        ss << ",\"direction\":\"" << to_string(g.signal.direction) << "\"";
        ss << ",\"zone\":\"" << to_string(g.signal.zone) << "\"";
        ss << ",\"level\":" << g.signal.level;
        ss << ",\"outcome\":\"" << to_string(g.outcome) << "\"";
        ss << "}";
    }
    ss << "]";

    ss << "}";
    return ss.str();
}

// Serialize a BacktestResult to JSON
inline std::string to_json(const BacktestResult& result) {
    std::ostringstream ss;
    ss << "{";
    ss << "\"active_days\":" << result.active_days;
    ss << ",\"mean_accuracy\":" << result.mean_accuracy << ",";
    write_tally(ss, result.totals);

    ss << ",\"days\":[";
    for (size_t i = 0; i < result.days.size(); ++i) {
        if (i > 0) ss << ",";
        ss << to_json(result.days[i]);
    }
    ss << "]";

    ss << "}";
    return ss.str();
}

// Serialize an autotune session with its calibration history
inline std::string to_json(const ConsistencyResult& result) {
    std::ostringstream ss;
    ss << "{";
    ss << "\"consistent\":" << (result.consistent ? "true" : "false");
    ss << ",\"source\":\"" << json_escape(result.source) << "\"";
    ss << ",\"resets\":" << result.resets;
    ss << ",\"settings\":" << to_json(result.settings);

    ss << ",\"attempts\":[";
    for (size_t i = 0; i < result.attempts.size(); ++i) {
        if (i > 0) ss << ",";
        const auto& a = result.attempts[i];
        ss << "{";
        ss << "\"reset\":" << a.reset;
        ss << ",\"failing_day\":\"" << time_utils::format_day(a.failing_day) << "\"";
        ss << ",\"calibration_day\":\"" << time_utils::format_day(a.calibration_day) << "\"";
        ss << ",\"failing_accuracy\":" << a.failing_accuracy;
        ss << ",\"failing_evaluated\":" << a.failing_evaluated;
        ss << ",\"candidates_tried\":" << a.calibration.candidates_tried;
        ss << ",\"met_target\":" << (a.calibration.met_target ? "true" : "false");
        ss << ",\"calibration_accuracy\":" << a.calibration.accuracy;
        ss << "}";
    }
    ss << "]";

    ss << ",\"run\":" << to_json(result.run);
    ss << "}";
    return ss.str();
}

}  // namespace backtest_io
