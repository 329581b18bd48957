#pragma once

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// Settings — every tunable of the strategy. Treated as a value: a run is
// bound to one instance and adjustments produce a new one (see with()).
// Percent fields are relative distances in percent (0.10 == 0.10%).
// ---------------------------------------------------------------------------
struct Settings {
    // Time-of-day bias
    double predominance_fraction = 0.60;
    int predominance_days = 5;
    int min_pred_occurrences = 3;

    // Support / resistance levels
    int sr_lookback_days = 3;
    int pivot_window = 3;
    double cluster_tolerance_pct = 0.05;
    int min_zone_strength = 1;

    // Zone band
    double zone_tolerance_pct = 0.10;
    double zone_min_pct = 0.0;
    double zone_max_pct = 0.50;
    double volatility_tolerance = 0.0;

    // Signal timing
    int confluence_steps = 2;
    int step_minutes = 5;
    int horizon_hours = 24;

    // Symbol selection
    int selection_lookback_hours = 24;
    int top_k = 3;
    double min_hist_accuracy = 0.55;
    int min_hist_signals = 3;

    // Copy with one adjustment applied.
    template <typename Fn>
    Settings with(Fn&& adjust) const {
        Settings next = *this;
        adjust(next);
        return next;
    }

    // Description of the first unusable value, or nullopt when usable.
    std::optional<std::string> problem() const {
        if (predominance_fraction <= 0.0 || predominance_fraction > 1.0)
            return "predominance_fraction must be in (0, 1]";
        if (predominance_days < 1) return "predominance_days must be >= 1";
        if (min_pred_occurrences < 1) return "min_pred_occurrences must be >= 1";
        if (sr_lookback_days < 1) return "sr_lookback_days must be >= 1";
        if (pivot_window < 1) return "pivot_window must be >= 1";
        if (cluster_tolerance_pct < 0.0) return "cluster_tolerance_pct must be >= 0";
        if (zone_tolerance_pct < 0.0) return "zone_tolerance_pct must be >= 0";
        if (zone_min_pct < 0.0 || zone_max_pct < zone_min_pct)
            return "zone band must satisfy 0 <= zone_min_pct <= zone_max_pct";
        if (volatility_tolerance < 0.0) return "volatility_tolerance must be >= 0";
        if (confluence_steps < 1) return "confluence_steps must be >= 1";
        if (step_minutes < 1 || 1440 % step_minutes != 0) return "step_minutes must divide a day";
        if (horizon_hours < 1 || horizon_hours > 24) return "horizon_hours must be in [1, 24]";
        if (selection_lookback_hours < 1) return "selection_lookback_hours must be >= 1";
        if (top_k < 1) return "top_k must be >= 1";
        if (min_hist_accuracy < 0.0 || min_hist_accuracy > 1.0)
            return "min_hist_accuracy must be in [0, 1]";
        if (min_hist_signals < 0) return "min_hist_signals must be >= 0";
        return std::nullopt;
    }

    void validate() const {
        if (auto p = problem()) throw std::invalid_argument("Settings: " + *p);
    }

    // Hash of the fields that shape support/resistance levels.
    size_t level_hash() const {
        size_t h = 0;
        hash_combine(h, sr_lookback_days);
        hash_combine(h, pivot_window);
        hash_combine(h, cluster_tolerance_pct);
        return h;
    }

    // Hash of the fields that shape a direction map.
    size_t map_hash() const {
        size_t h = 0;
        hash_combine(h, predominance_fraction);
        hash_combine(h, predominance_days);
        hash_combine(h, min_pred_occurrences);
        hash_combine(h, step_minutes);
        return h;
    }

    bool operator==(const Settings& o) const = default;

private:
    template <typename T>
    static void hash_combine(size_t& seed, const T& v) {
        seed ^= std::hash<T>{}(v) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
    }
};

// ---------------------------------------------------------------------------
// settings_fields — named access to every Settings field, shared by the CLI,
// the JSON settings file, the settings dump and the calibration grid.
// ---------------------------------------------------------------------------
namespace settings_fields {

struct Field {
    const char* key;        // JSON key / report name
    const char* option;     // CLI option
    const char* help;
    bool integral;
    std::function<double(const Settings&)> get;
    std::function<void(Settings&, double)> set;
};

// True when v can be stored in an int field without overflow.
inline bool fits_int(double v) {
    if (!std::isfinite(v)) return false;
    double r = std::round(v);
    return r >= static_cast<double>(std::numeric_limits<int>::min()) &&
           r <= static_cast<double>(std::numeric_limits<int>::max());
}

// True when f can hold v: finite, and within int range for integral fields.
inline bool accepts(const Field& f, double v) {
    return f.integral ? fits_int(v) : std::isfinite(v);
}

template <double Settings::*Member>
Field dbl_field(const char* key, const char* option, const char* help) {
    return Field{key, option, help, false,
                 [](const Settings& s) { return s.*Member; },
                 [](Settings& s, double v) { s.*Member = v; }};
}

template <int Settings::*Member>
Field int_field(const char* key, const char* option, const char* help) {
    return Field{key, option, help, true,
                 [](const Settings& s) { return static_cast<double>(s.*Member); },
                 [key](Settings& s, double v) {
                     if (!fits_int(v)) {
                         throw std::out_of_range(std::string("settings field ") + key +
                                                 " out of range");
                     }
                     s.*Member = static_cast<int>(std::lround(v));
                 }};
}

inline const std::vector<Field>& all() {
    static const std::vector<Field> fields = {
        dbl_field<&Settings::predominance_fraction>(
            "predominance_fraction", "--predominance",
            "majority fraction a slot needs to carry a bias"),
        int_field<&Settings::predominance_days>(
            "predominance_days", "--predominance-days",
            "days of history behind the direction map"),
        int_field<&Settings::sr_lookback_days>(
            "sr_lookback_days", "--sr-days",
            "days of history behind support/resistance levels"),
        int_field<&Settings::pivot_window>(
            "pivot_window", "--pivot-window", "candles on each side of a pivot"),
        dbl_field<&Settings::cluster_tolerance_pct>(
            "cluster_tolerance_pct", "--cluster-tol", "level clustering tolerance (%)"),
        dbl_field<&Settings::zone_tolerance_pct>(
            "zone_tolerance_pct", "--zone-tol", "nominal zone distance tolerance (%)"),
        int_field<&Settings::confluence_steps>(
            "confluence_steps", "--confluence-steps", "consecutive slots that must agree"),
        int_field<&Settings::horizon_hours>(
            "horizon_hours", "--horizon-hours",
            "hours of the prediction day that are traded"),
        int_field<&Settings::step_minutes>(
            "step_minutes", "--step-minutes", "slot and grace step (minutes)"),
        int_field<&Settings::selection_lookback_hours>(
            "selection_lookback_hours", "--history-hours",
            "trailing hours replayed for symbol selection"),
        int_field<&Settings::top_k>("top_k", "--top-k", "symbols traded per day"),
        dbl_field<&Settings::min_hist_accuracy>(
            "min_hist_accuracy", "--min-hist-acc",
            "minimum trailing accuracy to be selected"),
        int_field<&Settings::min_hist_signals>(
            "min_hist_signals", "--min-hist-signals",
            "minimum trailing evaluated signals to be selected"),
        dbl_field<&Settings::volatility_tolerance>(
            "volatility_tolerance", "--vol-tolerance",
            "zone tolerance per unit of mean candle range"),
        int_field<&Settings::min_zone_strength>(
            "min_zone_strength", "--min-zone-strength",
            "minimum pivots behind a tradable level"),
        int_field<&Settings::min_pred_occurrences>(
            "min_pred_occurrences", "--min-pred-occurrences",
            "minimum samples behind a slot bias"),
        dbl_field<&Settings::zone_min_pct>(
            "zone_min_pct", "--zone-min", "closest tradable level distance (%)"),
        dbl_field<&Settings::zone_max_pct>(
            "zone_max_pct", "--zone-max", "farthest tradable level distance (%)"),
    };
    return fields;
}

inline const Field* by_key(const std::string& key) {
    for (const auto& f : all()) {
        if (key == f.key) return &f;
    }
    return nullptr;
}

inline const Field* by_option(const std::string& option) {
    for (const auto& f : all()) {
        if (option == f.option) return &f;
    }
    return nullptr;
}

inline std::string format_value(const Field& f, const Settings& s) {
    std::ostringstream ss;
    if (f.integral) ss << static_cast<int>(f.get(s));
    else ss << f.get(s);
    return ss.str();
}

// "key=value" lines, one per field.
inline std::string dump(const Settings& s, const std::string& indent = "  ") {
    std::ostringstream ss;
    for (const auto& f : all()) {
        ss << indent << f.key << " = " << format_value(f, s) << "\n";
    }
    return ss.str();
}

}  // namespace settings_fields
