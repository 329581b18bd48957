#pragma once

#include "backtest/settings.hpp"

#include <cstddef>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// ParameterGrid — lazy cartesian product of candidate values over Settings
// fields, applied on top of a base Settings.
//
// Enumeration order is fixed: the first axis added varies slowest and the
// last axis fastest, so candidate i is always the same Settings.
// ---------------------------------------------------------------------------
class ParameterGrid {
public:
    struct Axis {
        const settings_fields::Field* field = nullptr;
        std::vector<double> values;
    };

    explicit ParameterGrid(const Settings& base) : base_(base) {}

    ParameterGrid& add(const std::string& key, std::vector<double> values) {
        const auto* field = settings_fields::by_key(key);
        if (!field) throw std::invalid_argument("ParameterGrid: unknown field " + key);
        if (values.empty()) throw std::invalid_argument("ParameterGrid: no values for " + key);
        for (double v : values) {
            if (!settings_fields::accepts(*field, v))
                throw std::invalid_argument("ParameterGrid: value out of range for " + key);
        }
        axes_.push_back(Axis{field, std::move(values)});
        return *this;
    }

    // Number of candidates (1 for a grid without axes: the base itself).
    size_t size() const {
        size_t n = 1;
        for (const auto& a : axes_) n *= a.values.size();
        return n;
    }

    const Settings& base() const { return base_; }
    const std::vector<Axis>& axes() const { return axes_; }

    Settings candidate(const std::vector<size_t>& index) const {
        Settings s = base_;
        for (size_t a = 0; a < axes_.size(); ++a) {
            axes_[a].field->set(s, axes_[a].values[index[a]]);
        }
        return s;
    }

    class Iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Settings;
        using difference_type = std::ptrdiff_t;
        using pointer = const Settings*;
        using reference = Settings;

        Iterator(const ParameterGrid* grid, bool done)
            : grid_(grid), index_(grid->axes_.size(), 0), done_(done) {}

        Settings operator*() const { return grid_->candidate(index_); }

        Iterator& operator++() {
            // Odometer: bump the last axis, carry leftwards.
            for (size_t a = index_.size(); a-- > 0;) {
                if (++index_[a] < grid_->axes_[a].values.size()) return *this;
                index_[a] = 0;
            }
            done_ = true;
            return *this;
        }

        bool operator==(const Iterator& o) const {
            return done_ == o.done_ && (done_ || index_ == o.index_);
        }
        bool operator!=(const Iterator& o) const { return !(*this == o); }

        const std::vector<size_t>& index() const { return index_; }

    private:
        const ParameterGrid* grid_;
        std::vector<size_t> index_;
        bool done_;
    };

    Iterator begin() const { return Iterator(this, false); }
    Iterator end() const { return Iterator(this, true); }

    // Twelve-axis grid used when recalibrating. Values are listed from the
    // most selective to the most permissive.
    static ParameterGrid default_calibration(const Settings& base) {
        ParameterGrid grid(base);
        grid.add("predominance_fraction", {0.70, 0.65, 0.60})
            .add("predominance_days", {5, 7})
            .add("pivot_window", {3, 2})
            .add("cluster_tolerance_pct", {0.05, 0.10})
            .add("zone_tolerance_pct", {0.10, 0.20})
            .add("confluence_steps", {3, 2})
            .add("top_k", {3, 5})
            .add("min_hist_accuracy", {0.60, 0.55})
            .add("min_hist_signals", {3, 1})
            .add("volatility_tolerance", {0.0, 0.5})
            .add("min_zone_strength", {2, 1})
            .add("min_pred_occurrences", {3, 2});
        return grid;
    }

private:
    Settings base_;
    std::vector<Axis> axes_;
};
