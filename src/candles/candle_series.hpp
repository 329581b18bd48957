#pragma once

#include "candles/candle.hpp"
#include "time_utils.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// CandleSeries — read-only, time-ascending candle sequence for one symbol.
//
// Implementations only provide indexed access; lookups by time, range
// slicing, day indexing and column access are shared and rely on the
// ascending time order. Duplicate times resolve to the first candle.
// ---------------------------------------------------------------------------
class CandleSeries {
public:
    enum class Column { OPEN, HIGH, LOW, CLOSE };

    virtual ~CandleSeries() = default;

    virtual size_t size() const = 0;
    virtual int64_t time_at(size_t i) const = 0;
    virtual Candle at(size_t i) const = 0;

    // Short name of the backing representation ("array", "table").
    virtual const char* representation() const = 0;

    bool empty() const { return size() == 0; }

    // First index whose time is >= ts.
    size_t lower_index(int64_t ts) const {
        size_t lo = 0, hi = size();
        while (lo < hi) {
            size_t mid = lo + (hi - lo) / 2;
            if (time_at(mid) < ts) lo = mid + 1;
            else hi = mid;
        }
        return lo;
    }

    std::optional<size_t> find_index(int64_t ts) const {
        size_t i = lower_index(ts);
        if (i < size() && time_at(i) == ts) return i;
        return std::nullopt;
    }

    std::optional<Candle> at_time(int64_t ts) const {
        auto i = find_index(ts);
        if (!i) return std::nullopt;
        return at(*i);
    }

    // Candle immediately preceding ts (latest candle with time < ts).
    std::optional<Candle> previous(int64_t ts) const {
        size_t i = lower_index(ts);
        if (i == 0) return std::nullopt;
        return at(i - 1);
    }

    // Index bounds [first, last) of the half-open time range [start, end).
    std::pair<size_t, size_t> range_indices(int64_t start, int64_t end) const {
        size_t first = lower_index(start);
        size_t last = std::max(first, lower_index(end));
        return {first, last};
    }

    std::vector<Candle> slice(int64_t start, int64_t end) const {
        auto [first, last] = range_indices(start, end);
        std::vector<Candle> out;
        out.reserve(last - first);
        for (size_t i = first; i < last; ++i) out.push_back(at(i));
        return out;
    }

    std::vector<double> column(Column col, size_t first, size_t last) const {
        std::vector<double> out;
        last = std::min(last, size());
        if (first >= last) return out;
        out.reserve(last - first);
        for (size_t i = first; i < last; ++i) {
            Candle c = at(i);
            switch (col) {
                case Column::OPEN:  out.push_back(c.open); break;
                case Column::HIGH:  out.push_back(c.high); break;
                case Column::LOW:   out.push_back(c.low); break;
                case Column::CLOSE: out.push_back(c.close); break;
            }
        }
        return out;
    }

    // Distinct UTC days that have at least one candle, ascending.
    const std::vector<int64_t>& days() const { return days_; }

    bool has_day(int64_t day) const {
        return std::binary_search(days_.begin(), days_.end(), day);
    }

    // The last `count` days strictly before `day` that have data.
    std::vector<int64_t> days_before(int64_t day, int count) const {
        auto it = std::lower_bound(days_.begin(), days_.end(), day);
        size_t end = static_cast<size_t>(it - days_.begin());
        size_t n = std::min(end, static_cast<size_t>(std::max(count, 0)));
        return std::vector<int64_t>(days_.begin() + (end - n), days_.begin() + end);
    }

    int64_t first_time() const { return empty() ? 0 : time_at(0); }
    int64_t last_time() const { return empty() ? 0 : time_at(size() - 1); }

protected:
    // Derived constructors call this once their storage is populated.
    void index_days() {
        days_.clear();
        for (size_t i = 0; i < size(); ++i) {
            int64_t d = time_utils::day_of(time_at(i));
            if (days_.empty() || days_.back() != d) days_.push_back(d);
        }
    }

private:
    std::vector<int64_t> days_;
};

// ---------------------------------------------------------------------------
// VectorCandleSeries — array-backed series (always available)
// ---------------------------------------------------------------------------
class VectorCandleSeries : public CandleSeries {
public:
    explicit VectorCandleSeries(std::vector<Candle> candles)
        : candles_(std::move(candles)) {
        std::stable_sort(candles_.begin(), candles_.end(),
                         [](const Candle& a, const Candle& b) { return a.time < b.time; });
        index_days();
    }

    size_t size() const override { return candles_.size(); }
    int64_t time_at(size_t i) const override { return candles_[i].time; }
    Candle at(size_t i) const override { return candles_[i]; }
    const char* representation() const override { return "array"; }

    const std::vector<Candle>& candles() const { return candles_; }

private:
    std::vector<Candle> candles_;
};
