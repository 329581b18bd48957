#pragma once

#include "candles/candle_series.hpp"

#include <algorithm>
#include <cstdint>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// CandleStore — the symbol universe: one read-only CandleSeries per symbol
// ---------------------------------------------------------------------------
class CandleStore {
public:
    CandleStore() = default;
    CandleStore(CandleStore&&) = default;
    CandleStore& operator=(CandleStore&&) = default;

    void add(const std::string& symbol, std::unique_ptr<CandleSeries> series) {
        if (!series) {
            throw std::invalid_argument("CandleStore::add: null series for " + symbol);
        }
        series_[symbol] = std::move(series);
    }

    bool contains(const std::string& symbol) const {
        return series_.count(symbol) > 0;
    }

    const CandleSeries& get(const std::string& symbol) const {
        auto it = series_.find(symbol);
        if (it == series_.end()) {
            throw std::out_of_range("Unknown symbol: " + symbol);
        }
        return *it->second;
    }

    // Symbols in lexicographic order.
    std::vector<std::string> symbols() const {
        std::vector<std::string> out;
        out.reserve(series_.size());
        for (const auto& [sym, _] : series_) out.push_back(sym);
        return out;
    }

    size_t size() const { return series_.size(); }
    bool empty() const { return series_.empty(); }

    // Union of the days present in any symbol, ascending.
    std::vector<int64_t> all_days() const {
        std::vector<int64_t> days;
        for (const auto& [_, s] : series_) {
            days.insert(days.end(), s->days().begin(), s->days().end());
        }
        std::sort(days.begin(), days.end());
        days.erase(std::unique(days.begin(), days.end()), days.end());
        return days;
    }

    size_t total_candles() const {
        size_t n = 0;
        for (const auto& [_, s] : series_) n += s->size();
        return n;
    }

private:
    std::map<std::string, std::unique_ptr<CandleSeries>> series_;
};
