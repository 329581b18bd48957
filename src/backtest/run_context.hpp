#pragma once

#include "backtest/settings.hpp"
#include "bias/direction_map.hpp"
#include "candles/candle_series.hpp"
#include "levels/level_builder.hpp"
#include "levels/level_clusterer.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>

// ---------------------------------------------------------------------------
// CacheKey — (symbol, day, hash of the settings subset the value depends on)
// ---------------------------------------------------------------------------
struct CacheKey {
    std::string symbol;
    int64_t day = 0;
    size_t settings_hash = 0;

    bool operator==(const CacheKey& o) const {
        return day == o.day && settings_hash == o.settings_hash && symbol == o.symbol;
    }
};

struct CacheKeyHash {
    size_t operator()(const CacheKey& k) const {
        size_t h = std::hash<std::string>{}(k.symbol);
        h ^= std::hash<int64_t>{}(k.day) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        h ^= k.settings_hash + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        return h;
    }
};

// ---------------------------------------------------------------------------
// MemoCache — typed memoization table with explicit invalidation
// ---------------------------------------------------------------------------
template <typename V>
class MemoCache {
public:
    const V* find(const CacheKey& key) const {
        auto it = entries_.find(key);
        return it == entries_.end() ? nullptr : &it->second;
    }

    const V& put(const CacheKey& key, V value) {
        return entries_.insert_or_assign(key, std::move(value)).first->second;
    }

    template <typename Compute>
    const V& get_or_compute(const CacheKey& key, Compute&& compute) {
        if (const V* hit = find(key)) {
            ++hits_;
            return *hit;
        }
        ++misses_;
        return put(key, compute());
    }

    void invalidate() { entries_.clear(); }

    size_t size() const { return entries_.size(); }
    size_t hits() const { return hits_; }
    size_t misses() const { return misses_; }

private:
    std::unordered_map<CacheKey, V, CacheKeyHash> entries_;
    size_t hits_ = 0;
    size_t misses_ = 0;
};

// ---------------------------------------------------------------------------
// RunContext — the Settings a run is bound to plus its derived-value caches.
//
// Components read levels and direction maps through the context; only the
// orchestrating loop calls invalidate(), once per reference-day boundary.
// ---------------------------------------------------------------------------
class RunContext {
public:
    explicit RunContext(const Settings& settings) : settings_(settings) {
        settings_.validate();
    }

    const Settings& settings() const { return settings_; }

    // Levels from data up to and including `ref_day`.
    const LevelSet& levels(const std::string& symbol, const CandleSeries& series,
                           int64_t ref_day) {
        CacheKey key{symbol, ref_day, settings_.level_hash()};
        return level_cache_.get_or_compute(key, [&] {
            return level_builder::build(series, ref_day, settings_);
        });
    }

    // Bias for `day`, built only from days strictly before it.
    const DirectionMap& direction_map(const std::string& symbol, const CandleSeries& series,
                                      int64_t day) {
        CacheKey key{symbol, day, settings_.map_hash()};
        return map_cache_.get_or_compute(key, [&] {
            DirectionMapBuilder builder(settings_.step_minutes, settings_.min_pred_occurrences,
                                        settings_.predominance_fraction);
            return builder.build(series, series.days_before(day, settings_.predominance_days));
        });
    }

    void invalidate() {
        level_cache_.invalidate();
        map_cache_.invalidate();
    }

    MemoCache<LevelSet>& level_cache() { return level_cache_; }
    MemoCache<DirectionMap>& map_cache() { return map_cache_; }

private:
    const Settings settings_;
    MemoCache<LevelSet> level_cache_;
    MemoCache<DirectionMap> map_cache_;
};
