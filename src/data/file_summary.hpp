#pragma once

#include "data/candle_loader.hpp"
#include "time_utils.hpp"

#include <cstdint>
#include <cstdio>
#include <sstream>
#include <string>
#include <vector>

namespace file_summary {

// 1536 -> "1.50 KB"
inline std::string human_bytes(uintmax_t num_bytes) {
    static const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    double size = static_cast<double>(num_bytes);
    char buf[64];
    for (const char* unit : units) {
        if (size < 1024.0) {
            std::snprintf(buf, sizeof(buf), "%.2f %s", size, unit);
            return buf;
        }
        size /= 1024.0;
    }
    std::snprintf(buf, sizeof(buf), "%.2f PB", size);
    return buf;
}

struct SymbolSummary {
    std::string symbol;
    size_t candles = 0;
    int64_t first_time = 0;
    int64_t last_time = 0;
};

struct Summary {
    std::string path;
    std::string size;
    std::string root_type;
    size_t symbols = 0;
    size_t records = 0;
    std::vector<SymbolSummary> first_symbols;
    std::vector<std::string> aliases;   // high/low sources seen in the file
};

inline Summary summarize(const RawCandleData& data, size_t max_symbols = 5) {
    Summary s;
    s.path = data.stats.path;
    s.size = human_bytes(data.stats.file_bytes);
    s.root_type = data.stats.format == "parquet" ? "table" : "object";
    s.symbols = data.candles.size();
    s.records = data.stats.records;

    for (const auto& [symbol, candles] : data.candles) {
        if (s.first_symbols.size() >= max_symbols) break;
        SymbolSummary sym;
        sym.symbol = symbol;
        sym.candles = candles.size();
        if (!candles.empty()) {
            // Raw records are in file order; report the extremes.
            sym.first_time = candles.front().time;
            sym.last_time = candles.front().time;
            for (const auto& c : candles) {
                if (c.time < sym.first_time) sym.first_time = c.time;
                if (c.time > sym.last_time) sym.last_time = c.time;
            }
        }
        s.first_symbols.push_back(std::move(sym));
    }

    if (data.stats.max_min_records > 0) s.aliases.push_back("max/min");
    if (data.stats.high_low_records > 0) s.aliases.push_back("high/low");
    if (data.stats.open_fallback_records > 0) s.aliases.push_back("open fallback");
    return s;
}

inline std::string format(const Summary& s) {
    std::ostringstream ss;
    ss << "\n== File ==\n";
    ss << "Path: " << s.path << "\n";
    ss << "Size: " << s.size << "\n";
    ss << "\n== Root ==\n";
    ss << "Type: " << s.root_type << "\n";
    ss << "Symbols: " << s.symbols << "\n";
    ss << "Candles: " << s.records << "\n";
    ss << "High/low source:";
    if (s.aliases.empty()) ss << " none";
    for (const auto& a : s.aliases) ss << " " << a;
    ss << "\n";

    for (const auto& sym : s.first_symbols) {
        ss << "\n== Symbol: " << sym.symbol << " ==\n";
        ss << "Candles: " << sym.candles << "\n";
        if (sym.candles == 0) continue;
        ss << "First: " << time_utils::format_time(sym.first_time) << "\n";
        ss << "Last:  " << time_utils::format_time(sym.last_time) << "\n";
    }
    return ss.str();
}

}  // namespace file_summary
