#pragma once

// candle_loader.hpp — reads the persisted symbol -> candles mapping.
//
// Inputs:
//   *.json     {"EURUSD": [{"from": 1700000000, "open": .., "close": ..,
//                           "max": .., "min": ..}, ...], ...}
//              ("high"/"low" accepted as aliases; both fall back to "open")
//   *.parquet  flat table: symbol (utf8), from (int64), open, high, low, close
//              (high/low optional; absent or null values fall back to open)
//
// Structural problems raise InputError carrying the process exit code.

#include "candles/arrow_candle_series.hpp"
#include "candles/candle_series.hpp"
#include "candles/candle_store.hpp"
#include "data/input_error.hpp"

#include <arrow/api.h>
#include <arrow/io/file.h>
#include <parquet/arrow/reader.h>

#include <nlohmann/json.hpp>

#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// RawCandleData — candles per symbol as read, before building series
// ---------------------------------------------------------------------------
struct LoadStats {
    std::string path;
    std::string format;             // "json" or "parquet"
    uintmax_t file_bytes = 0;
    size_t records = 0;
    size_t max_min_records = 0;     // high/low taken from max/min
    size_t high_low_records = 0;    // high/low taken from high/low
    size_t open_fallback_records = 0;
};

struct RawCandleData {
    std::map<std::string, std::vector<Candle>> candles;
    LoadStats stats;
};

enum class Representation { ARRAY, TABLE };

inline const char* to_string(Representation r) {
    return r == Representation::ARRAY ? "array" : "table";
}

namespace candle_loader {

namespace detail {

inline double require_number(const nlohmann::json& rec, const char* key,
                             const std::string& symbol, size_t idx) {
    auto it = rec.find(key);
    if (it == rec.end() || !it->is_number()) {
        throw InputError(exit_code::MALFORMED_INPUT,
                         "Record " + std::to_string(idx) + " of '" + symbol +
                         "' lacks numeric field '" + key + "'");
    }
    return it->get<double>();
}

// Epoch seconds; anything outside the int64 range is malformed.
inline int64_t require_time(const nlohmann::json& rec, const std::string& symbol, size_t idx) {
    double v = require_number(rec, "from", symbol, idx);
    constexpr double lo = static_cast<double>(std::numeric_limits<int64_t>::min());
    if (!std::isfinite(v) || v < lo || v >= -lo) {
        throw InputError(exit_code::MALFORMED_INPUT,
                         "Record " + std::to_string(idx) + " of '" + symbol +
                         "' has out-of-range 'from'");
    }
    return static_cast<int64_t>(v);
}

// First present numeric alias, or nullopt.
inline std::optional<double> alias(const nlohmann::json& rec, const char* a, const char* b) {
    for (const char* key : {a, b}) {
        auto it = rec.find(key);
        if (it != rec.end() && it->is_number()) return it->get<double>();
    }
    return std::nullopt;
}

}  // namespace detail

// Parse an already-decoded JSON document.
inline RawCandleData parse_json(const nlohmann::json& doc) {
    if (!doc.is_object()) {
        throw InputError(exit_code::MALFORMED_INPUT,
                         std::string("Top-level value must be a symbol mapping, got ") +
                         doc.type_name());
    }

    RawCandleData data;
    data.stats.format = "json";
    for (const auto& [symbol, records] : doc.items()) {
        if (!records.is_array()) {
            throw InputError(exit_code::MALFORMED_INPUT,
                             "Candles of '" + symbol + "' must be a list, got " +
                             records.type_name());
        }
        auto& out = data.candles[symbol];
        out.reserve(records.size());
        for (size_t i = 0; i < records.size(); ++i) {
            const auto& rec = records[i];
            if (!rec.is_object()) {
                throw InputError(exit_code::MALFORMED_INPUT,
                                 "Record " + std::to_string(i) + " of '" + symbol +
                                 "' is not an object");
            }
            Candle c{};
            c.time = detail::require_time(rec, symbol, i);
            c.open = detail::require_number(rec, "open", symbol, i);
            c.close = detail::require_number(rec, "close", symbol, i);

            auto hi = detail::alias(rec, "max", "high");
            auto lo = detail::alias(rec, "min", "low");
            c.high = hi.value_or(c.open);
            c.low = lo.value_or(c.open);

            if (rec.contains("max") || rec.contains("min")) ++data.stats.max_min_records;
            else if (rec.contains("high") || rec.contains("low")) ++data.stats.high_low_records;
            if (!hi || !lo) ++data.stats.open_fallback_records;

            out.push_back(c);
            ++data.stats.records;
        }
    }
    return data;
}

inline RawCandleData read_json(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("Cannot open input file: " + path);
    }
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw InputError(exit_code::MALFORMED_INPUT,
                         "Invalid JSON in " + path + ": " + e.what());
    }
    return parse_json(doc);
}

// Map an Arrow failure to an InputError. Features missing from the local
// Arrow/Parquet build are a missing capability, not malformed data.
inline InputError arrow_error(const std::string& what, const arrow::Status& st) {
    int code = st.IsNotImplemented() ? exit_code::MISSING_CAPABILITY
                                     : exit_code::MALFORMED_INPUT;
    return InputError(code, what + ": " + st.ToString());
}

inline RawCandleData read_parquet(const std::string& path) {
    auto open_result = arrow::io::ReadableFile::Open(path);
    if (!open_result.ok()) {
        throw std::runtime_error("Cannot open input file: " + path);
    }
    auto file_reader_result = parquet::arrow::OpenFile(
        open_result.ValueOrDie(), arrow::default_memory_pool());
    if (!file_reader_result.ok()) {
        throw arrow_error("Cannot read Parquet file " + path, file_reader_result.status());
    }
    auto reader = file_reader_result.MoveValueUnsafe();

    std::shared_ptr<arrow::Table> table;
    auto status = reader->ReadTable(&table);
    if (!status.ok()) throw arrow_error("Cannot read Parquet table " + path, status);

    auto combined_result = table->CombineChunks(arrow::default_memory_pool());
    if (!combined_result.ok()) throw arrow_error("Cannot combine chunks", combined_result.status());
    table = combined_result.MoveValueUnsafe();

    auto column = [&](const char* name, const std::shared_ptr<arrow::DataType>& type,
                      bool required = true) -> std::shared_ptr<arrow::ChunkedArray> {
        auto col = table->GetColumnByName(name);
        if (!col && !required) return nullptr;
        if (!col || !col->type()->Equals(*type)) {
            throw InputError(exit_code::MALFORMED_INPUT,
                             std::string("Parquet input needs column '") + name + "' of type " +
                             type->ToString());
        }
        return col;
    };

    RawCandleData data;
    data.stats.format = "parquet";
    if (table->num_rows() == 0) return data;

    auto sym = std::static_pointer_cast<arrow::StringArray>(
        column("symbol", arrow::utf8())->chunk(0));
    auto from = std::static_pointer_cast<arrow::Int64Array>(
        column("from", arrow::int64())->chunk(0));
    auto open = std::static_pointer_cast<arrow::DoubleArray>(
        column("open", arrow::float64())->chunk(0));
    auto optional_double = [&](const char* name) -> std::shared_ptr<arrow::DoubleArray> {
        auto col = column(name, arrow::float64(), false);
        if (!col) return nullptr;
        return std::static_pointer_cast<arrow::DoubleArray>(col->chunk(0));
    };
    auto high = optional_double("high");
    auto low = optional_double("low");
    auto close = std::static_pointer_cast<arrow::DoubleArray>(
        column("close", arrow::float64())->chunk(0));

    for (int64_t i = 0; i < table->num_rows(); ++i) {
        if (sym->IsNull(i) || from->IsNull(i) || open->IsNull(i) || close->IsNull(i)) {
            throw InputError(exit_code::MALFORMED_INPUT,
                             "Null required value in Parquet row " + std::to_string(i));
        }
        Candle c{};
        c.time = from->Value(i);
        c.open = open->Value(i);
        c.close = close->Value(i);
        bool has_high = high && !high->IsNull(i);
        bool has_low = low && !low->IsNull(i);
        c.high = has_high ? high->Value(i) : c.open;
        c.low = has_low ? low->Value(i) : c.open;
        if (has_high && has_low) ++data.stats.high_low_records;
        else ++data.stats.open_fallback_records;
        data.candles[sym->GetString(i)].push_back(c);
        ++data.stats.records;
    }
    return data;
}

// Load a candle file, dispatching on extension.
inline RawCandleData load_file(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        throw InputError(exit_code::FILE_NOT_FOUND, "Input file not found: " + path);
    }
    std::string ext = std::filesystem::path(path).extension().string();
    RawCandleData data = (ext == ".parquet") ? read_parquet(path) : read_json(path);
    data.stats.path = std::filesystem::absolute(path).string();
    data.stats.file_bytes = std::filesystem::file_size(path);
    return data;
}

// Build the symbol universe. The table representation falls back to the
// array representation per symbol when the Arrow table cannot be built;
// `fallbacks` counts those symbols.
inline CandleStore build_store(const RawCandleData& data, Representation repr,
                               int* fallbacks = nullptr) {
    CandleStore store;
    int n_fallback = 0;
    for (const auto& [symbol, candles] : data.candles) {
        if (repr == Representation::TABLE) {
            auto table_series = ArrowCandleSeries::from_candles(candles);
            if (table_series.ok()) {
                store.add(symbol, table_series.MoveValueUnsafe());
                continue;
            }
            std::cerr << "WARN: table representation unavailable for '" << symbol
                      << "' (" << table_series.status().ToString()
                      << "), using array representation\n";
            ++n_fallback;
        }
        store.add(symbol, std::make_unique<VectorCandleSeries>(candles));
    }
    if (fallbacks) *fallbacks = n_fallback;
    return store;
}

}  // namespace candle_loader
