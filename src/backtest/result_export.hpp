#pragma once

#include "backtest/backtest_runner.hpp"
#include "time_utils.hpp"

#include <arrow/api.h>
#include <arrow/io/file.h>
#include <parquet/arrow/writer.h>

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// ExportRow — one (reference day, symbol) line of a result export
// ---------------------------------------------------------------------------
struct ExportRow {
    std::string reference_day;
    std::string prediction_day;
    std::string symbol;
    bool selection_fallback = false;
    int signals = 0;
    int wins_g0 = 0;
    int wins_g1 = 0;
    int losses = 0;
    int no_data = 0;
    double accuracy = 0.0;
};

// ---------------------------------------------------------------------------
// ResultExporter — writes per-day, per-symbol tallies as CSV or Parquet
// ---------------------------------------------------------------------------
class ResultExporter {
public:
    static std::vector<ExportRow> rows(const BacktestResult& result) {
        std::vector<ExportRow> out;
        for (const auto& day : result.days) {
            for (const auto& sym : day.symbols) {
                ExportRow r;
                r.reference_day = time_utils::format_day(day.reference_day);
                r.prediction_day = time_utils::format_day(day.prediction_day);
                r.symbol = sym.symbol;
                r.selection_fallback = day.selection_fallback;
                r.signals = sym.tally.signals;
                r.wins_g0 = sym.tally.wins_g0;
                r.wins_g1 = sym.tally.wins_g1;
                r.losses = sym.tally.losses;
                r.no_data = sym.tally.no_data;
                r.accuracy = sym.tally.accuracy();
                out.push_back(std::move(r));
            }
        }
        return out;
    }

    static std::string header_line() {
        return "reference_day,prediction_day,symbol,selection_fallback,"
               "signals,wins_g0,wins_g1,losses,no_data,accuracy";
    }

    static std::string format_row(const ExportRow& r) {
        std::ostringstream ss;
        ss << r.reference_day;
        ss << "," << r.prediction_day;
        ss << "," << r.symbol;
        ss << "," << (r.selection_fallback ? "true" : "false");
        ss << "," << r.signals;
        ss << "," << r.wins_g0;
        ss << "," << r.wins_g1;
        ss << "," << r.losses;
        ss << "," << r.no_data;
        ss << "," << r.accuracy;
        return ss.str();
    }

    static void write_csv(const std::string& path, const BacktestResult& result) {
        check_parent(path);
        std::ofstream file(path);
        if (!file.is_open()) {
            throw std::runtime_error("Cannot open output file: " + path);
        }
        file << header_line() << "\n";
        for (const auto& r : rows(result)) file << format_row(r) << "\n";
    }

    // Parquet with ZSTD compression.
    static arrow::Status write_parquet(const std::string& path, const BacktestResult& result) {
        auto data = rows(result);

        auto schema = arrow::schema({
            arrow::field("reference_day", arrow::utf8()),
            arrow::field("prediction_day", arrow::utf8()),
            arrow::field("symbol", arrow::utf8()),
            arrow::field("selection_fallback", arrow::boolean()),
            arrow::field("signals", arrow::int64()),
            arrow::field("wins_g0", arrow::int64()),
            arrow::field("wins_g1", arrow::int64()),
            arrow::field("losses", arrow::int64()),
            arrow::field("no_data", arrow::int64()),
            arrow::field("accuracy", arrow::float64()),
        });

        arrow::StringBuilder ref_b, pred_b, sym_b;
        arrow::BooleanBuilder fallback_b;
        arrow::Int64Builder signals_b, g0_b, g1_b, loss_b, nodata_b;
        arrow::DoubleBuilder acc_b;
        for (const auto& r : data) {
            ARROW_RETURN_NOT_OK(ref_b.Append(r.reference_day));
            ARROW_RETURN_NOT_OK(pred_b.Append(r.prediction_day));
            ARROW_RETURN_NOT_OK(sym_b.Append(r.symbol));
            ARROW_RETURN_NOT_OK(fallback_b.Append(r.selection_fallback));
            ARROW_RETURN_NOT_OK(signals_b.Append(r.signals));
            ARROW_RETURN_NOT_OK(g0_b.Append(r.wins_g0));
            ARROW_RETURN_NOT_OK(g1_b.Append(r.wins_g1));
            ARROW_RETURN_NOT_OK(loss_b.Append(r.losses));
            ARROW_RETURN_NOT_OK(nodata_b.Append(r.no_data));
            ARROW_RETURN_NOT_OK(acc_b.Append(r.accuracy));
        }

        std::vector<std::shared_ptr<arrow::Array>> arrays(10);
        ARROW_RETURN_NOT_OK(ref_b.Finish(&arrays[0]));
        ARROW_RETURN_NOT_OK(pred_b.Finish(&arrays[1]));
        ARROW_RETURN_NOT_OK(sym_b.Finish(&arrays[2]));
        ARROW_RETURN_NOT_OK(fallback_b.Finish(&arrays[3]));
        ARROW_RETURN_NOT_OK(signals_b.Finish(&arrays[4]));
        ARROW_RETURN_NOT_OK(g0_b.Finish(&arrays[5]));
        ARROW_RETURN_NOT_OK(g1_b.Finish(&arrays[6]));
        ARROW_RETURN_NOT_OK(loss_b.Finish(&arrays[7]));
        ARROW_RETURN_NOT_OK(nodata_b.Finish(&arrays[8]));
        ARROW_RETURN_NOT_OK(acc_b.Finish(&arrays[9]));

        auto table = arrow::Table::Make(schema, arrays);

        ARROW_ASSIGN_OR_RAISE(auto outfile, arrow::io::FileOutputStream::Open(path));
        auto props = parquet::WriterProperties::Builder()
            .compression(parquet::Compression::ZSTD)
            ->build();
        int64_t chunk = std::max<int64_t>(1, table->num_rows());
        return parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), outfile,
                                          chunk, props);
    }

    // Parquet for a .parquet path, CSV otherwise. Throws std::runtime_error
    // when the file cannot be written.
    static void write(const std::string& path, const BacktestResult& result) {
        if (!is_parquet_path(path)) {
            write_csv(path, result);
            return;
        }
        auto status = write_parquet(path, result);
        if (!status.ok()) {
            throw std::runtime_error("Failed to write Parquet " + path + ": " +
                                     status.ToString());
        }
    }

    static bool is_parquet_path(const std::string& path) {
        return std::filesystem::path(path).extension() == ".parquet";
    }

private:
    static void check_parent(const std::string& path) {
        auto parent = std::filesystem::path(path).parent_path();
        if (!parent.empty() && !std::filesystem::exists(parent)) {
            throw std::runtime_error("Output directory does not exist: " + parent.string());
        }
    }
};
