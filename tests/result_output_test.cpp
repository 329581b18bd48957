// result_output_test.cpp — Tests for JSON result serialization, CSV and
// Parquet exports, and the input file summary.
//
// The JSON writers are hand-rolled; each test parses their output back to
// make sure it is well formed.

#include <gtest/gtest.h>

#include "backtest/backtest_result_io.hpp"
#include "backtest/backtest_runner.hpp"
#include "backtest/result_export.hpp"
#include "calibration/consistency_orchestrator.hpp"
#include "data/file_summary.hpp"
#include "test_candle_helpers.hpp"

#include <arrow/api.h>
#include <arrow/io/file.h>
#include <nlohmann/json.hpp>
#include <parquet/arrow/reader.h>
#include <parquet/metadata.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace candle_test_helpers;

// ===========================================================================
// Helpers
// ===========================================================================
namespace {

const std::vector<std::string> SYMBOLS = {"AUDUSD", "EURUSD"};

std::string temp_path(const std::string& name) {
    return (std::filesystem::temp_directory_path() / ("result_output_test_" + name)).string();
}

std::vector<std::string> read_lines(const std::string& path) {
    std::ifstream in(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) lines.push_back(line);
    return lines;
}

}  // namespace

class ResultOutputTest : public ::testing::Test {
protected:
    CandleStore store = zigzag_store(SYMBOLS, 30);
    BacktestRunner runner{store};
    BacktestResult result;
    std::vector<std::string> cleanup;

    void SetUp() override {
        RunContext ctx(zigzag_settings());
        result = runner.run(ctx, base_day() + 25, 2);
    }

    void TearDown() override {
        for (const auto& p : cleanup) std::filesystem::remove(p);
    }
};

// ===========================================================================
// 1. JSON
// ===========================================================================
TEST_F(ResultOutputTest, SettingsJsonListsEveryField) {
    auto doc = nlohmann::json::parse(backtest_io::to_json(zigzag_settings()));
    EXPECT_EQ(doc.size(), settings_fields::all().size());
    EXPECT_EQ(doc["pivot_window"].get<int>(), 2);
    EXPECT_DOUBLE_EQ(doc["predominance_fraction"].get<double>(), 0.60);
}

TEST_F(ResultOutputTest, BacktestJsonIsWellFormed) {
    auto doc = nlohmann::json::parse(backtest_io::to_json(result));
    EXPECT_EQ(doc["active_days"].get<int>(), 2);
    EXPECT_DOUBLE_EQ(doc["mean_accuracy"].get<double>(), 1.0);
    ASSERT_EQ(doc["days"].size(), 2u);

    const auto& day = doc["days"][0];
    EXPECT_EQ(day["reference_day"].get<std::string>(), "2024-03-26");
    EXPECT_EQ(day["prediction_day"].get<std::string>(), "2024-03-27");
    EXPECT_TRUE(day["selection_fallback"].get<bool>());
    EXPECT_EQ(day["selected"].size(), SYMBOLS.size());
    EXPECT_EQ(day["signals"].get<int>(), 2 * SIGNALS_PER_DAY);
    ASSERT_EQ(day["trades"].size(), static_cast<size_t>(2 * SIGNALS_PER_DAY));
    EXPECT_EQ(day["trades"][0]["outcome"].get<std::string>(), "WIN_G0");
}

TEST_F(ResultOutputTest, ConsistencyJsonCarriesAttempts) {
    Settings initial = zigzag_settings();
    initial.min_zone_strength = 1000000;
    ConsistencyResult r = ConsistencyOrchestrator(runner, 5).run(initial, base_day() + 25, 2,
                                                                 0.70, 3);
    auto doc = nlohmann::json::parse(backtest_io::to_json(r));
    EXPECT_TRUE(doc["consistent"].get<bool>());
    EXPECT_EQ(doc["source"].get<std::string>(), "adaptive");
    EXPECT_EQ(doc["resets"].get<int>(), 1);
    ASSERT_EQ(doc["attempts"].size(), 1u);
    EXPECT_EQ(doc["attempts"][0]["calibration_day"].get<std::string>(), "2024-03-25");
    EXPECT_TRUE(doc["attempts"][0]["met_target"].get<bool>());
}

TEST_F(ResultOutputTest, JsonEscapesSymbols) {
    EXPECT_EQ(backtest_io::json_escape("a\"b\\c"), "a\\\"b\\\\c");
}

// ===========================================================================
// 2. CSV and Parquet exports
// ===========================================================================
TEST_F(ResultOutputTest, RowsPerDayAndSymbol) {
    auto rows = ResultExporter::rows(result);
    ASSERT_EQ(rows.size(), 4u);
    EXPECT_EQ(rows[0].reference_day, "2024-03-26");
    EXPECT_EQ(rows[0].symbol, "AUDUSD");
    EXPECT_EQ(rows[1].symbol, "EURUSD");
    EXPECT_EQ(rows[2].reference_day, "2024-03-25");
    EXPECT_EQ(rows[0].signals, SIGNALS_PER_DAY);
    EXPECT_DOUBLE_EQ(rows[0].accuracy, 1.0);
}

TEST_F(ResultOutputTest, CsvHasHeaderAndRows) {
    auto path = temp_path("result.csv");
    cleanup.push_back(path);
    ResultExporter::write_csv(path, result);

    auto lines = read_lines(path);
    ASSERT_EQ(lines.size(), 5u);
    EXPECT_EQ(lines[0], ResultExporter::header_line());
    EXPECT_EQ(lines[1], "2024-03-26,2024-03-27,AUDUSD,true,48,48,0,0,0,1");
}

TEST_F(ResultOutputTest, CsvMissingDirectoryThrows) {
    EXPECT_THROW(ResultExporter::write_csv("/nonexistent_dir/result.csv", result),
                 std::runtime_error);
}

TEST_F(ResultOutputTest, ParquetRoundTrip) {
    auto path = temp_path("result.parquet");
    cleanup.push_back(path);
    ASSERT_TRUE(ResultExporter::is_parquet_path(path));
    ASSERT_TRUE(ResultExporter::write_parquet(path, result).ok());

    auto infile = arrow::io::ReadableFile::Open(path);
    ASSERT_TRUE(infile.ok());
    auto reader_result = parquet::arrow::OpenFile(infile.ValueOrDie(),
                                                  arrow::default_memory_pool());
    ASSERT_TRUE(reader_result.ok());
    auto reader = reader_result.MoveValueUnsafe();

    auto metadata = reader->parquet_reader()->metadata();
    ASSERT_GE(metadata->num_row_groups(), 1);
    EXPECT_EQ(metadata->RowGroup(0)->ColumnChunk(0)->compression(),
              parquet::Compression::ZSTD);

    std::shared_ptr<arrow::Table> table;
    ASSERT_TRUE(reader->ReadTable(&table).ok());
    EXPECT_EQ(table->num_rows(), 4);
    EXPECT_EQ(table->num_columns(), 10);
    auto symbols = std::static_pointer_cast<arrow::StringArray>(
        table->GetColumnByName("symbol")->chunk(0));
    EXPECT_EQ(symbols->GetString(1), "EURUSD");
}

TEST_F(ResultOutputTest, ParquetWriteFailureThrows) {
    auto status = ResultExporter::write_parquet("/nonexistent_dir/result.parquet", result);
    EXPECT_FALSE(status.ok());
    EXPECT_THROW(ResultExporter::write("/nonexistent_dir/result.parquet", result),
                 std::runtime_error);
}

TEST_F(ResultOutputTest, WritePicksFormatFromExtension) {
    auto csv = temp_path("dispatch.csv");
    auto pq = temp_path("dispatch.parquet");
    cleanup.push_back(csv);
    cleanup.push_back(pq);
    ResultExporter::write(csv, result);
    ResultExporter::write(pq, result);

    auto lines = read_lines(csv);
    ASSERT_EQ(lines.size(), 5u);
    EXPECT_EQ(lines[0], ResultExporter::header_line());
    std::ifstream in(pq, std::ios::binary);
    std::string magic(4, '\0');
    in.read(magic.data(), 4);
    EXPECT_EQ(magic, "PAR1");
}

TEST_F(ResultOutputTest, ParquetExtensionOnly) {
    EXPECT_FALSE(ResultExporter::is_parquet_path("out.csv"));
    EXPECT_FALSE(ResultExporter::is_parquet_path("out"));
}

// ===========================================================================
// 3. file_summary
// ===========================================================================
class FileSummaryTest : public ::testing::Test {};

TEST_F(FileSummaryTest, HumanBytes) {
    EXPECT_EQ(file_summary::human_bytes(512), "512.00 B");
    EXPECT_EQ(file_summary::human_bytes(1536), "1.50 KB");
    EXPECT_EQ(file_summary::human_bytes(3ULL * 1024 * 1024), "3.00 MB");
}

TEST_F(FileSummaryTest, SummarizeAndFormat) {
    RawCandleData data;
    data.stats.path = "/data/candles.json";
    data.stats.format = "json";
    data.stats.file_bytes = 2048;
    data.stats.records = 3;
    data.stats.max_min_records = 3;
    int64_t day = base_day();
    data.candles["EURUSD"] = {make_candle(at(day, 10, 5), 1.0, 1.1),
                              make_candle(at(day, 10, 0), 1.0, 1.1)};
    data.candles["GBPUSD"] = {make_candle(at(day, 9, 0), 1.0, 1.1)};

    auto s = file_summary::summarize(data, 1);
    EXPECT_EQ(s.size, "2.00 KB");
    EXPECT_EQ(s.root_type, "object");
    EXPECT_EQ(s.symbols, 2u);
    ASSERT_EQ(s.first_symbols.size(), 1u);
    EXPECT_EQ(s.first_symbols[0].first_time, at(day, 10, 0));
    EXPECT_EQ(s.first_symbols[0].last_time, at(day, 10, 5));
    EXPECT_EQ(s.aliases, (std::vector<std::string>{"max/min"}));

    std::string text = file_summary::format(s);
    EXPECT_NE(text.find("== File =="), std::string::npos);
    EXPECT_NE(text.find("Size: 2.00 KB"), std::string::npos);
    EXPECT_NE(text.find("== Symbol: EURUSD =="), std::string::npos);
    EXPECT_EQ(text.find("GBPUSD"), std::string::npos);
    EXPECT_NE(text.find("First: 2024-03-01 10:00:00"), std::string::npos);
}
