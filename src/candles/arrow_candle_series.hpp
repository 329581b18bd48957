#pragma once

#include "candles/candle_series.hpp"

#include <arrow/api.h>

#include <memory>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// ArrowCandleSeries — table-backed series over an Arrow table with columns
//   time (int64), open, high, low, close (float64)
// The time column is the index: it must be non-null and ascending.
// ---------------------------------------------------------------------------
class ArrowCandleSeries : public CandleSeries {
    struct Token {
        explicit Token() = default;
    };

public:
    // Only constructible through from_table() / from_candles().
    explicit ArrowCandleSeries(Token) {}

    static std::shared_ptr<arrow::Schema> schema() {
        return arrow::schema({
            arrow::field("time", arrow::int64(), /*nullable=*/false),
            arrow::field("open", arrow::float64(), false),
            arrow::field("high", arrow::float64(), false),
            arrow::field("low", arrow::float64(), false),
            arrow::field("close", arrow::float64(), false),
        });
    }

    static arrow::Result<std::unique_ptr<ArrowCandleSeries>> from_candles(
        std::vector<Candle> candles) {
        std::stable_sort(candles.begin(), candles.end(),
                         [](const Candle& a, const Candle& b) { return a.time < b.time; });

        arrow::Int64Builder time_b;
        arrow::DoubleBuilder open_b, high_b, low_b, close_b;
        auto n = static_cast<int64_t>(candles.size());
        ARROW_RETURN_NOT_OK(time_b.Reserve(n));
        ARROW_RETURN_NOT_OK(open_b.Reserve(n));
        ARROW_RETURN_NOT_OK(high_b.Reserve(n));
        ARROW_RETURN_NOT_OK(low_b.Reserve(n));
        ARROW_RETURN_NOT_OK(close_b.Reserve(n));
        for (const auto& c : candles) {
            time_b.UnsafeAppend(c.time);
            open_b.UnsafeAppend(c.open);
            high_b.UnsafeAppend(c.high);
            low_b.UnsafeAppend(c.low);
            close_b.UnsafeAppend(c.close);
        }

        std::vector<std::shared_ptr<arrow::Array>> arrays(5);
        ARROW_RETURN_NOT_OK(time_b.Finish(&arrays[0]));
        ARROW_RETURN_NOT_OK(open_b.Finish(&arrays[1]));
        ARROW_RETURN_NOT_OK(high_b.Finish(&arrays[2]));
        ARROW_RETURN_NOT_OK(low_b.Finish(&arrays[3]));
        ARROW_RETURN_NOT_OK(close_b.Finish(&arrays[4]));

        return from_table(arrow::Table::Make(schema(), arrays, n));
    }

    static arrow::Result<std::unique_ptr<ArrowCandleSeries>> from_table(
        const std::shared_ptr<arrow::Table>& table) {
        if (!table->schema()->Equals(*schema(), /*check_metadata=*/false)) {
            return arrow::Status::TypeError("candle table schema mismatch: ",
                                            table->schema()->ToString());
        }
        ARROW_ASSIGN_OR_RAISE(auto combined,
                              table->CombineChunks(arrow::default_memory_pool()));

        auto series = std::make_unique<ArrowCandleSeries>(Token{});
        series->table_ = combined;
        if (combined->num_rows() > 0) {
            series->time_ = std::static_pointer_cast<arrow::Int64Array>(
                combined->column(0)->chunk(0));
            series->open_ = std::static_pointer_cast<arrow::DoubleArray>(
                combined->column(1)->chunk(0));
            series->high_ = std::static_pointer_cast<arrow::DoubleArray>(
                combined->column(2)->chunk(0));
            series->low_ = std::static_pointer_cast<arrow::DoubleArray>(
                combined->column(3)->chunk(0));
            series->close_ = std::static_pointer_cast<arrow::DoubleArray>(
                combined->column(4)->chunk(0));

            for (int c = 0; c < combined->num_columns(); ++c) {
                if (combined->column(c)->null_count() > 0) {
                    return arrow::Status::Invalid("null value in candle column '",
                                                  combined->field(c)->name(), "'");
                }
            }
            for (int64_t i = 1; i < series->time_->length(); ++i) {
                if (series->time_->Value(i) < series->time_->Value(i - 1)) {
                    return arrow::Status::Invalid("candle table is not time-ascending at row ", i);
                }
            }
        }
        series->index_days();
        return series;
    }

    size_t size() const override {
        return static_cast<size_t>(table_->num_rows());
    }

    int64_t time_at(size_t i) const override {
        return time_->Value(static_cast<int64_t>(i));
    }

    Candle at(size_t i) const override {
        auto row = static_cast<int64_t>(i);
        return Candle{time_->Value(row), open_->Value(row), high_->Value(row),
                      low_->Value(row), close_->Value(row)};
    }

    const char* representation() const override { return "table"; }

    const std::shared_ptr<arrow::Table>& table() const { return table_; }

private:
    std::shared_ptr<arrow::Table> table_;
    std::shared_ptr<arrow::Int64Array> time_;
    std::shared_ptr<arrow::DoubleArray> open_;
    std::shared_ptr<arrow::DoubleArray> high_;
    std::shared_ptr<arrow::DoubleArray> low_;
    std::shared_ptr<arrow::DoubleArray> close_;
};
