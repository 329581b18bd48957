// zone_backtest.cpp — CLI for the price-zone / time-of-day bias backtest.
// Loads a symbol -> candles file (JSON or Parquet), then either summarizes
// it, runs a single multi-day backtest, or autotunes Settings toward a
// target accuracy held on every day of the window.
//
// Usage: ./zone_backtest <candles.json|.parquet> [--summary | --autotune] [options]

#include "backtest/backtest_result_io.hpp"
#include "backtest/backtest_runner.hpp"
#include "backtest/result_export.hpp"
#include "backtest/run_context.hpp"
#include "backtest/run_window.hpp"
#include "backtest/settings.hpp"
#include "backtest/success_criteria.hpp"
#include "calibration/consistency_orchestrator.hpp"
#include "data/candle_loader.hpp"
#include "data/file_summary.hpp"
#include "data/input_error.hpp"
#include "data/settings_file.hpp"
#include "time_utils.hpp"

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// ===========================================================================
// Options
// ===========================================================================
enum class Mode { BACKTEST, SUMMARY, AUTOTUNE };

struct Options {
    Mode mode = Mode::BACKTEST;
    std::string input_path;
    std::string settings_path;
    std::string export_path;
    std::string json_path;
    std::optional<int64_t> start_day;
    int num_days = run_window::DEFAULT_DAYS;
    double target = 0.70;
    int max_resets = 5;
    size_t max_candidates = 0;
    Representation representation = Representation::TABLE;
    std::vector<std::pair<const settings_fields::Field*, double>> overrides;
    bool help = false;
};

double parse_number(const std::string& option, const std::string& text) {
    size_t used = 0;
    double v = 0.0;
    try {
        v = std::stod(text, &used);
    } catch (const std::logic_error&) {
        used = 0;
    }
    if (used != text.size() || text.empty() || !std::isfinite(v)) {
        throw InputError(exit_code::USAGE, "Option " + option + " expects a number, got '" +
                                           text + "'");
    }
    return v;
}

int parse_int(const std::string& option, const std::string& text) {
    double v = parse_number(option, text);
    if (v != std::floor(v) || !settings_fields::fits_int(v)) {
        throw InputError(exit_code::USAGE, "Option " + option + " expects an integer, got '" +
                                           text + "'");
    }
    return static_cast<int>(v);
}

Options parse_args(int argc, char* argv[]) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= argc) throw InputError(exit_code::USAGE, "Missing value for " + arg);
            return argv[++i];
        };

        if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else if (arg == "--summary") {
            opts.mode = Mode::SUMMARY;
        } else if (arg == "--autotune") {
            opts.mode = Mode::AUTOTUNE;
        } else if (arg == "--input" || arg == "-p") {
            opts.input_path = value();
        } else if (arg == "--settings") {
            opts.settings_path = value();
        } else if (arg == "--export") {
            opts.export_path = value();
        } else if (arg == "--json") {
            opts.json_path = value();
        } else if (arg == "--start-day") {
            std::string text = value();
            opts.start_day = time_utils::parse_day(text);
            if (!opts.start_day) {
                throw InputError(exit_code::USAGE, "--start-day expects YYYY-MM-DD, got '" +
                                                   text + "'");
            }
        } else if (arg == "--days") {
            opts.num_days = parse_int(arg, value());
            if (opts.num_days < 1) throw InputError(exit_code::USAGE, "--days must be >= 1");
        } else if (arg == "--target") {
            opts.target = parse_number(arg, value());
            if (opts.target < 0.0 || opts.target > 1.0)
                throw InputError(exit_code::USAGE, "--target must be in [0, 1]");
        } else if (arg == "--max-resets") {
            opts.max_resets = parse_int(arg, value());
            if (opts.max_resets < 0) throw InputError(exit_code::USAGE, "--max-resets must be >= 0");
        } else if (arg == "--max-candidates") {
            int n = parse_int(arg, value());
            if (n < 0) throw InputError(exit_code::USAGE, "--max-candidates must be >= 0");
            opts.max_candidates = static_cast<size_t>(n);
        } else if (arg == "--representation") {
            std::string r = value();
            if (r == "array") opts.representation = Representation::ARRAY;
            else if (r == "table") opts.representation = Representation::TABLE;
            else throw InputError(exit_code::USAGE, "--representation expects array or table");
        } else if (const auto* field = settings_fields::by_option(arg)) {
            double v = field->integral ? parse_int(arg, value()) : parse_number(arg, value());
            opts.overrides.emplace_back(field, v);
        } else if (!arg.empty() && arg[0] != '-' && opts.input_path.empty()) {
            opts.input_path = arg;
        } else {
            throw InputError(exit_code::USAGE, "Unknown argument: " + arg);
        }
    }
    return opts;
}

// ===========================================================================
// Usage
// ===========================================================================
void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " <candles.json|.parquet> [mode] [options]\n"
              << "\n"
              << "Modes:\n"
              << "  (default)            backtest over --days reference days\n"
              << "  --summary            describe the input file and exit\n"
              << "  --autotune           search settings holding --target on every day\n"
              << "\n"
              << "Run options:\n"
              << "  --start-day <date>   last reference day, YYYY-MM-DD\n"
              << "  --days <n>           reference days in the window (default 10)\n"
              << "  --target <acc>       target daily accuracy (default 0.70)\n"
              << "  --max-resets <n>     recalibrations allowed by --autotune (default 5)\n"
              << "  --max-candidates <n> candidates per calibration, 0 = all (default 0)\n"
              << "  --representation <array|table>  candle series storage (default table)\n"
              << "  --settings <file>    JSON object of settings overrides\n"
              << "  --export <path>      per-day, per-symbol results (.csv or .parquet)\n"
              << "  --json <path>        full result as JSON\n"
              << "\n"
              << "Settings:\n";
    Settings defaults;
    for (const auto& f : settings_fields::all()) {
        std::fprintf(stderr, "  %-24s %s (default %s)\n", f.option, f.help,
                     settings_fields::format_value(f, defaults).c_str());
    }
}

// ===========================================================================
// Report
// ===========================================================================
void print_file_header(const RawCandleData& data, const CandleStore& store,
                       Representation requested, int fallbacks) {
    std::printf("\n== File ==\n");
    std::printf("Path: %s\n", data.stats.path.c_str());
    std::printf("Size: %s\n", file_summary::human_bytes(data.stats.file_bytes).c_str());
    std::printf("Format: %s\n", data.stats.format.c_str());
    std::printf("Symbols: %zu\n", store.size());
    std::printf("Candles: %zu\n", store.total_candles());
    std::printf("Representation: %s", to_string(requested));
    if (fallbacks > 0) std::printf(" (%d symbol(s) fell back to array)", fallbacks);
    std::printf("\n");
}

void print_day(const DayResult& day) {
    std::printf("  %s -> %s  signals=%3d  evaluated=%3d  no_data=%2d  accuracy=%5.1f%%  [",
                time_utils::format_day(day.reference_day).c_str(),
                time_utils::format_day(day.prediction_day).c_str(),
                day.totals.signals, day.totals.evaluated(), day.totals.no_data,
                day.accuracy() * 100.0);
    for (size_t i = 0; i < day.selected.size(); ++i) {
        std::printf("%s%s", i > 0 ? "," : "", day.selected[i].c_str());
    }
    std::printf("]%s\n", day.selection_fallback ? " (fallback: full universe)" : "");
}

void print_aggregate(const BacktestResult& result, const Settings& settings, double target) {
    std::printf("\n== Settings ==\n%s", settings_fields::dump(settings).c_str());

    const auto& t = result.totals;
    std::printf("\n== Aggregate ==\n");
    std::printf("  Days: %zu (%d with evaluated signals)\n", result.days.size(),
                result.active_days);
    std::printf("  Signals: %d  (G0 wins %d, G1 wins %d, losses %d, no data %d)\n",
                t.signals, t.wins_g0, t.wins_g1, t.losses, t.no_data);
    std::printf("  Overall accuracy: %.1f%%\n", t.accuracy() * 100.0);
    std::printf("  Mean daily accuracy: %.1f%%\n", result.mean_accuracy * 100.0);

    Assessment a = SuccessCriteria{target}.evaluate(result);
    std::printf("\n== Verdict ==\n");
    std::printf("  Target %.1f%% on every day: %d/%d days pass\n", target * 100.0,
                a.days_passed, a.days_total);
    std::printf("  %s\n", a.decision.c_str());
}

void write_outputs(const Options& opts, const BacktestResult& result,
                   const std::string& json) {
    if (!opts.export_path.empty()) {
        ResultExporter::write(opts.export_path, result);
        std::cout << "Exported results to " << opts.export_path << "\n";
    }
    if (!opts.json_path.empty()) {
        std::ofstream out(opts.json_path);
        if (!out.is_open()) {
            throw std::runtime_error("Cannot open output file: " + opts.json_path);
        }
        out << json << "\n";
        std::cout << "Wrote JSON to " << opts.json_path << "\n";
    }
}

// ===========================================================================
// Modes
// ===========================================================================
int run_backtest(const Options& opts, const BacktestRunner& runner, const Settings& settings,
                 int64_t start_day) {
    std::printf("\n== Backtest ==\n");
    RunContext ctx(settings);
    BacktestResult result = runner.run(ctx, start_day, opts.num_days);
    for (const auto& day : result.days) print_day(day);
    print_aggregate(result, settings, opts.target);
    write_outputs(opts, result, backtest_io::to_json(result));
    return exit_code::OK;
}

int run_autotune(const Options& opts, const BacktestRunner& runner, const Settings& settings,
                 int64_t start_day) {
    ConsistencyOrchestrator orchestrator(runner, opts.max_candidates);

    std::printf("\n== Autotune ==\n");
    auto curated = ConsistencyOrchestrator::curated_candidates(settings);
    std::printf("  Grid search over %zu curated settings...\n", curated.size());
    std::optional<ConsistencyResult> found =
        orchestrator.grid_search(curated, start_day, opts.num_days, opts.target);

    ConsistencyResult result;
    if (found) {
        std::printf("  Grid search found consistent settings\n");
        result = std::move(*found);
    } else {
        std::printf("  No curated settings held; adaptive recalibration (max %d resets)\n",
                    opts.max_resets);
        result = orchestrator.run(settings, start_day, opts.num_days, opts.target,
                                  opts.max_resets);
        for (const auto& a : result.attempts) {
            std::printf("  Reset %d: %s missed (%.1f%% over %d), calibrated on %s: "
                        "%zu candidates, %.1f%%%s\n",
                        a.reset, time_utils::format_day(a.failing_day).c_str(),
                        a.failing_accuracy * 100.0, a.failing_evaluated,
                        time_utils::format_day(a.calibration_day).c_str(),
                        a.calibration.candidates_tried, a.calibration.accuracy * 100.0,
                        a.calibration.met_target ? " (target met)" : " (best effort)");
        }
    }

    std::printf("\n== Backtest (%s) ==\n", result.source.c_str());
    for (const auto& day : result.run.days) print_day(day);
    if (!result.consistent && result.run.days.size() < static_cast<size_t>(opts.num_days)) {
        std::printf("  (partial run: stopped at the first failing day)\n");
    }
    print_aggregate(result.run, result.settings, opts.target);
    std::printf("  Resets: %d\n", result.resets);
    write_outputs(opts, result.run, backtest_io::to_json(result));
    return exit_code::OK;
}

int run(const Options& opts) {
    RawCandleData data = candle_loader::load_file(opts.input_path);

    if (opts.mode == Mode::SUMMARY) {
        std::printf("%s", file_summary::format(file_summary::summarize(data)).c_str());
        return exit_code::OK;
    }

    Settings settings;
    if (!opts.settings_path.empty()) settings = settings_file::load(opts.settings_path, settings);
    for (const auto& [field, v] : opts.overrides) field->set(settings, v);
    if (auto problem = settings.problem()) {
        throw InputError(exit_code::USAGE, "Invalid settings: " + *problem);
    }

    int fallbacks = 0;
    CandleStore store = candle_loader::build_store(data, opts.representation, &fallbacks);

    std::optional<int64_t> start_day = opts.start_day;
    if (!start_day) start_day = run_window::default_start_day(store);
    if (!start_day) {
        throw InputError(exit_code::INSUFFICIENT_HISTORY,
                         "Need at least two days of candles to backtest");
    }
    int available = run_window::days_available(store, *start_day);
    if (available < opts.num_days) {
        throw InputError(exit_code::INSUFFICIENT_HISTORY,
                         "Only " + std::to_string(available) + " day(s) of data up to " +
                         time_utils::format_day(*start_day) + ", need " +
                         std::to_string(opts.num_days));
    }
    print_file_header(data, store, opts.representation, fallbacks);
    std::printf("Start day: %s (%d reference days)\n",
                time_utils::format_day(*start_day).c_str(), opts.num_days);

    BacktestRunner runner(store);
    if (opts.mode == Mode::AUTOTUNE) return run_autotune(opts, runner, settings, *start_day);
    return run_backtest(opts, runner, settings, *start_day);
}

// ===========================================================================
// Main
// ===========================================================================
int main(int argc, char* argv[]) {
    Options opts;
    try {
        opts = parse_args(argc, argv);
    } catch (const InputError& e) {
        std::cerr << e.what() << "\n";
        print_usage(argv[0]);
        return e.code();
    }
    if (opts.help) {
        print_usage(argv[0]);
        return exit_code::OK;
    }
    if (opts.input_path.empty()) {
        std::cerr << "Missing required argument: input file\n";
        print_usage(argv[0]);
        return exit_code::USAGE;
    }

    try {
        return run(opts);
    } catch (const InputError& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return e.code();
    } catch (const std::runtime_error& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return exit_code::MALFORMED_INPUT;
    }
}
