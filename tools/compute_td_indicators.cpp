/// Command-line tool for DeMark indicator computation
///
/// Usage:
///   compute_td_indicators <ohlcv_file> <output_csv> [options]
///
/// Options:
///   --config <file>      Engine configuration (JSON)
///   --entry-price <P>    Evaluate exit tranches for a long position entered at P
///   --days-held <N>      Bars the position has been held (default: 0)
///   --json               Print the latest snapshot as JSON
///   --verbose            Debug logging (setup completions, TDST events)
///
/// Example:
///   compute_td_indicators btc_daily.txt states.csv
///   compute_td_indicators data.txt out.csv --config demark.json --entry-price 61250 --days-held 7

#include "ExitRules.hpp"
#include "IndicatorConfig.hpp"
#include "IndicatorEngine.hpp"
#include "Logger.hpp"
#include "StateWriter.hpp"
#include "validation/DataParsers.hpp"

#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <optional>

using namespace demark;

namespace {

void print_usage(const char* program_name)
{
    std::cout << "Usage: " << program_name
              << " <ohlcv_file> <output_csv> [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --config <file>      Engine configuration (JSON)\n";
    std::cout << "  --entry-price <P>    Evaluate exit tranches for a position entered at P\n";
    std::cout << "  --days-held <N>      Bars the position has been held (default: 0)\n";
    std::cout << "  --json               Print the latest snapshot as JSON\n";
    std::cout << "  --verbose            Debug logging\n";
    std::cout << "  --help               Show this help message\n\n";
    std::cout << "Input format (whitespace or comma separated):\n";
    std::cout << "  Date Time Open High Low Close [Volume]\n";
    std::cout << "  Date Open High Low Close [Volume]\n";
}

void print_summary(const IndicatorState& s)
{
    std::cout << "Latest bar " << s.bar_index << ":\n";
    std::cout << "  TD MA I       " << (s.ma1_active ? "active " : "inactive ") << s.ma1_value << "\n";
    std::cout << "  TD MA II      " << (s.ma2_active ? "active " : "inactive ") << s.ma2_value << "\n";
    std::cout << "  Entry valid   " << (s.entry_valid ? "yes" : "no") << "\n";
    std::cout << "  Setup         " << s.setup_count << "/9 (" << to_string(s.setup_phase) << ")\n";
    std::cout << "  Countdown     " << s.countdown << "/13\n";
    std::cout << "  TDST support  " << (s.tdst_active ? "active " : "inactive ") << s.tdst_support << "\n";
    std::cout << "  TDST resist.  " << (s.tdst_res_active ? "active " : "inactive ") << s.tdst_resistance << "\n";
    std::cout << "  Higher low    " << s.recent_higher_low << "\n";
    std::cout << "  MA2 blue      " << (s.ma2_entry_valid ? "entry valid" : "not valid") << "\n";
    std::cout << "  Exhaustion    " << to_string(s.exhaustion_level) << "\n";
    for (const auto& signal : s.exhaustion_signals) {
        std::cout << "    - " << signal << "\n";
    }
}

void print_exits(const ExitEvaluation& evaluation)
{
    std::cout << "Exit tranches:\n";
    for (const auto& t : evaluation.tranches) {
        std::cout << "  " << to_string(t.tranche) << " (" << std::setprecision(0) << std::fixed
                  << t.fraction * 100.0 << "%): "
                  << (t.decision.triggered ? std::string(to_string(t.decision.reason)) : "hold") << "\n";
    }
    std::cout << "  Total to exit: " << evaluation.total_fraction() * 100.0 << "%\n";
    std::cout.unsetf(std::ios::fixed);
    std::cout << std::setprecision(6);
}

} // anonymous namespace

int main(int argc, char** argv)
{
    if (argc < 3) {
        print_usage(argv[0]);
        return 1;
    }

    std::string ohlcv_file = argv[1];
    std::string output_file = argv[2];

    std::string config_file;
    std::optional<double> entry_price;
    int days_held = 0;
    bool json = false;
    bool verbose = false;

    // Parse options
    for (int i = 3; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--config" && i + 1 < argc) {
            config_file = argv[++i];
        } else if (arg == "--entry-price" && i + 1 < argc) {
            entry_price = std::atof(argv[++i]);
        } else if (arg == "--days-held" && i + 1 < argc) {
            days_held = std::atoi(argv[++i]);
        } else if (arg == "--json") {
            json = true;
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    EngineConfig config;
    if (!config_file.empty()) {
        auto parsed = EngineConfigParser::parse_file(config_file);
        if (!parsed.success) {
            std::cerr << "Failed to load config: " << parsed.error_message << "\n";
            return 1;
        }
        config = parsed.config;
    }
    Logger::set_level(verbose ? LogLevel::Debug : config.log_level);

    std::cout << "DeMark Indicator Computer\n";
    std::cout << "=========================\n\n";

    auto start_time = std::chrono::high_resolution_clock::now();

    auto bars = validation::OHLCVParser::parse_file(ohlcv_file);
    if (bars.empty()) {
        std::cerr << "Failed to read " << ohlcv_file << ": "
                  << validation::OHLCVParser::get_last_error() << "\n";
        return 1;
    }
    BarSeries series = validation::OHLCVParser::to_series(bars, ohlcv_file);
    Logger::info("Loaded " + std::to_string(series.size()) + " bars from " + ohlcv_file);

    for (std::size_t i = 0; i < series.size(); ++i) {
        std::string error;
        if (!validate_bar(series[i], error)) {
            std::cerr << "Invalid bar " << i << ": " << error << "\n";
            return 1;
        }
    }

    IndicatorEngine engine(config);
    auto states = engine.compute(series);

    std::string write_error;
    if (!StateWriter::write_csv(output_file, series, states, &write_error)) {
        std::cerr << "Failed to write output: " << write_error << "\n";
        return 1;
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration<double>(end_time - start_time).count();

    const IndicatorState& latest = states.back();
    if (json) {
        std::cout << StateWriter::to_json_string(latest) << "\n";
    } else {
        print_summary(latest);
    }

    if (entry_price) {
        PositionContext position;
        position.entry_price = *entry_price;
        position.days_held = days_held;

        ExitRuleEvaluator evaluator(config.exit);
        auto evaluation = evaluator.evaluate_all(series.bars.back().close, latest, position);
        if (json) {
            std::cout << StateWriter::to_json_string(evaluation) << "\n";
        } else {
            std::cout << "\n";
            print_exits(evaluation);
        }

        auto crossover = evaluator.check_ma2_crossover_exit(latest);
        if (crossover.triggered) {
            std::cout << "MA2 fast line below slow line: " << to_string(crossover.reason) << "\n";
        }
    }

    std::cout << "\nWrote " << states.size() << " rows to " << output_file << " in "
              << std::fixed << std::setprecision(2) << duration << " seconds\n";
    return 0;
}
