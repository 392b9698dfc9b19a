/// Command-line backtest over a bar file
///
/// Usage:
///   run_backtest <ohlcv_file> <run_config.json> [options]
///
/// Options:
///   --trades <file>      Write the trade ledger as CSV
///   --equity <file>      Write the equity curve as CSV
///   --verbose            Enable debug logging

#include "tradecore/BacktestRunner.hpp"
#include "tradecore/DataParsers.hpp"
#include "tradecore/Logger.hpp"
#include "tradecore/RunConfig.hpp"

#include <iomanip>
#include <iostream>

using namespace tradecore;

namespace {

void print_usage(const char* program_name)
{
    std::cout << "Usage: " << program_name << " <ohlcv_file> <run_config.json> [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --trades <file>   Write the trade ledger as CSV\n";
    std::cout << "  --equity <file>   Write the equity curve as CSV\n";
    std::cout << "  --verbose         Enable debug logging\n";
    std::cout << "  --help            Show this help message\n";
}

void print_metrics(const BacktestReport& report)
{
    std::cout << "\nResults for " << (report.symbol.empty() ? "<unnamed>" : report.symbol) << "\n";
    std::cout << "==============================\n";
    std::cout << std::fixed << std::setprecision(4);
    for (const auto& [key, value] : report.metrics.ToMap()) {
        std::cout << std::left << std::setw(16) << key << value << "\n";
    }
    std::cout << std::left << std::setw(16) << "ledger_entries" << report.simulation.trades.size() << "\n";
}

} // anonymous namespace

int main(int argc, char** argv)
{
    if (argc < 3) {
        print_usage(argv[0]);
        return 1;
    }

    std::string ohlcv_file = argv[1];
    std::string config_file = argv[2];
    std::string trades_file;
    std::string equity_file;

    for (int i = 3; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--trades" && i + 1 < argc) {
            trades_file = argv[++i];
        } else if (arg == "--equity" && i + 1 < argc) {
            equity_file = argv[++i];
        } else if (arg == "--verbose" || arg == "-v") {
            Logger::set_level(LogLevel::Debug);
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    std::string error;
    RunConfig config;
    if (!LoadRunConfigFromFile(config_file, &config, &error)) {
        Logger::error("run_backtest", error);
        return 1;
    }
    if (config.strategy.type == StrategyType::Signals) {
        Logger::error("run_backtest", "Strategy 'signals' needs caller-supplied signals; "
                                      "use ma_crossover or volatility_breakout");
        return 1;
    }

    BarSeries bars;
    if (!OHLCVParser::parse_file(ohlcv_file, &bars, &error)) {
        Logger::error("run_backtest", error);
        return 1;
    }

    BacktestRunner runner;
    BacktestReport report = runner.run(bars, config);
    if (!report.success) {
        return 1;
    }

    print_metrics(report);

    if (!trades_file.empty() && !write_trades_csv(trades_file, report.simulation.trades, &error)) {
        Logger::error("run_backtest", error);
        return 1;
    }
    if (!equity_file.empty() && !write_equity_csv(equity_file, report.simulation.equity_curve, &error)) {
        Logger::error("run_backtest", error);
        return 1;
    }

    return 0;
}
