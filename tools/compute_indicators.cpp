// compute_indicators: evaluates every definition in a definitions file over an
// OHLCV bar file and writes one CSV column per successful indicator.
// Exits with 2 when some indicators failed and the rest were still written.
//
//   compute_indicators bars.csv config/indicators.txt indicators.csv --parallel

#include "tradecore/DataParsers.hpp"
#include "tradecore/IndicatorConfig.hpp"
#include "tradecore/IndicatorEngine.hpp"
#include "tradecore/Logger.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string_view>
#include <utility>

using namespace tradecore;

namespace {

constexpr const char* kUsage = R"(<ohlcv_file> <definitions_file> <output_file> [options]

Options:
  --parallel        Compute indicators concurrently
  --quiet           Only log warnings and errors
  --help            Show this help message

Definitions file format:
  VARIABLE_NAME: INDICATOR_TYPE period [--source=close|open|high|low]

  SMA_20: SMA 20
  RSI_14: RSI 14
  EMA_HIGH: EMA 10 --source=high
)";

struct CommandLine {
    std::string ohlcv_file;
    std::string definitions_file;
    std::string output_file;
    ExecutionOptions options;
};

// Returns an exit code when the program should stop before computing.
std::optional<int> parse_command_line(int argc, char** argv, CommandLine* cmd)
{
    auto usage = [&](std::ostream& out) { out << "Usage: " << argv[0] << " " << kUsage; };

    for (int i = 1; i < argc; ++i) {
        if (std::string_view(argv[i]) == "--help" || std::string_view(argv[i]) == "-h") {
            usage(std::cout);
            return 0;
        }
    }
    if (argc < 4) {
        usage(std::cerr);
        return 1;
    }

    cmd->ohlcv_file = argv[1];
    cmd->definitions_file = argv[2];
    cmd->output_file = argv[3];
    for (int i = 4; i < argc; ++i) {
        const std::string_view flag = argv[i];
        if (flag == "--parallel") {
            cmd->options.parallel = true;
        } else if (flag == "--quiet" || flag == "-q") {
            Logger::set_level(LogLevel::Warning);
        } else {
            std::cerr << "Unknown option: " << flag << "\n";
            usage(std::cerr);
            return 1;
        }
    }
    return std::nullopt;
}

} // namespace

int main(int argc, char** argv)
{
    CommandLine cmd;
    if (auto exit_code = parse_command_line(argc, argv, &cmd)) {
        return *exit_code;
    }
    const auto started = std::chrono::steady_clock::now();

    BarSeries bars;
    std::string error;
    if (!OHLCVParser::parse_file(cmd.ohlcv_file, &bars, &error)) {
        Logger::error("compute_indicators", error);
        return 1;
    }

    ConfigParseResult parsed = IndicatorConfigParser::parse_file(cmd.definitions_file);
    if (!parsed.success) {
        Logger::error("compute_indicators", parsed.error_message);
        return 1;
    }
    Logger::info("compute_indicators", "Parsed " + std::to_string(parsed.parsed_indicators)
                                           + " indicator definitions from " + cmd.definitions_file);

    IndicatorEngine engine;
    auto results = engine.compute(bars, parsed.definitions, cmd.options);

    std::vector<std::string> names;
    std::vector<std::vector<double>> columns;
    int failed = 0;
    for (auto& result : results) {
        if (!result.success) {
            ++failed;
            continue;
        }
        names.push_back(result.name);
        columns.push_back(std::move(result.values));
    }

    if (!IndicatorResultWriter::write_csv(cmd.output_file, names, columns, bars.timestamp, &error)) {
        Logger::error("compute_indicators", error);
        return 1;
    }

    const double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();

    std::ostringstream oss;
    oss << "Wrote " << names.size() << " columns x " << bars.size() << " bars to " << cmd.output_file
        << " in " << std::fixed << std::setprecision(2) << elapsed << " seconds";
    Logger::info("compute_indicators", oss.str());

    if (failed > 0) {
        Logger::warning("compute_indicators", std::to_string(failed) + " indicator(s) failed");
        return 2;
    }
    return 0;
}
