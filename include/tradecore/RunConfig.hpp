#pragma once

#include "tradecore/TradeSimulator.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace tradecore {

enum class StrategyType {
    MaCrossover,
    VolatilityBreakout,
    Signals        // signals are supplied by the caller
};

std::string_view to_string(StrategyType type);

struct StrategyConfig {
    StrategyType type = StrategyType::MaCrossover;
    int short_window = 5;
    int long_window = 20;
    int window = 20;
    double k = 2.0;
};

// Fixed mode uses stop_loss / take_profit as fractions of the entry price.
// ATR mode is selected by atr_stop_multiplier > 0; take_profit is then read
// as a multiple of the entry ATR.
struct RiskConfig {
    double stop_loss = 0.05;
    double take_profit = 0.1;
    double atr_stop_multiplier = 0.0;
    int atr_period = 14;

    [[nodiscard]] bool uses_atr() const { return atr_stop_multiplier > 0.0; }
};

struct RunConfig {
    std::string symbol;
    double initial_equity = kDefaultStartingCash;
    bool allow_short = false;
    StrategyConfig strategy;
    RiskConfig risk;

    [[nodiscard]] std::string ToJsonString() const;
};

bool ParseRunConfig(const std::string& json_text,
                    RunConfig* config,
                    std::string* error = nullptr);

bool LoadRunConfigFromFile(const std::filesystem::path& file_path,
                           RunConfig* config,
                           std::string* error = nullptr);

} // namespace tradecore
