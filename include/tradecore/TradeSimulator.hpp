#pragma once

#include "tradecore/Series.hpp"
#include "tradecore/TradeTypes.hpp"

#include <cstdint>
#include <span>

namespace tradecore {

constexpr double kDefaultStartingCash = 10000.0;

enum class StopMode {
    FixedPercent,   // sl/tp are fractions of the entry price
    AtrMultiple     // sl/tp are multiples of the ATR sampled at entry
};

struct TradeSimulatorConfig {
    double sl_value = 0.0;
    double tp_value = 0.0;     // take profit is only armed when > 0
    bool allow_short = false;
    StopMode stop_mode = StopMode::FixedPercent;
    double starting_cash = kDefaultStartingCash;
};

/**
 * @brief Single-pass bar simulation with intrabar stop-loss / take-profit
 *
 * Per bar: exit check (SL before TP, gap-aware fills), signal application
 * (flip on an opposite signal, entry at the close when flat), equity mark.
 * Positions still open after the last bar are not closed.
 *
 * When use_atr is true the atr series must match the bar count; the value at the
 * entry bar is frozen for the life of the position.
 *
 * @throws InvalidArgument on misaligned inputs or a missing ATR series.
 */
SimulationResult simulate_trades(std::span<const std::int64_t> timestamps,
                                 std::span<const double> open,
                                 std::span<const double> high,
                                 std::span<const double> low,
                                 std::span<const double> close,
                                 std::span<const int> signals,
                                 double sl_value,
                                 double tp_value,
                                 bool allow_short,
                                 bool use_atr,
                                 std::span<const double> atr = {},
                                 double starting_cash = kDefaultStartingCash);

/// Fixed-percentage variant; no ATR input.
SimulationResult simulate_trades_fixed(std::span<const std::int64_t> timestamps,
                                       std::span<const double> open,
                                       std::span<const double> high,
                                       std::span<const double> low,
                                       std::span<const double> close,
                                       std::span<const int> signals,
                                       double sl_pct,
                                       double tp_pct,
                                       bool allow_short,
                                       double starting_cash = kDefaultStartingCash);

SimulationResult simulate_trades(const BarSeries& bars,
                                 std::span<const int> signals,
                                 const TradeSimulatorConfig& config,
                                 std::span<const double> atr = {});

} // namespace tradecore
