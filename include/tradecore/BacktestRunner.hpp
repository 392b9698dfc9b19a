#pragma once

#include "tradecore/PerformanceMetrics.hpp"
#include "tradecore/RunConfig.hpp"
#include "tradecore/Series.hpp"
#include "tradecore/TradeSimulator.hpp"

#include <span>
#include <string>
#include <vector>

namespace tradecore {

struct BacktestReport {
    bool success = false;
    std::string error_message;

    std::string symbol;
    std::vector<int> signals;
    SimulationResult simulation;
    tradecore::metrics::PerformanceMetrics::BacktestMetrics metrics;
};

/// Maps the risk section onto simulator settings. ATR mode when
/// atr_stop_multiplier > 0, fixed-percentage mode otherwise.
TradeSimulatorConfig resolve_simulator_config(const RunConfig& config);

/// ATR over the bars with warm-up NaN replaced by 0.
Series stop_atr(const BarSeries& bars, int period);

class BacktestRunner {
public:
    /// Builds signals for the configured strategy (or takes external_signals for
    /// StrategyType::Signals), runs the simulator and computes metrics.
    BacktestReport run(const BarSeries& bars,
                       const RunConfig& config,
                       std::span<const int> external_signals = {}) const;
};

} // namespace tradecore
