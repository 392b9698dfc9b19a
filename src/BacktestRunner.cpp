#include "tradecore/BacktestRunner.hpp"

#include "tradecore/Errors.hpp"
#include "tradecore/Indicators.hpp"
#include "tradecore/Logger.hpp"
#include "tradecore/SignalGenerators.hpp"

#include <cmath>
#include <sstream>
#include <utility>

namespace tradecore {

namespace {

BacktestReport make_error(const RunConfig& config, std::string message)
{
    BacktestReport report;
    report.symbol = config.symbol;
    report.success = false;
    report.error_message = std::move(message);
    Logger::error("BacktestRunner", report.error_message);
    return report;
}

std::vector<int> build_signals(const BarSeries& bars, const StrategyConfig& strategy)
{
    switch (strategy.type) {
        case StrategyType::MaCrossover:
            return ma_crossover_signals(bars.close,
                                        static_cast<std::size_t>(strategy.short_window),
                                        static_cast<std::size_t>(strategy.long_window));
        case StrategyType::VolatilityBreakout:
            return volatility_breakout_signals(bars.close,
                                               static_cast<std::size_t>(strategy.window),
                                               strategy.k);
        case StrategyType::Signals:
            break;
    }
    return {};
}

} // namespace

TradeSimulatorConfig resolve_simulator_config(const RunConfig& config)
{
    TradeSimulatorConfig sim;
    sim.allow_short = config.allow_short;
    sim.starting_cash = config.initial_equity;
    if (config.risk.uses_atr()) {
        sim.stop_mode = StopMode::AtrMultiple;
        sim.sl_value = config.risk.atr_stop_multiplier;
        sim.tp_value = config.risk.take_profit;
    } else {
        sim.stop_mode = StopMode::FixedPercent;
        sim.sl_value = config.risk.stop_loss;
        sim.tp_value = config.risk.take_profit;
    }
    return sim;
}

Series stop_atr(const BarSeries& bars, int period)
{
    if (period <= 0) {
        throw InvalidArgument("stop_atr: atr_period must be greater than 0");
    }
    Series values = atr(bars.high, bars.low, bars.close, static_cast<std::size_t>(period));
    for (double& v : values) {
        if (std::isnan(v)) {
            v = 0.0;
        }
    }
    return values;
}

BacktestReport BacktestRunner::run(const BarSeries& bars,
                                   const RunConfig& config,
                                   std::span<const int> external_signals) const
{
    if (!bars.aligned()) {
        return make_error(config, "Input series vectors must share identical length.");
    }

    BacktestReport report;
    report.symbol = config.symbol;

    try {
        if (config.strategy.type == StrategyType::Signals) {
            if (external_signals.size() != bars.size()) {
                return make_error(config, "Strategy 'signals' needs one signal per bar ("
                                              + std::to_string(external_signals.size()) + " given, "
                                              + std::to_string(bars.size()) + " bars).");
            }
            report.signals.assign(external_signals.begin(), external_signals.end());
        } else {
            report.signals = build_signals(bars, config.strategy);
        }

        const TradeSimulatorConfig sim = resolve_simulator_config(config);
        Series atr_values;
        if (sim.stop_mode == StopMode::AtrMultiple) {
            atr_values = stop_atr(bars, config.risk.atr_period);
        }

        report.simulation = simulate_trades(bars, report.signals, sim, atr_values);
    } catch (const InvalidArgument& ex) {
        return make_error(config, ex.what());
    }

    report.metrics = metrics::PerformanceMetrics::Calculate(report.simulation.equity_curve,
                                                            report.simulation.trades);
    report.success = true;

    std::ostringstream oss;
    oss << (config.symbol.empty() ? std::string("<unnamed>") : config.symbol)
        << " " << to_string(config.strategy.type) << ": " << bars.size() << " bars, "
        << report.metrics.total_trades << " trades, total_return " << report.metrics.total_return
        << ", max_drawdown " << report.metrics.max_drawdown << ", sharpe " << report.metrics.sharpe;
    Logger::info("BacktestRunner", oss.str());

    return report;
}

} // namespace tradecore
