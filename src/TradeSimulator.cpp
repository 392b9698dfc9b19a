#include "tradecore/TradeSimulator.hpp"

#include "tradecore/Errors.hpp"
#include "tradecore/Logger.hpp"

#include <cmath>
#include <sstream>
#include <string>

namespace tradecore {

namespace {

struct BarInputs {
    std::span<const std::int64_t> timestamps;
    std::span<const double> open;
    std::span<const double> high;
    std::span<const double> low;
    std::span<const double> close;
    std::span<const int> signals;
    std::span<const double> atr;
};

// Mutable state of one simulation call; never outlives it.
struct SimulationState {
    PositionSide side = PositionSide::Flat;
    double cash = 0.0;
    double entry_price = 0.0;
    std::int64_t entry_ts = 0;
    double entry_atr = 0.0;
};

struct ExitLevels {
    double stop_loss;
    double take_profit;
};

void validate_inputs(const BarInputs& in, bool use_atr)
{
    const std::size_t n = in.timestamps.size();
    auto check = [n](std::size_t size, const char* name) {
        if (size != n) {
            throw InvalidArgument(std::string("simulate_trades: ") + name + " length "
                                  + std::to_string(size) + " does not match timestamp length "
                                  + std::to_string(n));
        }
    };

    check(in.open.size(), "open");
    check(in.high.size(), "high");
    check(in.low.size(), "low");
    check(in.close.size(), "close");
    check(in.signals.size(), "signals");

    if (use_atr) {
        if (in.atr.empty() && n > 0) {
            throw InvalidArgument("simulate_trades: ATR series is required when ATR stops are enabled");
        }
        check(in.atr.size(), "atr");
    }
}

ExitLevels exit_levels(const SimulationState& state, const TradeSimulatorConfig& config)
{
    const double sign = side_sign(state.side);
    if (config.stop_mode == StopMode::AtrMultiple) {
        const double sl_distance = state.entry_atr * config.sl_value;
        const double tp_distance = state.entry_atr * config.tp_value;
        return {state.entry_price - sign * sl_distance, state.entry_price + sign * tp_distance};
    }
    return {state.entry_price * (1.0 - sign * config.sl_value),
            state.entry_price * (1.0 + sign * config.tp_value)};
}

void close_position(SimulationState& state, std::vector<Trade>& trades,
                    std::int64_t exit_ts, double exit_price, ExitReason reason)
{
    Trade trade;
    trade.entry_ts = state.entry_ts;
    trade.exit_ts = exit_ts;
    trade.entry_price = state.entry_price;
    trade.exit_price = exit_price;
    trade.pnl = (exit_price - state.entry_price) * side_sign(state.side);
    trade.exit_reason = reason;
    trade.side = state.side;

    state.cash += trade.pnl;
    trades.push_back(trade);

    state.side = PositionSide::Flat;
    state.entry_price = 0.0;
    state.entry_ts = 0;
    state.entry_atr = 0.0;
}

void open_position(SimulationState& state, PositionSide side, std::int64_t ts,
                   double price, double entry_atr)
{
    state.side = side;
    state.entry_price = price;
    state.entry_ts = ts;
    state.entry_atr = entry_atr;
}

// Step 1: intrabar stop-loss / take-profit. Stop-loss is checked first and wins ties.
void check_exit(SimulationState& state, std::vector<Trade>& trades, const BarInputs& in,
                std::size_t i, const TradeSimulatorConfig& config)
{
    if (state.side == PositionSide::Flat) {
        return;
    }

    const ExitLevels levels = exit_levels(state, config);
    const double bar_open = in.open[i];
    const bool take_profit_armed = config.tp_value > 0.0;

    if (state.side == PositionSide::Long) {
        if (in.low[i] <= levels.stop_loss) {
            const double fill = bar_open < levels.stop_loss ? bar_open : levels.stop_loss;
            close_position(state, trades, in.timestamps[i], fill, ExitReason::StopLoss);
        } else if (take_profit_armed && in.high[i] >= levels.take_profit) {
            const double fill = bar_open > levels.take_profit ? bar_open : levels.take_profit;
            close_position(state, trades, in.timestamps[i], fill, ExitReason::TakeProfit);
        }
    } else {
        if (in.high[i] >= levels.stop_loss) {
            const double fill = bar_open > levels.stop_loss ? bar_open : levels.stop_loss;
            close_position(state, trades, in.timestamps[i], fill, ExitReason::StopLoss);
        } else if (take_profit_armed && in.low[i] <= levels.take_profit) {
            const double fill = bar_open < levels.take_profit ? bar_open : levels.take_profit;
            close_position(state, trades, in.timestamps[i], fill, ExitReason::TakeProfit);
        }
    }
}

// Step 2: flip on an opposite signal, then enter at the close if flat.
void apply_signal(SimulationState& state, std::vector<Trade>& trades, const BarInputs& in,
                  std::size_t i, const TradeSimulatorConfig& config)
{
    const Signal signal = to_signal(in.signals[i]);
    if (signal == Signal::None) {
        return;
    }

    const double price = in.close[i];
    const std::int64_t ts = in.timestamps[i];

    const bool opposite = (state.side == PositionSide::Long && signal == Signal::Sell)
                       || (state.side == PositionSide::Short && signal == Signal::Buy);
    if (opposite) {
        close_position(state, trades, ts, price, ExitReason::SignalFlip);
    }

    if (state.side != PositionSide::Flat) {
        return;
    }

    const double entry_atr = config.stop_mode == StopMode::AtrMultiple ? in.atr[i] : 0.0;
    if (signal == Signal::Buy) {
        open_position(state, PositionSide::Long, ts, price, entry_atr);
    } else if (config.allow_short) {
        open_position(state, PositionSide::Short, ts, price, entry_atr);
    }
}

SimulationResult run_simulation(const BarInputs& in, const TradeSimulatorConfig& config)
{
    validate_inputs(in, config.stop_mode == StopMode::AtrMultiple);

    const std::size_t n = in.timestamps.size();
    SimulationResult result;
    result.equity_curve.reserve(n);

    SimulationState state;
    state.cash = config.starting_cash;

    for (std::size_t i = 0; i < n; ++i) {
        check_exit(state, result.trades, in, i, config);
        apply_signal(state, result.trades, in, i, config);

        const double unrealized = state.side == PositionSide::Flat
            ? 0.0
            : (in.close[i] - state.entry_price) * side_sign(state.side);
        result.equity_curve.push_back({in.timestamps[i], state.cash + unrealized});
    }

    if (Logger::enabled(LogLevel::Debug)) {
        std::ostringstream oss;
        oss << "Completed: " << n << " bars, " << result.trades.size() << " trades, final equity "
            << (result.equity_curve.empty() ? config.starting_cash : result.equity_curve.back().equity)
            << ", open position: " << to_string(state.side);
        Logger::debug("TradeSimulator", oss.str());
    }

    return result;
}

} // namespace

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
                                 std::span<const double> atr,
                                 double starting_cash)
{
    TradeSimulatorConfig config;
    config.sl_value = sl_value;
    config.tp_value = tp_value;
    config.allow_short = allow_short;
    config.stop_mode = use_atr ? StopMode::AtrMultiple : StopMode::FixedPercent;
    config.starting_cash = starting_cash;

    return run_simulation({timestamps, open, high, low, close, signals, atr}, config);
}

SimulationResult simulate_trades_fixed(std::span<const std::int64_t> timestamps,
                                       std::span<const double> open,
                                       std::span<const double> high,
                                       std::span<const double> low,
                                       std::span<const double> close,
                                       std::span<const int> signals,
                                       double sl_pct,
                                       double tp_pct,
                                       bool allow_short,
                                       double starting_cash)
{
    return simulate_trades(timestamps, open, high, low, close, signals,
                           sl_pct, tp_pct, allow_short, false, {}, starting_cash);
}

SimulationResult simulate_trades(const BarSeries& bars,
                                 std::span<const int> signals,
                                 const TradeSimulatorConfig& config,
                                 std::span<const double> atr)
{
    return run_simulation({bars.timestamp, bars.open, bars.high, bars.low, bars.close, signals, atr},
                          config);
}

} // namespace tradecore
