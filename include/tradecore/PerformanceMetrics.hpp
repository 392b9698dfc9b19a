#pragma once

#include "tradecore/TradeTypes.hpp"

#include <map>
#include <string>
#include <vector>

namespace tradecore {
namespace metrics {

// Summary statistics of one simulation run
class PerformanceMetrics {
public:
    struct BacktestMetrics {
        // Equity metrics
        double total_return = 0.0;    // final / initial - 1
        double max_drawdown = 0.0;    // largest peak-relative decline, positive fraction
        double sharpe = 0.0;          // annualized, zero risk-free rate

        // Trade metrics (trades with pnl == 0 are ignored)
        double win_rate = 0.0;
        double avg_win = 0.0;
        double avg_loss = 0.0;        // positive magnitude
        int total_trades = 0;
        double profit_factor = 0.0;   // 0 when there are no losing trades
        double expectancy = 0.0;      // mean pnl over the whole ledger

        std::map<std::string, double> ToMap() const {
            return {
                {"total_return", total_return},
                {"max_drawdown", max_drawdown},
                {"sharpe", sharpe},
                {"win_rate", win_rate},
                {"avg_win", avg_win},
                {"avg_loss", avg_loss},
                {"total_trades", static_cast<double>(total_trades)},
                {"profit_factor", profit_factor},
                {"expectancy", expectancy}
            };
        }
    };

    static BacktestMetrics Calculate(const std::vector<EquityPoint>& equity_curve,
                                     const std::vector<Trade>& trades);

    static double CalculateTotalReturn(const std::vector<EquityPoint>& equity_curve);
    static double CalculateMaxDrawdown(const std::vector<EquityPoint>& equity_curve);

    // Timestamps are in seconds. The annualization factor is
    // sqrt(365 * 86400 / median bar spacing), or sqrt(365) without a usable spacing.
    static double CalculateSharpeRatio(const std::vector<EquityPoint>& equity_curve);
    static double AnnualizationFactor(const std::vector<EquityPoint>& equity_curve);

    static void CalculateTradeMetrics(const std::vector<Trade>& trades, BacktestMetrics& metrics);

    // Bar-to-bar simple returns; bars whose predecessor is not positive are skipped
    static std::vector<double> CalculateReturns(const std::vector<EquityPoint>& equity_curve);
};

} // namespace metrics
} // namespace tradecore
