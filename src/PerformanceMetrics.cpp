#include "tradecore/PerformanceMetrics.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace tradecore {
namespace metrics {

namespace {

constexpr double kDaysPerYear = 365.0;
constexpr double kSecondsPerDay = 86400.0;

} // namespace

PerformanceMetrics::BacktestMetrics PerformanceMetrics::Calculate(
    const std::vector<EquityPoint>& equity_curve,
    const std::vector<Trade>& trades) {

    BacktestMetrics metrics;
    metrics.total_return = CalculateTotalReturn(equity_curve);
    metrics.max_drawdown = CalculateMaxDrawdown(equity_curve);
    metrics.sharpe = CalculateSharpeRatio(equity_curve);
    CalculateTradeMetrics(trades, metrics);
    return metrics;
}

double PerformanceMetrics::CalculateTotalReturn(const std::vector<EquityPoint>& equity_curve) {
    if (equity_curve.empty()) {
        return 0.0;
    }
    const double initial = equity_curve.front().equity;
    if (initial == 0.0) {
        return 0.0;
    }
    return equity_curve.back().equity / initial - 1.0;
}

double PerformanceMetrics::CalculateMaxDrawdown(const std::vector<EquityPoint>& equity_curve) {
    double peak = 0.0;
    double max_dd = 0.0;
    bool have_peak = false;

    for (const auto& point : equity_curve) {
        if (!have_peak || point.equity > peak) {
            peak = point.equity;
            have_peak = true;
        }
        if (peak > 0.0) {
            max_dd = std::max(max_dd, (peak - point.equity) / peak);
        }
    }
    return max_dd;
}

std::vector<double> PerformanceMetrics::CalculateReturns(const std::vector<EquityPoint>& equity_curve) {
    std::vector<double> returns;
    if (equity_curve.size() < 2) {
        return returns;
    }
    returns.reserve(equity_curve.size() - 1);
    for (size_t i = 1; i < equity_curve.size(); ++i) {
        const double prev = equity_curve[i - 1].equity;
        if (prev > 0.0) {
            returns.push_back(equity_curve[i].equity / prev - 1.0);
        }
    }
    return returns;
}

double PerformanceMetrics::AnnualizationFactor(const std::vector<EquityPoint>& equity_curve) {
    std::vector<double> deltas;
    for (size_t i = 1; i < equity_curve.size(); ++i) {
        const auto dt = equity_curve[i].timestamp - equity_curve[i - 1].timestamp;
        if (dt > 0) {
            deltas.push_back(static_cast<double>(dt));
        }
    }
    if (deltas.empty()) {
        return std::sqrt(kDaysPerYear);
    }

    std::sort(deltas.begin(), deltas.end());
    const size_t mid = deltas.size() / 2;
    const double median = deltas.size() % 2 == 0
        ? (deltas[mid - 1] + deltas[mid]) / 2.0
        : deltas[mid];
    return std::sqrt(kDaysPerYear * kSecondsPerDay / median);
}

double PerformanceMetrics::CalculateSharpeRatio(const std::vector<EquityPoint>& equity_curve) {
    const std::vector<double> returns = CalculateReturns(equity_curve);
    if (returns.empty()) {
        return 0.0;
    }

    const double mean = std::accumulate(returns.begin(), returns.end(), 0.0) / returns.size();
    double variance = 0.0;
    for (double r : returns) {
        variance += (r - mean) * (r - mean);
    }
    variance /= returns.size();
    const double sigma = std::sqrt(variance);
    if (sigma == 0.0) {
        return 0.0;
    }
    return mean / sigma * AnnualizationFactor(equity_curve);
}

void PerformanceMetrics::CalculateTradeMetrics(const std::vector<Trade>& trades, BacktestMetrics& metrics) {
    double gross_win = 0.0;
    double gross_loss = 0.0;
    double total_pnl = 0.0;
    int wins = 0;
    int losses = 0;

    for (const auto& trade : trades) {
        total_pnl += trade.pnl;
        if (trade.pnl > 0.0) {
            gross_win += trade.pnl;
            ++wins;
        } else if (trade.pnl < 0.0) {
            gross_loss += -trade.pnl;
            ++losses;
        }
    }

    metrics.total_trades = wins + losses;
    metrics.win_rate = metrics.total_trades > 0 ? static_cast<double>(wins) / metrics.total_trades : 0.0;
    metrics.avg_win = wins > 0 ? gross_win / wins : 0.0;
    metrics.avg_loss = losses > 0 ? gross_loss / losses : 0.0;
    metrics.profit_factor = gross_loss > 0.0 ? gross_win / gross_loss : 0.0;
    metrics.expectancy = trades.empty() ? 0.0 : total_pnl / trades.size();
}

} // namespace metrics
} // namespace tradecore
