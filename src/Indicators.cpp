#include "tradecore/Indicators.hpp"

#include "tradecore/Errors.hpp"
#include "tradecore/RollingStats.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace tradecore {

namespace {

void require_positive(std::size_t value, const char* what, const char* indicator)
{
    if (value == 0) {
        throw InvalidArgument(std::string(indicator) + ": " + what + " must be greater than 0");
    }
}

} // namespace

Series sma(std::span<const double> values, std::size_t window)
{
    require_positive(window, "window", "SMA");

    const std::size_t n = values.size();
    Series out(n, kNaN);

    double sum = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        sum += values[i];
        if (i >= window) {
            sum -= values[i - window];
        }
        if (i + 1 >= window) {
            out[i] = sum / static_cast<double>(window);
        }
    }

    return out;
}

Series rsi(std::span<const double> values, std::size_t period)
{
    require_positive(period, "period", "RSI");

    const std::size_t n = values.size();
    Series gains(n, kNaN);
    Series losses(n, kNaN);

    for (std::size_t i = 1; i < n; ++i) {
        const double delta = values[i] - values[i - 1];
        if (std::isnan(delta)) {
            continue;
        }
        gains[i] = std::max(delta, 0.0);
        losses[i] = std::max(-delta, 0.0);
    }

    const Series avg_gain = rolling_mean(gains, period);
    const Series avg_loss = rolling_mean(losses, period);

    Series out(n, kNaN);
    for (std::size_t i = 0; i < n; ++i) {
        const double g = avg_gain[i];
        const double l = avg_loss[i];
        if (std::isnan(g) || std::isnan(l)) {
            continue;
        }
        if (l == 0.0) {
            out[i] = 100.0;
        } else {
            out[i] = 100.0 - 100.0 / (1.0 + g / l);
        }
    }

    return out;
}

Series true_range(std::span<const double> high, std::span<const double> low,
                  std::span<const double> close)
{
    const std::size_t n = std::min({high.size(), low.size(), close.size()});
    Series tr(n, kNaN);

    for (std::size_t i = 0; i < n; ++i) {
        const double range = high[i] - low[i];
        if (i == 0) {
            tr[i] = range;
            continue;
        }

        // A NaN previous close drops the gap terms; a NaN high-low range stays NaN.
        const double prev_close = close[i - 1];
        const double up_gap = std::fabs(high[i] - prev_close);
        const double down_gap = std::fabs(low[i] - prev_close);

        double best = range;
        if (!std::isnan(up_gap) && up_gap > best) {
            best = up_gap;
        }
        if (!std::isnan(down_gap) && down_gap > best) {
            best = down_gap;
        }
        tr[i] = best;
    }

    return tr;
}

Series atr(std::span<const double> high, std::span<const double> low,
           std::span<const double> close, std::size_t period)
{
    require_positive(period, "period", "ATR");
    return rolling_mean(true_range(high, low, close), period);
}

Series ema(std::span<const double> values, std::size_t period)
{
    require_positive(period, "period", "EMA");
    return ema_recursion(values, period);
}

Series stddev(std::span<const double> values, std::size_t period)
{
    require_positive(period, "period", "STDDEV");
    return rolling_stddev(values, period);
}

} // namespace tradecore
