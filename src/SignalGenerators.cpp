#include "tradecore/SignalGenerators.hpp"

#include "tradecore/Indicators.hpp"

namespace tradecore {

std::vector<int> ma_crossover_signals(std::span<const double> close,
                                      std::size_t short_window,
                                      std::size_t long_window)
{
    const Series fast = sma(close, short_window);
    const Series slow = sma(close, long_window);

    const std::size_t n = close.size();
    std::vector<int> signals(n, 0);

    // NaN comparisons are false, so the warm-up region counts as "not above".
    bool prev_above = n > 0 && fast[0] > slow[0];
    for (std::size_t i = 1; i < n; ++i) {
        const bool above = fast[i] > slow[i];
        signals[i] = static_cast<int>(above) - static_cast<int>(prev_above);
        prev_above = above;
    }
    return signals;
}

std::vector<int> volatility_breakout_signals(std::span<const double> close,
                                             std::size_t window,
                                             double k)
{
    const Series mid = sma(close, window);
    const Series sd = stddev(close, window);

    const std::size_t n = close.size();
    std::vector<int> signals(n, 0);

    for (std::size_t i = 1; i < n; ++i) {
        const double upper = mid[i] + k * sd[i];
        const double lower = mid[i] - k * sd[i];
        const double prev_upper = mid[i - 1] + k * sd[i - 1];
        const double prev_lower = mid[i - 1] - k * sd[i - 1];

        if (close[i] > upper && close[i - 1] <= prev_upper) {
            signals[i] = 1;
        } else if (close[i] < lower && close[i - 1] >= prev_lower) {
            signals[i] = -1;
        }
    }
    return signals;
}

} // namespace tradecore
