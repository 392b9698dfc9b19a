#include "tradecore/RollingStats.hpp"

#include <cmath>

namespace tradecore {

Series rolling_mean(std::span<const double> values, std::size_t window)
{
    const std::size_t n = values.size();
    Series out(n, kNaN);
    if (window == 0 || n == 0) {
        return out;
    }

    double sum = 0.0;
    std::size_t count = 0;

    for (std::size_t i = 0; i < n; ++i) {
        const double v = values[i];
        if (!std::isnan(v)) {
            sum += v;
            ++count;
        }
        if (i >= window) {
            const double evicted = values[i - window];
            if (!std::isnan(evicted)) {
                sum -= evicted;
                --count;
            }
        }
        if (count == window) {
            out[i] = sum / static_cast<double>(count);
        }
    }

    return out;
}

Series ema_recursion(std::span<const double> values, std::size_t period)
{
    const std::size_t n = values.size();
    Series out(n, kNaN);
    if (period == 0 || n == 0) {
        return out;
    }

    const double alpha = 2.0 / (static_cast<double>(period) + 1.0);
    double ema = values[0];

    for (std::size_t i = 0; i < n; ++i) {
        if (i > 0) {
            ema = alpha * values[i] + (1.0 - alpha) * ema;
        }
        if (i + 1 >= period) {
            out[i] = ema;
        }
    }

    return out;
}

Series rolling_stddev(std::span<const double> values, std::size_t period)
{
    const std::size_t n = values.size();
    Series out(n, kNaN);
    if (period == 0 || n == 0) {
        return out;
    }

    for (std::size_t i = period - 1; i < n; ++i) {
        const std::size_t start = i + 1 - period;

        double sum = 0.0;
        std::size_t count = 0;
        for (std::size_t j = start; j <= i; ++j) {
            if (!std::isnan(values[j])) {
                sum += values[j];
                ++count;
            }
        }
        if (count == 0) {
            continue;
        }
        if (count == 1) {
            out[i] = 0.0;
            continue;
        }

        const double mean = sum / static_cast<double>(count);
        double sum_sq = 0.0;
        for (std::size_t j = start; j <= i; ++j) {
            if (!std::isnan(values[j])) {
                const double diff = values[j] - mean;
                sum_sq += diff * diff;
            }
        }
        out[i] = std::sqrt(sum_sq / static_cast<double>(count - 1));
    }

    return out;
}

} // namespace tradecore
