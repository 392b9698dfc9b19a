#pragma once

#include "tradecore/Series.hpp"

#include <cstddef>
#include <span>

namespace tradecore {

// All indicators return a series of the input's length with a NaN warm-up region.
// A zero window/period throws InvalidArgument.

/// Plain trailing average: running sum divided by `window`. Not NaN-aware.
Series sma(std::span<const double> values, std::size_t window);

/// RSI from simple (rolling_mean) averages of gains and losses.
Series rsi(std::span<const double> values, std::size_t period);

/// Average true range. Output length is the shortest of the three inputs.
Series atr(std::span<const double> high, std::span<const double> low,
           std::span<const double> close, std::size_t period);

Series ema(std::span<const double> values, std::size_t period);

Series stddev(std::span<const double> values, std::size_t period);

/// True range per bar; bar 0 is high - low.
Series true_range(std::span<const double> high, std::span<const double> low,
                  std::span<const double> close);

} // namespace tradecore
