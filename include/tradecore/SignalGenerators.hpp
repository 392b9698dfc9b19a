#pragma once

#include <cstddef>
#include <span>
#include <vector>

namespace tradecore {

// Signal series are index-aligned with the input: +1 buy, -1 sell, 0 nothing.

/// Edges of the regime sma(short) > sma(long). Bar 0 never signals.
std::vector<int> ma_crossover_signals(std::span<const double> close,
                                      std::size_t short_window,
                                      std::size_t long_window);

/// Bollinger-style breakout: buy when close crosses above sma + k*stddev,
/// sell when it crosses below sma - k*stddev.
std::vector<int> volatility_breakout_signals(std::span<const double> close,
                                             std::size_t window,
                                             double k);

} // namespace tradecore
