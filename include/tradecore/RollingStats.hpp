#pragma once

#include "tradecore/Series.hpp"

#include <cstddef>
#include <span>

namespace tradecore {

/**
 * @brief Trailing mean over windows that are completely free of NaN
 *
 * Keeps a running sum and a running count of non-NaN values. Index i is defined
 * only when all `window` trailing positions are finite; otherwise NaN.
 * A zero window yields an all-NaN series of the input's length.
 */
Series rolling_mean(std::span<const double> values, std::size_t window);

/**
 * @brief Exponential smoothing with alpha = 2 / (period + 1)
 *
 * The recursion is seeded with values[0] and runs from index 0, but output is
 * only emitted from index period - 1. A NaN input poisons every later value.
 */
Series ema_recursion(std::span<const double> values, std::size_t period);

/**
 * @brief Sample standard deviation over the trailing `period` raw positions
 *
 * NaN entries are skipped. Two-pass per index: mean, then squared deviations.
 * One finite sample gives 0, none gives NaN.
 */
Series rolling_stddev(std::span<const double> values, std::size_t period);

} // namespace tradecore
