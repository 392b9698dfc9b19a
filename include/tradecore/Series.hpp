#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <vector>

namespace tradecore {

using Series = std::vector<double>;

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

/// Column-oriented OHLC bars, index-aligned. Volume is optional and may be empty.
struct BarSeries {
    std::vector<std::int64_t> timestamp;
    std::vector<double> open;
    std::vector<double> high;
    std::vector<double> low;
    std::vector<double> close;
    std::vector<double> volume;

    std::size_t size() const noexcept { return close.size(); }
    bool empty() const noexcept { return close.empty(); }

    bool aligned() const noexcept
    {
        const auto n = close.size();
        return timestamp.size() == n && open.size() == n && high.size() == n
            && low.size() == n && (volume.empty() || volume.size() == n);
    }
};

} // namespace tradecore
