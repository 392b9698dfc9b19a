#pragma once

#include "tradecore/IndicatorId.hpp"

#include <array>
#include <cstddef>
#include <string>

namespace tradecore {

struct IndicatorParameters {
    std::array<double, 4> values{0.0, 0.0, 0.0, 0.0};

    double operator[](std::size_t idx) const noexcept { return values[idx]; }
    double& operator[](std::size_t idx) noexcept { return values[idx]; }
};

struct IndicatorRequest {
    IndicatorId id{IndicatorId::Sma};
    IndicatorParameters params{};
    PriceSource source{PriceSource::Close};   // ignored by ATR
    std::string name;
};

} // namespace tradecore
