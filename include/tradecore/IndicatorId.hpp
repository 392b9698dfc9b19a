#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

namespace tradecore {

enum class IndicatorId {
    Sma,
    Ema,
    Rsi,
    Atr,
    Stddev
};

/// Price column a single-input indicator reads from.
enum class PriceSource {
    Open,
    High,
    Low,
    Close
};

std::string_view to_string(IndicatorId id);
std::string_view to_string(PriceSource source);

/// Case-insensitive. "MA" is accepted as an alias of SMA.
std::optional<IndicatorId> parse_indicator_id(std::string_view text);
std::optional<PriceSource> parse_price_source(std::string_view text);

/// Number of numeric parameters the indicator expects.
std::size_t required_parameter_count(IndicatorId id);

} // namespace tradecore
