#include "tradecore/IndicatorId.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace tradecore {

namespace {

std::string to_upper(std::string_view text)
{
    std::string upper(text);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return upper;
}

} // namespace

std::string_view to_string(IndicatorId id)
{
    switch (id) {
        case IndicatorId::Sma: return "SMA";
        case IndicatorId::Ema: return "EMA";
        case IndicatorId::Rsi: return "RSI";
        case IndicatorId::Atr: return "ATR";
        case IndicatorId::Stddev: return "STDDEV";
    }
    return "UNKNOWN";
}

std::string_view to_string(PriceSource source)
{
    switch (source) {
        case PriceSource::Open: return "open";
        case PriceSource::High: return "high";
        case PriceSource::Low: return "low";
        case PriceSource::Close: return "close";
    }
    return "unknown";
}

std::optional<IndicatorId> parse_indicator_id(std::string_view text)
{
    const std::string upper = to_upper(text);
    if (upper == "SMA" || upper == "MA") return IndicatorId::Sma;
    if (upper == "EMA") return IndicatorId::Ema;
    if (upper == "RSI") return IndicatorId::Rsi;
    if (upper == "ATR") return IndicatorId::Atr;
    if (upper == "STDDEV" || upper == "STD") return IndicatorId::Stddev;
    return std::nullopt;
}

std::optional<PriceSource> parse_price_source(std::string_view text)
{
    const std::string upper = to_upper(text);
    if (upper == "OPEN") return PriceSource::Open;
    if (upper == "HIGH") return PriceSource::High;
    if (upper == "LOW") return PriceSource::Low;
    if (upper == "CLOSE") return PriceSource::Close;
    return std::nullopt;
}

std::size_t required_parameter_count(IndicatorId id)
{
    switch (id) {
        case IndicatorId::Sma:
        case IndicatorId::Ema:
        case IndicatorId::Rsi:
        case IndicatorId::Atr:
        case IndicatorId::Stddev:
            return 1;
    }
    return 0;
}

} // namespace tradecore
