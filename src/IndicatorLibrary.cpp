#include "tradecore/IndicatorLibrary.hpp"

#include "tradecore/Errors.hpp"
#include "tradecore/Indicators.hpp"

#include <cmath>
#include <limits>
#include <span>
#include <string>
#include <utility>

namespace tradecore {

namespace {

IndicatorResult make_error(std::string name, std::string message)
{
    IndicatorResult result;
    result.name = std::move(name);
    result.success = false;
    result.error_message = std::move(message);
    return result;
}

IndicatorResult initialize_result(const IndicatorRequest& request)
{
    IndicatorResult result;
    result.name = request.name.empty() ? std::string(to_string(request.id)) : request.name;
    return result;
}

std::span<const double> select_source(const BarSeries& bars, PriceSource source)
{
    switch (source) {
        case PriceSource::Open: return bars.open;
        case PriceSource::High: return bars.high;
        case PriceSource::Low: return bars.low;
        case PriceSource::Close: return bars.close;
    }
    return bars.close;
}

// Window parameters are rounded to the nearest integer; negative or
// out-of-range values are rejected here, zero is left for the indicator itself
// to reject.
bool read_window(const IndicatorRequest& request, std::size_t* window, std::string* error)
{
    const double raw = request.params[0];
    if (!std::isfinite(raw) || raw < 0.0
        || raw >= static_cast<double>(std::numeric_limits<long>::max())) {
        *error = std::string(to_string(request.id)) + ": period must be a non-negative number";
        return false;
    }
    *window = static_cast<std::size_t>(std::lround(raw));
    return true;
}

} // namespace

IndicatorResult compute_indicator(const BarSeries& bars, const IndicatorRequest& request)
{
    IndicatorResult result = initialize_result(request);

    if (!bars.aligned()) {
        return make_error(result.name, "Input series vectors must share identical length.");
    }

    std::size_t window = 0;
    std::string error;
    if (!read_window(request, &window, &error)) {
        return make_error(result.name, error);
    }

    const auto values = select_source(bars, request.source);

    try {
        switch (request.id) {
            case IndicatorId::Sma:
                result.values = sma(values, window);
                return result;
            case IndicatorId::Ema:
                result.values = ema(values, window);
                return result;
            case IndicatorId::Rsi:
                result.values = rsi(values, window);
                return result;
            case IndicatorId::Atr:
                result.values = atr(bars.high, bars.low, bars.close, window);
                return result;
            case IndicatorId::Stddev:
                result.values = stddev(values, window);
                return result;
        }
    } catch (const InvalidArgument& ex) {
        return make_error(result.name, ex.what());
    }

    return make_error(result.name, "Indicator not implemented.");
}

} // namespace tradecore
