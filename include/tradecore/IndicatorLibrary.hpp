#pragma once

#include "tradecore/IndicatorId.hpp"
#include "tradecore/IndicatorRequest.hpp"
#include "tradecore/IndicatorResult.hpp"
#include "tradecore/Series.hpp"

namespace tradecore {

/// Dispatches one request to the indicator functions. Never throws: contract
/// violations come back as a result with success == false.
IndicatorResult compute_indicator(const BarSeries& bars, const IndicatorRequest& request);

} // namespace tradecore
