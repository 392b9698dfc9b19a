#pragma once

#include "tradecore/IndicatorConfig.hpp"
#include "tradecore/IndicatorRequest.hpp"
#include "tradecore/IndicatorResult.hpp"
#include "tradecore/Series.hpp"

#include <vector>

namespace tradecore {

struct ExecutionOptions {
    bool parallel{false};
};

/// Batch front end over compute_indicator. Results are returned in request order;
/// a failed request yields a result with success == false and does not affect the others.
class IndicatorEngine {
public:
    std::vector<IndicatorResult> compute(const BarSeries& bars,
                                         const std::vector<IndicatorRequest>& requests,
                                         ExecutionOptions options = {}) const;

    /// Resolves parsed config definitions first; unknown types and bad flags are
    /// reported as failed results under the definition's variable name.
    std::vector<IndicatorResult> compute(const BarSeries& bars,
                                         const std::vector<IndicatorDefinition>& definitions,
                                         ExecutionOptions options = {}) const;
};

} // namespace tradecore
