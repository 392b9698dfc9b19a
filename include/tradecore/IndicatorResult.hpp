#pragma once

#include <string>
#include <vector>

namespace tradecore {

struct IndicatorResult {
    std::string name;
    std::vector<double> values;
    bool success{true};
    std::string error_message;
};

} // namespace tradecore
