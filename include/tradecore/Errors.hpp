#pragma once

#include <stdexcept>
#include <string>

namespace tradecore {

/// Raised for structural contract violations only (zero window, misaligned series,
/// missing ATR input). Data-dependent degeneracies yield NaN instead.
class InvalidArgument : public std::invalid_argument {
public:
    explicit InvalidArgument(const std::string& message)
        : std::invalid_argument(message)
    {
    }
};

} // namespace tradecore
