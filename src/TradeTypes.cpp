#include "tradecore/TradeTypes.hpp"

namespace tradecore {

std::string_view to_string(ExitReason reason)
{
    switch (reason) {
        case ExitReason::StopLoss: return "sl";
        case ExitReason::TakeProfit: return "tp";
        case ExitReason::SignalFlip: return "signal_flip";
    }
    return "unknown";
}

std::string_view to_string(PositionSide side)
{
    switch (side) {
        case PositionSide::Long: return "long";
        case PositionSide::Short: return "short";
        case PositionSide::Flat: return "flat";
    }
    return "unknown";
}

} // namespace tradecore
