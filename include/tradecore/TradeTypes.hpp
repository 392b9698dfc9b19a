#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

namespace tradecore {

enum class Signal : int {
    Sell = -1,
    None = 0,
    Buy = 1
};

/// Anything other than +1 / -1 is treated as no signal.
constexpr Signal to_signal(int raw) noexcept
{
    return raw == 1 ? Signal::Buy : (raw == -1 ? Signal::Sell : Signal::None);
}

enum class PositionSide : int {
    Short = -1,
    Flat = 0,
    Long = 1
};

constexpr double side_sign(PositionSide side) noexcept
{
    return static_cast<double>(static_cast<int>(side));
}

enum class ExitReason {
    StopLoss,
    TakeProfit,
    SignalFlip
};

std::string_view to_string(ExitReason reason);
std::string_view to_string(PositionSide side);

// Trade ledger entry, appended once per realized exit.
struct Trade {
    std::int64_t entry_ts{};
    std::int64_t exit_ts{};
    double entry_price{};
    double exit_price{};
    double pnl{};
    ExitReason exit_reason{ExitReason::SignalFlip};
    PositionSide side{PositionSide::Flat};
};

struct EquityPoint {
    std::int64_t timestamp{};
    double equity{};
};

struct SimulationResult {
    std::vector<EquityPoint> equity_curve;
    std::vector<Trade> trades;
};

} // namespace tradecore
