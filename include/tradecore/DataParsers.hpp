#pragma once

#include "tradecore/Series.hpp"
#include "tradecore/TradeTypes.hpp"

#include <string>
#include <vector>

namespace tradecore {

/**
 * @brief Loader for OHLC(V) bar files
 *
 * Format: Timestamp Open High Low Close [Volume]
 * Fields may be separated by whitespace or commas. A leading header line
 * (first field not numeric) is skipped, as are blank lines.
 * Example: 1727740800,63327.60,63606.00,63006.70,63531.99,1336.93
 */
class OHLCVParser {
public:
    static bool parse_file(const std::string& filepath,
                           BarSeries* bars,
                           std::string* error = nullptr);

    /// Parses a single data row into the series; false if the row is malformed.
    static bool parse_row(const std::string& line, BarSeries& bars);
};

/// Trade ledger as entry_ts,exit_ts,side,entry_price,exit_price,pnl,reason
bool write_trades_csv(const std::string& output_path,
                      const std::vector<Trade>& trades,
                      std::string* error = nullptr);

/// Equity curve as timestamp,equity
bool write_equity_csv(const std::string& output_path,
                      const std::vector<EquityPoint>& equity_curve,
                      std::string* error = nullptr);

} // namespace tradecore
