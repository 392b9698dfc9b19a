#pragma once

#include "tradecore/IndicatorRequest.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tradecore {

/// Represents a single indicator definition from a definitions file
struct IndicatorDefinition {
    std::string variable_name;      // e.g., "RSI_14"
    std::string indicator_type;     // e.g., "RSI"
    std::vector<double> params;     // Numeric parameters
    std::map<std::string, std::string> flags;  // Lower-cased keys, e.g. "source"

    // Raw line for error reporting
    std::string source_line;
    int line_number = 0;
};

/// Result of parsing a definitions file
struct ConfigParseResult {
    bool success = false;
    std::vector<IndicatorDefinition> definitions;
    std::string error_message;

    // Statistics
    int total_lines = 0;
    int parsed_indicators = 0;
    int comment_lines = 0;
    int blank_lines = 0;
    int skipped_lines = 0;
};

/// Parser for indicator definition files
class IndicatorConfigParser {
public:
    /// Parse a definitions file
    ///
    /// Syntax:
    ///   VARIABLE_NAME: INDICATOR_TYPE param1 param2 ... [--flag=value] [[FLAG=value]]
    ///
    /// Lines starting with ';' or '#' are comments. Lines without a colon are
    /// skipped with a warning.
    ///
    /// Examples:
    ///   SMA_20: SMA 20
    ///   RSI_14: RSI 14
    ///   ATR_14: ATR 14
    ///   EMA_HIGH: EMA 10 --source=high
    static ConfigParseResult parse_file(const std::string& file_path);

    static std::optional<IndicatorDefinition> parse_line(
        const std::string& line,
        int line_number = 0
    );

    /// Checks name, known type, parameter count and flag values
    static bool validate_definition(const IndicatorDefinition& def, std::string& error);

    /// Resolves a validated definition into an engine request
    static bool to_request(const IndicatorDefinition& def,
                           IndicatorRequest* request,
                           std::string* error = nullptr);

private:
    static std::vector<std::string> tokenize(const std::string& str);

    /// Check if a token is a flag (starts with -- or enclosed in [])
    static bool is_flag(const std::string& token);

    static std::pair<std::string, std::string> parse_flag(const std::string& token);
};

/// Write indicator results to CSV file
class IndicatorResultWriter {
public:
    /// Format: bar,timestamp,var1,var2,... The timestamp column is omitted when
    /// no timestamps are given. NaN is written as an empty field.
    static bool write_csv(
        const std::string& output_path,
        const std::vector<std::string>& variable_names,
        const std::vector<std::vector<double>>& results,
        const std::vector<std::int64_t>& timestamps = {},
        std::string* error = nullptr
    );
};

} // namespace tradecore
