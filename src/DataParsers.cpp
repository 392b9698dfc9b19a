#include "tradecore/DataParsers.hpp"

#include "tradecore/Logger.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <utility>

namespace tradecore {

namespace {

std::vector<std::string> split_fields(std::string line)
{
    std::replace(line.begin(), line.end(), ',', ' ');
    std::istringstream iss(line);
    std::vector<std::string> fields;
    std::string field;
    while (iss >> field) {
        fields.push_back(field);
    }
    return fields;
}

bool parse_int64(const std::string& token, std::int64_t* value)
{
    char* end = nullptr;
    const long long parsed = std::strtoll(token.c_str(), &end, 10);
    if (end == token.c_str() || *end != '\0') {
        return false;
    }
    *value = static_cast<std::int64_t>(parsed);
    return true;
}

bool parse_double(const std::string& token, double* value)
{
    char* end = nullptr;
    const double parsed = std::strtod(token.c_str(), &end);
    if (end == token.c_str() || *end != '\0') {
        return false;
    }
    *value = parsed;
    return true;
}

void set_error(std::string* error, std::string message)
{
    if (error) {
        *error = std::move(message);
    }
}

} // namespace

bool OHLCVParser::parse_row(const std::string& line, BarSeries& bars)
{
    const auto fields = split_fields(line);
    if (fields.size() != 5 && fields.size() != 6) {
        return false;
    }

    std::int64_t ts = 0;
    double o = 0.0, h = 0.0, l = 0.0, c = 0.0, v = 0.0;
    if (!parse_int64(fields[0], &ts) || !parse_double(fields[1], &o) || !parse_double(fields[2], &h)
        || !parse_double(fields[3], &l) || !parse_double(fields[4], &c)) {
        return false;
    }
    if (fields.size() == 6 && !parse_double(fields[5], &v)) {
        return false;
    }

    bars.timestamp.push_back(ts);
    bars.open.push_back(o);
    bars.high.push_back(h);
    bars.low.push_back(l);
    bars.close.push_back(c);
    if (fields.size() == 6) {
        bars.volume.push_back(v);
    }
    return true;
}

bool OHLCVParser::parse_file(const std::string& filepath, BarSeries* bars, std::string* error)
{
    if (!bars) {
        set_error(error, "Bar series pointer is null.");
        return false;
    }

    std::ifstream file(filepath);
    if (!file.is_open()) {
        set_error(error, "Failed to open file: " + filepath);
        return false;
    }

    BarSeries parsed;
    std::string line;
    std::size_t line_num = 0;
    bool first_row = true;

    while (std::getline(file, line)) {
        ++line_num;

        if (line.find_first_not_of(" \t\r\n") == std::string::npos) {
            continue;
        }

        if (first_row) {
            first_row = false;
            const auto fields = split_fields(line);
            std::int64_t ts = 0;
            if (!fields.empty() && !parse_int64(fields[0], &ts)) {
                continue;   // header
            }
        }

        if (!parse_row(line, parsed)) {
            set_error(error, "Parse error at line " + std::to_string(line_num) + ": " + line);
            return false;
        }
    }

    if (!parsed.volume.empty() && parsed.volume.size() != parsed.close.size()) {
        set_error(error, "Volume column is present on some rows only in " + filepath);
        return false;
    }

    if (parsed.empty()) {
        set_error(error, "No data parsed from file: " + filepath);
        return false;
    }

    Logger::info("OHLCVParser", "Loaded " + std::to_string(parsed.size()) + " bars from " + filepath);

    *bars = std::move(parsed);
    if (error) {
        error->clear();
    }
    return true;
}

bool write_trades_csv(const std::string& output_path,
                      const std::vector<Trade>& trades,
                      std::string* error)
{
    std::ofstream out(output_path);
    if (!out) {
        set_error(error, "Unable to open '" + output_path + "' for writing.");
        return false;
    }

    out << std::setprecision(10);
    out << "entry_ts,exit_ts,side,entry_price,exit_price,pnl,reason\n";
    for (const auto& trade : trades) {
        out << trade.entry_ts << ',' << trade.exit_ts << ',' << to_string(trade.side) << ','
            << trade.entry_price << ',' << trade.exit_price << ',' << trade.pnl << ','
            << to_string(trade.exit_reason) << '\n';
    }

    if (!out.good()) {
        set_error(error, "Failed to write '" + output_path + "'.");
        return false;
    }
    if (error) {
        error->clear();
    }
    return true;
}

bool write_equity_csv(const std::string& output_path,
                      const std::vector<EquityPoint>& equity_curve,
                      std::string* error)
{
    std::ofstream out(output_path);
    if (!out) {
        set_error(error, "Unable to open '" + output_path + "' for writing.");
        return false;
    }

    out << std::setprecision(12);
    out << "timestamp,equity\n";
    for (const auto& point : equity_curve) {
        out << point.timestamp << ',' << point.equity << '\n';
    }

    if (!out.good()) {
        set_error(error, "Failed to write '" + output_path + "'.");
        return false;
    }
    if (error) {
        error->clear();
    }
    return true;
}

} // namespace tradecore
