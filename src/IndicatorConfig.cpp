#include "tradecore/IndicatorConfig.hpp"

#include "tradecore/IndicatorId.hpp"
#include "tradecore/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <string_view>
#include <utility>

namespace tradecore {

namespace {

bool parse_number(const std::string& token, double* value)
{
    char* end = nullptr;
    const double parsed = std::strtod(token.c_str(), &end);
    if (end == token.c_str() || *end != '\0') {
        return false;
    }
    *value = parsed;
    return true;
}

void trim(std::string& text, const char* chars)
{
    text.erase(0, text.find_first_not_of(chars));
    const auto last = text.find_last_not_of(chars);
    if (last == std::string::npos) {
        text.clear();
    } else {
        text.erase(last + 1);
    }
}

} // namespace

ConfigParseResult IndicatorConfigParser::parse_file(const std::string& file_path)
{
    ConfigParseResult parsed;
    std::ifstream in(file_path);
    if (!in) {
        parsed.error_message = "Cannot open file: " + file_path;
        return parsed;
    }

    std::string raw;
    for (int number = 1; std::getline(in, raw); ++number) {
        ++parsed.total_lines;
        trim(raw, " \t\r\n");

        if (raw.empty()) {
            ++parsed.blank_lines;
            continue;
        }
        if (raw.front() == ';' || raw.front() == '#') {
            ++parsed.comment_lines;
            continue;
        }

        if (auto def = parse_line(raw, number)) {
            parsed.definitions.push_back(std::move(*def));
            ++parsed.parsed_indicators;
            continue;
        }
        ++parsed.skipped_lines;
        Logger::warning("IndicatorConfig", "Skipping line " + std::to_string(number)
                                               + " of " + file_path + ": " + raw);
    }

    parsed.success = true;
    return parsed;
}

std::optional<IndicatorDefinition> IndicatorConfigParser::parse_line(
    const std::string& line,
    int line_number)
{
    const auto colon = line.find(':');
    if (colon == std::string::npos) {
        return std::nullopt;
    }

    IndicatorDefinition def;
    def.line_number = line_number;
    def.source_line = line;
    def.variable_name = line.substr(0, colon);
    trim(def.variable_name, " \t");

    const auto tokens = tokenize(line.substr(colon + 1));
    if (def.variable_name.empty() || tokens.empty()) {
        return std::nullopt;
    }

    // Words before the first number or flag form the type, e.g. "MOVING AVERAGE"
    const auto first_arg = std::find_if(tokens.begin(), tokens.end(), [](const std::string& token) {
        double ignored = 0.0;
        return is_flag(token) || parse_number(token, &ignored);
    });
    for (auto it = tokens.begin(); it != first_arg; ++it) {
        if (it != tokens.begin()) {
            def.indicator_type += ' ';
        }
        def.indicator_type += *it;
    }

    for (auto it = first_arg; it != tokens.end(); ++it) {
        double value = 0.0;
        if (is_flag(*it)) {
            auto [key, flag_value] = parse_flag(*it);
            def.flags[key] = flag_value;
        } else if (parse_number(*it, &value)) {
            def.params.push_back(value);
        }
    }

    return def;
}

std::vector<std::string> IndicatorConfigParser::tokenize(const std::string& str)
{
    std::istringstream stream(str);
    return std::vector<std::string>(std::istream_iterator<std::string>(stream),
                                    std::istream_iterator<std::string>());
}

// "--name[=value]" or "[NAME=value]"
bool IndicatorConfigParser::is_flag(const std::string& token)
{
    const bool dashed = token.rfind("--", 0) == 0;
    const bool bracketed = token.size() >= 3 && token.front() == '[' && token.back() == ']';
    return dashed || bracketed;
}

std::pair<std::string, std::string> IndicatorConfigParser::parse_flag(const std::string& token)
{
    std::string_view body = token;
    if (body.starts_with("--")) {
        body.remove_prefix(2);
    }
    if (body.starts_with('[')) {
        body.remove_prefix(1);
    }
    if (body.ends_with(']')) {
        body.remove_suffix(1);
    }

    const auto eq = body.find('=');
    std::string key(body.substr(0, eq));
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (eq == std::string_view::npos) {
        return {key, "true"};
    }
    return {key, std::string(body.substr(eq + 1))};
}

bool IndicatorConfigParser::validate_definition(
    const IndicatorDefinition& def,
    std::string& error)
{
    if (def.variable_name.empty()) {
        error = "Variable name is empty";
        return false;
    }

    if (def.indicator_type.empty()) {
        error = "Indicator type is empty";
        return false;
    }

    const auto id = parse_indicator_id(def.indicator_type);
    if (!id) {
        error = "Unknown indicator type '" + def.indicator_type + "'";
        return false;
    }

    const std::size_t required = required_parameter_count(*id);
    if (def.params.size() < required) {
        error = std::string(to_string(*id)) + " expects " + std::to_string(required)
              + " parameter(s), got " + std::to_string(def.params.size());
        return false;
    }

    auto source = def.flags.find("source");
    if (source != def.flags.end() && !parse_price_source(source->second)) {
        error = "Unknown price source '" + source->second + "'";
        return false;
    }

    return true;
}

bool IndicatorConfigParser::to_request(const IndicatorDefinition& def,
                                       IndicatorRequest* request,
                                       std::string* error)
{
    std::string message;
    if (!validate_definition(def, message)) {
        if (error) {
            *error = message;
        }
        return false;
    }

    IndicatorRequest resolved;
    resolved.id = *parse_indicator_id(def.indicator_type);
    resolved.name = def.variable_name;
    for (std::size_t i = 0; i < def.params.size() && i < resolved.params.values.size(); ++i) {
        resolved.params[i] = def.params[i];
    }
    auto source = def.flags.find("source");
    if (source != def.flags.end()) {
        resolved.source = *parse_price_source(source->second);
    }

    *request = std::move(resolved);
    if (error) {
        error->clear();
    }
    return true;
}

bool IndicatorResultWriter::write_csv(
    const std::string& output_path,
    const std::vector<std::string>& variable_names,
    const std::vector<std::vector<double>>& results,
    const std::vector<std::int64_t>& timestamps,
    std::string* error)
{
    std::ofstream file(output_path);
    if (!file.is_open()) {
        if (error) {
            *error = "Unable to open '" + output_path + "' for writing.";
        }
        return false;
    }

    std::size_t num_rows = results.empty() ? timestamps.size() : results[0].size();
    file << std::setprecision(10);

    file << "bar";
    if (!timestamps.empty()) {
        file << ",timestamp";
    }
    for (const auto& name : variable_names) {
        file << "," << name;
    }
    file << "\n";

    for (std::size_t row = 0; row < num_rows; ++row) {
        file << row;

        if (!timestamps.empty()) {
            file << ",";
            if (row < timestamps.size()) {
                file << timestamps[row];
            }
        }

        for (const auto& col : results) {
            file << ",";
            if (row < col.size() && !std::isnan(col[row])) {
                file << col[row];
            }
        }
        file << "\n";
    }

    if (!file.good()) {
        if (error) {
            *error = "Failed to write '" + output_path + "'.";
        }
        return false;
    }
    if (error) {
        error->clear();
    }
    return true;
}

} // namespace tradecore
