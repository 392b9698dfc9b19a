#include "tradecore/RunConfig.hpp"

#include <json/json.h>

#include <fstream>
#include <sstream>
#include <utility>

namespace tradecore {

namespace {

std::string SerializeJson(const Json::Value& value)
{
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    return Json::writeString(builder, value);
}

bool Fail(std::string* error, std::string message)
{
    if (error) {
        *error = std::move(message);
    }
    return false;
}

bool ParseStrategyType(const std::string& text, StrategyType* type)
{
    if (text == "ma_crossover") {
        *type = StrategyType::MaCrossover;
    } else if (text == "volatility_breakout") {
        *type = StrategyType::VolatilityBreakout;
    } else if (text == "signals") {
        *type = StrategyType::Signals;
    } else {
        return false;
    }
    return true;
}

bool PopulateStrategyFromJson(const Json::Value& node, StrategyConfig* strategy, std::string* error)
{
    if (node.isNull()) {
        return true;
    }
    if (!node.isObject()) {
        return Fail(error, "'strategy' must be an object.");
    }

    const std::string type = node.get("type", std::string(to_string(strategy->type))).asString();
    if (!ParseStrategyType(type, &strategy->type)) {
        return Fail(error, "Unknown strategy type '" + type + "'.");
    }

    const Json::Value& params = node["params"];
    if (!params.isNull() && !params.isObject()) {
        return Fail(error, "'strategy.params' must be an object.");
    }
    if (params.isObject()) {
        strategy->short_window = params.get("short_window", strategy->short_window).asInt();
        strategy->long_window = params.get("long_window", strategy->long_window).asInt();
        strategy->window = params.get("window", strategy->window).asInt();
        strategy->k = params.get("k", strategy->k).asDouble();
    }

    if (strategy->type == StrategyType::MaCrossover
        && (strategy->short_window <= 0 || strategy->long_window <= 0)) {
        return Fail(error, "ma_crossover windows must be greater than 0.");
    }
    if (strategy->type == StrategyType::VolatilityBreakout && strategy->window <= 0) {
        return Fail(error, "volatility_breakout window must be greater than 0.");
    }
    return true;
}

bool PopulateRiskFromJson(const Json::Value& node, RiskConfig* risk, std::string* error)
{
    if (node.isNull()) {
        return true;
    }
    if (!node.isObject()) {
        return Fail(error, "'risk' must be an object.");
    }

    risk->stop_loss = node.get("stop_loss", risk->stop_loss).asDouble();
    risk->take_profit = node.get("take_profit", risk->take_profit).asDouble();
    risk->atr_stop_multiplier = node.get("atr_stop_multiplier", risk->atr_stop_multiplier).asDouble();
    risk->atr_period = node.get("atr_period", risk->atr_period).asInt();

    if (risk->stop_loss < 0.0 || risk->take_profit < 0.0
        || risk->atr_stop_multiplier < 0.0) {
        return Fail(error, "Risk values must not be negative.");
    }
    if (risk->uses_atr() && risk->atr_period <= 0) {
        return Fail(error, "atr_period must be greater than 0.");
    }
    return true;
}

bool PopulateRunConfigFromJson(const Json::Value& root, RunConfig* config, std::string* error)
{
    if (!config) {
        return Fail(error, "Config pointer is null.");
    }
    if (!root.isObject()) {
        return Fail(error, "Run config JSON must be an object.");
    }

    // jsoncpp throws Json::LogicError on type mismatches such as "window": "abc".
    RunConfig parsed;
    try {
        parsed.symbol = root.get("symbol", "").asString();
        parsed.initial_equity = root.get("initial_equity", parsed.initial_equity).asDouble();
        parsed.allow_short = root.get("allow_short", parsed.allow_short).asBool();
        if (!PopulateStrategyFromJson(root["strategy"], &parsed.strategy, error)
            || !PopulateRiskFromJson(root["risk"], &parsed.risk, error)) {
            return false;
        }
    } catch (const Json::Exception& ex) {
        return Fail(error, std::string("Invalid value type in run config: ") + ex.what());
    }

    *config = std::move(parsed);
    if (error) {
        error->clear();
    }
    return true;
}

} // namespace

std::string_view to_string(StrategyType type)
{
    switch (type) {
        case StrategyType::MaCrossover: return "ma_crossover";
        case StrategyType::VolatilityBreakout: return "volatility_breakout";
        case StrategyType::Signals: return "signals";
    }
    return "unknown";
}

std::string RunConfig::ToJsonString() const
{
    Json::Value root(Json::objectValue);
    root["symbol"] = symbol;
    root["initial_equity"] = initial_equity;
    root["allow_short"] = allow_short;

    Json::Value strategy_node(Json::objectValue);
    strategy_node["type"] = std::string(to_string(strategy.type));
    Json::Value params(Json::objectValue);
    params["short_window"] = strategy.short_window;
    params["long_window"] = strategy.long_window;
    params["window"] = strategy.window;
    params["k"] = strategy.k;
    strategy_node["params"] = params;
    root["strategy"] = strategy_node;

    Json::Value risk_node(Json::objectValue);
    risk_node["stop_loss"] = risk.stop_loss;
    risk_node["take_profit"] = risk.take_profit;
    risk_node["atr_stop_multiplier"] = risk.atr_stop_multiplier;
    risk_node["atr_period"] = risk.atr_period;
    root["risk"] = risk_node;

    return SerializeJson(root);
}

bool ParseRunConfig(const std::string& json_text, RunConfig* config, std::string* error)
{
    Json::Value root;
    std::string errs;
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    std::istringstream in(json_text);
    if (!Json::parseFromStream(builder, in, &root, &errs)) {
        return Fail(error, errs.empty() ? "Failed to parse run config JSON." : errs);
    }
    return PopulateRunConfigFromJson(root, config, error);
}

bool LoadRunConfigFromFile(const std::filesystem::path& file_path, RunConfig* config, std::string* error)
{
    std::ifstream in(file_path, std::ios::binary);
    if (!in) {
        return Fail(error, "Unable to open run config '" + file_path.string() + "' for reading.");
    }
    Json::Value root;
    std::string errs;
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    if (!Json::parseFromStream(builder, in, &root, &errs)) {
        return Fail(error, errs.empty()
            ? "Failed to parse run config JSON at '" + file_path.string() + "'."
            : errs);
    }
    return PopulateRunConfigFromJson(root, config, error);
}

} // namespace tradecore
