#include "tradecore/IndicatorEngine.hpp"
#include "tradecore/IndicatorLibrary.hpp"
#include "tradecore/Indicators.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <iterator>
#include <string>
#include <utility>

using namespace tradecore;

namespace {

BarSeries sample_bars()
{
    BarSeries bars;
    const double closes[] = {10, 11, 12, 11, 13, 14, 13, 15};
    for (std::size_t i = 0; i < std::size(closes); ++i) {
        bars.timestamp.push_back(static_cast<std::int64_t>(i));
        bars.open.push_back(closes[i] - 0.5);
        bars.high.push_back(closes[i] + 1.0);
        bars.low.push_back(closes[i] - 1.0);
        bars.close.push_back(closes[i]);
    }
    return bars;
}

IndicatorRequest make_request(IndicatorId id, double period, std::string name = {},
                              PriceSource source = PriceSource::Close)
{
    IndicatorRequest request;
    request.id = id;
    request.params[0] = period;
    request.name = std::move(name);
    request.source = source;
    return request;
}

void expect_same(const std::vector<double>& a, const std::vector<double>& b)
{
    ASSERT_EQ(a.size(), b.size());
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::isnan(b[i])) {
            EXPECT_TRUE(std::isnan(a[i]));
        } else {
            EXPECT_DOUBLE_EQ(a[i], b[i]);
        }
    }
}

} // namespace

TEST(IndicatorLibraryTest, DispatchesToIndicatorFunctions)
{
    const BarSeries bars = sample_bars();

    IndicatorResult result = compute_indicator(bars, make_request(IndicatorId::Sma, 3));
    ASSERT_TRUE(result.success) << result.error_message;
    EXPECT_EQ(result.name, "SMA");
    expect_same(result.values, sma(bars.close, 3));

    result = compute_indicator(bars, make_request(IndicatorId::Atr, 2, "ATR_2"));
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.name, "ATR_2");
    expect_same(result.values, atr(bars.high, bars.low, bars.close, 2));
}

TEST(IndicatorLibraryTest, PriceSourceSelectsColumn)
{
    const BarSeries bars = sample_bars();
    IndicatorResult result = compute_indicator(
        bars, make_request(IndicatorId::Ema, 3, "EMA_OPEN", PriceSource::Open));
    ASSERT_TRUE(result.success);
    expect_same(result.values, ema(bars.open, 3));
}

TEST(IndicatorLibraryTest, ZeroPeriodBecomesFailedResult)
{
    const BarSeries bars = sample_bars();
    IndicatorResult result = compute_indicator(bars, make_request(IndicatorId::Rsi, 0, "RSI_0"));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.name, "RSI_0");
    EXPECT_NE(result.error_message.find("RSI"), std::string::npos);
    EXPECT_TRUE(result.values.empty());
}

TEST(IndicatorLibraryTest, NegativePeriodIsRejected)
{
    const BarSeries bars = sample_bars();
    EXPECT_FALSE(compute_indicator(bars, make_request(IndicatorId::Sma, -4)).success);
}

TEST(IndicatorLibraryTest, OversizedPeriodIsRejected)
{
    const BarSeries bars = sample_bars();
    IndicatorResult result = compute_indicator(bars, make_request(IndicatorId::Sma, 1e30));
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.error_message.find("period"), std::string::npos);
    EXPECT_TRUE(result.values.empty());
}

TEST(IndicatorEngineTest, OversizedPeriodInDefinitionFailsThatItemOnly)
{
    const BarSeries bars = sample_bars();
    std::vector<IndicatorDefinition> defs;
    for (const char* line : {"HUGE: SMA 1e30", "SMA_2: SMA 2"}) {
        auto def = IndicatorConfigParser::parse_line(line);
        ASSERT_TRUE(def.has_value());
        defs.push_back(*def);
    }

    IndicatorEngine engine;
    auto results = engine.compute(bars, defs);
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].name, "HUGE");
    EXPECT_FALSE(results[0].success);
    EXPECT_TRUE(results[1].success);
}

TEST(IndicatorLibraryTest, MisalignedBarsAreRejected)
{
    BarSeries bars = sample_bars();
    bars.low.pop_back();
    IndicatorResult result = compute_indicator(bars, make_request(IndicatorId::Sma, 2));
    EXPECT_FALSE(result.success);
}

TEST(IndicatorEngineTest, ResultsKeepRequestOrder)
{
    const BarSeries bars = sample_bars();
    const std::vector<IndicatorRequest> requests{
        make_request(IndicatorId::Sma, 2, "first"),
        make_request(IndicatorId::Stddev, 0, "broken"),
        make_request(IndicatorId::Rsi, 3, "third"),
    };

    IndicatorEngine engine;
    for (bool parallel : {false, true}) {
        auto results = engine.compute(bars, requests, ExecutionOptions{parallel});
        ASSERT_EQ(results.size(), 3u);
        EXPECT_EQ(results[0].name, "first");
        EXPECT_TRUE(results[0].success);
        EXPECT_EQ(results[1].name, "broken");
        EXPECT_FALSE(results[1].success);
        EXPECT_EQ(results[2].name, "third");
        EXPECT_TRUE(results[2].success);
        expect_same(results[2].values, rsi(bars.close, 3));
    }
}

TEST(IndicatorEngineTest, DefinitionsWithUnknownTypesFailIndividually)
{
    const BarSeries bars = sample_bars();
    std::vector<IndicatorDefinition> defs;
    for (const char* line : {"S: SMA 2", "X: WILLIAMS 14", "H: EMA 3 --source=high"}) {
        auto def = IndicatorConfigParser::parse_line(line);
        ASSERT_TRUE(def.has_value());
        defs.push_back(*def);
    }

    IndicatorEngine engine;
    auto results = engine.compute(bars, defs);

    ASSERT_EQ(results.size(), 3u);
    EXPECT_TRUE(results[0].success);
    EXPECT_EQ(results[0].name, "S");
    EXPECT_FALSE(results[1].success);
    EXPECT_EQ(results[1].name, "X");
    EXPECT_NE(results[1].error_message.find("WILLIAMS"), std::string::npos);
    EXPECT_TRUE(results[2].success);
    expect_same(results[2].values, ema(bars.high, 3));
}

TEST(IndicatorIdTest, ParsesNamesAndAliases)
{
    EXPECT_EQ(parse_indicator_id("ma"), IndicatorId::Sma);
    EXPECT_EQ(parse_indicator_id("Sma"), IndicatorId::Sma);
    EXPECT_EQ(parse_indicator_id("STDDEV"), IndicatorId::Stddev);
    EXPECT_FALSE(parse_indicator_id("ADX").has_value());
    EXPECT_EQ(parse_price_source("HIGH"), PriceSource::High);
    EXPECT_EQ(to_string(IndicatorId::Atr), "ATR");
}
