#include "tradecore/DataParsers.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace tradecore;

namespace {

class DataParsersTest : public ::testing::Test {
protected:
    void TearDown() override
    {
        for (const auto& path : created_) {
            std::filesystem::remove(path);
        }
    }

    std::filesystem::path temp_path(const std::string& name)
    {
        auto path = std::filesystem::temp_directory_path() / ("tradecore_parsers_" + name);
        created_.push_back(path);
        return path;
    }

    std::filesystem::path write_file(const std::string& name, const std::string& contents)
    {
        auto path = temp_path(name);
        std::ofstream out(path);
        out << contents;
        return path;
    }

    static std::string read_all(const std::filesystem::path& path)
    {
        std::ifstream in(path);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

private:
    std::vector<std::filesystem::path> created_;
};

} // namespace

TEST_F(DataParsersTest, LoadsCommaSeparatedWithHeader)
{
    const auto path = write_file("bars.csv",
                                 "timestamp,open,high,low,close,volume\n"
                                 "1700000000,100,101,99,100.5,12\n"
                                 "\n"
                                 "1700000060,100.5,102,100,101.5,7.5\n");
    BarSeries bars;
    std::string error;
    ASSERT_TRUE(OHLCVParser::parse_file(path.string(), &bars, &error)) << error;

    ASSERT_EQ(bars.size(), 2u);
    EXPECT_TRUE(bars.aligned());
    EXPECT_EQ(bars.timestamp[1], 1700000060);
    EXPECT_DOUBLE_EQ(bars.high[0], 101.0);
    EXPECT_DOUBLE_EQ(bars.close[1], 101.5);
    ASSERT_EQ(bars.volume.size(), 2u);
    EXPECT_DOUBLE_EQ(bars.volume[1], 7.5);
}

TEST_F(DataParsersTest, LoadsWhitespaceSeparatedWithoutVolume)
{
    const auto path = write_file("bars.txt",
                                 "0 10 11 9 10.5\n"
                                 "60\t10.5 12 10 11\n");
    BarSeries bars;
    ASSERT_TRUE(OHLCVParser::parse_file(path.string(), &bars));
    EXPECT_EQ(bars.size(), 2u);
    EXPECT_TRUE(bars.volume.empty());
    EXPECT_TRUE(bars.aligned());
}

TEST_F(DataParsersTest, MalformedRowReportsLine)
{
    const auto path = write_file("bad.csv",
                                 "0,10,11,9,10\n"
                                 "60,10,abc,9,10\n");
    BarSeries bars;
    std::string error;
    EXPECT_FALSE(OHLCVParser::parse_file(path.string(), &bars, &error));
    EXPECT_NE(error.find("line 2"), std::string::npos);
    EXPECT_TRUE(bars.empty());
}

TEST_F(DataParsersTest, MixedVolumePresenceFails)
{
    const auto path = write_file("mixed.csv",
                                 "0,10,11,9,10,5\n"
                                 "60,10,11,9,10\n");
    BarSeries bars;
    std::string error;
    EXPECT_FALSE(OHLCVParser::parse_file(path.string(), &bars, &error));
    EXPECT_NE(error.find("Volume"), std::string::npos);
}

TEST_F(DataParsersTest, MissingAndEmptyFilesFail)
{
    BarSeries bars;
    std::string error;
    EXPECT_FALSE(OHLCVParser::parse_file("/nonexistent/tradecore/bars.csv", &bars, &error));
    EXPECT_FALSE(error.empty());

    const auto path = write_file("empty.csv", "timestamp,open,high,low,close\n");
    EXPECT_FALSE(OHLCVParser::parse_file(path.string(), &bars, &error));
    EXPECT_NE(error.find("No data"), std::string::npos);
}

TEST_F(DataParsersTest, WritesTradeLedger)
{
    Trade trade;
    trade.entry_ts = 60;
    trade.exit_ts = 240;
    trade.entry_price = 11.0;
    trade.exit_price = 14.0;
    trade.pnl = 3.0;
    trade.exit_reason = ExitReason::SignalFlip;
    trade.side = PositionSide::Long;

    const auto path = temp_path("trades.csv");
    std::string error;
    ASSERT_TRUE(write_trades_csv(path.string(), {trade}, &error)) << error;
    EXPECT_EQ(read_all(path),
              "entry_ts,exit_ts,side,entry_price,exit_price,pnl,reason\n"
              "60,240,long,11,14,3,signal_flip\n");
}

TEST_F(DataParsersTest, WritesEquityCurve)
{
    const auto path = temp_path("equity.csv");
    ASSERT_TRUE(write_equity_csv(path.string(), {{0, 10000.0}, {60, 10001.25}}));
    EXPECT_EQ(read_all(path), "timestamp,equity\n0,10000\n60,10001.25\n");
}

TEST_F(DataParsersTest, UnwritablePathFails)
{
    std::string error;
    EXPECT_FALSE(write_equity_csv("/nonexistent/tradecore/equity.csv", {}, &error));
    EXPECT_FALSE(error.empty());
}
