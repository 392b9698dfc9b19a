#include "tradecore/Logger.hpp"

#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

using namespace tradecore;

namespace {

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        previous_level_ = Logger::level();
        Logger::set_callback([this](LogLevel level, const std::string& line) {
            captured_.emplace_back(level, line);
        });
    }

    void TearDown() override
    {
        Logger::clear_callback();
        Logger::set_level(previous_level_);
    }

    std::vector<std::pair<LogLevel, std::string>> captured_;
    LogLevel previous_level_ = LogLevel::Info;
};

} // namespace

TEST_F(LoggerTest, FormatsComponentPrefix)
{
    Logger::set_level(LogLevel::Info);
    Logger::info("Engine", "started");

    ASSERT_EQ(captured_.size(), 1u);
    EXPECT_EQ(captured_[0].first, LogLevel::Info);
    EXPECT_EQ(captured_[0].second, "[Engine] started");
}

TEST_F(LoggerTest, FiltersBelowMinimumLevel)
{
    Logger::set_level(LogLevel::Warning);
    Logger::debug("A", "hidden");
    Logger::info("A", "hidden");
    Logger::warning("A", "shown");
    Logger::error("A", "shown too");

    ASSERT_EQ(captured_.size(), 2u);
    EXPECT_EQ(captured_[0].first, LogLevel::Warning);
    EXPECT_EQ(captured_[1].first, LogLevel::Error);
    EXPECT_FALSE(Logger::enabled(LogLevel::Info));
    EXPECT_TRUE(Logger::enabled(LogLevel::Error));
}

TEST_F(LoggerTest, LevelNames)
{
    EXPECT_EQ(to_string(LogLevel::Debug), "DEBUG");
    EXPECT_EQ(to_string(LogLevel::Warning), "WARNING");
}

TEST_F(LoggerTest, CallbackMayCallBackIntoLogger)
{
    Logger::set_level(LogLevel::Info);
    std::vector<std::string> lines;
    bool debug_enabled = true;
    Logger::set_callback([&](LogLevel level, const std::string& line) {
        lines.push_back(line);
        debug_enabled = Logger::enabled(LogLevel::Debug);
        if (level == LogLevel::Warning) {
            Logger::info("Relay", "from callback");
        }
    });

    Logger::warning("Engine", "slow batch");

    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "[Engine] slow batch");
    EXPECT_EQ(lines[1], "[Relay] from callback");
    EXPECT_FALSE(debug_enabled);
    EXPECT_EQ(Logger::level(), LogLevel::Info);
}
