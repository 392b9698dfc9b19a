#include "tradecore/RollingStats.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <vector>

using namespace tradecore;

namespace {

void expect_series(const Series& actual, const std::vector<double>& expected)
{
    ASSERT_EQ(actual.size(), expected.size());
    for (std::size_t i = 0; i < expected.size(); ++i) {
        if (std::isnan(expected[i])) {
            EXPECT_TRUE(std::isnan(actual[i])) << "index " << i << " = " << actual[i];
        } else {
            EXPECT_NEAR(actual[i], expected[i], 1e-12) << "index " << i;
        }
    }
}

} // namespace

TEST(RollingMeanTest, TrailingWindowAverage)
{
    const std::vector<double> values{1, 2, 3, 4, 5};
    expect_series(rolling_mean(values, 3), {kNaN, kNaN, 2.0, 3.0, 4.0});
}

TEST(RollingMeanTest, WindowContainingNaNIsUndefined)
{
    const std::vector<double> values{1, 2, kNaN, 4, 5, 6};
    expect_series(rolling_mean(values, 2), {kNaN, 1.5, kNaN, kNaN, 4.5, 5.5});
}

TEST(RollingMeanTest, ZeroWindowGivesAllNaN)
{
    const std::vector<double> values{1, 2, 3};
    expect_series(rolling_mean(values, 0), {kNaN, kNaN, kNaN});
}

TEST(RollingMeanTest, WindowLongerThanInput)
{
    const std::vector<double> values{1, 2};
    expect_series(rolling_mean(values, 5), {kNaN, kNaN});
    EXPECT_TRUE(rolling_mean(std::vector<double>{}, 3).empty());
}

TEST(EmaRecursionTest, SeededWithFirstValue)
{
    const std::vector<double> values{1, 2, 3};
    // alpha = 2/3
    expect_series(ema_recursion(values, 2), {kNaN, 5.0 / 3.0, 23.0 / 9.0});
}

TEST(EmaRecursionTest, NaNIsAbsorbing)
{
    const std::vector<double> values{1, 2, kNaN, 4, 5};
    const Series out = ema_recursion(values, 1);
    EXPECT_DOUBLE_EQ(out[0], 1.0);
    EXPECT_DOUBLE_EQ(out[1], 2.0);
    for (std::size_t i = 2; i < out.size(); ++i) {
        EXPECT_TRUE(std::isnan(out[i])) << "index " << i;
    }
}

TEST(EmaRecursionTest, ConstantInputStaysConstant)
{
    const std::vector<double> values(10, 7.5);
    const Series out = ema_recursion(values, 4);
    for (std::size_t i = 3; i < out.size(); ++i) {
        EXPECT_DOUBLE_EQ(out[i], 7.5);
    }
}

TEST(RollingStddevTest, SampleDeviation)
{
    const std::vector<double> values{1, 2, 3, 4};
    const double s = std::sqrt(0.5);
    expect_series(rolling_stddev(values, 2), {kNaN, s, s, s});
    expect_series(rolling_stddev(values, 4), {kNaN, kNaN, kNaN, std::sqrt(5.0 / 3.0)});
}

TEST(RollingStddevTest, IdenticalValuesGiveZero)
{
    const std::vector<double> values(6, 3.25);
    expect_series(rolling_stddev(values, 3), {kNaN, kNaN, 0.0, 0.0, 0.0, 0.0});
}

TEST(RollingStddevTest, SkipsNaNEntries)
{
    const std::vector<double> values{1, kNaN, 3, kNaN, kNaN};
    // one finite sample -> 0, none -> NaN
    expect_series(rolling_stddev(values, 2), {kNaN, 0.0, 0.0, 0.0, kNaN});
    expect_series(rolling_stddev(values, 3), {kNaN, kNaN, std::sqrt(2.0), 0.0, 0.0});
}
