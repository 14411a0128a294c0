// test/capture/rolling_stats_test.cpp
#include <gtest/gtest.h>

#include <cmath>

#include "capture/rolling_stats.hpp"

namespace radiohal {
namespace test {

TEST(RollingStatsTest, EmptyIsZero) {
    RollingStats stats;
    EXPECT_EQ(stats.getCount(), 0u);
    EXPECT_EQ(stats.getMean(), 0.0);
    EXPECT_EQ(stats.getVariance(), 0.0);
    EXPECT_EQ(stats.getMin(), 0.0);
    EXPECT_EQ(stats.getMax(), 0.0);
}

TEST(RollingStatsTest, SingleSampleHasNoVariance) {
    RollingStats stats;
    stats.Update(-72.0);
    EXPECT_EQ(stats.getCount(), 1u);
    EXPECT_DOUBLE_EQ(stats.getMean(), -72.0);
    EXPECT_EQ(stats.getVariance(), 0.0);
    EXPECT_DOUBLE_EQ(stats.getMin(), -72.0);
    EXPECT_DOUBLE_EQ(stats.getMax(), -72.0);
}

TEST(RollingStatsTest, SampleVariance) {
    RollingStats stats;
    for (double value : {2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0}) {
        stats.Update(value);
    }
    EXPECT_EQ(stats.getCount(), 8u);
    EXPECT_DOUBLE_EQ(stats.getMean(), 5.0);
    EXPECT_NEAR(stats.getVariance(), 32.0 / 7.0, 1e-9);
    EXPECT_NEAR(stats.getStdDev(), std::sqrt(32.0 / 7.0), 1e-9);
    EXPECT_DOUBLE_EQ(stats.getMin(), 2.0);
    EXPECT_DOUBLE_EQ(stats.getMax(), 9.0);
}

TEST(RollingStatsTest, ToStringSummarises) {
    RollingStats stats;
    stats.Update(-50.0);
    stats.Update(-70.0);
    EXPECT_EQ(stats.ToString(),
              "n=2 mean=-60.00 std=14.14 min=-70.00 max=-50.00");
}

}  // namespace test
}  // namespace radiohal
