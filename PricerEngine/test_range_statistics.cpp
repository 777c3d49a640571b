#include <gtest/gtest.h>
#include <cmath>
#include "PricingErrors.hpp"
#include "RangeStatistics.hpp"

namespace {

const double kPaths[] = {
    100.0, 110.0,
    90.0, 120.0,
    100.0, 80.0,
};

class RangeStatisticsTest : public ::testing::Test
{
protected:
    PnlMat *path;

    void SetUp() override
    {
        path = pnl_mat_create_from_ptr(3, 2, kPaths);
    }

    void TearDown() override
    {
        pnl_mat_free(&path);
    }
};

} // namespace

TEST_F(RangeStatisticsTest, FlattensEveryStep)
{
    RangeStatistics range(path);
    ASSERT_EQ(range.size(), 6);
    EXPECT_DOUBLE_EQ(GET(range.sorted, 0), 80.0);
    EXPECT_DOUBLE_EQ(GET(range.sorted, 5), 120.0);
}

TEST_F(RangeStatisticsTest, PercentileOfScoreAveragesStrictAndWeakRanks)
{
    RangeStatistics range(path);
    // 2 valeurs < 100, 4 valeurs <= 100
    EXPECT_DOUBLE_EQ(range.percentileOfScore(100.0), 50.0);
    EXPECT_DOUBLE_EQ(range.percentileOfScore(50.0), 0.0);
    EXPECT_DOUBLE_EQ(range.percentileOfScore(500.0), 100.0);
    EXPECT_DOUBLE_EQ(range.percentileOfScore(115.0), 500.0 / 6.0);
    EXPECT_THROW(range.percentileOfScore(std::nan("")), ValidationError);
}

TEST_F(RangeStatisticsTest, ScoreAtPercentileInterpolates)
{
    RangeStatistics range(path);
    EXPECT_DOUBLE_EQ(range.scoreAtPercentile(0.0), 80.0);
    EXPECT_DOUBLE_EQ(range.scoreAtPercentile(100.0), 120.0);
    // position 2.5 entre 100 et 100
    EXPECT_DOUBLE_EQ(range.scoreAtPercentile(50.0), 100.0);
    // position 4.5 entre 110 et 120
    EXPECT_DOUBLE_EQ(range.scoreAtPercentile(90.0), 115.0);
    EXPECT_THROW(range.scoreAtPercentile(101.0), ValidationError);
}

TEST_F(RangeStatisticsTest, ProbabilityInRangeCountsClosedBand)
{
    RangeStatistics range(path);
    EXPECT_DOUBLE_EQ(range.probabilityInRange(90.0, 110.0), 4.0 / 6.0);
    EXPECT_DOUBLE_EQ(range.probabilityInRange(0.0, 1000.0), 1.0);
    EXPECT_DOUBLE_EQ(range.probabilityInRange(101.0, 109.0), 0.0);
    EXPECT_THROW(range.probabilityInRange(110.0, 90.0), ValidationError);
}

TEST_F(RangeStatisticsTest, TerminalOnlyUsesLastColumn)
{
    RangeStatistics range(path, true);
    ASSERT_EQ(range.size(), 3);
    EXPECT_DOUBLE_EQ(range.probabilityInRange(100.0, 125.0), 2.0 / 3.0);
    EXPECT_DOUBLE_EQ(range.scoreAtPercentile(50.0), 110.0);
}
