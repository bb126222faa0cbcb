#include <chartkit/aggregate.hpp>
#include <gtest/gtest.h>
#include <vector>

using namespace chartkit;

TEST(Aggregate, SumOfValues)
{
    std::vector<double> v = {1.5, 2.5, 6.0};
    EXPECT_DOUBLE_EQ(aggregate::sum(v), 10.0);
}

TEST(Aggregate, SumOfEmptyIsZero)
{
    std::vector<double> v;
    EXPECT_DOUBLE_EQ(aggregate::sum(v), 0.0);
    TimeSeries s;
    EXPECT_DOUBLE_EQ(aggregate::sum(s), 0.0);
}

TEST(Aggregate, SumOfSeriesAndDistribution)
{
    TimeSeries   s = {{"2025-01-01", 100}, {"2025-01-02", 250.5}};
    Distribution d = {{"FREE", 10}, {"BASIC", 5}, {"PREMIUM", 2}};
    EXPECT_DOUBLE_EQ(aggregate::sum(s), 350.5);
    EXPECT_DOUBLE_EQ(aggregate::sum(d), 17.0);
}

TEST(Aggregate, MaxIsFlooredAtOne)
{
    std::vector<double> zeros = {0, 0, 0};
    std::vector<double> small = {0.2, 0.7};
    std::vector<double> empty;
    EXPECT_DOUBLE_EQ(aggregate::max(zeros), 1.0);
    EXPECT_DOUBLE_EQ(aggregate::max(small), 1.0);
    EXPECT_DOUBLE_EQ(aggregate::max(empty), 1.0);
}

TEST(Aggregate, MaxPicksLargest)
{
    std::vector<double> v = {3, 17, 4};
    EXPECT_DOUBLE_EQ(aggregate::max(v), 17.0);

    TimeSeries s = {{"a", 5}, {"b", 9}, {"c", 2}};
    EXPECT_DOUBLE_EQ(aggregate::max(s), 9.0);

    Distribution d = {{"x", 40}, {"y", 41}};
    EXPECT_DOUBLE_EQ(aggregate::max(d), 41.0);
}

TEST(Aggregate, MaxWithCustomFloor)
{
    std::vector<double> v = {-3, -1};
    EXPECT_DOUBLE_EQ(aggregate::max(v, -10.0), -1.0);
    EXPECT_DOUBLE_EQ(aggregate::max(v, 0.0), 0.0);
}

TEST(Aggregate, BarWidthPercent)
{
    std::vector<double> v = {50, 100, 25};
    EXPECT_DOUBLE_EQ(aggregate::bar_width_percent(100, v), 100.0);
    EXPECT_DOUBLE_EQ(aggregate::bar_width_percent(25, v), 25.0);

    Distribution d = {{"Math", 80}, {"Science", 20}};
    EXPECT_DOUBLE_EQ(aggregate::bar_width_percent(20, d), 25.0);
}

TEST(Aggregate, BarWidthOfAllZeroIsZero)
{
    std::vector<double> v = {0, 0};
    EXPECT_DOUBLE_EQ(aggregate::bar_width_percent(0, v), 0.0);
}

TEST(Aggregate, Latest)
{
    TimeSeries s = {{"2025-01-01", 3}, {"2025-01-02", 8}};
    EXPECT_DOUBLE_EQ(aggregate::latest(s), 8.0);
    TimeSeries empty;
    EXPECT_DOUBLE_EQ(aggregate::latest(empty), 0.0);
}
