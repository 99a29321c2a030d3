#include "trader/data_structures/bounded_series.hpp"
#include <gtest/gtest.h>

using OkxTrader::Core::BoundedSeries;

TEST(BoundedSeriesTest, KeepsMostRecentValuesOldestFirst) {
    BoundedSeries<int> series(3);
    for (int value = 1; value <= 5; ++value) {
        series.push(value);
    }

    ASSERT_EQ(series.size(), 3u);
    EXPECT_EQ(series.values().front(), 3);
    EXPECT_EQ(series.back(), 5);
}

TEST(BoundedSeriesTest, GrowsUntilCapacity) {
    BoundedSeries<double> series(4);
    EXPECT_TRUE(series.empty());
    series.push(1.0);
    series.push(2.0);
    EXPECT_EQ(series.size(), 2u);
    EXPECT_EQ(series.get_capacity(), 4);
}

TEST(BoundedSeriesTest, RejectsNonPositiveCapacity) {
    EXPECT_THROW(BoundedSeries<int>(0), std::invalid_argument);
    EXPECT_THROW(BoundedSeries<int>(-2), std::invalid_argument);
}

TEST(BoundedSeriesTest, ClearEmptiesTheSeries) {
    BoundedSeries<int> series(2);
    series.push(7);
    series.clear();
    EXPECT_TRUE(series.empty());
}
