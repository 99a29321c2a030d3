#include "trader/market_data/bar_aggregator.hpp"
#include <gtest/gtest.h>

using namespace OkxTrader::Core;

namespace {

const long long ONE_MINUTE_MS = 60000;

Tick make_tick(long long local_timestamp_ms, double price) {
    Tick tick;
    tick.symbol = "BTC-USDT-SWAP";
    tick.price = price;
    tick.volume = 1.0;
    tick.exchange_timestamp_ms = local_timestamp_ms;
    tick.local_timestamp_ms = local_timestamp_ms;
    return tick;
}

Bar make_candle(long long open_time_ms, double close_price, bool complete) {
    Bar candle;
    candle.open_time_ms = open_time_ms;
    candle.close_time_ms = open_time_ms + ONE_MINUTE_MS;
    candle.open_price = close_price;
    candle.high_price = close_price + 1.0;
    candle.low_price = close_price - 1.0;
    candle.close_price = close_price;
    candle.volume = 10.0;
    candle.complete = complete;
    return candle;
}

} // anonymous namespace

TEST(BarAggregatorTest, FirstTickOpensAlignedBar) {
    BarAggregator aggregator("1m", 100);
    Bar completed_bar;
    EXPECT_EQ(aggregator.get_timeframe_ms(), 60000);

    EXPECT_FALSE(aggregator.on_tick(make_tick(60500, 100.0), completed_bar));
    ASSERT_TRUE(aggregator.has_open_bar());
    EXPECT_EQ(aggregator.get_open_bar().open_time_ms, 60000);
    EXPECT_EQ(aggregator.get_open_bar().close_time_ms, 120000);
    EXPECT_DOUBLE_EQ(aggregator.get_open_bar().open_price, 100.0);
}

TEST(BarAggregatorTest, TicksFoldIntoOpenBarUntilBoundary) {
    BarAggregator aggregator("1m", 100);
    Bar completed_bar;

    aggregator.on_tick(make_tick(60500, 100.0), completed_bar);
    EXPECT_FALSE(aggregator.on_tick(make_tick(70000, 105.0), completed_bar));
    EXPECT_FALSE(aggregator.on_tick(make_tick(80000, 98.0), completed_bar));
    EXPECT_FALSE(aggregator.on_tick(make_tick(119999, 101.0), completed_bar));

    ASSERT_TRUE(aggregator.on_tick(make_tick(120000, 102.0), completed_bar));
    EXPECT_EQ(completed_bar.open_time_ms, 60000);
    EXPECT_EQ(completed_bar.close_time_ms, 120000);
    EXPECT_DOUBLE_EQ(completed_bar.open_price, 100.0);
    EXPECT_DOUBLE_EQ(completed_bar.high_price, 105.0);
    EXPECT_DOUBLE_EQ(completed_bar.low_price, 98.0);
    EXPECT_DOUBLE_EQ(completed_bar.close_price, 101.0);
    EXPECT_DOUBLE_EQ(completed_bar.volume, 3.0);
    EXPECT_TRUE(completed_bar.complete);

    // The boundary tick seeds the next bar
    EXPECT_EQ(aggregator.get_open_bar().open_time_ms, 120000);
    EXPECT_DOUBLE_EQ(aggregator.get_open_bar().open_price, 102.0);
    EXPECT_EQ(aggregator.get_bar_history().size(), 1u);
}

TEST(BarAggregatorTest, GapAcrossSeveralBoundariesAdvancesOneBar) {
    BarAggregator aggregator("1m", 100);
    Bar completed_bar;

    aggregator.on_tick(make_tick(60000, 100.0), completed_bar);
    ASSERT_TRUE(aggregator.on_tick(make_tick(400000, 110.0), completed_bar));
    EXPECT_EQ(completed_bar.open_time_ms, 60000);
    EXPECT_EQ(aggregator.get_open_bar().open_time_ms, 120000);

    ASSERT_TRUE(aggregator.on_tick(make_tick(400001, 111.0), completed_bar));
    EXPECT_EQ(completed_bar.open_time_ms, 120000);
    EXPECT_DOUBLE_EQ(completed_bar.open_price, 110.0);
}

TEST(BarAggregatorTest, HistoryIsBoundedAndOrdered) {
    BarAggregator aggregator("1m", 3);
    Bar completed_bar;

    for (long long minute = 1; minute <= 6; ++minute) {
        aggregator.on_tick(make_tick(minute * ONE_MINUTE_MS, 100.0 + minute), completed_bar);
    }

    const auto& history = aggregator.get_bar_history().values();
    ASSERT_EQ(history.size(), 3u);
    EXPECT_EQ(history[0].open_time_ms, 3 * ONE_MINUTE_MS);
    EXPECT_EQ(history[2].open_time_ms, 5 * ONE_MINUTE_MS);
}

TEST(BarAggregatorTest, ConfirmedCandlePassesThrough) {
    BarAggregator aggregator("1m", 100);

    EXPECT_TRUE(aggregator.on_candle_update(make_candle(60000, 100.0, false)).empty());
    std::vector<Bar> completed_bars = aggregator.on_candle_update(make_candle(60000, 101.0, true));

    ASSERT_EQ(completed_bars.size(), 1u);
    EXPECT_EQ(completed_bars[0].open_time_ms, 60000);
    EXPECT_DOUBLE_EQ(completed_bars[0].close_price, 101.0);
    EXPECT_FALSE(aggregator.has_open_bar());
}

TEST(BarAggregatorTest, LaterCandleFinalizesPendingCandle) {
    BarAggregator aggregator("1m", 100);

    aggregator.on_candle_update(make_candle(120000, 100.0, false));
    aggregator.on_candle_update(make_candle(120000, 103.0, false));
    std::vector<Bar> completed_bars = aggregator.on_candle_update(make_candle(180000, 104.0, false));

    ASSERT_EQ(completed_bars.size(), 1u);
    EXPECT_EQ(completed_bars[0].open_time_ms, 120000);
    EXPECT_DOUBLE_EQ(completed_bars[0].close_price, 103.0);
    EXPECT_TRUE(completed_bars[0].complete);
    EXPECT_EQ(aggregator.get_open_bar().open_time_ms, 180000);
}

TEST(BarAggregatorTest, RejectsDuplicateMisalignedAndOlderCandles) {
    BarAggregator aggregator("1m", 100);

    ASSERT_EQ(aggregator.on_candle_update(make_candle(120000, 100.0, true)).size(), 1u);
    EXPECT_TRUE(aggregator.on_candle_update(make_candle(120000, 100.0, true)).empty());
    EXPECT_TRUE(aggregator.on_candle_update(make_candle(60000, 100.0, true)).empty());
    EXPECT_TRUE(aggregator.on_candle_update(make_candle(150000, 100.0, true)).empty());

    aggregator.on_candle_update(make_candle(300000, 100.0, false));
    EXPECT_TRUE(aggregator.on_candle_update(make_candle(240000, 100.0, true)).empty());
    EXPECT_EQ(aggregator.get_bar_history().size(), 1u);
}

TEST(BarAggregatorTest, RejectsInvalidConstruction) {
    EXPECT_THROW(BarAggregator("15x", 100), std::invalid_argument);
    EXPECT_THROW(BarAggregator("1m", 0), std::invalid_argument);
}
