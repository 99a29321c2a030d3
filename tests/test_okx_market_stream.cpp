#include "api/okx/okx_market_stream.hpp"
#include "utils/time_utils.hpp"
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace OkxTrader;
using OkxTrader::API::Okx::OkxMarketStream;

namespace {

class CollectingEventHandler : public API::MarketEventHandler {
public:
    std::vector<Core::Tick> ticks;
    std::vector<Core::Bar> candles;
    std::vector<Core::StreamWarning> warnings;

    void on_tick(const Core::Tick& tick) override { ticks.push_back(tick); }
    void on_candle_update(const Core::Bar& candle) override { candles.push_back(candle); }
    void on_stream_warning(const Core::StreamWarning& warning) override { warnings.push_back(warning); }
};

std::string ticker_message(long long exchange_timestamp_ms) {
    return R"({"arg":{"channel":"tickers","instId":"BTC-USDT-SWAP"},"data":[{"instId":"BTC-USDT-SWAP","last":"50000","ts":")" +
           std::to_string(exchange_timestamp_ms) + R"("}]})";
}

class OkxMarketStreamTest : public ::testing::Test {
protected:
    OkxMarketStreamTest() : connectivity_manager(3, 1000, 1.5), market_stream(stream_config, event_handler, connectivity_manager) {}

    StreamConfig stream_config;
    CollectingEventHandler event_handler;
    ConnectivityManager connectivity_manager;
    OkxMarketStream market_stream;
};

} // anonymous namespace

TEST_F(OkxMarketStreamTest, TickerWithinSkewToleranceIsDelivered) {
    market_stream.handle_text_message(ticker_message(TimeUtils::get_current_epoch_milliseconds()));

    ASSERT_EQ(event_handler.ticks.size(), 1u);
    EXPECT_DOUBLE_EQ(event_handler.ticks[0].price, 50000.0);
    EXPECT_TRUE(event_handler.warnings.empty());
}

TEST_F(OkxMarketStreamTest, ClockSkewWarnsButKeepsTheTick) {
    market_stream.handle_text_message(ticker_message(TimeUtils::get_current_epoch_milliseconds() - 60000));

    ASSERT_EQ(event_handler.ticks.size(), 1u);
    ASSERT_EQ(event_handler.warnings.size(), 1u);
    EXPECT_EQ(event_handler.warnings[0].type, Core::StreamWarningType::CLOCK_SKEW);
    EXPECT_LT(event_handler.warnings[0].skew_ms, -stream_config.clock_skew_threshold_ms);
}

TEST_F(OkxMarketStreamTest, CandlesAreForwarded) {
    market_stream.handle_text_message(
        R"({"arg":{"channel":"candle30m","instId":"BTC-USDT-SWAP"},"data":[["1700001000000","1","2","0.5","1.5","10","0","0","1"]]})");
    ASSERT_EQ(event_handler.candles.size(), 1u);
    EXPECT_TRUE(event_handler.candles[0].complete);
}

TEST_F(OkxMarketStreamTest, SubscriptionErrorBecomesWarning) {
    market_stream.handle_text_message(R"({"event":"error","code":"60018","msg":"Wrong URL or channel"})");
    ASSERT_EQ(event_handler.warnings.size(), 1u);
    EXPECT_EQ(event_handler.warnings[0].type, Core::StreamWarningType::SUBSCRIPTION_ERROR);
    EXPECT_NE(event_handler.warnings[0].message.find("60018"), std::string::npos);
}

TEST_F(OkxMarketStreamTest, SubscriptionAckResetsReconnectAttempts) {
    connectivity_manager.begin_connect_attempt();
    connectivity_manager.report_failure("refused");
    ASSERT_EQ(connectivity_manager.get_consecutive_failures(), 1);

    market_stream.handle_text_message(R"({"event":"subscribe","arg":{"channel":"tickers","instId":"BTC-USDT-SWAP"}})");
    EXPECT_EQ(connectivity_manager.get_consecutive_failures(), 0);
}

TEST_F(OkxMarketStreamTest, MalformedFramesAreIgnored) {
    market_stream.handle_text_message("{broken");
    market_stream.handle_text_message("pong");
    EXPECT_TRUE(event_handler.ticks.empty());
    EXPECT_TRUE(event_handler.warnings.empty());
}

TEST_F(OkxMarketStreamTest, StopIsSticky) {
    EXPECT_FALSE(market_stream.is_stop_requested());
    market_stream.stop();
    EXPECT_TRUE(market_stream.is_stop_requested());
}
