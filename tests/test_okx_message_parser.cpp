#include "api/okx/okx_message_parser.hpp"
#include <gtest/gtest.h>

using namespace OkxTrader::API::Okx;

TEST(OkxMessageParserTest, DecodesTickerPush) {
    const std::string ticker_message =
        R"({"arg":{"channel":"tickers","instId":"BTC-USDT-SWAP"},)"
        R"("data":[{"instId":"BTC-USDT-SWAP","last":"43250.5","vol24h":"1200.25","ts":"1700000000123"}]})";

    OkxParsedMessage parsed_message = parse_okx_message(ticker_message, 1700000000500);

    ASSERT_EQ(parsed_message.kind, OkxMessageKind::TICKER);
    ASSERT_EQ(parsed_message.ticks.size(), 1u);
    EXPECT_EQ(parsed_message.ticks[0].symbol, "BTC-USDT-SWAP");
    EXPECT_DOUBLE_EQ(parsed_message.ticks[0].price, 43250.5);
    EXPECT_DOUBLE_EQ(parsed_message.ticks[0].volume, 1200.25);
    EXPECT_EQ(parsed_message.ticks[0].exchange_timestamp_ms, 1700000000123LL);
    EXPECT_EQ(parsed_message.ticks[0].local_timestamp_ms, 1700000000500LL);
}

TEST(OkxMessageParserTest, DecodesConfirmedAndOpenCandles) {
    const std::string candle_message =
        R"({"arg":{"channel":"candle30m","instId":"BTC-USDT-SWAP"},"data":[)"
        R"(["1700001000000","100","110","95","105","12.5","0","0","1"],)"
        R"(["1700002800000","105","106","104","105.5","3","0","0","0"]]})";

    OkxParsedMessage parsed_message = parse_okx_message(candle_message, 0);

    ASSERT_EQ(parsed_message.kind, OkxMessageKind::CANDLE);
    ASSERT_EQ(parsed_message.candles.size(), 2u);
    EXPECT_EQ(parsed_message.candles[0].open_time_ms, 1700001000000LL);
    EXPECT_EQ(parsed_message.candles[0].close_time_ms, 1700001000000LL + 30 * 60 * 1000);
    EXPECT_DOUBLE_EQ(parsed_message.candles[0].high_price, 110.0);
    EXPECT_DOUBLE_EQ(parsed_message.candles[0].volume, 12.5);
    EXPECT_TRUE(parsed_message.candles[0].complete);
    EXPECT_FALSE(parsed_message.candles[1].complete);
}

TEST(OkxMessageParserTest, RecognisesEventsAndPong) {
    OkxParsedMessage ack = parse_okx_message(R"({"event":"subscribe","arg":{"channel":"tickers","instId":"ETH-USDT"}})", 0);
    EXPECT_EQ(ack.kind, OkxMessageKind::SUBSCRIBE_ACK);
    EXPECT_EQ(ack.channel, "tickers");

    OkxParsedMessage error_event = parse_okx_message(R"({"event":"error","code":"60012","msg":"Invalid request"})", 0);
    EXPECT_EQ(error_event.kind, OkxMessageKind::ERROR_EVENT);
    EXPECT_EQ(error_event.error_code, "60012");
    EXPECT_EQ(error_event.error_message, "Invalid request");

    EXPECT_EQ(parse_okx_message("pong", 0).kind, OkxMessageKind::PONG);
}

TEST(OkxMessageParserTest, ReportsMalformedInputWithoutThrowing) {
    EXPECT_EQ(parse_okx_message("{not json", 0).kind, OkxMessageKind::MALFORMED);
    EXPECT_EQ(parse_okx_message("[1,2,3]", 0).kind, OkxMessageKind::MALFORMED);

    const std::string bad_price =
        R"({"arg":{"channel":"tickers","instId":"BTC-USDT"},"data":[{"last":"abc","ts":"1"}]})";
    OkxParsedMessage bad_price_message = parse_okx_message(bad_price, 0);
    EXPECT_EQ(bad_price_message.kind, OkxMessageKind::MALFORMED);
    EXPECT_TRUE(bad_price_message.ticks.empty());

    const std::string short_candle =
        R"({"arg":{"channel":"candle1m","instId":"BTC-USDT"},"data":[["1","2","3"]]})";
    EXPECT_EQ(parse_okx_message(short_candle, 0).kind, OkxMessageKind::MALFORMED);
}

TEST(OkxMessageParserTest, UnknownChannelIsNotAnError) {
    const std::string trades_message = R"({"arg":{"channel":"trades","instId":"BTC-USDT"},"data":[]})";
    EXPECT_EQ(parse_okx_message(trades_message, 0).kind, OkxMessageKind::UNKNOWN);
}

TEST(OkxMessageParserTest, BuildsSubscribeRequests) {
    EXPECT_EQ(build_subscribe_message("tickers", "BTC-USDT-SWAP"),
              R"({"args":[{"channel":"tickers","instId":"BTC-USDT-SWAP"}],"op":"subscribe"})");
    EXPECT_EQ(build_candle_channel_name("30m"), "candle30m");
    EXPECT_EQ(build_candle_channel_name("1h"), "candle1H");
    EXPECT_EQ(build_candle_channel_name("1d"), "candle1D");
}
