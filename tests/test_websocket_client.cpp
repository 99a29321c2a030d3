#include "api/okx/websocket_client.hpp"
#include <gtest/gtest.h>
#include <string>
#include <vector>

using OkxTrader::API::Okx::WebSocketClient;

TEST(WebSocketClientTest, AcceptsOnlySecureUrls) {
    EXPECT_TRUE(WebSocketClient::validateUrl("wss://ws.okx.com:8443/ws/v5/public"));
    EXPECT_FALSE(WebSocketClient::validateUrl("ws://ws.okx.com:8443/ws/v5/public"));
    EXPECT_FALSE(WebSocketClient::validateUrl("https://www.okx.com"));
}

TEST(WebSocketClientTest, SplitsUrlIntoHostPortAndPath) {
    const std::string websocket_url = "wss://ws.okx.com:8443/ws/v5/public";
    EXPECT_EQ(WebSocketClient::extractHostname(websocket_url), "ws.okx.com");
    EXPECT_EQ(WebSocketClient::extractPort(websocket_url), "8443");
    EXPECT_EQ(WebSocketClient::extractPath(websocket_url), "/ws/v5/public");
}

TEST(WebSocketClientTest, DefaultsPortAndPath) {
    EXPECT_EQ(WebSocketClient::extractPort("wss://example.com"), "443");
    EXPECT_EQ(WebSocketClient::extractPath("wss://example.com"), "/");
    EXPECT_EQ(WebSocketClient::extractPath("wss://example.com?x=1"), "/?x=1");
}

TEST(WebSocketClientTest, ConnectRejectsPlainUrlWithoutNetworkAccess) {
    WebSocketClient websocket_client;
    EXPECT_FALSE(websocket_client.connect("ws://localhost:1/"));
    EXPECT_FALSE(websocket_client.isConnected());
    EXPECT_FALSE(websocket_client.getLastError().empty());
}

TEST(WebSocketClientTest, PollReportsClosedWhenNotConnected) {
    WebSocketClient websocket_client;
    EXPECT_EQ(websocket_client.pollMessage(10), WebSocketClient::PollResult::CONNECTION_CLOSED);
}

TEST(WebSocketClientTest, ReassemblesContinuationFrames) {
    WebSocketClient websocket_client;
    std::vector<std::string> delivered_messages;
    websocket_client.setMessageCallback([&delivered_messages](const std::string& message) {
        delivered_messages.push_back(message);
    });

    EXPECT_EQ(websocket_client.handleFrame(0x1, false, "{\"arg\":"), WebSocketClient::PollResult::MESSAGE_PROCESSED);
    EXPECT_EQ(websocket_client.handleFrame(0x0, false, "{\"channel\":"), WebSocketClient::PollResult::MESSAGE_PROCESSED);
    EXPECT_TRUE(delivered_messages.empty());
    EXPECT_EQ(websocket_client.handleFrame(0x0, true, "\"tickers\"}}"), WebSocketClient::PollResult::MESSAGE_PROCESSED);

    ASSERT_EQ(delivered_messages.size(), 1u);
    EXPECT_EQ(delivered_messages[0], "{\"arg\":{\"channel\":\"tickers\"}}");
}

TEST(WebSocketClientTest, RejectsContinuationWithoutInitialFrame) {
    WebSocketClient websocket_client;
    EXPECT_EQ(websocket_client.handleFrame(0x0, true, "orphan"), WebSocketClient::PollResult::RECEIVE_ERROR);
}

TEST(WebSocketClientTest, RejectsFragmentedMessageOverSizeLimit) {
    WebSocketClient websocket_client;
    int delivered_count = 0;
    websocket_client.setMessageCallback([&delivered_count](const std::string&) { ++delivered_count; });

    const std::string fragment_payload(WebSocketClient::MAX_MESSAGE_PAYLOAD_BYTES / 2, 'x');
    EXPECT_EQ(websocket_client.handleFrame(0x1, false, fragment_payload), WebSocketClient::PollResult::MESSAGE_PROCESSED);
    EXPECT_EQ(websocket_client.handleFrame(0x0, false, fragment_payload), WebSocketClient::PollResult::MESSAGE_PROCESSED);
    EXPECT_EQ(websocket_client.handleFrame(0x0, true, "y"), WebSocketClient::PollResult::RECEIVE_ERROR);
    EXPECT_NE(websocket_client.getLastError().find("too large"), std::string::npos);
    EXPECT_EQ(delivered_count, 0);

    // The oversized message is discarded; a fresh message goes through.
    EXPECT_EQ(websocket_client.handleFrame(0x1, true, "pong"), WebSocketClient::PollResult::MESSAGE_PROCESSED);
    EXPECT_EQ(delivered_count, 1);
}
