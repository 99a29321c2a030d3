#include "api/okx/okx_trading_client.hpp"
#include "api/okx/paper_trading_client.hpp"
#include <gtest/gtest.h>
#include <atomic>

using namespace OkxTrader::API::Okx;

TEST(OkxTradingClientTest, SignatureIsBase64HmacOfPrehash) {
    std::string signature = build_okx_signature("secret", "2020-12-08T09:08:57.715Z", "GET",
                                                "/api/v5/account/balance?ccy=BTC", "");
    EXPECT_EQ(signature, "wpDvCwYCprcMQsQkxWJiWy+YADoQE4ep+OEKKLimMoY=");
}

TEST(OkxTradingClientTest, ProtectiveLevelsSitOnOppositeSides) {
    EXPECT_DOUBLE_EQ(compute_stop_loss_price(100.0, "buy", 0.5), 99.5);
    EXPECT_DOUBLE_EQ(compute_take_profit_price(100.0, "buy", 1.0), 101.0);
    EXPECT_DOUBLE_EQ(compute_stop_loss_price(100.0, "sell", 0.5), 100.5);
    EXPECT_DOUBLE_EQ(compute_take_profit_price(100.0, "sell", 1.0), 99.0);
}

TEST(OkxTradingClientTest, ExtractsOrderIdFromFirstDataRow) {
    nlohmann::json accepted = nlohmann::json::parse(
        R"({"code":"0","msg":"","data":[{"ordId":"312269865356374016","sCode":"0","sMsg":""}]})");
    EXPECT_EQ(extract_order_id(accepted), "312269865356374016");
}

TEST(OkxTradingClientTest, MissingOrderIdYieldsEmptyString) {
    EXPECT_EQ(extract_order_id(nlohmann::json::parse(R"({"code":"0","msg":"","data":[]})")), "");
    EXPECT_EQ(extract_order_id(nlohmann::json::parse(R"({"code":"0","msg":""})")), "");
    EXPECT_EQ(extract_order_id(nlohmann::json::parse(R"({"code":"0","data":[{"sCode":"0"}]})")), "");
    EXPECT_EQ(extract_order_id(nlohmann::json::parse(R"({"code":"0","data":[{"ordId":42}]})")), "");
    EXPECT_EQ(extract_order_id(nlohmann::json::parse(R"({"code":"0","data":"none"})")), "");
}

TEST(OkxTradingClientTest, LiveClientRequiresCredentials) {
    ExecutionConfig execution_config;
    execution_config.api_key = "key";
    execution_config.secret_key = "";
    execution_config.passphrase = "pass";
    EXPECT_THROW(OkxTradingClient client(execution_config), std::runtime_error);
}

TEST(PaperTradingClientTest, AcceptsOrdersAtLastPrice) {
    ExecutionConfig execution_config;
    std::atomic<double> last_price{25000.0};
    PaperTradingClient paper_client(execution_config, last_price);

    OkxTrader::Core::OrderResult first_result = paper_client.place_order("BTC-USDT-SWAP", "buy", "0.01");
    OkxTrader::Core::OrderResult second_result = paper_client.place_order("BTC-USDT-SWAP", "sell", "0.01");

    EXPECT_TRUE(first_result.order_successful);
    EXPECT_DOUBLE_EQ(first_result.executed_price, 25000.0);
    EXPECT_NE(first_result.order_id, second_result.order_id);
    EXPECT_TRUE(paper_client.set_leverage("BTC-USDT-SWAP", 5, "cross"));
    EXPECT_EQ(paper_client.get_client_name(), "Paper");
}
