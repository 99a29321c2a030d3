#include "trader/coordinators/trading_coordinator.hpp"
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>

using namespace OkxTrader::Core;
using OkxTrader::API::ExecutionInterface;

namespace {

class RecordingExecutionClient : public ExecutionInterface {
public:
    std::vector<std::string> placed_sides;
    std::string last_size;
    bool next_order_succeeds = true;
    bool throw_on_order = false;
    bool leverage_result = true;
    TradingCoordinator* reentrant_coordinator = nullptr;
    TradeDecision reentrant_decision = TradeDecision::EXECUTED;

    OrderResult place_order(const std::string&, const std::string& side, const std::string& size) override {
        if (throw_on_order) {
            throw std::runtime_error("network unreachable");
        }
        if (reentrant_coordinator) {
            Signal nested_signal;
            nested_signal.action = SignalAction::SELL;
            reentrant_decision = reentrant_coordinator->handle_signal(nested_signal, 0);
        }
        placed_sides.push_back(side);
        last_size = size;

        OrderResult order_result;
        order_result.order_successful = next_order_succeeds;
        order_result.order_id = next_order_succeeds ? "order-" + std::to_string(placed_sides.size()) : "";
        order_result.error_message = next_order_succeeds ? "" : "51008: insufficient margin";
        return order_result;
    }

    bool set_leverage(const std::string&, int, const std::string&) override {
        return leverage_result;
    }

    std::string get_client_name() const override { return "Recording"; }
};

Signal make_signal(SignalAction action) {
    Signal signal;
    signal.action = action;
    signal.price = 100.0;
    return signal;
}

class TradingCoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        execution_config.trade_size = "0.01";
        execution_config.trade_cooldown_ms = 60000;
    }

    ExecutionConfig execution_config;
    RecordingExecutionClient execution_client;
};

} // anonymous namespace

TEST_F(TradingCoordinatorTest, ExecutesBuyAndSellWithConfiguredSize) {
    TradingCoordinator coordinator(execution_client, execution_config, "BTC-USDT-SWAP");

    EXPECT_EQ(coordinator.handle_signal(make_signal(SignalAction::BUY), 1000), TradeDecision::EXECUTED);
    EXPECT_EQ(coordinator.handle_signal(make_signal(SignalAction::SELL), 100000), TradeDecision::EXECUTED);

    EXPECT_EQ(execution_client.placed_sides, (std::vector<std::string>{"buy", "sell"}));
    EXPECT_EQ(execution_client.last_size, "0.01");
    EXPECT_EQ(coordinator.get_executed_trade_count(), 2u);
    EXPECT_EQ(coordinator.get_last_trade_time_ms(), 100000);
}

TEST_F(TradingCoordinatorTest, HoldNeverReachesTheExchange) {
    TradingCoordinator coordinator(execution_client, execution_config, "BTC-USDT-SWAP");
    EXPECT_EQ(coordinator.handle_signal(make_signal(SignalAction::HOLD), 1000), TradeDecision::SKIPPED_HOLD);
    EXPECT_TRUE(execution_client.placed_sides.empty());
}

TEST_F(TradingCoordinatorTest, CooldownSuppressesRapidTrades) {
    TradingCoordinator coordinator(execution_client, execution_config, "BTC-USDT-SWAP");

    ASSERT_EQ(coordinator.handle_signal(make_signal(SignalAction::BUY), 1000), TradeDecision::EXECUTED);
    EXPECT_EQ(coordinator.handle_signal(make_signal(SignalAction::SELL), 60999), TradeDecision::SKIPPED_COOLDOWN);
    EXPECT_EQ(coordinator.handle_signal(make_signal(SignalAction::SELL), 61000), TradeDecision::EXECUTED);
    EXPECT_EQ(execution_client.placed_sides.size(), 2u);
}

TEST_F(TradingCoordinatorTest, FirstTradeIsNeverInCooldown) {
    TradingCoordinator coordinator(execution_client, execution_config, "BTC-USDT-SWAP");
    EXPECT_EQ(coordinator.handle_signal(make_signal(SignalAction::SELL), 0), TradeDecision::EXECUTED);
}

TEST_F(TradingCoordinatorTest, SecondSignalWhileOrderInFlightIsSkipped) {
    TradingCoordinator coordinator(execution_client, execution_config, "BTC-USDT-SWAP");
    execution_client.reentrant_coordinator = &coordinator;

    EXPECT_EQ(coordinator.handle_signal(make_signal(SignalAction::BUY), 1000), TradeDecision::EXECUTED);
    EXPECT_EQ(execution_client.reentrant_decision, TradeDecision::SKIPPED_IN_FLIGHT);
    EXPECT_EQ(execution_client.placed_sides.size(), 1u);
}

TEST_F(TradingCoordinatorTest, RejectedOrderDoesNotStartCooldown) {
    TradingCoordinator coordinator(execution_client, execution_config, "BTC-USDT-SWAP");

    execution_client.next_order_succeeds = false;
    EXPECT_EQ(coordinator.handle_signal(make_signal(SignalAction::BUY), 1000), TradeDecision::FAILED);
    EXPECT_EQ(coordinator.get_executed_trade_count(), 0u);

    execution_client.next_order_succeeds = true;
    EXPECT_EQ(coordinator.handle_signal(make_signal(SignalAction::BUY), 2000), TradeDecision::EXECUTED);
}

TEST_F(TradingCoordinatorTest, ExecutionExceptionIsReportedAsFailure) {
    TradingCoordinator coordinator(execution_client, execution_config, "BTC-USDT-SWAP");
    execution_client.throw_on_order = true;

    EXPECT_EQ(coordinator.handle_signal(make_signal(SignalAction::SELL), 1000), TradeDecision::FAILED);

    execution_client.throw_on_order = false;
    EXPECT_EQ(coordinator.handle_signal(make_signal(SignalAction::SELL), 1001), TradeDecision::EXECUTED);
}

TEST_F(TradingCoordinatorTest, LeverageResultIsReturned) {
    TradingCoordinator coordinator(execution_client, execution_config, "BTC-USDT-SWAP");
    EXPECT_TRUE(coordinator.configure_leverage());
    execution_client.leverage_result = false;
    EXPECT_FALSE(coordinator.configure_leverage());
}
