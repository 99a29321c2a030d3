#include "trading_coordinator.hpp"
#include "logging/logs/trading_logs.hpp"

namespace OkxTrader {
namespace Core {

using OkxTrader::Logging::TradingLogs;

namespace {

// Clears the in-flight flag however the placement ends.
class InFlightGuard {
public:
    explicit InFlightGuard(std::atomic<bool>& flag_ref) : flag(flag_ref) {}
    ~InFlightGuard() { flag.store(false); }

    InFlightGuard(const InFlightGuard&) = delete;
    InFlightGuard& operator=(const InFlightGuard&) = delete;

private:
    std::atomic<bool>& flag;
};

} // anonymous namespace

std::string to_string(TradeDecision decision) {
    switch (decision) {
        case TradeDecision::EXECUTED: return "EXECUTED";
        case TradeDecision::SKIPPED_HOLD: return "SKIPPED_HOLD";
        case TradeDecision::SKIPPED_COOLDOWN: return "SKIPPED_COOLDOWN";
        case TradeDecision::SKIPPED_IN_FLIGHT: return "SKIPPED_IN_FLIGHT";
        case TradeDecision::FAILED: return "FAILED";
    }
    return "UNKNOWN";
}

TradingCoordinator::TradingCoordinator(API::ExecutionInterface& execution_client_ref, const ExecutionConfig& execution_config,
                                       const std::string& trading_symbol)
    : execution_client(execution_client_ref), config(execution_config), symbol(trading_symbol),
      order_in_flight(false), has_traded(false), last_trade_time_ms(0), executed_trade_count(0) {}

TradeDecision TradingCoordinator::handle_signal(const Signal& signal, long long now_ms) {
    if (signal.action == SignalAction::HOLD) {
        return TradeDecision::SKIPPED_HOLD;
    }

    std::string action_name = to_string(signal.action);

    bool expected_idle = false;
    if (!order_in_flight.compare_exchange_strong(expected_idle, true)) {
        TradingLogs::log_signal_skipped(action_name, "an order is already in flight");
        return TradeDecision::SKIPPED_IN_FLIGHT;
    }
    InFlightGuard in_flight_guard(order_in_flight);

    if (has_traded.load() && now_ms - last_trade_time_ms.load() < config.trade_cooldown_ms) {
        long long remaining_ms = config.trade_cooldown_ms - (now_ms - last_trade_time_ms.load());
        TradingLogs::log_signal_skipped(action_name, "cooldown active, " + std::to_string(remaining_ms) + "ms remaining");
        return TradeDecision::SKIPPED_COOLDOWN;
    }

    std::string side = signal.action == SignalAction::BUY ? "buy" : "sell";

    OrderResult order_result;
    try {
        order_result = execution_client.place_order(symbol, side, config.trade_size);
    } catch (const std::exception& execution_error) {
        TradingLogs::log_execution_error(execution_error.what());
        return TradeDecision::FAILED;
    }

    if (!order_result.order_successful) {
        TradingLogs::log_execution_error(order_result.error_message);
        return TradeDecision::FAILED;
    }

    last_trade_time_ms.store(now_ms);
    has_traded.store(true);
    executed_trade_count.fetch_add(1);
    return TradeDecision::EXECUTED;
}

bool TradingCoordinator::configure_leverage() {
    bool leverage_applied = false;
    try {
        leverage_applied = execution_client.set_leverage(symbol, config.leverage, config.trade_mode);
    } catch (const std::exception& leverage_error) {
        TradingLogs::log_execution_error(leverage_error.what());
    }
    TradingLogs::log_leverage_result(symbol, config.leverage, config.trade_mode, leverage_applied);
    return leverage_applied;
}

} // namespace Core
} // namespace OkxTrader
