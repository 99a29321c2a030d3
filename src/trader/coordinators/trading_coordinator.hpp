#ifndef TRADING_COORDINATOR_HPP
#define TRADING_COORDINATOR_HPP

#include "configs/execution_config.hpp"
#include "api/general/execution_interface.hpp"
#include "trader/data_structures/data_structures.hpp"
#include <atomic>
#include <string>

namespace OkxTrader {
namespace Core {

enum class TradeDecision {
    EXECUTED,
    SKIPPED_HOLD,
    SKIPPED_COOLDOWN,
    SKIPPED_IN_FLIGHT,
    FAILED
};

std::string to_string(TradeDecision decision);

/**
 * Turns published signals into orders. Allows at most one order placement at
 * a time and enforces a minimum interval between accepted trades.
 */
class TradingCoordinator {
public:
    TradingCoordinator(API::ExecutionInterface& execution_client_ref, const ExecutionConfig& execution_config,
                       const std::string& trading_symbol);

    TradeDecision handle_signal(const Signal& signal, long long now_ms);

    // Applies configured leverage once at startup. Failure is logged, not fatal.
    bool configure_leverage();

    long long get_last_trade_time_ms() const { return last_trade_time_ms.load(); }
    unsigned long long get_executed_trade_count() const { return executed_trade_count.load(); }

private:
    API::ExecutionInterface& execution_client;
    const ExecutionConfig& config;
    std::string symbol;

    std::atomic<bool> order_in_flight;
    std::atomic<bool> has_traded;
    std::atomic<long long> last_trade_time_ms;
    std::atomic<unsigned long long> executed_trade_count;
};

} // namespace Core
} // namespace OkxTrader

#endif // TRADING_COORDINATOR_HPP
