#ifndef TRADING_LOGS_HPP
#define TRADING_LOGS_HPP

#include "trader/data_structures/data_structures.hpp"
#include <string>

namespace OkxTrader {
namespace Logging {

class TradingLogs {
public:
    static void log_order_intent(const std::string& symbol, const std::string& side, const std::string& size, double reference_price);
    static void log_order_result(const std::string& order_id, bool success, const std::string& reason);
    static void log_protective_orders(double stop_loss_price, double take_profit_price, bool success, const std::string& reason);
    static void log_paper_order(const std::string& symbol, const std::string& side, const std::string& size, double reference_price);
    static void log_signal_skipped(const std::string& action, const std::string& reason);
    static void log_leverage_result(const std::string& symbol, int leverage, const std::string& margin_mode, bool success);
    static void log_execution_error(const std::string& error_message);
};

} // namespace Logging
} // namespace OkxTrader

#endif // TRADING_LOGS_HPP
