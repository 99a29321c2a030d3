#include "trading_logs.hpp"
#include "logging/logger/async_logger.hpp"
#include "logging/logger/logging_macros.hpp"
#include <iomanip>
#include <sstream>

namespace OkxTrader {
namespace Logging {

namespace {

std::string format_price(double value) {
    std::ostringstream price_stream;
    price_stream << std::fixed << std::setprecision(2) << value;
    return price_stream.str();
}

} // anonymous namespace

void TradingLogs::log_order_intent(const std::string& symbol, const std::string& side, const std::string& size, double reference_price) {
    LOG_THREAD_ORDER_EXECUTION_HEADER();
    TABLE_HEADER_48("Order Intent", symbol);
    TABLE_ROW_48("Side", side);
    TABLE_ROW_48("Size", size);
    TABLE_ROW_48("Reference Price", format_price(reference_price));
    TABLE_FOOTER_48();
}

void TradingLogs::log_order_result(const std::string& order_id, bool success, const std::string& reason) {
    if (success) {
        LOG_THREAD_CONTENT("ORDER RESULT: accepted, id " + (order_id.empty() ? std::string("unknown") : order_id) +
                           (reason.empty() ? std::string() : " (" + reason + ")"));
    } else {
        LOG_THREAD_CONTENT("ORDER RESULT: rejected - " + reason);
    }
}

void TradingLogs::log_protective_orders(double stop_loss_price, double take_profit_price, bool success, const std::string& reason) {
    std::string targets = "SL " + format_price(stop_loss_price) + " / TP " + format_price(take_profit_price);
    if (success) {
        LOG_THREAD_CONTENT("EXIT TARGETS: " + targets + " placed");
    } else {
        LOG_THREAD_CONTENT("WARNING: EXIT TARGETS " + targets + " not placed - " + reason);
    }
}

void TradingLogs::log_paper_order(const std::string& symbol, const std::string& side, const std::string& size, double reference_price) {
    LOG_THREAD_CONTENT("PAPER ORDER: " + side + " " + size + " " + symbol + " @ " + format_price(reference_price));
}

void TradingLogs::log_signal_skipped(const std::string& action, const std::string& reason) {
    log_message("Signal " + action + " skipped: " + reason, "");
}

void TradingLogs::log_leverage_result(const std::string& symbol, int leverage, const std::string& margin_mode, bool success) {
    if (success) {
        log_message("Leverage set to " + std::to_string(leverage) + "x (" + margin_mode + ") for " + symbol, "");
    } else {
        log_message("WARNING: Failed to set leverage " + std::to_string(leverage) + "x for " + symbol + " - continuing", "");
    }
}

void TradingLogs::log_execution_error(const std::string& error_message) {
    log_message("ERROR: Order execution failed: " + error_message, "");
}

} // namespace Logging
} // namespace OkxTrader
