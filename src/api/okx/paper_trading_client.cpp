#include "paper_trading_client.hpp"
#include "okx_trading_client.hpp"
#include "logging/logs/trading_logs.hpp"

using OkxTrader::Logging::TradingLogs;

namespace OkxTrader {
namespace API {
namespace Okx {

PaperTradingClient::PaperTradingClient(const ExecutionConfig& execution_config, const std::atomic<double>& last_price_source)
    : config(execution_config), reference_price(last_price_source), order_sequence(0) {}

Core::OrderResult PaperTradingClient::place_order(const std::string& symbol, const std::string& side, const std::string& size) {
    double price = reference_price.load();
    TradingLogs::log_paper_order(symbol, side, size, price);

    Core::OrderResult order_result;
    order_result.order_successful = true;
    order_result.order_id = "paper-" + std::to_string(++order_sequence);
    order_result.executed_price = price;
    TradingLogs::log_order_result(order_result.order_id, true, "");

    if (price > 0.0) {
        TradingLogs::log_protective_orders(compute_stop_loss_price(price, side, config.stop_loss_percentage),
                                           compute_take_profit_price(price, side, config.take_profit_percentage),
                                           true, "");
    }
    return order_result;
}

bool PaperTradingClient::set_leverage(const std::string&, int, const std::string&) {
    return true;
}

std::string PaperTradingClient::get_client_name() const {
    return "Paper";
}

} // namespace Okx
} // namespace API
} // namespace OkxTrader
