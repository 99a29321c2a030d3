#ifndef PAPER_TRADING_CLIENT_HPP
#define PAPER_TRADING_CLIENT_HPP

#include "api/general/execution_interface.hpp"
#include "configs/execution_config.hpp"
#include <atomic>
#include <string>

namespace OkxTrader {
namespace API {
namespace Okx {

// Logs the orders it would place, priced at the last tick seen by the stream.
class PaperTradingClient : public ExecutionInterface {
private:
    ExecutionConfig config;
    const std::atomic<double>& reference_price;
    std::atomic<long long> order_sequence;

public:
    PaperTradingClient(const ExecutionConfig& execution_config, const std::atomic<double>& last_price_source);

    Core::OrderResult place_order(const std::string& symbol, const std::string& side, const std::string& size) override;
    bool set_leverage(const std::string& symbol, int leverage, const std::string& margin_mode) override;
    std::string get_client_name() const override;
};

} // namespace Okx
} // namespace API
} // namespace OkxTrader

#endif // PAPER_TRADING_CLIENT_HPP
