#ifndef OKX_TRADING_CLIENT_HPP
#define OKX_TRADING_CLIENT_HPP

#include "api/general/execution_interface.hpp"
#include "configs/execution_config.hpp"
#include "trader/data_structures/data_structures.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace OkxTrader {
namespace API {
namespace Okx {

// Exit levels around an entry price. side is the entry side ("buy" or "sell").
double compute_stop_loss_price(double entry_price, const std::string& side, double stop_loss_percentage);
double compute_take_profit_price(double entry_price, const std::string& side, double take_profit_percentage);

// Base64(HMAC-SHA256(secret, timestamp + method + request_path + body))
std::string build_okx_signature(const std::string& secret_key, const std::string& timestamp,
                                const std::string& method, const std::string& request_path, const std::string& body);

// ordId of the first data row; empty when the response carries no row.
std::string extract_order_id(const nlohmann::json& order_response);

/**
 * Live order routing through the OKX v5 REST API.
 * A market order is followed by a one-cancels-other stop-loss/take-profit algo order.
 */
class OkxTradingClient : public ExecutionInterface {
private:
    ExecutionConfig config;

    std::vector<std::string> build_auth_headers(const std::string& method, const std::string& request_path, const std::string& body) const;
    nlohmann::json make_signed_request(const std::string& method, const std::string& request_path, const std::string& body, int retries) const;
    nlohmann::json make_public_request(const std::string& request_path) const;

public:
    // Throws std::runtime_error when credentials are missing.
    explicit OkxTradingClient(const ExecutionConfig& execution_config);

    Core::OrderResult place_order(const std::string& symbol, const std::string& side, const std::string& size) override;
    bool set_leverage(const std::string& symbol, int leverage, const std::string& margin_mode) override;
    std::string get_client_name() const override;

    double get_last_price(const std::string& symbol) const;
};

} // namespace Okx
} // namespace API
} // namespace OkxTrader

#endif // OKX_TRADING_CLIENT_HPP
