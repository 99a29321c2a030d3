#include "okx_trading_client.hpp"
#include "logging/logs/trading_logs.hpp"
#include "utils/crypto_utils.hpp"
#include "utils/http_utils.hpp"
#include "utils/time_utils.hpp"
#include <iomanip>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;
using OkxTrader::Logging::TradingLogs;

namespace OkxTrader {
namespace API {
namespace Okx {

namespace {

constexpr const char* TICKER_PATH = "/api/v5/market/ticker";
constexpr const char* ORDER_PATH = "/api/v5/trade/order";
constexpr const char* ALGO_ORDER_PATH = "/api/v5/trade/order-algo";
constexpr const char* SET_LEVERAGE_PATH = "/api/v5/account/set-leverage";
constexpr int PRICE_DECIMALS = 2;
// Order submission is not idempotent and is never retried
constexpr int ORDER_SUBMISSION_RETRIES = 1;

std::string format_price(double price) {
    std::ostringstream price_stream;
    price_stream << std::fixed << std::setprecision(PRICE_DECIMALS) << price;
    return price_stream.str();
}

std::string opposite_side(const std::string& side) {
    return side == "buy" ? "sell" : "buy";
}

// OKX reports failures in-band: top-level "code" != "0", per-order "sCode" != "0".
void require_success(const json& response_json, const std::string& context) {
    std::string response_code = response_json.value("code", "");
    if (response_code != "0") {
        std::string message = response_json.value("msg", "");
        if (response_json.contains("data") && response_json.at("data").is_array() && !response_json.at("data").empty()) {
            const json& first_row = response_json.at("data").at(0);
            if (first_row.contains("sMsg")) {
                message += " " + first_row.value("sMsg", "");
            }
        }
        throw std::runtime_error(context + " rejected (code " + response_code + "): " + message);
    }
}

} // anonymous namespace

double compute_stop_loss_price(double entry_price, const std::string& side, double stop_loss_percentage) {
    double offset_fraction = stop_loss_percentage / 100.0;
    return side == "buy" ? entry_price * (1.0 - offset_fraction) : entry_price * (1.0 + offset_fraction);
}

double compute_take_profit_price(double entry_price, const std::string& side, double take_profit_percentage) {
    double offset_fraction = take_profit_percentage / 100.0;
    return side == "buy" ? entry_price * (1.0 + offset_fraction) : entry_price * (1.0 - offset_fraction);
}

std::string build_okx_signature(const std::string& secret_key, const std::string& timestamp,
                                const std::string& method, const std::string& request_path, const std::string& body) {
    return CryptoUtils::base64_encode(CryptoUtils::hmac_sha256(secret_key, timestamp + method + request_path + body));
}

std::string extract_order_id(const json& order_response) {
    auto data_iterator = order_response.find("data");
    if (data_iterator == order_response.end() || !data_iterator->is_array() || data_iterator->empty()) {
        return "";
    }
    const json& first_row = data_iterator->front();
    if (!first_row.is_object()) {
        return "";
    }
    auto order_id_iterator = first_row.find("ordId");
    if (order_id_iterator == first_row.end() || !order_id_iterator->is_string()) {
        return "";
    }
    return order_id_iterator->get<std::string>();
}

OkxTradingClient::OkxTradingClient(const ExecutionConfig& execution_config) : config(execution_config) {
    if (config.api_key.empty() || config.secret_key.empty() || config.passphrase.empty()) {
        throw std::runtime_error("OKX credentials are required for live execution (OKX_API_KEY, OKX_SECRET_KEY, OKX_PASSPHRASE)");
    }
    if (config.api_base_url.empty()) {
        throw std::runtime_error("OKX REST base URL is not configured");
    }
}

std::vector<std::string> OkxTradingClient::build_auth_headers(const std::string& method, const std::string& request_path, const std::string& body) const {
    std::string timestamp = TimeUtils::get_current_iso_time_with_milliseconds();
    std::vector<std::string> header_lines;
    header_lines.push_back("OK-ACCESS-KEY: " + config.api_key);
    header_lines.push_back("OK-ACCESS-SIGN: " + build_okx_signature(config.secret_key, timestamp, method, request_path, body));
    header_lines.push_back("OK-ACCESS-TIMESTAMP: " + timestamp);
    header_lines.push_back("OK-ACCESS-PASSPHRASE: " + config.passphrase);
    if (config.simulated_trading) {
        header_lines.push_back("x-simulated-trading: 1");
    }
    return header_lines;
}

json OkxTradingClient::make_signed_request(const std::string& method, const std::string& request_path, const std::string& body, int retries) const {
    std::string request_url = config.api_base_url + request_path;
    HttpRequest http_request(request_url, build_auth_headers(method, request_path, body), body, retries,
                             config.http_timeout_seconds);

    std::string response;
    try {
        response = method == "POST" ? http_post(http_request) : http_get(http_request);
    } catch (const std::exception& exception_error) {
        throw std::runtime_error("OKX " + method + " " + request_path + " failed: " + exception_error.what());
    }

    json response_json = json::parse(response, nullptr, false);
    if (response_json.is_discarded()) {
        throw std::runtime_error("OKX " + method + " " + request_path + " returned invalid JSON");
    }
    return response_json;
}

json OkxTradingClient::make_public_request(const std::string& request_path) const {
    HttpRequest http_request(config.api_base_url + request_path, std::vector<std::string>(), std::string(),
                             config.http_retries, config.http_timeout_seconds);
    std::string response = http_get(http_request);
    json response_json = json::parse(response, nullptr, false);
    if (response_json.is_discarded()) {
        throw std::runtime_error("OKX GET " + request_path + " returned invalid JSON");
    }
    return response_json;
}

double OkxTradingClient::get_last_price(const std::string& symbol) const {
    json ticker_json = make_public_request(std::string(TICKER_PATH) + "?instId=" + symbol);
    require_success(ticker_json, "Ticker request");
    const json& ticker_rows = ticker_json.at("data");
    if (!ticker_rows.is_array() || ticker_rows.empty()) {
        throw std::runtime_error("Ticker response for " + symbol + " carries no data");
    }
    return std::stod(ticker_rows.at(0).at("last").get<std::string>());
}

Core::OrderResult OkxTradingClient::place_order(const std::string& symbol, const std::string& side, const std::string& size) {
    Core::OrderResult order_result;

    double last_price = get_last_price(symbol);
    TradingLogs::log_order_intent(symbol, side, size, last_price);

    json order_json;
    order_json["instId"] = symbol;
    order_json["tdMode"] = config.trade_mode;
    order_json["side"] = side;
    order_json["ordType"] = "market";
    order_json["sz"] = size;

    json order_response = make_signed_request("POST", ORDER_PATH, order_json.dump(), ORDER_SUBMISSION_RETRIES);
    try {
        require_success(order_response, "Market order");
    } catch (const std::runtime_error& rejection_error) {
        order_result.error_message = rejection_error.what();
        TradingLogs::log_order_result("", false, order_result.error_message);
        return order_result;
    }

    order_result.order_successful = true;
    order_result.executed_price = last_price;
    // Accepted even without an id: the market order has been placed
    order_result.order_id = extract_order_id(order_response);
    TradingLogs::log_order_result(order_result.order_id, true,
                                  order_result.order_id.empty() ? "response carried no ordId" : "");

    double stop_loss_price = compute_stop_loss_price(last_price, side, config.stop_loss_percentage);
    double take_profit_price = compute_take_profit_price(last_price, side, config.take_profit_percentage);

    json algo_json;
    algo_json["instId"] = symbol;
    algo_json["tdMode"] = config.trade_mode;
    algo_json["side"] = opposite_side(side);
    algo_json["ordType"] = "oco";
    algo_json["sz"] = size;
    algo_json["slTriggerPx"] = format_price(stop_loss_price);
    algo_json["slOrdPx"] = "-1";
    algo_json["tpTriggerPx"] = format_price(take_profit_price);
    algo_json["tpOrdPx"] = "-1";

    // The market order stands even when its exit orders cannot be placed
    try {
        json algo_response = make_signed_request("POST", ALGO_ORDER_PATH, algo_json.dump(), ORDER_SUBMISSION_RETRIES);
        require_success(algo_response, "Protective order");
        TradingLogs::log_protective_orders(stop_loss_price, take_profit_price, true, "");
    } catch (const std::exception& protective_order_error) {
        TradingLogs::log_protective_orders(stop_loss_price, take_profit_price, false, protective_order_error.what());
    }

    return order_result;
}

bool OkxTradingClient::set_leverage(const std::string& symbol, int leverage, const std::string& margin_mode) {
    json leverage_json;
    leverage_json["instId"] = symbol;
    leverage_json["lever"] = std::to_string(leverage);
    leverage_json["mgnMode"] = margin_mode;

    try {
        json leverage_response = make_signed_request("POST", SET_LEVERAGE_PATH, leverage_json.dump(), config.http_retries);
        require_success(leverage_response, "Set leverage");
    } catch (const std::exception& leverage_error) {
        TradingLogs::log_execution_error(leverage_error.what());
        return false;
    }
    return true;
}

std::string OkxTradingClient::get_client_name() const {
    return config.simulated_trading ? "OKX (simulated trading)" : "OKX";
}

} // namespace Okx
} // namespace API
} // namespace OkxTrader
