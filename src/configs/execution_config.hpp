// ExecutionConfig.hpp
#ifndef EXECUTION_CONFIG_HPP
#define EXECUTION_CONFIG_HPP

#include <string>

struct ExecutionConfig {
    // ========================================================================
    // EXECUTION MODE
    // ========================================================================

    std::string mode;                                // "paper" (log only) or "live" (REST orders)
    std::string api_base_url;                        // REST base URL
    bool simulated_trading;                          // Sends x-simulated-trading: 1 (OKX demo account)

    // ========================================================================
    // ORDER PARAMETERS
    // ========================================================================

    std::string trade_size;                          // Order size in contracts, sent verbatim
    std::string trade_mode;                          // tdMode / mgnMode: cross or isolated
    int leverage;                                    // Leverage applied at startup
    double stop_loss_percentage;                     // Protective stop distance from entry, percent
    double take_profit_percentage;                   // Protective target distance from entry, percent
    long long trade_cooldown_ms;                     // Minimum time between accepted trades

    // ========================================================================
    // HTTP SETTINGS
    // ========================================================================

    int http_timeout_seconds;                        // Per-request timeout
    int http_retries;                                // Attempts per request

    // ========================================================================
    // CREDENTIALS (environment only)
    // ========================================================================

    std::string api_key;                             // OKX_API_KEY
    std::string secret_key;                          // OKX_SECRET_KEY
    std::string passphrase;                          // OKX_PASSPHRASE

    ExecutionConfig()
        : mode("paper"), api_base_url("https://www.okx.com"), simulated_trading(false), trade_size("0.001"),
          trade_mode("cross"), leverage(5), stop_loss_percentage(0.5), take_profit_percentage(1.0),
          trade_cooldown_ms(60000), http_timeout_seconds(10), http_retries(3) {}
};

#endif // EXECUTION_CONFIG_HPP
