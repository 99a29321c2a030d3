// StreamConfig.hpp
#ifndef STREAM_CONFIG_HPP
#define STREAM_CONFIG_HPP

#include <string>

struct StreamConfig {
    // ========================================================================
    // EXCHANGE ENDPOINT AND INSTRUMENT
    // ========================================================================

    std::string websocket_url;                       // Public WebSocket endpoint (wss://...)
    std::string symbol;                              // Instrument id, e.g. BTC-USDT-SWAP
    std::string timeframe;                           // Bar interval, e.g. 30m, 1h, 1d
    std::string bar_source;                          // "ticks" (aggregate locally) or "candles" (exchange bars)

    // ========================================================================
    // LIVENESS
    // ========================================================================

    int ping_interval_ms;                            // Interval between WebSocket pings
    int pong_timeout_ms;                             // Max wait for a pong before treating the link as dead
    int receive_poll_timeout_ms;                     // Socket readiness wait per receive poll
    long long clock_skew_threshold_ms;               // Exchange vs local timestamp tolerance

    // ========================================================================
    // RECONNECT BACKOFF
    // ========================================================================

    int max_reconnect_attempts;                      // Consecutive failures before giving up
    int initial_reconnect_delay_ms;                  // Delay before the first retry
    double reconnect_multiplier;                     // Growth factor between retries

    StreamConfig()
        : websocket_url("wss://ws.okx.com:8443/ws/v5/public"), symbol("BTC-USDT-SWAP"), timeframe("30m"),
          bar_source("ticks"), ping_interval_ms(20000), pong_timeout_ms(10000), receive_poll_timeout_ms(250),
          clock_skew_threshold_ms(5000), max_reconnect_attempts(10), initial_reconnect_delay_ms(1000),
          reconnect_multiplier(1.5) {}
};

#endif // STREAM_CONFIG_HPP
