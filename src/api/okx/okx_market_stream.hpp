#ifndef OKX_MARKET_STREAM_HPP
#define OKX_MARKET_STREAM_HPP

#include "websocket_client.hpp"
#include "okx_message_parser.hpp"
#include "api/general/market_event_handler.hpp"
#include "configs/stream_config.hpp"
#include "utils/connectivity_manager.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>

namespace OkxTrader {
namespace API {
namespace Okx {

/**
 * Connector for the OKX public stream.
 * run() owns the connection for its whole lifetime: connect, subscribe to the
 * ticker and candle channels, pump frames into the handler, keep the link alive
 * with pings and reconnect with backoff until stopped or out of attempts.
 */
class OkxMarketStream {
public:
    enum class StreamExitReason {
        STOPPED,
        RECONNECT_EXHAUSTED
    };

    OkxMarketStream(const StreamConfig& stream_config, MarketEventHandler& event_handler, ConnectivityManager& connectivity_manager);

    OkxMarketStream(const OkxMarketStream&) = delete;
    OkxMarketStream& operator=(const OkxMarketStream&) = delete;

    // Blocks the calling thread until stop() or reconnect exhaustion.
    StreamExitReason run();

    // Thread-safe; wakes a pending backoff wait.
    void stop();
    bool is_stop_requested() const;

    // Visible for testing: handles one inbound text frame.
    void handle_text_message(const std::string& message_text);

private:
    const StreamConfig& config;
    MarketEventHandler& handler;
    ConnectivityManager& connectivity;
    WebSocketClient websocket_client;

    std::atomic<bool> stop_requested;
    std::mutex backoff_mutex;
    std::condition_variable backoff_cv;

    std::string candle_channel;
    std::chrono::steady_clock::time_point last_ping_sent;
    std::chrono::steady_clock::time_point last_text_pong_received;
    bool ping_outstanding;

    bool connect_and_subscribe();
    // Returns the reason the connection ended.
    std::string pump_until_disconnect();
    bool wait_for_backoff(long long delay_ms);
    void check_clock_skew(const Core::Tick& tick);
    void publish_warning(Core::StreamWarningType warning_type, const std::string& message, long long skew_ms);
};

std::string stream_exit_reason_to_string(OkxMarketStream::StreamExitReason reason);

} // namespace Okx
} // namespace API
} // namespace OkxTrader

#endif // OKX_MARKET_STREAM_HPP
