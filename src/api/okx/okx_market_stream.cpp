#include "okx_market_stream.hpp"
#include "logging/logs/websocket_logs.hpp"
#include "utils/time_utils.hpp"
#include <cstdlib>
#include <stdexcept>

using OkxTrader::Logging::WebSocketLogs;

namespace OkxTrader {
namespace API {
namespace Okx {

OkxMarketStream::OkxMarketStream(const StreamConfig& stream_config, MarketEventHandler& event_handler, ConnectivityManager& connectivity_manager)
    : config(stream_config),
      handler(event_handler),
      connectivity(connectivity_manager),
      stop_requested(false),
      candle_channel(build_candle_channel_name(stream_config.timeframe)),
      last_ping_sent(std::chrono::steady_clock::now()),
      last_text_pong_received(std::chrono::steady_clock::now()),
      ping_outstanding(false) {
    websocket_client.setMessageCallback([this](const std::string& message_text) {
        handle_text_message(message_text);
    });
}

OkxMarketStream::StreamExitReason OkxMarketStream::run() {
    while (!stop_requested.load()) {
        if (!connectivity.begin_connect_attempt()) {
            return StreamExitReason::RECONNECT_EXHAUSTED;
        }

        WebSocketLogs::log_websocket_connection_attempt(config.websocket_url, connectivity.get_consecutive_failures() + 1);

        std::string failure_reason;
        if (connect_and_subscribe()) {
            failure_reason = pump_until_disconnect();
        } else {
            failure_reason = websocket_client.getLastError();
        }
        websocket_client.disconnect();

        if (stop_requested.load()) {
            break;
        }

        ConnectivityManager::FailureOutcome failure_outcome = connectivity.report_failure(failure_reason);
        if (failure_outcome.exhausted) {
            WebSocketLogs::log_websocket_reconnect_exhausted(config.max_reconnect_attempts, failure_reason);
            return StreamExitReason::RECONNECT_EXHAUSTED;
        }

        WebSocketLogs::log_websocket_reconnect_scheduled(connectivity.get_consecutive_failures(), config.max_reconnect_attempts,
                                                         failure_outcome.retry_delay_milliseconds, failure_reason);
        publish_warning(Core::StreamWarningType::RECONNECTING,
                        "Reconnecting in " + std::to_string(failure_outcome.retry_delay_milliseconds) + "ms: " + failure_reason, 0);

        if (!wait_for_backoff(failure_outcome.retry_delay_milliseconds)) {
            break;
        }
    }

    connectivity.report_disconnected();
    WebSocketLogs::log_websocket_stream_stopped();
    return StreamExitReason::STOPPED;
}

void OkxMarketStream::stop() {
    {
        std::lock_guard<std::mutex> backoff_lock(backoff_mutex);
        stop_requested.store(true);
    }
    backoff_cv.notify_all();
}

bool OkxMarketStream::is_stop_requested() const {
    return stop_requested.load();
}

bool OkxMarketStream::connect_and_subscribe() {
    if (!websocket_client.connect(config.websocket_url)) {
        return false;
    }
    connectivity.report_connected();

    const std::string subscription_channels[] = { TICKERS_CHANNEL, candle_channel };
    for (const std::string& channel : subscription_channels) {
        bool subscription_sent = websocket_client.sendMessage(build_subscribe_message(channel, config.symbol));
        WebSocketLogs::log_websocket_subscription_table(channel, config.symbol, subscription_sent,
                                                        subscription_sent ? "" : websocket_client.getLastError());
        if (!subscription_sent) {
            return false;
        }
    }

    last_ping_sent = std::chrono::steady_clock::now();
    ping_outstanding = false;
    return true;
}

std::string OkxMarketStream::pump_until_disconnect() {
    const std::chrono::milliseconds ping_interval(config.ping_interval_ms);
    const std::chrono::milliseconds pong_timeout(config.pong_timeout_ms);

    while (!stop_requested.load()) {
        std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now();

        if (ping_outstanding) {
            bool pong_received = websocket_client.getLastPongTime() >= last_ping_sent || last_text_pong_received >= last_ping_sent;
            if (pong_received) {
                ping_outstanding = false;
            } else if (now - last_ping_sent > pong_timeout) {
                long long waited_ms = std::chrono::duration_cast<std::chrono::milliseconds>(now - last_ping_sent).count();
                WebSocketLogs::log_websocket_pong_timeout(waited_ms);
                return "No pong within " + std::to_string(config.pong_timeout_ms) + "ms";
            }
        }

        if (!ping_outstanding && now - last_ping_sent >= ping_interval) {
            if (!websocket_client.sendPing("")) {
                return websocket_client.getLastError();
            }
            last_ping_sent = now;
            ping_outstanding = true;
        }

        WebSocketClient::PollResult poll_result = websocket_client.pollMessage(config.receive_poll_timeout_ms);
        if (poll_result == WebSocketClient::PollResult::CONNECTION_CLOSED ||
            poll_result == WebSocketClient::PollResult::RECEIVE_ERROR) {
            return websocket_client.getLastError();
        }
    }
    return "Stop requested";
}

void OkxMarketStream::handle_text_message(const std::string& message_text) {
    OkxParsedMessage parsed_message = parse_okx_message(message_text, TimeUtils::get_current_epoch_milliseconds());

    try {
        switch (parsed_message.kind) {
            case OkxMessageKind::TICKER:
                for (const Core::Tick& tick : parsed_message.ticks) {
                    check_clock_skew(tick);
                    handler.on_tick(tick);
                }
                break;

            case OkxMessageKind::CANDLE:
                for (const Core::Bar& candle : parsed_message.candles) {
                    handler.on_candle_update(candle);
                }
                break;

            case OkxMessageKind::SUBSCRIBE_ACK:
                WebSocketLogs::log_websocket_subscription_acknowledged(parsed_message.channel);
                connectivity.report_subscribed();
                break;

            case OkxMessageKind::ERROR_EVENT:
                WebSocketLogs::log_websocket_subscription_error(parsed_message.error_code, parsed_message.error_message);
                publish_warning(Core::StreamWarningType::SUBSCRIPTION_ERROR,
                                parsed_message.error_code + ": " + parsed_message.error_message, 0);
                break;

            case OkxMessageKind::PONG:
                last_text_pong_received = std::chrono::steady_clock::now();
                break;

            case OkxMessageKind::MALFORMED:
                WebSocketLogs::log_websocket_malformed_message(parsed_message.error_message, message_text);
                break;

            case OkxMessageKind::UNKNOWN:
                break;
        }
    } catch (const std::exception& handler_error) {
        WebSocketLogs::log_websocket_receive_error(std::string("Event handler error: ") + handler_error.what());
    }
}

void OkxMarketStream::check_clock_skew(const Core::Tick& tick) {
    long long skew_ms = tick.exchange_timestamp_ms - tick.local_timestamp_ms;
    if (std::llabs(skew_ms) <= config.clock_skew_threshold_ms) {
        return;
    }
    WebSocketLogs::log_websocket_clock_skew(tick.exchange_timestamp_ms, tick.local_timestamp_ms, config.clock_skew_threshold_ms);
    publish_warning(Core::StreamWarningType::CLOCK_SKEW,
                    "Exchange clock differs from local clock by " + std::to_string(skew_ms) + "ms", skew_ms);
}

void OkxMarketStream::publish_warning(Core::StreamWarningType warning_type, const std::string& message, long long skew_ms) {
    Core::StreamWarning warning;
    warning.type = warning_type;
    warning.message = message;
    warning.skew_ms = skew_ms;
    warning.timestamp_ms = TimeUtils::get_current_epoch_milliseconds();
    handler.on_stream_warning(warning);
}

bool OkxMarketStream::wait_for_backoff(long long delay_ms) {
    std::unique_lock<std::mutex> backoff_lock(backoff_mutex);
    backoff_cv.wait_for(backoff_lock, std::chrono::milliseconds(delay_ms), [this]() {
        return stop_requested.load();
    });
    return !stop_requested.load();
}

std::string stream_exit_reason_to_string(OkxMarketStream::StreamExitReason reason) {
    switch (reason) {
        case OkxMarketStream::StreamExitReason::STOPPED: return "STOPPED";
        case OkxMarketStream::StreamExitReason::RECONNECT_EXHAUSTED: return "RECONNECT_EXHAUSTED";
    }
    return "UNKNOWN";
}

} // namespace Okx
} // namespace API
} // namespace OkxTrader
