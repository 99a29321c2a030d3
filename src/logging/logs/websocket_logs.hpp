#ifndef WEBSOCKET_LOGS_HPP
#define WEBSOCKET_LOGS_HPP

#include <string>

namespace OkxTrader {
namespace Logging {

class WebSocketLogs {
public:
    static void log_websocket_connection_attempt(const std::string& websocketUrlString, int attemptNumberValue);
    static void log_websocket_connection_table(const std::string& websocketUrlString, bool successFlag, const std::string& errorMessageString);
    static void log_websocket_disconnection();
    static void log_websocket_ssl_error(const std::string& errorMessageString);
    static void log_websocket_handshake_error(const std::string& errorMessageString);
    static void log_websocket_message_send_failure(const std::string& errorMessageString);
    static void log_websocket_receive_error(const std::string& errorMessageString);
    static void log_websocket_close_frame(int closeCodeValue, const std::string& closeReasonString);
    static void log_websocket_frame_parse_error(const std::string& errorMessageString);
    static void log_websocket_subscription_table(const std::string& channelString, const std::string& instrumentString, bool successFlag, const std::string& errorMessageString);
    static void log_websocket_subscription_acknowledged(const std::string& channelString);
    static void log_websocket_subscription_error(const std::string& errorCodeString, const std::string& errorMessageString);
    static void log_websocket_malformed_message(const std::string& errorMessageString, const std::string& rawMessageString);
    static void log_websocket_pong_timeout(long long elapsedMillisecondsValue);
    static void log_websocket_clock_skew(long long exchangeTimestampValue, long long localTimestampValue, long long thresholdValue);
    static void log_websocket_reconnect_scheduled(int attemptNumberValue, int maxAttemptsValue, long long delayMillisecondsValue, const std::string& reasonString);
    static void log_websocket_reconnect_exhausted(int maxAttemptsValue, const std::string& lastErrorString);
    static void log_websocket_stream_stopped();
};

} // namespace Logging
} // namespace OkxTrader

#endif // WEBSOCKET_LOGS_HPP
