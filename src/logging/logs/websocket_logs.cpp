#include "websocket_logs.hpp"
#include "logging/logger/async_logger.hpp"
#include "logging/logger/logging_macros.hpp"
#include <string>

using OkxTrader::Logging::log_message;

void OkxTrader::Logging::WebSocketLogs::log_websocket_connection_attempt(const std::string& websocketUrlString, int attemptNumberValue) {
    log_message(std::string("Attempting connection to ") + websocketUrlString + " (attempt " + std::to_string(attemptNumberValue) + ")", "");
}

void OkxTrader::Logging::WebSocketLogs::log_websocket_connection_table(const std::string& websocketUrlString, bool successFlag, const std::string& errorMessageString) {
    TABLE_HEADER_48("WebSocket Connect", "Connection Status Details");
    TABLE_ROW_48("URL", websocketUrlString);
    TABLE_ROW_48("Status", successFlag ? "Connected successfully" : "Connection failed");
    if (!errorMessageString.empty()) {
        TABLE_ROW_48("Error", errorMessageString);
    }
    TABLE_FOOTER_48();
}

void OkxTrader::Logging::WebSocketLogs::log_websocket_disconnection() {
    log_message("Connection closed", "");
}

void OkxTrader::Logging::WebSocketLogs::log_websocket_ssl_error(const std::string& errorMessageString) {
    log_message(std::string("SSL error - ") + errorMessageString, "");
}

void OkxTrader::Logging::WebSocketLogs::log_websocket_handshake_error(const std::string& errorMessageString) {
    log_message(std::string("Handshake error - ") + errorMessageString, "");
}

void OkxTrader::Logging::WebSocketLogs::log_websocket_message_send_failure(const std::string& errorMessageString) {
    log_message(std::string("Failed to send message - ") + errorMessageString, "");
}

void OkxTrader::Logging::WebSocketLogs::log_websocket_receive_error(const std::string& errorMessageString) {
    log_message(std::string("Receive error - ") + errorMessageString, "");
}

void OkxTrader::Logging::WebSocketLogs::log_websocket_close_frame(int closeCodeValue, const std::string& closeReasonString) {
    std::string closeMessage = "Server closed connection - code " + std::to_string(closeCodeValue);
    if (!closeReasonString.empty()) {
        closeMessage += ", reason: " + closeReasonString;
    }
    log_message(closeMessage, "");
}

void OkxTrader::Logging::WebSocketLogs::log_websocket_frame_parse_error(const std::string& errorMessageString) {
    log_message(std::string("Frame parse error - ") + errorMessageString, "");
}

void OkxTrader::Logging::WebSocketLogs::log_websocket_subscription_table(const std::string& channelString, const std::string& instrumentString, bool successFlag, const std::string& errorMessageString) {
    TABLE_HEADER_48("WS Subscribe", "Subscription Request");
    TABLE_ROW_48("Channel", channelString);
    TABLE_ROW_48("Instrument", instrumentString);
    TABLE_ROW_48("Status", successFlag ? "Request sent" : "Request failed");
    if (!errorMessageString.empty()) {
        TABLE_ROW_48("Error", errorMessageString);
    }
    TABLE_FOOTER_48();
}

void OkxTrader::Logging::WebSocketLogs::log_websocket_subscription_acknowledged(const std::string& channelString) {
    log_message(std::string("Subscription acknowledged: ") + channelString, "");
}

void OkxTrader::Logging::WebSocketLogs::log_websocket_subscription_error(const std::string& errorCodeString, const std::string& errorMessageString) {
    log_message(std::string("ERROR: Exchange rejected request - code ") + errorCodeString + ": " + errorMessageString, "");
}

void OkxTrader::Logging::WebSocketLogs::log_websocket_malformed_message(const std::string& errorMessageString, const std::string& rawMessageString) {
    log_message(std::string("WARNING: Discarding malformed message - ") + errorMessageString + " | " + rawMessageString.substr(0, 200), "");
}

void OkxTrader::Logging::WebSocketLogs::log_websocket_pong_timeout(long long elapsedMillisecondsValue) {
    log_message("WARNING: No pong received for " + std::to_string(elapsedMillisecondsValue) + "ms - treating connection as dead", "");
}

void OkxTrader::Logging::WebSocketLogs::log_websocket_clock_skew(long long exchangeTimestampValue, long long localTimestampValue, long long thresholdValue) {
    long long skewValue = localTimestampValue - exchangeTimestampValue;
    log_message("WARNING: Clock skew " + std::to_string(skewValue) + "ms exceeds " + std::to_string(thresholdValue) +
                "ms (exchange " + std::to_string(exchangeTimestampValue) + ", local " + std::to_string(localTimestampValue) + ")", "");
}

void OkxTrader::Logging::WebSocketLogs::log_websocket_reconnect_scheduled(int attemptNumberValue, int maxAttemptsValue, long long delayMillisecondsValue, const std::string& reasonString) {
    TABLE_HEADER_48("WS Reconnect", "Backoff Scheduled");
    TABLE_ROW_48("Attempt", std::to_string(attemptNumberValue) + " / " + std::to_string(maxAttemptsValue));
    TABLE_ROW_48("Delay", std::to_string(delayMillisecondsValue) + " ms");
    TABLE_ROW_48("Reason", reasonString);
    TABLE_FOOTER_48();
}

void OkxTrader::Logging::WebSocketLogs::log_websocket_reconnect_exhausted(int maxAttemptsValue, const std::string& lastErrorString) {
    log_message("FATAL: Reconnect attempts exhausted after " + std::to_string(maxAttemptsValue) + " retries - last error: " + lastErrorString, "");
}

void OkxTrader::Logging::WebSocketLogs::log_websocket_stream_stopped() {
    log_message("Market stream stopped", "");
}
