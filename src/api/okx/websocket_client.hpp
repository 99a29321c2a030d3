#ifndef WEBSOCKET_CLIENT_HPP
#define WEBSOCKET_CLIENT_HPP

#include <string>
#include <functional>
#include <atomic>
#include <cstddef>
#include <chrono>
#include <vector>

namespace OkxTrader {
namespace API {
namespace Okx {

/**
 * Minimal RFC 6455 client over OpenSSL.
 * Owned and driven by a single thread: connect, send and pollMessage must all
 * be called from the thread that runs the market stream.
 */
class WebSocketClient {
public:
    using MessageCallback = std::function<void(const std::string& message)>;

    enum class PollResult {
        MESSAGE_PROCESSED,      // a frame was read and handled
        NO_MESSAGE,             // nothing arrived before the timeout
        CONNECTION_CLOSED,      // close frame or EOF
        RECEIVE_ERROR           // transport or framing error, see getLastError()
    };

    // Upper bound for a single frame and for a reassembled fragmented message.
    static constexpr size_t MAX_MESSAGE_PAYLOAD_BYTES = 16 * 1024 * 1024;

    WebSocketClient();
    ~WebSocketClient();

    WebSocketClient(const WebSocketClient&) = delete;
    WebSocketClient& operator=(const WebSocketClient&) = delete;

    bool connect(const std::string& websocketUrlString);
    void disconnect();
    bool isConnected() const;

    void setMessageCallback(MessageCallback callbackFunction);

    bool sendMessage(const std::string& messageContent);
    bool sendPing(const std::string& payloadContent);
    bool sendPong(const std::string& payloadContent);
    bool sendClose(unsigned short closeCodeValue);

    PollResult pollMessage(int timeoutMilliseconds);

    std::string getLastError() const;
    std::chrono::steady_clock::time_point getLastPongTime() const;

    // Dispatches one unmasked frame: data, continuation or control.
    // Called by pollMessage; public for testing.
    PollResult handleFrame(unsigned char opcodeValue, bool finalFragmentFlag, const std::string& payloadString);

    // URL helpers, public for testing.
    static bool validateUrl(const std::string& urlStringToValidate);
    static std::string extractHostname(const std::string& urlString);
    static std::string extractPort(const std::string& urlString);
    static std::string extractPath(const std::string& urlString);

private:
    std::string websocketUrlStringValue;
    MessageCallback messageCallbackFunction;

    std::atomic<bool> connectedFlag;
    std::string lastErrorStringValue;
    std::chrono::steady_clock::time_point lastPongTimeValue;

    int socketFileDescriptor;
    void* sslContextPointer;
    void* sslConnectionPointer;

    // Accumulates continuation frames until FIN
    std::string fragmentedMessageBuffer;
    bool fragmentedMessageActive;

    bool establishTcpConnection();
    bool performSslHandshake();
    bool performWebSocketHandshake();
    void cleanupConnection();

    // 1 ready, 0 timeout, -1 select error
    int waitForSocket(bool waitForWrite, int timeoutMilliseconds);
    bool readExact(unsigned char* bufferPointer, size_t byteCount);
    bool writeAll(const unsigned char* bufferPointer, size_t byteCount);
    bool sendFrame(unsigned char opcodeValue, const std::string& payloadContent);
    std::string describeSslError(const std::string& operationName, int sslReturnValue);
};

} // namespace Okx
} // namespace API
} // namespace OkxTrader

#endif // WEBSOCKET_CLIENT_HPP
