#include "websocket_client.hpp"
#include "logging/logs/websocket_logs.hpp"
#include "utils/crypto_utils.hpp"
#include <sys/socket.h>
#include <netinet/in.h>
#include <netdb.h>
#include <unistd.h>
#include <fcntl.h>
#include <sys/select.h>
#include <openssl/ssl.h>
#include <openssl/err.h>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <stdexcept>

using OkxTrader::Logging::WebSocketLogs;

namespace OkxTrader {
namespace API {
namespace Okx {

namespace {

constexpr unsigned char OPCODE_CONTINUATION = 0x0;
constexpr unsigned char OPCODE_TEXT = 0x1;
constexpr unsigned char OPCODE_BINARY = 0x2;
constexpr unsigned char OPCODE_CLOSE = 0x8;
constexpr unsigned char OPCODE_PING = 0x9;
constexpr unsigned char OPCODE_PONG = 0xA;

constexpr unsigned short NORMAL_CLOSURE_CODE = 1000;
constexpr int FRAME_BODY_TIMEOUT_MS = 5000;
constexpr int HANDSHAKE_TIMEOUT_MS = 10000;
constexpr size_t MAX_HANDSHAKE_RESPONSE_BYTES = 8192;
constexpr const char* WEBSOCKET_ACCEPT_GUID = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

} // anonymous namespace

WebSocketClient::WebSocketClient()
    : connectedFlag(false)
    , lastPongTimeValue(std::chrono::steady_clock::now())
    , socketFileDescriptor(-1)
    , sslContextPointer(nullptr)
    , sslConnectionPointer(nullptr)
    , fragmentedMessageActive(false)
{
}

WebSocketClient::~WebSocketClient() {
    try {
        disconnect();
    } catch (const std::exception& destructorExceptionError) {
        lastErrorStringValue = std::string("Destructor error: ") + destructorExceptionError.what();
    }
}

bool WebSocketClient::connect(const std::string& websocketUrlString) {
    // Always cleanup any existing connection before creating new one
    if (connectedFlag.load() || socketFileDescriptor >= 0 || sslConnectionPointer || sslContextPointer) {
        cleanupConnection();
    }

    lastErrorStringValue.clear();
    fragmentedMessageBuffer.clear();
    fragmentedMessageActive = false;

    if (!validateUrl(websocketUrlString)) {
        lastErrorStringValue = "Invalid WebSocket URL format";
        WebSocketLogs::log_websocket_connection_table(websocketUrlString, false, lastErrorStringValue);
        return false;
    }

    websocketUrlStringValue = websocketUrlString;

    try {
        if (!establishTcpConnection() || !performSslHandshake() || !performWebSocketHandshake()) {
            cleanupConnection();
            WebSocketLogs::log_websocket_connection_table(websocketUrlString, false, lastErrorStringValue);
            return false;
        }
    } catch (const std::exception& connectionExceptionError) {
        lastErrorStringValue = std::string("Connection exception: ") + connectionExceptionError.what();
        cleanupConnection();
        WebSocketLogs::log_websocket_connection_table(websocketUrlString, false, lastErrorStringValue);
        return false;
    }

    connectedFlag.store(true);
    lastPongTimeValue = std::chrono::steady_clock::now();
    WebSocketLogs::log_websocket_connection_table(websocketUrlString, true, "");
    return true;
}

void WebSocketClient::disconnect() {
    bool hadTransport = socketFileDescriptor >= 0 || sslConnectionPointer || sslContextPointer;
    if (!hadTransport) {
        connectedFlag.store(false);
        return;
    }

    if (connectedFlag.load() && !sendClose(NORMAL_CLOSURE_CODE)) {
        lastErrorStringValue = "Close frame not delivered: " + lastErrorStringValue;
    }

    cleanupConnection();
    WebSocketLogs::log_websocket_disconnection();
}

bool WebSocketClient::isConnected() const {
    return connectedFlag.load();
}

void WebSocketClient::setMessageCallback(MessageCallback callbackFunction) {
    messageCallbackFunction = std::move(callbackFunction);
}

bool WebSocketClient::sendMessage(const std::string& messageContent) {
    return sendFrame(OPCODE_TEXT, messageContent);
}

bool WebSocketClient::sendPing(const std::string& payloadContent) {
    return sendFrame(OPCODE_PING, payloadContent);
}

bool WebSocketClient::sendPong(const std::string& payloadContent) {
    return sendFrame(OPCODE_PONG, payloadContent);
}

bool WebSocketClient::sendClose(unsigned short closeCodeValue) {
    std::string closePayload;
    closePayload.push_back(static_cast<char>((closeCodeValue >> 8) & 0xFF));
    closePayload.push_back(static_cast<char>(closeCodeValue & 0xFF));
    return sendFrame(OPCODE_CLOSE, closePayload);
}

std::string WebSocketClient::getLastError() const {
    return lastErrorStringValue;
}

std::chrono::steady_clock::time_point WebSocketClient::getLastPongTime() const {
    return lastPongTimeValue;
}

bool WebSocketClient::sendFrame(unsigned char opcodeValue, const std::string& payloadContent) {
    if (!connectedFlag.load() || !sslConnectionPointer) {
        lastErrorStringValue = "Not connected to WebSocket";
        WebSocketLogs::log_websocket_message_send_failure(lastErrorStringValue);
        return false;
    }

    std::vector<unsigned char> maskingKeyBytes;
    try {
        maskingKeyBytes = CryptoUtils::generate_random_bytes(4);
    } catch (const std::exception& randomBytesError) {
        lastErrorStringValue = std::string("Masking key generation failed: ") + randomBytesError.what();
        WebSocketLogs::log_websocket_message_send_failure(lastErrorStringValue);
        return false;
    }

    std::vector<unsigned char> frameBuffer;
    size_t messageLength = payloadContent.length();

    frameBuffer.push_back(static_cast<unsigned char>(0x80 | opcodeValue));

    if (messageLength < 126) {
        frameBuffer.push_back(static_cast<unsigned char>(messageLength | 0x80));
    } else if (messageLength < 65536) {
        frameBuffer.push_back(126 | 0x80);
        frameBuffer.push_back(static_cast<unsigned char>((messageLength >> 8) & 0xFF));
        frameBuffer.push_back(static_cast<unsigned char>(messageLength & 0xFF));
    } else {
        frameBuffer.push_back(127 | 0x80);
        for (int i = 7; i >= 0; --i) {
            frameBuffer.push_back(static_cast<unsigned char>((static_cast<unsigned long long>(messageLength) >> (i * 8)) & 0xFF));
        }
    }

    frameBuffer.insert(frameBuffer.end(), maskingKeyBytes.begin(), maskingKeyBytes.end());

    for (size_t i = 0; i < payloadContent.size(); ++i) {
        frameBuffer.push_back(static_cast<unsigned char>(payloadContent[i]) ^ maskingKeyBytes[i % 4]);
    }

    if (!writeAll(frameBuffer.data(), frameBuffer.size())) {
        WebSocketLogs::log_websocket_message_send_failure(lastErrorStringValue);
        return false;
    }
    return true;
}

WebSocketClient::PollResult WebSocketClient::pollMessage(int timeoutMilliseconds) {
    if (!connectedFlag.load() || !sslConnectionPointer) {
        lastErrorStringValue = "Not connected to WebSocket";
        return PollResult::CONNECTION_CLOSED;
    }

    SSL* sslConnectionPointerTyped = static_cast<SSL*>(sslConnectionPointer);

    if (SSL_pending(sslConnectionPointerTyped) <= 0) {
        int readinessValue = waitForSocket(false, timeoutMilliseconds);
        if (readinessValue == 0) {
            return PollResult::NO_MESSAGE;
        }
        if (readinessValue < 0) {
            WebSocketLogs::log_websocket_receive_error(lastErrorStringValue);
            return PollResult::RECEIVE_ERROR;
        }
    }

    // The first byte is read without waiting: a readable socket may carry
    // only TLS records that hold no application data.
    unsigned char frameHeaderBytes[2];
    ERR_clear_error();
    int firstReadResult = SSL_read(sslConnectionPointerTyped, frameHeaderBytes, 1);
    if (firstReadResult <= 0) {
        int sslErrorCode = SSL_get_error(sslConnectionPointerTyped, firstReadResult);
        if (sslErrorCode == SSL_ERROR_WANT_READ || sslErrorCode == SSL_ERROR_WANT_WRITE) {
            return PollResult::NO_MESSAGE;
        }
        if (sslErrorCode == SSL_ERROR_ZERO_RETURN || (sslErrorCode == SSL_ERROR_SYSCALL && ERR_peek_error() == 0)) {
            lastErrorStringValue = "Connection closed by server";
            connectedFlag.store(false);
            return PollResult::CONNECTION_CLOSED;
        }
        lastErrorStringValue = describeSslError("SSL read", firstReadResult);
        WebSocketLogs::log_websocket_receive_error(lastErrorStringValue);
        return PollResult::RECEIVE_ERROR;
    }

    if (!readExact(frameHeaderBytes + 1, 1)) {
        return connectedFlag.load() ? PollResult::RECEIVE_ERROR : PollResult::CONNECTION_CLOSED;
    }

    bool finalFragmentFlag = (frameHeaderBytes[0] & 0x80) != 0;
    unsigned char opcodeValue = frameHeaderBytes[0] & 0x0F;
    bool maskedFlag = (frameHeaderBytes[1] & 0x80) != 0;
    unsigned long long payloadLengthValue = frameHeaderBytes[1] & 0x7F;

    if (payloadLengthValue == 126) {
        unsigned char extendedLengthBytes[2];
        if (!readExact(extendedLengthBytes, 2)) {
            return connectedFlag.load() ? PollResult::RECEIVE_ERROR : PollResult::CONNECTION_CLOSED;
        }
        payloadLengthValue = (static_cast<unsigned long long>(extendedLengthBytes[0]) << 8) | extendedLengthBytes[1];
    } else if (payloadLengthValue == 127) {
        unsigned char extendedLengthBytes[8];
        if (!readExact(extendedLengthBytes, 8)) {
            return connectedFlag.load() ? PollResult::RECEIVE_ERROR : PollResult::CONNECTION_CLOSED;
        }
        payloadLengthValue = 0;
        for (int i = 0; i < 8; ++i) {
            payloadLengthValue = (payloadLengthValue << 8) | extendedLengthBytes[i];
        }
    }

    if (payloadLengthValue > MAX_MESSAGE_PAYLOAD_BYTES) {
        lastErrorStringValue = "Frame payload too large: " + std::to_string(payloadLengthValue) + " bytes";
        WebSocketLogs::log_websocket_frame_parse_error(lastErrorStringValue);
        return PollResult::RECEIVE_ERROR;
    }

    unsigned char maskingKeyBytes[4] = {0, 0, 0, 0};
    if (maskedFlag && !readExact(maskingKeyBytes, 4)) {
        return connectedFlag.load() ? PollResult::RECEIVE_ERROR : PollResult::CONNECTION_CLOSED;
    }

    std::string payloadString(static_cast<size_t>(payloadLengthValue), '\0');
    if (payloadLengthValue > 0 &&
        !readExact(reinterpret_cast<unsigned char*>(&payloadString[0]), static_cast<size_t>(payloadLengthValue))) {
        return connectedFlag.load() ? PollResult::RECEIVE_ERROR : PollResult::CONNECTION_CLOSED;
    }

    if (maskedFlag) {
        for (size_t i = 0; i < payloadString.size(); ++i) {
            payloadString[i] = static_cast<char>(static_cast<unsigned char>(payloadString[i]) ^ maskingKeyBytes[i % 4]);
        }
    }

    return handleFrame(opcodeValue, finalFragmentFlag, payloadString);
}

WebSocketClient::PollResult WebSocketClient::handleFrame(unsigned char opcodeValue, bool finalFragmentFlag, const std::string& payloadString) {
    switch (opcodeValue) {
        case OPCODE_TEXT:
        case OPCODE_BINARY:
            if (fragmentedMessageActive) {
                lastErrorStringValue = "New data frame while a fragmented message is in progress";
                WebSocketLogs::log_websocket_frame_parse_error(lastErrorStringValue);
                return PollResult::RECEIVE_ERROR;
            }
            if (!finalFragmentFlag) {
                fragmentedMessageBuffer = payloadString;
                fragmentedMessageActive = true;
                return PollResult::MESSAGE_PROCESSED;
            }
            if (messageCallbackFunction) {
                messageCallbackFunction(payloadString);
            }
            return PollResult::MESSAGE_PROCESSED;

        case OPCODE_CONTINUATION:
            if (!fragmentedMessageActive) {
                lastErrorStringValue = "Continuation frame without an initial frame";
                WebSocketLogs::log_websocket_frame_parse_error(lastErrorStringValue);
                return PollResult::RECEIVE_ERROR;
            }
            if (fragmentedMessageBuffer.size() + payloadString.size() > MAX_MESSAGE_PAYLOAD_BYTES) {
                lastErrorStringValue = "Fragmented message too large: " +
                    std::to_string(fragmentedMessageBuffer.size() + payloadString.size()) + " bytes";
                fragmentedMessageBuffer.clear();
                fragmentedMessageActive = false;
                WebSocketLogs::log_websocket_frame_parse_error(lastErrorStringValue);
                return PollResult::RECEIVE_ERROR;
            }
            fragmentedMessageBuffer += payloadString;
            if (finalFragmentFlag) {
                std::string completeMessage;
                completeMessage.swap(fragmentedMessageBuffer);
                fragmentedMessageActive = false;
                if (messageCallbackFunction) {
                    messageCallbackFunction(completeMessage);
                }
            }
            return PollResult::MESSAGE_PROCESSED;

        case OPCODE_CLOSE: {
            int closeCodeValue = 0;
            std::string closeReasonString;
            if (payloadString.size() >= 2) {
                closeCodeValue = (static_cast<unsigned char>(payloadString[0]) << 8) | static_cast<unsigned char>(payloadString[1]);
                closeReasonString = payloadString.substr(2);
            }
            WebSocketLogs::log_websocket_close_frame(closeCodeValue, closeReasonString);
            if (!sendClose(NORMAL_CLOSURE_CODE)) {
                lastErrorStringValue = "Close acknowledgement not delivered: " + lastErrorStringValue;
            }
            lastErrorStringValue = "Server closed connection (code " + std::to_string(closeCodeValue) + ")";
            connectedFlag.store(false);
            return PollResult::CONNECTION_CLOSED;
        }

        case OPCODE_PING:
            if (!sendPong(payloadString)) {
                return PollResult::RECEIVE_ERROR;
            }
            return PollResult::MESSAGE_PROCESSED;

        case OPCODE_PONG:
            lastPongTimeValue = std::chrono::steady_clock::now();
            return PollResult::MESSAGE_PROCESSED;

        default:
            lastErrorStringValue = "Unsupported opcode " + std::to_string(static_cast<int>(opcodeValue));
            WebSocketLogs::log_websocket_frame_parse_error(lastErrorStringValue);
            return PollResult::RECEIVE_ERROR;
    }
}

int WebSocketClient::waitForSocket(bool waitForWrite, int timeoutMilliseconds) {
    fd_set readFileDescriptorSet;
    fd_set writeFileDescriptorSet;
    struct timeval timeoutStruct;

    FD_ZERO(&readFileDescriptorSet);
    FD_ZERO(&writeFileDescriptorSet);

    if (waitForWrite) {
        FD_SET(socketFileDescriptor, &writeFileDescriptorSet);
    } else {
        FD_SET(socketFileDescriptor, &readFileDescriptorSet);
    }

    timeoutStruct.tv_sec = timeoutMilliseconds / 1000;
    timeoutStruct.tv_usec = (timeoutMilliseconds % 1000) * 1000;

    int selectResult = select(socketFileDescriptor + 1, &readFileDescriptorSet, &writeFileDescriptorSet, nullptr, &timeoutStruct);
    if (selectResult < 0) {
        if (errno == EINTR) {
            return 0;
        }
        lastErrorStringValue = std::string("select() failed: ") + strerror(errno);
        return -1;
    }
    return selectResult > 0 ? 1 : 0;
}

bool WebSocketClient::readExact(unsigned char* bufferPointer, size_t byteCount) {
    SSL* sslConnectionPointerTyped = static_cast<SSL*>(sslConnectionPointer);
    size_t totalBytesRead = 0;

    while (totalBytesRead < byteCount) {
        ERR_clear_error();
        int bytesRead = SSL_read(sslConnectionPointerTyped, bufferPointer + totalBytesRead, static_cast<int>(byteCount - totalBytesRead));
        if (bytesRead > 0) {
            totalBytesRead += static_cast<size_t>(bytesRead);
            continue;
        }

        int sslErrorCode = SSL_get_error(sslConnectionPointerTyped, bytesRead);
        if (sslErrorCode == SSL_ERROR_WANT_READ || sslErrorCode == SSL_ERROR_WANT_WRITE) {
            int readinessValue = waitForSocket(sslErrorCode == SSL_ERROR_WANT_WRITE, FRAME_BODY_TIMEOUT_MS);
            if (readinessValue <= 0) {
                if (readinessValue == 0) {
                    lastErrorStringValue = "Timed out reading from socket";
                }
                WebSocketLogs::log_websocket_receive_error(lastErrorStringValue);
                return false;
            }
            continue;
        }

        if (sslErrorCode == SSL_ERROR_ZERO_RETURN || (sslErrorCode == SSL_ERROR_SYSCALL && ERR_peek_error() == 0)) {
            lastErrorStringValue = "Connection closed by server";
            connectedFlag.store(false);
            return false;
        }

        lastErrorStringValue = describeSslError("SSL read", bytesRead);
        WebSocketLogs::log_websocket_receive_error(lastErrorStringValue);
        return false;
    }
    return true;
}

bool WebSocketClient::writeAll(const unsigned char* bufferPointer, size_t byteCount) {
    SSL* sslConnectionPointerTyped = static_cast<SSL*>(sslConnectionPointer);
    size_t totalBytesSent = 0;

    while (totalBytesSent < byteCount) {
        ERR_clear_error();
        int bytesSent = SSL_write(sslConnectionPointerTyped, bufferPointer + totalBytesSent, static_cast<int>(byteCount - totalBytesSent));
        if (bytesSent > 0) {
            totalBytesSent += static_cast<size_t>(bytesSent);
            continue;
        }

        int sslErrorCode = SSL_get_error(sslConnectionPointerTyped, bytesSent);
        if (sslErrorCode == SSL_ERROR_WANT_READ || sslErrorCode == SSL_ERROR_WANT_WRITE) {
            int readinessValue = waitForSocket(sslErrorCode == SSL_ERROR_WANT_WRITE, FRAME_BODY_TIMEOUT_MS);
            if (readinessValue <= 0) {
                if (readinessValue == 0) {
                    lastErrorStringValue = "SSL write timeout";
                }
                return false;
            }
            continue;
        }

        lastErrorStringValue = describeSslError("SSL write", bytesSent);
        return false;
    }
    return true;
}

std::string WebSocketClient::describeSslError(const std::string& operationName, int sslReturnValue) {
    int sslErrorCode = SSL_get_error(static_cast<SSL*>(sslConnectionPointer), sslReturnValue);
    unsigned long opensslErrorCode = ERR_get_error();
    if (opensslErrorCode != 0) {
        char errorBuffer[512];
        ERR_error_string_n(opensslErrorCode, errorBuffer, sizeof(errorBuffer));
        return operationName + " failed: " + errorBuffer + " (SSL_get_error: " + std::to_string(sslErrorCode) + ")";
    }
    if (sslErrorCode == SSL_ERROR_SYSCALL && errno != 0) {
        return operationName + " failed: " + strerror(errno);
    }
    return operationName + " failed: SSL_get_error=" + std::to_string(sslErrorCode);
}

bool WebSocketClient::establishTcpConnection() {
    std::string hostnameString = extractHostname(websocketUrlStringValue);
    std::string portString = extractPort(websocketUrlStringValue);

    if (hostnameString.empty() || portString.empty()) {
        lastErrorStringValue = "Failed to extract hostname or port from URL";
        return false;
    }

    struct addrinfo hintsStruct;
    struct addrinfo* resultsPointer = nullptr;

    std::memset(&hintsStruct, 0, sizeof(hintsStruct));
    hintsStruct.ai_family = AF_UNSPEC;
    hintsStruct.ai_socktype = SOCK_STREAM;

    int getAddrInfoResult = getaddrinfo(hostnameString.c_str(), portString.c_str(), &hintsStruct, &resultsPointer);
    if (getAddrInfoResult != 0) {
        lastErrorStringValue = std::string("getaddrinfo failed: ") + gai_strerror(getAddrInfoResult);
        return false;
    }

    socketFileDescriptor = -1;
    for (struct addrinfo* currentAddressPointer = resultsPointer; currentAddressPointer != nullptr; currentAddressPointer = currentAddressPointer->ai_next) {
        socketFileDescriptor = socket(currentAddressPointer->ai_family, currentAddressPointer->ai_socktype, currentAddressPointer->ai_protocol);
        if (socketFileDescriptor < 0) {
            continue;
        }

        if (::connect(socketFileDescriptor, currentAddressPointer->ai_addr, static_cast<socklen_t>(currentAddressPointer->ai_addrlen)) == 0) {
            break;
        }

        ::close(socketFileDescriptor);
        socketFileDescriptor = -1;
    }

    freeaddrinfo(resultsPointer);

    if (socketFileDescriptor < 0) {
        lastErrorStringValue = "Failed to establish TCP connection to " + hostnameString + ":" + portString;
        return false;
    }

    int flagsValue = fcntl(socketFileDescriptor, F_GETFL, 0);
    if (flagsValue < 0 || fcntl(socketFileDescriptor, F_SETFL, flagsValue | O_NONBLOCK) < 0) {
        lastErrorStringValue = std::string("Failed to set non-blocking mode: ") + strerror(errno);
        return false;
    }

    return true;
}

bool WebSocketClient::performSslHandshake() {
    sslContextPointer = SSL_CTX_new(TLS_client_method());
    if (!sslContextPointer) {
        char errorBuffer[512];
        ERR_error_string_n(ERR_get_error(), errorBuffer, sizeof(errorBuffer));
        lastErrorStringValue = std::string("Failed to create SSL context: ") + errorBuffer;
        WebSocketLogs::log_websocket_ssl_error(lastErrorStringValue);
        return false;
    }

    SSL_CTX* sslContextPointerTyped = static_cast<SSL_CTX*>(sslContextPointer);
    SSL_CTX_set_min_proto_version(sslContextPointerTyped, TLS1_2_VERSION);
    SSL_CTX_set_verify(sslContextPointerTyped, SSL_VERIFY_PEER, nullptr);
    if (SSL_CTX_set_default_verify_paths(sslContextPointerTyped) != 1) {
        lastErrorStringValue = "Failed to load default CA certificates";
        WebSocketLogs::log_websocket_ssl_error(lastErrorStringValue);
        return false;
    }

    sslConnectionPointer = SSL_new(sslContextPointerTyped);
    if (!sslConnectionPointer) {
        char errorBuffer[512];
        ERR_error_string_n(ERR_get_error(), errorBuffer, sizeof(errorBuffer));
        lastErrorStringValue = std::string("Failed to create SSL connection: ") + errorBuffer;
        WebSocketLogs::log_websocket_ssl_error(lastErrorStringValue);
        return false;
    }

    SSL* sslConnectionPointerTyped = static_cast<SSL*>(sslConnectionPointer);
    SSL_set_fd(sslConnectionPointerTyped, socketFileDescriptor);

    std::string hostnameString = extractHostname(websocketUrlStringValue);
    SSL_set_tlsext_host_name(sslConnectionPointerTyped, hostnameString.c_str());
    if (SSL_set1_host(sslConnectionPointerTyped, hostnameString.c_str()) != 1) {
        lastErrorStringValue = "Failed to set expected certificate host name";
        WebSocketLogs::log_websocket_ssl_error(lastErrorStringValue);
        return false;
    }

    while (true) {
        ERR_clear_error();
        int sslConnectResult = SSL_connect(sslConnectionPointerTyped);
        if (sslConnectResult == 1) {
            return true;
        }

        int sslErrorCode = SSL_get_error(sslConnectionPointerTyped, sslConnectResult);
        if (sslErrorCode != SSL_ERROR_WANT_READ && sslErrorCode != SSL_ERROR_WANT_WRITE) {
            lastErrorStringValue = describeSslError("SSL handshake", sslConnectResult);
            WebSocketLogs::log_websocket_ssl_error(lastErrorStringValue);
            return false;
        }

        int readinessValue = waitForSocket(sslErrorCode == SSL_ERROR_WANT_WRITE, HANDSHAKE_TIMEOUT_MS);
        if (readinessValue <= 0) {
            if (readinessValue == 0) {
                lastErrorStringValue = "SSL handshake timeout";
            }
            WebSocketLogs::log_websocket_ssl_error(lastErrorStringValue);
            return false;
        }
    }
}

bool WebSocketClient::performWebSocketHandshake() {
    std::vector<unsigned char> webSocketKeyBytes = CryptoUtils::generate_random_bytes(16);
    std::string webSocketKeyString = CryptoUtils::base64_encode(std::string(webSocketKeyBytes.begin(), webSocketKeyBytes.end()));

    std::string hostnameString = extractHostname(websocketUrlStringValue);
    std::string pathString = extractPath(websocketUrlStringValue);

    std::stringstream handshakeStream;
    handshakeStream << "GET " << pathString << " HTTP/1.1\r\n";
    handshakeStream << "Host: " << hostnameString << "\r\n";
    handshakeStream << "Upgrade: websocket\r\n";
    handshakeStream << "Connection: Upgrade\r\n";
    handshakeStream << "Sec-WebSocket-Key: " << webSocketKeyString << "\r\n";
    handshakeStream << "Sec-WebSocket-Version: 13\r\n";
    handshakeStream << "\r\n";

    std::string handshakeRequestString = handshakeStream.str();
    if (!writeAll(reinterpret_cast<const unsigned char*>(handshakeRequestString.data()), handshakeRequestString.size())) {
        WebSocketLogs::log_websocket_handshake_error(lastErrorStringValue);
        return false;
    }

    // Byte-wise read so no frame data after the headers is consumed
    std::string handshakeResponseString;
    while (handshakeResponseString.find("\r\n\r\n") == std::string::npos) {
        if (handshakeResponseString.size() >= MAX_HANDSHAKE_RESPONSE_BYTES) {
            lastErrorStringValue = "WebSocket handshake response too large";
            WebSocketLogs::log_websocket_handshake_error(lastErrorStringValue);
            return false;
        }
        unsigned char responseByte = 0;
        if (!readExact(&responseByte, 1)) {
            WebSocketLogs::log_websocket_handshake_error(lastErrorStringValue);
            return false;
        }
        handshakeResponseString.push_back(static_cast<char>(responseByte));
    }

    size_t firstLineEndPos = handshakeResponseString.find("\r\n");
    std::string firstLine = handshakeResponseString.substr(0, firstLineEndPos);
    if (firstLine.find(" 101") == std::string::npos) {
        lastErrorStringValue = "WebSocket handshake failed - invalid response code. First line: " + firstLine;
        WebSocketLogs::log_websocket_handshake_error(lastErrorStringValue);
        return false;
    }

    std::string expectedAcceptBase64String = CryptoUtils::base64_encode(CryptoUtils::sha1_digest(webSocketKeyString + WEBSOCKET_ACCEPT_GUID));
    if (handshakeResponseString.find(expectedAcceptBase64String) == std::string::npos) {
        lastErrorStringValue = "WebSocket handshake failed - invalid accept key, expected " + expectedAcceptBase64String;
        WebSocketLogs::log_websocket_handshake_error(lastErrorStringValue);
        return false;
    }

    return true;
}

void WebSocketClient::cleanupConnection() {
    connectedFlag.store(false);

    if (sslConnectionPointer) {
        SSL* sslConnectionToFree = static_cast<SSL*>(sslConnectionPointer);
        sslConnectionPointer = nullptr;
        SSL_free(sslConnectionToFree);
    }

    if (sslContextPointer) {
        SSL_CTX* sslContextToFree = static_cast<SSL_CTX*>(sslContextPointer);
        sslContextPointer = nullptr;
        SSL_CTX_free(sslContextToFree);
    }

    if (socketFileDescriptor >= 0) {
        int socketFileDescriptorToClose = socketFileDescriptor;
        socketFileDescriptor = -1;
        ::close(socketFileDescriptorToClose);
    }

    fragmentedMessageBuffer.clear();
    fragmentedMessageActive = false;
}

bool WebSocketClient::validateUrl(const std::string& urlStringToValidate) {
    return urlStringToValidate.find("wss://") == 0;
}

std::string WebSocketClient::extractHostname(const std::string& urlString) {
    size_t protocolStart = urlString.find("://");
    if (protocolStart == std::string::npos) {
        return "";
    }

    size_t hostnameStart = protocolStart + 3;
    size_t hostnameEnd = urlString.find_first_of(":/?", hostnameStart);
    if (hostnameEnd == std::string::npos) {
        hostnameEnd = urlString.length();
    }
    return urlString.substr(hostnameStart, hostnameEnd - hostnameStart);
}

std::string WebSocketClient::extractPort(const std::string& urlString) {
    size_t protocolStart = urlString.find("://");
    if (protocolStart == std::string::npos) {
        return "";
    }

    size_t hostnameStart = protocolStart + 3;
    size_t authorityEnd = urlString.find_first_of("/?", hostnameStart);
    if (authorityEnd == std::string::npos) {
        authorityEnd = urlString.length();
    }

    size_t portStart = urlString.find(':', hostnameStart);
    if (portStart != std::string::npos && portStart < authorityEnd) {
        return urlString.substr(portStart + 1, authorityEnd - portStart - 1);
    }

    if (urlString.find("wss://") == 0) {
        return "443";
    }
    return "80";
}

std::string WebSocketClient::extractPath(const std::string& urlString) {
    size_t protocolStart = urlString.find("://");
    if (protocolStart == std::string::npos) {
        return "/";
    }

    size_t pathStart = urlString.find_first_of("/?", protocolStart + 3);
    if (pathStart == std::string::npos) {
        return "/";
    }

    std::string pathString = urlString.substr(pathStart);
    if (pathString[0] == '?') {
        pathString = "/" + pathString;
    }
    return pathString;
}

} // namespace Okx
} // namespace API
} // namespace OkxTrader
