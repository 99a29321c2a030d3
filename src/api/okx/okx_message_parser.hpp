#ifndef OKX_MESSAGE_PARSER_HPP
#define OKX_MESSAGE_PARSER_HPP

#include "trader/data_structures/data_structures.hpp"
#include <string>
#include <vector>

namespace OkxTrader {
namespace API {
namespace Okx {

// OKX public channel names
constexpr const char* TICKERS_CHANNEL = "tickers";
constexpr const char* CANDLE_CHANNEL_PREFIX = "candle";

enum class OkxMessageKind {
    TICKER,
    CANDLE,
    SUBSCRIBE_ACK,
    ERROR_EVENT,
    PONG,
    UNKNOWN,
    MALFORMED
};

// ========================================================================
// Decoded inbound frame
// ========================================================================

struct OkxParsedMessage {
    OkxMessageKind kind;
    std::string channel;                // "tickers", "candle30m", ...
    std::string instrument_id;
    std::vector<Core::Tick> ticks;      // TICKER only
    std::vector<Core::Bar> candles;     // CANDLE only
    std::string error_code;             // ERROR_EVENT only
    std::string error_message;          // ERROR_EVENT and MALFORMED

    OkxParsedMessage() : kind(OkxMessageKind::UNKNOWN) {}
};

// Decodes one text frame received from the public stream. Never throws; a
// frame that is not valid JSON or carries unusable data is reported as MALFORMED.
OkxParsedMessage parse_okx_message(const std::string& message_text, long long local_timestamp_ms);

std::string build_subscribe_message(const std::string& channel, const std::string& instrument_id);

// "30m" -> "candle30m", "1h" -> "candle1H"
std::string build_candle_channel_name(const std::string& timeframe);


} // namespace Okx
} // namespace API
} // namespace OkxTrader

#endif // OKX_MESSAGE_PARSER_HPP
