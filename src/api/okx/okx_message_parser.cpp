#include "okx_message_parser.hpp"
#include "utils/time_utils.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>

using json = nlohmann::json;

namespace OkxTrader {
namespace API {
namespace Okx {

namespace {

// OKX sends numeric fields as JSON strings; plain numbers are accepted too.
double read_decimal_field(const json& field_value) {
    if (field_value.is_string()) {
        return std::stod(field_value.get<std::string>());
    }
    if (field_value.is_number()) {
        return field_value.get<double>();
    }
    throw std::invalid_argument("expected numeric field");
}

long long read_timestamp_field(const json& field_value) {
    if (field_value.is_string()) {
        return std::stoll(field_value.get<std::string>());
    }
    if (field_value.is_number_integer()) {
        return field_value.get<long long>();
    }
    throw std::invalid_argument("expected timestamp field");
}

std::string read_string_field(const json& object_value, const char* key) {
    json::const_iterator field_iterator = object_value.find(key);
    if (field_iterator == object_value.end() || field_iterator->is_null()) {
        return "";
    }
    if (field_iterator->is_string()) {
        return field_iterator->get<std::string>();
    }
    return field_iterator->dump();
}

long long candle_duration_for_channel(const std::string& channel) {
    std::string label = channel.substr(std::string(CANDLE_CHANNEL_PREFIX).size());
    try {
        return TimeUtils::parse_timeframe_to_milliseconds(label);
    } catch (const std::invalid_argument&) {
        return 0;
    }
}

void decode_ticker_rows(const json& data_rows, OkxParsedMessage& parsed_message, long long local_timestamp_ms) {
    for (const json& ticker_row : data_rows) {
        Core::Tick tick;
        tick.symbol = ticker_row.contains("instId") ? read_string_field(ticker_row, "instId") : parsed_message.instrument_id;
        tick.price = read_decimal_field(ticker_row.at("last"));
        tick.volume = ticker_row.contains("vol24h") ? read_decimal_field(ticker_row.at("vol24h")) : 0.0;
        tick.exchange_timestamp_ms = read_timestamp_field(ticker_row.at("ts"));
        tick.local_timestamp_ms = local_timestamp_ms;
        parsed_message.ticks.push_back(tick);
    }
}

void decode_candle_rows(const json& data_rows, OkxParsedMessage& parsed_message) {
    long long duration_ms = candle_duration_for_channel(parsed_message.channel);
    for (const json& candle_row : data_rows) {
        if (!candle_row.is_array() || candle_row.size() < 6) {
            throw std::invalid_argument("candle row must hold at least 6 fields");
        }
        Core::Bar bar;
        bar.open_time_ms = read_timestamp_field(candle_row.at(0));
        bar.close_time_ms = bar.open_time_ms + duration_ms;
        bar.open_price = read_decimal_field(candle_row.at(1));
        bar.high_price = read_decimal_field(candle_row.at(2));
        bar.low_price = read_decimal_field(candle_row.at(3));
        bar.close_price = read_decimal_field(candle_row.at(4));
        bar.volume = read_decimal_field(candle_row.at(5));
        bar.complete = candle_row.size() >= 9 && candle_row.at(8).is_string() && candle_row.at(8).get<std::string>() == "1";
        parsed_message.candles.push_back(bar);
    }
}

} // anonymous namespace

OkxParsedMessage parse_okx_message(const std::string& message_text, long long local_timestamp_ms) {
    OkxParsedMessage parsed_message;

    if (message_text == "pong") {
        parsed_message.kind = OkxMessageKind::PONG;
        return parsed_message;
    }

    json message_json = json::parse(message_text, nullptr, false);
    if (message_json.is_discarded() || !message_json.is_object()) {
        parsed_message.kind = OkxMessageKind::MALFORMED;
        parsed_message.error_message = "invalid JSON";
        return parsed_message;
    }

    try {
        if (message_json.contains("arg") && message_json.at("arg").is_object()) {
            parsed_message.channel = read_string_field(message_json.at("arg"), "channel");
            parsed_message.instrument_id = read_string_field(message_json.at("arg"), "instId");
        }

        if (message_json.contains("event")) {
            std::string event_name = read_string_field(message_json, "event");
            if (event_name == "subscribe") {
                parsed_message.kind = OkxMessageKind::SUBSCRIBE_ACK;
            } else if (event_name == "error") {
                parsed_message.kind = OkxMessageKind::ERROR_EVENT;
                parsed_message.error_code = read_string_field(message_json, "code");
                parsed_message.error_message = read_string_field(message_json, "msg");
            } else {
                parsed_message.kind = OkxMessageKind::UNKNOWN;
            }
            return parsed_message;
        }

        if (!message_json.contains("data") || !message_json.at("data").is_array()) {
            parsed_message.kind = OkxMessageKind::UNKNOWN;
            return parsed_message;
        }

        const json& data_rows = message_json.at("data");
        if (parsed_message.channel == TICKERS_CHANNEL) {
            decode_ticker_rows(data_rows, parsed_message, local_timestamp_ms);
            parsed_message.kind = OkxMessageKind::TICKER;
        } else if (parsed_message.channel.compare(0, std::string(CANDLE_CHANNEL_PREFIX).size(), CANDLE_CHANNEL_PREFIX) == 0) {
            decode_candle_rows(data_rows, parsed_message);
            parsed_message.kind = OkxMessageKind::CANDLE;
        } else {
            parsed_message.kind = OkxMessageKind::UNKNOWN;
        }
    } catch (const json::exception& json_error) {
        parsed_message = OkxParsedMessage();
        parsed_message.kind = OkxMessageKind::MALFORMED;
        parsed_message.error_message = json_error.what();
    } catch (const std::logic_error& field_error) {
        // std::stod / std::stoll failures
        parsed_message = OkxParsedMessage();
        parsed_message.kind = OkxMessageKind::MALFORMED;
        parsed_message.error_message = std::string("bad field: ") + field_error.what();
    }

    return parsed_message;
}

std::string build_subscribe_message(const std::string& channel, const std::string& instrument_id) {
    json subscribe_json;
    subscribe_json["op"] = "subscribe";
    subscribe_json["args"] = json::array({ json{{"channel", channel}, {"instId", instrument_id}} });
    return subscribe_json.dump();
}

std::string build_candle_channel_name(const std::string& timeframe) {
    return std::string(CANDLE_CHANNEL_PREFIX) + TimeUtils::timeframe_to_okx_bar_label(timeframe);
}

} // namespace Okx
} // namespace API
} // namespace OkxTrader
