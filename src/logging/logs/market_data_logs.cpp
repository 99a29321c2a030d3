#include "market_data_logs.hpp"
#include "logging/logger/async_logger.hpp"
#include "logging/logger/logging_macros.hpp"
#include "utils/time_utils.hpp"
#include <iomanip>
#include <sstream>

namespace OkxTrader {
namespace Logging {

namespace {

std::string format_price(double value) {
    std::ostringstream price_stream;
    price_stream << std::fixed << std::setprecision(2) << value;
    return price_stream.str();
}

} // anonymous namespace

void MarketDataLogs::log_tick_received(const Core::Tick& tick) {
    log_message("TICK " + tick.symbol + " price=" + format_price(tick.price) +
                " exch_ts=" + std::to_string(tick.exchange_timestamp_ms), "");
}

void MarketDataLogs::log_bar_completed(const std::string& symbol, const std::string& timeframe, const Core::Bar& bar) {
    TABLE_HEADER_48("Bar Completed", symbol + " " + timeframe);
    TABLE_ROW_48("Open Time", TimeUtils::convert_milliseconds_to_human_readable(bar.open_time_ms));
    TABLE_ROW_48("Open", format_price(bar.open_price));
    TABLE_ROW_48("High", format_price(bar.high_price));
    TABLE_ROW_48("Low", format_price(bar.low_price));
    TABLE_ROW_48("Close", format_price(bar.close_price));
    TABLE_ROW_48("Volume", format_price(bar.volume));
    TABLE_FOOTER_48();
}

void MarketDataLogs::log_bar_rejected(const std::string& reason, const Core::Bar& bar) {
    log_message("WARNING: Bar rejected (" + reason + ") open_time=" + std::to_string(bar.open_time_ms), "");
}

void MarketDataLogs::log_events_dropped(const std::string& channel_name, size_t dropped_count) {
    log_message("WARNING: " + std::to_string(dropped_count) + " " + channel_name + " events dropped by slow consumer", "");
}

void MarketDataLogs::log_stream_warning(const Core::StreamWarning& warning) {
    log_message("STREAM WARNING [" + Core::to_string(warning.type) + "] " + warning.message, "");
}

void MarketDataLogs::log_market_status_table(const std::string& symbol, const std::string& connection_status,
                                             double last_price, size_t ticks_seen, size_t bars_completed,
                                             long long last_bar_open_time_ms) {
    TABLE_HEADER_48("Market Status", symbol);
    TABLE_ROW_48("Connection", connection_status);
    TABLE_ROW_48("Last Price", last_price > 0.0 ? format_price(last_price) : std::string("n/a"));
    TABLE_ROW_48("Ticks Seen", std::to_string(ticks_seen));
    TABLE_ROW_48("Bars Completed", std::to_string(bars_completed));
    TABLE_ROW_48("Last Bar", last_bar_open_time_ms > 0 ? TimeUtils::convert_milliseconds_to_human_readable(last_bar_open_time_ms) : std::string("n/a"));
    TABLE_FOOTER_48();
}

} // namespace Logging
} // namespace OkxTrader
