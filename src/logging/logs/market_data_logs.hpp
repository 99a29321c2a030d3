#ifndef MARKET_DATA_LOGS_HPP
#define MARKET_DATA_LOGS_HPP

#include "trader/data_structures/data_structures.hpp"
#include <string>
#include <cstddef>

namespace OkxTrader {
namespace Logging {

class MarketDataLogs {
public:
    static void log_tick_received(const Core::Tick& tick);
    static void log_bar_completed(const std::string& symbol, const std::string& timeframe, const Core::Bar& bar);
    static void log_bar_rejected(const std::string& reason, const Core::Bar& bar);
    static void log_events_dropped(const std::string& channel_name, size_t dropped_count);
    static void log_stream_warning(const Core::StreamWarning& warning);
    static void log_market_status_table(const std::string& symbol, const std::string& connection_status,
                                        double last_price, size_t ticks_seen, size_t bars_completed,
                                        long long last_bar_open_time_ms);
};

} // namespace Logging
} // namespace OkxTrader

#endif // MARKET_DATA_LOGS_HPP
