#ifndef BAR_AGGREGATOR_HPP
#define BAR_AGGREGATOR_HPP

#include "trader/data_structures/data_structures.hpp"
#include "trader/data_structures/bounded_series.hpp"
#include <string>
#include <vector>

namespace OkxTrader {
namespace Core {

/**
 * Builds timeframe bars for one instrument.
 *
 * Tick mode folds every tick into the open bar and closes it when a tick
 * arrives at or after the bar's close time. Candle mode passes exchange
 * candles through, holding an unconfirmed candle until it is confirmed or a
 * later candle replaces it.
 *
 * Completed bars are appended to history in strictly increasing open time.
 */
class BarAggregator {
public:
    // Throws std::invalid_argument on an unparsable timeframe or non-positive history size.
    BarAggregator(const std::string& timeframe, int max_bar_history);

    // Returns true and fills completed_bar when the tick closed the open bar.
    bool on_tick(const Tick& tick, Bar& completed_bar);

    // Returns the bars this update completed, oldest first.
    std::vector<Bar> on_candle_update(const Bar& candle);

    const BoundedSeries<Bar>& get_bar_history() const { return bar_history; }
    bool has_open_bar() const { return open_bar_active; }
    const Bar& get_open_bar() const { return open_bar; }
    long long get_timeframe_ms() const { return timeframe_ms; }

    void reset();

private:
    long long timeframe_ms;
    BoundedSeries<Bar> bar_history;
    Bar open_bar;
    bool open_bar_active;
    long long last_appended_open_time_ms;
    bool any_bar_appended;

    void open_new_bar(long long open_time_ms, double price);
    bool append_completed_bar(const Bar& bar);
    bool is_stale(long long open_time_ms) const;
};

} // namespace Core
} // namespace OkxTrader

#endif // BAR_AGGREGATOR_HPP
