#include "bar_aggregator.hpp"
#include "logging/logs/market_data_logs.hpp"
#include "utils/time_utils.hpp"
#include <algorithm>
#include <stdexcept>

using OkxTrader::Logging::MarketDataLogs;

namespace OkxTrader {
namespace Core {

BarAggregator::BarAggregator(const std::string& timeframe, int max_bar_history)
    : timeframe_ms(TimeUtils::parse_timeframe_to_milliseconds(timeframe)),
      bar_history(max_bar_history),
      open_bar_active(false),
      last_appended_open_time_ms(0),
      any_bar_appended(false) {}

bool BarAggregator::on_tick(const Tick& tick, Bar& completed_bar) {
    if (!open_bar_active) {
        // Seed from wall-clock time; exchange timestamps may be skewed.
        open_new_bar(TimeUtils::align_to_timeframe(tick.local_timestamp_ms, timeframe_ms), tick.price);
        return false;
    }

    if (tick.local_timestamp_ms >= open_bar.open_time_ms + timeframe_ms) {
        Bar finished_bar = open_bar;
        finished_bar.complete = true;
        // A gap spanning several timeframes still advances by one bar.
        open_new_bar(finished_bar.open_time_ms + timeframe_ms, tick.price);

        if (!append_completed_bar(finished_bar)) {
            return false;
        }
        completed_bar = finished_bar;
        return true;
    }

    open_bar.high_price = std::max(open_bar.high_price, tick.price);
    open_bar.low_price = std::min(open_bar.low_price, tick.price);
    open_bar.close_price = tick.price;
    open_bar.volume += 1.0;
    return false;
}

std::vector<Bar> BarAggregator::on_candle_update(const Bar& candle) {
    std::vector<Bar> completed_bars;

    if (candle.open_time_ms % timeframe_ms != 0) {
        MarketDataLogs::log_bar_rejected("open time not aligned to timeframe", candle);
        return completed_bars;
    }
    if (is_stale(candle.open_time_ms)) {
        MarketDataLogs::log_bar_rejected("duplicate or out-of-order open time", candle);
        return completed_bars;
    }
    if (open_bar_active && candle.open_time_ms < open_bar.open_time_ms) {
        MarketDataLogs::log_bar_rejected("older than the pending candle", candle);
        return completed_bars;
    }

    Bar normalized_candle = candle;
    normalized_candle.close_time_ms = candle.open_time_ms + timeframe_ms;

    if (open_bar_active && normalized_candle.open_time_ms > open_bar.open_time_ms) {
        Bar finished_bar = open_bar;
        finished_bar.complete = true;
        open_bar_active = false;
        if (append_completed_bar(finished_bar)) {
            completed_bars.push_back(finished_bar);
        }
    }

    if (normalized_candle.complete) {
        open_bar_active = false;
        if (append_completed_bar(normalized_candle)) {
            completed_bars.push_back(normalized_candle);
        }
    } else {
        open_bar = normalized_candle;
        open_bar_active = true;
    }

    return completed_bars;
}

void BarAggregator::reset() {
    bar_history.clear();
    open_bar = Bar();
    open_bar_active = false;
    last_appended_open_time_ms = 0;
    any_bar_appended = false;
}

void BarAggregator::open_new_bar(long long open_time_ms, double price) {
    open_bar = Bar();
    open_bar.open_time_ms = open_time_ms;
    open_bar.close_time_ms = open_time_ms + timeframe_ms;
    open_bar.open_price = price;
    open_bar.high_price = price;
    open_bar.low_price = price;
    open_bar.close_price = price;
    open_bar.volume = 0.0;
    open_bar.complete = false;
    open_bar_active = true;
}

bool BarAggregator::append_completed_bar(const Bar& bar) {
    if (is_stale(bar.open_time_ms)) {
        MarketDataLogs::log_bar_rejected("duplicate or out-of-order open time", bar);
        return false;
    }
    bar_history.push(bar);
    last_appended_open_time_ms = bar.open_time_ms;
    any_bar_appended = true;
    return true;
}

bool BarAggregator::is_stale(long long open_time_ms) const {
    return any_bar_appended && open_time_ms <= last_appended_open_time_ms;
}

} // namespace Core
} // namespace OkxTrader
