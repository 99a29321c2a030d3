/**
 * Market monitor thread.
 * Consumes the published market events for logging and CSV output.
 */
#include "market_monitor_thread.hpp"
#include "logging/logger/async_logger.hpp"
#include "logging/logs/market_data_logs.hpp"

using namespace OkxTrader::Threads;
using namespace OkxTrader::Logging;

MarketMonitorThread::MarketMonitorThread(const OkxTrader::Config::SystemConfig& system_config,
                                         Core::EventDistributor& event_distributor,
                                         Core::MarketActivity& market_activity,
                                         ConnectivityManager& connectivity_manager)
    : config(system_config), distributor(event_distributor), activity(market_activity),
      connectivity(connectivity_manager), reported_tick_drops(0), reported_warning_drops(0),
      reported_bar_update_drops(0), last_status_time(std::chrono::steady_clock::now()) {
    // Subscribed before the stream starts so no event is published to an empty channel
    tick_subscription = distributor.tick_channel.subscribe(static_cast<size_t>(config.timing.tick_queue_capacity));
    completed_bar_subscription = distributor.completed_bar_channel.subscribe(static_cast<size_t>(config.timing.bar_queue_capacity));
    warning_subscription = distributor.warning_channel.subscribe(static_cast<size_t>(config.timing.warning_queue_capacity));
}

// ========================================================================
// THREAD LIFECYCLE MANAGEMENT
// ========================================================================

void MarketMonitorThread::operator()() {
    set_log_thread_tag("MONITR");

    const std::chrono::milliseconds wait_timeout(config.timing.event_wait_timeout_ms);

    while (true) {
        try {
            Core::Bar completed_bar;
            if (completed_bar_subscription->wait_and_pop(completed_bar, wait_timeout)) {
                handle_completed_bar(completed_bar);
            } else if (completed_bar_subscription->is_closed() && completed_bar_subscription->size() == 0) {
                break;
            }

            drain_ticks();
            drain_warnings();
            report_dropped_events();
            log_status_if_due();
        } catch (const std::exception& exception_error) {
            log_message("ERROR: Market monitor iteration failed: " + std::string(exception_error.what()), "");
        }
    }

    drain_warnings();
    report_dropped_events();
}

void MarketMonitorThread::drain_ticks() {
    Core::Tick tick;
    while (tick_subscription->try_pop(tick)) {
        if (config.logging.log_every_tick) {
            MarketDataLogs::log_tick_received(tick);
        }
    }
}

void MarketMonitorThread::drain_warnings() {
    Core::StreamWarning warning;
    while (warning_subscription->try_pop(warning)) {
        MarketDataLogs::log_stream_warning(warning);
    }
}

void MarketMonitorThread::handle_completed_bar(const Core::Bar& bar) {
    MarketDataLogs::log_bar_completed(config.stream.symbol, config.stream.timeframe, bar);

    if (!config.logging.enable_bars_csv) {
        return;
    }
    LoggingContext* logging_context = get_logging_context();
    if (logging_context && logging_context->csv_bars_logger) {
        logging_context->csv_bars_logger->log_bar(config.stream.symbol, config.stream.timeframe, bar);
    }
}

void MarketMonitorThread::report_dropped_events() {
    size_t tick_drops = distributor.tick_channel.get_total_dropped_count();
    if (tick_drops > reported_tick_drops) {
        MarketDataLogs::log_events_dropped(distributor.tick_channel.get_name(), tick_drops - reported_tick_drops);
        reported_tick_drops = tick_drops;
    }

    size_t bar_update_drops = distributor.bar_update_channel.get_total_dropped_count();
    if (bar_update_drops > reported_bar_update_drops) {
        MarketDataLogs::log_events_dropped(distributor.bar_update_channel.get_name(), bar_update_drops - reported_bar_update_drops);
        reported_bar_update_drops = bar_update_drops;
    }

    size_t warning_drops = distributor.warning_channel.get_total_dropped_count();
    if (warning_drops > reported_warning_drops) {
        MarketDataLogs::log_events_dropped(distributor.warning_channel.get_name(), warning_drops - reported_warning_drops);
        reported_warning_drops = warning_drops;
    }
}

void MarketMonitorThread::log_status_if_due() {
    auto now = std::chrono::steady_clock::now();
    auto since_last_status = std::chrono::duration_cast<std::chrono::seconds>(now - last_status_time);
    if (since_last_status.count() < config.timing.market_status_logging_interval_seconds) {
        return;
    }
    last_status_time = now;

    MarketDataLogs::log_market_status_table(config.stream.symbol, connectivity.get_status_string(),
                                            activity.last_price.load(),
                                            static_cast<size_t>(activity.ticks_seen.load()),
                                            static_cast<size_t>(activity.bars_completed.load()),
                                            activity.last_bar_open_time_ms.load());
}
