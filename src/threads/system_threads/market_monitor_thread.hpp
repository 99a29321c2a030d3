#ifndef MARKET_MONITOR_THREAD_HPP
#define MARKET_MONITOR_THREAD_HPP

#include "configs/system_config.hpp"
#include "trader/coordinators/event_distributor.hpp"
#include "trader/coordinators/market_data_coordinator.hpp"
#include "utils/connectivity_manager.hpp"
#include <chrono>
#include <memory>

namespace OkxTrader {
namespace Threads {

/**
 * Observer of the event channels. Logs ticks, completed bars and stream
 * warnings, writes completed bars to the bars CSV, reports events dropped by
 * the lossy channels and prints a periodic market status table.
 */
class MarketMonitorThread {
public:
    MarketMonitorThread(const OkxTrader::Config::SystemConfig& system_config,
                        Core::EventDistributor& event_distributor,
                        Core::MarketActivity& market_activity,
                        ConnectivityManager& connectivity_manager);

    void operator()();

private:
    const OkxTrader::Config::SystemConfig& config;
    Core::EventDistributor& distributor;
    Core::MarketActivity& activity;
    ConnectivityManager& connectivity;

    Core::EventChannel<Core::Tick>::SubscriptionPtr tick_subscription;
    Core::EventChannel<Core::Bar>::SubscriptionPtr completed_bar_subscription;
    Core::EventChannel<Core::StreamWarning>::SubscriptionPtr warning_subscription;

    size_t reported_tick_drops;
    size_t reported_warning_drops;
    size_t reported_bar_update_drops;
    std::chrono::steady_clock::time_point last_status_time;

    void drain_ticks();
    void drain_warnings();
    void handle_completed_bar(const Core::Bar& bar);
    void report_dropped_events();
    void log_status_if_due();
};

} // namespace Threads
} // namespace OkxTrader

#endif // MARKET_MONITOR_THREAD_HPP
