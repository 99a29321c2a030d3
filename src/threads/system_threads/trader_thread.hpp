#ifndef TRADER_THREAD_HPP
#define TRADER_THREAD_HPP

#include "configs/timing_config.hpp"
#include "trader/coordinators/trading_coordinator.hpp"
#include "trader/coordinators/event_distributor.hpp"
#include "trader/data_structures/data_structures.hpp"
#include <atomic>

namespace OkxTrader {
namespace Threads {

struct TraderThread {
    const TimingConfig& timing;
    OkxTrader::Core::TradingCoordinator& trading_coordinator;
    std::atomic<bool>& running;
    OkxTrader::Core::EventChannel<OkxTrader::Core::Signal>::SubscriptionPtr signal_subscription;

    std::atomic<unsigned long> signals_handled{0};

    // Subscribes immediately so signals published before the thread starts are kept.
    TraderThread(const TimingConfig& timing_config,
                 OkxTrader::Core::TradingCoordinator& coordinator_ref,
                 OkxTrader::Core::EventDistributor& event_distributor,
                 std::atomic<bool>& running_flag)
        : timing(timing_config), trading_coordinator(coordinator_ref), running(running_flag),
          signal_subscription(event_distributor.signal_channel.subscribe(static_cast<size_t>(timing_config.signal_queue_capacity))) {}

    // Thread entrypoint
    void operator()();

private:
    void execute_signal_loop();
};

} // namespace Threads
} // namespace OkxTrader

#endif // TRADER_THREAD_HPP
