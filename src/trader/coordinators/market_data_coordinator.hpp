#ifndef MARKET_DATA_COORDINATOR_HPP
#define MARKET_DATA_COORDINATOR_HPP

#include "configs/system_config.hpp"
#include "api/general/market_event_handler.hpp"
#include "trader/data_structures/data_structures.hpp"
#include "trader/market_data/bar_aggregator.hpp"
#include "trader/strategy_analysis/signal_state_machine.hpp"
#include "event_distributor.hpp"
#include <atomic>
#include <string>

namespace OkxTrader {
namespace Core {

using Config::SystemConfig;

enum class BarSource {
    TICKS,      // bars built locally from ticker pushes
    CANDLES     // exchange candle channel used as-is
};

// Throws std::invalid_argument for anything other than "ticks" or "candles".
BarSource parse_bar_source(const std::string& bar_source_name);

// Counters shared with the monitor thread and the paper execution client.
struct MarketActivity {
    std::atomic<double> last_price{0.0};
    std::atomic<unsigned long long> ticks_seen{0};
    std::atomic<unsigned long long> bars_completed{0};
    std::atomic<unsigned long long> signals_emitted{0};
    std::atomic<long long> last_bar_open_time_ms{0};
};

/**
 * Stream-side event handler. Runs on the stream thread: publishes raw events,
 * builds bars, drives the signal state machine and publishes its signals.
 */
class MarketDataCoordinator : public API::MarketEventHandler {
public:
    MarketDataCoordinator(const SystemConfig& system_config, EventDistributor& event_distributor,
                          BarAggregator& bar_aggregator, SignalStateMachine& signal_state_machine,
                          MarketActivity& market_activity);

    void on_tick(const Tick& tick) override;
    void on_candle_update(const Bar& candle) override;
    void on_stream_warning(const StreamWarning& warning) override;

private:
    const SystemConfig& config;
    EventDistributor& distributor;
    BarAggregator& aggregator;
    SignalStateMachine& state_machine;
    MarketActivity& activity;
    BarSource bar_source;

    void process_completed_bar(const Bar& completed_bar);
};

} // namespace Core
} // namespace OkxTrader

#endif // MARKET_DATA_COORDINATOR_HPP
