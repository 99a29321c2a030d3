#include "market_data_coordinator.hpp"
#include "logging/logs/market_data_logs.hpp"
#include "logging/logs/signal_analysis_logs.hpp"
#include <stdexcept>

namespace OkxTrader {
namespace Core {

using OkxTrader::Logging::MarketDataLogs;
using OkxTrader::Logging::SignalAnalysisLogs;

BarSource parse_bar_source(const std::string& bar_source_name) {
    if (bar_source_name == "ticks") {
        return BarSource::TICKS;
    }
    if (bar_source_name == "candles") {
        return BarSource::CANDLES;
    }
    throw std::invalid_argument("Unknown bar source '" + bar_source_name + "' (expected ticks or candles)");
}

MarketDataCoordinator::MarketDataCoordinator(const SystemConfig& system_config, EventDistributor& event_distributor,
                                             BarAggregator& bar_aggregator, SignalStateMachine& signal_state_machine,
                                             MarketActivity& market_activity)
    : config(system_config), distributor(event_distributor), aggregator(bar_aggregator),
      state_machine(signal_state_machine), activity(market_activity),
      bar_source(parse_bar_source(system_config.stream.bar_source)) {}

void MarketDataCoordinator::on_tick(const Tick& tick) {
    activity.last_price.store(tick.price);
    activity.ticks_seen.fetch_add(1);
    distributor.tick_channel.publish(tick);

    if (bar_source != BarSource::TICKS) {
        return;
    }

    Bar completed_bar;
    if (aggregator.on_tick(tick, completed_bar)) {
        process_completed_bar(completed_bar);
    }
}

void MarketDataCoordinator::on_candle_update(const Bar& candle) {
    distributor.bar_update_channel.publish(candle);

    if (bar_source != BarSource::CANDLES) {
        return;
    }

    for (const Bar& completed_bar : aggregator.on_candle_update(candle)) {
        process_completed_bar(completed_bar);
    }
}

void MarketDataCoordinator::on_stream_warning(const StreamWarning& warning) {
    distributor.warning_channel.publish(warning);
}

void MarketDataCoordinator::process_completed_bar(const Bar& completed_bar) {
    activity.bars_completed.fetch_add(1);
    activity.last_bar_open_time_ms.store(completed_bar.open_time_ms);
    distributor.completed_bar_channel.publish(completed_bar);

    Signal signal;
    if (!state_machine.on_bar_completed(completed_bar, signal)) {
        return;
    }

    activity.signals_emitted.fetch_add(1);
    SignalAnalysisLogs::log_signal_emitted(config.stream.symbol, signal, state_machine.get_position_bias());
    distributor.signal_channel.publish(signal);
}

} // namespace Core
} // namespace OkxTrader
