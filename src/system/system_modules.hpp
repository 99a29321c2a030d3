#ifndef SYSTEM_MODULES_HPP
#define SYSTEM_MODULES_HPP

#include <memory>
#include "api/general/execution_interface.hpp"
#include "api/okx/okx_market_stream.hpp"
#include "threads/system_threads/logging_thread.hpp"
#include "threads/system_threads/market_monitor_thread.hpp"
#include "threads/system_threads/market_stream_thread.hpp"
#include "threads/system_threads/trader_thread.hpp"
#include "trader/coordinators/market_data_coordinator.hpp"
#include "trader/coordinators/trading_coordinator.hpp"
#include "trader/market_data/bar_aggregator.hpp"
#include "trader/strategy_analysis/signal_state_machine.hpp"

/**
 * @brief Runtime module container
 * 
 * Holds active system modules as smart pointers for centralized ownership.
 * Members are declared in dependency order so destruction runs in reverse.
 */
struct SystemModules {
    // =========================================================================
    // CORE TRADING COMPONENTS
    // =========================================================================
    OkxTrader::API::ExecutionInterfacePtr execution_client;                        // Live OKX or paper client
    std::unique_ptr<OkxTrader::Core::TradingCoordinator> trading_coordinator;      // Signal to order gate
    std::unique_ptr<OkxTrader::Core::BarAggregator> bar_aggregator;                // Tick / candle to bar
    std::unique_ptr<OkxTrader::Core::SignalStateMachine> signal_state_machine;     // Strategy evaluation
    std::unique_ptr<OkxTrader::Core::MarketDataCoordinator> market_data_coordinator; // Stream event handler
    std::unique_ptr<OkxTrader::API::Okx::OkxMarketStream> market_stream;          // Exchange connector
    
    // =========================================================================
    // THREADING COMPONENTS
    // =========================================================================
    std::unique_ptr<OkxTrader::Threads::LoggingThread> logging_thread;             // Log drain
    std::unique_ptr<OkxTrader::Threads::MarketMonitorThread> market_monitor_thread; // Event observer
    std::unique_ptr<OkxTrader::Threads::TraderThread> trader_thread;               // Signal consumer
    std::unique_ptr<OkxTrader::Threads::MarketStreamThread> market_stream_thread;  // Connector runner
};

#endif // SYSTEM_MODULES_HPP
