#ifndef SYSTEM_STATE_HPP
#define SYSTEM_STATE_HPP

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <stdexcept>
#include "system/system_modules.hpp"
#include "configs/system_config.hpp"
#include "logging/logger/async_logger.hpp"
#include "trader/coordinators/event_distributor.hpp"
#include "trader/coordinators/market_data_coordinator.hpp"
#include "utils/connectivity_manager.hpp"

/**
 * @brief Central system state container
 * 
 * Contains configuration, shared market state, the event channels and
 * the flags used to coordinate shutdown.
 */
struct SystemState {
    // =========================================================================
    // THREAD SYNCHRONIZATION
    // =========================================================================
    std::mutex mtx;                    // Guards shutdown transitions
    std::condition_variable cv;        // Wakes the main thread on shutdown
    
    // =========================================================================
    // SYSTEM CONTROL FLAGS
    // =========================================================================
    std::atomic<bool> running{true};                // Main system running flag
    std::atomic<bool> shutdown_requested{false};    // Set by SIGINT / SIGTERM
    std::atomic<bool> reconnect_exhausted{false};   // Set when the stream gives up
    
    // =========================================================================
    // CONFIGURATION AND MODULES
    // =========================================================================
    OkxTrader::Config::SystemConfig config;                       // Complete system configuration
    OkxTrader::Core::EventDistributor event_distributor;          // Tick, bar, signal and warning channels
    OkxTrader::Core::MarketActivity market_activity;              // Live counters for monitoring
    ConnectivityManager connectivity_manager;                     // Stream connection state
    std::unique_ptr<SystemModules> trading_modules;               // All system modules
    std::shared_ptr<OkxTrader::Logging::LoggingContext> logging_context;  // Logging context

    // =========================================================================
    // CONSTRUCTORS
    // =========================================================================

    explicit SystemState(const OkxTrader::Config::SystemConfig& initial)
        : config(initial),
          connectivity_manager(config.stream.max_reconnect_attempts,
                               config.stream.initial_reconnect_delay_ms,
                               config.stream.reconnect_multiplier) {
        if (config.stream.symbol.empty()) {
            throw std::runtime_error("Target symbol is required but not configured");
        }
    }

    SystemState(const SystemState&) = delete;
    SystemState& operator=(const SystemState&) = delete;
};

#endif // SYSTEM_STATE_HPP
