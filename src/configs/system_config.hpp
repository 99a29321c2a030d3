#ifndef SYSTEM_CONFIG_HPP
#define SYSTEM_CONFIG_HPP

#include "stream_config.hpp"
#include "strategy_config.hpp"
#include "execution_config.hpp"
#include "timing_config.hpp"
#include "logging_config.hpp"

namespace OkxTrader {
namespace Config {

/**
 * Main trading system configuration.
 * Each member is loaded from its own CSV file under config/.
 */
struct SystemConfig {
    SystemConfig() {}

    StreamConfig stream;               // Exchange stream, liveness and reconnect settings
    StrategyConfig strategy;           // Indicator and strategy settings
    ExecutionConfig execution;         // Order execution settings and credentials
    TimingConfig timing;               // Thread intervals and event queue capacities
    LoggingConfig logging;             // Logging configuration
};

} // namespace Config
} // namespace OkxTrader

#endif // SYSTEM_CONFIG_HPP
