#ifndef SYSTEM_MANAGER_HPP
#define SYSTEM_MANAGER_HPP

#include <memory>
#include "system/system_modules.hpp"
#include "system/system_state.hpp"
#include "system/system_threads.hpp"
#include "logging/logger/async_logger.hpp"

namespace OkxTrader {
namespace System {

// Process exit codes
constexpr int EXIT_CODE_GRACEFUL = 0;
constexpr int EXIT_CODE_INITIALIZATION_FAILURE = 1;
constexpr int EXIT_CODE_RECONNECT_EXHAUSTED = 2;

struct SystemInitializationResult {
    std::unique_ptr<SystemState> system_state;
    std::shared_ptr<OkxTrader::Logging::AsyncLogger> logger;
    
    SystemInitializationResult() = default;
    SystemInitializationResult(SystemInitializationResult&&) = default;
    SystemInitializationResult& operator=(SystemInitializationResult&&) = default;
    
    SystemInitializationResult(const SystemInitializationResult&) = delete;
    SystemInitializationResult& operator=(const SystemInitializationResult&) = delete;
};

// Loads configuration and sets up logging. Throws on failure.
SystemInitializationResult initialize(const std::string& config_directory);

// Builds all modules and starts the threads. Throws if a module cannot be created.
SystemThreads startup(SystemState& system_state, std::shared_ptr<OkxTrader::Logging::AsyncLogger> logger);

// Blocks until a shutdown signal or reconnect exhaustion; returns the process exit code.
int run(SystemState& system_state);

void shutdown(SystemState& system_state, SystemThreads& thread_handles,
              std::shared_ptr<OkxTrader::Logging::AsyncLogger> logger, int exit_code);

} // namespace System
} // namespace OkxTrader

#endif // SYSTEM_MANAGER_HPP
