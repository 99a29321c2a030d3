#include "system_manager.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <thread>
#include "configs/system_config.hpp"
#include "api/okx/okx_trading_client.hpp"
#include "api/okx/paper_trading_client.hpp"
#include "logging/logs/system_logs.hpp"
#include "logging/logger/async_logger.hpp"
#include "trader/config_loader/config_loader.hpp"

using namespace OkxTrader::Logging;
using namespace OkxTrader::Threads;

namespace OkxTrader {
namespace System {

namespace {

// Binds the logging context to the new thread and reports how the thread ended.
// A thread that dies on an exception takes the whole system down.
template <typename ThreadBody>
std::thread start_system_thread(const std::string& thread_name, SystemState& state, ThreadBody& thread_body) {
    LoggingContext& logging_context = *state.logging_context;
    return std::thread([thread_name, &logging_context, &state, &thread_body]() {
        set_logging_context(logging_context);
        SystemLogs::log_thread_started(thread_name);
        try {
            thread_body();
            SystemLogs::log_thread_exited(thread_name);
        } catch (const std::exception& exception_error) {
            SystemLogs::log_thread_exception(thread_name, exception_error.what());
            {
                std::lock_guard<std::mutex> state_lock(state.mtx);
                state.running.store(false);
            }
            state.cv.notify_all();
        }
    });
}

OkxTrader::API::ExecutionInterfacePtr create_execution_client(SystemState& state) {
    if (state.config.execution.mode == "live") {
        return OkxTrader::API::ExecutionInterfacePtr(new OkxTrader::API::Okx::OkxTradingClient(state.config.execution));
    }
    return OkxTrader::API::ExecutionInterfacePtr(
        new OkxTrader::API::Okx::PaperTradingClient(state.config.execution, state.market_activity.last_price));
}

void join_if_running(std::thread& thread_handle) {
    if (thread_handle.joinable()) {
        thread_handle.join();
    }
}

} // anonymous namespace

SystemInitializationResult initialize(const std::string& config_directory) {
    SystemInitializationResult initialization_result;
    
    // Initialize minimal logging context early - required before any logging calls
    auto early_logging_context = std::make_shared<LoggingContext>();
    set_logging_context(*early_logging_context);
    
    // Load system configuration (may call log_message during loading)
    OkxTrader::Config::SystemConfig initial_config;
    int config_load_result = load_system_config(initial_config, config_directory);
    if (config_load_result != 0) {
        SystemLogs::log_fatal_error(std::string("Config load failed with result: ") + std::to_string(config_load_result));
        throw std::runtime_error("System initialization failed: configuration loading failed");
    }
    
    try {
        initialization_result.system_state = std::make_unique<SystemState>(initial_config);
        initialization_result.system_state->logging_context = early_logging_context;
        
        // Run folder, log file and async logger
        initialization_result.logger = initialize_application_foundation(initialization_result.system_state->config);
        
        if (initial_config.logging.enable_bars_csv) {
            std::shared_ptr<CSVBarsLogger> bars_logger = initialize_csv_bars_logger("bars_logs");
            SystemLogs::log_csv_bars_logger_ready(bars_logger->get_file_path());
        }
    } catch (const std::exception& exception_error) {
        SystemLogs::log_fatal_error(std::string("System initialization exception: ") + exception_error.what());
        throw;
    }
    
    return initialization_result;
}

SystemModules create_trading_modules(SystemState& state) {
    SystemModules modules;
    const OkxTrader::Config::SystemConfig& config = state.config;

    // Execution side
    modules.execution_client = create_execution_client(state);
    modules.trading_coordinator = std::make_unique<OkxTrader::Core::TradingCoordinator>(
        *modules.execution_client, config.execution, config.stream.symbol);

    // Market data side
    modules.bar_aggregator = std::make_unique<OkxTrader::Core::BarAggregator>(config.stream.timeframe, config.strategy.max_bar_history);
    modules.signal_state_machine = std::make_unique<OkxTrader::Core::SignalStateMachine>(config.strategy, config.stream.timeframe);
    modules.market_data_coordinator = std::make_unique<OkxTrader::Core::MarketDataCoordinator>(
        config, state.event_distributor, *modules.bar_aggregator, *modules.signal_state_machine, state.market_activity);
    modules.market_stream = std::make_unique<OkxTrader::API::Okx::OkxMarketStream>(
        config.stream, *modules.market_data_coordinator, state.connectivity_manager);

    // Consumers subscribe in their constructors, before the stream thread exists
    modules.market_monitor_thread = std::make_unique<MarketMonitorThread>(
        config, state.event_distributor, state.market_activity, state.connectivity_manager);
    modules.trader_thread = std::make_unique<TraderThread>(
        config.timing, *modules.trading_coordinator, state.event_distributor, state.running);
    modules.market_stream_thread = std::make_unique<MarketStreamThread>(
        *modules.market_stream, state.mtx, state.cv, state.running, state.reconnect_exhausted);

    return modules;
}

SystemThreads startup(SystemState& system_state, std::shared_ptr<AsyncLogger> logger) {
    if (!logger) {
        throw std::runtime_error("System startup failed: Logger is required but not provided");
    }
    if (!system_state.logging_context) {
        throw std::runtime_error("Logging context not initialized - system must fail without context");
    }

    SystemThreads handles;

    // The logger goes first so startup output is drained while modules are built
    system_state.trading_modules = std::make_unique<SystemModules>();
    system_state.trading_modules->logging_thread = std::make_unique<LoggingThread>(logger, system_state.config);
    handles.logger_thread = start_system_thread("LoggingThread", system_state, *system_state.trading_modules->logging_thread);

    try {
        SystemModules created_modules = create_trading_modules(system_state);
        created_modules.logging_thread = std::move(system_state.trading_modules->logging_thread);
        *system_state.trading_modules = std::move(created_modules);
    } catch (const std::exception& exception_error) {
        SystemLogs::log_system_startup_error(exception_error.what());
        logger->stop();
        join_if_running(handles.logger_thread);
        throw;
    }

    SystemModules& modules = *system_state.trading_modules;
    SystemLogs::log_configuration_summary(system_state.config);

    // Leverage is applied once, before any signal can arrive
    modules.trading_coordinator->configure_leverage();

    handles.monitor_thread = start_system_thread("MarketMonitorThread", system_state, *modules.market_monitor_thread);
    handles.trader_thread = start_system_thread("TraderThread", system_state, *modules.trader_thread);
    handles.stream_thread = start_system_thread("MarketStreamThread", system_state, *modules.market_stream_thread);

    SystemLogs::log_startup_complete();
    return handles;
}

int run(SystemState& system_state) {
    std::unique_lock<std::mutex> state_lock(system_state.mtx);
    // Signal handlers only flip atomics, so the wait also polls
    while (system_state.running.load() && !system_state.shutdown_requested.load()) {
        system_state.cv.wait_for(state_lock, std::chrono::milliseconds(system_state.config.timing.event_wait_timeout_ms));
    }
    state_lock.unlock();

    if (system_state.reconnect_exhausted.load()) {
        SystemLogs::log_shutdown_requested("stream reconnect attempts exhausted");
        return EXIT_CODE_RECONNECT_EXHAUSTED;
    }
    if (system_state.shutdown_requested.load()) {
        SystemLogs::log_shutdown_requested("termination signal received");
        return EXIT_CODE_GRACEFUL;
    }
    SystemLogs::log_shutdown_requested("a system thread failed");
    return EXIT_CODE_INITIALIZATION_FAILURE;
}

void shutdown(SystemState& system_state, SystemThreads& thread_handles, std::shared_ptr<AsyncLogger> logger, int exit_code) {
    system_state.running.store(false);

    if (system_state.trading_modules && system_state.trading_modules->market_stream) {
        system_state.trading_modules->market_stream->stop();
    }

    // Closing the channels releases a stream thread blocked on a full lossless queue
    system_state.event_distributor.close_all();

    join_if_running(thread_handles.stream_thread);
    join_if_running(thread_handles.trader_thread);
    join_if_running(thread_handles.monitor_thread);

    LoggingContext* logging_context = get_logging_context();
    if (logging_context && logging_context->csv_bars_logger) {
        logging_context->csv_bars_logger->flush();
        SystemLogs::log_csv_bars_written(logging_context->csv_bars_logger->get_rows_written(),
                                         logging_context->csv_bars_logger->get_file_path());
    }

    SystemLogs::log_shutdown_complete(exit_code);

    if (logger) {
        shutdown_global_logger(*logger);
    }
    join_if_running(thread_handles.logger_thread);
}

} // namespace System
} // namespace OkxTrader
