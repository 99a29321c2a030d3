/**
 * Trader thread.
 * Consumes signals and hands them to the TradingCoordinator.
 */
#include "trader_thread.hpp"
#include "logging/logger/async_logger.hpp"
#include "logging/logs/trading_logs.hpp"
#include "utils/time_utils.hpp"
#include <chrono>

using namespace OkxTrader::Threads;
using namespace OkxTrader::Logging;

// ========================================================================
// THREAD LIFECYCLE MANAGEMENT
// ========================================================================

void TraderThread::operator()() {
    set_log_thread_tag("TRADER");
    execute_signal_loop();
}

void TraderThread::execute_signal_loop() {
    const std::chrono::milliseconds wait_timeout(timing.event_wait_timeout_ms);

    while (true) {
        OkxTrader::Core::Signal signal;
        if (!signal_subscription->wait_and_pop(signal, wait_timeout)) {
            if (signal_subscription->is_closed()) {
                break;
            }
            continue;
        }

        if (!running.load()) {
            TradingLogs::log_signal_skipped(OkxTrader::Core::to_string(signal.action), "shutdown in progress");
            continue;
        }

        try {
            trading_coordinator.handle_signal(signal, TimeUtils::get_current_epoch_milliseconds());
            signals_handled.fetch_add(1);
        } catch (const std::exception& exception_error) {
            TradingLogs::log_execution_error("Signal handling failed: " + std::string(exception_error.what()));
        }
    }
}
