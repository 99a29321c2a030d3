#include "system_logs.hpp"
#include "logging/logger/async_logger.hpp"
#include "logging/logger/logging_macros.hpp"
#include <sstream>

using OkxTrader::Logging::log_message;

void SystemLogs::log_configuration_summary(const OkxTrader::Config::SystemConfig& config) {
    LOG_STARTUP_SECTION_HEADER("OKX SIGNAL TRADER");
    LOG_STARTUP_CONTENT("Symbol:      " + config.stream.symbol);
    LOG_STARTUP_CONTENT("Timeframe:   " + config.stream.timeframe + " (bars from " + config.stream.bar_source + ")");
    LOG_STARTUP_CONTENT("Endpoint:    " + config.stream.websocket_url);
    LOG_STARTUP_CONTENT("Strategy:    " + config.strategy.strategy_type);
    LOG_STARTUP_CONTENT("Execution:   " + config.execution.mode + (config.execution.simulated_trading ? " (simulated account)" : ""));
    std::ostringstream backoff_stream;
    backoff_stream << "Reconnect:   " << config.stream.max_reconnect_attempts << " attempts, "
                   << config.stream.initial_reconnect_delay_ms << "ms x" << config.stream.reconnect_multiplier;
    LOG_STARTUP_CONTENT(backoff_stream.str());
    LOG_STARTUP_SEPARATOR();
}

void SystemLogs::log_system_startup_error(const std::string& error_message) {
    log_message(std::string("ERROR: System startup error: ") + error_message, "");
}

void SystemLogs::log_fatal_error(const std::string& error_message) {
    log_message(std::string("FATAL: ") + error_message, "");
}

void SystemLogs::log_csv_bars_logger_ready(const std::string& csv_file_path) {
    log_message("Completed bars will be written to " + csv_file_path, "");
}

void SystemLogs::log_csv_bars_written(unsigned long rows_written, const std::string& csv_file_path) {
    log_message(std::to_string(rows_written) + " completed bars written to " + csv_file_path, "");
}

void SystemLogs::log_startup_complete() {
    log_message("SYSTEM_STARTUP: System startup completed successfully", "");
}

void SystemLogs::log_shutdown_requested(const std::string& reason) {
    log_message("SYSTEM_SHUTDOWN: Shutdown requested - " + reason, "");
}

void SystemLogs::log_shutdown_complete(int exit_code) {
    log_message("SYSTEM_SHUTDOWN: All threads joined, exit code " + std::to_string(exit_code), "");
}

void SystemLogs::log_thread_started(const std::string& thread_name) {
    log_message(thread_name + " thread started", "");
}

void SystemLogs::log_thread_exited(const std::string& thread_name) {
    log_message(thread_name + " thread exited", "");
}

void SystemLogs::log_thread_exception(const std::string& thread_name, const std::string& error_message) {
    log_message("ERROR: " + thread_name + " thread exception: " + error_message, "");
}
