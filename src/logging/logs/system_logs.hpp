#ifndef SYSTEM_LOGS_HPP
#define SYSTEM_LOGS_HPP

#include "configs/system_config.hpp"
#include <string>

/**
 * Specialized logging for system management operations.
 * Handles all system-level logging in a consistent format.
 */
class SystemLogs {
public:
    // System startup and shutdown
    static void log_configuration_summary(const OkxTrader::Config::SystemConfig& config);
    static void log_system_startup_error(const std::string& error_message);
    static void log_fatal_error(const std::string& error_message);
    static void log_csv_bars_logger_ready(const std::string& csv_file_path);
    static void log_csv_bars_written(unsigned long rows_written, const std::string& csv_file_path);
    static void log_startup_complete();
    static void log_shutdown_requested(const std::string& reason);
    static void log_shutdown_complete(int exit_code);

    // Thread management
    static void log_thread_started(const std::string& thread_name);
    static void log_thread_exited(const std::string& thread_name);
    static void log_thread_exception(const std::string& thread_name, const std::string& error_message);
};

#endif // SYSTEM_LOGS_HPP
