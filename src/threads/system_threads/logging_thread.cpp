/**
 * Logging thread.
 * Drains the async logger queue to the console and the run log file.
 */
#include "logging_thread.hpp"
#include "logging/logger/async_logger.hpp"
#include "logging/logs/system_logs.hpp"
#include <fstream>
#include <iostream>
#include <mutex>
#include <vector>

using namespace OkxTrader::Threads;
using namespace OkxTrader::Logging;

// ========================================================================
// THREAD LIFECYCLE MANAGEMENT
// ========================================================================

void LoggingThread::operator()() {
    set_log_thread_tag("LOGGER");
    execute_logging_processing_loop();
}

void LoggingThread::execute_logging_processing_loop() {
    std::ofstream log_file(logger_ptr->get_file_path(), std::ios::app);
    if (!log_file.is_open()) {
        std::cerr << "WARNING: Cannot open log file " << logger_ptr->get_file_path() << ", console only" << std::endl;
    }

    std::mutex& console_mutex = get_logging_context()->console_mutex;
    std::vector<std::string> line_batch;

    while (logger_ptr->is_running()) {
        try {
            // Bounded wait so stop() is noticed within one poll interval
            if (logger_ptr->wait_and_drain(line_batch, config.timing.thread_logging_poll_interval_ms)) {
                logger_ptr->write_batch(line_batch, log_file, console_mutex);
            }
        } catch (const std::exception& exception) {
            std::cerr << "ERROR: Logging loop iteration failed: " << exception.what() << std::endl;
            line_batch.clear();
        }
    }

    // Lines enqueued by other threads while they shut down
    if (logger_ptr->drain(line_batch)) {
        logger_ptr->write_batch(line_batch, log_file, console_mutex);
    }
}
