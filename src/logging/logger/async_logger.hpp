#ifndef ASYNC_LOGGER_HPP
#define ASYNC_LOGGER_HPP

#include "configs/system_config.hpp"
#include "csv_bars_logger.hpp"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace OkxTrader {
namespace Logging {

// Width of the "[TAG   ]" column in every log line.
constexpr size_t LOG_TAG_WIDTH = 6;

/**
 * Queue between the producing threads and the LOGGER thread.
 * Producers only format and enqueue; the LOGGER thread owns the file handle
 * and does all console and disk I/O.
 */
class AsyncLogger {
public:
    explicit AsyncLogger(const std::string& log_file_path);

    AsyncLogger(const AsyncLogger&) = delete;
    AsyncLogger& operator=(const AsyncLogger&) = delete;

    void enqueue(std::string formatted_line);

    // Wakes the LOGGER thread; lines enqueued afterwards are still accepted
    // and picked up by the final drain.
    void stop();
    bool is_running() const { return running.load(); }

    // Waits up to poll_interval_ms for the first line, then moves every queued
    // line into line_batch. Returns false when nothing was collected.
    bool wait_and_drain(std::vector<std::string>& line_batch, int poll_interval_ms);

    // Non-blocking variant used for the final drain at shutdown.
    bool drain(std::vector<std::string>& line_batch);

    // Writes the batch to stdout and to log_file (when open), then clears it.
    void write_batch(std::vector<std::string>& line_batch, std::ofstream& log_file, std::mutex& console_mutex);

    const std::string& get_file_path() const { return file_path; }

private:
    const std::string file_path;

    std::mutex queue_mutex;
    std::condition_variable queue_cv;
    std::deque<std::string> pending_lines;
    std::atomic<bool> running;
};

/**
 * Per-process logging state shared by every thread.
 * Each thread binds it once with set_logging_context() and registers its tag.
 */
struct LoggingContext {
    std::shared_ptr<AsyncLogger> async_logger;
    std::shared_ptr<CSVBarsLogger> csv_bars_logger;
    std::mutex console_mutex;
    std::string run_folder;

    std::string get_thread_tag() const;
    void set_thread_tag(const std::string& tag_value);

private:
    mutable std::mutex thread_tag_mutex;
    std::unordered_map<std::thread::id, std::string> thread_tags;
};

// Formats "<time> [<tag>]   <message>" and hands it to the async logger, or
// writes it straight to the console when no logger is attached yet.
// Threads with no bound context fall back to stderr.
void log_message(const std::string& message, const std::string& log_file_path);

void set_log_thread_tag(const std::string& thread_tag_value);

// Throws std::runtime_error when the calling thread has no bound context.
LoggingContext* get_logging_context();
void set_logging_context(LoggingContext& context);

// runtime_logs/run_<DD-HH-MM>_<revision>
std::string create_run_folder(const std::string& root_directory);

// <run_folder>/<stem>_<DD-HH-MM>_<revision><extension>
std::string build_run_file_path(const std::string& run_folder, const std::string& file_name);

// Creates the run folder and the async logger and attaches both to the
// calling thread's context.
std::shared_ptr<AsyncLogger> initialize_application_foundation(const OkxTrader::Config::SystemConfig& config);
std::shared_ptr<CSVBarsLogger> initialize_csv_bars_logger(const std::string& base_filename);
void shutdown_global_logger(AsyncLogger& logger);

} // namespace Logging
} // namespace OkxTrader

#endif // ASYNC_LOGGER_HPP
