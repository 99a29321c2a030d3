#include "async_logger.hpp"
#include "utils/time_utils.hpp"
#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace OkxTrader {
namespace Logging {

namespace {

thread_local LoggingContext* bound_logging_context = nullptr;

std::string pad_thread_tag(const std::string& tag_value) {
    std::string padded_tag = tag_value.substr(0, LOG_TAG_WIDTH);
    padded_tag.append(LOG_TAG_WIDTH - padded_tag.size(), ' ');
    return padded_tag;
}

std::string format_log_line(const std::string& thread_tag, const std::string& message) {
    std::ostringstream line_stream;
    line_stream << TimeUtils::get_current_human_readable_time() << " [" << thread_tag << "]   " << message << '\n';
    return line_stream.str();
}

// Short git revision of the working directory, "unknown" outside a checkout.
std::string read_git_revision() {
    FILE* git_pipe = popen("git rev-parse --short HEAD 2>/dev/null", "r");
    if (!git_pipe) {
        return "unknown";
    }

    std::string revision;
    char read_buffer[64];
    while (fgets(read_buffer, sizeof(read_buffer), git_pipe) != nullptr) {
        revision += read_buffer;
    }
    pclose(git_pipe);

    while (!revision.empty() && (revision.back() == '\n' || revision.back() == '\r')) {
        revision.pop_back();
    }
    return revision.empty() ? "unknown" : revision;
}

std::string current_run_stamp() {
    std::time_t now = std::time(nullptr);
    std::tm local_time;
    localtime_r(&now, &local_time);
    std::ostringstream stamp_stream;
    stamp_stream << std::put_time(&local_time, TimeUtils::LOG_FILENAME) << "_" << read_git_revision();
    return stamp_stream.str();
}

} // anonymous namespace

// ========================================================================
// AsyncLogger
// ========================================================================

AsyncLogger::AsyncLogger(const std::string& log_file_path)
    : file_path(log_file_path), running(true) {
    if (file_path.empty()) {
        throw std::runtime_error("AsyncLogger requires a log file path");
    }
}

void AsyncLogger::enqueue(std::string formatted_line) {
    {
        std::lock_guard<std::mutex> queue_lock(queue_mutex);
        pending_lines.push_back(std::move(formatted_line));
    }
    queue_cv.notify_one();
}

void AsyncLogger::stop() {
    {
        std::lock_guard<std::mutex> queue_lock(queue_mutex);
        running.store(false);
    }
    queue_cv.notify_all();
}

bool AsyncLogger::wait_and_drain(std::vector<std::string>& line_batch, int poll_interval_ms) {
    std::unique_lock<std::mutex> queue_lock(queue_mutex);
    queue_cv.wait_for(queue_lock, std::chrono::milliseconds(poll_interval_ms), [this]() {
        return !pending_lines.empty() || !running.load();
    });
    if (pending_lines.empty()) {
        return false;
    }
    line_batch.insert(line_batch.end(), std::make_move_iterator(pending_lines.begin()),
                      std::make_move_iterator(pending_lines.end()));
    pending_lines.clear();
    return true;
}

bool AsyncLogger::drain(std::vector<std::string>& line_batch) {
    std::lock_guard<std::mutex> queue_lock(queue_mutex);
    if (pending_lines.empty()) {
        return false;
    }
    line_batch.insert(line_batch.end(), std::make_move_iterator(pending_lines.begin()),
                      std::make_move_iterator(pending_lines.end()));
    pending_lines.clear();
    return true;
}

void AsyncLogger::write_batch(std::vector<std::string>& line_batch, std::ofstream& log_file, std::mutex& console_mutex) {
    {
        std::lock_guard<std::mutex> console_lock(console_mutex);
        for (const std::string& log_line : line_batch) {
            std::cout << log_line;
        }
        std::cout.flush();
    }

    if (log_file.is_open()) {
        for (const std::string& log_line : line_batch) {
            log_file << log_line;
        }
        log_file.flush();
    }

    line_batch.clear();
}

// ========================================================================
// LoggingContext
// ========================================================================

std::string LoggingContext::get_thread_tag() const {
    std::lock_guard<std::mutex> thread_tag_lock(thread_tag_mutex);
    auto tag_iterator = thread_tags.find(std::this_thread::get_id());
    if (tag_iterator == thread_tags.end()) {
        return pad_thread_tag("MAIN");
    }
    return tag_iterator->second;
}

void LoggingContext::set_thread_tag(const std::string& tag_value) {
    std::lock_guard<std::mutex> thread_tag_lock(thread_tag_mutex);
    thread_tags[std::this_thread::get_id()] = pad_thread_tag(tag_value);
}

// ========================================================================
// Free functions
// ========================================================================

void log_message(const std::string& message, const std::string& log_file_path) {
    LoggingContext* logging_context = bound_logging_context;
    if (!logging_context) {
        std::cerr << message << std::endl;
        return;
    }

    std::string log_line;
    try {
        log_line = format_log_line(logging_context->get_thread_tag(), message);
    } catch (const std::exception& format_error) {
        std::cerr << "CRITICAL ERROR: Failed to format log line: " << format_error.what() << '\n' << message << std::endl;
        return;
    }

    if (logging_context->async_logger) {
        logging_context->async_logger->enqueue(std::move(log_line));
        return;
    }

    {
        std::lock_guard<std::mutex> console_lock(logging_context->console_mutex);
        std::cout << log_line << std::flush;
    }

    if (!log_file_path.empty()) {
        std::ofstream direct_log_file(log_file_path, std::ios::app);
        if (!direct_log_file.is_open()) {
            std::cerr << "ERROR: Failed to open log file: " << log_file_path << std::endl;
            return;
        }
        direct_log_file << log_line;
    }
}

void set_log_thread_tag(const std::string& thread_tag_value) {
    get_logging_context()->set_thread_tag(thread_tag_value);
}

LoggingContext* get_logging_context() {
    if (!bound_logging_context) {
        throw std::runtime_error("Logging context not bound to the current thread");
    }
    return bound_logging_context;
}

void set_logging_context(LoggingContext& context) {
    bound_logging_context = &context;
}

std::string create_run_folder(const std::string& root_directory) {
    std::string run_folder = root_directory + "/run_" + current_run_stamp();

    std::error_code create_error;
    std::filesystem::create_directories(run_folder, create_error);
    if (create_error) {
        throw std::runtime_error("Failed to create run folder " + run_folder + ": " + create_error.message());
    }
    return run_folder;
}

std::string build_run_file_path(const std::string& run_folder, const std::string& file_name) {
    std::filesystem::path requested_path(file_name);
    std::string stem = requested_path.stem().string();
    std::string extension = requested_path.extension().string();
    if (stem.empty()) {
        throw std::runtime_error("Log file name has no stem: " + file_name);
    }
    return run_folder + "/" + stem + "_" + current_run_stamp() + extension;
}

std::shared_ptr<AsyncLogger> initialize_application_foundation(const OkxTrader::Config::SystemConfig& config) {
    LoggingContext* logging_context = get_logging_context();

    logging_context->run_folder = create_run_folder("runtime_logs");
    auto async_logger = std::make_shared<AsyncLogger>(build_run_file_path(logging_context->run_folder, config.logging.log_file));

    logging_context->async_logger = async_logger;
    set_log_thread_tag("MAIN");
    return async_logger;
}

std::shared_ptr<CSVBarsLogger> initialize_csv_bars_logger(const std::string& base_filename) {
    LoggingContext* logging_context = get_logging_context();
    if (logging_context->run_folder.empty()) {
        throw std::runtime_error("Run folder not created before the CSV bars logger");
    }

    auto bars_logger = std::make_shared<CSVBarsLogger>(build_run_file_path(logging_context->run_folder, base_filename + ".csv"));
    logging_context->csv_bars_logger = bars_logger;
    return bars_logger;
}

void shutdown_global_logger(AsyncLogger& logger) {
    logger.stop();
}

} // namespace Logging
} // namespace OkxTrader
