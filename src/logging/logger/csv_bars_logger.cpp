#include "csv_bars_logger.hpp"
#include "utils/time_utils.hpp"
#include <filesystem>
#include <iomanip>
#include <stdexcept>
#include <system_error>
#include <cstdint>

namespace OkxTrader {
namespace Logging {

namespace {

const char* const BARS_CSV_HEADER = "open_time,open_time_ms,close_time_ms,symbol,timeframe,open,high,low,close,volume";

bool file_has_content(const std::filesystem::path& csv_path) {
    std::error_code size_error;
    std::uintmax_t file_size = std::filesystem::file_size(csv_path, size_error);
    return !size_error && file_size > 0;
}

} // anonymous namespace

CSVBarsLogger::CSVBarsLogger(const std::string& csv_file_path) : file_path(csv_file_path), rows_written(0) {
    std::filesystem::path csv_path(file_path);
    if (csv_path.has_parent_path()) {
        std::error_code create_error;
        std::filesystem::create_directories(csv_path.parent_path(), create_error);
        if (create_error) {
            throw std::runtime_error("Failed to create bars log directory: " + create_error.message());
        }
    }

    bool append_to_existing = file_has_content(csv_path);
    csv_stream.open(file_path, std::ios::out | std::ios::app);
    if (!csv_stream.is_open()) {
        throw std::runtime_error("Failed to open bars log file: " + file_path);
    }
    if (!append_to_existing) {
        csv_stream << BARS_CSV_HEADER << '\n';
        csv_stream.flush();
    }
}

void CSVBarsLogger::log_bar(const std::string& symbol, const std::string& timeframe, const Core::Bar& bar) {
    std::lock_guard<std::mutex> csv_lock(csv_mutex);
    csv_stream << TimeUtils::convert_milliseconds_to_human_readable(bar.open_time_ms) << ','
               << bar.open_time_ms << ','
               << bar.close_time_ms << ','
               << symbol << ','
               << timeframe << ','
               << std::fixed << std::setprecision(8)
               << bar.open_price << ','
               << bar.high_price << ','
               << bar.low_price << ','
               << bar.close_price << ','
               << bar.volume << '\n';
    if (!csv_stream) {
        throw std::runtime_error("Failed to write bar row to " + file_path);
    }
    ++rows_written;
}

void CSVBarsLogger::flush() {
    std::lock_guard<std::mutex> csv_lock(csv_mutex);
    csv_stream.flush();
}

unsigned long CSVBarsLogger::get_rows_written() const {
    std::lock_guard<std::mutex> csv_lock(csv_mutex);
    return rows_written;
}

} // namespace Logging
} // namespace OkxTrader
