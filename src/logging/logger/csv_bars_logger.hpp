#ifndef CSV_BARS_LOGGER_HPP
#define CSV_BARS_LOGGER_HPP

#include "trader/data_structures/data_structures.hpp"
#include <fstream>
#include <mutex>
#include <string>

namespace OkxTrader {
namespace Logging {

/**
 * Appends completed bars to runtime_logs/run_<stamp>/bars_logs_<stamp>.csv.
 * Written from the MONITOR thread; flushed once more at shutdown.
 */
class CSVBarsLogger {
public:
    // Throws std::runtime_error when the file cannot be opened.
    explicit CSVBarsLogger(const std::string& csv_file_path);

    CSVBarsLogger(const CSVBarsLogger&) = delete;
    CSVBarsLogger& operator=(const CSVBarsLogger&) = delete;

    void log_bar(const std::string& symbol, const std::string& timeframe, const Core::Bar& bar);
    void flush();

    const std::string& get_file_path() const { return file_path; }
    unsigned long get_rows_written() const;

private:
    const std::string file_path;
    std::ofstream csv_stream;
    mutable std::mutex csv_mutex;
    unsigned long rows_written;
};

} // namespace Logging
} // namespace OkxTrader

#endif // CSV_BARS_LOGGER_HPP
