#ifndef LOGGING_MACROS_HPP
#define LOGGING_MACROS_HPP

#include "async_logger.hpp"
#include <string>

namespace OkxTrader {
namespace Logging {

constexpr size_t TABLE_LABEL_WIDTH = 17;
constexpr size_t TABLE_VALUE_WIDTH = 48;

// Truncates or right-pads text to exactly width characters.
inline std::string fit_table_cell(const std::string& text, size_t width) {
    std::string cell = text.substr(0, width);
    cell.append(width - cell.size(), ' ');
    return cell;
}

inline std::string format_table_row(const std::string& label, const std::string& value) {
    return "│ " + fit_table_cell(label, TABLE_LABEL_WIDTH) + " │ " + fit_table_cell(value, TABLE_VALUE_WIDTH) + " │";
}

} // namespace Logging
} // namespace OkxTrader

// Startup banner (top level, no indentation)
#define LOG_STARTUP_SECTION_HEADER(title) log_message("+-- " + std::string(title), "")
#define LOG_STARTUP_CONTENT(msg) log_message("|   " + std::string(msg), "")
#define LOG_STARTUP_SEPARATOR() log_message("|", "")

// Sections emitted by worker threads
#define LOG_THREAD_SECTION_HEADER(title) log_message("+-- " + std::string(title), "")
#define LOG_THREAD_CONTENT(msg) log_message("|   " + std::string(msg), "")
#define LOG_THREAD_SIGNAL_ANALYSIS_HEADER(symbol) LOG_THREAD_SECTION_HEADER("SIGNAL - " + std::string(symbol))
#define LOG_THREAD_ORDER_EXECUTION_HEADER() LOG_THREAD_SECTION_HEADER("ORDER EXECUTION")

// Two-column box tables: 17-char label, 48-char value
#define TABLE_HEADER_48(title, subtitle) do { \
    LOG_THREAD_CONTENT("┌───────────────────┬──────────────────────────────────────────────────┐"); \
    LOG_THREAD_CONTENT(OkxTrader::Logging::format_table_row(title, subtitle)); \
    LOG_THREAD_CONTENT("├───────────────────┼──────────────────────────────────────────────────┤"); \
} while (0)

#define TABLE_ROW_48(label, value) LOG_THREAD_CONTENT(OkxTrader::Logging::format_table_row(label, value))

#define TABLE_FOOTER_48() LOG_THREAD_CONTENT("└───────────────────┴──────────────────────────────────────────────────┘")

#endif // LOGGING_MACROS_HPP
