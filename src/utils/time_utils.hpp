#ifndef TIME_UTILS_HPP
#define TIME_UTILS_HPP

#include <string>
#include <chrono>
#include <sstream>
#include <iomanip>

namespace TimeUtils {

// Time conversion constants
constexpr long long MILLISECONDS_PER_SECOND = 1000;
constexpr long long SECONDS_PER_MINUTE = 60;
constexpr long long MINUTES_PER_HOUR = 60;
constexpr long long HOURS_PER_DAY = 24;
constexpr long long MILLISECONDS_PER_MINUTE = MILLISECONDS_PER_SECOND * SECONDS_PER_MINUTE;
constexpr long long MILLISECONDS_PER_HOUR = MILLISECONDS_PER_MINUTE * MINUTES_PER_HOUR;
constexpr long long MILLISECONDS_PER_DAY = MILLISECONDS_PER_HOUR * HOURS_PER_DAY;

// Time format constants
constexpr const char* ISO_8601_WITHOUT_Z = "%Y-%m-%dT%H:%M:%S";
constexpr const char* HUMAN_READABLE = "%Y-%m-%d %H:%M:%S";
constexpr const char* LOG_FILENAME = "%d-%H-%M";

// Common time utility functions
std::string get_current_human_readable_time();
std::string get_current_iso_time_with_milliseconds();
long long get_current_epoch_milliseconds();

// Timestamp conversion functions
std::string convert_milliseconds_to_human_readable(long long milliseconds_timestamp);

// Timeframe helpers ("30m", "1h", "1d")
long long parse_timeframe_to_milliseconds(const std::string& timeframe);
long long align_to_timeframe(long long timestamp_ms, long long timeframe_ms);
std::string timeframe_to_okx_bar_label(const std::string& timeframe);

} // namespace TimeUtils

#endif // TIME_UTILS_HPP
