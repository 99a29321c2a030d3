#include "time_utils.hpp"
#include <cctype>
#include <ctime>
#include <regex>
#include <stdexcept>

namespace TimeUtils {

std::string get_current_human_readable_time() {
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);
    std::stringstream ss;

    // Use thread-safe localtime_r instead of localtime
    struct tm timeinfo;
    localtime_r(&in_time_t, &timeinfo);
    ss << std::put_time(&timeinfo, HUMAN_READABLE);
    return ss.str();
}

std::string get_current_iso_time_with_milliseconds() {
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);
    auto milliseconds_part = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % MILLISECONDS_PER_SECOND;

    struct tm timeinfo;
    gmtime_r(&in_time_t, &timeinfo);
    std::stringstream ss;
    ss << std::put_time(&timeinfo, ISO_8601_WITHOUT_Z) << "." << std::setw(3) << std::setfill('0') << milliseconds_part << "Z";
    return ss.str();
}

long long get_current_epoch_milliseconds() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string convert_milliseconds_to_human_readable(long long milliseconds_timestamp) {
    time_t timestamp_seconds = static_cast<time_t>(milliseconds_timestamp / MILLISECONDS_PER_SECOND);

    struct tm timeinfo;
    localtime_r(&timestamp_seconds, &timeinfo);

    std::stringstream ss;
    ss << std::put_time(&timeinfo, HUMAN_READABLE);
    return ss.str();
}

long long parse_timeframe_to_milliseconds(const std::string& timeframe) {
    // Upper-case M is OKX's monthly bar and is not accepted. At most nine
    // digits keeps amount * MILLISECONDS_PER_DAY within a long long.
    static const std::regex timeframe_pattern("^([0-9]{1,9})([mhHdD])$");
    std::smatch timeframe_match;
    if (!std::regex_match(timeframe, timeframe_match, timeframe_pattern)) {
        throw std::invalid_argument("Invalid timeframe '" + timeframe + "' (expected <n>m, <n>h or <n>d)");
    }

    long long amount = std::stoll(timeframe_match[1].str());
    if (amount <= 0) {
        throw std::invalid_argument("Timeframe amount must be positive: '" + timeframe + "'");
    }

    char unit = static_cast<char>(std::tolower(static_cast<unsigned char>(timeframe_match[2].str()[0])));
    switch (unit) {
        case 'm': return amount * MILLISECONDS_PER_MINUTE;
        case 'h': return amount * MILLISECONDS_PER_HOUR;
        case 'd': return amount * MILLISECONDS_PER_DAY;
    }
    throw std::invalid_argument("Invalid timeframe unit in '" + timeframe + "'");
}

long long align_to_timeframe(long long timestamp_ms, long long timeframe_ms) {
    if (timeframe_ms <= 0) {
        throw std::invalid_argument("Timeframe duration must be positive");
    }
    long long remainder = timestamp_ms % timeframe_ms;
    if (remainder < 0) {
        remainder += timeframe_ms;
    }
    return timestamp_ms - remainder;
}

// OKX labels hour and day bars in upper case (1H, 4H, 1D) and minute bars in lower case (30m).
std::string timeframe_to_okx_bar_label(const std::string& timeframe) {
    parse_timeframe_to_milliseconds(timeframe);
    std::string amount_string = timeframe.substr(0, timeframe.size() - 1);
    char unit = static_cast<char>(std::tolower(static_cast<unsigned char>(timeframe.back())));
    if (unit == 'm') {
        return amount_string + "m";
    }
    return amount_string + static_cast<char>(std::toupper(static_cast<unsigned char>(unit)));
}

} // namespace TimeUtils
