#include "signal_analysis_logs.hpp"
#include "logging/logger/async_logger.hpp"
#include "logging/logger/logging_macros.hpp"
#include <iomanip>
#include <sstream>

namespace OkxTrader {
namespace Logging {

namespace {

std::string format_value(double value) {
    std::ostringstream value_stream;
    value_stream << std::fixed << std::setprecision(4) << value;
    return value_stream.str();
}

} // anonymous namespace

void SignalAnalysisLogs::log_insufficient_history(size_t available_bars, size_t required_bars) {
    log_message("Warming up: " + std::to_string(available_bars) + "/" + std::to_string(required_bars) + " bars", "");
}

void SignalAnalysisLogs::log_ema_evaluation(double ema_short, double ema_long, Core::SignalAction action) {
    log_message("EMA short=" + format_value(ema_short) + " long=" + format_value(ema_long) +
                " -> " + Core::to_string(action), "");
}

void SignalAnalysisLogs::log_combined_evaluation(const Core::SupertrendSnapshot& supertrend, const Core::FractalTrendSnapshot& fractal,
                                                 const Core::BollingerBandsSnapshot& bands, Core::SignalAction action) {
    log_message("Supertrend=" + std::string(supertrend.trend > 0 ? "UP" : "DOWN") +
                " atr=" + format_value(supertrend.atr) +
                " fractal=" + Core::to_string(fractal.trend) +
                " bb=[" + format_value(bands.lower) + ", " + format_value(bands.middle) + ", " + format_value(bands.upper) + "]" +
                " -> " + Core::to_string(action), "");
}

void SignalAnalysisLogs::log_signal_emitted(const std::string& symbol, const Core::Signal& signal, Core::PositionBias new_bias) {
    LOG_THREAD_SIGNAL_ANALYSIS_HEADER(symbol);
    TABLE_HEADER_48("Signal", signal.strategy_tag + " " + signal.timeframe);
    TABLE_ROW_48("Action", Core::to_string(signal.action));
    TABLE_ROW_48("Price", format_value(signal.price));
    TABLE_ROW_48("Position Bias", Core::to_string(new_bias));
    for (const auto& indicator_entry : signal.supporting_indicators) {
        TABLE_ROW_48(indicator_entry.first, format_value(indicator_entry.second));
    }
    TABLE_FOOTER_48();
}

void SignalAnalysisLogs::log_duplicate_bar_dropped(long long open_time_ms, long long last_open_time_ms) {
    log_message("WARNING: Dropping bar " + std::to_string(open_time_ms) + " (last processed " +
                std::to_string(last_open_time_ms) + ")", "");
}

void SignalAnalysisLogs::log_signal_analysis_error(const std::string& error_message) {
    log_message("ERROR: Signal evaluation failed, no signal for this bar: " + error_message, "");
}

} // namespace Logging
} // namespace OkxTrader
