#ifndef SIGNAL_ANALYSIS_LOGS_HPP
#define SIGNAL_ANALYSIS_LOGS_HPP

#include "trader/data_structures/data_structures.hpp"
#include <string>
#include <cstddef>

namespace OkxTrader {
namespace Logging {

class SignalAnalysisLogs {
public:
    static void log_insufficient_history(size_t available_bars, size_t required_bars);
    static void log_ema_evaluation(double ema_short, double ema_long, Core::SignalAction action);
    static void log_combined_evaluation(const Core::SupertrendSnapshot& supertrend, const Core::FractalTrendSnapshot& fractal,
                                        const Core::BollingerBandsSnapshot& bands, Core::SignalAction action);
    static void log_signal_emitted(const std::string& symbol, const Core::Signal& signal, Core::PositionBias new_bias);
    static void log_duplicate_bar_dropped(long long open_time_ms, long long last_open_time_ms);
    static void log_signal_analysis_error(const std::string& error_message);
};

} // namespace Logging
} // namespace OkxTrader

#endif // SIGNAL_ANALYSIS_LOGS_HPP
