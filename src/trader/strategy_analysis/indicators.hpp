#ifndef INDICATORS_HPP
#define INDICATORS_HPP

#include <deque>
#include "trader/data_structures/data_structures.hpp"

namespace OkxTrader {
namespace Core {

// All calculations return false when the series is shorter than required
// or a length parameter is not positive. Outputs are untouched in that case.

bool calculate_sma(const std::deque<double>& series, int length, double& sma_value);
bool calculate_std_dev(const std::deque<double>& series, int length, double& std_dev_value);

// Seeded with the SMA of the first `length` values, then folded forward.
// `excluded_trailing` drops that many values from the end (EMA as of an earlier bar).
bool calculate_ema(const std::deque<double>& series, int length, double& ema_value, int excluded_trailing = 0);

bool calculate_bollinger_bands(const std::deque<double>& series, int length, double deviation, BollingerBandsSnapshot& bands);

// Mean true range over the last `period` bars; needs period + 1 bars.
bool calculate_atr(const std::deque<Bar>& bars, int period, double& atr_value);

bool calculate_supertrend(const std::deque<Bar>& bars, int period, double multiplier, int previous_trend,
                          SupertrendSnapshot& supertrend);

bool calculate_fractal_trend_signal(const std::deque<Bar>& bars, int fractal_period, const BollingerBandsSnapshot& bands,
                                    FractalTrendSnapshot& fractal_signal);

/**
 * Carries the Supertrend direction from one completed bar to the next.
 * Starts in the up direction.
 */
class SupertrendTracker {
public:
    SupertrendTracker() : previous_trend(1) {}

    bool update(const std::deque<Bar>& bars, int period, double multiplier, SupertrendSnapshot& supertrend);
    int get_previous_trend() const { return previous_trend; }
    void reset() { previous_trend = 1; }

private:
    int previous_trend;
};

} // namespace Core
} // namespace OkxTrader

#endif // INDICATORS_HPP
