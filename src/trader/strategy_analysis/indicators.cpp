#include "indicators.hpp"
#include <algorithm>
#include <cmath>

namespace OkxTrader {
namespace Core {

bool calculate_sma(const std::deque<double>& series, int length, double& sma_value) {
    if (length <= 0 || static_cast<int>(series.size()) < length) {
        return false;
    }

    double window_sum = 0.0;
    for (size_t value_index = series.size() - static_cast<size_t>(length); value_index < series.size(); ++value_index) {
        window_sum += series[value_index];
    }
    sma_value = window_sum / length;
    return true;
}

bool calculate_std_dev(const std::deque<double>& series, int length, double& std_dev_value) {
    double mean_value = 0.0;
    if (!calculate_sma(series, length, mean_value)) {
        return false;
    }

    double squared_deviation_sum = 0.0;
    for (size_t value_index = series.size() - static_cast<size_t>(length); value_index < series.size(); ++value_index) {
        double deviation_value = series[value_index] - mean_value;
        squared_deviation_sum += deviation_value * deviation_value;
    }
    // Population standard deviation
    std_dev_value = std::sqrt(squared_deviation_sum / length);
    return true;
}

bool calculate_ema(const std::deque<double>& series, int length, double& ema_value, int excluded_trailing) {
    if (length <= 0 || excluded_trailing < 0) {
        return false;
    }
    if (static_cast<int>(series.size()) - excluded_trailing < length) {
        return false;
    }

    size_t effective_size = series.size() - static_cast<size_t>(excluded_trailing);
    double smoothing_factor = 2.0 / (length + 1.0);

    double running_ema = 0.0;
    for (int seed_index = 0; seed_index < length; ++seed_index) {
        running_ema += series[static_cast<size_t>(seed_index)];
    }
    running_ema /= length;

    for (size_t value_index = static_cast<size_t>(length); value_index < effective_size; ++value_index) {
        running_ema = series[value_index] * smoothing_factor + running_ema * (1.0 - smoothing_factor);
    }

    ema_value = running_ema;
    return true;
}

bool calculate_bollinger_bands(const std::deque<double>& series, int length, double deviation, BollingerBandsSnapshot& bands) {
    double middle_value = 0.0;
    double std_dev_value = 0.0;
    if (!calculate_sma(series, length, middle_value) || !calculate_std_dev(series, length, std_dev_value)) {
        return false;
    }

    bands.middle = middle_value;
    bands.upper = middle_value + deviation * std_dev_value;
    bands.lower = middle_value - deviation * std_dev_value;
    return true;
}

bool calculate_atr(const std::deque<Bar>& bars, int period, double& atr_value) {
    if (period <= 0 || static_cast<int>(bars.size()) < period + 1) {
        return false;
    }

    double true_range_sum = 0.0;
    for (size_t bar_index = bars.size() - static_cast<size_t>(period); bar_index < bars.size(); ++bar_index) {
        const Bar& current_bar = bars[bar_index];
        double previous_close = bars[bar_index - 1].close_price;
        double true_range_value = std::max({current_bar.high_price - current_bar.low_price,
                                            std::abs(current_bar.high_price - previous_close),
                                            std::abs(current_bar.low_price - previous_close)});
        true_range_sum += true_range_value;
    }

    atr_value = true_range_sum / period;
    return true;
}

bool calculate_supertrend(const std::deque<Bar>& bars, int period, double multiplier, int previous_trend,
                          SupertrendSnapshot& supertrend) {
    double atr_value = 0.0;
    if (!calculate_atr(bars, period, atr_value)) {
        return false;
    }

    const Bar& last_bar = bars.back();
    double hl2_value = (last_bar.high_price + last_bar.low_price) / 2.0;
    double upper_band_value = hl2_value + multiplier * atr_value;
    double lower_band_value = hl2_value - multiplier * atr_value;

    int trend_value = previous_trend;
    if (last_bar.close_price > upper_band_value) {
        trend_value = 1;
    } else if (last_bar.close_price < lower_band_value) {
        trend_value = -1;
    }

    supertrend.trend = trend_value;
    supertrend.atr = atr_value;
    supertrend.upper_band = upper_band_value;
    supertrend.lower_band = lower_band_value;
    return true;
}

bool calculate_fractal_trend_signal(const std::deque<Bar>& bars, int fractal_period, const BollingerBandsSnapshot& bands,
                                    FractalTrendSnapshot& fractal_signal) {
    if (fractal_period < 3 || static_cast<int>(bars.size()) < fractal_period) {
        return false;
    }

    size_t window_start = bars.size() - static_cast<size_t>(fractal_period);
    size_t center_index = window_start + static_cast<size_t>(fractal_period / 2);
    const Bar& center_bar = bars[center_index];

    bool is_high_fractal = true;
    bool is_low_fractal = true;
    for (size_t bar_index = window_start; bar_index < bars.size(); ++bar_index) {
        if (bar_index == center_index) {
            continue;
        }
        if (bars[bar_index].high_price >= center_bar.high_price) {
            is_high_fractal = false;
        }
        if (bars[bar_index].low_price <= center_bar.low_price) {
            is_low_fractal = false;
        }
    }

    double close_value = bars.back().close_price;

    FractalTrend bullish_trend = FractalTrend::NEUTRAL;
    if (is_low_fractal && close_value > center_bar.low_price && close_value > bands.lower) {
        bullish_trend = close_value >= bands.middle ? FractalTrend::STRONGLY_BULLISH : FractalTrend::BULLISH;
    }

    FractalTrend bearish_trend = FractalTrend::NEUTRAL;
    if (is_high_fractal && close_value < center_bar.high_price && close_value < bands.upper) {
        bearish_trend = close_value <= bands.middle ? FractalTrend::STRONGLY_BEARISH : FractalTrend::BEARISH;
    }

    FractalTrend resolved_trend = FractalTrend::NEUTRAL;
    if (bullish_trend != FractalTrend::NEUTRAL && bearish_trend != FractalTrend::NEUTRAL) {
        resolved_trend = close_value >= bands.middle ? bullish_trend : bearish_trend;
    } else if (bullish_trend != FractalTrend::NEUTRAL) {
        resolved_trend = bullish_trend;
    } else {
        resolved_trend = bearish_trend;
    }

    fractal_signal.is_high_fractal = is_high_fractal;
    fractal_signal.is_low_fractal = is_low_fractal;
    fractal_signal.fractal_high = center_bar.high_price;
    fractal_signal.fractal_low = center_bar.low_price;
    fractal_signal.trend = resolved_trend;
    fractal_signal.buy_signal = is_bullish(resolved_trend);
    fractal_signal.sell_signal = is_bearish(resolved_trend);
    return true;
}

bool SupertrendTracker::update(const std::deque<Bar>& bars, int period, double multiplier, SupertrendSnapshot& supertrend) {
    if (!calculate_supertrend(bars, period, multiplier, previous_trend, supertrend)) {
        return false;
    }
    previous_trend = supertrend.trend;
    return true;
}

} // namespace Core
} // namespace OkxTrader
