#include "signal_state_machine.hpp"
#include "logging/logs/signal_analysis_logs.hpp"
#include <algorithm>
#include <stdexcept>

using OkxTrader::Logging::SignalAnalysisLogs;

namespace OkxTrader {
namespace Core {

StrategyType parse_strategy_type(const std::string& strategy_name) {
    if (strategy_name == "EMA") {
        return StrategyType::EMA;
    }
    if (strategy_name == "COMBINED") {
        return StrategyType::COMBINED;
    }
    throw std::invalid_argument("Unknown strategy type '" + strategy_name + "' (expected EMA or COMBINED)");
}

std::string to_string(StrategyType strategy_type) {
    switch (strategy_type) {
        case StrategyType::EMA: return "EMA";
        case StrategyType::COMBINED: return "COMBINED";
    }
    return "UNKNOWN";
}

size_t required_history_for_strategy(const StrategyConfig& config) {
    if (parse_strategy_type(config.strategy_type) == StrategyType::EMA) {
        return static_cast<size_t>(config.ema_long_period) + 1;
    }
    int longest_lookback = std::max(config.supertrend_period + 1, std::max(config.fractal_period, config.bb_length));
    return static_cast<size_t>(longest_lookback);
}

StrategyDecision decide_combined_action(PositionBias current_bias, int supertrend_trend, FractalTrend fractal_trend) {
    StrategyDecision decision;
    decision.next_bias = current_bias;

    bool fractal_bullish = is_bullish(fractal_trend);
    bool fractal_bearish = is_bearish(fractal_trend);

    // Exits take precedence over entries
    if (current_bias == PositionBias::LONG && fractal_bearish) {
        decision.action = SignalAction::SELL;
        decision.next_bias = PositionBias::FLAT;
    } else if (current_bias == PositionBias::SHORT && fractal_bullish) {
        decision.action = SignalAction::BUY;
        decision.next_bias = PositionBias::FLAT;
    } else if (supertrend_trend == 1 && fractal_bullish && current_bias != PositionBias::LONG) {
        decision.action = SignalAction::BUY;
        decision.next_bias = PositionBias::LONG;
    } else if (supertrend_trend == -1 && fractal_bearish && current_bias != PositionBias::SHORT) {
        decision.action = SignalAction::SELL;
        decision.next_bias = PositionBias::SHORT;
    } else {
        decision.action = SignalAction::HOLD;
    }
    return decision;
}

StrategyDecision decide_ema_action(PositionBias current_bias, double ema_short, double ema_long) {
    StrategyDecision decision;
    decision.next_bias = current_bias;
    if (ema_short > ema_long) {
        decision.action = SignalAction::BUY;
        decision.next_bias = PositionBias::LONG;
    } else if (ema_short < ema_long) {
        decision.action = SignalAction::SELL;
        decision.next_bias = PositionBias::SHORT;
    } else if (current_bias == PositionBias::LONG) {
        // Touching averages are not a crossover: the current regime stands
        decision.action = SignalAction::BUY;
    } else if (current_bias == PositionBias::SHORT) {
        decision.action = SignalAction::SELL;
    } else {
        decision.action = SignalAction::HOLD;
    }
    return decision;
}

SignalStateMachine::SignalStateMachine(const StrategyConfig& strategy_config, const std::string& timeframe)
    : config(strategy_config),
      timeframe_label(timeframe),
      strategy_type(parse_strategy_type(strategy_config.strategy_type)),
      required_history(required_history_for_strategy(strategy_config)),
      state(strategy_config.max_price_history, strategy_config.max_bar_history) {}

bool SignalStateMachine::on_bar_completed(const Bar& bar, Signal& signal) {
    if (state.any_bar_processed && bar.open_time_ms <= state.last_processed_open_time_ms) {
        SignalAnalysisLogs::log_duplicate_bar_dropped(bar.open_time_ms, state.last_processed_open_time_ms);
        return false;
    }

    try {
        state.close_prices.push(bar.close_price);
        state.bars.push(bar);
        state.last_processed_open_time_ms = bar.open_time_ms;
        state.any_bar_processed = true;

        size_t available_history = strategy_type == StrategyType::EMA ? state.close_prices.size() : state.bars.size();
        if (available_history < required_history) {
            SignalAnalysisLogs::log_insufficient_history(available_history, required_history);
            return false;
        }

        StrategyDecision decision;
        decision.next_bias = state.position_bias;
        bool evaluated = strategy_type == StrategyType::EMA ? evaluate_ema(decision) : evaluate_combined(decision);
        if (!evaluated || decision.action == state.last_emitted_action) {
            return false;
        }

        signal = Signal();
        signal.action = decision.action;
        signal.price = bar.close_price;
        signal.timestamp_ms = bar.close_time_ms;
        signal.strategy_tag = to_string(strategy_type);
        signal.timeframe = timeframe_label;
        signal.bar = bar;
        signal.supporting_indicators = decision.indicators;

        state.last_emitted_action = decision.action;
        state.position_bias = decision.next_bias;
        return true;
    } catch (const std::exception& evaluation_error) {
        SignalAnalysisLogs::log_signal_analysis_error(evaluation_error.what());
        return false;
    }
}

bool SignalStateMachine::evaluate_ema(StrategyDecision& decision) {
    const std::deque<double>& closes = state.close_prices.values();

    double ema_short = 0.0;
    double ema_long = 0.0;
    double previous_ema_short = 0.0;
    double previous_ema_long = 0.0;
    if (!calculate_ema(closes, config.ema_short_period, ema_short) ||
        !calculate_ema(closes, config.ema_long_period, ema_long) ||
        !calculate_ema(closes, config.ema_short_period, previous_ema_short, 1) ||
        !calculate_ema(closes, config.ema_long_period, previous_ema_long, 1)) {
        return false;
    }

    std::map<std::string, double> indicators;
    indicators["ema_short"] = ema_short;
    indicators["ema_long"] = ema_long;
    indicators["ema_short_previous"] = previous_ema_short;
    indicators["ema_long_previous"] = previous_ema_long;

    decision = decide_ema_action(state.position_bias, ema_short, ema_long);
    decision.indicators = indicators;

    SignalAnalysisLogs::log_ema_evaluation(ema_short, ema_long, decision.action);
    return true;
}

bool SignalStateMachine::evaluate_combined(StrategyDecision& decision) {
    const std::deque<Bar>& bars = state.bars.values();

    SupertrendSnapshot supertrend;
    if (!state.supertrend_tracker.update(bars, config.supertrend_period, config.supertrend_multiplier, supertrend)) {
        return false;
    }

    BollingerBandsSnapshot bands;
    if (!calculate_bollinger_bands(state.close_prices.values(), config.bb_length, config.bb_deviation, bands)) {
        return false;
    }

    FractalTrendSnapshot fractal;
    if (!calculate_fractal_trend_signal(bars, config.fractal_period, bands, fractal)) {
        return false;
    }

    decision = decide_combined_action(state.position_bias, supertrend.trend, fractal.trend);

    decision.indicators["supertrend_trend"] = static_cast<double>(supertrend.trend);
    decision.indicators["supertrend_atr"] = supertrend.atr;
    decision.indicators["supertrend_upper"] = supertrend.upper_band;
    decision.indicators["supertrend_lower"] = supertrend.lower_band;
    decision.indicators["bb_upper"] = bands.upper;
    decision.indicators["bb_middle"] = bands.middle;
    decision.indicators["bb_lower"] = bands.lower;
    decision.indicators["fractal_high"] = fractal.fractal_high;
    decision.indicators["fractal_low"] = fractal.fractal_low;

    SignalAnalysisLogs::log_combined_evaluation(supertrend, fractal, bands, decision.action);
    return true;
}

} // namespace Core
} // namespace OkxTrader
