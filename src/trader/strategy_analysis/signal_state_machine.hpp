#ifndef SIGNAL_STATE_MACHINE_HPP
#define SIGNAL_STATE_MACHINE_HPP

#include "configs/strategy_config.hpp"
#include "trader/data_structures/data_structures.hpp"
#include "trader/data_structures/bounded_series.hpp"
#include "indicators.hpp"
#include <map>
#include <string>

namespace OkxTrader {
namespace Core {

enum class StrategyType {
    EMA,
    COMBINED
};

// Throws std::invalid_argument for anything other than "EMA" or "COMBINED".
StrategyType parse_strategy_type(const std::string& strategy_name);
std::string to_string(StrategyType strategy_type);

// Bars needed before the strategy evaluates at all.
size_t required_history_for_strategy(const StrategyConfig& config);

// ========================================================================
// Everything the state machine remembers between bars
// ========================================================================

struct StrategyState {
    BoundedSeries<double> close_prices;
    BoundedSeries<Bar> bars;
    SignalAction last_emitted_action;
    PositionBias position_bias;
    SupertrendTracker supertrend_tracker;
    long long last_processed_open_time_ms;
    bool any_bar_processed;

    StrategyState(int max_price_history, int max_bar_history)
        : close_prices(max_price_history), bars(max_bar_history), last_emitted_action(SignalAction::HOLD),
          position_bias(PositionBias::FLAT), last_processed_open_time_ms(0), any_bar_processed(false) {}

    void reset() {
        close_prices.clear();
        bars.clear();
        last_emitted_action = SignalAction::HOLD;
        position_bias = PositionBias::FLAT;
        supertrend_tracker.reset();
        last_processed_open_time_ms = 0;
        any_bar_processed = false;
    }
};

struct StrategyDecision {
    SignalAction action;
    PositionBias next_bias;                             // bias to adopt if the action is emitted
    std::map<std::string, double> indicators;

    StrategyDecision() : action(SignalAction::HOLD), next_bias(PositionBias::FLAT) {}
};

// Transition rules of the COMBINED strategy; indicators are left empty.
StrategyDecision decide_combined_action(PositionBias current_bias, int supertrend_trend, FractalTrend fractal_trend);

// EMA crossover regime: short above long buys, below sells. Equal averages
// keep the regime of current_bias (HOLD only while FLAT).
StrategyDecision decide_ema_action(PositionBias current_bias, double ema_short, double ema_long);

/**
 * Turns completed bars into edge-triggered trading signals.
 * A signal is produced only when the computed action differs from the last
 * emitted one. Must be driven from a single thread.
 */
class SignalStateMachine {
public:
    SignalStateMachine(const StrategyConfig& strategy_config, const std::string& timeframe);

    // Returns true and fills signal when the bar produced a transition.
    // Never throws: a failure while evaluating one bar yields no signal for it.
    bool on_bar_completed(const Bar& bar, Signal& signal);

    PositionBias get_position_bias() const { return state.position_bias; }
    SignalAction get_last_emitted_action() const { return state.last_emitted_action; }
    const StrategyState& get_state() const { return state; }
    StrategyType get_strategy_type() const { return strategy_type; }

    void reset() { state.reset(); }

private:
    const StrategyConfig& config;
    std::string timeframe_label;
    StrategyType strategy_type;
    size_t required_history;
    StrategyState state;

    bool evaluate_ema(StrategyDecision& decision);
    bool evaluate_combined(StrategyDecision& decision);
};

} // namespace Core
} // namespace OkxTrader

#endif // SIGNAL_STATE_MACHINE_HPP
