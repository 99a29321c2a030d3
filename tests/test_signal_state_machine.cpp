#include "trader/strategy_analysis/signal_state_machine.hpp"
#include <gtest/gtest.h>
#include <vector>

using namespace OkxTrader::Core;

namespace {

const long long ONE_MINUTE_MS = 60000;

Bar make_bar(long long index, double close_price) {
    Bar bar;
    bar.open_time_ms = index * ONE_MINUTE_MS;
    bar.close_time_ms = bar.open_time_ms + ONE_MINUTE_MS;
    bar.open_price = close_price;
    bar.high_price = close_price + 0.5;
    bar.low_price = close_price - 0.5;
    bar.close_price = close_price;
    bar.volume = 1.0;
    bar.complete = true;
    return bar;
}

StrategyConfig make_ema_config() {
    StrategyConfig config;
    config.strategy_type = "EMA";
    config.ema_short_period = 2;
    config.ema_long_period = 4;
    return config;
}

std::vector<Signal> feed(SignalStateMachine& state_machine, const std::vector<double>& closes, long long first_index) {
    std::vector<Signal> signals;
    for (size_t close_index = 0; close_index < closes.size(); ++close_index) {
        Signal signal;
        if (state_machine.on_bar_completed(make_bar(first_index + static_cast<long long>(close_index), closes[close_index]), signal)) {
            signals.push_back(signal);
        }
    }
    return signals;
}

} // anonymous namespace

TEST(SignalStateMachineTest, EmaCrossoverEmitsExactlyOneBuy) {
    StrategyConfig config = make_ema_config();
    SignalStateMachine state_machine(config, "1m");
    EXPECT_EQ(state_machine.get_strategy_type(), StrategyType::EMA);

    std::vector<Signal> flat_signals = feed(state_machine, {100.0, 100.0, 100.0, 100.0, 100.0}, 1);
    EXPECT_TRUE(flat_signals.empty());

    std::vector<Signal> rising_signals = feed(state_machine, {101.0, 102.0, 103.0, 104.0}, 6);
    ASSERT_EQ(rising_signals.size(), 1u);
    EXPECT_EQ(rising_signals[0].action, SignalAction::BUY);
    EXPECT_DOUBLE_EQ(rising_signals[0].price, 101.0);
    EXPECT_EQ(rising_signals[0].timestamp_ms, 7 * ONE_MINUTE_MS);
    EXPECT_EQ(rising_signals[0].strategy_tag, "EMA");
    EXPECT_EQ(rising_signals[0].timeframe, "1m");
    EXPECT_EQ(rising_signals[0].supporting_indicators.count("ema_short"), 1u);
    EXPECT_EQ(state_machine.get_position_bias(), PositionBias::LONG);
}

TEST(SignalStateMachineTest, EmaReversalEmitsSellAfterBuy) {
    StrategyConfig config = make_ema_config();
    SignalStateMachine state_machine(config, "1m");

    feed(state_machine, {100.0, 100.0, 100.0, 100.0, 100.0, 105.0}, 1);
    ASSERT_EQ(state_machine.get_last_emitted_action(), SignalAction::BUY);

    std::vector<Signal> falling_signals = feed(state_machine, {95.0, 90.0, 85.0}, 7);
    ASSERT_EQ(falling_signals.size(), 1u);
    EXPECT_EQ(falling_signals[0].action, SignalAction::SELL);
    EXPECT_EQ(state_machine.get_position_bias(), PositionBias::SHORT);
}

TEST(SignalStateMachineTest, EmaConvergenceDoesNotRearmBuy) {
    StrategyConfig config = make_ema_config();
    config.max_price_history = 5;
    SignalStateMachine state_machine(config, "1m");

    // Once the window holds only 105s both averages equal 105; the next
    // uptick must not produce a second BUY.
    std::vector<Signal> signals = feed(state_machine,
        {100.0, 100.0, 100.0, 100.0, 100.0, 105.0, 105.0, 105.0, 105.0, 105.0, 105.0, 106.0}, 1);

    ASSERT_EQ(signals.size(), 1u);
    EXPECT_EQ(signals[0].action, SignalAction::BUY);
    EXPECT_EQ(state_machine.get_last_emitted_action(), SignalAction::BUY);
    EXPECT_EQ(state_machine.get_position_bias(), PositionBias::LONG);
}

TEST(SignalStateMachineTest, NoEvaluationBeforeRequiredHistory) {
    StrategyConfig config = make_ema_config();
    SignalStateMachine state_machine(config, "1m");

    std::vector<Signal> signals = feed(state_machine, {100.0, 110.0, 120.0, 130.0}, 1);
    EXPECT_TRUE(signals.empty());
    EXPECT_EQ(state_machine.get_last_emitted_action(), SignalAction::HOLD);
    EXPECT_EQ(state_machine.get_state().close_prices.size(), 4u);
}

TEST(SignalStateMachineTest, DuplicateBarIsDropped) {
    StrategyConfig config = make_ema_config();
    SignalStateMachine state_machine(config, "1m");

    Signal signal;
    state_machine.on_bar_completed(make_bar(3, 100.0), signal);
    EXPECT_FALSE(state_machine.on_bar_completed(make_bar(3, 100.0), signal));
    EXPECT_FALSE(state_machine.on_bar_completed(make_bar(2, 100.0), signal));
    EXPECT_EQ(state_machine.get_state().bars.size(), 1u);
}

TEST(SignalStateMachineTest, CombinedStrategyStaysQuietOnFlatMarket) {
    StrategyConfig config;
    config.strategy_type = "COMBINED";
    SignalStateMachine state_machine(config, "30m");

    std::vector<double> closes(60, 100.0);
    EXPECT_TRUE(feed(state_machine, closes, 1).empty());
    EXPECT_EQ(state_machine.get_position_bias(), PositionBias::FLAT);
}

TEST(SignalStateMachineTest, CombinedStrategyEntersOnBullishFractalAndExitsOnBearish) {
    StrategyConfig config;
    config.strategy_type = "COMBINED";
    config.supertrend_period = 3;
    config.supertrend_multiplier = 3.0;
    config.bb_length = 5;
    config.bb_deviation = 2.0;
    config.fractal_period = 5;
    SignalStateMachine state_machine(config, "30m");

    // {high, low, close}: a trough at bar 5 confirmed by bar 7, then a peak at
    // bar 9 confirmed by bar 11.
    const std::vector<std::vector<double>> bar_prices = {
        {101.0, 99.0, 100.0}, {101.0, 99.0, 100.0}, {101.0, 99.0, 100.0}, {100.0, 96.0, 97.0},
        {100.0, 95.0, 96.0}, {101.0, 97.0, 100.0}, {103.0, 99.0, 102.0}, {106.0, 101.0, 105.0},
        {108.0, 103.0, 104.0}, {105.0, 100.0, 101.0}, {103.0, 98.0, 99.0}};

    std::vector<Signal> signals;
    for (size_t price_index = 0; price_index < bar_prices.size(); ++price_index) {
        Bar bar = make_bar(static_cast<long long>(price_index) + 1, bar_prices[price_index][2]);
        bar.high_price = bar_prices[price_index][0];
        bar.low_price = bar_prices[price_index][1];

        Signal signal;
        if (!state_machine.on_bar_completed(bar, signal)) {
            continue;
        }
        signals.push_back(signal);
        if (signal.action == SignalAction::BUY) {
            EXPECT_EQ(price_index + 1, 7u);
            EXPECT_EQ(state_machine.get_position_bias(), PositionBias::LONG);
        } else if (signal.action == SignalAction::SELL) {
            EXPECT_EQ(price_index + 1, 11u);
            EXPECT_EQ(state_machine.get_position_bias(), PositionBias::FLAT);
        }
    }

    // BUY, the HOLD that follows it, then the SELL exit
    ASSERT_EQ(signals.size(), 3u);
    EXPECT_EQ(signals[0].action, SignalAction::BUY);
    EXPECT_DOUBLE_EQ(signals[0].price, 102.0);
    EXPECT_EQ(signals[0].strategy_tag, "COMBINED");
    EXPECT_DOUBLE_EQ(signals[0].supporting_indicators.at("supertrend_trend"), 1.0);
    EXPECT_DOUBLE_EQ(signals[0].supporting_indicators.at("fractal_low"), 95.0);
    EXPECT_EQ(signals[1].action, SignalAction::HOLD);
    EXPECT_EQ(signals[2].action, SignalAction::SELL);
    EXPECT_DOUBLE_EQ(signals[2].supporting_indicators.at("fractal_high"), 108.0);

    EXPECT_EQ(state_machine.get_position_bias(), PositionBias::FLAT);
    EXPECT_EQ(state_machine.get_last_emitted_action(), SignalAction::SELL);
    EXPECT_EQ(state_machine.get_state().supertrend_tracker.get_previous_trend(), 1);
}

TEST(SignalStateMachineTest, ResetClearsHistoryAndBias) {
    StrategyConfig config = make_ema_config();
    SignalStateMachine state_machine(config, "1m");

    feed(state_machine, {100.0, 100.0, 100.0, 100.0, 100.0, 105.0}, 1);
    state_machine.reset();
    EXPECT_EQ(state_machine.get_position_bias(), PositionBias::FLAT);
    EXPECT_EQ(state_machine.get_last_emitted_action(), SignalAction::HOLD);
    EXPECT_TRUE(state_machine.get_state().bars.empty());
}

TEST(CombinedDecisionTest, EntersLongOnUptrendWithBullishFractal) {
    StrategyDecision decision = decide_combined_action(PositionBias::FLAT, 1, FractalTrend::BULLISH);
    EXPECT_EQ(decision.action, SignalAction::BUY);
    EXPECT_EQ(decision.next_bias, PositionBias::LONG);
}

TEST(CombinedDecisionTest, EntersShortOnDowntrendWithBearishFractal) {
    StrategyDecision decision = decide_combined_action(PositionBias::FLAT, -1, FractalTrend::STRONGLY_BEARISH);
    EXPECT_EQ(decision.action, SignalAction::SELL);
    EXPECT_EQ(decision.next_bias, PositionBias::SHORT);
}

TEST(CombinedDecisionTest, HoldsWhenTrendAndFractalDisagree) {
    EXPECT_EQ(decide_combined_action(PositionBias::FLAT, -1, FractalTrend::BULLISH).action, SignalAction::HOLD);
    EXPECT_EQ(decide_combined_action(PositionBias::FLAT, 1, FractalTrend::NEUTRAL).action, SignalAction::HOLD);
}

TEST(CombinedDecisionTest, ExitsTakePrecedenceOverEntries) {
    StrategyDecision long_exit = decide_combined_action(PositionBias::LONG, -1, FractalTrend::BEARISH);
    EXPECT_EQ(long_exit.action, SignalAction::SELL);
    EXPECT_EQ(long_exit.next_bias, PositionBias::FLAT);

    StrategyDecision short_exit = decide_combined_action(PositionBias::SHORT, 1, FractalTrend::STRONGLY_BULLISH);
    EXPECT_EQ(short_exit.action, SignalAction::BUY);
    EXPECT_EQ(short_exit.next_bias, PositionBias::FLAT);
}

TEST(CombinedDecisionTest, DoesNotReenterExistingPosition) {
    StrategyDecision decision = decide_combined_action(PositionBias::LONG, 1, FractalTrend::BULLISH);
    EXPECT_EQ(decision.action, SignalAction::HOLD);
    EXPECT_EQ(decision.next_bias, PositionBias::LONG);
}

TEST(EmaDecisionTest, FollowsCrossoverRegime) {
    EXPECT_EQ(decide_ema_action(PositionBias::FLAT, 101.0, 100.0).action, SignalAction::BUY);
    EXPECT_EQ(decide_ema_action(PositionBias::LONG, 99.0, 100.0).action, SignalAction::SELL);
    EXPECT_EQ(decide_ema_action(PositionBias::FLAT, 100.0, 100.0).action, SignalAction::HOLD);
}

TEST(EmaDecisionTest, EqualAveragesKeepCurrentRegime) {
    StrategyDecision long_touch = decide_ema_action(PositionBias::LONG, 100.0, 100.0);
    EXPECT_EQ(long_touch.action, SignalAction::BUY);
    EXPECT_EQ(long_touch.next_bias, PositionBias::LONG);

    StrategyDecision short_touch = decide_ema_action(PositionBias::SHORT, 100.0, 100.0);
    EXPECT_EQ(short_touch.action, SignalAction::SELL);
    EXPECT_EQ(short_touch.next_bias, PositionBias::SHORT);
}

TEST(StrategyTypeTest, ParsesKnownNamesOnly) {
    EXPECT_EQ(parse_strategy_type("EMA"), StrategyType::EMA);
    EXPECT_EQ(parse_strategy_type("COMBINED"), StrategyType::COMBINED);
    EXPECT_THROW(parse_strategy_type("macd"), std::invalid_argument);
}

TEST(StrategyTypeTest, RequiredHistoryMatchesLongestLookback) {
    StrategyConfig ema_config = make_ema_config();
    EXPECT_EQ(required_history_for_strategy(ema_config), 5u);

    StrategyConfig combined_config;
    combined_config.strategy_type = "COMBINED";
    EXPECT_EQ(required_history_for_strategy(combined_config), 20u);
}
