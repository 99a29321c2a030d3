// StrategyConfig.hpp
#ifndef STRATEGY_CONFIG_HPP
#define STRATEGY_CONFIG_HPP

#include <string>

struct StrategyConfig {
    // ========================================================================
    // STRATEGY SELECTION
    // ========================================================================

    std::string strategy_type;                       // "EMA" (crossover) or "COMBINED" (supertrend + fractal)

    // ========================================================================
    // EMA CROSSOVER PARAMETERS
    // ========================================================================

    int ema_short_period;                            // Fast EMA length
    int ema_long_period;                             // Slow EMA length

    // ========================================================================
    // COMBINED STRATEGY PARAMETERS
    // ========================================================================

    int fractal_period;                              // Window size for fractal detection
    int bb_length;                                   // Bollinger Bands SMA length
    double bb_deviation;                             // Bollinger Bands standard deviation multiplier
    int supertrend_period;                           // ATR period for Supertrend
    double supertrend_multiplier;                    // ATR multiplier for Supertrend bands

    // ========================================================================
    // HISTORY CAPACITY
    // ========================================================================

    int max_price_history;                           // Close prices retained for EMA calculations
    int max_bar_history;                             // Completed bars retained for bar-based indicators

    StrategyConfig()
        : strategy_type("COMBINED"), ema_short_period(9), ema_long_period(21), fractal_period(15), bb_length(20),
          bb_deviation(2.0), supertrend_period(10), supertrend_multiplier(3.0), max_price_history(1000),
          max_bar_history(500) {}
};

#endif // STRATEGY_CONFIG_HPP
