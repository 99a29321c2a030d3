#ifndef DATA_STRUCTURES_HPP
#define DATA_STRUCTURES_HPP

#include <string>
#include <map>

namespace OkxTrader {
namespace Core {

struct Tick {
    std::string symbol;
    double price;
    double volume;
    long long exchange_timestamp_ms;
    long long local_timestamp_ms;

    Tick() : symbol(""), price(0.0), volume(0.0), exchange_timestamp_ms(0), local_timestamp_ms(0) {}
};

// open_time_ms is always a multiple of the timeframe; close_time_ms = open_time_ms + timeframe.
struct Bar {
    long long open_time_ms;
    long long close_time_ms;
    double open_price;
    double high_price;
    double low_price;
    double close_price;
    double volume;
    bool complete;

    Bar() : open_time_ms(0), close_time_ms(0), open_price(0.0), high_price(0.0), low_price(0.0),
            close_price(0.0), volume(0.0), complete(false) {}
};

enum class SignalAction {
    BUY,
    SELL,
    HOLD
};

enum class PositionBias {
    FLAT,
    LONG,
    SHORT
};

enum class FractalTrend {
    STRONGLY_BULLISH,
    BULLISH,
    NEUTRAL,
    BEARISH,
    STRONGLY_BEARISH
};

struct BollingerBandsSnapshot {
    double upper;
    double middle;
    double lower;

    BollingerBandsSnapshot() : upper(0.0), middle(0.0), lower(0.0) {}
};

struct SupertrendSnapshot {
    int trend;              // +1 up, -1 down
    double atr;
    double upper_band;
    double lower_band;

    SupertrendSnapshot() : trend(1), atr(0.0), upper_band(0.0), lower_band(0.0) {}
};

struct FractalTrendSnapshot {
    bool is_high_fractal;
    bool is_low_fractal;
    double fractal_high;
    double fractal_low;
    bool buy_signal;
    bool sell_signal;
    FractalTrend trend;

    FractalTrendSnapshot()
        : is_high_fractal(false), is_low_fractal(false), fractal_high(0.0), fractal_low(0.0),
          buy_signal(false), sell_signal(false), trend(FractalTrend::NEUTRAL) {}
};

struct Signal {
    SignalAction action;
    double price;
    long long timestamp_ms;
    std::string strategy_tag;
    std::string timeframe;
    Bar bar;
    std::map<std::string, double> supporting_indicators;

    Signal() : action(SignalAction::HOLD), price(0.0), timestamp_ms(0), strategy_tag(""), timeframe(""), bar() {}
};

enum class StreamWarningType {
    CLOCK_SKEW,
    RECONNECTING,
    SUBSCRIPTION_ERROR
};

struct StreamWarning {
    StreamWarningType type;
    std::string message;
    long long skew_ms;
    long long timestamp_ms;

    StreamWarning() : type(StreamWarningType::CLOCK_SKEW), message(""), skew_ms(0), timestamp_ms(0) {}
};

struct OrderResult {
    bool order_successful;
    std::string order_id;
    double executed_price;
    std::string error_message;

    OrderResult() : order_successful(false), order_id(""), executed_price(0.0), error_message("") {}
};

inline std::string to_string(SignalAction action) {
    switch (action) {
        case SignalAction::BUY: return "BUY";
        case SignalAction::SELL: return "SELL";
        case SignalAction::HOLD: return "HOLD";
    }
    return "UNKNOWN";
}

inline std::string to_string(PositionBias bias) {
    switch (bias) {
        case PositionBias::FLAT: return "FLAT";
        case PositionBias::LONG: return "LONG";
        case PositionBias::SHORT: return "SHORT";
    }
    return "UNKNOWN";
}

inline std::string to_string(FractalTrend trend) {
    switch (trend) {
        case FractalTrend::STRONGLY_BULLISH: return "STRONGLY_BULLISH";
        case FractalTrend::BULLISH: return "BULLISH";
        case FractalTrend::NEUTRAL: return "NEUTRAL";
        case FractalTrend::BEARISH: return "BEARISH";
        case FractalTrend::STRONGLY_BEARISH: return "STRONGLY_BEARISH";
    }
    return "UNKNOWN";
}

inline std::string to_string(StreamWarningType type) {
    switch (type) {
        case StreamWarningType::CLOCK_SKEW: return "CLOCK_SKEW";
        case StreamWarningType::RECONNECTING: return "RECONNECTING";
        case StreamWarningType::SUBSCRIPTION_ERROR: return "SUBSCRIPTION_ERROR";
    }
    return "UNKNOWN";
}

inline bool is_bullish(FractalTrend trend) {
    return trend == FractalTrend::BULLISH || trend == FractalTrend::STRONGLY_BULLISH;
}

inline bool is_bearish(FractalTrend trend) {
    return trend == FractalTrend::BEARISH || trend == FractalTrend::STRONGLY_BEARISH;
}

} // namespace Core
} // namespace OkxTrader

#endif // DATA_STRUCTURES_HPP
