#ifndef MARKET_EVENT_HANDLER_HPP
#define MARKET_EVENT_HANDLER_HPP

#include "trader/data_structures/data_structures.hpp"
#include <memory>

namespace OkxTrader {
namespace API {

// Receives decoded stream events on the stream thread, in receipt order.
class MarketEventHandler {
public:
    virtual ~MarketEventHandler() = default;

    virtual void on_tick(const Core::Tick& tick) = 0;
    virtual void on_candle_update(const Core::Bar& candle) = 0;
    virtual void on_stream_warning(const Core::StreamWarning& warning) = 0;
};

} // namespace API
} // namespace OkxTrader

#endif // MARKET_EVENT_HANDLER_HPP
