#ifndef MARKET_STREAM_THREAD_HPP
#define MARKET_STREAM_THREAD_HPP

#include "api/okx/okx_market_stream.hpp"
#include <atomic>
#include <condition_variable>
#include <mutex>

namespace OkxTrader {
namespace Threads {

/**
 * Owns the exchange connection for the lifetime of the process.
 * When the stream gives up reconnecting it raises reconnect_exhausted and
 * wakes the main thread so the process can exit with a distinct code.
 */
struct MarketStreamThread {
    API::Okx::OkxMarketStream& market_stream;
    std::mutex& state_mtx;
    std::condition_variable& state_cv;
    std::atomic<bool>& running;
    std::atomic<bool>& reconnect_exhausted;

    MarketStreamThread(API::Okx::OkxMarketStream& stream_ref,
                       std::mutex& mtx,
                       std::condition_variable& cv,
                       std::atomic<bool>& running_flag,
                       std::atomic<bool>& exhausted_flag)
        : market_stream(stream_ref), state_mtx(mtx), state_cv(cv),
          running(running_flag), reconnect_exhausted(exhausted_flag) {}

    void operator()();
};

} // namespace Threads
} // namespace OkxTrader

#endif // MARKET_STREAM_THREAD_HPP
