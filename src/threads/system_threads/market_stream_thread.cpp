/**
 * Market stream thread.
 * Runs the OKX connector; all market event handling happens on this thread.
 */
#include "market_stream_thread.hpp"
#include "logging/logger/async_logger.hpp"
#include "logging/logs/system_logs.hpp"

using namespace OkxTrader::Threads;
using namespace OkxTrader::Logging;
using OkxTrader::API::Okx::OkxMarketStream;

void MarketStreamThread::operator()() {
    set_log_thread_tag("STREAM");

    OkxMarketStream::StreamExitReason exit_reason = market_stream.run();
    log_message("Market stream exited: " + OkxTrader::API::Okx::stream_exit_reason_to_string(exit_reason), "");

    if (exit_reason == OkxMarketStream::StreamExitReason::RECONNECT_EXHAUSTED) {
        {
            std::lock_guard<std::mutex> state_lock(state_mtx);
            reconnect_exhausted.store(true);
            running.store(false);
        }
        state_cv.notify_all();
    }
}
