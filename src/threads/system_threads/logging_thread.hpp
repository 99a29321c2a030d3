#ifndef LOGGING_THREAD_HPP
#define LOGGING_THREAD_HPP

#include <string>
#include <memory>
#include "logging/logger/async_logger.hpp"
#include "configs/system_config.hpp"

namespace OkxTrader {
namespace Threads {

class LoggingThread {
public:
    LoggingThread(std::shared_ptr<OkxTrader::Logging::AsyncLogger> logger,
                  const OkxTrader::Config::SystemConfig& system_config)
        : logger_ptr(logger), config(system_config) {}

    void operator()();

private:
    std::shared_ptr<OkxTrader::Logging::AsyncLogger> logger_ptr;
    const OkxTrader::Config::SystemConfig& config;

    void execute_logging_processing_loop();
};

} // namespace Threads
} // namespace OkxTrader

#endif // LOGGING_THREAD_HPP
