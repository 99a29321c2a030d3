#ifndef SYSTEM_THREADS_HPP
#define SYSTEM_THREADS_HPP

#include <thread>
#include <chrono>
#include <utility>

/**
 * @brief System thread handles
 */
struct SystemThreads {
    std::thread logger_thread;    // Logging system thread
    std::thread monitor_thread;   // Market event observer thread
    std::thread trader_thread;    // Signal consumer thread
    std::thread stream_thread;    // Exchange connector thread
    
    std::chrono::steady_clock::time_point start_time;  // System startup timestamp
    
    SystemThreads() : start_time(std::chrono::steady_clock::now()) {}
    
    SystemThreads(const SystemThreads&) = delete;
    SystemThreads& operator=(const SystemThreads&) = delete;
    
    SystemThreads(SystemThreads&& other) noexcept
        : logger_thread(std::move(other.logger_thread)),
          monitor_thread(std::move(other.monitor_thread)),
          trader_thread(std::move(other.trader_thread)),
          stream_thread(std::move(other.stream_thread)),
          start_time(other.start_time) {}
    
    SystemThreads& operator=(SystemThreads&& other) noexcept {
        if (this != &other) {
            logger_thread = std::move(other.logger_thread);
            monitor_thread = std::move(other.monitor_thread);
            trader_thread = std::move(other.trader_thread);
            stream_thread = std::move(other.stream_thread);
            start_time = other.start_time;
        }
        return *this;
    }
};

#endif // SYSTEM_THREADS_HPP
