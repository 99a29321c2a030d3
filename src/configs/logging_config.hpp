// LoggingConfig.hpp
#ifndef LOGGING_CONFIG_HPP
#define LOGGING_CONFIG_HPP

#include <string>

struct LoggingConfig {
    std::string log_file;
    bool enable_bars_csv;
    bool log_every_tick;

    LoggingConfig() : log_file("trading_system.log"), enable_bars_csv(true), log_every_tick(false) {}
};

#endif // LOGGING_CONFIG_HPP
