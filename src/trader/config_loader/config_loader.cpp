#include "config_loader.hpp"
#include "logging/logger/async_logger.hpp"
#include "trader/strategy_analysis/signal_state_machine.hpp"
#include "trader/coordinators/market_data_coordinator.hpp"
#include "utils/time_utils.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

using OkxTrader::Logging::log_message;

namespace {
    inline std::string trim(const std::string& input_string) {
        const char* whitespace_chars = " \t\r\n";
        auto begin_position = input_string.find_first_not_of(whitespace_chars);
        auto end_position = input_string.find_last_not_of(whitespace_chars);
        if (begin_position == std::string::npos) return "";
        return input_string.substr(begin_position, end_position - begin_position + 1);
    }

    inline bool to_bool(const std::string& input_value) {
        std::string normalized_value = input_value;
        std::transform(normalized_value.begin(), normalized_value.end(), normalized_value.begin(), ::tolower);
        return normalized_value == "1" || normalized_value == "true" || normalized_value == "yes";
    }

    // Whole-string numeric parsing; "12abc" is rejected.
    int to_int(const std::string& key, const std::string& value) {
        size_t parsed_length = 0;
        int parsed_value = std::stoi(value, &parsed_length);
        if (parsed_length != value.size()) {
            throw std::invalid_argument("Invalid integer for " + key + ": '" + value + "'");
        }
        return parsed_value;
    }

    long long to_long(const std::string& key, const std::string& value) {
        size_t parsed_length = 0;
        long long parsed_value = std::stoll(value, &parsed_length);
        if (parsed_length != value.size()) {
            throw std::invalid_argument("Invalid integer for " + key + ": '" + value + "'");
        }
        return parsed_value;
    }

    double to_double(const std::string& key, const std::string& value) {
        size_t parsed_length = 0;
        double parsed_value = std::stod(value, &parsed_length);
        if (parsed_length != value.size()) {
            throw std::invalid_argument("Invalid number for " + key + ": '" + value + "'");
        }
        return parsed_value;
    }

    std::string read_environment_variable(const char* variable_name) {
        const char* variable_value = std::getenv(variable_name);
        return variable_value ? std::string(variable_value) : std::string();
    }

    void apply_config_value(OkxTrader::Config::SystemConfig& cfg, const std::string& key, const std::string& value) {
        // Stream
        if (key == "stream.websocket_url") cfg.stream.websocket_url = value;
        else if (key == "stream.symbol") cfg.stream.symbol = value;
        else if (key == "stream.timeframe") cfg.stream.timeframe = value;
        else if (key == "stream.bar_source") cfg.stream.bar_source = value;
        else if (key == "stream.ping_interval_ms") cfg.stream.ping_interval_ms = to_int(key, value);
        else if (key == "stream.pong_timeout_ms") cfg.stream.pong_timeout_ms = to_int(key, value);
        else if (key == "stream.receive_poll_timeout_ms") cfg.stream.receive_poll_timeout_ms = to_int(key, value);
        else if (key == "stream.clock_skew_threshold_ms") cfg.stream.clock_skew_threshold_ms = to_long(key, value);
        else if (key == "stream.max_reconnect_attempts") cfg.stream.max_reconnect_attempts = to_int(key, value);
        else if (key == "stream.initial_reconnect_delay_ms") cfg.stream.initial_reconnect_delay_ms = to_int(key, value);
        else if (key == "stream.reconnect_multiplier") cfg.stream.reconnect_multiplier = to_double(key, value);

        // Strategy
        else if (key == "strategy.type") cfg.strategy.strategy_type = value;
        else if (key == "strategy.ema_short_period") cfg.strategy.ema_short_period = to_int(key, value);
        else if (key == "strategy.ema_long_period") cfg.strategy.ema_long_period = to_int(key, value);
        else if (key == "strategy.fractal_period") cfg.strategy.fractal_period = to_int(key, value);
        else if (key == "strategy.bb_length") cfg.strategy.bb_length = to_int(key, value);
        else if (key == "strategy.bb_deviation") cfg.strategy.bb_deviation = to_double(key, value);
        else if (key == "strategy.supertrend_period") cfg.strategy.supertrend_period = to_int(key, value);
        else if (key == "strategy.supertrend_multiplier") cfg.strategy.supertrend_multiplier = to_double(key, value);
        else if (key == "strategy.max_price_history") cfg.strategy.max_price_history = to_int(key, value);
        else if (key == "strategy.max_bar_history") cfg.strategy.max_bar_history = to_int(key, value);

        // Execution
        else if (key == "execution.mode") cfg.execution.mode = value;
        else if (key == "execution.api_base_url") cfg.execution.api_base_url = value;
        else if (key == "execution.simulated_trading") cfg.execution.simulated_trading = to_bool(value);
        else if (key == "execution.trade_size") cfg.execution.trade_size = value;
        else if (key == "execution.trade_mode") cfg.execution.trade_mode = value;
        else if (key == "execution.leverage") cfg.execution.leverage = to_int(key, value);
        else if (key == "execution.stop_loss_percentage") cfg.execution.stop_loss_percentage = to_double(key, value);
        else if (key == "execution.take_profit_percentage") cfg.execution.take_profit_percentage = to_double(key, value);
        else if (key == "execution.trade_cooldown_ms") cfg.execution.trade_cooldown_ms = to_long(key, value);
        else if (key == "execution.http_timeout_seconds") cfg.execution.http_timeout_seconds = to_int(key, value);
        else if (key == "execution.http_retries") cfg.execution.http_retries = to_int(key, value);

        // Logging
        else if (key == "logging.log_file") cfg.logging.log_file = value;
        else if (key == "logging.enable_bars_csv") cfg.logging.enable_bars_csv = to_bool(value);
        else if (key == "logging.log_every_tick") cfg.logging.log_every_tick = to_bool(value);

        // Timing
        else if (key == "timing.thread_logging_poll_interval_ms") cfg.timing.thread_logging_poll_interval_ms = to_int(key, value);
        else if (key == "timing.event_wait_timeout_ms") cfg.timing.event_wait_timeout_ms = to_int(key, value);
        else if (key == "timing.market_status_logging_interval_seconds") cfg.timing.market_status_logging_interval_seconds = to_int(key, value);
        else if (key == "timing.tick_queue_capacity") cfg.timing.tick_queue_capacity = to_int(key, value);
        else if (key == "timing.bar_queue_capacity") cfg.timing.bar_queue_capacity = to_int(key, value);
        else if (key == "timing.signal_queue_capacity") cfg.timing.signal_queue_capacity = to_int(key, value);
        else if (key == "timing.warning_queue_capacity") cfg.timing.warning_queue_capacity = to_int(key, value);

        // Unknown keys are ignored
    }
}

bool load_config_from_csv(OkxTrader::Config::SystemConfig& cfg, const std::string& csv_path) {
    std::ifstream config_file_stream(csv_path);
    if (!config_file_stream.is_open()) {
        return false;
    }

    std::string config_line_string;
    int line_number = 0;
    while (std::getline(config_file_stream, config_line_string)) {
        line_number++;
        config_line_string = trim(config_line_string);
        if (config_line_string.empty() || config_line_string[0] == '#') continue;

        std::stringstream config_line_stream(config_line_string);
        std::string config_key_string, config_value_string;
        if (!std::getline(config_line_stream, config_key_string, ',')) continue;
        if (!std::getline(config_line_stream, config_value_string)) continue;
        config_key_string = trim(config_key_string);
        config_value_string = trim(config_value_string);

        try {
            apply_config_value(cfg, config_key_string, config_value_string);
        } catch (const std::exception& line_exception_error) {
            log_message("ERROR: " + csv_path + ":" + std::to_string(line_number) + " " + config_key_string +
                        " - " + std::string(line_exception_error.what()), "");
            return false;
        }
    }
    return true;
}

void load_credentials_from_environment(OkxTrader::Config::SystemConfig& cfg) {
    cfg.execution.api_key = read_environment_variable("OKX_API_KEY");
    cfg.execution.secret_key = read_environment_variable("OKX_SECRET_KEY");
    cfg.execution.passphrase = read_environment_variable("OKX_PASSPHRASE");
}

int load_system_config(OkxTrader::Config::SystemConfig& config, const std::string& config_directory) {
    // Load configuration from separate logical files
    std::vector<std::string> config_files = {
        config_directory + "/stream_config.csv",
        config_directory + "/strategy_config.csv",
        config_directory + "/execution_config.csv",
        config_directory + "/logging_config.csv",
        config_directory + "/timing_config.csv"
    };

    for (const auto& config_path : config_files) {
        if (!load_config_from_csv(config, config_path)) {
            log_message("ERROR: Failed to load config CSV from " + config_path, "");
            return 1;
        }
    }

    load_credentials_from_environment(config);

    std::string validation_error;
    if (!validate_config(config, validation_error)) {
        log_message("ERROR: Configuration validation failed: " + validation_error, "");
        return 1;
    }

    return 0;
}

bool validate_config(const OkxTrader::Config::SystemConfig& config, std::string& error_message) {
    // Stream
    if (config.stream.symbol.empty()) {
        error_message = "stream.symbol is required (provide via stream_config.csv)";
        return false;
    }
    if (config.stream.websocket_url.find("wss://") != 0) {
        error_message = "stream.websocket_url must start with wss://, got '" + config.stream.websocket_url + "'";
        return false;
    }
    try {
        TimeUtils::parse_timeframe_to_milliseconds(config.stream.timeframe);
        OkxTrader::Core::parse_bar_source(config.stream.bar_source);
    } catch (const std::invalid_argument& stream_value_error) {
        error_message = stream_value_error.what();
        return false;
    }
    if (config.stream.ping_interval_ms <= 0 || config.stream.pong_timeout_ms <= 0 || config.stream.receive_poll_timeout_ms <= 0) {
        error_message = "stream ping, pong and poll intervals must be > 0";
        return false;
    }
    if (config.stream.clock_skew_threshold_ms <= 0) {
        error_message = "stream.clock_skew_threshold_ms must be > 0";
        return false;
    }
    if (config.stream.max_reconnect_attempts < 1) {
        error_message = "stream.max_reconnect_attempts must be >= 1";
        return false;
    }
    if (config.stream.initial_reconnect_delay_ms <= 0) {
        error_message = "stream.initial_reconnect_delay_ms must be > 0";
        return false;
    }
    if (config.stream.reconnect_multiplier < 1.0) {
        error_message = "stream.reconnect_multiplier must be >= 1.0";
        return false;
    }

    // Strategy
    size_t required_history = 0;
    try {
        required_history = OkxTrader::Core::required_history_for_strategy(config.strategy);
    } catch (const std::invalid_argument& strategy_type_error) {
        error_message = strategy_type_error.what();
        return false;
    }
    if (config.strategy.ema_short_period < 1 || config.strategy.ema_long_period < 1) {
        error_message = "strategy EMA periods must be >= 1";
        return false;
    }
    if (config.strategy.ema_short_period >= config.strategy.ema_long_period) {
        error_message = "strategy.ema_short_period must be less than strategy.ema_long_period";
        return false;
    }
    if (config.strategy.fractal_period < 3) {
        error_message = "strategy.fractal_period must be >= 3";
        return false;
    }
    if (config.strategy.bb_length < 1 || config.strategy.supertrend_period < 1) {
        error_message = "strategy.bb_length and strategy.supertrend_period must be >= 1";
        return false;
    }
    if (config.strategy.bb_deviation <= 0.0 || config.strategy.supertrend_multiplier <= 0.0) {
        error_message = "strategy.bb_deviation and strategy.supertrend_multiplier must be > 0";
        return false;
    }
    if (config.strategy.max_price_history < static_cast<int>(required_history) ||
        config.strategy.max_bar_history < static_cast<int>(required_history)) {
        error_message = "strategy history capacities must hold at least " + std::to_string(required_history) +
                        " values for the " + config.strategy.strategy_type + " strategy";
        return false;
    }

    // Execution
    if (config.execution.mode != "paper" && config.execution.mode != "live") {
        error_message = "execution.mode must be paper or live, got '" + config.execution.mode + "'";
        return false;
    }
    if (config.execution.trade_mode != "cross" && config.execution.trade_mode != "isolated" && config.execution.trade_mode != "cash") {
        error_message = "execution.trade_mode must be cross, isolated or cash";
        return false;
    }
    try {
        size_t parsed_length = 0;
        double trade_size_value = std::stod(config.execution.trade_size, &parsed_length);
        if (parsed_length != config.execution.trade_size.size() || trade_size_value <= 0.0) {
            throw std::invalid_argument("non-positive");
        }
    } catch (const std::logic_error&) {
        error_message = "execution.trade_size must be a positive number, got '" + config.execution.trade_size + "'";
        return false;
    }
    if (config.execution.leverage < 1) {
        error_message = "execution.leverage must be >= 1";
        return false;
    }
    if (config.execution.stop_loss_percentage <= 0.0 || config.execution.take_profit_percentage <= 0.0) {
        error_message = "execution stop-loss and take-profit percentages must be > 0";
        return false;
    }
    if (config.execution.trade_cooldown_ms < 0) {
        error_message = "execution.trade_cooldown_ms must be >= 0";
        return false;
    }
    if (config.execution.http_timeout_seconds <= 0 || config.execution.http_retries < 1) {
        error_message = "execution.http_timeout_seconds must be > 0 and execution.http_retries >= 1";
        return false;
    }
    if (config.execution.mode == "live") {
        if (config.execution.api_base_url.empty()) {
            error_message = "execution.api_base_url is required in live mode";
            return false;
        }
        if (config.execution.api_key.empty() || config.execution.secret_key.empty() || config.execution.passphrase.empty()) {
            error_message = "Live mode requires OKX_API_KEY, OKX_SECRET_KEY and OKX_PASSPHRASE in the environment";
            return false;
        }
    }

    // Logging
    if (config.logging.log_file.empty()) {
        error_message = "logging.log_file is required";
        return false;
    }

    // Timing
    if (config.timing.thread_logging_poll_interval_ms <= 0 || config.timing.event_wait_timeout_ms <= 0 ||
        config.timing.market_status_logging_interval_seconds <= 0) {
        error_message = "timing intervals must be > 0";
        return false;
    }
    if (config.timing.tick_queue_capacity <= 0 || config.timing.bar_queue_capacity <= 0 ||
        config.timing.signal_queue_capacity <= 0 || config.timing.warning_queue_capacity <= 0) {
        error_message = "timing queue capacities must be > 0";
        return false;
    }

    return true;
}
