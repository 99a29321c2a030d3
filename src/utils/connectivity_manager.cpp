#include "connectivity_manager.hpp"
#include <cmath>
#include <stdexcept>

ConnectivityManager::ConnectivityManager(int max_reconnect_attempts, long long initial_reconnect_delay_ms, double reconnect_multiplier)
    : max_attempts(max_reconnect_attempts),
      initial_delay_milliseconds(initial_reconnect_delay_ms),
      backoff_multiplier(reconnect_multiplier) {
    if (max_attempts <= 0) {
        throw std::runtime_error("max_reconnect_attempts must be greater than 0");
    }
    if (initial_delay_milliseconds <= 0) {
        throw std::runtime_error("initial_reconnect_delay_ms must be greater than 0");
    }
    if (backoff_multiplier < 1.0) {
        throw std::runtime_error("reconnect_multiplier must be at least 1.0");
    }
    state_.last_success = std::chrono::steady_clock::now();
    state_.next_retry_time = state_.last_success;
}

bool ConnectivityManager::begin_connect_attempt() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_.status == ConnectionStatus::FAILED) {
        return false;
    }
    state_.status = ConnectionStatus::CONNECTING;
    return true;
}

void ConnectivityManager::report_connected() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_.status == ConnectionStatus::FAILED) {
        return;
    }
    state_.status = ConnectionStatus::CONNECTED;
    state_.last_success = std::chrono::steady_clock::now();
}

void ConnectivityManager::report_subscribed() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_.status == ConnectionStatus::FAILED) {
        return;
    }
    auto now = std::chrono::steady_clock::now();

    state_.status = ConnectionStatus::CONNECTED;
    state_.last_success = now;
    state_.consecutive_failures = 0;
    state_.retry_delay_milliseconds = 0;
    state_.next_retry_time = now;
    state_.last_error_message.clear();
}

ConnectivityManager::FailureOutcome ConnectivityManager::report_failure(const std::string& error_message) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto now = std::chrono::steady_clock::now();

    state_.last_failure = now;
    state_.last_error_message = error_message;

    if (state_.status == ConnectionStatus::FAILED) {
        return FailureOutcome{true, 0};
    }

    state_.consecutive_failures++;
    if (state_.consecutive_failures > max_attempts) {
        state_.status = ConnectionStatus::FAILED;
        state_.retry_delay_milliseconds = 0;
        return FailureOutcome{true, 0};
    }

    state_.status = ConnectionStatus::BACKING_OFF;
    state_.retry_delay_milliseconds = compute_delay_milliseconds(state_.consecutive_failures);
    state_.next_retry_time = now + std::chrono::milliseconds(state_.retry_delay_milliseconds);
    return FailureOutcome{false, state_.retry_delay_milliseconds};
}

void ConnectivityManager::report_disconnected() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_.status != ConnectionStatus::FAILED) {
        state_.status = ConnectionStatus::DISCONNECTED;
    }
}

long long ConnectivityManager::compute_delay_milliseconds(int attempt_number) const {
    if (attempt_number < 1) {
        return 0;
    }
    double delay_value = static_cast<double>(initial_delay_milliseconds) * std::pow(backoff_multiplier, attempt_number - 1);
    return static_cast<long long>(std::llround(delay_value));
}

ConnectivityManager::ConnectionStatus ConnectivityManager::get_status() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_.status;
}

ConnectivityManager::ConnectivityState ConnectivityManager::get_state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

int ConnectivityManager::get_consecutive_failures() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_.consecutive_failures;
}

long long ConnectivityManager::get_retry_delay_milliseconds() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_.retry_delay_milliseconds;
}

bool ConnectivityManager::is_failed() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_.status == ConnectionStatus::FAILED;
}

std::string ConnectivityManager::get_status_string() const {
    return status_to_string(get_status());
}

std::string ConnectivityManager::status_to_string(ConnectionStatus status) {
    switch (status) {
        case ConnectionStatus::DISCONNECTED:
            return "DISCONNECTED";
        case ConnectionStatus::CONNECTING:
            return "CONNECTING";
        case ConnectionStatus::CONNECTED:
            return "CONNECTED";
        case ConnectionStatus::BACKING_OFF:
            return "BACKING_OFF";
        case ConnectionStatus::FAILED:
            return "FAILED";
    }
    return "UNKNOWN";
}
