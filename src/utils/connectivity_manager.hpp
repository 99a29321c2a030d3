#ifndef CONNECTIVITY_MANAGER_HPP
#define CONNECTIVITY_MANAGER_HPP

#include <chrono>
#include <mutex>
#include <string>

/**
 * ConnectivityManager - reconnect state machine for the exchange stream
 *
 * Tracks the stream connection through DISCONNECTED, CONNECTING, CONNECTED,
 * BACKING_OFF and FAILED. Each failure yields the next backoff delay
 * (initial_delay * multiplier^(attempt-1)). Once the attempt count exceeds the
 * configured maximum the manager enters FAILED and stays there.
 * A subscription acknowledgement resets the attempt count.
 */
class ConnectivityManager {
public:
    enum class ConnectionStatus {
        DISCONNECTED,       // No connection, no attempt in progress
        CONNECTING,         // Attempt in progress
        CONNECTED,          // Transport up (subscriptions may be pending)
        BACKING_OFF,        // Waiting before the next attempt
        FAILED              // Attempts exhausted, terminal
    };

    struct ConnectivityState {
        ConnectionStatus status = ConnectionStatus::DISCONNECTED;
        std::chrono::steady_clock::time_point last_success;
        std::chrono::steady_clock::time_point last_failure;
        std::chrono::steady_clock::time_point next_retry_time;
        int consecutive_failures = 0;
        long long retry_delay_milliseconds = 0;
        std::string last_error_message;
    };

    struct FailureOutcome {
        bool exhausted;                     // true once FAILED has been entered
        long long retry_delay_milliseconds; // delay to wait before the next attempt (0 when exhausted)
    };

private:
    mutable std::mutex state_mutex_;
    ConnectivityState state_;

    const int max_attempts;
    const long long initial_delay_milliseconds;
    const double backoff_multiplier;

public:
    ConnectivityManager(int max_reconnect_attempts, long long initial_reconnect_delay_ms, double reconnect_multiplier);

    ConnectivityManager(const ConnectivityManager&) = delete;
    ConnectivityManager& operator=(const ConnectivityManager&) = delete;

    // Returns false when the manager is FAILED and no attempt may start.
    bool begin_connect_attempt();
    void report_connected();
    void report_subscribed();
    FailureOutcome report_failure(const std::string& error_message);
    void report_disconnected();

    ConnectionStatus get_status() const;
    ConnectivityState get_state() const;
    int get_consecutive_failures() const;
    long long get_retry_delay_milliseconds() const;
    bool is_failed() const;
    std::string get_status_string() const;

    static std::string status_to_string(ConnectionStatus status);

    // Backoff delay for the given 1-based failure number.
    long long compute_delay_milliseconds(int attempt_number) const;
};

#endif // CONNECTIVITY_MANAGER_HPP
