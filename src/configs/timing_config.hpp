// TimingConfig.hpp
#ifndef TIMING_CONFIG_HPP
#define TIMING_CONFIG_HPP

struct TimingConfig {
    // ========================================================================
    // THREAD POLLING INTERVALS
    // ========================================================================

    int thread_logging_poll_interval_ms;             // Logging thread flush interval in milliseconds
    int event_wait_timeout_ms;                       // Consumer wait on event queues in milliseconds

    // ========================================================================
    // SYSTEM HEALTH MONITORING
    // ========================================================================

    int market_status_logging_interval_seconds;      // Market status table interval in seconds

    // ========================================================================
    // EVENT QUEUE CAPACITIES
    // ========================================================================

    int tick_queue_capacity;                         // Per-subscriber tick queue (drops oldest)
    int bar_queue_capacity;                          // Per-subscriber bar queue (never drops)
    int signal_queue_capacity;                       // Per-subscriber signal queue (never drops)
    int warning_queue_capacity;                      // Per-subscriber warning queue (drops oldest)

    TimingConfig()
        : thread_logging_poll_interval_ms(500), event_wait_timeout_ms(250), market_status_logging_interval_seconds(60),
          tick_queue_capacity(256), bar_queue_capacity(64), signal_queue_capacity(16), warning_queue_capacity(32) {}
};

#endif // TIMING_CONFIG_HPP
