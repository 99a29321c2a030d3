// main.cpp
#include "system/system_manager.hpp"
#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <iostream>
#include <string>
#include <signal.h>

using namespace OkxTrader::System;

// =============================================================================
// SIGNAL ROUTING
// =============================================================================

/**
 * Routes SIGINT/SIGTERM to the running SystemState.
 * The handler touches atomics only; run() notices the flag on its next poll.
 * A signal that arrives before the state exists is remembered and replayed
 * once attach() is called.
 */
class ShutdownSignalRouter {
public:
    static ShutdownSignalRouter& get_instance() {
        static ShutdownSignalRouter router;
        return router;
    }

    bool install() {
        struct sigaction shutdown_action;
        std::memset(&shutdown_action, 0, sizeof(shutdown_action));
        shutdown_action.sa_handler = &ShutdownSignalRouter::on_signal;
        sigemptyset(&shutdown_action.sa_mask);

        struct sigaction ignore_action;
        std::memset(&ignore_action, 0, sizeof(ignore_action));
        ignore_action.sa_handler = SIG_IGN;
        sigemptyset(&ignore_action.sa_mask);

        // SIGPIPE ignored: a dropped TLS peer surfaces as a write error
        return sigaction(SIGINT, &shutdown_action, nullptr) == 0 &&
               sigaction(SIGTERM, &shutdown_action, nullptr) == 0 &&
               sigaction(SIGPIPE, &ignore_action, nullptr) == 0;
    }

    void attach(SystemState* state) {
        attached_state.store(state);
        if (state && received_signal.load() != 0) {
            state->shutdown_requested.store(true);
        }
    }

private:
    std::atomic<int> received_signal{0};
    std::atomic<SystemState*> attached_state{nullptr};

    ShutdownSignalRouter() = default;
    ShutdownSignalRouter(const ShutdownSignalRouter&) = delete;
    ShutdownSignalRouter& operator=(const ShutdownSignalRouter&) = delete;

    static void on_signal(int signal_number) {
        ShutdownSignalRouter& router = get_instance();
        router.received_signal.store(signal_number);
        SystemState* state = router.attached_state.load();
        if (state) {
            state->shutdown_requested.store(true);
        }
    }
};

// =============================================================================
// ENTRY POINT
// =============================================================================

// Usage: okx_trader [config_directory]   (defaults to ./config)
int main(int argc, char* argv[]) {
    const std::string config_directory = argc > 1 ? std::string(argv[1]) : std::string("config");
    ShutdownSignalRouter& signal_router = ShutdownSignalRouter::get_instance();

    if (!signal_router.install()) {
        std::cerr << "Fatal error: cannot install signal handlers: " << std::strerror(errno) << std::endl;
        return EXIT_CODE_INITIALIZATION_FAILURE;
    }

    SystemInitializationResult initialization_result;
    try {
        initialization_result = initialize(config_directory);
    } catch (const std::exception& initialization_error) {
        std::cerr << "Initialization failed: " << initialization_error.what() << std::endl;
        return EXIT_CODE_INITIALIZATION_FAILURE;
    }

    SystemState& system_state = *initialization_result.system_state;
    signal_router.attach(&system_state);

    SystemThreads thread_handles;
    try {
        thread_handles = startup(system_state, initialization_result.logger);
    } catch (const std::exception& startup_error) {
        std::cerr << "Startup failed: " << startup_error.what() << std::endl;
        signal_router.attach(nullptr);
        return EXIT_CODE_INITIALIZATION_FAILURE;
    }

    int exit_code = run(system_state);
    shutdown(system_state, thread_handles, initialization_result.logger, exit_code);

    signal_router.attach(nullptr);
    return exit_code;
}
