#pragma once
#include <functional>
#include <csignal>

// Signals are forwarded through a pipe to a dispatcher thread, so callbacks
// run outside signal context and may lock, log or cancel freely.
namespace SignalManager {

using SignalCallback = std::function<void(int)>;

// Final callbacks run after every normal callback for the same signal
void register_signal(int signum, SignalCallback cb, bool is_final = false);

// Install handlers for every registered signal and start the dispatcher
void setup();

// Restore default handlers, stop the dispatcher and drop all callbacks
void shutdown();

// setup() for the lifetime of a scope; shutdown() runs however the scope is left
class SignalGuard {
public:
    SignalGuard() {
        try {
            setup();
        } catch (...) {
            shutdown();
            throw;
        }
    }

    ~SignalGuard() {
        shutdown();
    }

    SignalGuard(const SignalGuard&) = delete;
    SignalGuard& operator=(const SignalGuard&) = delete;
};

}
