#include "signal_binding.h"
#include "dispatcher.h"
#include <atomic>
#include <csignal>
#include <stdexcept>

namespace parley {

namespace {

std::atomic<Dispatcher*> g_dispatcher{nullptr};

// Only flips atomics; the main loop does the logging
void signal_handler(int signal) {
    Dispatcher* dispatcher = g_dispatcher.load();
    if (!dispatcher) {
        return;
    }
    if (signal == SIGINT) {
        dispatcher->interrupt();
    } else {
        dispatcher->stop();
    }
}

} // namespace

SignalBinding::SignalBinding(Dispatcher& dispatcher) {
    Dispatcher* expected = nullptr;
    if (!g_dispatcher.compare_exchange_strong(expected, &dispatcher)) {
        throw std::logic_error("Signals are already bound to a dispatcher");
    }
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
}

SignalBinding::~SignalBinding() {
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    g_dispatcher = nullptr;
}

bool SignalBinding::active() {
    return g_dispatcher.load() != nullptr;
}

} // namespace parley
