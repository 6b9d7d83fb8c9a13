#pragma once

namespace parley {

class Dispatcher;

/**
 * @brief Routes SIGINT to Dispatcher::interrupt() and SIGTERM to Dispatcher::stop()
 *
 * While the binding exists the signal handlers reach the given Dispatcher.
 * Destroying the binding restores the default handlers before the Dispatcher
 * can go away, including when an exception unwinds past it. Only one binding
 * may exist at a time.
 */
class SignalBinding {
public:
    /// @throws std::logic_error if another binding is active
    explicit SignalBinding(Dispatcher& dispatcher);
    ~SignalBinding();

    SignalBinding(const SignalBinding&) = delete;
    SignalBinding& operator=(const SignalBinding&) = delete;

    /// True while some binding routes signals to a Dispatcher
    static bool active();
};

} // namespace parley
