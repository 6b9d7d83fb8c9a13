#pragma once

#include "common.h"
#include <optional>
#include <string>

namespace parley {

class Component;

/**
 * @brief Receives component status transitions
 *
 * Called from whichever thread changed the status, on every transition.
 * Implementations must return quickly, must accept components they have not
 * seen before, and must not let failures escape into the caller.
 */
class StatusNotifier {
public:
    virtual ~StatusNotifier() = default;

    virtual void update_status(const Component& component, Status status) = 0;
};

/**
 * @brief A pluggable part of the system (input, output or service)
 *
 * Constructed once at startup, started once by the Dispatcher before the main
 * loop and stopped once at shutdown. The notifier is not owned and must outlive
 * the component; it may be null.
 */
class Component {
public:
    Component(std::string name, StatusNotifier* notifier)
        : name_(std::move(name)), notifier_(notifier) {}
    virtual ~Component() = default;

    Component(const Component&) = delete;
    Component& operator=(const Component&) = delete;

    /// One-time setup. Throwing aborts system startup.
    virtual void start() {}

    /// Release resources. Best effort; the Dispatcher logs anything thrown.
    virtual void stop() {}

    virtual ComponentKind kind() const = 0;

    /// Display name, e.g. "PurpleAir"
    const std::string& name() const { return name_; }

    Status status() const { return status_; }

protected:
    /// Record a status change and tell the notifier about it.
    void notify_status(Status status);

private:
    std::string name_;
    StatusNotifier* notifier_;
    Status status_ = Status::Initializing;
};

/**
 * @brief A source of utterances
 */
class Input : public Component {
public:
    using Component::Component;

    ComponentKind kind() const override { return ComponentKind::Input; }

    /**
     * @brief Non-blocking poll for the next utterance
     * @return A non-empty token batch, or nullopt when nothing is pending
     */
    virtual std::optional<Tokens> read() = 0;
};

/**
 * @brief A sink for responses (speech, display, console...)
 */
class Output : public Component {
public:
    using Component::Component;

    ComponentKind kind() const override { return ComponentKind::Output; }

    /// Deliver a response. May throw; the Dispatcher isolates failures per output.
    virtual void write(const std::string& text) = 0;
};

} // namespace parley
