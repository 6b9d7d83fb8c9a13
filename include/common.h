#pragma once

#include <cstdint>
#include <vector>
#include <string>
#include <chrono>

namespace parley {

// Timing
using TimePoint = std::chrono::steady_clock::time_point;
using Duration = std::chrono::milliseconds;

inline int64_t ms_since(TimePoint start) {
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration_cast<Duration>(now - start).count();
}

/// Wall-clock milliseconds since the epoch (for payload timestamps)
inline int64_t epoch_ms() {
    return std::chrono::duration_cast<Duration>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// Dispatcher defaults
constexpr int DEFAULT_POLL_INTERVAL_MS = 100;
constexpr const char* DEFAULT_APOLOGY_TEXT = "I'm sorry, I don't know how to help with that";

/**
 * @brief Component status as reported to the StatusNotifier
 */
enum class Status {
    Initializing,
    Idle,
    Active,
    Working
};

inline const char* status_string(Status status) {
    switch (status) {
        case Status::Initializing: return "<INITIALISING>";
        case Status::Idle:         return "<IDLE>";
        case Status::Active:       return "<ACTIVE>";
        case Status::Working:      return "<WORKING>";
        default: return "<UNKNOWN>";
    }
}

/**
 * @brief Which section of the system a component plugs into
 */
enum class ComponentKind {
    Input,
    Output,
    Service
};

inline const char* kind_string(ComponentKind kind) {
    switch (kind) {
        case ComponentKind::Input:   return "input";
        case ComponentKind::Output:  return "output";
        case ComponentKind::Service: return "service";
        default: return "unknown";
    }
}

/// One unit of an utterance as delivered by an input
struct Token {
    std::string element;
    float confidence = 1.0f;   ///< Recogniser confidence (1.0 for typed text)
    int64_t start_ms = -1;     ///< Offset into the utterance (-1 = unknown)
    int64_t end_ms = -1;

    Token() = default;
    explicit Token(std::string e) : element(std::move(e)) {}
};

using Tokens = std::vector<Token>;

} // namespace parley
