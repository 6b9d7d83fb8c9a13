#pragma once

#include "component.h"
#include <map>
#include <mutex>
#include <optional>
#include <set>

namespace parley {

/**
 * @brief StatusNotifier that logs transitions and keeps a live view of them
 *
 * Remembers the last status of every component it has been told about and,
 * per component kind, which components are currently non-idle and since when
 * that kind has been busy. A status indicator (LED, tray icon) can poll it
 * from its own thread.
 */
class StatusBoard : public StatusNotifier {
public:
    void update_status(const Component& component, Status status) override;

    /// Last reported status, or nullopt for an unknown component
    std::optional<Status> status_of(const Component& component) const;

    /// Number of non-idle components of a kind
    size_t busy_count(ComponentKind kind) const;

    /// Milliseconds since the kind went busy, or -1 if none of its components are busy
    int64_t ms_busy(ComponentKind kind) const;

private:
    struct KindState {
        std::set<const Component*> busy;
        TimePoint busy_since{};
    };

    KindState& state_for(ComponentKind kind);
    const KindState& state_for(ComponentKind kind) const;

    mutable std::mutex mutex_;
    std::map<const Component*, Status> statuses_;
    KindState inputs_;
    KindState outputs_;
    KindState services_;
};

} // namespace parley
