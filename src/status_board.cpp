#include "status_board.h"
#include "logger.h"
#include <chrono>

namespace parley {

void StatusBoard::update_status(const Component& component, Status status) {
    LOG_STATUS("Component " + component.name() + " is now " + status_string(status));

    std::lock_guard<std::mutex> lock(mutex_);
    statuses_[&component] = status;

    KindState& state = state_for(component.kind());
    if (status == Status::Idle) {
        state.busy.erase(&component);
    } else if (status == Status::Active || status == Status::Working) {
        // Every new burst of activity restarts the clock
        state.busy.insert(&component);
        state.busy_since = std::chrono::steady_clock::now();
    }
}

std::optional<Status> StatusBoard::status_of(const Component& component) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = statuses_.find(&component);
    if (it == statuses_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t StatusBoard::busy_count(ComponentKind kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_for(kind).busy.size();
}

int64_t StatusBoard::ms_busy(ComponentKind kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const KindState& state = state_for(kind);
    if (state.busy.empty()) {
        return -1;
    }
    return ms_since(state.busy_since);
}

StatusBoard::KindState& StatusBoard::state_for(ComponentKind kind) {
    switch (kind) {
        case ComponentKind::Input:  return inputs_;
        case ComponentKind::Output: return outputs_;
        default:                    return services_;
    }
}

const StatusBoard::KindState& StatusBoard::state_for(ComponentKind kind) const {
    switch (kind) {
        case ComponentKind::Input:  return inputs_;
        case ComponentKind::Output: return outputs_;
        default:                    return services_;
    }
}

} // namespace parley
