#include "component.h"
#include "logger.h"
#include <exception>

namespace parley {

void Component::notify_status(Status status) {
    status_ = status;
    if (notifier_ == nullptr) {
        return;
    }
    try {
        notifier_->update_status(*this, status);
    } catch (const std::exception& e) {
        Logger::warn("Notifier failed for " + name_ + " -> " + status_string(status) + ": " + e.what());
    }
}

} // namespace parley
