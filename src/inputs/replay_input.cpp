#include "inputs/replay_input.h"
#include "logger.h"
#include "utils.h"
#include <chrono>
#include <fstream>
#include <stdexcept>

namespace parley {

ReplayInput::ReplayInput(StatusNotifier* notifier, std::string path, int interval_ms)
    : Input("ReplayInput", notifier), path_(std::move(path)), interval_ms_(interval_ms) {
    if (interval_ms_ < 0) {
        throw std::invalid_argument("ReplayInput interval_ms must not be negative");
    }
}

void ReplayInput::start() {
    std::ifstream file(path_);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open replay file: " + path_);
    }

    lines_.clear();
    std::string line;
    while (std::getline(file, line)) {
        if (!utils::is_empty_or_whitespace(line)) {
            lines_.push_back(line);
        }
    }
    next_ = 0;
    released_any_ = false;

    LOG_INPUT("Replaying " + std::to_string(lines_.size()) + " utterances from " + path_);
    notify_status(Status::Idle);
}

void ReplayInput::stop() {
    notify_status(Status::Idle);
}

std::optional<Tokens> ReplayInput::read() {
    if (exhausted()) {
        return std::nullopt;
    }
    if (released_any_ && ms_since(last_release_) < interval_ms_) {
        return std::nullopt;
    }

    notify_status(Status::Active);
    Tokens tokens = utils::tokenize(lines_[next_++]);
    last_release_ = std::chrono::steady_clock::now();
    released_any_ = true;
    notify_status(Status::Idle);
    return tokens;
}

} // namespace parley
