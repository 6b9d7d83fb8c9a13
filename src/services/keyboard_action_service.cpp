#include "services/keyboard_action_service.h"
#include "logger.h"
#include "utils.h"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <sys/wait.h>
#include <unistd.h>

namespace parley {

namespace {

// Spoken phrase -> xdotool chord
const std::vector<std::pair<const char*, const char*>> KEY_ACTIONS = {
    {"Copy that",            "ctrl+c"},
    {"Paste that",           "ctrl+v"},
    {"Copy from terminal",   "ctrl+shift+c"},
    {"Paste to terminal",    "ctrl+shift+v"},
    {"Refresh",              "F5"},
    {"Open terminal",        "ctrl+alt+t"},
    {"Show applications",    "super"},
    {"Show notifications",   "super+m"},
    {"Open System Monitor",  "super+2"},
    {"Open Firefox",         "super+3"},
    {"Open Chrome",          "super+6"},
    {"Open Thunderbird",     "super+7"},
    {"Open Code",            "super+8"},
    {"Open Signal",          "super+9"},
    {"Open Slack",           "ctrl+alt+shift+s"},
    {"Next application",     "alt+Tab"},
    {"Last application",     "alt+shift+Tab"},
    {"Next window",          "alt+grave"},
    {"Last window",          "alt+shift+grave"},
    {"Press escape key",     "Escape"},
    {"Move up",              "Up"},
    {"Move down",            "Down"},
    {"Page up",              "Prior"},
    {"Page down",            "Next"},
};

class KeyPressHandler : public Handler {
public:
    KeyPressHandler(KeyboardActionService& service, const Tokens& tokens, float belief, std::string chord)
        : Handler(service, tokens, belief), service_(service), chord_(std::move(chord)) {}

    std::optional<HandlerResult> handle() override {
        service_.press(chord_);
        return HandlerResult::awaiting_reply();
    }

private:
    KeyboardActionService& service_;
    std::string chord_;
};

} // namespace

KeyboardActionService::KeyboardActionService(StatusNotifier* notifier, float belief, std::string command)
    : Service("KeyboardAction", notifier), belief_(belief), command_(std::move(command)) {
    if (command_.empty()) {
        throw std::invalid_argument("KeyboardAction needs a command to send keys with");
    }
    for (const auto& [phrase, chord] : KEY_ACTIONS) {
        actions_.push_back({parse_key_phrase(phrase), chord});
    }
}

void KeyboardActionService::start() {
    LOG_SERVICE("KeyboardAction sending keys with " + command_);
    notify_status(Status::Idle);
}

std::optional<std::string> KeyboardActionService::chord_for(const std::vector<std::string>& words) const {
    for (const auto& action : actions_) {
        if (words.size() >= action.phrase.size() &&
            std::equal(action.phrase.begin(), action.phrase.end(), words.begin())) {
            return action.chord;
        }
    }
    return std::nullopt;
}

std::unique_ptr<Handler> KeyboardActionService::evaluate(const Tokens& tokens) {
    auto chord = chord_for(utils::words_of(tokens));
    if (!chord) {
        return nullptr;
    }
    return std::make_unique<KeyPressHandler>(*this, tokens, belief_, *chord);
}

void KeyboardActionService::press(const std::string& chord) {
    notify_status(Status::Working);
    LOG_SERVICE("KeyboardAction pressing " + chord);

    pid_t pid = fork();
    if (pid == -1) {
        notify_status(Status::Idle);
        throw std::runtime_error(std::string("fork failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        // Child: no shell, so the chord needs no escaping
        execlp(command_.c_str(), command_.c_str(), "key", chord.c_str(), static_cast<char*>(nullptr));
        _exit(127);
    }

    int status = 0;
    pid_t waited;
    do {
        waited = waitpid(pid, &status, 0);
    } while (waited == -1 && errno == EINTR);
    notify_status(Status::Idle);

    if (waited == -1) {
        throw std::runtime_error(std::string("waitpid failed: ") + std::strerror(errno));
    }
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        int code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
        throw std::runtime_error(command_ + " key " + chord + " exited with status " + std::to_string(code));
    }
}

} // namespace parley
