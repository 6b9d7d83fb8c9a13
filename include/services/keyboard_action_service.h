#pragma once

#include "key_phrase.h"
#include "service.h"
#include <string>
#include <vector>

namespace parley {

/**
 * @brief Turns spoken desktop commands ("copy that", "open terminal") into key chords
 *
 * The chord is sent by running `<command> key <chord>` (xdotool syntax) when
 * the handler runs. Handlers say nothing, expect a follow-up
 * and do not stop lower-ranked handlers.
 */
class KeyboardActionService : public Service {
public:
    struct Action {
        KeyPhrase phrase;
        std::string chord;  ///< xdotool key chord, e.g. "ctrl+shift+c"
    };

    KeyboardActionService(StatusNotifier* notifier, float belief = 0.8f, std::string command = "xdotool");

    void start() override;
    std::unique_ptr<Handler> evaluate(const Tokens& tokens) override;

    /// Chord for an utterance that starts with a known phrase
    std::optional<std::string> chord_for(const std::vector<std::string>& words) const;

    /// Run the key command for a chord. Throws std::runtime_error if it fails.
    void press(const std::string& chord);

    const std::vector<Action>& actions() const { return actions_; }

private:
    float belief_;
    std::string command_;
    std::vector<Action> actions_;
};

} // namespace parley
