#pragma once

#include "component.h"
#include <optional>
#include <string>
#include <vector>

namespace parley {

/**
 * @brief Replays utterances from a text file, one non-blank line per read()
 *
 * Useful for demos and regression runs. Lines are released no faster than
 * interval_ms apart. The file is loaded by start().
 */
class ReplayInput : public Input {
public:
    ReplayInput(StatusNotifier* notifier, std::string path, int interval_ms = 0);

    void start() override;
    void stop() override;
    std::optional<Tokens> read() override;

    bool exhausted() const { return next_ >= lines_.size(); }

private:
    std::string path_;
    int interval_ms_;
    std::vector<std::string> lines_;
    size_t next_ = 0;
    TimePoint last_release_{};
    bool released_any_ = false;
};

} // namespace parley
