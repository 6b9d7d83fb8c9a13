#pragma once

#include "component.h"
#include <optional>
#include <string>

namespace parley {

/**
 * @brief Typed utterances, one per line, from a file descriptor (stdin by default)
 *
 * read() never blocks: it polls the descriptor, drains what is available and
 * hands back the next complete non-blank line split on whitespace. The
 * descriptor is not closed by stop().
 */
class TextInput : public Input {
public:
    explicit TextInput(StatusNotifier* notifier, int fd = 0);

    void start() override;
    void stop() override;
    std::optional<Tokens> read() override;

    /// True once the other end has closed and every buffered line has been read
    bool at_end() const { return eof_ && pending_.empty(); }

private:
    /// Pull whatever bytes are ready into pending_
    void drain();

    /// Take the next complete line out of pending_, if there is one
    std::optional<std::string> next_line();

    int fd_;
    std::string pending_;
    bool eof_ = false;
};

} // namespace parley
