#include "inputs/text_input.h"
#include "logger.h"
#include "utils.h"
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <stdexcept>
#include <unistd.h>

namespace parley {

TextInput::TextInput(StatusNotifier* notifier, int fd)
    : Input("TextInput", notifier), fd_(fd) {
    if (fd_ < 0) {
        throw std::invalid_argument("TextInput needs a valid file descriptor, got " + std::to_string(fd_));
    }
}

void TextInput::start() {
    LOG_INPUT("Reading utterances from fd " + std::to_string(fd_));
    notify_status(Status::Idle);
}

void TextInput::stop() {
    notify_status(Status::Idle);
}

std::optional<Tokens> TextInput::read() {
    drain();

    // A trailing line without a newline still counts once the stream has ended
    if (eof_ && !pending_.empty() && pending_.find('\n') == std::string::npos) {
        pending_ += '\n';
    }

    while (auto line = next_line()) {
        Tokens tokens = utils::tokenize(*line);
        if (tokens.empty()) {
            continue;
        }
        notify_status(Status::Active);
        notify_status(Status::Idle);
        return tokens;
    }
    return std::nullopt;
}

void TextInput::drain() {
    if (eof_) {
        return;
    }

    char buffer[1024];
    while (true) {
        struct pollfd pfd;
        pfd.fd = fd_;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int ready = ::poll(&pfd, 1, 0);
        if (ready < 0) {
            if (errno == EINTR) {
                return;
            }
            throw std::runtime_error(std::string("poll failed: ") + std::strerror(errno));
        }
        if (ready == 0 || (pfd.revents & (POLLIN | POLLHUP)) == 0) {
            return;
        }

        ssize_t n = ::read(fd_, buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                return;
            }
            throw std::runtime_error(std::string("read failed: ") + std::strerror(errno));
        }
        if (n == 0) {
            LOG_INPUT("End of input on fd " + std::to_string(fd_));
            eof_ = true;
            return;
        }
        pending_.append(buffer, static_cast<size_t>(n));
    }
}

std::optional<std::string> TextInput::next_line() {
    size_t newline = pending_.find('\n');
    if (newline == std::string::npos) {
        return std::nullopt;
    }
    std::string line = pending_.substr(0, newline);
    pending_.erase(0, newline + 1);
    return line;
}

} // namespace parley
