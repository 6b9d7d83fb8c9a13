#include "outputs/console_output.h"
#include <iostream>
#include <stdexcept>

namespace parley {

ConsoleOutput::ConsoleOutput(StatusNotifier* notifier, std::string prefix)
    : ConsoleOutput(notifier, std::move(prefix), std::cout) {}

ConsoleOutput::ConsoleOutput(StatusNotifier* notifier, std::string prefix, std::ostream& stream)
    : Output("ConsoleOutput", notifier), prefix_(std::move(prefix)), stream_(stream) {}

void ConsoleOutput::start() {
    notify_status(Status::Idle);
}

void ConsoleOutput::stop() {
    stream_.flush();
    notify_status(Status::Idle);
}

void ConsoleOutput::write(const std::string& text) {
    notify_status(Status::Active);
    stream_ << prefix_ << text << std::endl;
    notify_status(Status::Idle);
    if (!stream_) {
        throw std::runtime_error("console stream is not writable");
    }
}

} // namespace parley
