#pragma once

#include "component.h"
#include <ostream>
#include <string>

namespace parley {

/// Prints each response as a line on a stream (stdout unless told otherwise)
class ConsoleOutput : public Output {
public:
    explicit ConsoleOutput(StatusNotifier* notifier, std::string prefix = "");
    ConsoleOutput(StatusNotifier* notifier, std::string prefix, std::ostream& stream);

    void start() override;
    void stop() override;
    void write(const std::string& text) override;

private:
    std::string prefix_;
    std::ostream& stream_;
};

} // namespace parley
