#pragma once

#include "service.h"

namespace parley {

/// "say ..." / "repeat ..." answers with the rest of the utterance
class EchoService : public Service {
public:
    explicit EchoService(StatusNotifier* notifier, float belief = 0.5f);

    void start() override;
    std::unique_ptr<Handler> evaluate(const Tokens& tokens) override;

private:
    float belief_;
};

} // namespace parley
