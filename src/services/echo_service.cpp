#include "services/echo_service.h"
#include "utils.h"

namespace parley {

namespace {

class EchoHandler : public Handler {
public:
    EchoHandler(Service& service, const Tokens& tokens, float belief)
        : Handler(service, tokens, belief) {}

    std::optional<HandlerResult> handle() override {
        std::string text = utils::join_elements(tokens().begin() + 1, tokens().end());
        if (text.empty()) {
            return std::nullopt;
        }
        return HandlerResult::reply(text);
    }
};

} // namespace

EchoService::EchoService(StatusNotifier* notifier, float belief)
    : Service("Echo", notifier), belief_(belief) {}

void EchoService::start() {
    notify_status(Status::Idle);
}

std::unique_ptr<Handler> EchoService::evaluate(const Tokens& tokens) {
    if (tokens.size() < 2) {
        return nullptr;
    }
    std::string verb = utils::to_letters(tokens.front().element);
    if (verb != "say" && verb != "repeat") {
        return nullptr;
    }
    return std::make_unique<EchoHandler>(*this, tokens, belief_);
}

} // namespace parley
