#include "outputs/feed_output.h"
#include "logger.h"
#include <stdexcept>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace parley {

FeedOutput::FeedOutput(StatusNotifier* notifier, std::string url, int timeout_ms)
    : Output("FeedOutput", notifier), url_(std::move(url)), http_(timeout_ms) {
    if (url_.empty()) {
        throw std::invalid_argument("FeedOutput needs a url");
    }
}

void FeedOutput::start() {
    LOG_OUTPUT("Posting responses to " + url_);
    notify_status(Status::Idle);
}

void FeedOutput::stop() {
    notify_status(Status::Idle);
}

std::string FeedOutput::payload_for(const std::string& text, int64_t timestamp_ms) {
    json payload;
    payload["event"] = "response";
    payload["text"] = text;
    payload["timestamp_ms"] = timestamp_ms;
    return payload.dump();
}

void FeedOutput::write(const std::string& text) {
    notify_status(Status::Active);
    Result<HttpResponse> result = http_.post_json(url_, payload_for(text, epoch_ms()));
    notify_status(Status::Idle);

    if (result.is_error()) {
        throw std::runtime_error(result.error().message);
    }
    const HttpResponse& response = result.value();
    if (!response.ok()) {
        throw std::runtime_error("feed server answered HTTP " + std::to_string(response.status_code)
            + ": " + response.body);
    }
}

} // namespace parley
