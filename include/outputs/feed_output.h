#pragma once

#include "component.h"
#include "http_client.h"
#include <string>

namespace parley {

/**
 * @brief Posts each response to an HTTP endpoint as JSON
 *
 * Body: {"event": "response", "text": ..., "timestamp_ms": ...}.
 * A transport failure or non-2xx status makes write() throw.
 */
class FeedOutput : public Output {
public:
    FeedOutput(StatusNotifier* notifier, std::string url, int timeout_ms = 2000);

    void start() override;
    void stop() override;
    void write(const std::string& text) override;

    /// The JSON document write() sends for a response
    static std::string payload_for(const std::string& text, int64_t timestamp_ms);

private:
    std::string url_;
    HttpClient http_;
};

} // namespace parley
