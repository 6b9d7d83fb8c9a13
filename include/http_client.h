#pragma once

#include "errors.h"
#include <memory>
#include <string>

namespace parley {

struct HttpResponse {
    int status_code = 0;
    std::string body;

    bool ok() const { return status_code >= 200 && status_code < 300; }
};

/**
 * @brief Minimal blocking HTTP client (libcurl)
 *
 * Transport failures come back as NetworkError; any HTTP status, including
 * 4xx/5xx, is a successful HttpResponse for the caller to inspect.
 */
class HttpClient {
public:
    explicit HttpClient(int timeout_ms = 5000, int connect_timeout_ms = 2000);
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    Result<HttpResponse> get(const std::string& url);

    /// POST a JSON body (Content-Type: application/json)
    Result<HttpResponse> post_json(const std::string& url, const std::string& body);

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace parley
