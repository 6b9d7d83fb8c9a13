#include "http_client.h"
#include "logger.h"
#include <curl/curl.h>

namespace parley {

namespace {

size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    std::string* buffer = static_cast<std::string*>(userp);
    buffer->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

} // namespace

class HttpClient::Impl {
public:
    Impl(int timeout_ms, int connect_timeout_ms)
        : timeout_ms_(timeout_ms), connect_timeout_ms_(connect_timeout_ms) {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    }

    ~Impl() {
        curl_global_cleanup();
    }

    Result<HttpResponse> perform(const std::string& method, const std::string& url, const std::string& body) {
        CURL* curl = curl_easy_init();
        if (!curl) {
            return make_network_error("Failed to initialize CURL");
        }

        struct curl_slist* headers = nullptr;
        HttpResponse response;

        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms_));
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(connect_timeout_ms_));
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

        if (method == "POST") {
            headers = curl_slist_append(headers, "Content-Type: application/json");
            curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
        } else {
            curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
        }

        Logger::debug("[HTTP] " + method + " " + url);
        CURLcode res = curl_easy_perform(curl);

        std::string error_msg;
        if (res == CURLE_OK) {
            long http_code = 0;
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
            response.status_code = static_cast<int>(http_code);
        } else {
            error_msg = method + " " + url + " failed: " + curl_easy_strerror(res);
        }

        curl_slist_free_all(headers);
        curl_easy_cleanup(curl);

        if (!error_msg.empty()) {
            return make_network_error(error_msg);
        }
        return response;
    }

private:
    int timeout_ms_;
    int connect_timeout_ms_;
};

HttpClient::HttpClient(int timeout_ms, int connect_timeout_ms)
    : pimpl_(std::make_unique<Impl>(timeout_ms, connect_timeout_ms)) {}

HttpClient::~HttpClient() = default;

Result<HttpResponse> HttpClient::get(const std::string& url) {
    return pimpl_->perform("GET", url, "");
}

Result<HttpResponse> HttpClient::post_json(const std::string& url, const std::string& body) {
    return pimpl_->perform("POST", url, body);
}

} // namespace parley
