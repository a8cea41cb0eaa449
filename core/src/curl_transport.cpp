#include "keyreg/transport.hpp"
#include <curl/curl.h>
#include <glog/logging.h>
#include <memory>
#include <mutex>

namespace keyreg {

namespace {

// libcurl global state, initialized once for the process
void ensure_curl_initialized() {
    static std::once_flag once;
    std::call_once(once, []() {
        CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK) {
            LOG(ERROR) << "curl_global_init failed: " << curl_easy_strerror(rc);
        }
    });
}

struct EasyHandleDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

struct HeaderListDeleter {
    void operator()(curl_slist* headers) const { curl_slist_free_all(headers); }
};

using EasyHandle = std::unique_ptr<CURL, EasyHandleDeleter>;
using HeaderList = std::unique_ptr<curl_slist, HeaderListDeleter>;

size_t write_callback(char* contents, size_t size, size_t nmemb, void* userp) {
    static_cast<std::string*>(userp)->append(contents, size * nmemb);
    return size * nmemb;
}

TransportError::Kind classify(CURLcode code) {
    switch (code) {
        case CURLE_COULDNT_CONNECT:
            return TransportError::Kind::CONNECTION_FAILED;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
            return TransportError::Kind::HOST_RESOLUTION;
        case CURLE_OPERATION_TIMEDOUT:
            return TransportError::Kind::TIMEOUT;
        default:
            return TransportError::Kind::OTHER;
    }
}

class CurlTransport : public HttpTransport {
public:
    CurlTransport() {
        ensure_curl_initialized();
    }

    HttpResponse post_json(
        const std::string& url,
        const std::string& json_body,
        std::chrono::milliseconds timeout) override {

        // Fresh handle per call: connections are never reused
        EasyHandle curl(curl_easy_init());
        if (!curl) {
            throw TransportError(TransportError::Kind::OTHER, url, "failed to initialize CURL");
        }

        curl_slist* raw_headers = nullptr;
        raw_headers = curl_slist_append(raw_headers, "Content-Type: application/json");
        raw_headers = curl_slist_append(raw_headers, "Accept: application/json");
        raw_headers = curl_slist_append(raw_headers, "Expect:");
        HeaderList headers(raw_headers);

        std::string response_body;
        char error_buffer[CURL_ERROR_SIZE] = {0};

        curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, json_body.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(json_body.size()));
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response_body);
        curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
        curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 0L);
        curl_easy_setopt(curl.get(), CURLOPT_FORBID_REUSE, 1L);

        VLOG(1) << "POST " << url << " body: " << json_body;

        CURLcode res = curl_easy_perform(curl.get());
        if (res != CURLE_OK) {
            std::string message = error_buffer[0] != '\0' ? error_buffer : curl_easy_strerror(res);
            throw TransportError(classify(res), url, message);
        }

        HttpResponse response;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status_code);
        response.body = std::move(response_body);

        VLOG(1) << "Response " << response.status_code << " from " << url << ": " << response.body;
        return response;
    }
};

} // namespace

const char* to_string(TransportError::Kind kind) {
    switch (kind) {
        case TransportError::Kind::CONNECTION_FAILED: return "connection failed";
        case TransportError::Kind::HOST_RESOLUTION: return "host resolution failed";
        case TransportError::Kind::TIMEOUT: return "timeout";
        case TransportError::Kind::OTHER: return "transport error";
    }
    return "transport error";
}

std::unique_ptr<HttpTransport> HttpTransport::create() {
    return std::make_unique<CurlTransport>();
}

} // namespace keyreg
