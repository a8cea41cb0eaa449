/**
 * @file transport.hpp
 * @brief HTTP transport used by the registration client
 *
 * The transport knows one request shape: a JSON document POSTed to a URL,
 * bounded by a timeout that covers the whole exchange. Each call opens its
 * own connection; nothing is pooled between calls.
 */

#pragma once

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

namespace keyreg {

/// Reply received from the server, whatever its status
struct HttpResponse {
    long status_code = 0;
    std::string body;

    bool is_success() const { return status_code >= 200 && status_code < 300; }
};

/**
 * @brief The request/response exchange could not be completed
 *
 * Raised for connectivity problems and timeouts, never for an HTTP status.
 */
class TransportError : public std::runtime_error {
public:
    enum class Kind {
        CONNECTION_FAILED,  ///< Refused or unreachable
        HOST_RESOLUTION,    ///< Host name could not be resolved
        TIMEOUT,            ///< No complete response within the timeout
        OTHER
    };

    TransportError(Kind kind, const std::string& url, const std::string& message)
        : std::runtime_error("POST " + url + " failed: " + message)
        , kind_(kind)
        , url_(url) {}

    Kind kind() const { return kind_; }
    const std::string& url() const { return url_; }

private:
    Kind kind_;
    std::string url_;
};

const char* to_string(TransportError::Kind kind);

class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    /// Create the libcurl backed transport
    static std::unique_ptr<HttpTransport> create();

    /**
     * @brief POST a JSON document and wait for the reply
     * @param url Absolute http:// URL
     * @param json_body Serialized JSON request body
     * @param timeout Limit for connect and response together
     * @return Status code and body of the reply
     * @throws TransportError if no reply was received
     */
    virtual HttpResponse post_json(
        const std::string& url,
        const std::string& json_body,
        std::chrono::milliseconds timeout) = 0;
};

} // namespace keyreg
