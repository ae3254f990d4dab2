/**
 * @file HttpClient.hpp
 * @brief Interface for bounded, cancellable HTTP GET retrieval.
 */

#pragma once
#include <chrono>
#include <string>
#include <utility>
#include <vector>
#include "CancellationToken.hpp"

namespace logoscout::domain {

/**
 * @struct HttpRequest
 * @brief A single GET request with its own deadline.
 */
struct HttpRequest {
    std::string url; ///< Absolute URL, scheme included. Query must already be encoded.
    std::vector<std::pair<std::string, std::string>> headers;
    std::chrono::milliseconds timeout{10000};
    bool followRedirects = true;
    const CancellationToken* cancel = nullptr; ///< Optional, not owned.
};

struct HttpResponse {
    int status = 0;
    std::string body;
    std::string contentType;

    bool ok() const { return status >= 200 && status < 300; }
};

/**
 * @class HttpClient
 * @brief Abstract transport used by every network-facing component.
 *
 * Implementations must enforce HttpRequest::timeout by aborting the underlying
 * connection, and must honor HttpRequest::cancel. Transport failures (DNS,
 * connect, TLS, timeout, cancellation) are reported by throwing; any HTTP status
 * received from the server is returned, not thrown.
 */
class HttpClient {
public:
    virtual ~HttpClient() = default;

    /**
     * @brief Performs a GET request.
     * @param request URL, headers and limits.
     * @return Status, body and content type of the final response.
     * @throws infrastructure::HttpError on transport failure.
     */
    virtual HttpResponse get(const HttpRequest& request) = 0;
};

} // namespace logoscout::domain
