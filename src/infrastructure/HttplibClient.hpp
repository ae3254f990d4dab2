/**
 * @file HttplibClient.hpp
 * @brief cpp-httplib implementation of the HttpClient port.
 */

#pragma once
#include "domain/HttpClient.hpp"

namespace logoscout::infrastructure {

/**
 * @class HttplibClient
 * @brief Blocking HTTPS client with per-request deadline and cancellation.
 *
 * A fresh httplib::Client is created per request, so one instance can be used
 * from several threads at once.
 */
class HttplibClient : public domain::HttpClient {
public:
    HttplibClient() = default;

    /** @brief Performs the GET. @see domain::HttpClient::get */
    domain::HttpResponse get(const domain::HttpRequest& request) override;
};

} // namespace logoscout::infrastructure
