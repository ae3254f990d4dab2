/**
 * @file HttplibClient.cpp
 * @brief Implementation of HttplibClient.
 */

#include "infrastructure/HttplibClient.hpp"
#include "infrastructure/HttpError.hpp"
#include "infrastructure/UrlUtils.hpp"
#include <httplib.h>
#include <chrono>
#include <cstdint>
#include <ctime>

namespace logoscout::infrastructure {

namespace {

constexpr int kMaxRedirects = 10;

// Below this much remaining budget a failed transfer counts as a timeout.
constexpr std::chrono::milliseconds kDeadlineSlack(20);

bool IsRedirect(int status) {
    return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

HttpError TimeoutError(const domain::HttpRequest& request) {
    return HttpError(HttpError::Kind::Timeout,
                     "Request timed out after " + std::to_string(request.timeout.count()) + "ms");
}

} // namespace

domain::HttpResponse HttplibClient::get(const domain::HttpRequest& request) {
    using Clock = std::chrono::steady_clock;

    httplib::Headers headers;
    for (const auto& header : request.headers) {
        headers.emplace(header.first, header.second);
    }

    // request.timeout bounds the whole call, redirect hops included. Each hop
    // gets only what is left of it.
    const auto deadline = Clock::now() + request.timeout;
    std::string url = request.url;

    for (int hop = 0;; ++hop) {
        auto parts = UrlUtils::Split(url);
        if (!parts) {
            throw HttpError(HttpError::Kind::InvalidUrl, "Invalid URL: " + url);
        }
        if (request.cancel && request.cancel->isCancelled()) {
            throw HttpError(HttpError::Kind::Cancelled, "Request cancelled");
        }
        const auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
        if (remaining.count() <= 0) {
            throw TimeoutError(request);
        }

        httplib::Client cli(parts->origin);
        cli.set_connection_timeout(remaining);
        cli.set_read_timeout(remaining);
        cli.set_write_timeout(remaining);
        // Caps connect, headers and body together; socket timeouts alone restart per read.
        cli.set_max_timeout(static_cast<time_t>(remaining.count()));
        cli.set_follow_location(false);

        // The progress hook makes httplib drop the connection on cancel.
        bool deadlineHit = false;
        auto progress = [&](std::uint64_t, std::uint64_t) {
            if (request.cancel && request.cancel->isCancelled()) {
                return false;
            }
            if (Clock::now() >= deadline) {
                deadlineHit = true;
                return false;
            }
            return true;
        };

        auto res = cli.Get(parts->pathAndQuery, headers, progress);
        if (!res) {
            if (request.cancel && request.cancel->isCancelled()) {
                throw HttpError(HttpError::Kind::Cancelled, "Request cancelled");
            }
            if (deadlineHit || Clock::now() + kDeadlineSlack >= deadline) {
                throw TimeoutError(request);
            }
            throw HttpError(HttpError::Kind::Connection,
                            "Connection failed: " + httplib::to_string(res.error()));
        }

        if (request.followRedirects && IsRedirect(res->status) && res->has_header("Location")) {
            if (hop >= kMaxRedirects) {
                throw HttpError(HttpError::Kind::Other,
                                "Too many redirects (" + std::to_string(kMaxRedirects) + ")");
            }
            url = UrlUtils::ResolveAgainst(parts->origin, res->get_header_value("Location"));
            continue;
        }

        domain::HttpResponse response;
        response.status = res->status;
        response.body = std::move(res->body);
        response.contentType = res->get_header_value("Content-Type");
        return response;
    }
}

} // namespace logoscout::infrastructure
