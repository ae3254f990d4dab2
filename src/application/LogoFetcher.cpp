/**
 * @file LogoFetcher.cpp
 * @brief Implementation of the logo sources and the fetch pipeline.
 */

#include "application/LogoFetcher.hpp"
#include "application/ImageValidator.hpp"
#include "infrastructure/HttpError.hpp"
#include "infrastructure/UrlUtils.hpp"
#include <algorithm>
#include <iostream>
#include <new>
#include <nlohmann/json.hpp>

namespace logoscout::application {

using json = nlohmann::json;

namespace {

const char* const kImageAccept = "image/*,*/*;q=0.8";

// Highest quality first.
const std::array<const char*, 4> kFaviconPaths = {
    "/apple-touch-icon.png",
    "/apple-touch-icon-precomposed.png",
    "/favicon-32x32.png",
    "/favicon.ico"
};

long long ElapsedMs(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
}

domain::LogoResult RequireValidImage(std::string buffer, const std::string& label, const std::string& url) {
    auto validation = ImageValidator::Validate(buffer);
    if (!validation.valid) {
        throw LogoSourceError(validation.reason.value_or("Invalid image from " + label));
    }
    return domain::LogoResult{std::move(buffer), *validation.info, label, url};
}

} // namespace

LogoFetcher::LogoFetcher(std::shared_ptr<domain::HttpClient> http, Settings settings)
    : m_http(std::move(http)), m_settings(std::move(settings)) {}

const std::array<SourceDescriptor, 4>& LogoFetcher::Sources() {
    static const std::array<SourceDescriptor, 4> sources = {{
        {LogoSource::LogoApi, "Clearbit", "Clearbit Logo API", false},
        {LogoSource::FaviconService, "Google Favicon", "Google Favicon Service", false},
        {LogoSource::InstantAnswer, "DuckDuckGo", "DuckDuckGo Instant Answer", true},
        {LogoSource::DirectFavicon, "Direct Favicon", "Direct Favicon", false},
    }};
    return sources;
}

domain::LogoFetchResult LogoFetcher::fetchLogo(const std::string& siteDomain,
                                               const std::string& companyName,
                                               domain::LogoSize size,
                                               const domain::CancellationToken* cancel) const {
    domain::LogoFetchResult result;

    for (const auto& source : Sources()) {
        if (cancel && cancel->isCancelled()) {
            result.error = "Logo fetch cancelled";
            return result;
        }

        const std::string& input = source.usesCompanyName ? companyName : siteDomain;
        const auto start = std::chrono::steady_clock::now();
        std::string attemptedUrl;

        try {
            auto logo = fetchFrom(source, input, size, cancel, attemptedUrl);
            result.attempts.push_back({source.name, logo.sourceUrl, true, std::nullopt, ElapsedMs(start)});
            result.success = true;
            result.logo = std::move(logo);
            return result;
        } catch (const std::bad_alloc&) {
            throw;
        } catch (const std::exception& e) {
            const std::string url = attemptedUrl.empty()
                ? "[" + std::string(source.name) + "] " + input
                : attemptedUrl;
            result.attempts.push_back({source.name, url, false, std::string(e.what()), ElapsedMs(start)});
            std::cerr << "[LogoFetcher] " << source.name << " failed for '" << input << "': "
                      << e.what() << std::endl;
        }
    }

    if (cancel && cancel->isCancelled()) {
        result.error = "Logo fetch cancelled";
    } else {
        result.error = "Failed to download logo from all " + std::to_string(Sources().size()) + " sources";
    }
    return result;
}

domain::LogoResult LogoFetcher::fetchFrom(const SourceDescriptor& source, const std::string& input,
                                          domain::LogoSize size, const domain::CancellationToken* cancel,
                                          std::string& attemptedUrl) const {
    switch (source.id) {
        case LogoSource::LogoApi:
            return fetchFromLogoApi(input, size, cancel, attemptedUrl);
        case LogoSource::FaviconService:
            return fetchFromFaviconService(input, size, cancel, attemptedUrl);
        case LogoSource::InstantAnswer:
            return fetchFromInstantAnswer(input, cancel, attemptedUrl);
        case LogoSource::DirectFavicon:
            return fetchDirectFavicon(input, cancel, attemptedUrl);
    }
    throw LogoSourceError("Unknown logo source");
}

std::string LogoFetcher::fetchBuffer(const std::string& url, std::chrono::milliseconds timeout,
                                     const domain::CancellationToken* cancel) const {
    domain::HttpRequest request;
    request.url = url;
    request.headers = {
        {"User-Agent", m_settings.userAgent},
        {"Accept", kImageAccept}
    };
    request.timeout = timeout;
    request.followRedirects = true;
    request.cancel = cancel;

    auto response = m_http->get(request);
    if (!response.ok()) {
        throw LogoSourceError("HTTP " + std::to_string(response.status));
    }
    return std::move(response.body);
}

domain::LogoResult LogoFetcher::fetchFromLogoApi(const std::string& siteDomain, domain::LogoSize size,
                                                 const domain::CancellationToken* cancel,
                                                 std::string& attemptedUrl) const {
    const int sizeParam = std::min(domain::LogoSizePixels(size) * 2, kLogoApiMaxSize);
    attemptedUrl = m_settings.logoApiBase + "/" + siteDomain + "?size=" + std::to_string(sizeParam) + "&format=png";

    return RequireValidImage(fetchBuffer(attemptedUrl, m_settings.sourceTimeout, cancel),
                             "Clearbit Logo API", attemptedUrl);
}

domain::LogoResult LogoFetcher::fetchFromFaviconService(const std::string& siteDomain, domain::LogoSize size,
                                                        const domain::CancellationToken* cancel,
                                                        std::string& attemptedUrl) const {
    const int sizeParam = std::min(domain::LogoSizePixels(size) * 2, kFaviconServiceMaxSize);
    attemptedUrl = m_settings.faviconServiceBase + "?domain=" + siteDomain + "&sz=" + std::to_string(sizeParam);

    auto logo = RequireValidImage(fetchBuffer(attemptedUrl, m_settings.sourceTimeout, cancel),
                                  "Google Favicon Service", attemptedUrl);

    // The service answers unknown domains with a tiny generic globe.
    if (logo.buffer.size() < kFaviconPlaceholderBytes && size != domain::LogoSize::Small) {
        throw LogoSourceError("Google returned a generic placeholder icon");
    }
    return logo;
}

domain::LogoResult LogoFetcher::fetchFromInstantAnswer(const std::string& companyName,
                                                       const domain::CancellationToken* cancel,
                                                       std::string& attemptedUrl) const {
    attemptedUrl = m_settings.instantAnswerBase + "?q=" +
                   infrastructure::UrlUtils::EncodeComponent(companyName + " company") +
                   "&format=json&no_html=1";

    domain::HttpRequest request;
    request.url = attemptedUrl;
    request.headers = {{"User-Agent", m_settings.userAgent}};
    request.timeout = m_settings.sourceTimeout;
    request.cancel = cancel;

    auto response = m_http->get(request);
    if (!response.ok()) {
        throw LogoSourceError("DDG API HTTP " + std::to_string(response.status));
    }

    std::string imageUrl;
    try {
        auto data = json::parse(response.body);
        if (data.is_object() && data.contains("Image") && data["Image"].is_string()) {
            imageUrl = data["Image"].get<std::string>();
        }
    } catch (const json::exception& e) {
        throw LogoSourceError(std::string("Malformed DuckDuckGo response: ") + e.what());
    }

    if (imageUrl.empty()) {
        throw LogoSourceError("No logo image found in DuckDuckGo response");
    }

    attemptedUrl = infrastructure::UrlUtils::ResolveAgainst(m_settings.instantAnswerOrigin, imageUrl);
    return RequireValidImage(fetchBuffer(attemptedUrl, m_settings.sourceTimeout, cancel),
                             "DuckDuckGo Instant Answer", attemptedUrl);
}

domain::LogoResult LogoFetcher::fetchDirectFavicon(const std::string& siteDomain,
                                                   const domain::CancellationToken* cancel,
                                                   std::string& attemptedUrl) const {
    std::string lastError;

    for (const char* path : kFaviconPaths) {
        attemptedUrl = "https://" + siteDomain + path;
        try {
            auto buffer = fetchBuffer(attemptedUrl, m_settings.faviconProbeTimeout, cancel);
            auto validation = ImageValidator::Validate(buffer);
            if (validation.valid) {
                return domain::LogoResult{std::move(buffer), *validation.info, "Direct Favicon", attemptedUrl};
            }
            lastError = validation.reason.value_or("Invalid image");
        } catch (const infrastructure::HttpError& e) {
            if (e.kind() == infrastructure::HttpError::Kind::Cancelled) {
                throw;
            }
            lastError = e.what();
        } catch (const LogoSourceError& e) {
            lastError = e.what();
        }
    }

    throw LogoSourceError(lastError.empty() ? "No valid favicon found at any common path" : lastError);
}

} // namespace logoscout::application
