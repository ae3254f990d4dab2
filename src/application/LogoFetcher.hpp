/**
 * @file LogoFetcher.hpp
 * @brief Cascading multi-source logo download pipeline.
 */

#pragma once
#include <array>
#include <chrono>
#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include "domain/CancellationToken.hpp"
#include "domain/HttpClient.hpp"
#include "domain/LogoFetchResult.hpp"

namespace logoscout::application {

/**
 * @enum LogoSource
 * @brief The fixed, ordered set of logo sources. Declaration order is priority order.
 */
enum class LogoSource {
    LogoApi,        ///< Clearbit logo CDN, keyed by domain.
    FaviconService, ///< Google s2 favicons, keyed by domain.
    InstantAnswer,  ///< DuckDuckGo Instant Answer JSON, keyed by company name.
    DirectFavicon   ///< Conventional icon paths on the domain itself.
};

struct SourceDescriptor {
    LogoSource id;
    const char* name;      ///< Short name used in the attempt log.
    const char* label;     ///< Provenance label reported on success.
    bool usesCompanyName;  ///< Input is the company name instead of the domain.
};

/** @brief A source-level failure: bad status, rejected content, missing data. */
class LogoSourceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @class LogoFetcher
 * @brief Tries every source strictly in priority order until one yields a validated image.
 *
 * Sources run one at a time on the calling thread with no retries. Every
 * failure (transport error, non-2xx status, timeout, validator rejection) is
 * recorded as a FetchAttempt; fetchLogo() itself never throws for those.
 */
class LogoFetcher {
public:
    struct Settings {
        std::string logoApiBase = "https://logo.clearbit.com";
        std::string faviconServiceBase = "https://www.google.com/s2/favicons";
        std::string instantAnswerBase = "https://api.duckduckgo.com/";
        std::string instantAnswerOrigin = "https://duckduckgo.com";
        std::string userAgent = "LogoScout/1.0";
        std::chrono::milliseconds sourceTimeout{10000};
        std::chrono::milliseconds faviconProbeTimeout{8000};
    };

    static constexpr int kLogoApiMaxSize = 1024;
    static constexpr int kFaviconServiceMaxSize = 256;
    static constexpr std::size_t kFaviconPlaceholderBytes = 500;

    LogoFetcher(std::shared_ptr<domain::HttpClient> http, Settings settings);

    /** @brief Sources in the order they are tried. */
    static const std::array<SourceDescriptor, 4>& Sources();

    /**
     * @brief Downloads a logo with cascading fallback.
     * @param siteDomain Resolved domain, e.g. "shopify.com".
     * @param companyName Display/search name, used by name-keyed sources.
     * @param size Logical size.
     * @param cancel Optional token. A cancelled in-flight source is logged as a failed attempt
     *               and no further source is started.
     */
    domain::LogoFetchResult fetchLogo(const std::string& siteDomain,
                                      const std::string& companyName,
                                      domain::LogoSize size = domain::LogoSize::Large,
                                      const domain::CancellationToken* cancel = nullptr) const;

private:
    domain::LogoResult fetchFrom(const SourceDescriptor& source, const std::string& input,
                                 domain::LogoSize size, const domain::CancellationToken* cancel,
                                 std::string& attemptedUrl) const;

    domain::LogoResult fetchFromLogoApi(const std::string& siteDomain, domain::LogoSize size,
                                        const domain::CancellationToken* cancel, std::string& attemptedUrl) const;
    domain::LogoResult fetchFromFaviconService(const std::string& siteDomain, domain::LogoSize size,
                                               const domain::CancellationToken* cancel, std::string& attemptedUrl) const;
    domain::LogoResult fetchFromInstantAnswer(const std::string& companyName,
                                              const domain::CancellationToken* cancel, std::string& attemptedUrl) const;
    domain::LogoResult fetchDirectFavicon(const std::string& siteDomain,
                                          const domain::CancellationToken* cancel, std::string& attemptedUrl) const;

    /** @brief GET with image headers; throws on transport failure or non-2xx. */
    std::string fetchBuffer(const std::string& url, std::chrono::milliseconds timeout,
                            const domain::CancellationToken* cancel) const;

    std::shared_ptr<domain::HttpClient> m_http;
    Settings m_settings;
};

} // namespace logoscout::application
