/**
 * @file WebSearchDomainFinder.hpp
 * @brief Live-search fallback that scrapes an HTML search results page.
 */

#pragma once
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "domain/DomainSearchService.hpp"
#include "domain/HttpClient.hpp"

namespace logoscout::infrastructure {

/**
 * @class WebSearchDomainFinder
 * @brief Implements DomainSearchService against the DuckDuckGo HTML endpoint.
 *
 * Sends one "<name> official website" query, reads the displayed result URLs
 * in document order and returns the first host that is not a reference site,
 * social network, app store, review aggregator or the search engine itself.
 */
class WebSearchDomainFinder : public domain::DomainSearchService {
public:
    struct Settings {
        std::string endpoint = "https://html.duckduckgo.com/html/";
        std::string userAgent;
        std::chrono::milliseconds timeout{5000};
    };

    WebSearchDomainFinder(std::shared_ptr<domain::HttpClient> http, Settings settings);

    /** @brief Never throws. @see domain::DomainSearchService::findOfficialDomain */
    std::optional<std::string> findOfficialDomain(const std::string& companyName,
                                                  const domain::CancellationToken* cancel = nullptr) override;

    /** @brief Text of every element whose class list contains "result__url", in document order. */
    static std::vector<std::string> ExtractResultUrls(const std::string& html);

    /** @brief First bare host not covered by the exclusion list. */
    static std::optional<std::string> SelectOfficialDomain(const std::vector<std::string>& displayUrls);

private:
    std::shared_ptr<domain::HttpClient> m_http;
    Settings m_settings;
};

} // namespace logoscout::infrastructure
