/**
 * @file DomainSearchService.hpp
 * @brief Interface for the live web-search fallback of domain resolution.
 */

#pragma once
#include <optional>
#include <string>
#include "CancellationToken.hpp"

namespace logoscout::domain {

/**
 * @class DomainSearchService
 * @brief Finds the official domain of a company through an external search.
 *
 * Implementations never throw for network or parsing problems: any failure is
 * reported as std::nullopt, the same as "no qualifying result".
 */
class DomainSearchService {
public:
    virtual ~DomainSearchService() = default;

    /**
     * @brief Looks up the official website of a company.
     * @param companyName Raw user input.
     * @param cancel Optional cancellation token.
     * @return Bare host (no scheme, no "www.") or nullopt.
     */
    virtual std::optional<std::string> findOfficialDomain(const std::string& companyName,
                                                          const CancellationToken* cancel = nullptr) = 0;
};

} // namespace logoscout::domain
