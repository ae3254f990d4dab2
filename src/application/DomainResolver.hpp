/**
 * @file DomainResolver.hpp
 * @brief Maps free-text company names to canonical domains.
 */

#pragma once
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include "domain/CancellationToken.hpp"
#include "domain/CompanyDatabase.hpp"
#include "domain/CompanyEntry.hpp"
#include "domain/DomainSearchService.hpp"

namespace logoscout::application {

/**
 * @class DomainResolver
 * @brief Five-tier resolution engine: exact key, alias, fuzzy, live search, inferred.
 *
 * Tiers run strictly in order and the first hit wins. resolve() always returns
 * a result; failures only lower the confidence.
 */
class DomainResolver {
public:
    /** @brief Maximum edit distance accepted by the fuzzy tier. */
    static constexpr std::size_t kMaxFuzzyDistance = 2;

    /**
     * @param liveSearch Live web-search fallback. nullptr disables tier 4.
     * @param database Curated table; must outlive the resolver.
     */
    explicit DomainResolver(std::shared_ptr<domain::DomainSearchService> liveSearch = nullptr,
                            const domain::CompanyDatabase& database = domain::CompanyDatabase::Instance());

    /**
     * @brief Resolves a company name or alias to its domain.
     * @param input Raw user input, any UTF-8 string.
     * @param cancel Optional token; once cancelled, the live-search tier is skipped or aborted.
     */
    domain::ResolvedDomain resolve(const std::string& input,
                                   const domain::CancellationToken* cancel = nullptr) const;

private:
    std::optional<domain::ResolvedDomain> matchExact(const std::string& normalized) const;
    std::optional<domain::ResolvedDomain> matchAlias(const std::string& normalized) const;
    std::optional<domain::ResolvedDomain> matchFuzzy(const std::string& normalized) const;
    std::optional<domain::ResolvedDomain> matchLiveSearch(const std::string& input,
                                                          const domain::CancellationToken* cancel) const;

    std::shared_ptr<domain::DomainSearchService> m_liveSearch;
    const domain::CompanyDatabase& m_database;
};

} // namespace logoscout::application
