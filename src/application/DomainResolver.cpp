/**
 * @file DomainResolver.cpp
 * @brief Implementation of the resolution tiers.
 */

#include "application/DomainResolver.hpp"
#include "application/TextMatching.hpp"
#include <iostream>

namespace logoscout::application {

using domain::MatchConfidence;
using domain::ResolvedDomain;

DomainResolver::DomainResolver(std::shared_ptr<domain::DomainSearchService> liveSearch,
                               const domain::CompanyDatabase& database)
    : m_liveSearch(std::move(liveSearch)), m_database(database) {}

ResolvedDomain DomainResolver::resolve(const std::string& input,
                                       const domain::CancellationToken* cancel) const {
    const std::string normalized = NormalizeName(input);

    if (auto exact = matchExact(normalized)) return *exact;
    if (auto alias = matchAlias(normalized)) return *alias;
    // Blank input goes straight to inference; every short key is within fuzzy range of "".
    if (!normalized.empty()) {
        if (auto fuzzy = matchFuzzy(normalized)) return *fuzzy;
        if (auto live = matchLiveSearch(input, cancel)) return *live;
    }

    const std::string sanitized = StripWhitespace(normalized);
    ResolvedDomain inferred;
    inferred.domain = sanitized + ".com";
    inferred.company = sanitized;
    inferred.category = "Unknown";
    inferred.confidence = MatchConfidence::Inferred;
    inferred.matchedName = input;
    return inferred;
}

std::optional<ResolvedDomain> DomainResolver::matchExact(const std::string& normalized) const {
    const domain::CompanyEntry* entry = m_database.find(normalized);
    if (!entry) {
        return std::nullopt;
    }
    return ResolvedDomain{entry->domain, normalized, entry->category, MatchConfidence::Exact, normalized};
}

std::optional<ResolvedDomain> DomainResolver::matchAlias(const std::string& normalized) const {
    for (const auto& [key, entry] : m_database.entries()) {
        for (const auto& alias : entry.aliases) {
            if (NormalizeName(alias) == normalized) {
                return ResolvedDomain{entry.domain, key, entry.category, MatchConfidence::Alias, alias};
            }
        }
    }
    return std::nullopt;
}

std::optional<ResolvedDomain> DomainResolver::matchFuzzy(const std::string& normalized) const {
    const domain::CompanyDatabase::Record* best = nullptr;
    const std::string* via = nullptr;
    std::size_t bestDistance = kMaxFuzzyDistance + 1;

    // Strict '<' keeps the first candidate on ties; the key is checked before its aliases.
    for (const auto& record : m_database.entries()) {
        const std::size_t keyDistance = LevenshteinDistance(normalized, NormalizeName(record.first));
        if (keyDistance < bestDistance) {
            best = &record;
            via = &record.first;
            bestDistance = keyDistance;
        }
        for (const auto& alias : record.second.aliases) {
            const std::size_t aliasDistance = LevenshteinDistance(normalized, NormalizeName(alias));
            if (aliasDistance < bestDistance) {
                best = &record;
                via = &alias;
                bestDistance = aliasDistance;
            }
        }
    }

    if (!best) {
        return std::nullopt;
    }
    return ResolvedDomain{best->second.domain, best->first, best->second.category, MatchConfidence::Fuzzy, *via};
}

std::optional<ResolvedDomain> DomainResolver::matchLiveSearch(const std::string& input,
                                                              const domain::CancellationToken* cancel) const {
    if (!m_liveSearch || (cancel && cancel->isCancelled())) {
        return std::nullopt;
    }

    std::optional<std::string> found;
    try {
        found = m_liveSearch->findOfficialDomain(input, cancel);
    } catch (const std::exception& e) {
        std::cerr << "[DomainResolver] Live search raised for '" << input << "': " << e.what() << std::endl;
        return std::nullopt;
    }

    if (!found || found->empty()) {
        return std::nullopt;
    }
    return ResolvedDomain{*found, input, "Unknown (Live Search)", MatchConfidence::LiveSearch, input};
}

} // namespace logoscout::application
