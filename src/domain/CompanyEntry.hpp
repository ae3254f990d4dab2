/**
 * @file CompanyEntry.hpp
 * @brief Curated company records and the result of resolving a name to a domain.
 */

#pragma once
#include <string>
#include <vector>

namespace logoscout::domain {

/**
 * @struct CompanyEntry
 * @brief Immutable record of the curated database, keyed by a lowercase company key.
 */
struct CompanyEntry {
    std::string domain;               ///< Canonical domain, may carry a path (e.g. "aws.amazon.com/s3").
    std::vector<std::string> aliases; ///< Alternative names, in declaration order.
    std::string category;             ///< Human-readable category ("CRM", "Cloud", ...).
};

/**
 * @enum MatchConfidence
 * @brief How a ResolvedDomain was derived, ordered by decreasing trust.
 */
enum class MatchConfidence {
    Exact,
    Alias,
    Fuzzy,
    LiveSearch,
    Inferred
};

inline std::string ConfidenceToString(MatchConfidence c) {
    switch (c) {
        case MatchConfidence::Exact: return "exact";
        case MatchConfidence::Alias: return "alias";
        case MatchConfidence::Fuzzy: return "fuzzy";
        case MatchConfidence::LiveSearch: return "live-search";
        case MatchConfidence::Inferred: return "inferred";
    }
    return "inferred";
}

/**
 * @struct ResolvedDomain
 * @brief Outcome of a single resolution call. Always produced, never an error.
 */
struct ResolvedDomain {
    std::string domain;
    std::string company;     ///< Canonical key, or the sanitized/raw input for unknown names.
    std::string category;
    MatchConfidence confidence = MatchConfidence::Inferred;
    std::string matchedName; ///< Key or alias that matched, or the raw input.
};

} // namespace logoscout::domain
