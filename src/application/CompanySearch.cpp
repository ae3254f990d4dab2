/**
 * @file CompanySearch.cpp
 * @brief Implementation of CompanySearch.
 */

#include "application/CompanySearch.hpp"
#include "application/TextMatching.hpp"
#include <algorithm>
#include <limits>

namespace logoscout::application {

namespace {

constexpr std::size_t kNoMatch = std::numeric_limits<std::size_t>::max();
constexpr std::size_t kMaxSearchDistance = 3;

struct ScoredEntry {
    std::size_t score;
    const domain::CompanyDatabase::Record* record;
};

} // namespace

CompanySearch::CompanySearch(const domain::CompanyDatabase& database)
    : m_database(database) {}

std::vector<SearchResult> CompanySearch::search(const std::string& query, const SearchOptions& options) const {
    const std::string normalized = NormalizeName(query);
    const std::string categoryFilter = options.category ? ToLower(*options.category) : std::string();

    std::vector<ScoredEntry> scored;
    for (const auto& record : m_database.entries()) {
        const std::string& key = record.first;
        const domain::CompanyEntry& entry = record.second;
        const std::string category = ToLower(entry.category);

        if (options.category && category != categoryFilter) continue;

        std::size_t score = kNoMatch;
        if (key.find(normalized) != std::string::npos) {
            score = std::min<std::size_t>(score, key == normalized ? 0 : 1);
        }
        for (const auto& alias : entry.aliases) {
            if (NormalizeName(alias).find(normalized) != std::string::npos) {
                score = std::min<std::size_t>(score, 2);
            }
        }
        if (category.find(normalized) != std::string::npos) {
            score = std::min<std::size_t>(score, 3);
        }
        const std::size_t distance = LevenshteinDistance(normalized, key);
        if (distance <= kMaxSearchDistance) {
            score = std::min(score, 4 + distance);
        }

        if (score != kNoMatch) {
            scored.push_back({score, &record});
        }
    }

    std::stable_sort(scored.begin(), scored.end(),
        [](const ScoredEntry& a, const ScoredEntry& b) { return a.score < b.score; });

    std::vector<SearchResult> results;
    const std::size_t count = std::min(options.limit, scored.size());
    results.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        const auto& record = *scored[i].record;
        results.push_back({record.first, record.second.domain, record.second.aliases, record.second.category});
    }
    return results;
}

} // namespace logoscout::application
