/**
 * @file CompanySearch.hpp
 * @brief Ranked lookup over the curated company database.
 */

#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "domain/CompanyDatabase.hpp"

namespace logoscout::application {

struct SearchOptions {
    std::optional<std::string> category; ///< Case-insensitive equality filter.
    std::size_t limit = 25;
};

/**
 * @struct SearchResult
 * @brief One matching database entry.
 */
struct SearchResult {
    std::string name; ///< Company key.
    std::string domain;
    std::vector<std::string> aliases;
    std::string category;
};

/**
 * @class CompanySearch
 * @brief Pure, stateless scoring of database entries against a query.
 *
 * Scores (lower is better): exact key 0, key substring 1, alias substring 2,
 * category substring 3, key within edit distance 3 -> 4 + distance.
 */
class CompanySearch {
public:
    explicit CompanySearch(const domain::CompanyDatabase& database = domain::CompanyDatabase::Instance());

    std::vector<SearchResult> search(const std::string& query, const SearchOptions& options = {}) const;

    std::vector<std::string> categories() const { return m_database.categories(); }
    std::size_t companyCount() const { return m_database.size(); }

private:
    const domain::CompanyDatabase& m_database;
};

} // namespace logoscout::application
