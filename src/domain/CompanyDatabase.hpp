/**
 * @file CompanyDatabase.hpp
 * @brief Curated, read-only table of company key -> domain/aliases/category.
 */

#pragma once
#include <cstddef>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include "CompanyEntry.hpp"

namespace logoscout::domain {

/**
 * @class CompanyDatabase
 * @brief Ordered company table with O(1) exact key lookup.
 *
 * Iteration order is declaration order and is part of the contract: alias
 * lookup and fuzzy tie-breaking both take the first candidate encountered.
 * The instance is never mutated after construction, so it can be shared by
 * any number of threads without locking.
 */
class CompanyDatabase {
public:
    using Record = std::pair<std::string, CompanyEntry>;

    /**
     * @brief Builds a table from records in iteration order.
     * @throws std::invalid_argument if a key appears twice.
     */
    explicit CompanyDatabase(std::vector<Record> records);

    /** @brief The built-in curated table, built on first use. */
    static const CompanyDatabase& Instance();

    const std::vector<Record>& entries() const { return m_records; }

    /** @brief Exact key lookup; nullptr if absent. */
    const CompanyEntry* find(const std::string& key) const;

    /** @brief Distinct categories, sorted alphabetically. */
    std::vector<std::string> categories() const;

    std::size_t size() const { return m_records.size(); }

private:
    std::vector<Record> m_records;
    std::unordered_map<std::string, std::size_t> m_index;
};

} // namespace logoscout::domain
