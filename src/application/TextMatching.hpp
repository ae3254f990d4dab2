/**
 * @file TextMatching.hpp
 * @brief Normalization and edit-distance helpers shared by resolution and search.
 */

#pragma once
#include <cstddef>
#include <string>

namespace logoscout::application {

/**
 * @brief Canonical form used for every name comparison.
 *
 * Lowercases, trims, removes '.', '_' and '-', and collapses runs of
 * whitespace into a single space.
 */
std::string NormalizeName(const std::string& input);

/** @brief ASCII lowercase copy. */
std::string ToLower(const std::string& input);

/** @brief Removes every whitespace character. */
std::string StripWhitespace(const std::string& input);

/** @brief Levenshtein distance (unit cost insert/delete/substitute), byte-wise. */
std::size_t LevenshteinDistance(const std::string& a, const std::string& b);

} // namespace logoscout::application
