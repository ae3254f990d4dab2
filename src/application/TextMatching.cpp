/**
 * @file TextMatching.cpp
 * @brief Implementation of TextMatching.
 */

#include "application/TextMatching.hpp"
#include <algorithm>
#include <cctype>
#include <vector>

namespace logoscout::application {

std::string ToLower(const std::string& input) {
    std::string out;
    out.reserve(input.size());
    for (unsigned char c : input) {
        out.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}

std::string NormalizeName(const std::string& input) {
    auto isSpace = [](char ch) { return std::isspace(static_cast<unsigned char>(ch)) != 0; };
    auto first = std::find_if_not(input.begin(), input.end(), isSpace);
    auto last = std::find_if_not(input.rbegin(), input.rend(), isSpace).base();

    // Trim happens before punctuation removal, so ". x" keeps a leading space.
    std::string out;
    out.reserve(input.size());
    for (auto it = first; it < last; ++it) {
        const char ch = *it;
        if (ch == '.' || ch == '_' || ch == '-') {
            continue;
        }
        if (isSpace(ch)) {
            if (out.empty() || out.back() != ' ') {
                out.push_back(' ');
            }
            continue;
        }
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    return out;
}

std::string StripWhitespace(const std::string& input) {
    std::string out;
    out.reserve(input.size());
    for (unsigned char c : input) {
        if (!std::isspace(c)) {
            out.push_back(static_cast<char>(c));
        }
    }
    return out;
}

std::size_t LevenshteinDistance(const std::string& a, const std::string& b) {
    if (a.empty()) return b.size();
    if (b.empty()) return a.size();

    // Two-row dynamic programming over the shorter string.
    const std::string& shorter = a.size() < b.size() ? a : b;
    const std::string& longer = a.size() < b.size() ? b : a;

    std::vector<std::size_t> prev(shorter.size() + 1);
    std::vector<std::size_t> curr(shorter.size() + 1);
    for (std::size_t j = 0; j <= shorter.size(); ++j) {
        prev[j] = j;
    }

    for (std::size_t i = 1; i <= longer.size(); ++i) {
        curr[0] = i;
        for (std::size_t j = 1; j <= shorter.size(); ++j) {
            const std::size_t cost = longer[i - 1] == shorter[j - 1] ? 0 : 1;
            curr[j] = std::min({prev[j] + 1, curr[j - 1] + 1, prev[j - 1] + cost});
        }
        std::swap(prev, curr);
    }
    return prev[shorter.size()];
}

} // namespace logoscout::application
