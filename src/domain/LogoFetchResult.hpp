/**
 * @file LogoFetchResult.hpp
 * @brief Result types produced by the cascading logo fetch pipeline.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>
#include "ImageInfo.hpp"

namespace logoscout::domain {

/**
 * @enum LogoSize
 * @brief Logical logo size. Each source maps it to its own native parameter.
 */
enum class LogoSize {
    Small,  ///< 64px
    Medium, ///< 128px
    Large   ///< 256px
};

inline int LogoSizePixels(LogoSize size) {
    switch (size) {
        case LogoSize::Small: return 64;
        case LogoSize::Medium: return 128;
        case LogoSize::Large: return 256;
    }
    return 256;
}

inline std::string LogoSizeToString(LogoSize size) {
    switch (size) {
        case LogoSize::Small: return "small";
        case LogoSize::Medium: return "medium";
        case LogoSize::Large: return "large";
    }
    return "large";
}

inline std::optional<LogoSize> LogoSizeFromString(const std::string& value) {
    if (value == "small") return LogoSize::Small;
    if (value == "medium") return LogoSize::Medium;
    if (value == "large") return LogoSize::Large;
    return std::nullopt;
}

/**
 * @struct FetchAttempt
 * @brief One entry of the diagnostic attempt log, appended once per source tried.
 */
struct FetchAttempt {
    std::string source;
    std::string url;
    bool success = false;
    std::optional<std::string> error;
    long long durationMs = 0;
};

/**
 * @struct LogoResult
 * @brief Validated image bytes plus provenance.
 */
struct LogoResult {
    std::string buffer; ///< Raw image bytes.
    ImageInfo imageInfo;
    std::string source;    ///< Human-readable source label.
    std::string sourceUrl; ///< URL the bytes were downloaded from.
};

/**
 * @struct LogoFetchResult
 * @brief Outcome of one pipeline run. Owned by the caller once returned.
 */
struct LogoFetchResult {
    bool success = false;
    std::optional<LogoResult> logo;
    std::vector<FetchAttempt> attempts;
    std::optional<std::string> error;
};

} // namespace logoscout::domain
