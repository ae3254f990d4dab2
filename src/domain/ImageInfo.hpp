/**
 * @file ImageInfo.hpp
 * @brief Classification of a downloaded byte buffer.
 */

#pragma once
#include <cstddef>
#include <optional>
#include <string>

namespace logoscout::domain {

/**
 * @struct ImageInfo
 * @brief Format details derived purely from buffer content.
 */
struct ImageInfo {
    std::string format;    ///< "PNG", "SVG", ...
    std::string extension; ///< File extension without dot.
    std::string mimeType;
    std::size_t sizeBytes = 0;
    bool isValid = false;
    bool isSvg = false;
};

/**
 * @struct ValidationResult
 * @brief Either a valid image with its info, or a rejection with a reason.
 */
struct ValidationResult {
    bool valid = false;
    std::optional<ImageInfo> info;
    std::optional<std::string> reason;
};

} // namespace logoscout::domain
