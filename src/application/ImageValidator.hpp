/**
 * @file ImageValidator.hpp
 * @brief Content sniffing that separates real images from error pages and placeholders.
 */

#pragma once
#include <cstddef>
#include <string>
#include "domain/ImageInfo.hpp"

namespace logoscout::application {

/**
 * @class ImageValidator
 * @brief Stateless, deterministic classifier of downloaded byte buffers.
 *
 * Rules are applied in order and the first match decides:
 * empty, too small (< 100 bytes), HTML document, SVG, magic-byte table, unknown.
 */
class ImageValidator {
public:
    /** @brief Buffers below this size are treated as tracking pixels / placeholders. */
    static constexpr std::size_t kMinimumImageBytes = 100;

    /**
     * @brief Classifies a buffer.
     * @param buffer Raw bytes as received from the network.
     * @return valid + ImageInfo, or invalid + human-readable reason.
     */
    static domain::ValidationResult Validate(const std::string& buffer);
};

/** @brief "512 B", "1.5 KB", "2.0 MB". */
std::string FormatFileSize(std::size_t bytes);

} // namespace logoscout::application
