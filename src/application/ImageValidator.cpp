/**
 * @file ImageValidator.cpp
 * @brief Magic-byte table and text signature checks.
 */

#include "application/ImageValidator.hpp"
#include "application/TextMatching.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <cstdio>
#include <vector>

namespace logoscout::application {

namespace {

constexpr std::size_t kHtmlSniffBytes = 512;
constexpr std::size_t kSvgSniffBytes = 1024;

struct ImageSignature {
    std::vector<std::uint8_t> bytes;
    std::size_t offset;
    const char* format;
    const char* extension;
    const char* mimeType;
};

// Order matters: RIFF is only a container prefix and must not shadow a tighter match.
const std::array<ImageSignature, 10>& Signatures() {
    static const std::array<ImageSignature, 10> table = {{
        {{0x89, 0x50, 0x4E, 0x47}, 0, "PNG", "png", "image/png"},
        {{0xFF, 0xD8, 0xFF}, 0, "JPEG", "jpg", "image/jpeg"},
        {{0x47, 0x49, 0x46, 0x38, 0x37, 0x61}, 0, "GIF", "gif", "image/gif"},
        {{0x47, 0x49, 0x46, 0x38, 0x39, 0x61}, 0, "GIF", "gif", "image/gif"},
        {{0x52, 0x49, 0x46, 0x46}, 0, "WEBP", "webp", "image/webp"},
        {{0x00, 0x00, 0x01, 0x00}, 0, "ICO", "ico", "image/x-icon"},
        {{0x42, 0x4D}, 0, "BMP", "bmp", "image/bmp"},
        {{0x49, 0x49, 0x2A, 0x00}, 0, "TIFF", "tiff", "image/tiff"},
        {{0x4D, 0x4D, 0x00, 0x2A}, 0, "TIFF", "tiff", "image/tiff"},
        {{0x66, 0x74, 0x79, 0x70, 0x61, 0x76, 0x69, 0x66}, 4, "AVIF", "avif", "image/avif"},
    }};
    return table;
}

bool MatchBytes(const std::string& buffer, const ImageSignature& sig) {
    if (buffer.size() < sig.offset + sig.bytes.size()) {
        return false;
    }
    for (std::size_t i = 0; i < sig.bytes.size(); ++i) {
        if (static_cast<std::uint8_t>(buffer[sig.offset + i]) != sig.bytes[i]) {
            return false;
        }
    }
    return true;
}

// Leading UTF-8 byte order marks are dropped along with whitespace.
std::string Trim(const std::string& text) {
    static const std::string kBom = "\xEF\xBB\xBF";
    auto isSpace = [](char ch) { return std::isspace(static_cast<unsigned char>(ch)) != 0; };
    std::size_t begin = 0;
    while (begin < text.size()) {
        if (isSpace(text[begin])) {
            ++begin;
        } else if (text.compare(begin, kBom.size(), kBom) == 0) {
            begin += kBom.size();
        } else {
            break;
        }
    }
    auto first = text.begin() + static_cast<std::ptrdiff_t>(begin);
    auto last = std::find_if_not(text.rbegin(), text.rend(), isSpace).base();
    if (first >= last) return {};
    return std::string(first, last);
}

bool StartsWith(const std::string& text, const char* prefix) {
    return text.rfind(prefix, 0) == 0;
}

bool Contains(const std::string& text, const char* needle) {
    return text.find(needle) != std::string::npos;
}

bool IsHtmlContent(const std::string& buffer) {
    const std::string head = ToLower(Trim(buffer.substr(0, kHtmlSniffBytes)));
    return StartsWith(head, "<!doctype html") ||
           StartsWith(head, "<html") ||
           StartsWith(head, "<!doctype") ||
           (Contains(head, "<head>") && Contains(head, "<body"));
}

bool IsSvgContent(const std::string& buffer) {
    const std::string head = Trim(buffer.substr(0, kSvgSniffBytes));
    return (StartsWith(head, "<?xml") && Contains(head, "<svg")) ||
           StartsWith(head, "<svg") ||
           Contains(head, "xmlns=\"http://www.w3.org/2000/svg\"");
}

domain::ValidationResult Reject(std::string reason) {
    domain::ValidationResult result;
    result.valid = false;
    result.reason = std::move(reason);
    return result;
}

domain::ValidationResult Accept(const std::string& format, const std::string& extension,
                                const std::string& mimeType, std::size_t size, bool isSvg) {
    domain::ValidationResult result;
    result.valid = true;
    result.info = domain::ImageInfo{format, extension, mimeType, size, true, isSvg};
    return result;
}

} // namespace

domain::ValidationResult ImageValidator::Validate(const std::string& buffer) {
    if (buffer.empty()) {
        return Reject("Empty buffer: no data received");
    }

    if (buffer.size() < kMinimumImageBytes) {
        return Reject("Buffer too small (" + std::to_string(buffer.size()) +
                      " bytes): likely a placeholder");
    }

    if (IsHtmlContent(buffer)) {
        return Reject("Content is HTML, not an image: likely an error page");
    }

    if (IsSvgContent(buffer)) {
        return Accept("SVG", "svg", "image/svg+xml", buffer.size(), true);
    }

    for (const auto& sig : Signatures()) {
        if (MatchBytes(buffer, sig)) {
            return Accept(sig.format, sig.extension, sig.mimeType, buffer.size(), false);
        }
    }

    return Reject("Unknown format: could not identify image type from file header");
}

std::string FormatFileSize(std::size_t bytes) {
    char text[32];
    if (bytes < 1024) {
        std::snprintf(text, sizeof(text), "%zu B", bytes);
    } else if (bytes < 1024 * 1024) {
        std::snprintf(text, sizeof(text), "%.1f KB", static_cast<double>(bytes) / 1024.0);
    } else {
        std::snprintf(text, sizeof(text), "%.1f MB", static_cast<double>(bytes) / (1024.0 * 1024.0));
    }
    return text;
}

} // namespace logoscout::application
