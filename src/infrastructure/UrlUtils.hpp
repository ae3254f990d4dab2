/**
 * @file UrlUtils.hpp
 * @brief Minimal URL handling for the endpoints LogoScout talks to.
 */

#pragma once
#include <optional>
#include <string>

namespace logoscout::infrastructure {

class UrlUtils {
public:
    struct Parts {
        std::string origin;       ///< "https://host[:port]"
        std::string pathAndQuery; ///< Always starts with '/'.
    };

    /** @brief Splits an absolute http(s) URL; nullopt for anything else. */
    static std::optional<Parts> Split(const std::string& url);

    /** @brief Percent-encodes everything except RFC 3986 unreserved characters. */
    static std::string EncodeComponent(const std::string& value);

    /**
     * @brief Makes a possibly relative URL absolute.
     * @param origin Base origin, e.g. "https://duckduckgo.com".
     * @param url Absolute ("http..."), protocol-relative ("//...") or path-relative.
     */
    static std::string ResolveAgainst(const std::string& origin, const std::string& url);

    /**
     * @brief Reduces a displayed result URL to its bare host.
     *
     * "HTTPS://www.Shopify.com/en/about" -> "shopify.com".
     */
    static std::string BareHost(const std::string& displayUrl);
};

} // namespace logoscout::infrastructure
