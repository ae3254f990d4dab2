/**
 * @file UrlUtils.cpp
 * @brief Implementation of UrlUtils.
 */

#include "infrastructure/UrlUtils.hpp"
#include <algorithm>
#include <cctype>

namespace logoscout::infrastructure {

namespace {

std::string Lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool StartsWith(const std::string& value, const std::string& prefix) {
    return value.rfind(prefix, 0) == 0;
}

} // namespace

std::optional<UrlUtils::Parts> UrlUtils::Split(const std::string& url) {
    const auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        return std::nullopt;
    }
    const std::string scheme = Lower(url.substr(0, schemeEnd));
    if (scheme != "http" && scheme != "https") {
        return std::nullopt;
    }

    const auto hostStart = schemeEnd + 3;
    const auto pathStart = url.find_first_of("/?#", hostStart);
    const std::string host = url.substr(hostStart, pathStart == std::string::npos ? std::string::npos
                                                                                  : pathStart - hostStart);
    if (host.empty()) {
        return std::nullopt;
    }

    Parts parts;
    parts.origin = scheme + "://" + host;
    if (pathStart == std::string::npos) {
        parts.pathAndQuery = "/";
    } else {
        std::string rest = url.substr(pathStart);
        const auto fragment = rest.find('#');
        if (fragment != std::string::npos) {
            rest.erase(fragment);
        }
        parts.pathAndQuery = (rest.empty() || rest[0] != '/') ? "/" + rest : rest;
    }
    return parts;
}

std::string UrlUtils::EncodeComponent(const std::string& value) {
    static const char* kHex = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size() * 3);
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

std::string UrlUtils::ResolveAgainst(const std::string& origin, const std::string& url) {
    if (StartsWith(url, "http")) {
        return url;
    }
    if (StartsWith(url, "//")) {
        return "https:" + url;
    }
    if (!url.empty() && url[0] == '/') {
        return origin + url;
    }
    return origin + "/" + url;
}

std::string UrlUtils::BareHost(const std::string& displayUrl) {
    std::string host = Lower(displayUrl);
    if (StartsWith(host, "https://")) {
        host.erase(0, 8);
    } else if (StartsWith(host, "http://")) {
        host.erase(0, 7);
    }
    if (StartsWith(host, "www.")) {
        host.erase(0, 4);
    }
    const auto slash = host.find('/');
    if (slash != std::string::npos) {
        host.erase(slash);
    }
    return host;
}

} // namespace logoscout::infrastructure
