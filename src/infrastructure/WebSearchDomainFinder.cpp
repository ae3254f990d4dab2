/**
 * @file WebSearchDomainFinder.cpp
 * @brief Implementation of WebSearchDomainFinder.
 *
 * The result page markup is a third-party contract; anything unexpected in it
 * yields "no match".
 */

#include "infrastructure/WebSearchDomainFinder.hpp"
#include "infrastructure/UrlUtils.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <sstream>
#include <gumbo.h>

namespace logoscout::infrastructure {

namespace {

const std::vector<std::string>& ExcludedHosts() {
    static const std::vector<std::string> hosts = {
        "wikipedia.org", "linkedin.com", "facebook.com", "twitter.com", "instagram.com",
        "youtube.com", "apps.apple.com", "play.google.com", "g2.com", "trustpilot.com",
        "capterra.com", "crunchbase.com", "bloomberg.com", "forbes.com", "github.com",
        "duckduckgo.com"
    };
    return hosts;
}

bool HasClassToken(const GumboNode* node, const std::string& className) {
    const GumboAttribute* attr = gumbo_get_attribute(&node->v.element.attributes, "class");
    if (!attr || !attr->value) {
        return false;
    }
    std::istringstream tokens(attr->value);
    std::string token;
    while (tokens >> token) {
        if (token == className) return true;
    }
    return false;
}

// Gumbo has already decoded character references in text nodes.
void CollectText(const GumboNode* node, std::string& out) {
    if (node->type == GUMBO_NODE_TEXT || node->type == GUMBO_NODE_WHITESPACE ||
        node->type == GUMBO_NODE_CDATA) {
        out += node->v.text.text;
        return;
    }
    if (node->type != GUMBO_NODE_ELEMENT) {
        return;
    }
    const GumboVector* children = &node->v.element.children;
    for (unsigned int i = 0; i < children->length; ++i) {
        CollectText(static_cast<const GumboNode*>(children->data[i]), out);
    }
}

std::string Trim(const std::string& text) {
    auto isSpace = [](char ch) { return std::isspace(static_cast<unsigned char>(ch)) != 0; };
    auto first = std::find_if_not(text.begin(), text.end(), isSpace);
    auto last = std::find_if_not(text.rbegin(), text.rend(), isSpace).base();
    if (first >= last) return {};
    return std::string(first, last);
}

} // namespace

WebSearchDomainFinder::WebSearchDomainFinder(std::shared_ptr<domain::HttpClient> http, Settings settings)
    : m_http(std::move(http)), m_settings(std::move(settings)) {}

std::optional<std::string> WebSearchDomainFinder::findOfficialDomain(const std::string& companyName,
                                                                     const domain::CancellationToken* cancel) {
    if (!m_http) {
        return std::nullopt;
    }

    domain::HttpRequest request;
    request.url = m_settings.endpoint + "?q=" + UrlUtils::EncodeComponent(companyName + " official website");
    request.headers = {
        {"User-Agent", m_settings.userAgent},
        {"Cookie", "ah=wt"} // disables ads in results
    };
    request.timeout = m_settings.timeout;
    request.cancel = cancel;

    try {
        auto response = m_http->get(request);
        if (!response.ok()) {
            std::cerr << "[WebSearchDomainFinder] HTTP " << response.status
                      << " searching for '" << companyName << "'" << std::endl;
            return std::nullopt;
        }
        return SelectOfficialDomain(ExtractResultUrls(response.body));
    } catch (const std::exception& e) {
        std::cerr << "[WebSearchDomainFinder] Live search failed for '" << companyName << "': "
                  << e.what() << std::endl;
    }
    return std::nullopt;
}

std::vector<std::string> WebSearchDomainFinder::ExtractResultUrls(const std::string& html) {
    std::vector<std::string> urls;
    GumboOutput* output = gumbo_parse_with_options(&kGumboDefaultOptions, html.data(), html.size());
    if (!output) {
        return urls;
    }

    // Depth-first, children pushed in reverse so matches come out in document order.
    std::vector<const GumboNode*> stack{output->root};
    while (!stack.empty()) {
        const GumboNode* node = stack.back();
        stack.pop_back();
        if (node->type != GUMBO_NODE_ELEMENT) continue;

        if (HasClassToken(node, "result__url")) {
            std::string text;
            CollectText(node, text);
            urls.push_back(Trim(text));
            continue;
        }

        const GumboVector* children = &node->v.element.children;
        for (int i = static_cast<int>(children->length) - 1; i >= 0; --i) {
            stack.push_back(static_cast<const GumboNode*>(children->data[i]));
        }
    }

    gumbo_destroy_output(&kGumboDefaultOptions, output);
    return urls;
}

std::optional<std::string> WebSearchDomainFinder::SelectOfficialDomain(const std::vector<std::string>& displayUrls) {
    for (const auto& displayUrl : displayUrls) {
        const std::string host = UrlUtils::BareHost(displayUrl);
        if (host.empty()) continue;

        const bool excluded = std::any_of(ExcludedHosts().begin(), ExcludedHosts().end(),
            [&host](const std::string& ex) { return host.find(ex) != std::string::npos; });
        if (!excluded) {
            return host;
        }
    }
    return std::nullopt;
}

} // namespace logoscout::infrastructure
