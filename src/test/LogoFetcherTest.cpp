#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "application/LogoFetcher.hpp"
#include "TestSupport.hpp"

using namespace logoscout;
using application::LogoFetcher;
using domain::LogoSize;
using test::FakeHttpClient;

namespace {

LogoFetcher::Settings TestSettings() {
    LogoFetcher::Settings settings;
    settings.logoApiBase = "https://logo.test";
    settings.faviconServiceBase = "https://favicon.test/s2";
    settings.instantAnswerBase = "https://ia.test/";
    settings.instantAnswerOrigin = "https://ia.test";
    settings.userAgent = "LogoScoutTest/1.0";
    settings.sourceTimeout = std::chrono::milliseconds(700);
    settings.faviconProbeTimeout = std::chrono::milliseconds(300);
    return settings;
}

void TestSourceOrder() {
    std::cout << "[Test] Source order..." << std::endl;
    const auto& sources = LogoFetcher::Sources();
    assert(sources.size() == 4);
    assert(std::string(sources[0].name) == "Clearbit");
    assert(std::string(sources[1].name) == "Google Favicon");
    assert(std::string(sources[2].name) == "DuckDuckGo");
    assert(std::string(sources[3].name) == "Direct Favicon");
    assert(sources[2].usesCompanyName);
    assert(!sources[0].usesCompanyName && !sources[3].usesCompanyName);
    std::cout << "[PASS] Source order" << std::endl;
}

void TestFirstSourceWins() {
    std::cout << "[Test] First source success stops the cascade..." << std::endl;
    auto http = std::make_shared<FakeHttpClient>();
    http->respond("https://logo.test/", 200, test::MakePng(4096));
    LogoFetcher fetcher(http, TestSettings());

    auto result = fetcher.fetchLogo("shopify.com", "shopify");
    assert(result.success);
    assert(!result.error);
    assert(result.attempts.size() == 1);
    assert(result.attempts[0].success);
    assert(result.logo->source == "Clearbit Logo API");
    assert(result.logo->sourceUrl == "https://logo.test/shopify.com?size=512&format=png");
    assert(result.logo->imageInfo.format == "PNG");
    assert(result.logo->buffer.size() == 4096);

    auto requests = http->requests();
    assert(requests.size() == 1);
    assert(test::HeaderValue(requests[0], "User-Agent") == "LogoScoutTest/1.0");
    assert(test::HeaderValue(requests[0], "Accept") == "image/*,*/*;q=0.8");
    assert(requests[0].timeout == std::chrono::milliseconds(700));
    assert(requests[0].followRedirects);

    auto small = fetcher.fetchLogo("shopify.com", "shopify", LogoSize::Small);
    assert(small.logo->sourceUrl == "https://logo.test/shopify.com?size=128&format=png");
    std::cout << "[PASS] First source success stops the cascade" << std::endl;
}

void TestFallbackToInstantAnswer() {
    std::cout << "[Test] Fallback to the instant answer source..." << std::endl;
    auto http = std::make_shared<FakeHttpClient>();
    http->respond("https://logo.test/", 404, "not found", "text/plain");
    http->fail("https://favicon.test/", "connection refused");
    http->respond("https://ia.test/?q=", 200, R"({"Heading":"Shopify","Image":"/i/shopify.com.png"})",
                  "application/json");
    http->respond("https://ia.test/i/", 200, test::MakePng(3000));
    LogoFetcher fetcher(http, TestSettings());

    auto result = fetcher.fetchLogo("shopify.com", "Shopify Inc");
    assert(result.success);
    assert(result.attempts.size() == 3);
    assert(!result.attempts[0].success && *result.attempts[0].error == "HTTP 404");
    assert(!result.attempts[1].success && *result.attempts[1].error == "connection refused");
    assert(result.attempts[1].url == "https://favicon.test/s2?domain=shopify.com&sz=256");
    assert(result.attempts[2].success);
    assert(result.attempts[2].source == "DuckDuckGo");
    assert(result.logo->source == "DuckDuckGo Instant Answer");
    assert(result.logo->sourceUrl == "https://ia.test/i/shopify.com.png");

    const auto urls = http->requestedUrls();
    assert(urls.size() == 4);
    assert(urls[2] == "https://ia.test/?q=Shopify%20Inc%20company&format=json&no_html=1");
    assert(http->countRequestsTo("https://shopify.com/") == 0);
    std::cout << "[PASS] Fallback to the instant answer source" << std::endl;
}

void TestAllSourcesFail() {
    std::cout << "[Test] All sources fail..." << std::endl;
    auto http = std::make_shared<FakeHttpClient>();
    LogoFetcher fetcher(http, TestSettings());

    auto result = fetcher.fetchLogo("nowhere.test", "Nowhere");
    assert(!result.success);
    assert(!result.logo);
    assert(result.error == std::optional<std::string>("Failed to download logo from all 4 sources"));
    assert(result.attempts.size() == 4);
    for (const auto& attempt : result.attempts) {
        assert(!attempt.success);
        assert(attempt.error && !attempt.error->empty());
        assert(attempt.durationMs >= 0);
    }
    assert(result.attempts[3].url == "https://nowhere.test/favicon.ico");

    // One request per API source plus one probe per conventional favicon path.
    assert(http->requests().size() == 7);
    assert(http->countRequestsTo("https://nowhere.test/") == 4);
    for (const auto& r : http->requests()) {
        if (r.url.rfind("https://nowhere.test/", 0) == 0) {
            assert(r.timeout == std::chrono::milliseconds(300));
        }
    }
    std::cout << "[PASS] All sources fail" << std::endl;
}

void TestRejectedContent() {
    std::cout << "[Test] Error pages and placeholders are skipped..." << std::endl;
    const std::string errorPage = "<!DOCTYPE html><html><body>" + std::string(400, ' ') + "</body></html>";

    auto http = std::make_shared<FakeHttpClient>();
    http->respond("https://logo.test/", 200, errorPage, "text/html");
    http->respond("https://favicon.test/", 200, test::MakePng(300));
    http->respond("https://ia.test/?q=", 200, "{not json", "application/json");
    http->respond("https://acme.test/favicon.ico", 200, test::MakeIco(1200), "image/x-icon");
    LogoFetcher fetcher(http, TestSettings());

    auto large = fetcher.fetchLogo("acme.test", "Acme");
    assert(large.success);
    assert(large.attempts.size() == 4);
    assert(large.attempts[0].error->find("HTML") != std::string::npos);
    assert(*large.attempts[1].error == "Google returned a generic placeholder icon");
    assert(large.attempts[2].error->rfind("Malformed DuckDuckGo response", 0) == 0);
    assert(large.logo->source == "Direct Favicon");
    assert(large.logo->imageInfo.format == "ICO");
    assert(large.logo->sourceUrl == "https://acme.test/favicon.ico");

    // Probes run highest quality first.
    const auto urls = http->requestedUrls();
    assert(urls[3] == "https://acme.test/apple-touch-icon.png");
    assert(urls[4] == "https://acme.test/apple-touch-icon-precomposed.png");
    assert(urls[5] == "https://acme.test/favicon-32x32.png");
    assert(urls[6] == "https://acme.test/favicon.ico");

    // A small favicon is acceptable when a small logo was requested.
    auto small = fetcher.fetchLogo("acme.test", "Acme", LogoSize::Small);
    assert(small.success);
    assert(small.attempts.size() == 2);
    assert(small.logo->source == "Google Favicon Service");
    assert(small.logo->sourceUrl == "https://favicon.test/s2?domain=acme.test&sz=128");
    std::cout << "[PASS] Error pages and placeholders are skipped" << std::endl;
}

void TestInstantAnswerWithoutImage() {
    std::cout << "[Test] Instant answer without an image..." << std::endl;
    auto http = std::make_shared<FakeHttpClient>();
    http->respond("https://ia.test/?q=", 200, R"({"Heading":"Acme","Image":""})", "application/json");
    LogoFetcher fetcher(http, TestSettings());

    auto result = fetcher.fetchLogo("acme.test", "Acme");
    assert(!result.success);
    assert(*result.attempts[2].error == "No logo image found in DuckDuckGo response");

    auto protocolRelative = std::make_shared<FakeHttpClient>();
    protocolRelative->respond("https://ia.test/?q=", 200, R"({"Image":"//cdn.test/acme.png"})", "application/json");
    protocolRelative->respond("https://cdn.test/", 200, test::MakePng(1000));
    LogoFetcher cdnFetcher(protocolRelative, TestSettings());
    auto cdn = cdnFetcher.fetchLogo("acme.test", "Acme");
    assert(cdn.success);
    assert(cdn.logo->sourceUrl == "https://cdn.test/acme.png");
    std::cout << "[PASS] Instant answer without an image" << std::endl;
}

void TestCancellation() {
    std::cout << "[Test] Cancellation..." << std::endl;
    domain::CancellationToken token;
    auto http = std::make_shared<FakeHttpClient>();
    http->on("https://logo.test/", [&token](const domain::HttpRequest& request) -> domain::HttpResponse {
        assert(request.cancel == &token);
        token.cancel();
        throw infrastructure::HttpError(infrastructure::HttpError::Kind::Cancelled, "Request cancelled");
    });
    LogoFetcher fetcher(http, TestSettings());

    auto result = fetcher.fetchLogo("shopify.com", "shopify", LogoSize::Large, &token);
    assert(!result.success);
    assert(result.error == std::optional<std::string>("Logo fetch cancelled"));
    assert(result.attempts.size() == 1);
    assert(!result.attempts[0].success);
    assert(http->requests().size() == 1);

    auto untouched = std::make_shared<FakeHttpClient>();
    LogoFetcher idle(untouched, TestSettings());
    auto precancelled = idle.fetchLogo("shopify.com", "shopify", LogoSize::Large, &token);
    assert(!precancelled.success);
    assert(precancelled.attempts.empty());
    assert(untouched->requests().empty());
    std::cout << "[PASS] Cancellation" << std::endl;
}

} // namespace

int main() {
    TestSourceOrder();
    TestFirstSourceWins();
    TestFallbackToInstantAnswer();
    TestAllSourcesFail();
    TestRejectedContent();
    TestInstantAnswerWithoutImage();
    TestCancellation();
    std::cout << "All LogoFetcher tests passed." << std::endl;
    return 0;
}
