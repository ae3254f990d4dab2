#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <new>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "application/BulkLogoService.hpp"
#include "TestSupport.hpp"

using namespace logoscout;
using application::BulkLogoService;
using domain::LogoSize;

namespace {

std::shared_ptr<application::LogoFetcher> MakeFetcher(std::shared_ptr<test::FakeHttpClient> http) {
    application::LogoFetcher::Settings settings;
    settings.logoApiBase = "https://logo.test";
    settings.faviconServiceBase = "https://favicon.test/s2";
    settings.instantAnswerBase = "https://ia.test/";
    settings.instantAnswerOrigin = "https://ia.test";
    return std::make_shared<application::LogoFetcher>(std::move(http), settings);
}

} // namespace

int main() {
    std::cout << "[Test] Starting bulk download test..." << std::endl;

    auto http = std::make_shared<test::FakeHttpClient>();
    http->setDelay(std::chrono::milliseconds(20));
    http->respond("https://logo.test/slack.com", 404, "missing", "text/plain");
    http->respond("https://logo.test/", 200, test::MakePng(2048));

    auto resolver = std::make_shared<application::DomainResolver>();
    BulkLogoService service(resolver, MakeFetcher(http));

    const std::vector<std::string> inputs = {
        "Shopify", "Stripe", "Slack", "GitHub", "Notion", "Figma",
        "Vercel", "shoppify", "zzznotreal999", "HubSpot", "Zoom", "Airtable"
    };

    std::mutex sinkMutex;
    std::set<std::string> stored;
    application::LogoSink sink = [&](const domain::ResolvedDomain& resolved, const domain::LogoResult& logo) {
        if (resolved.company == "github") {
            throw std::runtime_error("disk full");
        }
        std::lock_guard<std::mutex> lock(sinkMutex);
        stored.insert(resolved.company);
        return "mem://" + resolved.company + "." + logo.imageInfo.extension;
    };

    auto results = service.run(inputs, LogoSize::Medium, sink);

    std::cout << "[Test] Order and isolation..." << std::endl;
    assert(results.size() == inputs.size());
    for (std::size_t i = 0; i < inputs.size(); ++i) {
        assert(results[i].input == inputs[i]);
    }

    assert(results[0].success);
    assert(results[0].company == "shopify");
    assert(results[0].confidence == domain::MatchConfidence::Exact);
    assert(results[0].filePath == std::optional<std::string>("mem://shopify.png"));
    assert(results[0].source == std::optional<std::string>("Clearbit Logo API"));

    // Every source failed for this one.
    assert(!results[2].success);
    assert(results[2].domain == "slack.com");
    assert(results[2].error == std::optional<std::string>("Failed to download logo from all 4 sources"));

    // The sink threw for this one only.
    assert(!results[3].success);
    assert(results[3].error == std::optional<std::string>("disk full"));
    assert(!results[3].filePath);

    assert(results[7].success);
    assert(results[7].confidence == domain::MatchConfidence::Fuzzy);
    assert(results[8].success);
    assert(results[8].confidence == domain::MatchConfidence::Inferred);
    assert(results[8].domain == "zzznotreal999.com");

    std::size_t successes = 0;
    for (const auto& r : results) {
        if (r.success) ++successes;
    }
    assert(successes == inputs.size() - 2);
    assert(stored.size() == successes - 1); // "shoppify" and "Shopify" share one company key
    std::cout << "[PASS] Order and isolation" << std::endl;

    std::cout << "[Test] Concurrency cap..." << std::endl;
    std::cout << "  peak concurrent requests: " << http->maxInFlight() << std::endl;
    assert(http->maxInFlight() >= 1);
    assert(http->maxInFlight() <= static_cast<int>(BulkLogoService::kMaxConcurrency));
    std::cout << "[PASS] Concurrency cap" << std::endl;

    std::cout << "[Test] Edge cases..." << std::endl;
    assert(service.run({}, LogoSize::Large).empty());

    auto withoutSink = service.run({"Stripe"}, LogoSize::Large);
    assert(withoutSink.size() == 1 && withoutSink[0].success && !withoutSink[0].filePath);

    domain::CancellationToken token;
    token.cancel();
    auto cancelled = service.run({"Stripe", "Figma"}, LogoSize::Large, sink, &token);
    for (const auto& r : cancelled) {
        assert(!r.success);
        assert(r.error == std::optional<std::string>("Logo fetch cancelled"));
        assert(r.confidence == domain::MatchConfidence::Exact);
    }
    std::cout << "[PASS] Edge cases" << std::endl;

    std::cout << "[Test] Out of memory aborts the batch..." << std::endl;
    std::atomic<int> sinkCalls{0};
    application::LogoSink exhausted = [&](const domain::ResolvedDomain&, const domain::LogoResult&) -> std::string {
        ++sinkCalls;
        throw std::bad_alloc();
    };
    bool propagated = false;
    try {
        service.run(inputs, LogoSize::Medium, exhausted);
    } catch (const std::bad_alloc&) {
        propagated = true;
    }
    assert(propagated);
    // Workers stop taking new items once one has failed.
    assert(sinkCalls.load() >= 1);
    assert(sinkCalls.load() < static_cast<int>(inputs.size()));
    std::cout << "[PASS] Out of memory aborts the batch" << std::endl;

    std::cout << "All BulkLogoService tests passed." << std::endl;
    return 0;
}
