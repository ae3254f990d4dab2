#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "app/LogoScoutApp.hpp"
#include "TestSupport.hpp"

using namespace logoscout;
namespace fs = std::filesystem;

namespace {

infrastructure::AppConfig TestConfig(const fs::path& assets) {
    infrastructure::AppConfig config;
    config.assetsDir = assets;
    config.endpoints.logoApi = "https://logo.test";
    config.endpoints.faviconService = "https://favicon.test/s2";
    config.endpoints.instantAnswer = "https://ia.test/";
    config.endpoints.instantAnswerOrigin = "https://ia.test";
    config.endpoints.htmlSearch = "https://search.test/html/";
    return config;
}

bool Contains(const std::string& text, const std::string& needle) {
    return text.find(needle) != std::string::npos;
}

} // namespace

int main() {
    const fs::path root = fs::temp_directory_path() / "logoscout_app_test";
    fs::remove_all(root);

    auto http = std::make_shared<test::FakeHttpClient>();
    http->respond("https://logo.test/stripe.com", 200, test::MakePng(1500));
    http->respond("https://logo.test/acmewidgets.io", 200, test::MakePng(900));
    http->respond("https://search.test/html/", 200,
                  "<a class=\"result__url\" href=\"#\">www.acmewidgets.io</a>", "text/html");

    std::cout << "[Test] resolve command..." << std::endl;
    {
        std::ostringstream out;
        app::LogoScoutApp application(TestConfig(root / "assets"), http, out);
        assert(application.RunResolve("GH") == 0);
        assert(Contains(out.str(), "Domain: github.com"));
        assert(Contains(out.str(), "Confidence: alias"));

        out.str("");
        assert(application.RunResolve("Acme Widgets") == 0);
        assert(Contains(out.str(), "Domain: acmewidgets.io"));
        assert(Contains(out.str(), "Confidence: live-search"));
    }
    std::cout << "[PASS] resolve command" << std::endl;

    std::cout << "[Test] download command..." << std::endl;
    {
        std::ostringstream out;
        app::LogoScoutApp application(TestConfig(root / "assets"), http, out);
        assert(application.RunDownload("Stripe", domain::LogoSize::Large, "original") == 0);
        assert(fs::exists(root / "assets" / "stripe.png"));
        assert(fs::file_size(root / "assets" / "stripe.png") == 1500);
        assert(Contains(out.str(), "Source: Clearbit Logo API"));
        assert(Contains(out.str(), "Match confidence: exact"));

        assert(application.RunDownload("Stripe", domain::LogoSize::Large, "jpg") == 0);
        assert(fs::exists(root / "assets" / "stripe.jpg"));

        out.str("");
        assert(application.RunDownload("Figma", domain::LogoSize::Medium, "original") == 2);
        assert(Contains(out.str(), "Could not download logo for \"Figma\""));
        assert(Contains(out.str(), "Attempts (4):"));
        assert(!fs::exists(root / "assets" / "figma.png"));
    }
    std::cout << "[PASS] download command" << std::endl;

    std::cout << "[Test] bulk command..." << std::endl;
    {
        std::ostringstream out;
        auto config = TestConfig(root / "bulk");
        config.liveSearchEnabled = false;
        app::LogoScoutApp application(config, http, out);

        std::vector<std::string> tooMany(app::LogoScoutApp::kMaxBulkCompanies + 1, "stripe");
        assert(application.RunBulk(tooMany, domain::LogoSize::Large) == 1);
        assert(application.RunBulk({}, domain::LogoSize::Large) == 1);

        assert(application.RunBulk({"Stripe"}, domain::LogoSize::Large) == 0);
        assert(fs::exists(root / "bulk" / "stripe.png"));

        out.str("");
        assert(application.RunBulk({"Stripe", "Figma"}, domain::LogoSize::Small) == 2);
        assert(Contains(out.str(), "1/2 succeeded"));
        assert(Contains(out.str(), "figma (figma.com)"));
    }
    std::cout << "[PASS] bulk command" << std::endl;

    std::cout << "[Test] search and categories commands..." << std::endl;
    {
        std::ostringstream out;
        app::LogoScoutApp application(TestConfig(root / "assets"), http, out);
        assert(application.RunSearch("stripe", std::nullopt, 5) == 0);
        assert(Contains(out.str(), "stripe.com"));

        out.str("");
        assert(application.RunSearch("qqqqqqqqqq", std::string("CRM"), 25) == 0);
        assert(Contains(out.str(), "No companies found for \"qqqqqqqqqq\" in category \"CRM\""));

        out.str("");
        assert(application.RunCategories() == 0);
        assert(Contains(out.str(), "224 companies | 22 categories"));
        assert(Contains(out.str(), "  - Payments"));
    }
    std::cout << "[PASS] search and categories commands" << std::endl;

    fs::remove_all(root);
    std::cout << "All LogoScoutApp tests passed." << std::endl;
    return 0;
}
