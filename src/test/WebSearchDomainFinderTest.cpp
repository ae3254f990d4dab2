#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "infrastructure/WebSearchDomainFinder.hpp"
#include "TestSupport.hpp"

using namespace logoscout;
using infrastructure::WebSearchDomainFinder;

namespace {

const char* kResultsPage = R"(<html><body>
<div class="result results_links">
  <a class="result__a" href="//duckduckgo.com/l/?uddg=1">Acme - Wikipedia</a>
  <a class="result__url" href="//duckduckgo.com/l/?uddg=1">
    en.wikipedia.org/wiki/Acme
  </a>
</div>
<div class="result results_links">
  <a class="result__url js-result-url" href="//duckduckgo.com/l/?uddg=2">www.linkedin.com/company/acme</a>
</div>
<div class="result results_links">
  <a class="result__url" href="//duckduckgo.com/l/?uddg=3"><b>www.AcmeWidgets.com</b>/about?a=1&amp;b=2</a>
</div>
<div class="result results_links">
  <a class="result__url" href="//duckduckgo.com/l/?uddg=4">acme.example.org</a>
</div>
</body></html>)";

WebSearchDomainFinder::Settings TestSettings() {
    WebSearchDomainFinder::Settings settings;
    settings.endpoint = "https://search.test/html/";
    settings.userAgent = "TestBrowser/1.0";
    settings.timeout = std::chrono::milliseconds(1234);
    return settings;
}

} // namespace

int main() {
    std::cout << "[Test] Extracting displayed result URLs..." << std::endl;
    auto urls = WebSearchDomainFinder::ExtractResultUrls(kResultsPage);
    assert(urls.size() == 4);
    assert(urls[0] == "en.wikipedia.org/wiki/Acme");
    assert(urls[1] == "www.linkedin.com/company/acme");
    assert(urls[2] == "www.AcmeWidgets.com/about?a=1&b=2");
    assert(urls[3] == "acme.example.org");
    assert(WebSearchDomainFinder::ExtractResultUrls("<html>no results</html>").empty());
    // "result__url__extra" is a different class.
    assert(WebSearchDomainFinder::ExtractResultUrls(
        "<span class=\"result__url__extra\">x.com</span>").empty());
    assert(WebSearchDomainFinder::ExtractResultUrls("<p title=\"result__url\">result__url</p>").empty());
    std::cout << "[PASS] Extracting displayed result URLs" << std::endl;

    std::cout << "[Test] Character references are decoded..." << std::endl;
    auto decoded = WebSearchDomainFinder::ExtractResultUrls(
        "<a class=\"result__url\">www.example&#46;com/a</a>"
        "<a class='result__url'>caf&eacute;.fr</a>"
        "<span class=\"result__url\">shop&#x2E;test&#x2F;x</span>");
    assert(decoded.size() == 3);
    assert(decoded[0] == "www.example.com/a");
    assert(decoded[1] == "caf\xC3\xA9.fr");
    assert(decoded[2] == "shop.test/x");
    assert(WebSearchDomainFinder::SelectOfficialDomain(decoded) == std::optional<std::string>("example.com"));
    std::cout << "[PASS] Character references are decoded" << std::endl;

    std::cout << "[Test] Selecting the official domain..." << std::endl;
    assert(WebSearchDomainFinder::SelectOfficialDomain(urls) == std::optional<std::string>("acmewidgets.com"));
    assert(!WebSearchDomainFinder::SelectOfficialDomain({}));
    assert(!WebSearchDomainFinder::SelectOfficialDomain({
        "https://www.facebook.com/acme", "apps.apple.com/app/acme", "www.g2.com/products/acme",
        "github.com/acme", "duckduckgo.com/?q=acme"
    }));
    // Substring match also covers subdomains of excluded hosts.
    assert(WebSearchDomainFinder::SelectOfficialDomain({"fr.linkedin.com/acme", "https://Acme.io/"})
           == std::optional<std::string>("acme.io"));
    std::cout << "[PASS] Selecting the official domain" << std::endl;

    std::cout << "[Test] Live search request..." << std::endl;
    auto http = std::make_shared<test::FakeHttpClient>();
    http->respond("https://search.test/html/", 200, kResultsPage, "text/html");
    WebSearchDomainFinder finder(http, TestSettings());

    auto found = finder.findOfficialDomain("Acme Widgets");
    assert(found == std::optional<std::string>("acmewidgets.com"));

    auto requests = http->requests();
    assert(requests.size() == 1);
    assert(requests[0].url == "https://search.test/html/?q=Acme%20Widgets%20official%20website");
    assert(test::HeaderValue(requests[0], "User-Agent") == "TestBrowser/1.0");
    assert(test::HeaderValue(requests[0], "Cookie") == "ah=wt");
    assert(requests[0].timeout == std::chrono::milliseconds(1234));
    std::cout << "[PASS] Live search request" << std::endl;

    std::cout << "[Test] Failures yield no domain..." << std::endl;
    auto failing = std::make_shared<test::FakeHttpClient>();
    failing->fail("https://search.test/", "connection refused");
    WebSearchDomainFinder unreachable(failing, TestSettings());
    assert(!unreachable.findOfficialDomain("Acme"));

    auto blocked = std::make_shared<test::FakeHttpClient>();
    blocked->respond("https://search.test/", 403, kResultsPage, "text/html");
    WebSearchDomainFinder forbidden(blocked, TestSettings());
    assert(!forbidden.findOfficialDomain("Acme"));

    auto garbage = std::make_shared<test::FakeHttpClient>();
    garbage->respond("https://search.test/", 200, "<<<not html", "text/html");
    WebSearchDomainFinder unparseable(garbage, TestSettings());
    assert(!unparseable.findOfficialDomain("Acme"));
    std::cout << "[PASS] Failures yield no domain" << std::endl;

    std::cout << "All WebSearchDomainFinder tests passed." << std::endl;
    return 0;
}
