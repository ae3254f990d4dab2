#include <cassert>
#include <iostream>

#include "application/TextMatching.hpp"

using namespace logoscout::application;

int main() {
    std::cout << "[Test] NormalizeName..." << std::endl;
    assert(NormalizeName("Shopify") == "shopify");
    assert(NormalizeName("  Shop_i-fy.  ") == "shopify");
    assert(NormalizeName("Next.js") == "nextjs");
    assert(NormalizeName("Google   Cloud\tPlatform") == "google cloud platform");
    assert(NormalizeName("") == "");
    assert(NormalizeName(" \t\n ") == "");
    // Punctuation is removed after trimming, so the leftover space is kept.
    assert(NormalizeName(". Stripe") == " stripe");
    std::cout << "[PASS] NormalizeName" << std::endl;

    std::cout << "[Test] Helpers..." << std::endl;
    assert(ToLower("HubSpot CRM") == "hubspot crm");
    assert(StripWhitespace("acme widgets\tcorp") == "acmewidgetscorp");
    std::cout << "[PASS] Helpers" << std::endl;

    std::cout << "[Test] LevenshteinDistance..." << std::endl;
    assert(LevenshteinDistance("shoppify", "shopify") == 1);
    assert(LevenshteinDistance("kitten", "sitting") == 3);
    assert(LevenshteinDistance("flaw", "lawn") == 2);
    assert(LevenshteinDistance("", "abc") == 3);
    assert(LevenshteinDistance("abc", "") == 3);
    assert(LevenshteinDistance("stripe", "stripe") == 0);
    assert(LevenshteinDistance("slak", "slack") == LevenshteinDistance("slack", "slak"));
    std::cout << "[PASS] LevenshteinDistance" << std::endl;

    std::cout << "All TextMatching tests passed." << std::endl;
    return 0;
}
