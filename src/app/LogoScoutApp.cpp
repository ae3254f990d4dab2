/**
 * @file LogoScoutApp.cpp
 * @brief Implementation of LogoScoutApp.
 */

#include "app/LogoScoutApp.hpp"
#include "application/FetchReport.hpp"
#include "application/ImageValidator.hpp"
#include "infrastructure/HttplibClient.hpp"
#include "infrastructure/WebSearchDomainFinder.hpp"
#include <chrono>
#include <iomanip>

namespace logoscout::app {

namespace {

std::string JoinStrings(const std::vector<std::string>& values, const std::string& separator) {
    std::string out;
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out += separator;
        out += values[i];
    }
    return out;
}

} // namespace

LogoScoutApp::LogoScoutApp(infrastructure::AppConfig config,
                           std::shared_ptr<domain::HttpClient> http,
                           std::ostream& out)
    : m_config(std::move(config)), m_out(out) {
    if (!http) {
        http = std::make_shared<infrastructure::HttplibClient>();
    }

    std::shared_ptr<domain::DomainSearchService> liveSearch;
    if (m_config.liveSearchEnabled) {
        infrastructure::WebSearchDomainFinder::Settings searchSettings;
        searchSettings.endpoint = m_config.endpoints.htmlSearch;
        searchSettings.userAgent = m_config.searchUserAgent;
        searchSettings.timeout = std::chrono::milliseconds(m_config.liveSearchTimeoutMs);
        liveSearch = std::make_shared<infrastructure::WebSearchDomainFinder>(http, searchSettings);
    }

    application::LogoFetcher::Settings fetchSettings;
    fetchSettings.logoApiBase = m_config.endpoints.logoApi;
    fetchSettings.faviconServiceBase = m_config.endpoints.faviconService;
    fetchSettings.instantAnswerBase = m_config.endpoints.instantAnswer;
    fetchSettings.instantAnswerOrigin = m_config.endpoints.instantAnswerOrigin;
    fetchSettings.userAgent = m_config.userAgent;
    fetchSettings.sourceTimeout = std::chrono::milliseconds(m_config.sourceTimeoutMs);
    fetchSettings.faviconProbeTimeout = std::chrono::milliseconds(m_config.faviconProbeTimeoutMs);

    m_services.resolver = std::make_shared<application::DomainResolver>(liveSearch);
    m_services.companySearch = std::make_unique<application::CompanySearch>();
    m_services.logoFetcher = std::make_shared<application::LogoFetcher>(http, fetchSettings);
    m_services.bulkService = std::make_unique<application::BulkLogoService>(m_services.resolver, m_services.logoFetcher);
    m_services.logoRepository = std::make_unique<infrastructure::LogoRepository>(m_config.assetsDir);
}

int LogoScoutApp::RunDownload(const std::string& company, domain::LogoSize size, const std::string& format) {
    const auto resolved = m_services.resolver->resolve(company);
    const auto result = m_services.logoFetcher->fetchLogo(resolved.domain, resolved.company, size);

    if (!result.success || !result.logo) {
        m_out << "Could not download logo for \"" << company << "\"\n"
              << "   Resolved domain: " << resolved.domain
              << " (confidence: " << domain::ConfidenceToString(resolved.confidence) << ")\n\n"
              << application::SummarizeFetchResult(result) << "\n\n"
              << "Tip: try providing the exact domain name, e.g. 'shopify.com'" << std::endl;
        return 2;
    }

    // The override only renames; bytes are always stored as received.
    const std::string extension = format != "original" ? format : result.logo->imageInfo.extension;
    const auto path = m_services.logoRepository->save(resolved.company, extension, result.logo->buffer);

    m_out << "Logo downloaded successfully!\n\n"
          << "Company: " << resolved.company << "\n"
          << "Domain: " << resolved.domain << "\n"
          << "Match confidence: " << domain::ConfidenceToString(resolved.confidence);
    if (resolved.confidence == domain::MatchConfidence::Fuzzy) {
        m_out << " (matched: \"" << resolved.matchedName << "\")";
    }
    m_out << "\nCategory: " << resolved.category << "\n\n"
          << "Saved to: " << path.string() << "\n"
          << "Format: " << result.logo->imageInfo.format << "\n"
          << "Size: " << application::FormatFileSize(result.logo->imageInfo.sizeBytes) << "\n"
          << "Source: " << result.logo->source << "\n\n"
          << "Fetch attempts: " << result.attempts.size();
    for (const auto& attempt : result.attempts) {
        m_out << "\n   " << (attempt.success ? "[ok]   " : "[skip] ") << attempt.source
              << " (" << attempt.durationMs << "ms)";
        if (attempt.error) {
            m_out << " - " << *attempt.error;
        }
    }
    m_out << std::endl;
    return 0;
}

int LogoScoutApp::RunResolve(const std::string& company) {
    const auto resolved = m_services.resolver->resolve(company);
    m_out << "Input: " << company << "\n"
          << "Domain: " << resolved.domain << "\n"
          << "Company: " << resolved.company << "\n"
          << "Category: " << resolved.category << "\n"
          << "Confidence: " << domain::ConfidenceToString(resolved.confidence) << "\n"
          << "Matched name: " << resolved.matchedName << std::endl;
    return 0;
}

int LogoScoutApp::RunSearch(const std::string& query, const std::optional<std::string>& category, std::size_t limit) {
    application::SearchOptions options;
    options.category = category;
    options.limit = limit;

    const auto results = m_services.companySearch->search(query, options);
    const auto categories = m_services.companySearch->categories();
    const auto total = m_services.companySearch->companyCount();
    const std::string scope = category ? " in category \"" + *category + "\"" : std::string();

    if (results.empty()) {
        m_out << "No companies found for \"" << query << "\"" << scope << "\n\n"
              << "Database: " << total << " companies across " << categories.size() << " categories\n"
              << "Categories: " << JoinStrings(categories, ", ") << "\n\n"
              << "Tips:\n"
              << "   - Try a shorter search term\n"
              << "   - Browse by category: search for \"CRM\", \"Payments\", \"Cloud\", etc.\n"
              << "   - Downloading still works for companies not in the database" << std::endl;
        return 0;
    }

    m_out << "Found " << results.size() << " companies matching \"" << query << "\"" << scope << "\n\n";
    for (const auto& r : results) {
        m_out << "  - " << std::left << std::setw(20) << r.name << " | "
              << std::setw(30) << r.domain << " | " << r.category;
        if (!r.aliases.empty()) {
            m_out << " | aliases: " << JoinStrings(r.aliases, ", ");
        }
        m_out << "\n";
    }
    m_out << std::right << "\nDatabase: " << total << " companies | " << categories.size() << " categories" << std::endl;
    return 0;
}

int LogoScoutApp::RunBulk(const std::vector<std::string>& companies, domain::LogoSize size) {
    if (companies.empty() || companies.size() > kMaxBulkCompanies) {
        std::cerr << "[LogoScoutApp] bulk expects between 1 and " << kMaxBulkCompanies
                  << " companies, got " << companies.size() << std::endl;
        return 1;
    }

    auto& repository = *m_services.logoRepository;
    application::LogoSink sink = [&repository](const domain::ResolvedDomain& resolved,
                                               const domain::LogoResult& logo) {
        return repository.save(resolved.company, logo.imageInfo.extension, logo.buffer).string();
    };

    const auto results = m_services.bulkService->run(companies, size, sink);

    std::size_t successes = 0;
    for (const auto& r : results) {
        if (r.success) ++successes;
    }

    m_out << "Bulk Logo Download Complete\n"
          << "   " << successes << "/" << results.size() << " succeeded\n";

    if (successes > 0) {
        m_out << "\nSuccessfully downloaded:\n";
        for (const auto& r : results) {
            if (!r.success) continue;
            m_out << "   - " << r.company << " (" << r.domain << ") -> " << r.filePath.value_or("")
                  << " [" << r.source.value_or("") << "]\n";
        }
    }
    if (successes < results.size()) {
        m_out << "\nFailed:\n";
        for (const auto& r : results) {
            if (r.success) continue;
            const std::string company = r.company.empty() ? r.input : r.company;
            m_out << "   - " << company << " (" << (r.domain.empty() ? "unknown" : r.domain) << ") - "
                  << r.error.value_or("Unknown error") << "\n";
        }
    }
    m_out << "\nAssets saved to: " << repository.assetsDir().string() << std::endl;
    return successes == results.size() ? 0 : 2;
}

int LogoScoutApp::RunCategories() {
    const auto categories = m_services.companySearch->categories();
    m_out << "Database: " << m_services.companySearch->companyCount() << " companies | "
          << categories.size() << " categories\n";
    for (const auto& c : categories) {
        m_out << "  - " << c << "\n";
    }
    m_out.flush();
    return 0;
}

} // namespace logoscout::app
