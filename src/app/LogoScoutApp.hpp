/**
 * @file LogoScoutApp.hpp
 * @brief Command-level entry points of the logoscout CLI.
 */

#pragma once

#include <cstddef>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "application/AppServices.hpp"
#include "domain/HttpClient.hpp"
#include "domain/LogoFetchResult.hpp"
#include "infrastructure/ConfigLoader.hpp"

namespace logoscout::app {

/**
 * @class LogoScoutApp
 * @brief Wires services from configuration and renders command results.
 *
 * Each run* method returns a process exit code.
 */
class LogoScoutApp {
public:
    static constexpr std::size_t kMaxBulkCompanies = 20;

    /**
     * @param config Effective configuration.
     * @param http Transport override; nullptr uses HttplibClient.
     * @param out Stream receiving user-facing reports.
     */
    explicit LogoScoutApp(infrastructure::AppConfig config,
                          std::shared_ptr<domain::HttpClient> http = nullptr,
                          std::ostream& out = std::cout);

    /** @brief Resolve, fetch and save one logo. 0 on success, 2 if no logo was found. */
    int RunDownload(const std::string& company, domain::LogoSize size, const std::string& format);

    int RunResolve(const std::string& company);

    int RunSearch(const std::string& query, const std::optional<std::string>& category, std::size_t limit);

    /** @brief Download up to kMaxBulkCompanies logos concurrently. */
    int RunBulk(const std::vector<std::string>& companies, domain::LogoSize size);

    int RunCategories();

private:
    infrastructure::AppConfig m_config;
    application::AppServices m_services;
    std::ostream& m_out;
};

} // namespace logoscout::app
