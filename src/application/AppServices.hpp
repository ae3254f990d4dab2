/**
 * @file AppServices.hpp
 * @brief Container for application-level services to facilitate dependency injection.
 */

#pragma once

#include <memory>
#include "application/BulkLogoService.hpp"
#include "application/CompanySearch.hpp"
#include "application/DomainResolver.hpp"
#include "application/LogoFetcher.hpp"
#include "infrastructure/LogoRepository.hpp"

namespace logoscout::application {

struct AppServices {
    std::shared_ptr<DomainResolver> resolver;
    std::unique_ptr<CompanySearch> companySearch;
    std::shared_ptr<LogoFetcher> logoFetcher;
    std::unique_ptr<BulkLogoService> bulkService;
    std::unique_ptr<infrastructure::LogoRepository> logoRepository;
};

} // namespace logoscout::application
