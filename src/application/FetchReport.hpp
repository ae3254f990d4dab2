/**
 * @file FetchReport.hpp
 * @brief Human-readable rendering of fetch results for diagnostics.
 */

#pragma once
#include <string>
#include "domain/LogoFetchResult.hpp"

namespace logoscout::application {

/**
 * @brief Multi-line summary: outcome, provenance and one line per attempt.
 *
 * Failed attempts are followed by an indented line carrying the error.
 */
std::string SummarizeFetchResult(const domain::LogoFetchResult& result);

} // namespace logoscout::application
