#include "application/FetchReport.hpp"
#include "application/ImageValidator.hpp"
#include <sstream>

namespace logoscout::application {

std::string SummarizeFetchResult(const domain::LogoFetchResult& result) {
    std::ostringstream out;

    if (result.success && result.logo) {
        out << "[OK] Logo downloaded successfully\n";
        out << "   Source: " << result.logo->source << "\n";
        out << "   Format: " << result.logo->imageInfo.format << "\n";
        out << "   Size: " << FormatFileSize(result.logo->imageInfo.sizeBytes) << "\n";
    } else {
        out << "[FAIL] Failed to download logo\n";
        out << "   Error: " << result.error.value_or("Unknown error") << "\n";
    }

    out << "\nAttempts (" << result.attempts.size() << "):";
    for (const auto& attempt : result.attempts) {
        out << "\n   " << (attempt.success ? "[ok]   " : "[fail] ") << attempt.source
            << " (" << attempt.durationMs << "ms)";
        if (attempt.error) {
            out << "\n      -> " << *attempt.error;
        }
    }
    return out.str();
}

} // namespace logoscout::application
