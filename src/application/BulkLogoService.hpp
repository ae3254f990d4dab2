/**
 * @file BulkLogoService.hpp
 * @brief Resolves and fetches logos for many companies with a fixed concurrency cap.
 */

#pragma once
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "application/DomainResolver.hpp"
#include "application/LogoFetcher.hpp"

namespace logoscout::application {

/**
 * @struct BulkItemResult
 * @brief Outcome for one input of a bulk run.
 */
struct BulkItemResult {
    std::string input;
    std::string company;
    std::string domain;
    std::optional<domain::MatchConfidence> confidence; ///< Empty if resolution never completed.
    bool success = false;
    std::optional<std::string> filePath; ///< Set when a sink stored the logo.
    std::optional<std::string> source;
    std::optional<std::string> error;
};

/**
 * @brief Receives each downloaded logo; returns where it was stored.
 *
 * Called from worker threads. May throw; the error is reported for that item only,
 * except std::bad_alloc, which aborts the batch.
 */
using LogoSink = std::function<std::string(const domain::ResolvedDomain&, const domain::LogoResult&)>;

/**
 * @class BulkLogoService
 * @brief Fans out independent resolve+fetch chains over at most kMaxConcurrency threads.
 *
 * Items never affect each other: a network error, rejected image or exception
 * in one chain is recorded in that item's result and the others carry on.
 * There is no batch-wide deadline.
 */
class BulkLogoService {
public:
    static constexpr std::size_t kMaxConcurrency = 5;

    BulkLogoService(std::shared_ptr<DomainResolver> resolver, std::shared_ptr<LogoFetcher> fetcher);

    /**
     * @brief Processes every input.
     * @return One result per input, in input order.
     * @throws std::bad_alloc if any item runs out of memory; remaining items are skipped.
     */
    std::vector<BulkItemResult> run(const std::vector<std::string>& inputs,
                                    domain::LogoSize size,
                                    const LogoSink& sink = nullptr,
                                    const domain::CancellationToken* cancel = nullptr) const;

private:
    BulkItemResult processOne(const std::string& input, domain::LogoSize size,
                              const LogoSink& sink, const domain::CancellationToken* cancel) const;

    std::shared_ptr<DomainResolver> m_resolver;
    std::shared_ptr<LogoFetcher> m_fetcher;
};

} // namespace logoscout::application
