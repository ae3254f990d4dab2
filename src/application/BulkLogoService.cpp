/**
 * @file BulkLogoService.cpp
 * @brief Implementation of BulkLogoService.
 */

#include "application/BulkLogoService.hpp"
#include <algorithm>
#include <atomic>
#include <exception>
#include <iostream>
#include <mutex>
#include <new>
#include <thread>

namespace logoscout::application {

BulkLogoService::BulkLogoService(std::shared_ptr<DomainResolver> resolver, std::shared_ptr<LogoFetcher> fetcher)
    : m_resolver(std::move(resolver)), m_fetcher(std::move(fetcher)) {}

std::vector<BulkItemResult> BulkLogoService::run(const std::vector<std::string>& inputs,
                                                 domain::LogoSize size,
                                                 const LogoSink& sink,
                                                 const domain::CancellationToken* cancel) const {
    std::vector<BulkItemResult> results(inputs.size());
    std::atomic<std::size_t> next{0};
    std::atomic<bool> aborted{false};
    std::mutex failureMutex;
    std::exception_ptr failure;

    // Each slot of `results` is written by exactly one worker.
    // Anything processOne lets through stops the batch and is rethrown by run().
    auto worker = [&]() {
        for (;;) {
            if (aborted.load()) {
                return;
            }
            const std::size_t index = next.fetch_add(1);
            if (index >= inputs.size()) {
                return;
            }
            try {
                results[index] = processOne(inputs[index], size, sink, cancel);
            } catch (...) {
                std::lock_guard<std::mutex> lock(failureMutex);
                if (!failure) {
                    failure = std::current_exception();
                }
                aborted.store(true);
                return;
            }
        }
    };

    const std::size_t workerCount = std::min(kMaxConcurrency, inputs.size());
    std::vector<std::thread> workers;
    workers.reserve(workerCount);
    for (std::size_t i = 0; i < workerCount; ++i) {
        workers.emplace_back(worker);
    }
    for (auto& t : workers) {
        if (t.joinable()) t.join();
    }
    if (failure) {
        std::rethrow_exception(failure);
    }

    const auto succeeded = std::count_if(results.begin(), results.end(),
                                         [](const BulkItemResult& r) { return r.success; });
    std::cout << "[BulkLogoService] " << succeeded << "/" << results.size() << " logos downloaded" << std::endl;
    return results;
}

BulkItemResult BulkLogoService::processOne(const std::string& input, domain::LogoSize size,
                                           const LogoSink& sink, const domain::CancellationToken* cancel) const {
    BulkItemResult item;
    item.input = input;

    try {
        const auto resolved = m_resolver->resolve(input, cancel);
        item.company = resolved.company;
        item.domain = resolved.domain;
        item.confidence = resolved.confidence;

        auto fetched = m_fetcher->fetchLogo(resolved.domain, resolved.company, size, cancel);
        if (!fetched.success || !fetched.logo) {
            item.error = fetched.error.value_or("Unknown error");
            return item;
        }

        item.source = fetched.logo->source;
        if (sink) {
            item.filePath = sink(resolved, *fetched.logo);
        }
        item.success = true;
    } catch (const std::bad_alloc&) {
        throw;
    } catch (const std::exception& e) {
        item.success = false;
        item.error = e.what();
        std::cerr << "[BulkLogoService] '" << input << "' failed: " << e.what() << std::endl;
    } catch (...) {
        item.success = false;
        item.error = "Unknown error during bulk item processing.";
        std::cerr << "[BulkLogoService] '" << input << "' failed with an unknown error" << std::endl;
    }
    return item;
}

} // namespace logoscout::application
