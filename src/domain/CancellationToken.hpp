/**
 * @file CancellationToken.hpp
 * @brief Shared flag used by callers to abort in-flight network work.
 */

#pragma once
#include <atomic>

namespace logoscout::domain {

/**
 * @class CancellationToken
 * @brief Thread-safe one-way cancel switch. Once cancelled it stays cancelled.
 */
class CancellationToken {
public:
    void cancel() { m_cancelled.store(true); }
    bool isCancelled() const { return m_cancelled.load(); }

private:
    std::atomic<bool> m_cancelled{false};
};

} // namespace logoscout::domain
