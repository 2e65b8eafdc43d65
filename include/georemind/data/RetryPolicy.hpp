#pragma once

#include <chrono>
#include <functional>
#include <type_traits>
#include <utility>

#include "georemind/data/StorageError.hpp"

namespace georemind {
namespace data {

struct RetryPolicy
{
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    int maxAttempts = 3;
    std::chrono::milliseconds baseDelay{ 100 };
    std::chrono::milliseconds maxDelay{ 2000 };
    Sleeper sleep; // empty uses QThread::msleep

    // Exponential backoff for the given 1-based attempt, with up to 50% random jitter, never above maxDelay.
    std::chrono::milliseconds delayFor(int attempt) const;
    void pause(std::chrono::milliseconds delay) const;
};

void logRetry(const QString &what, int attempt, const StorageError &error);

// Retries transient errors only. Running out of attempts throws StorageUnavailable.
template<typename Operation>
auto runWithRetry(const RetryPolicy &policy, const QString &what, Operation &&operation)
    -> decltype(operation())
{
    const int attempts = policy.maxAttempts < 1 ? 1 : policy.maxAttempts;
    for (int attempt = 1;; ++attempt) {
        try {
            return operation();
        } catch (const StorageUnavailable &) {
            throw;
        } catch (const StorageError &error) {
            if (!error.isTransient()) {
                throw;
            }
            if (attempt >= attempts) {
                throw StorageUnavailable(QStringLiteral("%1 failed after %2 attempts: %3")
                                             .arg(what)
                                             .arg(attempts)
                                             .arg(error.message()));
            }
            logRetry(what, attempt, error);
            policy.pause(policy.delayFor(attempt));
        }
    }
}

} // namespace data
} // namespace georemind
