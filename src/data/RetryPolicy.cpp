#include "georemind/data/RetryPolicy.hpp"

#include "georemind/core/Logging.hpp"

#include <QRandomGenerator>
#include <QThread>
#include <algorithm>

namespace georemind {
namespace data {

std::chrono::milliseconds RetryPolicy::delayFor(int attempt) const
{
    const int exponent = std::clamp(attempt - 1, 0, 16);
    const qint64 base = std::max<qint64>(baseDelay.count(), 0);
    const qint64 ceiling = std::max<qint64>(maxDelay.count(), base);
    const qint64 capped = std::min<qint64>(base << exponent, ceiling);
    const qint64 jitter = capped > 0 ? QRandomGenerator::global()->bounded(static_cast<int>(capped / 2) + 1) : 0;
    return std::chrono::milliseconds(std::min(capped + jitter, ceiling));
}

void RetryPolicy::pause(std::chrono::milliseconds delay) const
{
    if (sleep) {
        sleep(delay);
        return;
    }
    QThread::msleep(static_cast<unsigned long>(delay.count()));
}

void logRetry(const QString &what, int attempt, const StorageError &error)
{
    qCInfo(lcStorage) << what << "attempt" << attempt << "hit a transient error, retrying:" << error.message();
}

} // namespace data
} // namespace georemind
