#pragma once

#include <QDateTime>
#include <optional>
#include <vector>

#include "georemind/data/Task.hpp"

namespace georemind {
namespace data {
class KeyValueStore;
}

namespace core {

struct ActiveTaskMarker
{
    data::TaskId taskId = 0;
    QDateTime startedAt;
    QDateTime pausedAt;      // invalid while running
    qint64 pausedSeconds = 0; // finished pauses only

    bool isPaused() const { return pausedAt.isValid(); }
    // Time spent paused up to now, the running pause included.
    qint64 pausedSecondsAt(const QDateTime &now) const;
};

// Expired pending entries are ignored and pruned.
class ActiveTaskState
{
public:
    explicit ActiveTaskState(data::KeyValueStore &store);

    std::optional<ActiveTaskMarker> activeTask() const;
    void setActive(data::TaskId taskId, const QDateTime &startedAt);
    void clearActive();
    void setPaused(const QDateTime &pausedAt);
    void setResumed(qint64 pausedSeconds);

    void addPending(data::TaskId taskId, const QDateTime &until);
    bool removePending(data::TaskId taskId);
    std::vector<data::TaskId> pendingTaskIds(const QDateTime &now);

private:
    data::KeyValueStore &m_store;
};

} // namespace core
} // namespace georemind
