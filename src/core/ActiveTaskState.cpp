#include "georemind/core/ActiveTaskState.hpp"

#include "georemind/core/Logging.hpp"
#include "georemind/data/KeyValueStore.hpp"

#include <algorithm>

namespace georemind {
namespace core {

namespace {
const QString kActiveTaskIdKey = QStringLiteral("active/taskId");
const QString kActiveStartedAtKey = QStringLiteral("active/startedAt");
const QString kActivePausedAtKey = QStringLiteral("active/pausedAt");
const QString kActivePausedSecondsKey = QStringLiteral("active/pausedSeconds");
const QString kPendingGroup = QStringLiteral("pending");

QString pendingKey(data::TaskId taskId)
{
    return QStringLiteral("%1/%2").arg(kPendingGroup).arg(taskId);
}
} // namespace

qint64 ActiveTaskMarker::pausedSecondsAt(const QDateTime &now) const
{
    if (!isPaused()) {
        return pausedSeconds;
    }
    return pausedSeconds + std::max<qint64>(0, pausedAt.secsTo(now));
}

ActiveTaskState::ActiveTaskState(data::KeyValueStore &store)
    : m_store(store)
{
}

std::optional<ActiveTaskMarker> ActiveTaskState::activeTask() const
{
    const QVariant storedId = m_store.value(kActiveTaskIdKey);
    if (!storedId.isValid()) {
        return std::nullopt;
    }
    bool ok = false;
    const data::TaskId taskId = storedId.toLongLong(&ok);
    if (!ok) {
        qCWarning(lcArbiter) << "Ignoring malformed active task marker" << storedId;
        return std::nullopt;
    }
    ActiveTaskMarker marker;
    marker.taskId = taskId;
    marker.startedAt = QDateTime::fromString(m_store.value(kActiveStartedAtKey).toString(), Qt::ISODateWithMs);
    marker.pausedAt = QDateTime::fromString(m_store.value(kActivePausedAtKey).toString(), Qt::ISODateWithMs);
    marker.pausedSeconds = std::max<qint64>(0, m_store.value(kActivePausedSecondsKey).toLongLong());
    return marker;
}

void ActiveTaskState::setActive(data::TaskId taskId, const QDateTime &startedAt)
{
    // The id goes last: a reader seeing it always finds the start time too.
    m_store.remove(kActivePausedAtKey);
    m_store.remove(kActivePausedSecondsKey);
    m_store.setValue(kActiveStartedAtKey, startedAt.toString(Qt::ISODateWithMs));
    m_store.setValue(kActiveTaskIdKey, taskId);
}

void ActiveTaskState::clearActive()
{
    // The id goes first, so a half-cleared marker reads as none.
    m_store.remove(kActiveTaskIdKey);
    m_store.remove(kActiveStartedAtKey);
    m_store.remove(kActivePausedAtKey);
    m_store.remove(kActivePausedSecondsKey);
}

void ActiveTaskState::setPaused(const QDateTime &pausedAt)
{
    m_store.setValue(kActivePausedAtKey, pausedAt.toString(Qt::ISODateWithMs));
}

void ActiveTaskState::setResumed(qint64 pausedSeconds)
{
    m_store.setValue(kActivePausedSecondsKey, pausedSeconds);
    m_store.remove(kActivePausedAtKey);
}

void ActiveTaskState::addPending(data::TaskId taskId, const QDateTime &until)
{
    m_store.setValue(pendingKey(taskId), until.toString(Qt::ISODateWithMs));
}

bool ActiveTaskState::removePending(data::TaskId taskId)
{
    const QString key = pendingKey(taskId);
    if (!m_store.value(key).isValid()) {
        return false;
    }
    m_store.remove(key);
    return true;
}

std::vector<data::TaskId> ActiveTaskState::pendingTaskIds(const QDateTime &now)
{
    std::vector<data::TaskId> live;
    for (const QString &key : m_store.childKeys(kPendingGroup)) {
        bool ok = false;
        const data::TaskId taskId = key.toLongLong(&ok);
        const QDateTime until =
            QDateTime::fromString(m_store.value(QStringLiteral("%1/%2").arg(kPendingGroup, key)).toString(),
                                  Qt::ISODateWithMs);
        if (!ok || !until.isValid() || until < now) {
            m_store.remove(QStringLiteral("%1/%2").arg(kPendingGroup, key));
            qCDebug(lcArbiter) << "Pruned pending entry" << key;
            continue;
        }
        live.push_back(taskId);
    }
    std::sort(live.begin(), live.end());
    return live;
}

} // namespace core
} // namespace georemind
