#pragma once

#include <QDate>
#include <QDateTime>
#include <QString>
#include <optional>

#include "georemind/data/Task.hpp"

namespace georemind {
namespace data {

// One work session on a task. Open while endTime is invalid; never changed once closed.
struct TaskHistoryEntry
{
    std::optional<qint64> id;
    std::optional<TaskId> taskId; // unset for orphaned entries
    QString taskName;
    int taskPriority = 3;
    QDateTime startTime;
    QDateTime endTime;
    qint64 durationSeconds = 0;
    QDate completionDate;
    QString geofenceId;

    bool isOpen() const { return !endTime.isValid(); }
};

} // namespace data
} // namespace georemind
