#pragma once

#include <QMap>
#include <optional>
#include <vector>

#include "georemind/data/TaskHistoryEntry.hpp"

namespace georemind {
namespace data {

class Connection;

class TaskHistoryRepository
{
public:
    explicit TaskHistoryRepository(Connection &connection);

    // A second open entry for one task is a Constraint StorageError.
    TaskHistoryEntry openEntry(TaskHistoryEntry entry);
    std::optional<TaskHistoryEntry> findOpenEntry(TaskId taskId) const;
    // Sets end time, duration and completion date. False when the entry is unknown or already closed.
    bool closeEntry(qint64 entryId, const QDateTime &endTime, qint64 pausedSeconds = 0);
    bool removeEntry(qint64 entryId);

    std::vector<TaskHistoryEntry> fetchForTask(TaskId taskId) const;
    qint64 totalTimeSpent(TaskId taskId) const;
    int completionCount(TaskId taskId) const;
    std::optional<QDateTime> lastCompletionTime(TaskId taskId) const;

    // Closed entries, newest first.
    std::vector<TaskHistoryEntry> fetchPage(int limit, int offset) const;
    int totalCount() const;
    QMap<QDate, std::vector<TaskHistoryEntry>> groupByCompletionDate(const QDate &from, const QDate &to) const;

private:
    Connection &m_connection;
};

} // namespace data
} // namespace georemind
