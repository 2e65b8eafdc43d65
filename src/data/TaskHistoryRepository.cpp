#include "georemind/data/TaskHistoryRepository.hpp"

#include "georemind/core/Logging.hpp"
#include "georemind/data/Database.hpp"

#include <QSqlQuery>
#include <QVariant>

namespace georemind {
namespace data {

namespace {
const QString kSelectColumns = QStringLiteral(
    "SELECT id, task_id, task_name, task_priority, start_time, end_time, duration_seconds, completion_date, "
    "geofence_id FROM task_history");

TaskHistoryEntry readEntry(const QSqlQuery &query)
{
    TaskHistoryEntry entry;
    entry.id = query.value(0).toLongLong();
    if (!query.value(1).isNull()) {
        entry.taskId = query.value(1).toLongLong();
    }
    entry.taskName = query.value(2).toString();
    entry.taskPriority = query.value(3).toInt();
    entry.startTime = QDateTime::fromSecsSinceEpoch(query.value(4).toLongLong());
    if (!query.value(5).isNull()) {
        entry.endTime = QDateTime::fromSecsSinceEpoch(query.value(5).toLongLong());
    }
    entry.durationSeconds = query.value(6).toLongLong();
    entry.completionDate = QDate::fromString(query.value(7).toString(), Qt::ISODate);
    entry.geofenceId = query.value(8).toString();
    return entry;
}

std::vector<TaskHistoryEntry> readAll(QSqlQuery &query)
{
    std::vector<TaskHistoryEntry> entries;
    while (query.next()) {
        entries.push_back(readEntry(query));
    }
    return entries;
}
} // namespace

TaskHistoryRepository::TaskHistoryRepository(Connection &connection)
    : m_connection(connection)
{
}

TaskHistoryEntry TaskHistoryRepository::openEntry(TaskHistoryEntry entry)
{
    entry.endTime = QDateTime();
    entry.durationSeconds = 0;
    entry.completionDate = QDate();

    return runWithRetry(m_connection.retryPolicy(), QStringLiteral("open history entry"), [&] {
        QSqlQuery query = m_connection.prepare(QStringLiteral(
            "INSERT INTO task_history (task_id, task_name, task_priority, start_time, end_time, duration_seconds, "
            "completion_date, geofence_id, created_at) VALUES (:task_id, :name, :priority, :start, NULL, 0, NULL, "
            ":geofence, :created)"));
        query.bindValue(QStringLiteral(":task_id"), entry.taskId ? QVariant(*entry.taskId) : QVariant(QVariant::LongLong));
        query.bindValue(QStringLiteral(":name"), entry.taskName);
        query.bindValue(QStringLiteral(":priority"), entry.taskPriority);
        query.bindValue(QStringLiteral(":start"), entry.startTime.toSecsSinceEpoch());
        query.bindValue(QStringLiteral(":geofence"),
                        entry.geofenceId.isEmpty() ? QVariant(QVariant::String) : QVariant(entry.geofenceId));
        query.bindValue(QStringLiteral(":created"), QDateTime::currentSecsSinceEpoch());
        m_connection.exec(query, QStringLiteral("open history entry"));

        TaskHistoryEntry stored = entry;
        stored.id = query.lastInsertId().toLongLong();
        return stored;
    });
}

std::optional<TaskHistoryEntry> TaskHistoryRepository::findOpenEntry(TaskId taskId) const
{
    return runWithRetry(m_connection.retryPolicy(), QStringLiteral("find open history entry"),
                        [&]() -> std::optional<TaskHistoryEntry> {
                            QSqlQuery query = m_connection.prepare(
                                kSelectColumns + QStringLiteral(" WHERE task_id = :task_id AND end_time IS NULL"));
                            query.bindValue(QStringLiteral(":task_id"), taskId);
                            m_connection.exec(query, QStringLiteral("find open history entry"));
                            if (query.next()) {
                                return readEntry(query);
                            }
                            return std::nullopt;
                        });
}

bool TaskHistoryRepository::closeEntry(qint64 entryId, const QDateTime &endTime, qint64 pausedSeconds)
{
    return runWithRetry(m_connection.retryPolicy(), QStringLiteral("close history entry"), [&] {
        // Duration is clamped so a clock step backwards never stores a negative value.
        QSqlQuery query = m_connection.prepare(QStringLiteral(
            "UPDATE task_history SET end_time = :end, "
            "duration_seconds = MAX(0, :end_for_duration - start_time - :paused), completion_date = :date "
            "WHERE id = :id AND end_time IS NULL"));
        query.bindValue(QStringLiteral(":end"), endTime.toSecsSinceEpoch());
        query.bindValue(QStringLiteral(":end_for_duration"), endTime.toSecsSinceEpoch());
        query.bindValue(QStringLiteral(":paused"), pausedSeconds);
        query.bindValue(QStringLiteral(":date"), endTime.date().toString(Qt::ISODate));
        query.bindValue(QStringLiteral(":id"), entryId);
        m_connection.exec(query, QStringLiteral("close history entry"));
        return query.numRowsAffected() > 0;
    });
}

bool TaskHistoryRepository::removeEntry(qint64 entryId)
{
    return runWithRetry(m_connection.retryPolicy(), QStringLiteral("remove history entry"), [&] {
        QSqlQuery query = m_connection.prepare(QStringLiteral("DELETE FROM task_history WHERE id = :id"));
        query.bindValue(QStringLiteral(":id"), entryId);
        m_connection.exec(query, QStringLiteral("remove history entry"));
        return query.numRowsAffected() > 0;
    });
}

std::vector<TaskHistoryEntry> TaskHistoryRepository::fetchForTask(TaskId taskId) const
{
    return runWithRetry(m_connection.retryPolicy(), QStringLiteral("fetch task history"), [&] {
        QSqlQuery query = m_connection.prepare(
            kSelectColumns + QStringLiteral(" WHERE task_id = :task_id ORDER BY start_time DESC, id DESC"));
        query.bindValue(QStringLiteral(":task_id"), taskId);
        m_connection.exec(query, QStringLiteral("fetch task history"));
        return readAll(query);
    });
}

qint64 TaskHistoryRepository::totalTimeSpent(TaskId taskId) const
{
    return runWithRetry(m_connection.retryPolicy(), QStringLiteral("sum task time"), [&] {
        QSqlQuery query = m_connection.prepare(QStringLiteral(
            "SELECT COALESCE(SUM(duration_seconds), 0) FROM task_history WHERE task_id = :task_id "
            "AND end_time IS NOT NULL"));
        query.bindValue(QStringLiteral(":task_id"), taskId);
        m_connection.exec(query, QStringLiteral("sum task time"));
        return query.next() ? query.value(0).toLongLong() : qint64(0);
    });
}

int TaskHistoryRepository::completionCount(TaskId taskId) const
{
    return runWithRetry(m_connection.retryPolicy(), QStringLiteral("count completions"), [&] {
        QSqlQuery query = m_connection.prepare(QStringLiteral(
            "SELECT COUNT(*) FROM task_history WHERE task_id = :task_id AND end_time IS NOT NULL"));
        query.bindValue(QStringLiteral(":task_id"), taskId);
        m_connection.exec(query, QStringLiteral("count completions"));
        return query.next() ? query.value(0).toInt() : 0;
    });
}

std::optional<QDateTime> TaskHistoryRepository::lastCompletionTime(TaskId taskId) const
{
    return runWithRetry(m_connection.retryPolicy(), QStringLiteral("last completion"),
                        [&]() -> std::optional<QDateTime> {
                            QSqlQuery query = m_connection.prepare(QStringLiteral(
                                "SELECT MAX(end_time) FROM task_history WHERE task_id = :task_id"));
                            query.bindValue(QStringLiteral(":task_id"), taskId);
                            m_connection.exec(query, QStringLiteral("last completion"));
                            if (query.next() && !query.value(0).isNull()) {
                                return QDateTime::fromSecsSinceEpoch(query.value(0).toLongLong());
                            }
                            return std::nullopt;
                        });
}

std::vector<TaskHistoryEntry> TaskHistoryRepository::fetchPage(int limit, int offset) const
{
    return runWithRetry(m_connection.retryPolicy(), QStringLiteral("fetch history page"), [&] {
        QSqlQuery query = m_connection.prepare(kSelectColumns
                                               + QStringLiteral(" WHERE end_time IS NOT NULL ORDER BY end_time DESC, "
                                                                "id DESC LIMIT :limit OFFSET :offset"));
        query.bindValue(QStringLiteral(":limit"), qMax(limit, 0));
        query.bindValue(QStringLiteral(":offset"), qMax(offset, 0));
        m_connection.exec(query, QStringLiteral("fetch history page"));
        return readAll(query);
    });
}

int TaskHistoryRepository::totalCount() const
{
    return runWithRetry(m_connection.retryPolicy(), QStringLiteral("count history"), [&] {
        QSqlQuery query =
            m_connection.prepare(QStringLiteral("SELECT COUNT(*) FROM task_history WHERE end_time IS NOT NULL"));
        m_connection.exec(query, QStringLiteral("count history"));
        return query.next() ? query.value(0).toInt() : 0;
    });
}

QMap<QDate, std::vector<TaskHistoryEntry>> TaskHistoryRepository::groupByCompletionDate(const QDate &from,
                                                                                        const QDate &to) const
{
    const auto entries = runWithRetry(m_connection.retryPolicy(), QStringLiteral("history by date"), [&] {
        QSqlQuery query = m_connection.prepare(kSelectColumns
                                               + QStringLiteral(" WHERE completion_date BETWEEN :from AND :to "
                                                                "ORDER BY completion_date ASC, end_time ASC"));
        query.bindValue(QStringLiteral(":from"), from.toString(Qt::ISODate));
        query.bindValue(QStringLiteral(":to"), to.toString(Qt::ISODate));
        m_connection.exec(query, QStringLiteral("history by date"));
        return readAll(query);
    });

    QMap<QDate, std::vector<TaskHistoryEntry>> grouped;
    for (const auto &entry : entries) {
        grouped[entry.completionDate].push_back(entry);
    }
    qCDebug(lcStorage) << "Grouped" << entries.size() << "history entries into" << grouped.size() << "days";
    return grouped;
}

} // namespace data
} // namespace georemind
