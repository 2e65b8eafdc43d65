#include "georemind/data/NotificationHistoryRepository.hpp"

#include "georemind/core/Logging.hpp"
#include "georemind/data/Database.hpp"

#include <QSqlQuery>
#include <QVariant>

namespace georemind {
namespace data {

NotificationHistoryRepository::NotificationHistoryRepository(Connection &connection)
    : m_connection(connection)
{
}

bool NotificationHistoryRepository::insert(NotificationRecord record)
{
    if (!record.timestamp.isValid()) {
        record.timestamp = QDateTime::currentDateTime();
    }
    const bool inserted = runWithRetry(m_connection.retryPolicy(), QStringLiteral("insert notification history"), [&] {
        QSqlQuery query = m_connection.prepare(QStringLiteral(
            "INSERT OR IGNORE INTO notification_history (notification_id, geofence_id, task_name, event_type, body, "
            "timestamp) VALUES (:notification_id, :geofence_id, :task_name, :event_type, :body, :timestamp)"));
        query.bindValue(QStringLiteral(":notification_id"), record.notificationId);
        query.bindValue(QStringLiteral(":geofence_id"), record.geofenceId);
        query.bindValue(QStringLiteral(":task_name"),
                        record.taskName.isEmpty() ? QVariant(QVariant::String) : QVariant(record.taskName));
        query.bindValue(QStringLiteral(":event_type"), record.eventType);
        query.bindValue(QStringLiteral(":body"), record.body);
        query.bindValue(QStringLiteral(":timestamp"), record.timestamp.toMSecsSinceEpoch());
        m_connection.exec(query, QStringLiteral("insert notification history"));
        return query.numRowsAffected() > 0;
    });
    if (!inserted) {
        qCDebug(lcStorage) << "Notification" << record.notificationId << "for" << record.geofenceId
                           << "already recorded";
    }
    return inserted;
}

std::vector<NotificationRecord> NotificationHistoryRepository::fetchAll() const
{
    return runWithRetry(m_connection.retryPolicy(), QStringLiteral("fetch notification history"), [&] {
        QSqlQuery query = m_connection.prepare(QStringLiteral(
            "SELECT id, notification_id, geofence_id, task_name, event_type, body, timestamp "
            "FROM notification_history ORDER BY timestamp DESC, id DESC"));
        m_connection.exec(query, QStringLiteral("fetch notification history"));
        std::vector<NotificationRecord> records;
        while (query.next()) {
            NotificationRecord record;
            record.id = query.value(0).toLongLong();
            record.notificationId = query.value(1).toInt();
            record.geofenceId = query.value(2).toString();
            record.taskName = query.value(3).toString();
            record.eventType = query.value(4).toString();
            record.body = query.value(5).toString();
            record.timestamp = QDateTime::fromMSecsSinceEpoch(query.value(6).toLongLong());
            records.push_back(record);
        }
        return records;
    });
}

int NotificationHistoryRepository::clearAll()
{
    const int removed = runWithRetry(m_connection.retryPolicy(), QStringLiteral("clear notification history"), [&] {
        QSqlQuery query = m_connection.prepare(QStringLiteral("DELETE FROM notification_history"));
        m_connection.exec(query, QStringLiteral("clear notification history"));
        return query.numRowsAffected();
    });
    qCInfo(lcStorage) << "Cleared" << removed << "notification history records";
    return removed;
}

} // namespace data
} // namespace georemind
