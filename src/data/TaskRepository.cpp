#include "georemind/data/TaskRepository.hpp"

#include "georemind/core/Errors.hpp"
#include "georemind/core/Logging.hpp"
#include "georemind/data/Database.hpp"

#include <QSqlQuery>
#include <QVariant>

namespace georemind {
namespace data {

namespace {
constexpr auto DATE_FORMAT = "yyyy-MM-dd";
constexpr auto TIME_FORMAT = "HH:mm:ss";

const QString kSelectColumns = QStringLiteral(
    "SELECT id, name, priority, scheduled_date, scheduled_time, is_recurring, recurrence, geofence_id, "
    "is_completed, notification_sound, enable_speech, created_at FROM tasks");

QVariant nullableText(const QString &value)
{
    return value.isEmpty() ? QVariant(QVariant::String) : QVariant(value);
}

Task readTask(const QSqlQuery &query)
{
    Task task;
    task.id = query.value(0).toLongLong();
    task.name = query.value(1).toString();
    task.priority = query.value(2).toInt();
    task.scheduledDate = QDate::fromString(query.value(3).toString(), QLatin1String(DATE_FORMAT));
    task.scheduledTime = QTime::fromString(query.value(4).toString(), QLatin1String(TIME_FORMAT));
    task.isRecurring = query.value(5).toBool();
    if (!query.value(6).isNull()) {
        task.recurrence = RecurrencePattern::fromJson(query.value(6).toString());
    }
    task.geofenceId = query.value(7).toString();
    task.isCompleted = query.value(8).toBool();
    task.notificationSound = query.value(9).toString();
    if (!query.value(10).isNull()) {
        task.enableSpeech = query.value(10).toBool();
    }
    task.createdAt = QDateTime::fromSecsSinceEpoch(query.value(11).toLongLong());
    return task;
}

void bindTaskValues(QSqlQuery &query, const Task &task)
{
    query.bindValue(QStringLiteral(":name"), task.name.trimmed());
    query.bindValue(QStringLiteral(":priority"), task.priority);
    query.bindValue(QStringLiteral(":scheduled_date"),
                    task.scheduledDate.isValid() ? QVariant(task.scheduledDate.toString(QLatin1String(DATE_FORMAT)))
                                                 : QVariant(QVariant::String));
    query.bindValue(QStringLiteral(":scheduled_time"),
                    task.scheduledTime.isValid() ? QVariant(task.scheduledTime.toString(QLatin1String(TIME_FORMAT)))
                                                 : QVariant(QVariant::String));
    query.bindValue(QStringLiteral(":is_recurring"), task.isRecurring ? 1 : 0);
    query.bindValue(QStringLiteral(":recurrence"),
                    task.recurrence.type() == RecurrenceType::None ? QVariant(QVariant::String)
                                                                   : QVariant(task.recurrence.toJson()));
    query.bindValue(QStringLiteral(":geofence_id"), nullableText(task.geofenceId));
    query.bindValue(QStringLiteral(":is_completed"), task.isCompleted ? 1 : 0);
    query.bindValue(QStringLiteral(":notification_sound"), nullableText(task.notificationSound));
    query.bindValue(QStringLiteral(":enable_speech"),
                    task.enableSpeech ? QVariant(*task.enableSpeech ? 1 : 0) : QVariant(QVariant::Int));
}
} // namespace

TaskRepository::TaskRepository(Connection &connection)
    : m_connection(connection)
{
}

std::vector<Task> TaskRepository::fetchTasks() const
{
    return runWithRetry(m_connection.retryPolicy(), QStringLiteral("fetch tasks"), [&] {
        QSqlQuery query = m_connection.prepare(kSelectColumns + QStringLiteral(" ORDER BY priority DESC, id ASC"));
        m_connection.exec(query, QStringLiteral("fetch tasks"));
        std::vector<Task> tasks;
        while (query.next()) {
            tasks.push_back(readTask(query));
        }
        return tasks;
    });
}

std::optional<Task> TaskRepository::findById(TaskId id) const
{
    return runWithRetry(m_connection.retryPolicy(), QStringLiteral("find task"), [&]() -> std::optional<Task> {
        QSqlQuery query = m_connection.prepare(kSelectColumns + QStringLiteral(" WHERE id = :id"));
        query.bindValue(QStringLiteral(":id"), id);
        m_connection.exec(query, QStringLiteral("find task"));
        if (query.next()) {
            return readTask(query);
        }
        return std::nullopt;
    });
}

std::vector<Task> TaskRepository::fetchOpenTasksForGeofences(const QStringList &geofenceIds) const
{
    std::vector<Task> tasks;
    if (geofenceIds.isEmpty()) {
        return tasks;
    }
    QStringList placeholders;
    for (int i = 0; i < geofenceIds.size(); ++i) {
        placeholders << QStringLiteral(":g%1").arg(i);
    }
    const QString sql = kSelectColumns
        + QStringLiteral(" WHERE is_completed = 0 AND geofence_id IN (%1) ORDER BY id ASC").arg(placeholders.join(','));

    return runWithRetry(m_connection.retryPolicy(), QStringLiteral("fetch geofence tasks"), [&] {
        QSqlQuery query = m_connection.prepare(sql);
        for (int i = 0; i < geofenceIds.size(); ++i) {
            query.bindValue(placeholders.at(i), geofenceIds.at(i));
        }
        m_connection.exec(query, QStringLiteral("fetch geofence tasks"));
        std::vector<Task> result;
        while (query.next()) {
            result.push_back(readTask(query));
        }
        return result;
    });
}

std::vector<Task> TaskRepository::fetchOpenTasksByName(const QString &name) const
{
    return runWithRetry(m_connection.retryPolicy(), QStringLiteral("fetch tasks by name"), [&] {
        QSqlQuery query = m_connection.prepare(kSelectColumns
                                               + QStringLiteral(" WHERE is_completed = 0 AND name = :name ORDER BY id ASC"));
        query.bindValue(QStringLiteral(":name"), name.trimmed());
        m_connection.exec(query, QStringLiteral("fetch tasks by name"));
        std::vector<Task> result;
        while (query.next()) {
            result.push_back(readTask(query));
        }
        return result;
    });
}

bool TaskRepository::hasTasksForGeofence(const QString &geofenceId) const
{
    return runWithRetry(m_connection.retryPolicy(), QStringLiteral("check geofence tasks"), [&] {
        QSqlQuery query =
            m_connection.prepare(QStringLiteral("SELECT EXISTS (SELECT 1 FROM tasks WHERE geofence_id = :geofence_id)"));
        query.bindValue(QStringLiteral(":geofence_id"), geofenceId);
        m_connection.exec(query, QStringLiteral("check geofence tasks"));
        return query.next() && query.value(0).toBool();
    });
}

Task TaskRepository::addTask(Task task)
{
    validateTask(task);
    task.id.reset();
    task.createdAt = QDateTime::fromSecsSinceEpoch(QDateTime::currentSecsSinceEpoch());

    return runWithRetry(m_connection.retryPolicy(), QStringLiteral("add task"), [&] {
        return m_connection.transaction([&] {
            if (task.hasGeofence()) {
                QSqlQuery geofence = m_connection.prepare(QStringLiteral("SELECT task FROM geofences WHERE id = :id"));
                geofence.bindValue(QStringLiteral(":id"), task.geofenceId);
                m_connection.exec(geofence, QStringLiteral("look up geofence"));
                if (!geofence.next()) {
                    throw core::NotFoundError(QStringLiteral("Geofence %1 does not exist").arg(task.geofenceId));
                }
                const bool hasLegacyName = !geofence.value(0).toString().isEmpty();
                geofence.finish();
                if (!hasLegacyName) {
                    QSqlQuery bind = m_connection.prepare(QStringLiteral("UPDATE geofences SET task = :task WHERE id = :id"));
                    bind.bindValue(QStringLiteral(":task"), task.name.trimmed());
                    bind.bindValue(QStringLiteral(":id"), task.geofenceId);
                    m_connection.exec(bind, QStringLiteral("bind geofence task"));
                }
            }

            QSqlQuery insert = m_connection.prepare(QStringLiteral(
                "INSERT INTO tasks (name, priority, scheduled_date, scheduled_time, is_recurring, recurrence, "
                "geofence_id, is_completed, notification_sound, enable_speech, created_at) VALUES (:name, :priority, "
                ":scheduled_date, :scheduled_time, :is_recurring, :recurrence, :geofence_id, :is_completed, "
                ":notification_sound, :enable_speech, :created_at)"));
            bindTaskValues(insert, task);
            insert.bindValue(QStringLiteral(":created_at"), task.createdAt.toSecsSinceEpoch());
            m_connection.exec(insert, QStringLiteral("insert task"));

            Task stored = task;
            stored.name = task.name.trimmed();
            stored.id = insert.lastInsertId().toLongLong();
            qCDebug(lcStorage) << "Stored task" << *stored.id << stored.name;
            return stored;
        });
    });
}

bool TaskRepository::updateTask(const Task &task)
{
    if (!task.id) {
        return false;
    }
    validateTask(task);
    return runWithRetry(m_connection.retryPolicy(), QStringLiteral("update task"), [&] {
        QSqlQuery query = m_connection.prepare(QStringLiteral(
            "UPDATE tasks SET name = :name, priority = :priority, scheduled_date = :scheduled_date, "
            "scheduled_time = :scheduled_time, is_recurring = :is_recurring, recurrence = :recurrence, "
            "geofence_id = :geofence_id, is_completed = :is_completed, notification_sound = :notification_sound, "
            "enable_speech = :enable_speech WHERE id = :id"));
        bindTaskValues(query, task);
        query.bindValue(QStringLiteral(":id"), *task.id);
        m_connection.exec(query, QStringLiteral("update task"));
        return query.numRowsAffected() > 0;
    });
}

bool TaskRepository::setCompleted(TaskId id, bool completed)
{
    return runWithRetry(m_connection.retryPolicy(), QStringLiteral("complete task"), [&] {
        QSqlQuery query = m_connection.prepare(QStringLiteral("UPDATE tasks SET is_completed = :done WHERE id = :id"));
        query.bindValue(QStringLiteral(":done"), completed ? 1 : 0);
        query.bindValue(QStringLiteral(":id"), id);
        m_connection.exec(query, QStringLiteral("complete task"));
        return query.numRowsAffected() > 0;
    });
}

bool TaskRepository::removeTask(TaskId id)
{
    return runWithRetry(m_connection.retryPolicy(), QStringLiteral("remove task"), [&] {
        QSqlQuery query = m_connection.prepare(QStringLiteral("DELETE FROM tasks WHERE id = :id"));
        query.bindValue(QStringLiteral(":id"), id);
        m_connection.exec(query, QStringLiteral("remove task"));
        return query.numRowsAffected() > 0;
    });
}

} // namespace data
} // namespace georemind
