#include "georemind/data/Database.hpp"

#include "georemind/core/Logging.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSqlError>
#include <QStringList>
#include <QUuid>

namespace georemind {
namespace data {

namespace {
const char *const kSchemaStatements[] = {
    R"(CREATE TABLE IF NOT EXISTS geofences (
        id TEXT PRIMARY KEY,
        latitude REAL NOT NULL,
        longitude REAL NOT NULL,
        radius_meters REAL NOT NULL,
        fill_color TEXT NOT NULL,
        fill_opacity REAL NOT NULL,
        stroke_color TEXT NOT NULL,
        stroke_width REAL NOT NULL,
        task TEXT,
        created_at INTEGER NOT NULL))",
    R"(CREATE TABLE IF NOT EXISTS tasks (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        name TEXT NOT NULL,
        priority INTEGER NOT NULL CHECK (priority BETWEEN 1 AND 5),
        scheduled_date TEXT,
        scheduled_time TEXT,
        is_recurring INTEGER NOT NULL DEFAULT 0,
        recurrence TEXT,
        geofence_id TEXT,
        is_completed INTEGER NOT NULL DEFAULT 0,
        notification_sound TEXT,
        enable_speech INTEGER,
        created_at INTEGER NOT NULL))",
    "CREATE INDEX IF NOT EXISTS idx_tasks_geofence ON tasks (geofence_id)",
    R"(CREATE TABLE IF NOT EXISTS task_history (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        task_id INTEGER,
        task_name TEXT NOT NULL,
        task_priority INTEGER NOT NULL,
        start_time INTEGER NOT NULL,
        end_time INTEGER,
        duration_seconds INTEGER NOT NULL DEFAULT 0,
        completion_date TEXT,
        geofence_id TEXT,
        created_at INTEGER NOT NULL))",
    "CREATE INDEX IF NOT EXISTS idx_task_history_task ON task_history (task_id)",
    // At most one open session per task.
    "CREATE UNIQUE INDEX IF NOT EXISTS idx_task_history_open ON task_history (task_id) WHERE end_time IS NULL",
    R"(CREATE TABLE IF NOT EXISTS notification_history (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        notification_id INTEGER NOT NULL,
        geofence_id TEXT NOT NULL,
        task_name TEXT,
        event_type TEXT NOT NULL,
        body TEXT NOT NULL,
        timestamp INTEGER NOT NULL,
        UNIQUE (notification_id, geofence_id)))",
};
} // namespace

Connection::Connection(QSqlDatabase database, QString connectionName, QString path, bool readOnly, RetryPolicy retry)
    : m_database(std::move(database))
    , m_connectionName(std::move(connectionName))
    , m_path(std::move(path))
    , m_readOnly(readOnly)
    , m_retry(std::move(retry))
{
}

Connection::~Connection()
{
    close();
}

bool Connection::isOpen() const
{
    return !m_connectionName.isEmpty() && m_database.isOpen();
}

QSqlQuery Connection::prepare(const QString &sql)
{
    if (!isOpen()) {
        throw StorageError(StorageErrorKind::Other, QStringLiteral("Connection to %1 is closed").arg(m_path));
    }
    QSqlQuery query(m_database);
    if (!query.prepare(sql)) {
        throw StorageError::fromSqlError(query.lastError(), QStringLiteral("prepare"));
    }
    return query;
}

void Connection::exec(QSqlQuery &query, const QString &context)
{
    if (!query.exec()) {
        throw StorageError::fromSqlError(query.lastError(), context);
    }
}

void Connection::execute(const QString &sql)
{
    QSqlQuery query = prepare(sql);
    exec(query, sql.section(' ', 0, 1));
}

void Connection::rollbackQuietly()
{
    if (!isOpen()) {
        return;
    }
    QSqlQuery query(m_database);
    if (!query.exec(QStringLiteral("ROLLBACK"))) {
        qCWarning(lcStorage) << "Rollback failed:" << query.lastError().text();
    }
}

void Connection::close()
{
    if (m_connectionName.isEmpty()) {
        return;
    }
    m_database.close();
    m_database = QSqlDatabase();
    QSqlDatabase::removeDatabase(m_connectionName);
    qCDebug(lcStorage) << "Closed connection" << m_connectionName;
    m_connectionName.clear();
}

Database::Database(DatabaseOptions options)
    : m_options(std::move(options))
{
}

std::unique_ptr<Connection> Database::openConnection(OpenMode mode) const
{
    const bool readOnly = mode == OpenMode::ReadOnly;
    if (!readOnly) {
        QDir dir = QFileInfo(m_options.path).dir();
        if (!dir.exists()) {
            dir.mkpath(QStringLiteral("."));
        }
    }

    const QString name = QStringLiteral("georemind-%1").arg(QUuid::createUuid().toString(QUuid::WithoutBraces));
    std::unique_ptr<Connection> connection;
    {
        QSqlDatabase database = QSqlDatabase::addDatabase(QStringLiteral("QSQLITE"), name);
        database.setDatabaseName(m_options.path);
        QStringList connectOptions{ QStringLiteral("QSQLITE_BUSY_TIMEOUT=%1").arg(m_options.busyTimeoutMs) };
        if (readOnly) {
            connectOptions << QStringLiteral("QSQLITE_OPEN_READONLY");
        }
        database.setConnectOptions(connectOptions.join(';'));
        if (!database.open()) {
            const QSqlError error = database.lastError();
            database = QSqlDatabase();
            QSqlDatabase::removeDatabase(name);
            throw StorageUnavailable(QStringLiteral("Cannot open %1: %2").arg(m_options.path, error.text()),
                                     classifySqlError(error));
        }
        connection.reset(new Connection(database, name, m_options.path, readOnly, m_options.retry));
    }

    if (readOnly) {
        qCDebug(lcStorage) << "Opened read-only connection to" << m_options.path;
        return connection;
    }

    try {
        runWithRetry(m_options.retry, QStringLiteral("schema setup"), [&] {
            connection->execute(QStringLiteral("PRAGMA journal_mode=WAL"));
            createSchema(*connection);
        });
    } catch (const StorageError &error) {
        throw StorageUnavailable(QStringLiteral("Cannot prepare %1: %2").arg(m_options.path, error.message()),
                                 error.kind());
    }
    qCDebug(lcStorage) << "Opened connection to" << m_options.path;
    return connection;
}

void Database::createSchema(Connection &connection) const
{
    QSqlQuery versionQuery = connection.prepare(QStringLiteral("PRAGMA user_version"));
    connection.exec(versionQuery, QStringLiteral("read schema version"));
    const int version = versionQuery.next() ? versionQuery.value(0).toInt() : 0;
    versionQuery.finish();
    if (version >= kSchemaVersion) {
        return;
    }

    connection.transaction([&] {
        for (const char *statement : kSchemaStatements) {
            connection.execute(QString::fromLatin1(statement));
        }
        connection.execute(QStringLiteral("PRAGMA user_version = %1").arg(kSchemaVersion));
    });
    qCInfo(lcStorage) << "Created schema version" << kSchemaVersion << "in" << m_options.path;
}

bool Database::checkIntegrity() const
{
    bool healthy = false;
    try {
        auto connection = openConnection(OpenMode::ReadWrite);
        QSqlQuery query = connection->prepare(QStringLiteral("PRAGMA integrity_check"));
        connection->exec(query, QStringLiteral("integrity check"));
        healthy = query.next() && query.value(0).toString() == QLatin1String("ok");
    } catch (const StorageError &error) {
        if (error.kind() != StorageErrorKind::Corrupt) {
            throw;
        }
        qCWarning(lcStorage) << "Integrity check could not read the database:" << error.message();
    }

    if (healthy) {
        return true;
    }
    repair();
    return false;
}

void Database::repair() const
{
    const QString backupPath = QStringLiteral("%1.corrupt-%2")
                                   .arg(m_options.path,
                                        QDateTime::currentDateTimeUtc().toString(QStringLiteral("yyyyMMddThhmmss")));
    if (QFile::copy(m_options.path, backupPath)) {
        qCWarning(lcStorage) << "Backed up corrupt database to" << backupPath;
    } else {
        qCWarning(lcStorage) << "Could not back up corrupt database" << m_options.path;
    }

    for (const QString &suffix : { QString(), QStringLiteral("-wal"), QStringLiteral("-shm") }) {
        const QString file = m_options.path + suffix;
        if (QFile::exists(file) && !QFile::remove(file)) {
            throw StorageUnavailable(QStringLiteral("Cannot delete corrupt database file %1").arg(file),
                                     StorageErrorKind::Corrupt);
        }
    }

    openConnection(OpenMode::ReadWrite);
    qCWarning(lcStorage) << "Recreated database" << m_options.path;
}

} // namespace data
} // namespace georemind
