#pragma once

#include <QSqlDatabase>
#include <QSqlQuery>
#include <QString>
#include <memory>
#include <type_traits>

#include "georemind/data/RetryPolicy.hpp"

namespace georemind {
namespace data {

enum class OpenMode
{
    ReadOnly,
    ReadWrite,
};

struct DatabaseOptions
{
    QString path;
    int busyTimeoutMs = 5000;
    RetryPolicy retry;
};

// Stays on the thread that opened it.
class Connection
{
public:
    ~Connection();

    Connection(const Connection &) = delete;
    Connection &operator=(const Connection &) = delete;

    bool isOpen() const;
    bool isReadOnly() const { return m_readOnly; }
    const QString &path() const { return m_path; }
    const RetryPolicy &retryPolicy() const { return m_retry; }

    QSqlQuery prepare(const QString &sql);
    void exec(QSqlQuery &query, const QString &context);
    void execute(const QString &sql);

    // Runs body between BEGIN IMMEDIATE and COMMIT; any exception rolls back and propagates.
    template<typename Body>
    auto transaction(Body &&body) -> decltype(body());

    void close();

private:
    friend class Database;
    Connection(QSqlDatabase database, QString connectionName, QString path, bool readOnly, RetryPolicy retry);

    void rollbackQuietly();

    QSqlDatabase m_database;
    QString m_connectionName;
    QString m_path;
    bool m_readOnly = false;
    RetryPolicy m_retry;
};

class Database
{
public:
    static constexpr int kSchemaVersion = 1;

    explicit Database(DatabaseOptions options);

    const DatabaseOptions &options() const { return m_options; }

    // Throws StorageUnavailable when the file cannot be opened or its schema prepared.
    std::unique_ptr<Connection> openConnection(OpenMode mode = OpenMode::ReadWrite) const;

    // A corrupt file is moved aside and recreated empty, returning false.
    bool checkIntegrity() const;

private:
    void createSchema(Connection &connection) const;
    void repair() const;

    DatabaseOptions m_options;
};

template<typename Body>
auto Connection::transaction(Body &&body) -> decltype(body())
{
    execute(QStringLiteral("BEGIN IMMEDIATE"));
    try {
        if constexpr (std::is_void_v<decltype(body())>) {
            body();
            execute(QStringLiteral("COMMIT"));
        } else {
            auto result = body();
            execute(QStringLiteral("COMMIT"));
            return result;
        }
    } catch (...) {
        rollbackQuietly();
        throw;
    }
}

} // namespace data
} // namespace georemind
