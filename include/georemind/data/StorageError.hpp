#pragma once

#include "georemind/core/Errors.hpp"

class QSqlError;

namespace georemind {
namespace data {

enum class StorageErrorKind
{
    Transient,  // busy, locked, I/O: worth retrying
    Constraint, // the statement can never succeed as written
    Corrupt,    // needs the integrity repair, never retried
    Other,
};

class StorageError : public core::Error
{
public:
    StorageError(StorageErrorKind kind, const QString &message)
        : core::Error(message)
        , m_kind(kind)
    {
    }

    StorageErrorKind kind() const { return m_kind; }
    bool isTransient() const { return m_kind == StorageErrorKind::Transient; }

    static StorageError fromSqlError(const QSqlError &error, const QString &context);

private:
    StorageErrorKind m_kind;
};

// Retries exhausted, or no connection could be opened at all.
class StorageUnavailable : public StorageError
{
public:
    explicit StorageUnavailable(const QString &message, StorageErrorKind cause = StorageErrorKind::Transient)
        : StorageError(cause, message)
    {
    }
};

StorageErrorKind classifySqlError(const QSqlError &error);

} // namespace data
} // namespace georemind
