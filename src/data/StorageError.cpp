#include "georemind/data/StorageError.hpp"

#include <QSqlError>

namespace georemind {
namespace data {

namespace {
// Primary SQLite result codes as reported by the QSQLITE driver.
constexpr int kSqliteBusy = 5;
constexpr int kSqliteLocked = 6;
constexpr int kSqliteIoErr = 10;
constexpr int kSqliteCorrupt = 11;
constexpr int kSqliteCantOpen = 14;
constexpr int kSqliteConstraint = 19;
constexpr int kSqliteNotADb = 26;
} // namespace

StorageErrorKind classifySqlError(const QSqlError &error)
{
    bool ok = false;
    const int nativeCode = error.nativeErrorCode().toInt(&ok);
    if (ok) {
        switch (nativeCode & 0xff) {
        case kSqliteBusy:
        case kSqliteLocked:
        case kSqliteIoErr:
        case kSqliteCantOpen:
            return StorageErrorKind::Transient;
        case kSqliteCorrupt:
        case kSqliteNotADb:
            return StorageErrorKind::Corrupt;
        case kSqliteConstraint:
            return StorageErrorKind::Constraint;
        default:
            break;
        }
    }

    // Some driver paths only carry the message text.
    const QString text = error.text().toLower();
    if (text.contains(QLatin1String("database is locked")) || text.contains(QLatin1String("busy"))
        || text.contains(QLatin1String("disk i/o error")) || text.contains(QLatin1String("timeout"))) {
        return StorageErrorKind::Transient;
    }
    if (text.contains(QLatin1String("malformed")) || text.contains(QLatin1String("not a database"))) {
        return StorageErrorKind::Corrupt;
    }
    if (text.contains(QLatin1String("constraint"))) {
        return StorageErrorKind::Constraint;
    }
    return StorageErrorKind::Other;
}

StorageError StorageError::fromSqlError(const QSqlError &error, const QString &context)
{
    return StorageError(classifySqlError(error),
                        QStringLiteral("%1: %2 (code %3)").arg(context, error.text(), error.nativeErrorCode()));
}

} // namespace data
} // namespace georemind
