#pragma once

#include <QDateTime>
#include <QString>
#include <optional>

namespace georemind {
namespace data {

struct NotificationRecord
{
    std::optional<qint64> id;
    int notificationId = 0;
    QString geofenceId;
    QString taskName; // snapshot, may be empty
    QString eventType;
    QString body;
    QDateTime timestamp;
};

} // namespace data
} // namespace georemind
