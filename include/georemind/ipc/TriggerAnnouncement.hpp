#pragma once

#include <QDateTime>
#include <QJsonObject>
#include <QStringList>
#include <optional>

#include "georemind/data/Geofence.hpp"

namespace georemind {
namespace ipc {

// What the background context tells the foreground about a geofence event.
struct TriggerAnnouncement
{
    QString event; // "enter" or "exit"
    QStringList geofenceIds;
    std::optional<data::GeoPoint> location;
    int notificationId = 0;
    QString ackMailbox;
    QDateTime timestamp;

    QJsonObject toJson() const;
    // Empty for messages of another type or without geofence ids.
    static std::optional<TriggerAnnouncement> fromJson(const QJsonObject &object);
};

// A notification button pressed outside the foreground process (Do Now / Do Later).
struct NotificationActionMessage
{
    QString actionId;
    qint64 taskId = 0;

    QJsonObject toJson() const;
    static std::optional<NotificationActionMessage> fromJson(const QJsonObject &object);
};

} // namespace ipc
} // namespace georemind
