#include "georemind/ipc/TriggerAnnouncement.hpp"

#include <QJsonArray>

namespace georemind {
namespace ipc {

namespace {
const QString kMessageType = QStringLiteral("geofence-event");
const QString kActionMessageType = QStringLiteral("notification-action");
} // namespace

QJsonObject TriggerAnnouncement::toJson() const
{
    QJsonObject object;
    object.insert(QStringLiteral("type"), kMessageType);
    object.insert(QStringLiteral("event"), event);
    object.insert(QStringLiteral("geofenceIds"), QJsonArray::fromStringList(geofenceIds));
    if (location) {
        QJsonObject point;
        point.insert(QStringLiteral("latitude"), location->latitude);
        point.insert(QStringLiteral("longitude"), location->longitude);
        object.insert(QStringLiteral("location"), point);
    }
    object.insert(QStringLiteral("notificationId"), notificationId);
    object.insert(QStringLiteral("ackPortName"), ackMailbox);
    object.insert(QStringLiteral("timestamp"), timestamp.toMSecsSinceEpoch());
    return object;
}

std::optional<TriggerAnnouncement> TriggerAnnouncement::fromJson(const QJsonObject &object)
{
    if (object.value(QStringLiteral("type")).toString() != kMessageType) {
        return std::nullopt;
    }
    TriggerAnnouncement announcement;
    announcement.event = object.value(QStringLiteral("event")).toString();
    for (const QJsonValue &id : object.value(QStringLiteral("geofenceIds")).toArray()) {
        if (id.isString() && !id.toString().isEmpty()) {
            announcement.geofenceIds << id.toString();
        }
    }
    if (announcement.geofenceIds.isEmpty()) {
        return std::nullopt;
    }
    const QJsonValue location = object.value(QStringLiteral("location"));
    if (location.isObject()) {
        data::GeoPoint point;
        point.latitude = location.toObject().value(QStringLiteral("latitude")).toDouble();
        point.longitude = location.toObject().value(QStringLiteral("longitude")).toDouble();
        announcement.location = point;
    }
    announcement.notificationId = object.value(QStringLiteral("notificationId")).toInt();
    announcement.ackMailbox = object.value(QStringLiteral("ackPortName")).toString();
    announcement.timestamp =
        QDateTime::fromMSecsSinceEpoch(static_cast<qint64>(object.value(QStringLiteral("timestamp")).toDouble()));
    return announcement;
}

QJsonObject NotificationActionMessage::toJson() const
{
    QJsonObject object;
    object.insert(QStringLiteral("type"), kActionMessageType);
    object.insert(QStringLiteral("actionId"), actionId);
    object.insert(QStringLiteral("taskId"), taskId);
    return object;
}

std::optional<NotificationActionMessage> NotificationActionMessage::fromJson(const QJsonObject &object)
{
    if (object.value(QStringLiteral("type")).toString() != kActionMessageType) {
        return std::nullopt;
    }
    const QJsonValue taskId = object.value(QStringLiteral("taskId"));
    NotificationActionMessage message;
    message.actionId = object.value(QStringLiteral("actionId")).toString();
    if (message.actionId.isEmpty() || !taskId.isDouble()) {
        return std::nullopt;
    }
    message.taskId = static_cast<qint64>(taskId.toDouble());
    return message;
}

} // namespace ipc
} // namespace georemind
