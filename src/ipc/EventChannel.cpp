#include "georemind/ipc/EventChannel.hpp"

#include "georemind/core/Logging.hpp"
#include "georemind/ipc/Mailbox.hpp"

#include <QRandomGenerator>

namespace georemind {
namespace ipc {

namespace {
constexpr int kNotificationIdBound = 2147483647;
} // namespace

QString handshakeResultName(HandshakeResult result)
{
    switch (result) {
    case HandshakeResult::NoListener:
        return QStringLiteral("no-listener");
    case HandshakeResult::Acknowledged:
        return QStringLiteral("acknowledged");
    case HandshakeResult::TimedOut:
        return QStringLiteral("timed-out");
    case HandshakeResult::Failed:
        return QStringLiteral("failed");
    }
    return QString();
}

EventChannel::EventChannel(MailboxDirectory &directory, std::chrono::milliseconds ackTimeout)
    : m_directory(directory)
    , m_ackTimeout(ackTimeout)
{
}

int EventChannel::generateNotificationId()
{
    return static_cast<int>(QRandomGenerator::global()->bounded(kNotificationIdBound));
}

QString EventChannel::ackMailboxName(int notificationId)
{
    return QStringLiteral("geofence-ack-%1").arg(notificationId);
}

HandshakeResult EventChannel::announce(TriggerAnnouncement announcement)
{
    const auto foreground = m_directory.lookup(QString::fromLatin1(kEventMailboxName));
    if (!foreground) {
        qCInfo(lcChannel) << "No foreground listener for notification" << announcement.notificationId;
        return HandshakeResult::NoListener;
    }

    announcement.ackMailbox = ackMailboxName(announcement.notificationId);
    try {
        MailboxRegistration ack(m_directory, announcement.ackMailbox);
        if (!foreground->send(announcement.toJson())) {
            qCWarning(lcChannel) << "Could not send announcement" << announcement.notificationId;
            return HandshakeResult::Failed;
        }
        const auto reply = ack.receiver().waitForMessage(m_ackTimeout);
        if (!reply) {
            qCInfo(lcChannel) << "No acknowledgment for notification" << announcement.notificationId << "within"
                              << m_ackTimeout.count() << "ms";
            return HandshakeResult::TimedOut;
        }
        qCInfo(lcChannel) << "Foreground acknowledged notification" << announcement.notificationId << "as"
                          << reply->value(QStringLiteral("status")).toString();
        return HandshakeResult::Acknowledged;
    } catch (const MailboxError &error) {
        qCWarning(lcChannel) << "Handshake for notification" << announcement.notificationId
                             << "failed:" << error.message();
        return HandshakeResult::Failed;
    }
}

bool EventChannel::publishHistoryUpdate(int notificationId)
{
    const auto foreground = m_directory.lookup(QString::fromLatin1(kHistoryMailboxName));
    if (!foreground) {
        return false;
    }
    QJsonObject message;
    message.insert(QStringLiteral("type"), QStringLiteral("history-updated"));
    message.insert(QStringLiteral("notificationId"), notificationId);
    return foreground->send(message);
}

bool EventChannel::sendAction(MailboxDirectory &directory, const NotificationActionMessage &action)
{
    const auto foreground = directory.lookup(QString::fromLatin1(kActionMailboxName));
    if (!foreground) {
        return false;
    }
    return foreground->send(action.toJson());
}

bool EventChannel::acknowledge(MailboxDirectory &directory, const QString &ackMailbox, const QString &status)
{
    if (ackMailbox.isEmpty()) {
        return false;
    }
    const auto background = directory.lookup(ackMailbox);
    if (!background) {
        qCInfo(lcChannel) << "Ack mailbox" << ackMailbox << "is gone, background already moved on";
        return false;
    }
    QJsonObject message;
    message.insert(QStringLiteral("type"), QStringLiteral("ack"));
    message.insert(QStringLiteral("status"), status);
    return background->send(message);
}

} // namespace ipc
} // namespace georemind
