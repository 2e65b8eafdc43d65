#pragma once

#include <QString>
#include <chrono>

#include "georemind/ipc/TriggerAnnouncement.hpp"

namespace georemind {
namespace ipc {

class MailboxDirectory;

// Foreground-owned mailbox receiving trigger announcements.
constexpr auto kEventMailboxName = "geofence-event-port";
// Foreground-owned mailbox told when new notification history was written.
constexpr auto kHistoryMailboxName = "notification-history-port";
// Foreground-owned mailbox for notification actions pressed elsewhere.
constexpr auto kActionMailboxName = "notification-action-port";

enum class HandshakeResult
{
    NoListener,   // no foreground mailbox registered
    Acknowledged, // foreground took over the user-visible handling
    TimedOut,     // announced, no answer within the window
    Failed,       // the channel itself failed; treated like no listener
};

QString handshakeResultName(HandshakeResult result);

// The ack mailbox is released on every path out of announce().
class EventChannel
{
public:
    EventChannel(MailboxDirectory &directory, std::chrono::milliseconds ackTimeout);

    // Uniform in [0, 2^31 - 1).
    static int generateNotificationId();
    static QString ackMailboxName(int notificationId);

    // Fills in the ack mailbox name. Never throws.
    HandshakeResult announce(TriggerAnnouncement announcement);

    // Best effort; false when no foreground listens.
    bool publishHistoryUpdate(int notificationId);

    // False when no foreground listens; the caller then handles the action itself.
    static bool sendAction(MailboxDirectory &directory, const NotificationActionMessage &action);

    // Sent by the foreground after taking over; status is "suppressed" or "prompted".
    static bool acknowledge(MailboxDirectory &directory, const QString &ackMailbox, const QString &status);

private:
    MailboxDirectory &m_directory;
    std::chrono::milliseconds m_ackTimeout;
};

} // namespace ipc
} // namespace georemind
