#pragma once

#include <QJsonObject>
#include <QObject>
#include <chrono>
#include <memory>
#include <optional>
#include <vector>

#include "georemind/core/ActiveTaskState.hpp"
#include "georemind/core/Clock.hpp"
#include "georemind/core/PriorityModel.hpp"
#include "georemind/data/TaskHistoryEntry.hpp"
#include "georemind/ipc/TriggerAnnouncement.hpp"

namespace georemind {
namespace data {
class Connection;
}
namespace ipc {
class MailboxDirectory;
class MailboxReceiver;
}

namespace services {

class NotificationDisplay;
class SpeechEngine;

enum class SessionEnd
{
    Completed,
    Abandoned,
};

struct ArbiterOptions
{
    std::chrono::minutes snooze{ 5 };
    bool speechByDefault = true;
    QString defaultSound; // for tasks without their own sound; empty is the platform default
    core::Clock clock = core::systemClock();
};

// Foreground owner of the active task. Switching only happens on an explicit Do Now.
class ActiveTaskArbiter : public QObject
{
    Q_OBJECT
public:
    ActiveTaskArbiter(data::Connection &connection, core::ActiveTaskState &state, ipc::MailboxDirectory &directory,
                      NotificationDisplay &display, SpeechEngine &speech, ArbiterOptions options = ArbiterOptions(),
                      QObject *parent = nullptr);
    ~ActiveTaskArbiter() override;

    // Registers the event, history and action mailboxes. Throws ipc::MailboxError when another foreground owns them.
    void listen();
    void stopListening();
    bool isListening() const;

    // A stale marker is cleared first, a live one throws core::ConflictError.
    data::TaskHistoryEntry startSession(data::TaskId taskId);
    // Throws core::NotFoundError when the task has no open session; a marker naming it is cleared anyway.
    data::TaskHistoryEntry endSession(data::TaskId taskId, const QDateTime &endedAt,
                                      SessionEnd how = SessionEnd::Completed);
    std::optional<core::ActiveTaskMarker> activeSession() const;

    // Paused time is left out of the session duration. The task stays the active one meanwhile.
    void pauseSession(data::TaskId taskId);
    void resumeSession(data::TaskId taskId);

    // Empty when the announcement was not handled (exit event, nothing to surface).
    std::optional<core::ArrivalDecision> handleAnnouncement(const ipc::TriggerAnnouncement &announcement);
    // Do Now checks the target task before it ends the current session.
    void handleNotificationAction(const QString &actionId, data::TaskId taskId);

    std::vector<data::TaskId> pendingTaskIds();

signals:
    void taskArrived(qint64 taskId, int notificationId);
    void taskQueued(qint64 taskId);
    void preemptionRequested(qint64 taskId, qint64 activeTaskId);
    void sessionStarted(qint64 taskId);
    void sessionEnded(qint64 taskId, bool completed);
    void notificationHistoryChanged(int notificationId);

private slots:
    void onEventMessage(const QJsonObject &message);
    void onHistoryMessage(const QJsonObject &message);
    void onActionMessage(const QJsonObject &message);

private:
    core::ActiveTaskMarker requireActive(data::TaskId taskId) const;
    bool isLive(const core::ActiveTaskMarker &marker) const;
    QDateTime snoozeUntil() const;
    void speakQueued(const QString &text);
    void showArrival(int notificationId, const std::vector<data::Task> &tasks, const QDateTime &now);
    void showSwitchPrompt(int notificationId, const data::Task &incoming, const data::Task &active);
    void cancelNotification(int notificationId);

    data::Connection &m_connection;
    core::ActiveTaskState &m_state;
    ipc::MailboxDirectory &m_directory;
    NotificationDisplay &m_display;
    SpeechEngine &m_speech;
    ArbiterOptions m_options;
    std::unique_ptr<ipc::MailboxReceiver> m_eventMailbox;
    std::unique_ptr<ipc::MailboxReceiver> m_historyMailbox;
    std::unique_ptr<ipc::MailboxReceiver> m_actionMailbox;
};

} // namespace services
} // namespace georemind
