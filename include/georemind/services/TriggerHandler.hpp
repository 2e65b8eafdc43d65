#pragma once

#include <QStringList>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include "georemind/core/Clock.hpp"
#include "georemind/data/Task.hpp"
#include "georemind/ipc/EventChannel.hpp"
#include "georemind/services/CandidateResolver.hpp"
#include "georemind/services/GeofenceEvent.hpp"

namespace georemind {
namespace core {
class ActiveTaskState;
}
namespace data {
class Connection;
class Database;
}
namespace ipc {
class MailboxDirectory;
}

namespace services {

class NotificationDisplay;
class SpeechEngine;

struct TriggerOptions
{
    std::chrono::milliseconds ackTimeout{ 1000 };
    bool speechByDefault = true; // for tasks that do not set enableSpeech
    std::chrono::milliseconds maxSpeechWait{ 10000 };
    std::chrono::milliseconds speechPollInterval{ 500 };
    std::chrono::minutes snooze{ 5 };
    QString defaultSound; // for tasks without their own sound; empty is the platform default
    std::function<void(std::chrono::milliseconds)> sleep; // empty uses QThread::msleep
    core::Clock clock = core::systemClock();
};

// What one invocation did, for logging and tests.
struct TriggerOutcome
{
    bool processed = false;
    int notificationId = 0;
    ipc::HandshakeResult handshake = ipc::HandshakeResult::NoListener;
    bool ackReceived = false;
    bool preemptivelySuppressed = false;
    bool alertShown = false;
    std::vector<data::TaskId> candidateIds;
    std::vector<data::TaskId> queuedTaskIds;
    std::vector<data::TaskId> snoozedTaskIds; // skipped, still inside their Do Later window
    QStringList spokenTexts;
    int historyRecordsSaved = 0;
    int historyReconnects = 0;
};

// Background reaction to one geofence event. Only data::StorageUnavailable escapes handle().
class TriggerHandler
{
public:
    TriggerHandler(const data::Database &database, core::ActiveTaskState &state, ipc::MailboxDirectory &directory,
                   NotificationDisplay &display, SpeechEngine &speech, TriggerOptions options = TriggerOptions());

    TriggerOutcome handle(const GeofenceEvent &event);

private:
    std::vector<Candidate> findCandidates(data::Connection &connection, const QStringList &geofenceIds,
                                          const QDateTime &now, bool &failed);
    std::vector<data::TaskId> pendingTaskIds(const QDateTime &now);
    std::optional<double> activePriority(data::Connection &connection, const QDateTime &now);
    void queueCandidates(const std::vector<Candidate> &candidates, const QDateTime &now, TriggerOutcome &outcome);
    void showAlert(const std::vector<Candidate> &candidates, const GeofenceEvent &event, const QDateTime &now,
                   TriggerOutcome &outcome);
    void speakCandidates(const std::vector<Candidate> &candidates, bool queued, TriggerOutcome &outcome);
    void waitForSpeech();
    void saveHistory(std::unique_ptr<data::Connection> &connection, const std::vector<Candidate> &candidates,
                     const GeofenceEvent &event, TriggerOutcome &outcome);
    void pause(std::chrono::milliseconds delay) const;

    const data::Database &m_database;
    core::ActiveTaskState &m_state;
    ipc::MailboxDirectory &m_directory;
    NotificationDisplay &m_display;
    SpeechEngine &m_speech;
    TriggerOptions m_options;
};

QString queuedSpeechText(const QString &taskName);

} // namespace services
} // namespace georemind
