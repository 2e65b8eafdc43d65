#include "georemind/services/TriggerHandler.hpp"

#include "georemind/core/ActiveTaskState.hpp"
#include "georemind/core/Logging.hpp"
#include "georemind/core/PriorityModel.hpp"
#include "georemind/data/Database.hpp"
#include "georemind/data/GeofenceRepository.hpp"
#include "georemind/data/NotificationHistoryRepository.hpp"
#include "georemind/data/TaskHistoryRepository.hpp"
#include "georemind/data/TaskRepository.hpp"
#include "georemind/services/NotificationDisplay.hpp"
#include "georemind/services/SpeechEngine.hpp"

#include <QThread>
#include <algorithm>

namespace georemind {
namespace services {

namespace {
QString genericBody(const GeofenceEvent &event)
{
    return QStringLiteral("Event: %1 for geofences: %2")
        .arg(transitionName(event.transition), event.geofenceIds.join(QStringLiteral(", ")));
}

QStringList namesFor(const std::vector<Candidate> &candidates, const QString &geofenceId)
{
    QStringList names;
    for (const auto &candidate : candidates) {
        if (candidate.geofenceId == geofenceId && !candidate.task.name.isEmpty()) {
            names << candidate.task.name;
        }
    }
    return names;
}
} // namespace

QString queuedSpeechText(const QString &taskName)
{
    return QStringLiteral("%1 added to pending queue.").arg(taskName);
}

TriggerHandler::TriggerHandler(const data::Database &database, core::ActiveTaskState &state,
                               ipc::MailboxDirectory &directory, NotificationDisplay &display, SpeechEngine &speech,
                               TriggerOptions options)
    : m_database(database)
    , m_state(state)
    , m_directory(directory)
    , m_display(display)
    , m_speech(speech)
    , m_options(std::move(options))
{
}

TriggerOutcome TriggerHandler::handle(const GeofenceEvent &event)
{
    TriggerOutcome outcome;
    if (event.transition == GeofenceTransition::Exit) {
        qCInfo(lcTrigger) << "Exit from" << event.geofenceIds << "logged, nothing to do";
        return outcome;
    }
    if (event.geofenceIds.isEmpty()) {
        qCWarning(lcTrigger) << "Enter event without geofence ids ignored";
        return outcome;
    }

    // Fatal for this invocation when it throws; the connection closes on every way out.
    std::unique_ptr<data::Connection> connection = m_database.openConnection(data::OpenMode::ReadWrite);
    const QDateTime now = m_options.clock();
    outcome.processed = true;
    outcome.notificationId = ipc::EventChannel::generateNotificationId();
    qCInfo(lcTrigger) << "Enter" << event.geofenceIds << "as notification" << outcome.notificationId;

    // Read before the handshake: only tasks snoozed by an earlier event are skipped.
    const auto pending = pendingTaskIds(now);

    ipc::TriggerAnnouncement announcement;
    announcement.event = transitionName(event.transition);
    announcement.geofenceIds = event.geofenceIds;
    announcement.location = event.location;
    announcement.notificationId = outcome.notificationId;
    announcement.timestamp = now;
    ipc::EventChannel channel(m_directory, m_options.ackTimeout);
    outcome.handshake = channel.announce(announcement);
    outcome.ackReceived = outcome.handshake == ipc::HandshakeResult::Acknowledged;

    bool resolutionFailed = false;
    const auto resolved = findCandidates(*connection, event.geofenceIds, now, resolutionFailed);
    const auto candidates = withoutPending(resolved, pending);
    for (const auto &candidate : resolved) {
        if (std::find(pending.begin(), pending.end(), *candidate.task.id) != pending.end()) {
            outcome.snoozedTaskIds.push_back(*candidate.task.id);
        }
    }
    for (const auto &candidate : candidates) {
        outcome.candidateIds.push_back(*candidate.task.id);
    }

    if (!candidates.empty()) {
        const double incoming = core::incomingHighest(candidateTasks(candidates), now);
        const auto decision = core::decideArrival(activePriority(*connection, now), incoming);
        outcome.preemptivelySuppressed = decision == core::ArrivalDecision::Queue;
        qCInfo(lcTrigger) << "Incoming priority" << incoming << "decision" << core::arrivalDecisionName(decision);
    }

    if (outcome.ackReceived) {
        qCInfo(lcTrigger) << "Foreground took over notification" << outcome.notificationId;
    } else if (outcome.preemptivelySuppressed) {
        queueCandidates(candidates, now, outcome);
    } else if (!candidates.empty() || resolutionFailed) {
        showAlert(candidates, event, now, outcome);
    } else if (!outcome.snoozedTaskIds.empty()) {
        qCInfo(lcTrigger) << "Every task at" << event.geofenceIds << "is snoozed";
    } else {
        qCInfo(lcTrigger) << "No open task for" << event.geofenceIds;
    }

    if (!outcome.ackReceived) {
        speakCandidates(candidates, outcome.preemptivelySuppressed, outcome);
    }

    saveHistory(connection, candidates, event, outcome);
    if (outcome.historyRecordsSaved > 0 && channel.publishHistoryUpdate(outcome.notificationId)) {
        qCDebug(lcTrigger) << "Told the foreground about new history";
    }
    return outcome;
}

std::vector<Candidate> TriggerHandler::findCandidates(data::Connection &connection, const QStringList &geofenceIds,
                                                      const QDateTime &now, bool &failed)
{
    try {
        data::TaskRepository tasks(connection);
        data::GeofenceRepository geofences(connection);
        return resolveCandidates(tasks, geofences, geofenceIds, now);
    } catch (const data::StorageError &error) {
        qCWarning(lcTrigger) << "Could not resolve tasks:" << error.message();
        failed = true;
        return {};
    }
}

std::vector<data::TaskId> TriggerHandler::pendingTaskIds(const QDateTime &now)
{
    try {
        return m_state.pendingTaskIds(now);
    } catch (const core::StateStoreError &error) {
        qCWarning(lcTrigger) << "Could not read snoozed tasks:" << error.message();
        return {};
    }
}

std::optional<double> TriggerHandler::activePriority(data::Connection &connection, const QDateTime &now)
{
    try {
        const auto marker = m_state.activeTask();
        if (!marker) {
            return std::nullopt;
        }
        const auto task = data::TaskRepository(connection).findById(marker->taskId);
        if (!task || task->isCompleted) {
            qCWarning(lcTrigger) << "Active marker points at unknown or completed task" << marker->taskId;
            return std::nullopt;
        }
        if (!data::TaskHistoryRepository(connection).findOpenEntry(marker->taskId)) {
            qCWarning(lcTrigger) << "Active marker of task" << marker->taskId << "has no open session";
            return std::nullopt;
        }
        return core::effectivePriority(*task, now);
    } catch (const core::Error &error) {
        qCWarning(lcTrigger) << "Could not read the active task, not suppressing:" << error.message();
        return std::nullopt;
    }
}

void TriggerHandler::queueCandidates(const std::vector<Candidate> &candidates, const QDateTime &now,
                                     TriggerOutcome &outcome)
{
    const QDateTime until = now.addSecs(std::chrono::duration_cast<std::chrono::seconds>(m_options.snooze).count());
    for (const auto &candidate : candidates) {
        try {
            m_state.addPending(*candidate.task.id, until);
            outcome.queuedTaskIds.push_back(*candidate.task.id);
        } catch (const core::StateStoreError &error) {
            qCWarning(lcTrigger) << "Could not queue task" << *candidate.task.id << ":" << error.message();
        }
    }
    qCInfo(lcTrigger) << "Suppressed alert, queued" << outcome.queuedTaskIds.size() << "tasks behind the active one";
}

void TriggerHandler::showAlert(const std::vector<Candidate> &candidates, const GeofenceEvent &event,
                               const QDateTime &now, TriggerOutcome &outcome)
{
    NotificationRequest request;
    request.id = outcome.notificationId;
    request.actions = arrivalActions();
    if (candidates.empty()) {
        request.title = QStringLiteral("Task reminder");
        request.body = genericBody(event);
        request.sound = m_options.defaultSound;
    } else {
        const data::Task &top = candidates.front().task;
        request.title = QStringLiteral("%1 Priority Task").arg(data::priorityLabel(top.priority));
        request.sound = top.notificationSound.isEmpty() ? m_options.defaultSound : top.notificationSound;
        QStringList lines;
        for (const auto &candidate : candidates) {
            const QString urgency = core::urgencyLabel(candidate.task, now);
            lines << (urgency.isEmpty() ? candidate.task.name
                                        : QStringLiteral("%1: %2").arg(urgency, candidate.task.name));
        }
        request.body = lines.join(QLatin1Char('\n'));
    }

    try {
        m_display.show(request);
        outcome.alertShown = true;
    } catch (const std::exception &error) {
        qCWarning(lcTrigger) << "Could not show notification" << request.id << ":" << error.what();
    }
}

void TriggerHandler::speakCandidates(const std::vector<Candidate> &candidates, bool queued, TriggerOutcome &outcome)
{
    if (candidates.empty()) {
        return;
    }
    try {
        if (!m_speech.isAvailable()) {
            qCInfo(lcTrigger) << "Speech unavailable, skipping";
            return;
        }
    } catch (const std::exception &error) {
        qCWarning(lcTrigger) << "Speech check failed:" << error.what();
        return;
    }

    for (const auto &candidate : candidates) {
        const data::Task &task = candidate.task;
        if (task.name.trimmed().isEmpty() || !task.enableSpeech.value_or(m_options.speechByDefault)) {
            continue;
        }
        const QString text = queued ? queuedSpeechText(task.name) : task.name;
        try {
            m_speech.speak(text, queued ? SpeechMode::Snooze : SpeechMode::Location);
            outcome.spokenTexts << text;
            waitForSpeech();
        } catch (const std::exception &error) {
            qCWarning(lcTrigger) << "Could not speak" << text << ":" << error.what();
        }
    }
}

void TriggerHandler::waitForSpeech()
{
    std::chrono::milliseconds waited{ 0 };
    while (m_speech.isSpeaking()) {
        if (waited >= m_options.maxSpeechWait) {
            qCInfo(lcTrigger) << "Speech still running after" << waited.count() << "ms, moving on";
            return;
        }
        pause(m_options.speechPollInterval);
        waited += m_options.speechPollInterval;
    }
}

void TriggerHandler::saveHistory(std::unique_ptr<data::Connection> &connection,
                                 const std::vector<Candidate> &candidates, const GeofenceEvent &event,
                                 TriggerOutcome &outcome)
{
    QString prefix = QStringLiteral("You have task: ");
    if (outcome.ackReceived) {
        prefix = QStringLiteral("Handled in app: ");
    } else if (outcome.preemptivelySuppressed) {
        prefix = QStringLiteral("Added to pending queue: ");
    }

    for (const QString &geofenceId : event.geofenceIds) {
        const QStringList names = namesFor(candidates, geofenceId);
        data::NotificationRecord record;
        record.notificationId = outcome.notificationId;
        record.geofenceId = geofenceId;
        record.taskName = names.value(0);
        record.eventType = transitionName(event.transition);
        record.body = names.isEmpty() ? genericBody(event) : prefix + names.join(QStringLiteral(", "));
        record.timestamp = m_options.clock();

        try {
            data::NotificationHistoryRepository(*connection).insert(record);
            ++outcome.historyRecordsSaved;
            continue;
        } catch (const data::StorageError &error) {
            qCWarning(lcTrigger) << "Saving history for" << geofenceId << "failed, reopening:" << error.message();
        }
        try {
            ++outcome.historyReconnects;
            connection = m_database.openConnection(data::OpenMode::ReadWrite);
            data::NotificationHistoryRepository(*connection).insert(record);
            ++outcome.historyRecordsSaved;
        } catch (const data::StorageError &error) {
            qCWarning(lcTrigger) << "Giving up on history for" << geofenceId << ":" << error.message();
        }
    }
}

void TriggerHandler::pause(std::chrono::milliseconds delay) const
{
    if (m_options.sleep) {
        m_options.sleep(delay);
        return;
    }
    QThread::msleep(static_cast<unsigned long>(delay.count()));
}

} // namespace services
} // namespace georemind
