#include "georemind/services/ActiveTaskArbiter.hpp"

#include "georemind/core/Errors.hpp"
#include "georemind/core/Logging.hpp"
#include "georemind/data/Database.hpp"
#include "georemind/data/GeofenceRepository.hpp"
#include "georemind/data/TaskHistoryRepository.hpp"
#include "georemind/data/TaskRepository.hpp"
#include "georemind/ipc/EventChannel.hpp"
#include "georemind/ipc/Mailbox.hpp"
#include "georemind/services/CandidateResolver.hpp"
#include "georemind/services/NotificationDisplay.hpp"
#include "georemind/services/SpeechEngine.hpp"
#include "georemind/services/TriggerHandler.hpp"

#include <algorithm>

namespace georemind {
namespace services {

ActiveTaskArbiter::ActiveTaskArbiter(data::Connection &connection, core::ActiveTaskState &state,
                                     ipc::MailboxDirectory &directory, NotificationDisplay &display,
                                     SpeechEngine &speech, ArbiterOptions options, QObject *parent)
    : QObject(parent)
    , m_connection(connection)
    , m_state(state)
    , m_directory(directory)
    , m_display(display)
    , m_speech(speech)
    , m_options(std::move(options))
{
}

ActiveTaskArbiter::~ActiveTaskArbiter()
{
    stopListening();
}

void ActiveTaskArbiter::listen()
{
    if (isListening()) {
        return;
    }
    m_eventMailbox = m_directory.registerMailbox(QString::fromLatin1(ipc::kEventMailboxName));
    connect(m_eventMailbox.get(), &ipc::MailboxReceiver::messageReceived, this, &ActiveTaskArbiter::onEventMessage);
    try {
        m_historyMailbox = m_directory.registerMailbox(QString::fromLatin1(ipc::kHistoryMailboxName));
    } catch (const ipc::MailboxError &) {
        stopListening();
        throw;
    }
    connect(m_historyMailbox.get(), &ipc::MailboxReceiver::messageReceived, this,
            &ActiveTaskArbiter::onHistoryMessage);
    try {
        m_actionMailbox = m_directory.registerMailbox(QString::fromLatin1(ipc::kActionMailboxName));
    } catch (const ipc::MailboxError &) {
        stopListening();
        throw;
    }
    connect(m_actionMailbox.get(), &ipc::MailboxReceiver::messageReceived, this, &ActiveTaskArbiter::onActionMessage);
    qCInfo(lcArbiter) << "Listening for geofence events";
}

void ActiveTaskArbiter::stopListening()
{
    if (m_eventMailbox) {
        m_directory.unregisterMailbox(m_eventMailbox->name());
        m_eventMailbox.reset();
    }
    if (m_historyMailbox) {
        m_directory.unregisterMailbox(m_historyMailbox->name());
        m_historyMailbox.reset();
    }
    if (m_actionMailbox) {
        m_directory.unregisterMailbox(m_actionMailbox->name());
        m_actionMailbox.reset();
    }
}

bool ActiveTaskArbiter::isListening() const
{
    return m_eventMailbox != nullptr;
}

data::TaskHistoryEntry ActiveTaskArbiter::startSession(data::TaskId taskId)
{
    if (const auto marker = m_state.activeTask()) {
        if (isLive(*marker)) {
            throw core::ConflictError(QStringLiteral("Task %1 is already active, end it before starting %2")
                                          .arg(marker->taskId)
                                          .arg(taskId));
        }
        qCWarning(lcArbiter) << "Clearing stale active marker of task" << marker->taskId;
        m_state.clearActive();
    }
    data::TaskRepository tasks(m_connection);
    const auto task = tasks.findById(taskId);
    if (!task) {
        throw core::NotFoundError(QStringLiteral("Task %1 does not exist").arg(taskId));
    }
    if (task->isCompleted) {
        throw core::ConflictError(QStringLiteral("Task %1 is already completed").arg(taskId));
    }

    data::TaskHistoryRepository history(m_connection);
    if (const auto stale = history.findOpenEntry(taskId)) {
        qCWarning(lcArbiter) << "Closing stale open session" << *stale->id << "of task" << taskId;
        history.closeEntry(*stale->id, stale->startTime);
    }

    data::TaskHistoryEntry entry;
    entry.taskId = taskId;
    entry.taskName = task->name;
    entry.taskPriority = task->priority;
    entry.startTime = m_options.clock();
    entry.geofenceId = task->geofenceId;
    const data::TaskHistoryEntry opened = history.openEntry(entry);

    try {
        m_state.setActive(taskId, opened.startTime);
    } catch (const core::StateStoreError &) {
        history.removeEntry(*opened.id);
        throw;
    }
    if (m_state.removePending(taskId)) {
        qCDebug(lcArbiter) << "Task" << taskId << "left the pending queue";
    }

    qCInfo(lcArbiter) << "Started session on task" << taskId << task->name;
    emit sessionStarted(taskId);
    return opened;
}

data::TaskHistoryEntry ActiveTaskArbiter::endSession(data::TaskId taskId, const QDateTime &endedAt, SessionEnd how)
{
    data::TaskHistoryRepository history(m_connection);
    const auto open = history.findOpenEntry(taskId);
    const auto marker = m_state.activeTask();
    const bool ownsMarker = marker && marker->taskId == taskId;
    if (!open) {
        if (ownsMarker) {
            qCWarning(lcArbiter) << "Clearing active marker of task" << taskId << "without an open session";
            m_state.clearActive();
        }
        throw core::NotFoundError(QStringLiteral("Task %1 has no open session").arg(taskId));
    }

    // Marker first: an entry left open by a failure here is closed by the next start.
    const qint64 pausedSeconds = ownsMarker ? marker->pausedSecondsAt(endedAt) : 0;
    if (ownsMarker) {
        m_state.clearActive();
    }
    history.closeEntry(*open->id, endedAt, pausedSeconds);

    const bool completed = how == SessionEnd::Completed;
    if (completed) {
        data::TaskRepository tasks(m_connection);
        tasks.setCompleted(taskId, true);
        const auto task = tasks.findById(taskId);
        if (task && task->isRecurring) {
            const auto next = data::nextOccurrence(task->recurrence, endedAt.date());
            if (next) {
                try {
                    const auto instance = tasks.addTask(task->copyWithDate(*next));
                    qCInfo(lcArbiter) << "Scheduled next instance" << *instance.id << "of" << task->name << "on"
                                      << *next;
                } catch (const core::NotFoundError &error) {
                    qCWarning(lcArbiter) << "Next instance of" << task->name << "not created:" << error.message();
                }
            }
        }
    }

    data::TaskHistoryEntry closed = *open;
    closed.endTime = endedAt;
    closed.durationSeconds = std::max<qint64>(0, open->startTime.secsTo(endedAt) - pausedSeconds);
    closed.completionDate = endedAt.date();
    qCInfo(lcArbiter) << "Ended session on task" << taskId << (completed ? "completed" : "abandoned") << "after"
                      << closed.durationSeconds << "s";
    emit sessionEnded(taskId, completed);
    return closed;
}

std::optional<core::ActiveTaskMarker> ActiveTaskArbiter::activeSession() const
{
    return m_state.activeTask();
}

core::ActiveTaskMarker ActiveTaskArbiter::requireActive(data::TaskId taskId) const
{
    const auto marker = m_state.activeTask();
    if (!marker || marker->taskId != taskId) {
        throw core::NotFoundError(QStringLiteral("Task %1 is not the active task").arg(taskId));
    }
    return *marker;
}

void ActiveTaskArbiter::pauseSession(data::TaskId taskId)
{
    const auto marker = requireActive(taskId);
    if (marker.isPaused()) {
        throw core::ConflictError(QStringLiteral("Task %1 is already paused").arg(taskId));
    }
    m_state.setPaused(m_options.clock());
    qCInfo(lcArbiter) << "Paused task" << taskId;
}

void ActiveTaskArbiter::resumeSession(data::TaskId taskId)
{
    const auto marker = requireActive(taskId);
    if (!marker.isPaused()) {
        throw core::ConflictError(QStringLiteral("Task %1 is not paused").arg(taskId));
    }
    const qint64 pausedSeconds = marker.pausedSecondsAt(m_options.clock());
    m_state.setResumed(pausedSeconds);
    qCInfo(lcArbiter) << "Resumed task" << taskId << "after" << pausedSeconds << "s paused in total";
}

bool ActiveTaskArbiter::isLive(const core::ActiveTaskMarker &marker) const
{
    const auto task = data::TaskRepository(m_connection).findById(marker.taskId);
    if (!task || task->isCompleted) {
        return false;
    }
    return data::TaskHistoryRepository(m_connection).findOpenEntry(marker.taskId).has_value();
}

std::optional<core::ArrivalDecision> ActiveTaskArbiter::handleAnnouncement(const ipc::TriggerAnnouncement &announcement)
{
    if (announcement.event != QLatin1String("enter")) {
        qCDebug(lcArbiter) << "Ignoring" << announcement.event << "for" << announcement.geofenceIds;
        return std::nullopt;
    }
    const QDateTime now = m_options.clock();
    data::TaskRepository tasks(m_connection);
    data::GeofenceRepository geofences(m_connection);
    const auto candidates = candidateTasks(withoutPending(
        resolveCandidates(tasks, geofences, announcement.geofenceIds, now), m_state.pendingTaskIds(now)));
    if (candidates.empty()) {
        qCInfo(lcArbiter) << "Nothing to surface for" << announcement.geofenceIds;
        return std::nullopt;
    }

    std::optional<data::Task> active;
    if (const auto marker = m_state.activeTask()) {
        if (isLive(*marker)) {
            active = tasks.findById(marker->taskId);
        }
    }
    const double incoming = core::incomingHighest(candidates, now);
    const auto decision = core::decideArrival(
        active ? std::optional<double>(core::effectivePriority(*active, now)) : std::nullopt, incoming);
    qCInfo(lcArbiter) << "Notification" << announcement.notificationId << "incoming" << incoming << "decision"
                      << core::arrivalDecisionName(decision);

    switch (decision) {
    case core::ArrivalDecision::Alert:
        showArrival(announcement.notificationId, candidates, now);
        emit taskArrived(*candidates.front().id, announcement.notificationId);
        break;
    case core::ArrivalDecision::Queue: {
        cancelNotification(announcement.notificationId);
        for (const auto &task : candidates) {
            m_state.addPending(*task.id, snoozeUntil());
        }
        // The background only waits briefly; answer before anything slow.
        ipc::EventChannel::acknowledge(m_directory, announcement.ackMailbox, QStringLiteral("suppressed"));
        QStringList phrases;
        for (const auto &task : candidates) {
            if (!task.name.trimmed().isEmpty() && task.enableSpeech.value_or(m_options.speechByDefault)) {
                phrases << queuedSpeechText(task.name);
            }
            emit taskQueued(*task.id);
        }
        speakQueued(phrases.join(QLatin1Char(' ')));
        break;
    }
    case core::ArrivalDecision::PromptSwitch:
        cancelNotification(announcement.notificationId);
        showSwitchPrompt(announcement.notificationId, candidates.front(), *active);
        ipc::EventChannel::acknowledge(m_directory, announcement.ackMailbox, QStringLiteral("prompted"));
        emit preemptionRequested(*candidates.front().id, *active->id);
        break;
    }
    return decision;
}

void ActiveTaskArbiter::handleNotificationAction(const QString &actionId, data::TaskId taskId)
{
    if (actionId == QLatin1String(kDoLaterActionId)) {
        m_state.addPending(taskId, snoozeUntil());
        qCInfo(lcArbiter) << "Task" << taskId << "deferred until" << snoozeUntil();
        emit taskQueued(taskId);
        return;
    }
    if (actionId != QLatin1String(kDoNowActionId)) {
        qCWarning(lcArbiter) << "Unknown notification action" << actionId;
        return;
    }

    const auto target = data::TaskRepository(m_connection).findById(taskId);
    if (!target) {
        throw core::NotFoundError(QStringLiteral("Task %1 does not exist").arg(taskId));
    }
    if (target->isCompleted) {
        throw core::ConflictError(QStringLiteral("Task %1 is already completed").arg(taskId));
    }
    if (const auto marker = m_state.activeTask()) {
        if (marker->taskId == taskId) {
            qCDebug(lcArbiter) << "Task" << taskId << "is already active";
            return;
        }
        try {
            endSession(marker->taskId, m_options.clock(), SessionEnd::Abandoned);
        } catch (const core::NotFoundError &) {
            qCWarning(lcArbiter) << "Active task" << marker->taskId << "had no open session, clearing marker";
            m_state.clearActive();
        }
    }
    startSession(taskId);
}

std::vector<data::TaskId> ActiveTaskArbiter::pendingTaskIds()
{
    return m_state.pendingTaskIds(m_options.clock());
}

void ActiveTaskArbiter::onEventMessage(const QJsonObject &message)
{
    const auto announcement = ipc::TriggerAnnouncement::fromJson(message);
    if (!announcement) {
        qCWarning(lcArbiter) << "Dropping unexpected message on the event mailbox";
        return;
    }
    try {
        handleAnnouncement(*announcement);
    } catch (const core::Error &error) {
        qCWarning(lcArbiter) << "Could not handle notification" << announcement->notificationId
                             << ", leaving it to the background:" << error.message();
    }
}

void ActiveTaskArbiter::onActionMessage(const QJsonObject &message)
{
    const auto action = ipc::NotificationActionMessage::fromJson(message);
    if (!action) {
        qCWarning(lcArbiter) << "Dropping unexpected message on the action mailbox";
        return;
    }
    try {
        handleNotificationAction(action->actionId, action->taskId);
    } catch (const core::Error &error) {
        qCWarning(lcArbiter) << "Action" << action->actionId << "on task" << action->taskId
                             << "failed:" << error.message();
    }
}

void ActiveTaskArbiter::onHistoryMessage(const QJsonObject &message)
{
    if (message.value(QStringLiteral("type")).toString() != QLatin1String("history-updated")) {
        return;
    }
    emit notificationHistoryChanged(message.value(QStringLiteral("notificationId")).toInt());
}

QDateTime ActiveTaskArbiter::snoozeUntil() const
{
    return m_options.clock().addSecs(std::chrono::duration_cast<std::chrono::seconds>(m_options.snooze).count());
}

void ActiveTaskArbiter::speakQueued(const QString &text)
{
    if (text.isEmpty()) {
        return;
    }
    try {
        if (m_speech.isAvailable()) {
            m_speech.speak(text, SpeechMode::Snooze);
        }
    } catch (const std::exception &error) {
        qCWarning(lcArbiter) << "Could not speak" << text << ":" << error.what();
    }
}

void ActiveTaskArbiter::showArrival(int notificationId, const std::vector<data::Task> &tasks, const QDateTime &now)
{
    NotificationRequest request;
    request.id = notificationId;
    request.title = QStringLiteral("%1 Priority Task").arg(data::priorityLabel(tasks.front().priority));
    request.sound = tasks.front().notificationSound.isEmpty() ? m_options.defaultSound
                                                              : tasks.front().notificationSound;
    request.actions = arrivalActions();
    QStringList lines;
    for (const auto &task : tasks) {
        const QString urgency = core::urgencyLabel(task, now);
        lines << (urgency.isEmpty() ? task.name : QStringLiteral("%1: %2").arg(urgency, task.name));
    }
    request.body = lines.join(QLatin1Char('\n'));
    try {
        m_display.show(request);
    } catch (const std::exception &error) {
        qCWarning(lcArbiter) << "Could not show notification" << notificationId << ":" << error.what();
    }
}

void ActiveTaskArbiter::showSwitchPrompt(int notificationId, const data::Task &incoming, const data::Task &active)
{
    NotificationRequest request;
    request.id = notificationId;
    request.title = QStringLiteral("Switch to %1?").arg(incoming.name);
    request.body = QStringLiteral("%1 (%2) outranks your active task %3 (%4).")
                       .arg(incoming.name, data::priorityLabel(incoming.priority), active.name,
                            data::priorityLabel(active.priority));
    request.sound = incoming.notificationSound.isEmpty() ? m_options.defaultSound : incoming.notificationSound;
    request.actions = arrivalActions();
    try {
        m_display.show(request);
    } catch (const std::exception &error) {
        qCWarning(lcArbiter) << "Could not show switch prompt" << notificationId << ":" << error.what();
    }
}

void ActiveTaskArbiter::cancelNotification(int notificationId)
{
    try {
        m_display.cancel(notificationId);
    } catch (const std::exception &error) {
        qCWarning(lcArbiter) << "Could not cancel notification" << notificationId << ":" << error.what();
    }
}

} // namespace services
} // namespace georemind
