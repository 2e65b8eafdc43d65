#include <QCommandLineParser>
#include <QCoreApplication>
#include <QSettings>
#include <QString>
#include <QTextStream>

#include "version.h"

#include "georemind/core/ActiveTaskState.hpp"
#include "georemind/core/AppContext.hpp"
#include "georemind/core/Errors.hpp"
#include "georemind/core/Logging.hpp"
#include "georemind/core/PriorityModel.hpp"
#include "georemind/data/Database.hpp"
#include "georemind/data/GeofenceRepository.hpp"
#include "georemind/data/NotificationHistoryRepository.hpp"
#include "georemind/data/TaskHistoryRepository.hpp"
#include "georemind/data/TaskRepository.hpp"
#include "georemind/ipc/EventChannel.hpp"
#include "georemind/services/ActiveTaskArbiter.hpp"
#include "georemind/services/NotificationDisplay.hpp"
#include "georemind/services/TriggerHandler.hpp"

using namespace georemind;

namespace {

QTextStream &out()
{
    static QTextStream stream(stdout);
    return stream;
}

data::TaskId parseTaskId(const QStringList &arguments, int index = 1)
{
    bool ok = false;
    const data::TaskId id = arguments.value(index).toLongLong(&ok);
    if (!ok) {
        throw core::ValidationError(QStringLiteral("Expected a task id, got \"%1\"").arg(arguments.value(index)));
    }
    return id;
}

double parseNumber(const QCommandLineParser &parser, const QString &option)
{
    bool ok = false;
    const double value = parser.value(option).toDouble(&ok);
    if (!ok) {
        throw core::ValidationError(QStringLiteral("--%1 needs a number").arg(option));
    }
    return value;
}

data::RecurrencePattern parseRecurrence(const QString &text, const QDate &until)
{
    if (text == QLatin1String("daily")) {
        return data::RecurrencePattern::daily(until);
    }
    if (text == QLatin1String("weekdays")) {
        return data::RecurrencePattern::weekdaysOnly(until);
    }
    if (text.startsWith(QLatin1String("weekly:"))) {
        std::vector<int> days;
        for (const QString &day : text.mid(7).split(QLatin1Char(','), QString::SkipEmptyParts)) {
            days.push_back(day.toInt());
        }
        return data::RecurrencePattern::weekly(days, until);
    }
    throw core::ValidationError(QStringLiteral("Unknown recurrence \"%1\"").arg(text));
}

int runServe(QCoreApplication &app, core::AppContext &context)
{
    auto &arbiter = context.arbiter();
    QObject::connect(&arbiter, &services::ActiveTaskArbiter::taskQueued, [](qint64 taskId) {
        qCInfo(lcApp) << "Task" << taskId << "added to pending queue";
    });
    QObject::connect(&arbiter, &services::ActiveTaskArbiter::preemptionRequested,
                     [](qint64 taskId, qint64 activeTaskId) {
                         qCInfo(lcApp) << "Task" << taskId << "outranks active task" << activeTaskId;
                     });
    QObject::connect(&arbiter, &services::ActiveTaskArbiter::sessionStarted, [](qint64 taskId) {
        qCInfo(lcApp) << "Now working on task" << taskId;
    });
    QObject::connect(&arbiter, &services::ActiveTaskArbiter::notificationHistoryChanged, [](int notificationId) {
        qCInfo(lcApp) << "Notification history changed by" << notificationId;
    });
    arbiter.listen();
    return app.exec();
}

int runTrigger(const QCommandLineParser &parser, core::AppContext &context)
{
    services::GeofenceEvent event;
    event.transition = services::parseTransition(parser.value(QStringLiteral("event")));
    event.geofenceIds = parser.values(QStringLiteral("geofence"));
    if (parser.isSet(QStringLiteral("lat")) && parser.isSet(QStringLiteral("lng"))) {
        event.location = data::GeoPoint{ parseNumber(parser, QStringLiteral("lat")),
                                         parseNumber(parser, QStringLiteral("lng")) };
    }
    const auto outcome = context.makeTriggerHandler()->handle(event);
    out() << "notification " << outcome.notificationId << " handshake "
          << ipc::handshakeResultName(outcome.handshake) << " alert " << (outcome.alertShown ? "shown" : "none")
          << " suppressed " << (outcome.preemptivelySuppressed ? "yes" : "no") << " history "
          << outcome.historyRecordsSaved << '\n';
    return 0;
}

// Delivered to a running `serve` when there is one, applied here otherwise.
int runAction(const QStringList &arguments, core::AppContext &context)
{
    const QString name = arguments.value(1);
    ipc::NotificationActionMessage action;
    if (name == QLatin1String("do-now")) {
        action.actionId = QString::fromLatin1(services::kDoNowActionId);
    } else if (name == QLatin1String("do-later")) {
        action.actionId = QString::fromLatin1(services::kDoLaterActionId);
    } else {
        throw core::ValidationError(QStringLiteral("Unknown action \"%1\", use do-now or do-later").arg(name));
    }
    action.taskId = parseTaskId(arguments, 2);

    if (ipc::EventChannel::sendAction(context.mailboxDirectory(), action)) {
        out() << name << " sent to the running app\n";
        return 0;
    }
    context.arbiter().handleNotificationAction(action.actionId, action.taskId);
    out() << name << " applied to task " << action.taskId << '\n';
    return 0;
}

int runAddGeofence(const QCommandLineParser &parser, core::AppContext &context)
{
    data::Geofence geofence;
    geofence.id = parser.value(QStringLiteral("id"));
    geofence.center = data::GeoPoint{ parseNumber(parser, QStringLiteral("lat")),
                                      parseNumber(parser, QStringLiteral("lng")) };
    if (parser.isSet(QStringLiteral("radius"))) {
        geofence.radiusMeters = parseNumber(parser, QStringLiteral("radius"));
    }
    geofence.taskName = parser.value(QStringLiteral("task"));
    data::GeofenceRepository repository(context.connection(), context.config().radiusBounds());
    const auto stored = repository.saveGeofence(geofence);
    out() << "geofence " << stored.id << " radius " << stored.radiusMeters << '\n';
    return 0;
}

int runAddTask(const QCommandLineParser &parser, core::AppContext &context)
{
    data::Task task;
    task.name = parser.value(QStringLiteral("name"));
    if (parser.isSet(QStringLiteral("priority"))) {
        task.priority = parser.value(QStringLiteral("priority")).toInt();
    }
    task.geofenceId = parser.value(QStringLiteral("geofence"));
    task.scheduledDate = QDate::fromString(parser.value(QStringLiteral("date")), Qt::ISODate);
    task.scheduledTime = QTime::fromString(parser.value(QStringLiteral("time")), QStringLiteral("HH:mm"));
    if (parser.isSet(QStringLiteral("recurrence"))) {
        const QDate until = QDate::fromString(parser.value(QStringLiteral("until")), Qt::ISODate);
        task.recurrence = parseRecurrence(parser.value(QStringLiteral("recurrence")), until);
        task.isRecurring = true;
    }
    task.notificationSound = parser.value(QStringLiteral("sound"));
    if (parser.isSet(QStringLiteral("speech"))) {
        task.enableSpeech = parser.value(QStringLiteral("speech")) == QLatin1String("on");
    }
    const auto stored = data::TaskRepository(context.connection()).addTask(task);
    out() << "task " << *stored.id << ' ' << stored.name << '\n';
    return 0;
}

int runListTasks(core::AppContext &context)
{
    const QDateTime now = QDateTime::currentDateTime();
    const auto tasks = core::rankTasks(data::TaskRepository(context.connection()).fetchTasks(), now);
    for (const auto &task : tasks) {
        out() << *task.id << '\t' << task.name << '\t' << data::priorityLabel(task.priority) << '\t'
              << core::effectivePriority(task, now) << '\t' << task.recurrence.shortDescription() << '\t'
              << (task.isCompleted ? QStringLiteral("done") : core::urgencyLabel(task, now)) << '\n';
    }
    return 0;
}

int runHistory(data::TaskId taskId, core::AppContext &context)
{
    data::TaskHistoryRepository history(context.connection());
    for (const auto &entry : history.fetchForTask(taskId)) {
        out() << entry.startTime.toString(Qt::ISODate) << '\t'
              << (entry.isOpen() ? QStringLiteral("open") : entry.endTime.toString(Qt::ISODate)) << '\t'
              << entry.durationSeconds << "s\n";
    }
    out() << "total " << history.totalTimeSpent(taskId) << "s, completed " << history.completionCount(taskId)
          << " times\n";
    return 0;
}

int runNotifications(const QCommandLineParser &parser, core::AppContext &context)
{
    data::NotificationHistoryRepository repository(context.connection());
    if (parser.isSet(QStringLiteral("clear"))) {
        out() << "cleared " << repository.clearAll() << '\n';
        return 0;
    }
    for (const auto &record : repository.fetchAll()) {
        out() << record.timestamp.toString(Qt::ISODate) << '\t' << record.notificationId << '\t'
              << record.geofenceId << '\t' << record.body << '\n';
    }
    return 0;
}

int runCommand(QCoreApplication &app, const QCommandLineParser &parser, core::AppContext &context)
{
    const QStringList arguments = parser.positionalArguments();
    const QString command = arguments.value(0);

    if (command == QLatin1String("serve")) {
        return runServe(app, context);
    }
    if (command == QLatin1String("trigger")) {
        return runTrigger(parser, context);
    }
    if (command == QLatin1String("add-geofence")) {
        return runAddGeofence(parser, context);
    }
    if (command == QLatin1String("add-task")) {
        return runAddTask(parser, context);
    }
    if (command == QLatin1String("list-tasks")) {
        return runListTasks(context);
    }
    if (command == QLatin1String("start")) {
        const auto entry = context.arbiter().startSession(parseTaskId(arguments));
        out() << "started " << *entry.taskId << " at " << entry.startTime.toString(Qt::ISODate) << '\n';
        return 0;
    }
    if (command == QLatin1String("end")) {
        const auto how = parser.isSet(QStringLiteral("abandon")) ? services::SessionEnd::Abandoned
                                                                 : services::SessionEnd::Completed;
        const auto entry = context.arbiter().endSession(parseTaskId(arguments), QDateTime::currentDateTime(), how);
        out() << "ended " << *entry.taskId << " after " << entry.durationSeconds << "s\n";
        return 0;
    }
    if (command == QLatin1String("pause")) {
        const data::TaskId taskId = parseTaskId(arguments);
        context.arbiter().pauseSession(taskId);
        out() << "paused " << taskId << '\n';
        return 0;
    }
    if (command == QLatin1String("resume")) {
        const data::TaskId taskId = parseTaskId(arguments);
        context.arbiter().resumeSession(taskId);
        out() << "resumed " << taskId << '\n';
        return 0;
    }
    if (command == QLatin1String("action")) {
        return runAction(arguments, context);
    }
    if (command == QLatin1String("pending")) {
        for (const auto taskId : context.activeTaskState().pendingTaskIds(QDateTime::currentDateTime())) {
            out() << taskId << '\n';
        }
        return 0;
    }
    if (command == QLatin1String("notifications")) {
        return runNotifications(parser, context);
    }
    if (command == QLatin1String("history")) {
        return runHistory(parseTaskId(arguments), context);
    }
    if (command == QLatin1String("check-db")) {
        const bool healthy = context.database().checkIntegrity();
        out() << (healthy ? "ok" : "repaired") << '\n';
        return healthy ? 0 : 2;
    }
    qCCritical(lcApp) << "Unknown command" << command;
    return 64;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("GeoRemind"));
    QCoreApplication::setOrganizationDomain(QStringLiteral("georemind.app"));
    QCoreApplication::setApplicationName(QStringLiteral("georemind"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kGeoRemindVersion));

    QCoreApplication app(argc, argv);

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Location-aware task reminders"));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("serve, trigger, add-geofence, add-task, list-tasks, start, end, "
                                                "pause, resume, action, pending, notifications, history or "
                                                "check-db"));
    parser.addOptions({
        { QStringLiteral("database"), QStringLiteral("Database file."), QStringLiteral("path") },
        { QStringLiteral("event"), QStringLiteral("Geofence transition: enter or exit."), QStringLiteral("event"),
          QStringLiteral("enter") },
        { QStringLiteral("geofence"), QStringLiteral("Geofence id, repeatable."), QStringLiteral("id") },
        { QStringLiteral("id"), QStringLiteral("Id of a new geofence."), QStringLiteral("id") },
        { QStringLiteral("lat"), QStringLiteral("Latitude."), QStringLiteral("degrees") },
        { QStringLiteral("lng"), QStringLiteral("Longitude."), QStringLiteral("degrees") },
        { QStringLiteral("radius"), QStringLiteral("Geofence radius."), QStringLiteral("meters") },
        { QStringLiteral("task"), QStringLiteral("Legacy task name bound to a geofence."), QStringLiteral("name") },
        { QStringLiteral("name"), QStringLiteral("Task name."), QStringLiteral("name") },
        { QStringLiteral("priority"), QStringLiteral("Task priority 1-5."), QStringLiteral("priority") },
        { QStringLiteral("date"), QStringLiteral("Scheduled date."), QStringLiteral("yyyy-MM-dd") },
        { QStringLiteral("time"), QStringLiteral("Scheduled time."), QStringLiteral("HH:mm") },
        { QStringLiteral("recurrence"), QStringLiteral("daily, weekdays or weekly:1,3,5."), QStringLiteral("rule") },
        { QStringLiteral("until"), QStringLiteral("Last day of the recurrence."), QStringLiteral("yyyy-MM-dd") },
        { QStringLiteral("speech"), QStringLiteral("Speech for this task: on or off."), QStringLiteral("on|off") },
        { QStringLiteral("sound"), QStringLiteral("Notification sound for this task."), QStringLiteral("sound") },
        { QStringLiteral("abandon"), QStringLiteral("End the session without completing the task.") },
        { QStringLiteral("clear"), QStringLiteral("Delete all notification history.") },
    });
    parser.process(app);

    QSettings settings;
    core::AppConfig config = core::AppConfig::load(settings);
    if (parser.isSet(QStringLiteral("database"))) {
        config.databasePath = parser.value(QStringLiteral("database"));
    }

    try {
        core::AppContext context(config);
        return runCommand(app, parser, context);
    } catch (const data::StorageUnavailable &error) {
        qCCritical(lcApp) << "Storage unavailable:" << error.message();
        return 3;
    } catch (const core::Error &error) {
        qCCritical(lcApp).noquote() << error.message();
        return 1;
    }
}
