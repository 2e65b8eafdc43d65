#include <QtTest/QtTest>

#include "georemind/core/ActiveTaskState.hpp"
#include "georemind/data/Database.hpp"
#include "georemind/data/GeofenceRepository.hpp"
#include "georemind/data/NotificationHistoryRepository.hpp"
#include "georemind/data/SettingsKeyValueStore.hpp"
#include "georemind/data/TaskHistoryRepository.hpp"
#include "georemind/data/TaskRepository.hpp"
#include "georemind/ipc/InProcessMailbox.hpp"
#include "georemind/services/ActiveTaskArbiter.hpp"
#include "georemind/services/TriggerHandler.hpp"
#include "support/TestDoubles.hpp"

using namespace georemind;
using namespace georemind::services;
using namespace std::chrono_literals;

class TriggerHandlerTest : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void alertsWithoutForeground();
    void queuesBehindMoreUrgentActiveTask();
    void foregroundTakesOverWhenItAcknowledges();
    void timeoutShowsExactlyOneAlert();
    void exitEventsAreOnlyLogged();
    void emptyEnterEventIsIgnored();
    void legacyTaskNameFallback();
    void legacyFallbackSkipsReferencedGeofence();
    void staleActiveMarkerDoesNotSuppress();
    void snoozedTaskIsSkipped();
    void defaultSoundFillsIn();
    void historyFailureReconnectsOnceAndContinues();
    void nothingDueStillRecordsHistory();
    void speechFailureIsTolerated();
    void displayFailureIsTolerated();
    void speechWaitIsBounded();
    void unopenableDatabasePropagates();

private:
    data::TaskId addTask(const QString &name, int priority, const QString &geofenceId = QString());
    void addGeofence(const QString &id, const QString &legacyName = QString());
    GeofenceEvent enter(const QStringList &ids) const;
    TriggerHandler makeHandler(TriggerOptions options = TriggerOptions());
    void openSession(data::TaskId taskId, const QDateTime &startedAt);
    std::vector<data::NotificationRecord> history();

    QDateTime m_now;
    std::vector<std::chrono::milliseconds> m_sleeps;
    std::unique_ptr<QTemporaryDir> m_dir;
    std::unique_ptr<data::Database> m_database;
    std::unique_ptr<data::Connection> m_connection;
    std::unique_ptr<data::SettingsKeyValueStore> m_store;
    std::unique_ptr<core::ActiveTaskState> m_state;
    std::unique_ptr<ipc::InProcessMailboxDirectory> m_directory;
    std::unique_ptr<testing::RecordingNotificationDisplay> m_display;
    std::unique_ptr<testing::ScriptedSpeechEngine> m_speech;
};

void TriggerHandlerTest::init()
{
    m_now = QDateTime(QDate(2024, 5, 6), QTime(12, 0));
    m_sleeps.clear();
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
    m_database = std::make_unique<data::Database>(testing::testDatabaseOptions(QDir(m_dir->path())));
    m_connection = m_database->openConnection();
    m_store = std::make_unique<data::SettingsKeyValueStore>(m_dir->filePath(QStringLiteral("state.ini")));
    m_state = std::make_unique<core::ActiveTaskState>(*m_store);
    m_directory = std::make_unique<ipc::InProcessMailboxDirectory>();
    m_display = std::make_unique<testing::RecordingNotificationDisplay>();
    m_speech = std::make_unique<testing::ScriptedSpeechEngine>();

    addGeofence(QStringLiteral("G"));
}

void TriggerHandlerTest::cleanup()
{
    m_speech.reset();
    m_display.reset();
    m_directory.reset();
    m_state.reset();
    m_store.reset();
    m_connection.reset();
    m_database.reset();
    m_dir.reset();
}

data::TaskId TriggerHandlerTest::addTask(const QString &name, int priority, const QString &geofenceId)
{
    data::Task task;
    task.name = name;
    task.priority = priority;
    task.geofenceId = geofenceId;
    return *data::TaskRepository(*m_connection).addTask(task).id;
}

void TriggerHandlerTest::addGeofence(const QString &id, const QString &legacyName)
{
    data::Geofence geofence;
    geofence.id = id;
    geofence.center = { 48.2082, 16.3738 };
    geofence.taskName = legacyName;
    data::GeofenceRepository(*m_connection).saveGeofence(geofence);
}

GeofenceEvent TriggerHandlerTest::enter(const QStringList &ids) const
{
    GeofenceEvent event;
    event.transition = GeofenceTransition::Enter;
    event.geofenceIds = ids;
    event.location = data::GeoPoint{ 48.2083, 16.3739 };
    return event;
}

TriggerHandler TriggerHandlerTest::makeHandler(TriggerOptions options)
{
    options.ackTimeout = 50ms;
    options.clock = [this] { return m_now; };
    options.sleep = [this](std::chrono::milliseconds delay) { m_sleeps.push_back(delay); };
    return TriggerHandler(*m_database, *m_state, *m_directory, *m_display, *m_speech, options);
}

void TriggerHandlerTest::openSession(data::TaskId taskId, const QDateTime &startedAt)
{
    data::TaskHistoryEntry entry;
    entry.taskId = taskId;
    entry.taskName = data::TaskRepository(*m_connection).findById(taskId)->name;
    entry.startTime = startedAt;
    data::TaskHistoryRepository(*m_connection).openEntry(entry);
    m_state->setActive(taskId, startedAt);
}

std::vector<data::NotificationRecord> TriggerHandlerTest::history()
{
    return data::NotificationHistoryRepository(*m_connection).fetchAll();
}

void TriggerHandlerTest::alertsWithoutForeground()
{
    const auto taskId = addTask(QStringLiteral("X"), 5, QStringLiteral("G"));

    auto handler = makeHandler();
    const auto outcome = handler.handle(enter({ QStringLiteral("G") }));

    QVERIFY(outcome.processed);
    QCOMPARE(outcome.handshake, ipc::HandshakeResult::NoListener);
    QCOMPARE(outcome.candidateIds, std::vector<data::TaskId>{ taskId });
    QVERIFY(outcome.alertShown);
    QVERIFY(!outcome.preemptivelySuppressed);

    QCOMPARE(m_display->shown.size(), std::size_t(1));
    const auto &alert = m_display->shown.front();
    QCOMPARE(alert.id, outcome.notificationId);
    QCOMPARE(alert.title, QStringLiteral("Very High Priority Task"));
    QCOMPARE(alert.body, QStringLiteral("X"));
    QCOMPARE(alert.actions.size(), std::size_t(2));
    QCOMPARE(alert.actions.front().id, QString::fromLatin1(kDoNowActionId));

    QCOMPARE(m_speech->spoken, QStringList{ QStringLiteral("X") });
    QVERIFY(m_speech->modes.front() == SpeechMode::Location);

    const auto records = history();
    QCOMPARE(records.size(), std::size_t(1));
    QCOMPARE(records.front().notificationId, outcome.notificationId);
    QCOMPARE(records.front().geofenceId, QStringLiteral("G"));
    QCOMPARE(records.front().taskName, QStringLiteral("X"));
    QCOMPARE(records.front().eventType, QStringLiteral("enter"));
    QCOMPARE(records.front().body, QStringLiteral("You have task: X"));
    QCOMPARE(outcome.historyRecordsSaved, 1);
}

void TriggerHandlerTest::queuesBehindMoreUrgentActiveTask()
{
    const auto active = addTask(QStringLiteral("Y"), 5);
    const auto incoming = addTask(QStringLiteral("Z"), 2, QStringLiteral("G"));
    openSession(active, m_now.addSecs(-600));

    auto handler = makeHandler();
    const auto outcome = handler.handle(enter({ QStringLiteral("G") }));

    QVERIFY(outcome.preemptivelySuppressed);
    QVERIFY(!outcome.alertShown);
    QVERIFY(m_display->shown.empty());
    QCOMPARE(outcome.queuedTaskIds, std::vector<data::TaskId>{ incoming });
    QCOMPARE(m_state->pendingTaskIds(m_now), std::vector<data::TaskId>{ incoming });
    QCOMPARE(m_speech->spoken, QStringList{ QStringLiteral("Z added to pending queue.") });
    QVERIFY(m_speech->modes.front() == SpeechMode::Snooze);

    const auto records = history();
    QCOMPARE(records.size(), std::size_t(1));
    QCOMPARE(records.front().body, QStringLiteral("Added to pending queue: Z"));
    QCOMPARE(m_state->activeTask()->taskId, active);
}

void TriggerHandlerTest::foregroundTakesOverWhenItAcknowledges()
{
    const auto active = addTask(QStringLiteral("Y"), 2);
    addTask(QStringLiteral("Z"), 5, QStringLiteral("G"));

    // The foreground keeps its own connection and its own view of the shared state file.
    auto foregroundConnection = m_database->openConnection();
    data::SettingsKeyValueStore foregroundStore(m_dir->filePath(QStringLiteral("state.ini")));
    core::ActiveTaskState foregroundState(foregroundStore);
    testing::RecordingNotificationDisplay foregroundDisplay;
    testing::ScriptedSpeechEngine foregroundSpeech;
    ArbiterOptions arbiterOptions;
    arbiterOptions.clock = [this] { return m_now; };
    ActiveTaskArbiter arbiter(*foregroundConnection, foregroundState, *m_directory, foregroundDisplay,
                              foregroundSpeech, arbiterOptions);
    arbiter.listen();
    arbiter.startSession(active);
    QSignalSpy preemption(&arbiter, &ActiveTaskArbiter::preemptionRequested);
    QSignalSpy historyChanged(&arbiter, &ActiveTaskArbiter::notificationHistoryChanged);

    auto handler = makeHandler();
    const auto outcome = handler.handle(enter({ QStringLiteral("G") }));

    QCOMPARE(outcome.handshake, ipc::HandshakeResult::Acknowledged);
    QVERIFY(outcome.ackReceived);
    QVERIFY(!outcome.alertShown);
    QVERIFY(m_display->shown.empty());
    QVERIFY(m_speech->spoken.isEmpty());

    QCOMPARE(preemption.count(), 1);
    QCOMPARE(foregroundDisplay.shown.size(), std::size_t(1));
    QCOMPARE(foregroundDisplay.shown.front().id, outcome.notificationId);
    QCOMPARE(foregroundDisplay.shown.front().title, QStringLiteral("Switch to Z?"));
    QCOMPARE(m_state->activeTask()->taskId, active);

    const auto records = history();
    QCOMPARE(records.size(), std::size_t(1));
    QCOMPARE(records.front().body, QStringLiteral("Handled in app: Z"));
    QCOMPARE(historyChanged.count(), 1);
    QCOMPARE(historyChanged.at(0).at(0).toInt(), outcome.notificationId);
}

void TriggerHandlerTest::timeoutShowsExactlyOneAlert()
{
    addTask(QStringLiteral("Z"), 4, QStringLiteral("G"));
    // Something owns the event mailbox but never answers.
    ipc::MailboxRegistration silentForeground(*m_directory, QString::fromLatin1(ipc::kEventMailboxName));

    auto handler = makeHandler();
    const auto outcome = handler.handle(enter({ QStringLiteral("G") }));

    QCOMPARE(outcome.handshake, ipc::HandshakeResult::TimedOut);
    QVERIFY(!outcome.ackReceived);
    QCOMPARE(m_display->shown.size(), std::size_t(1));
    QCOMPARE(m_display->shown.front().id, outcome.notificationId);
    QCOMPARE(m_display->shown.front().title, QStringLiteral("High Priority Task"));
    QVERIFY(!m_directory->isRegistered(ipc::EventChannel::ackMailboxName(outcome.notificationId)));
}

void TriggerHandlerTest::exitEventsAreOnlyLogged()
{
    addTask(QStringLiteral("Z"), 3, QStringLiteral("G"));
    auto event = enter({ QStringLiteral("G") });
    event.transition = GeofenceTransition::Exit;

    auto handler = makeHandler();
    const auto outcome = handler.handle(event);

    QVERIFY(!outcome.processed);
    QVERIFY(m_display->shown.empty());
    QVERIFY(m_speech->spoken.isEmpty());
    QVERIFY(history().empty());
}

void TriggerHandlerTest::emptyEnterEventIsIgnored()
{
    auto handler = makeHandler();
    const auto outcome = handler.handle(enter({}));

    QVERIFY(!outcome.processed);
    QVERIFY(m_display->shown.empty());
    QVERIFY(history().empty());
}

void TriggerHandlerTest::legacyTaskNameFallback()
{
    addGeofence(QStringLiteral("H"), QStringLiteral("Water plants"));
    const auto legacy = addTask(QStringLiteral("Water plants"), 2);
    const auto bound = addTask(QStringLiteral("Buy bread"), 4, QStringLiteral("G"));

    auto handler = makeHandler();
    const auto outcome = handler.handle(enter({ QStringLiteral("G"), QStringLiteral("H") }));

    QCOMPARE(outcome.candidateIds, (std::vector<data::TaskId>{ bound, legacy }));
    QCOMPARE(m_display->shown.front().body, QStringLiteral("Buy bread\nWater plants"));
    QCOMPARE(m_speech->spoken, (QStringList{ QStringLiteral("Buy bread"), QStringLiteral("Water plants") }));

    const auto records = history();
    QCOMPARE(records.size(), std::size_t(2));
    QStringList bodies;
    for (const auto &record : records) {
        bodies << record.body;
    }
    bodies.sort();
    QCOMPARE(bodies, (QStringList{ QStringLiteral("You have task: Buy bread"),
                                   QStringLiteral("You have task: Water plants") }));
}

void TriggerHandlerTest::legacyFallbackSkipsReferencedGeofence()
{
    addGeofence(QStringLiteral("H"), QStringLiteral("Water plants"));
    addTask(QStringLiteral("Water plants"), 2);
    const auto done = addTask(QStringLiteral("Repot cactus"), 3, QStringLiteral("H"));
    data::TaskRepository(*m_connection).setCompleted(done, true);

    auto handler = makeHandler();
    const auto outcome = handler.handle(enter({ QStringLiteral("H") }));

    QVERIFY(outcome.processed);
    QVERIFY(outcome.candidateIds.empty());
    QVERIFY(!outcome.alertShown);
    QVERIFY(m_speech->spoken.isEmpty());
}

void TriggerHandlerTest::staleActiveMarkerDoesNotSuppress()
{
    addTask(QStringLiteral("Z"), 1, QStringLiteral("G"));
    m_state->setActive(999, m_now);

    auto handler = makeHandler();
    auto outcome = handler.handle(enter({ QStringLiteral("G") }));

    QVERIFY(!outcome.preemptivelySuppressed);
    QVERIFY(outcome.alertShown);
    QVERIFY(outcome.queuedTaskIds.empty());

    // A known open task whose session was already closed does not count either.
    const auto ended = addTask(QStringLiteral("Y"), 5);
    m_state->setActive(ended, m_now.addSecs(-600));
    outcome = handler.handle(enter({ QStringLiteral("G") }));

    QVERIFY(!outcome.preemptivelySuppressed);
    QVERIFY(outcome.alertShown);
    QVERIFY(m_state->pendingTaskIds(m_now).empty());
}

void TriggerHandlerTest::snoozedTaskIsSkipped()
{
    const auto snoozed = addTask(QStringLiteral("Z"), 4, QStringLiteral("G"));
    m_state->addPending(snoozed, m_now.addSecs(5 * 60));

    auto handler = makeHandler();
    auto outcome = handler.handle(enter({ QStringLiteral("G") }));

    QVERIFY(outcome.processed);
    QVERIFY(outcome.candidateIds.empty());
    QCOMPARE(outcome.snoozedTaskIds, std::vector<data::TaskId>{ snoozed });
    QVERIFY(!outcome.alertShown);
    QVERIFY(m_display->shown.empty());
    QVERIFY(m_speech->spoken.isEmpty());

    m_now = m_now.addSecs(6 * 60);
    outcome = handler.handle(enter({ QStringLiteral("G") }));

    QCOMPARE(outcome.candidateIds, std::vector<data::TaskId>{ snoozed });
    QVERIFY(outcome.snoozedTaskIds.empty());
    QVERIFY(outcome.alertShown);
}

void TriggerHandlerTest::defaultSoundFillsIn()
{
    addTask(QStringLiteral("Z"), 3, QStringLiteral("G"));
    data::Task loud;
    loud.name = QStringLiteral("Alarm");
    loud.priority = 5;
    loud.geofenceId = QStringLiteral("H");
    loud.notificationSound = QStringLiteral("siren");
    addGeofence(QStringLiteral("H"));
    data::TaskRepository(*m_connection).addTask(loud);

    TriggerOptions options;
    options.defaultSound = QStringLiteral("chime");
    auto handler = makeHandler(options);

    handler.handle(enter({ QStringLiteral("G") }));
    handler.handle(enter({ QStringLiteral("H") }));

    QCOMPARE(m_display->shown.size(), std::size_t(2));
    QCOMPARE(m_display->shown.at(0).sound, QStringLiteral("chime"));
    QCOMPARE(m_display->shown.at(1).sound, QStringLiteral("siren"));
}

void TriggerHandlerTest::historyFailureReconnectsOnceAndContinues()
{
    addGeofence(QStringLiteral("G1"));
    addGeofence(QStringLiteral("G2"));
    m_connection->execute(QStringLiteral(
        "CREATE TRIGGER reject_g1 BEFORE INSERT ON notification_history WHEN NEW.geofence_id = 'G1' "
        "BEGIN SELECT RAISE(ABORT, 'rejected'); END"));

    auto handler = makeHandler();
    const auto outcome = handler.handle(enter({ QStringLiteral("G1"), QStringLiteral("G2") }));

    QVERIFY(outcome.processed);
    QCOMPARE(outcome.historyReconnects, 1);
    QCOMPARE(outcome.historyRecordsSaved, 1);
    const auto records = history();
    QCOMPARE(records.size(), std::size_t(1));
    QCOMPARE(records.front().geofenceId, QStringLiteral("G2"));
}

void TriggerHandlerTest::nothingDueStillRecordsHistory()
{
    data::Task task;
    task.name = QStringLiteral("Sunday market");
    task.geofenceId = QStringLiteral("G");
    task.isRecurring = true;
    task.recurrence = data::RecurrencePattern::weekly({ 7 });
    data::TaskRepository(*m_connection).addTask(task);

    auto handler = makeHandler();
    const auto outcome = handler.handle(enter({ QStringLiteral("G") }));

    QVERIFY(outcome.processed);
    QVERIFY(outcome.candidateIds.empty());
    QVERIFY(!outcome.alertShown);
    QVERIFY(m_display->shown.empty());
    QVERIFY(m_speech->spoken.isEmpty());

    const auto records = history();
    QCOMPARE(records.size(), std::size_t(1));
    QCOMPARE(records.front().body, QStringLiteral("Event: enter for geofences: G"));
    QVERIFY(records.front().taskName.isEmpty());
}

void TriggerHandlerTest::speechFailureIsTolerated()
{
    addTask(QStringLiteral("Z"), 3, QStringLiteral("G"));
    m_speech->failOnSpeak = true;

    auto handler = makeHandler();
    const auto outcome = handler.handle(enter({ QStringLiteral("G") }));

    QVERIFY(outcome.alertShown);
    QVERIFY(outcome.spokenTexts.isEmpty());
    QCOMPARE(outcome.historyRecordsSaved, 1);
}

void TriggerHandlerTest::displayFailureIsTolerated()
{
    addTask(QStringLiteral("Z"), 3, QStringLiteral("G"));
    m_display->failOnShow = true;

    auto handler = makeHandler();
    const auto outcome = handler.handle(enter({ QStringLiteral("G") }));

    QVERIFY(!outcome.alertShown);
    QCOMPARE(outcome.spokenTexts, QStringList{ QStringLiteral("Z") });
    QCOMPARE(history().size(), std::size_t(1));
}

void TriggerHandlerTest::speechWaitIsBounded()
{
    addTask(QStringLiteral("Short"), 3, QStringLiteral("G"));
    m_speech->pollsPerUtterance = 3;

    auto handler = makeHandler();
    handler.handle(enter({ QStringLiteral("G") }));
    QCOMPARE(m_sleeps.size(), std::size_t(3));
    QCOMPARE(m_sleeps.front(), std::chrono::milliseconds(500));

    m_sleeps.clear();
    m_speech->pollsPerUtterance = 1000;
    handler.handle(enter({ QStringLiteral("G") }));
    // 10 s at 500 ms per poll.
    QCOMPARE(m_sleeps.size(), std::size_t(20));
}

void TriggerHandlerTest::unopenableDatabasePropagates()
{
    addTask(QStringLiteral("Z"), 3, QStringLiteral("G"));
    {
        QFile blocker(m_dir->filePath(QStringLiteral("blocker")));
        QVERIFY(blocker.open(QIODevice::WriteOnly));
    }
    auto options = testing::testDatabaseOptions(QDir(m_dir->filePath(QStringLiteral("blocker"))));
    data::Database unreachable(options);
    TriggerHandler handler(unreachable, *m_state, *m_directory, *m_display, *m_speech);

    QVERIFY_EXCEPTION_THROWN(handler.handle(enter({ QStringLiteral("G") })), data::StorageUnavailable);
    QVERIFY(m_display->shown.empty());
}

QTEST_GUILESS_MAIN(TriggerHandlerTest)
#include "TriggerHandlerTest.moc"
