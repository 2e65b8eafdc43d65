#include <QtTest/QtTest>

#include "georemind/data/Database.hpp"
#include "georemind/data/NotificationHistoryRepository.hpp"
#include "georemind/data/TaskHistoryRepository.hpp"
#include "support/TestDoubles.hpp"

using namespace georemind;
using namespace georemind::data;

namespace {
const QDateTime kMorning(QDate(2024, 5, 6), QTime(9, 0));

TaskHistoryEntry sessionFor(TaskId taskId, const QDateTime &start)
{
    TaskHistoryEntry entry;
    entry.taskId = taskId;
    entry.taskName = QStringLiteral("Task %1").arg(taskId);
    entry.taskPriority = 3;
    entry.startTime = start;
    entry.geofenceId = QStringLiteral("G");
    return entry;
}
} // namespace

class HistoryRepositoryTest : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void closeEntryRecordsDuration();
    void oneOpenEntryPerTask();
    void perTaskAggregates();
    void pagesAreNewestFirst();
    void groupsByCompletionDate();
    void notificationInsertIsIdempotent();
    void notificationHistoryNewestFirstAndClear();

private:
    std::unique_ptr<QTemporaryDir> m_dir;
    std::unique_ptr<Database> m_database;
    std::unique_ptr<Connection> m_connection;
};

void HistoryRepositoryTest::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
    m_database = std::make_unique<Database>(testing::testDatabaseOptions(QDir(m_dir->path())));
    m_connection = m_database->openConnection();
}

void HistoryRepositoryTest::cleanup()
{
    m_connection.reset();
    m_database.reset();
    m_dir.reset();
}

void HistoryRepositoryTest::closeEntryRecordsDuration()
{
    TaskHistoryRepository repo(*m_connection);
    const auto opened = repo.openEntry(sessionFor(1, kMorning));
    QVERIFY(opened.id.has_value());
    QVERIFY(opened.isOpen());

    const auto open = repo.findOpenEntry(1);
    QVERIFY(open.has_value());
    QCOMPARE(open->id, opened.id);

    QVERIFY(repo.closeEntry(*opened.id, kMorning.addSecs(25 * 60)));
    QVERIFY(!repo.findOpenEntry(1).has_value());
    // Closed entries never change again.
    QVERIFY(!repo.closeEntry(*opened.id, kMorning.addSecs(3600)));

    const auto entries = repo.fetchForTask(1);
    QCOMPARE(entries.size(), std::size_t(1));
    QCOMPARE(entries.front().durationSeconds, qint64(25 * 60));
    QCOMPARE(entries.front().completionDate, kMorning.date());
    QCOMPARE(entries.front().endTime, kMorning.addSecs(25 * 60));
}

void HistoryRepositoryTest::oneOpenEntryPerTask()
{
    TaskHistoryRepository repo(*m_connection);
    repo.openEntry(sessionFor(1, kMorning));
    try {
        repo.openEntry(sessionFor(1, kMorning.addSecs(60)));
        QFAIL("second open entry for the same task was accepted");
    } catch (const StorageError &error) {
        QCOMPARE(error.kind(), StorageErrorKind::Constraint);
    }

    // Other tasks and closed entries are unaffected.
    QVERIFY(repo.openEntry(sessionFor(2, kMorning)).id.has_value());
    QVERIFY(repo.closeEntry(*repo.findOpenEntry(1)->id, kMorning.addSecs(120)));
    QVERIFY(repo.openEntry(sessionFor(1, kMorning.addSecs(600))).id.has_value());
}

void HistoryRepositoryTest::perTaskAggregates()
{
    TaskHistoryRepository repo(*m_connection);
    QCOMPARE(repo.totalTimeSpent(1), qint64(0));
    QCOMPARE(repo.completionCount(1), 0);
    QVERIFY(!repo.lastCompletionTime(1).has_value());

    auto first = repo.openEntry(sessionFor(1, kMorning));
    repo.closeEntry(*first.id, kMorning.addSecs(600));
    auto second = repo.openEntry(sessionFor(1, kMorning.addDays(1)));
    repo.closeEntry(*second.id, kMorning.addDays(1).addSecs(300));
    repo.openEntry(sessionFor(1, kMorning.addDays(2)));

    QCOMPARE(repo.totalTimeSpent(1), qint64(900));
    QCOMPARE(repo.completionCount(1), 2);
    QCOMPARE(repo.lastCompletionTime(1), std::optional<QDateTime>(kMorning.addDays(1).addSecs(300)));

    QVERIFY(repo.removeEntry(*second.id));
    QCOMPARE(repo.completionCount(1), 1);
}

void HistoryRepositoryTest::pagesAreNewestFirst()
{
    TaskHistoryRepository repo(*m_connection);
    for (int i = 0; i < 5; ++i) {
        const auto entry = repo.openEntry(sessionFor(i + 1, kMorning.addSecs(i * 3600)));
        repo.closeEntry(*entry.id, kMorning.addSecs(i * 3600 + 60));
    }
    repo.openEntry(sessionFor(99, kMorning));

    QCOMPARE(repo.totalCount(), 5);
    const auto firstPage = repo.fetchPage(2, 0);
    QCOMPARE(firstPage.size(), std::size_t(2));
    QCOMPARE(firstPage[0].taskId, std::optional<TaskId>(5));
    QCOMPARE(firstPage[1].taskId, std::optional<TaskId>(4));

    const auto lastPage = repo.fetchPage(2, 4);
    QCOMPARE(lastPage.size(), std::size_t(1));
    QCOMPARE(lastPage[0].taskId, std::optional<TaskId>(1));
    QVERIFY(repo.fetchPage(2, 10).empty());
}

void HistoryRepositoryTest::groupsByCompletionDate()
{
    TaskHistoryRepository repo(*m_connection);
    for (int day = 0; day < 3; ++day) {
        for (int task = 1; task <= day + 1; ++task) {
            const auto entry = repo.openEntry(sessionFor(task, kMorning.addDays(day)));
            repo.closeEntry(*entry.id, kMorning.addDays(day).addSecs(60));
        }
    }

    const auto grouped = repo.groupByCompletionDate(kMorning.date().addDays(1), kMorning.date().addDays(2));
    QCOMPARE(grouped.size(), 2);
    QCOMPARE(grouped.value(kMorning.date().addDays(1)).size(), std::size_t(2));
    QCOMPARE(grouped.value(kMorning.date().addDays(2)).size(), std::size_t(3));
    QVERIFY(!grouped.contains(kMorning.date()));
}

void HistoryRepositoryTest::notificationInsertIsIdempotent()
{
    NotificationHistoryRepository repo(*m_connection);
    NotificationRecord record;
    record.notificationId = 1234;
    record.geofenceId = QStringLiteral("G");
    record.eventType = QStringLiteral("enter");
    record.body = QStringLiteral("You have task: Buy milk");

    QVERIFY(repo.insert(record));
    QVERIFY(!repo.insert(record));

    record.geofenceId = QStringLiteral("H");
    QVERIFY(repo.insert(record));
    QCOMPARE(repo.fetchAll().size(), std::size_t(2));
}

void HistoryRepositoryTest::notificationHistoryNewestFirstAndClear()
{
    NotificationHistoryRepository repo(*m_connection);
    for (int i = 0; i < 3; ++i) {
        NotificationRecord record;
        record.notificationId = 100 + i;
        record.geofenceId = QStringLiteral("G");
        record.taskName = QStringLiteral("Task %1").arg(i);
        record.eventType = QStringLiteral("enter");
        record.body = QStringLiteral("You have task: Task %1").arg(i);
        record.timestamp = kMorning.addSecs(i * 60);
        repo.insert(record);
    }

    const auto records = repo.fetchAll();
    QCOMPARE(records.size(), std::size_t(3));
    QCOMPARE(records.front().notificationId, 102);
    QCOMPARE(records.front().timestamp, kMorning.addSecs(120));
    QCOMPARE(records.back().taskName, QStringLiteral("Task 0"));

    QCOMPARE(repo.clearAll(), 3);
    QVERIFY(repo.fetchAll().empty());
}

QTEST_GUILESS_MAIN(HistoryRepositoryTest)
#include "HistoryRepositoryTest.moc"
