#include <QtTest/QtTest>

#include "georemind/core/ActiveTaskState.hpp"
#include "georemind/data/SettingsKeyValueStore.hpp"

using namespace georemind;

class ActiveTaskStateTest : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void noActiveTaskInitially();
    void setAndClearActive();
    void markerVisibleThroughSecondStore();
    void malformedMarkerReadsAsNone();
    void pendingEntriesExpire();
    void removePending();

private:
    QString stateFile() const { return m_dir->filePath(QStringLiteral("state.ini")); }

    std::unique_ptr<QTemporaryDir> m_dir;
    std::unique_ptr<data::SettingsKeyValueStore> m_store;
};

void ActiveTaskStateTest::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
    m_store = std::make_unique<data::SettingsKeyValueStore>(stateFile());
}

void ActiveTaskStateTest::cleanup()
{
    m_store.reset();
    m_dir.reset();
}

void ActiveTaskStateTest::noActiveTaskInitially()
{
    core::ActiveTaskState state(*m_store);
    QVERIFY(!state.activeTask().has_value());
    QVERIFY(state.pendingTaskIds(QDateTime::currentDateTime()).empty());
}

void ActiveTaskStateTest::setAndClearActive()
{
    core::ActiveTaskState state(*m_store);
    const QDateTime started(QDate(2024, 5, 6), QTime(9, 15, 30, 250));
    state.setActive(7, started);

    const auto marker = state.activeTask();
    QVERIFY(marker.has_value());
    QCOMPARE(marker->taskId, data::TaskId(7));
    QCOMPARE(marker->startedAt, started);

    state.clearActive();
    QVERIFY(!state.activeTask().has_value());
}

void ActiveTaskStateTest::markerVisibleThroughSecondStore()
{
    core::ActiveTaskState writer(*m_store);
    writer.setActive(42, QDateTime::currentDateTime());

    data::SettingsKeyValueStore otherStore(stateFile());
    core::ActiveTaskState reader(otherStore);
    const auto marker = reader.activeTask();
    QVERIFY(marker.has_value());
    QCOMPARE(marker->taskId, data::TaskId(42));

    reader.clearActive();
    QVERIFY(!writer.activeTask().has_value());
}

void ActiveTaskStateTest::malformedMarkerReadsAsNone()
{
    m_store->setValue(QStringLiteral("active/taskId"), QStringLiteral("not-a-number"));
    core::ActiveTaskState state(*m_store);
    QVERIFY(!state.activeTask().has_value());
}

void ActiveTaskStateTest::pendingEntriesExpire()
{
    core::ActiveTaskState state(*m_store);
    const QDateTime now(QDate(2024, 5, 6), QTime(12, 0));
    state.addPending(9, now.addSecs(300));
    state.addPending(3, now.addSecs(60));
    state.addPending(5, now.addSecs(-1));

    const auto live = state.pendingTaskIds(now);
    QCOMPARE(live, (std::vector<data::TaskId>{ 3, 9 }));
    QVERIFY(!m_store->value(QStringLiteral("pending/5")).isValid());

    QCOMPARE(state.pendingTaskIds(now.addSecs(120)), std::vector<data::TaskId>{ 9 });
    QVERIFY(state.pendingTaskIds(now.addSecs(600)).empty());
    QVERIFY(m_store->childKeys(QStringLiteral("pending")).isEmpty());
}

void ActiveTaskStateTest::removePending()
{
    core::ActiveTaskState state(*m_store);
    const QDateTime now = QDateTime::currentDateTime();
    state.addPending(11, now.addSecs(300));

    QVERIFY(state.removePending(11));
    QVERIFY(!state.removePending(11));
    QVERIFY(state.pendingTaskIds(now).empty());
}

QTEST_GUILESS_MAIN(ActiveTaskStateTest)
#include "ActiveTaskStateTest.moc"
