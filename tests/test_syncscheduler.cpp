/**
 * @file test_syncscheduler.cpp
 * @brief Unit tests for SyncScheduler
 *
 * Tests the reconnect, periodic and cleanup triggers with short timer
 * intervals.
 */

#include <QtTest/QtTest>
#include <QTemporaryDir>
#include <QSignalSpy>
#include "faketransport.h"
#include "store/fieldworkstore.h"
#include "net/connectivitymonitor.h"
#include "storage/storagemanager.h"
#include "sync/syncengine.h"
#include "sync/syncscheduler.h"

using namespace FieldSync;

class TestSyncScheduler : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    // ========== Manual Sync Tests ==========
    void testSyncNowOnline();
    void testSyncNowOffline();

    // ========== Trigger Tests ==========
    void testStartDrainsWhenOnline();
    void testReconnectTrigger();
    void testOfflineCancelsReconnect();
    void testStoppedIgnoresConnectivity();
    void testPeriodicTrigger();

    // ========== Cleanup Tests ==========
    void testRunCleanup();
    void testDefaults();

private:
    void queueFinding(const QString &id);

    QTemporaryDir *m_tempDir = nullptr;
    FieldworkStore *m_store = nullptr;
    FakeTransport *m_transport = nullptr;
    SyncEngine *m_engine = nullptr;
    ConnectivityMonitor *m_monitor = nullptr;
    StorageManager *m_storage = nullptr;
    SyncScheduler *m_scheduler = nullptr;
};

void TestSyncScheduler::init()
{
    m_tempDir = new QTemporaryDir();
    QVERIFY(m_tempDir->isValid());

    m_store = new FieldworkStore(m_tempDir->filePath("fieldwork.db"));
    QVERIFY(m_store->open());

    m_transport = new FakeTransport();
    m_engine = new SyncEngine(m_store, SyncHandlerSet::createDefault(m_store, m_transport));
    m_engine->setSleepFunction([](int) {});
    m_monitor = new ConnectivityMonitor(m_transport);
    m_storage = new StorageManager(m_store);

    m_scheduler = new SyncScheduler(m_engine, m_monitor, m_storage);
    m_scheduler->setReconnectDelay(20);
}

void TestSyncScheduler::cleanup()
{
    delete m_scheduler;
    delete m_storage;
    delete m_monitor;
    delete m_engine;
    delete m_transport;
    delete m_store;
    delete m_tempDir;
    m_scheduler = nullptr;
    m_storage = nullptr;
    m_monitor = nullptr;
    m_engine = nullptr;
    m_transport = nullptr;
    m_store = nullptr;
    m_tempDir = nullptr;
}

void TestSyncScheduler::queueFinding(const QString &id)
{
    DraftFinding finding;
    finding.id = id;
    finding.reviewId = "review-1";
    finding.title = "Finding " + id;
    finding.createdAt = QDateTime::currentDateTimeUtc();
    finding.updatedAt = finding.createdAt;
    QVERIFY(m_store->putDraftFinding(finding));
    QVERIFY(!m_engine->enqueue(EntityType::DraftFinding, id, SyncAction::Create, finding.toJson()).isEmpty());
}

// ========== Manual Sync Tests ==========

void TestSyncScheduler::testSyncNowOnline()
{
    queueFinding("f-1");

    QSignalSpy spy(m_scheduler, &SyncScheduler::syncTriggered);
    QCOMPARE(m_scheduler->syncNow(), 1);
    QCOMPARE(spy.count(), 1);
    QCOMPARE(spy.at(0).at(0).toString(), QString("manual"));
}

void TestSyncScheduler::testSyncNowOffline()
{
    queueFinding("f-1");
    m_monitor->setPlatformOnline(false);

    QCOMPARE(m_scheduler->syncNow(), 0);
    QVERIFY(m_transport->calls.isEmpty());
    QCOMPARE(m_store->queueEntries().size(), 1);
}

// ========== Trigger Tests ==========

void TestSyncScheduler::testStartDrainsWhenOnline()
{
    queueFinding("f-1");

    QSignalSpy spy(m_scheduler, &SyncScheduler::syncTriggered);
    m_scheduler->start();
    QVERIFY(m_scheduler->isRunning());
    QVERIFY(m_scheduler->isReconnectPending());

    QTRY_COMPARE(spy.count(), 1);
    QCOMPARE(spy.at(0).at(0).toString(), QString("reconnect"));
    QVERIFY(m_store->queueEntries().isEmpty());
}

void TestSyncScheduler::testReconnectTrigger()
{
    m_monitor->setPlatformOnline(false);
    m_scheduler->start();
    QVERIFY(!m_scheduler->isReconnectPending());

    queueFinding("f-1");

    m_monitor->checkNow();
    QVERIFY(m_monitor->isOnline());
    QVERIFY(m_scheduler->isReconnectPending());

    QTRY_VERIFY(m_store->queueEntries().isEmpty());
    QCOMPARE(m_transport->calls.size(), 1);
}

void TestSyncScheduler::testOfflineCancelsReconnect()
{
    m_scheduler->setReconnectDelay(200);
    m_scheduler->start();
    QVERIFY(m_scheduler->isReconnectPending());

    m_monitor->setPlatformOnline(false);
    QVERIFY(!m_scheduler->isReconnectPending());
}

void TestSyncScheduler::testStoppedIgnoresConnectivity()
{
    m_monitor->setPlatformOnline(false);
    m_monitor->checkNow();
    QVERIFY(m_monitor->isOnline());
    QVERIFY(!m_scheduler->isReconnectPending());
}

void TestSyncScheduler::testPeriodicTrigger()
{
    m_scheduler->setReconnectDelay(60000);
    m_scheduler->setPeriodicInterval(30);

    QSignalSpy spy(m_scheduler, &SyncScheduler::syncTriggered);
    m_scheduler->start();
    queueFinding("f-1");

    QTRY_VERIFY(spy.count() >= 1);
    QCOMPARE(spy.at(0).at(0).toString(), QString("periodic"));

    m_scheduler->stop();
    QVERIFY(!m_scheduler->isRunning());
    QVERIFY(!m_scheduler->isReconnectPending());
}

// ========== Cleanup Tests ==========

void TestSyncScheduler::testRunCleanup()
{
    ChecklistItem oldItem;
    oldItem.id = "item-old";
    oldItem.reviewId = "review-1";
    oldItem.updatedAt = QDateTime::currentDateTimeUtc().addDays(-45);
    oldItem.syncStatus = SyncStatus::Synced;
    QVERIFY(m_store->putChecklistItem(oldItem));

    ChecklistItem freshItem = oldItem;
    freshItem.id = "item-fresh";
    freshItem.updatedAt = QDateTime::currentDateTimeUtc().addDays(-2);
    QVERIFY(m_store->putChecklistItem(freshItem));

    SyncQueueEntry expired;
    expired.id = "expired";
    expired.entityType = EntityType::DraftFinding;
    expired.entityId = "f-gone";
    expired.payload = "{}";
    expired.retryCount = 3;
    expired.maxRetries = 3;
    expired.lastAttempt = QDateTime::currentDateTimeUtc().addDays(-3);
    expired.createdAt = expired.lastAttempt;
    QVERIFY(m_store->addQueueEntry(expired));

    QSignalSpy spy(m_scheduler, &SyncScheduler::cleanupFinished);
    m_scheduler->runCleanup();

    QCOMPARE(spy.count(), 1);
    QCOMPARE(spy.at(0).at(0).toInt(), 1);
    QCOMPARE(spy.at(0).at(1).toInt(), 1);
    QVERIFY(!m_store->checklistItem("item-old").isValid());
    QVERIFY(m_store->checklistItem("item-fresh").isValid());
    QVERIFY(!m_store->queueEntry("expired").isValid());
}

void TestSyncScheduler::testDefaults()
{
    SyncScheduler scheduler(nullptr, nullptr, nullptr);
    QCOMPARE(scheduler.reconnectDelay(), SyncScheduler::DEFAULT_RECONNECT_DELAY_MS);
    QCOMPARE(scheduler.periodicInterval(), SyncScheduler::DEFAULT_PERIODIC_INTERVAL_MS);
    QCOMPARE(scheduler.retentionDays(), SyncScheduler::DEFAULT_RETENTION_DAYS);
    QCOMPARE(scheduler.syncNow(), 0);
}

QTEST_MAIN(TestSyncScheduler)
#include "test_syncscheduler.moc"
