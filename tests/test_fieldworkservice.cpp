/**
 * @file test_fieldworkservice.cpp
 * @brief Unit tests for FieldworkService
 *
 * Tests that each reviewer operation writes the record and queues its sync
 * entry together, and the read helpers the capture screens use.
 */

#include <QtTest/QtTest>
#include <QTemporaryDir>
#include <QSignalSpy>
#include "faketransport.h"
#include "store/fieldworkstore.h"
#include "sync/syncengine.h"
#include "fieldwork/fieldworkservice.h"

using namespace FieldSync;

class TestFieldworkService : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    // ========== Checklist Tests ==========
    void testInitializeChecklist();
    void testInitializeKeepsExisting();
    void testChecklistOrdering();
    void testCompleteChecklistItem();
    void testUncompleteChecklistItem();
    void testUpdateMissingItem();
    void testChecklistProgress();

    // ========== Evidence Tests ==========
    void testAddEvidence();
    void testAddEvidenceNeedsItem();
    void testAddEvidenceRolledBackWhenQueueFails();
    void testCallerStatusIgnored();
    void testAnnotateEvidence();
    void testAnnotateRefusedWhileSyncing();
    void testRemoveEvidence();

    // ========== Draft Finding Tests ==========
    void testCreateDraftFinding();
    void testUpdateDraftFinding();
    void testDraftFindingValidation();
    void testDeleteDraftFinding();

    // ========== Session Tests ==========
    void testSessionLifecycle();

    // ========== End-to-end Tests ==========
    void testCaptureThenSync();

private:
    QList<ChecklistItem> templateItems() const;
    FieldEvidence photoFor(const QString &itemId) const;

    QTemporaryDir *m_tempDir = nullptr;
    FieldworkStore *m_store = nullptr;
    FakeTransport *m_transport = nullptr;
    SyncEngine *m_engine = nullptr;
    FieldworkService *m_service = nullptr;
};

void TestFieldworkService::init()
{
    m_tempDir = new QTemporaryDir();
    QVERIFY(m_tempDir->isValid());

    m_store = new FieldworkStore(m_tempDir->filePath("fieldwork.db"));
    QVERIFY(m_store->open());

    m_transport = new FakeTransport();
    m_engine = new SyncEngine(m_store, SyncHandlerSet::createDefault(m_store, m_transport));
    m_engine->setSleepFunction([](int) {});
    m_service = new FieldworkService(m_store, m_engine);
}

void TestFieldworkService::cleanup()
{
    delete m_service;
    delete m_engine;
    delete m_transport;
    delete m_store;
    delete m_tempDir;
    m_service = nullptr;
    m_engine = nullptr;
    m_transport = nullptr;
    m_store = nullptr;
    m_tempDir = nullptr;
}

QList<ChecklistItem> TestFieldworkService::templateItems() const
{
    QList<ChecklistItem> items;

    ChecklistItem debrief;
    debrief.id = "item-3";
    debrief.label = "Debrief with the accountable manager";
    debrief.phase = ChecklistPhase::PostVisit;
    debrief.sortOrder = 1;
    items << debrief;

    ChecklistItem walk;
    walk.id = "item-2";
    walk.label = "Walk the movement area";
    walk.phase = ChecklistPhase::OnSite;
    walk.sortOrder = 2;
    items << walk;

    ChecklistItem docs;
    docs.id = "item-1";
    docs.label = "Request the aerodrome manual";
    docs.phase = ChecklistPhase::PreVisit;
    docs.sortOrder = 1;
    items << docs;

    ChecklistItem lighting;
    lighting.id = "item-4";
    lighting.label = "Check the apron lighting";
    lighting.phase = ChecklistPhase::OnSite;
    lighting.sortOrder = 1;
    items << lighting;

    return items;
}

FieldEvidence TestFieldworkService::photoFor(const QString &itemId) const
{
    FieldEvidence evidence;
    evidence.checklistItemId = itemId;
    evidence.type = EvidenceType::Photo;
    evidence.blob = QByteArray(3000, 'p');
    evidence.mimeType = "image/jpeg";
    evidence.fileName = "apron.jpg";
    return evidence;
}

// ========== Checklist Tests ==========

void TestFieldworkService::testInitializeChecklist()
{
    QList<ChecklistItem> items = m_service->initializeChecklist("review-1", templateItems());
    QCOMPARE(items.size(), 4);

    for (const ChecklistItem &item : items) {
        QCOMPARE(item.reviewId, QString("review-1"));
        QCOMPARE(item.syncStatus, SyncStatus::Synced);
        QVERIFY(item.updatedAt.isValid());
    }

    // Template items mirror the server, nothing to push
    QVERIFY(m_store->queueEntries().isEmpty());
}

void TestFieldworkService::testInitializeKeepsExisting()
{
    m_service->initializeChecklist("review-1", templateItems());
    QVERIFY(m_service->completeChecklistItem("item-2", "user-1"));

    QList<ChecklistItem> again = m_service->initializeChecklist("review-1", QList<ChecklistItem>());
    QCOMPARE(again.size(), 4);
    QVERIFY(m_store->checklistItem("item-2").isCompleted);
}

void TestFieldworkService::testChecklistOrdering()
{
    m_service->initializeChecklist("review-1", templateItems());

    QStringList ids;
    for (const ChecklistItem &item : m_service->checklistForReview("review-1")) {
        ids << item.id;
    }
    QCOMPARE(ids, QStringList({"item-1", "item-4", "item-2", "item-3"}));
}

void TestFieldworkService::testCompleteChecklistItem()
{
    m_service->initializeChecklist("review-1", templateItems());
    QVERIFY(m_service->completeChecklistItem("item-1", "user-7"));

    ChecklistItem item = m_store->checklistItem("item-1");
    QVERIFY(item.isCompleted);
    QVERIFY(item.completedAt.isValid());
    QCOMPARE(item.completedById, QString("user-7"));
    QCOMPARE(item.syncStatus, SyncStatus::Pending);

    QList<SyncQueueEntry> entries = m_store->queueEntries();
    QCOMPARE(entries.size(), 1);
    QCOMPARE(entries.first().entityType, EntityType::ChecklistItem);
    QCOMPARE(entries.first().action, SyncAction::Update);
    QJsonObject payload = QJsonDocument::fromJson(entries.first().payload).object();
    QCOMPARE(payload["isCompleted"].toBool(), true);
}

void TestFieldworkService::testUncompleteChecklistItem()
{
    m_service->initializeChecklist("review-1", templateItems());
    m_service->completeChecklistItem("item-1", "user-7");
    QVERIFY(m_service->completeChecklistItem("item-1", "user-7", false));

    ChecklistItem item = m_store->checklistItem("item-1");
    QVERIFY(!item.isCompleted);
    QVERIFY(!item.completedAt.isValid());
    QVERIFY(item.completedById.isEmpty());
    QCOMPARE(m_store->queueEntries().size(), 2);
}

void TestFieldworkService::testUpdateMissingItem()
{
    ChecklistItem ghost;
    ghost.id = "missing";

    QSignalSpy errorSpy(m_service, &FieldworkService::errorOccurred);
    QVERIFY(!m_service->updateChecklistItem(ghost));
    QVERIFY(!m_service->completeChecklistItem("missing", "user-1"));
    QCOMPARE(errorSpy.count(), 2);
    QVERIFY(m_service->lastError().contains("missing"));
    QVERIFY(m_store->queueEntries().isEmpty());
}

void TestFieldworkService::testChecklistProgress()
{
    QCOMPARE(m_service->checklistProgress("review-1").percentage, 0);

    QList<ChecklistItem> items = templateItems();
    items.removeLast();
    m_service->initializeChecklist("review-1", items);
    m_service->completeChecklistItem("item-1", "user-1");

    ChecklistProgress progress = m_service->checklistProgress("review-1");
    QCOMPARE(progress.total, 3);
    QCOMPARE(progress.completed, 1);
    QCOMPARE(progress.percentage, 33);

    m_service->completeChecklistItem("item-2", "user-1");
    QCOMPARE(m_service->checklistProgress("review-1").percentage, 67);
}

// ========== Evidence Tests ==========

void TestFieldworkService::testAddEvidence()
{
    m_service->initializeChecklist("review-1", templateItems());

    QString id = m_service->addEvidence(photoFor("item-4"));
    QVERIFY(!id.isEmpty());

    FieldEvidence stored = m_store->evidence(id);
    QCOMPARE(stored.reviewId, QString("review-1"));
    QCOMPARE(stored.fileSize, qint64(3000));
    QVERIFY(stored.capturedAt.isValid());
    QCOMPARE(stored.syncStatus, SyncStatus::Pending);

    QList<SyncQueueEntry> entries = m_store->queueEntriesForEntity(EntityType::FieldEvidence, id);
    QCOMPARE(entries.size(), 1);
    QCOMPARE(entries.first().action, SyncAction::Create);
    QVERIFY(!entries.first().payload.contains("blob"));

    QCOMPARE(m_service->evidenceForChecklistItem("item-4").size(), 1);
}

void TestFieldworkService::testCallerStatusIgnored()
{
    m_service->initializeChecklist("review-1", templateItems());

    // Whatever status the caller hands in, the queue decides
    FieldEvidence photo = photoFor("item-2");
    photo.syncStatus = SyncStatus::Synced;
    QString evidenceId = m_service->addEvidence(photo);
    QVERIFY(!evidenceId.isEmpty());
    QCOMPARE(m_store->evidence(evidenceId).syncStatus, SyncStatus::Pending);

    DraftFinding finding;
    finding.reviewId = "review-1";
    finding.title = "Fuel farm signage missing";
    finding.syncStatus = SyncStatus::Failed;
    QString findingId = m_service->saveDraftFinding(finding);
    QVERIFY(!findingId.isEmpty());
    QCOMPARE(m_store->draftFinding(findingId).syncStatus, SyncStatus::Pending);
}

void TestFieldworkService::testAddEvidenceNeedsItem()
{
    QVERIFY(m_service->addEvidence(photoFor("no-such-item")).isEmpty());

    m_service->initializeChecklist("review-1", templateItems());
    FieldEvidence empty = photoFor("item-1");
    empty.blob.clear();
    QVERIFY(m_service->addEvidence(empty).isEmpty());
    QVERIFY(m_store->queueEntries().isEmpty());
}

void TestFieldworkService::testAddEvidenceRolledBackWhenQueueFails()
{
    m_service->initializeChecklist("review-1", templateItems());

    // An engine that cannot queue anything
    SyncEngine broken(nullptr, SyncHandlerSet());
    FieldworkService service(m_store, &broken);

    FieldEvidence photo = photoFor("item-1");
    photo.id = "ev-orphan";
    QVERIFY(service.addEvidence(photo).isEmpty());
    QVERIFY(!m_store->evidence("ev-orphan").isValid());
}

void TestFieldworkService::testAnnotateEvidence()
{
    m_service->initializeChecklist("review-1", templateItems());
    QString id = m_service->addEvidence(photoFor("item-4"));

    QByteArray annotated(3500, 'a');
    QVERIFY(m_service->annotateEvidence(id, annotated, "Cracked lens circled", QByteArray("thumb")));

    FieldEvidence stored = m_store->evidence(id);
    QCOMPARE(stored.blob, annotated);
    QCOMPARE(stored.annotation, QString("Cracked lens circled"));

    QList<SyncQueueEntry> entries = m_store->queueEntriesForEntity(EntityType::FieldEvidence, id);
    QCOMPARE(entries.size(), 2);
    QCOMPARE(entries.last().action, SyncAction::Update);

    QVERIFY(!m_service->annotateEvidence(id, QByteArray(), "empty"));
}

void TestFieldworkService::testAnnotateRefusedWhileSyncing()
{
    m_service->initializeChecklist("review-1", templateItems());
    QString id = m_service->addEvidence(photoFor("item-4"));
    QVERIFY(m_store->setSyncStatus(EntityType::FieldEvidence, id, SyncStatus::Syncing));

    QVERIFY(!m_service->annotateEvidence(id, QByteArray(10, 'a'), "late edit"));
    QCOMPARE(m_store->evidence(id).blob.size(), 3000);
}

void TestFieldworkService::testRemoveEvidence()
{
    m_service->initializeChecklist("review-1", templateItems());
    QString id = m_service->addEvidence(photoFor("item-4"));

    QVERIFY(m_service->removeEvidence(id));
    QVERIFY(m_store->evidence(id).markedForDeletion);
    QVERIFY(m_service->evidenceForChecklistItem("item-4").isEmpty());

    // A second remove does not queue another delete
    QVERIFY(m_service->removeEvidence(id));
    QCOMPARE(m_store->queueEntriesForEntity(EntityType::FieldEvidence, id).size(), 2);

    QVERIFY(!m_service->annotateEvidence(id, QByteArray(10, 'a'), "too late"));
    QVERIFY(!m_service->removeEvidence("missing"));
}

// ========== Draft Finding Tests ==========

void TestFieldworkService::testCreateDraftFinding()
{
    DraftFinding finding;
    finding.reviewId = "review-1";
    finding.title = "Runway markings faded";
    finding.severity = FindingSeverity::Major;

    QString id = m_service->saveDraftFinding(finding);
    QVERIFY(!id.isEmpty());

    DraftFinding stored = m_store->draftFinding(id);
    QVERIFY(stored.createdAt.isValid());
    QCOMPARE(stored.syncStatus, SyncStatus::Pending);

    QList<SyncQueueEntry> entries = m_store->queueEntriesForEntity(EntityType::DraftFinding, id);
    QCOMPARE(entries.size(), 1);
    QCOMPARE(entries.first().action, SyncAction::Create);
    QCOMPARE(m_service->draftFindingsForReview("review-1").size(), 1);
}

void TestFieldworkService::testUpdateDraftFinding()
{
    DraftFinding finding;
    finding.reviewId = "review-1";
    finding.title = "Runway markings faded";
    QString id = m_service->saveDraftFinding(finding);
    QDateTime created = m_store->draftFinding(id).createdAt;

    finding.id = id;
    finding.description = "Threshold markings on 09 barely visible";
    QCOMPARE(m_service->saveDraftFinding(finding), id);

    DraftFinding stored = m_store->draftFinding(id);
    QCOMPARE(stored.description, QString("Threshold markings on 09 barely visible"));
    QCOMPARE(stored.createdAt, created);

    QList<SyncQueueEntry> entries = m_store->queueEntriesForEntity(EntityType::DraftFinding, id);
    QCOMPARE(entries.size(), 2);
    QCOMPARE(entries.last().action, SyncAction::Update);

    // An unknown client id is a create
    finding.id = "client-chosen";
    QCOMPARE(m_service->saveDraftFinding(finding), QString("client-chosen"));
    QCOMPARE(m_store->queueEntriesForEntity(EntityType::DraftFinding, "client-chosen").first().action,
             SyncAction::Create);
}

void TestFieldworkService::testDraftFindingValidation()
{
    DraftFinding noReview;
    noReview.title = "Orphan";
    QVERIFY(m_service->saveDraftFinding(noReview).isEmpty());

    DraftFinding noTitle;
    noTitle.reviewId = "review-1";
    noTitle.title = "  ";
    QVERIFY(m_service->saveDraftFinding(noTitle).isEmpty());

    QVERIFY(m_store->queueEntries().isEmpty());
}

void TestFieldworkService::testDeleteDraftFinding()
{
    DraftFinding finding;
    finding.reviewId = "review-1";
    finding.title = "Fence gap";
    QString id = m_service->saveDraftFinding(finding);

    QVERIFY(m_service->deleteDraftFinding(id));
    QVERIFY(m_store->draftFinding(id).markedForDeletion);
    QVERIFY(m_service->draftFindingsForReview("review-1").isEmpty());
    QCOMPARE(m_store->queueEntriesForEntity(EntityType::DraftFinding, id).last().action, SyncAction::Delete);

    finding.id = id;
    QVERIFY(m_service->saveDraftFinding(finding).isEmpty());
    QVERIFY(!m_service->deleteDraftFinding("missing"));
}

// ========== Session Tests ==========

void TestFieldworkService::testSessionLifecycle()
{
    QVERIFY(m_service->startSession(QString(), "user-1").isEmpty());

    QString id = m_service->startSession("review-1", "user-1", "Rugged tablet");
    QVERIFY(!id.isEmpty());
    QVERIFY(m_store->session(id).isOpen());

    QVERIFY(m_service->endSession(id));
    QVERIFY(!m_store->session(id).isOpen());

    // Ending twice does not queue again
    QVERIFY(m_service->endSession(id));
    QList<SyncQueueEntry> entries = m_store->queueEntriesForEntity(EntityType::OfflineSession, id);
    QCOMPARE(entries.size(), 2);
    QCOMPARE(entries.first().action, SyncAction::Create);
    QCOMPARE(entries.last().action, SyncAction::Update);
}

// ========== End-to-end Tests ==========

void TestFieldworkService::testCaptureThenSync()
{
    m_service->initializeChecklist("review-1", templateItems());
    QString sessionId = m_service->startSession("review-1", "user-1");
    m_service->completeChecklistItem("item-4", "user-1");
    QString evidenceId = m_service->addEvidence(photoFor("item-4"));

    DraftFinding finding;
    finding.reviewId = "review-1";
    finding.title = "Apron light out";
    finding.evidenceIds = {evidenceId};
    QString findingId = m_service->saveDraftFinding(finding);

    QCOMPARE(m_engine->processQueue(), 4);
    QVERIFY(m_store->queueEntries().isEmpty());

    QCOMPARE(m_store->checklistItem("item-4").syncStatus, SyncStatus::Synced);
    QCOMPARE(m_store->evidence(evidenceId).syncStatus, SyncStatus::Synced);
    QCOMPARE(m_store->draftFinding(findingId).syncStatus, SyncStatus::Synced);
    QVERIFY(m_store->session(sessionId).syncedAt.isValid());
    QCOMPARE(m_transport->callCount("upload"), 1);
}

QTEST_MAIN(TestFieldworkService)
#include "test_fieldworkservice.moc"
