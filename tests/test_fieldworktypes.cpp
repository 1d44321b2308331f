/**
 * @file test_fieldworktypes.cpp
 * @brief Unit tests for the fieldwork record types
 *
 * Tests enum string conversion and the JSON snapshots used as queue
 * payloads.
 */

#include <QtTest/QtTest>
#include <QJsonArray>
#include "store/fieldworktypes.h"

using namespace FieldSync;

class TestFieldworkTypes : public QObject
{
    Q_OBJECT

private slots:
    // ========== Enum Conversion Tests ==========
    void testSyncStatusStrings();
    void testEntityTypeUnknown();
    void testSyncActionCaseInsensitive();
    void testEvidenceTypeStrings();

    // ========== Timestamp Tests ==========
    void testIsoStringUtcWithMs();
    void testIsoStringInvalid();

    // ========== Record JSON Tests ==========
    void testChecklistItemJson();
    void testChecklistItemFromJson();
    void testEvidenceMetadataHasNoBlob();
    void testDraftFindingJson();
    void testDraftFindingFromJson();
    void testOfflineSessionOpenEnded();

    // ========== Queue Entry Tests ==========
    void testQueueEntryExhausted();
    void testStatusSummary();
};

// ========== Enum Conversion Tests ==========

void TestFieldworkTypes::testSyncStatusStrings()
{
    const QList<SyncStatus> all = {SyncStatus::Pending, SyncStatus::Syncing, SyncStatus::Synced,
                                   SyncStatus::Failed, SyncStatus::Conflict};
    for (SyncStatus status : all) {
        bool ok = false;
        QCOMPARE(syncStatusFromString(syncStatusToString(status), &ok), status);
        QVERIFY(ok);
    }
    QCOMPARE(syncStatusToString(SyncStatus::Conflict), QString("conflict"));
}

void TestFieldworkTypes::testEntityTypeUnknown()
{
    bool ok = true;
    entityTypeFromString("inspectionReport", &ok);
    QVERIFY(!ok);

    QCOMPARE(entityTypeToString(EntityType::FieldEvidence), QString("fieldEvidence"));
    QCOMPARE(entityTypeFromString("draftFinding", &ok), EntityType::DraftFinding);
    QVERIFY(ok);
}

void TestFieldworkTypes::testSyncActionCaseInsensitive()
{
    bool ok = false;
    QCOMPARE(syncActionFromString("DELETE", &ok), SyncAction::Delete);
    QVERIFY(ok);
    QCOMPARE(syncActionToString(SyncAction::Create), QString("create"));
}

void TestFieldworkTypes::testEvidenceTypeStrings()
{
    QCOMPARE(evidenceTypeToString(EvidenceType::VoiceNote), QString("voice_note"));
    QCOMPARE(evidenceTypeFromString("document"), EvidenceType::Document);
    QCOMPARE(evidenceTypeFromString("garbage"), EvidenceType::Photo);
}

// ========== Timestamp Tests ==========

void TestFieldworkTypes::testIsoStringUtcWithMs()
{
    QDateTime dt(QDate(2024, 3, 5), QTime(14, 30, 15, 250), Qt::UTC);
    QString iso = toIsoString(dt);
    QCOMPARE(iso, QString("2024-03-05T14:30:15.250Z"));
    QCOMPARE(fromIsoString(iso), dt);
}

void TestFieldworkTypes::testIsoStringInvalid()
{
    QVERIFY(toIsoString(QDateTime()).isEmpty());
    QVERIFY(!fromIsoString(QString()).isValid());
    QVERIFY(!fromIsoString("not a date").isValid());
}

// ========== Record JSON Tests ==========

void TestFieldworkTypes::testChecklistItemJson()
{
    ChecklistItem item;
    item.id = "item-1";
    item.reviewId = "review-1";
    item.phase = ChecklistPhase::PreVisit;
    item.isCompleted = true;
    item.completedAt = QDateTime(QDate(2024, 1, 2), QTime(8, 0), Qt::UTC);
    item.notes = "Checked the apron lighting";
    item.updatedAt = QDateTime(QDate(2024, 1, 2), QTime(8, 5), Qt::UTC);

    QJsonObject json = item.toJson();
    QCOMPARE(json["phase"].toString(), QString("pre-visit"));
    QCOMPARE(json["isCompleted"].toBool(), true);
    QCOMPARE(json["clientUpdatedAt"].toString(), QString("2024-01-02T08:05:00.000Z"));
    QVERIFY(json["completedById"].isNull());
}

void TestFieldworkTypes::testChecklistItemFromJson()
{
    QJsonObject json;
    json["id"] = "item-2";
    json["reviewId"] = "review-1";
    json["phase"] = "post-visit";
    json["isCompleted"] = false;
    json["notes"] = "Follow up";
    json["clientUpdatedAt"] = "2024-01-02T08:05:00.000Z";

    ChecklistItem item = ChecklistItem::fromJson(json);
    QCOMPARE(item.id, QString("item-2"));
    QCOMPARE(item.phase, ChecklistPhase::PostVisit);
    QCOMPARE(item.notes, QString("Follow up"));
    QVERIFY(item.updatedAt.isValid());
    QVERIFY(!item.completedAt.isValid());
}

void TestFieldworkTypes::testEvidenceMetadataHasNoBlob()
{
    FieldEvidence evidence;
    evidence.id = "ev-1";
    evidence.checklistItemId = "item-1";
    evidence.blob = QByteArray(2048, 'x');
    evidence.thumbnail = QByteArray(64, 't');
    evidence.fileName = "runway.jpg";
    evidence.fileSize = 2048;
    evidence.gps.valid = true;
    evidence.gps.latitude = 45.5;
    evidence.gps.longitude = -73.6;

    QJsonObject meta = evidence.metadataJson();
    QVERIFY(!meta.contains("blob"));
    QVERIFY(!meta.contains("thumbnail"));
    QCOMPARE(meta["fileSize"].toInteger(), qint64(2048));
    QCOMPARE(meta["gpsLatitude"].toDouble(), 45.5);
    QVERIFY(meta["gpsAccuracy"].isNull());
}

void TestFieldworkTypes::testDraftFindingJson()
{
    DraftFinding finding;
    finding.id = "f-1";
    finding.reviewId = "review-1";
    finding.title = "Expired fire extinguisher";
    finding.severity = FindingSeverity::Major;
    finding.evidenceIds = {"ev-1", "ev-2"};

    QJsonObject json = finding.toJson();
    QCOMPARE(json["clientId"].toString(), QString("f-1"));
    QCOMPARE(json["severity"].toString(), QString("MAJOR"));
    QCOMPARE(json["evidenceIds"].toArray().size(), 2);
    QVERIFY(json["questionId"].isNull());
    QVERIFY(json["gpsLatitude"].isNull());
}

void TestFieldworkTypes::testDraftFindingFromJson()
{
    QJsonObject json;
    json["clientId"] = "f-2";
    json["reviewId"] = "review-1";
    json["title"] = "Missing signage";
    json["severity"] = "CRITICAL";
    json["evidenceIds"] = QJsonArray{"ev-9"};
    json["gpsLatitude"] = 10.0;
    json["gpsLongitude"] = 20.0;

    DraftFinding finding = DraftFinding::fromJson(json);
    QCOMPARE(finding.id, QString("f-2"));
    QCOMPARE(finding.severity, FindingSeverity::Critical);
    QCOMPARE(finding.evidenceIds, QStringList{"ev-9"});
    QVERIFY(finding.gps.valid);
    QCOMPARE(finding.gps.longitude, 20.0);
}

void TestFieldworkTypes::testOfflineSessionOpenEnded()
{
    OfflineSession session;
    session.id = "s-1";
    session.reviewId = "review-1";
    session.startedAt = QDateTime::currentDateTimeUtc();
    QVERIFY(session.isOpen());
    QVERIFY(session.toJson()["endedAt"].isNull());

    session.endedAt = session.startedAt.addSecs(3600);
    QVERIFY(!session.isOpen());
    QCOMPARE(OfflineSession::fromJson(session.toJson()).endedAt, session.endedAt);
}

// ========== Queue Entry Tests ==========

void TestFieldworkTypes::testQueueEntryExhausted()
{
    SyncQueueEntry entry;
    entry.maxRetries = 3;
    entry.retryCount = 2;
    QVERIFY(!entry.isExhausted());
    entry.retryCount = 3;
    QVERIFY(entry.isExhausted());
}

void TestFieldworkTypes::testStatusSummary()
{
    SyncEngineStatus status;
    status.pending = 2;
    status.failed = 1;
    QCOMPARE(status.summary(), QString("Pending: 2, Failed: 1, Conflicts: 0, Last sync: never"));
}

QTEST_MAIN(TestFieldworkTypes)
#include "test_fieldworktypes.moc"
