#include "fieldworkservice.h"
#include "../store/fieldworkstore.h"
#include "../sync/syncengine.h"

#include <QUuid>
#include <QDebug>
#include <algorithm>
#include <cmath>

namespace FieldSync {

FieldworkService::FieldworkService(FieldworkStore *store, SyncEngine *engine, QObject *parent)
    : QObject(parent)
    , m_store(store)
    , m_engine(engine)
{
}

QString FieldworkService::newId()
{
    return QUuid::createUuid().toString(QUuid::WithoutBraces);
}

bool FieldworkService::fail(const QString &error)
{
    m_lastError = error;
    qWarning() << "[FieldworkService]" << error;
    emit errorOccurred(error);
    return false;
}

// ========== Checklist ==========

QList<ChecklistItem> FieldworkService::initializeChecklist(const QString &reviewId,
                                                           const QList<ChecklistItem> &templateItems)
{
    QList<ChecklistItem> existing = checklistForReview(reviewId);
    if (!existing.isEmpty()) {
        return existing;
    }

    QDateTime now = QDateTime::currentDateTimeUtc();
    QList<ChecklistItem> items;
    for (ChecklistItem item : templateItems) {
        if (item.id.isEmpty()) {
            item.id = newId();
        }
        item.reviewId = reviewId;
        if (!item.updatedAt.isValid()) {
            item.updatedAt = now;
        }
        // Mirrors the server copy, nothing to push yet
        item.syncStatus = SyncStatus::Synced;
        items.append(item);
    }

    bool ok = m_store->runInTransaction([&]() {
        for (const ChecklistItem &item : items) {
            if (!m_store->putChecklistItem(item)) {
                return false;
            }
        }
        return true;
    });

    if (!ok) {
        fail(QString("Failed to initialize checklist for review %1: %2")
            .arg(reviewId, m_store->lastErrorString()));
        return QList<ChecklistItem>();
    }

    emit logMessage(QString("Checklist initialized for review %1 (%2 items)")
        .arg(reviewId).arg(items.size()));
    return checklistForReview(reviewId);
}

QList<ChecklistItem> FieldworkService::checklistForReview(const QString &reviewId) const
{
    QList<ChecklistItem> items = m_store->checklistItems(RecordFilter::byReview(reviewId));
    std::stable_sort(items.begin(), items.end(), [](const ChecklistItem &a, const ChecklistItem &b) {
        if (a.phase != b.phase) {
            return static_cast<int>(a.phase) < static_cast<int>(b.phase);
        }
        return a.sortOrder < b.sortOrder;
    });
    return items;
}

bool FieldworkService::updateChecklistItem(const ChecklistItem &item)
{
    ChecklistItem stored = m_store->checklistItem(item.id);
    if (!stored.isValid()) {
        return fail(QString("Checklist item not found: %1").arg(item.id));
    }

    ChecklistItem updated = item;
    updated.reviewId = stored.reviewId;
    updated.syncStatus = stored.syncStatus;
    updated.updatedAt = QDateTime::currentDateTimeUtc();

    bool ok = m_store->runInTransaction([&]() {
        return m_store->putChecklistItem(updated)
            && !m_engine->enqueue(EntityType::ChecklistItem, updated.id,
                                  SyncAction::Update, updated.toJson()).isEmpty();
    });

    if (!ok) {
        return fail(QString("Failed to save checklist item %1: %2")
            .arg(item.id, m_store->lastErrorString()));
    }
    return true;
}

bool FieldworkService::completeChecklistItem(const QString &itemId, const QString &userId, bool completed)
{
    ChecklistItem item = m_store->checklistItem(itemId);
    if (!item.isValid()) {
        return fail(QString("Checklist item not found: %1").arg(itemId));
    }

    item.isCompleted = completed;
    if (completed) {
        item.completedAt = QDateTime::currentDateTimeUtc();
        item.completedById = userId;
    } else {
        item.completedAt = QDateTime();
        item.completedById.clear();
    }
    return updateChecklistItem(item);
}

ChecklistProgress FieldworkService::checklistProgress(const QString &reviewId) const
{
    ChecklistProgress progress;
    const QList<ChecklistItem> items = m_store->checklistItems(RecordFilter::byReview(reviewId));
    progress.total = items.size();
    for (const ChecklistItem &item : items) {
        if (item.isCompleted) {
            progress.completed++;
        }
    }
    if (progress.total > 0) {
        progress.percentage = static_cast<int>(std::lround(100.0 * progress.completed / progress.total));
    }
    return progress;
}

// ========== Evidence ==========

QString FieldworkService::addEvidence(FieldEvidence evidence)
{
    ChecklistItem item = m_store->checklistItem(evidence.checklistItemId);
    if (!item.isValid()) {
        fail(QString("Cannot attach evidence: checklist item %1 not found")
            .arg(evidence.checklistItemId));
        return QString();
    }
    if (evidence.blob.isEmpty()) {
        fail("Cannot attach evidence: no captured data");
        return QString();
    }

    if (evidence.id.isEmpty()) {
        evidence.id = newId();
    }
    if (evidence.reviewId.isEmpty()) {
        evidence.reviewId = item.reviewId;
    }
    if (!evidence.capturedAt.isValid()) {
        evidence.capturedAt = QDateTime::currentDateTimeUtc();
    }
    evidence.fileSize = evidence.blob.size();
    evidence.markedForDeletion = false;

    bool ok = m_store->runInTransaction([&]() {
        return m_store->putEvidence(evidence)
            && !m_engine->enqueue(EntityType::FieldEvidence, evidence.id,
                                  SyncAction::Create, evidence.metadataJson()).isEmpty();
    });

    if (!ok) {
        fail(QString("Failed to store evidence %1: %2")
            .arg(evidence.fileName, m_store->lastErrorString()));
        return QString();
    }

    emit logMessage(QString("Captured %1 %2 (%3 bytes)")
        .arg(evidenceTypeToString(evidence.type), evidence.fileName)
        .arg(evidence.fileSize));
    return evidence.id;
}

bool FieldworkService::annotateEvidence(const QString &evidenceId, const QByteArray &annotatedBlob,
                                        const QString &annotation, const QByteArray &thumbnail)
{
    FieldEvidence record = m_store->evidence(evidenceId);
    if (!record.isValid()) {
        return fail(QString("Evidence not found: %1").arg(evidenceId));
    }
    if (record.syncStatus == SyncStatus::Syncing) {
        return fail(QString("Evidence %1 is being uploaded and cannot be changed").arg(evidenceId));
    }
    if (record.markedForDeletion) {
        return fail(QString("Evidence %1 is marked for deletion").arg(evidenceId));
    }
    if (annotatedBlob.isEmpty()) {
        return fail("Annotated evidence has no data");
    }

    record.blob = annotatedBlob;
    record.thumbnail = thumbnail;
    record.annotation = annotation;
    record.fileSize = annotatedBlob.size();

    bool ok = m_store->runInTransaction([&]() {
        return m_store->updateEvidenceBlob(evidenceId, annotatedBlob, thumbnail, annotation)
            && !m_engine->enqueue(EntityType::FieldEvidence, evidenceId,
                                  SyncAction::Update, record.metadataJson()).isEmpty();
    });

    if (!ok) {
        return fail(QString("Failed to annotate evidence %1: %2")
            .arg(evidenceId, m_store->lastErrorString()));
    }
    return true;
}

bool FieldworkService::removeEvidence(const QString &evidenceId)
{
    FieldEvidence record = m_store->evidence(evidenceId);
    if (!record.isValid()) {
        return fail(QString("Evidence not found: %1").arg(evidenceId));
    }
    if (record.markedForDeletion) {
        return true;
    }

    record.markedForDeletion = true;

    bool ok = m_store->runInTransaction([&]() {
        return m_store->putEvidence(record)
            && !m_engine->enqueue(EntityType::FieldEvidence, evidenceId,
                                  SyncAction::Delete, record.metadataJson()).isEmpty();
    });

    if (!ok) {
        return fail(QString("Failed to remove evidence %1: %2")
            .arg(evidenceId, m_store->lastErrorString()));
    }
    return true;
}

QList<FieldEvidence> FieldworkService::evidenceForChecklistItem(const QString &checklistItemId,
                                                                bool withBlobs) const
{
    return m_store->evidenceRecords(RecordFilter::byChecklistItem(checklistItemId), withBlobs,
        [](const FieldEvidence &evidence) { return !evidence.markedForDeletion; });
}

// ========== Draft findings ==========

QString FieldworkService::saveDraftFinding(DraftFinding finding)
{
    if (finding.reviewId.isEmpty()) {
        fail("Draft finding needs a review");
        return QString();
    }
    if (finding.title.trimmed().isEmpty()) {
        fail("Draft finding needs a title");
        return QString();
    }

    QDateTime now = QDateTime::currentDateTimeUtc();
    SyncAction action = SyncAction::Update;

    DraftFinding stored = finding.id.isEmpty() ? DraftFinding() : m_store->draftFinding(finding.id);
    if (stored.isValid()) {
        if (stored.markedForDeletion) {
            fail(QString("Draft finding %1 is marked for deletion").arg(finding.id));
            return QString();
        }
        finding.createdAt = stored.createdAt;
        finding.syncStatus = stored.syncStatus;
    } else {
        action = SyncAction::Create;
        if (finding.id.isEmpty()) {
            finding.id = newId();
        }
        finding.createdAt = now;
    }
    finding.updatedAt = now;
    finding.markedForDeletion = false;

    bool ok = m_store->runInTransaction([&]() {
        return m_store->putDraftFinding(finding)
            && !m_engine->enqueue(EntityType::DraftFinding, finding.id,
                                  action, finding.toJson()).isEmpty();
    });

    if (!ok) {
        fail(QString("Failed to save draft finding: %1").arg(m_store->lastErrorString()));
        return QString();
    }
    return finding.id;
}

bool FieldworkService::deleteDraftFinding(const QString &findingId)
{
    DraftFinding finding = m_store->draftFinding(findingId);
    if (!finding.isValid()) {
        return fail(QString("Draft finding not found: %1").arg(findingId));
    }
    if (finding.markedForDeletion) {
        return true;
    }

    finding.markedForDeletion = true;
    finding.updatedAt = QDateTime::currentDateTimeUtc();

    bool ok = m_store->runInTransaction([&]() {
        return m_store->putDraftFinding(finding)
            && !m_engine->enqueue(EntityType::DraftFinding, findingId,
                                  SyncAction::Delete, finding.toJson()).isEmpty();
    });

    if (!ok) {
        return fail(QString("Failed to delete draft finding %1: %2")
            .arg(findingId, m_store->lastErrorString()));
    }
    return true;
}

QList<DraftFinding> FieldworkService::draftFindingsForReview(const QString &reviewId) const
{
    return m_store->draftFindings(RecordFilter::byReview(reviewId),
        [](const DraftFinding &finding) { return !finding.markedForDeletion; });
}

// ========== Sessions ==========

QString FieldworkService::startSession(const QString &reviewId, const QString &userId,
                                       const QString &deviceInfo)
{
    if (reviewId.isEmpty()) {
        fail("Offline session needs a review");
        return QString();
    }

    OfflineSession session;
    session.id = newId();
    session.reviewId = reviewId;
    session.userId = userId;
    session.deviceInfo = deviceInfo;
    session.startedAt = QDateTime::currentDateTimeUtc();

    bool ok = m_store->runInTransaction([&]() {
        return m_store->putSession(session)
            && !m_engine->enqueue(EntityType::OfflineSession, session.id,
                                  SyncAction::Create, session.toJson()).isEmpty();
    });

    if (!ok) {
        fail(QString("Failed to start offline session: %1").arg(m_store->lastErrorString()));
        return QString();
    }

    emit logMessage(QString("Offline session started for review %1").arg(reviewId));
    return session.id;
}

bool FieldworkService::endSession(const QString &sessionId)
{
    OfflineSession session = m_store->session(sessionId);
    if (!session.isValid()) {
        return fail(QString("Offline session not found: %1").arg(sessionId));
    }
    if (!session.isOpen()) {
        return true;
    }

    session.endedAt = QDateTime::currentDateTimeUtc();

    bool ok = m_store->runInTransaction([&]() {
        return m_store->putSession(session)
            && !m_engine->enqueue(EntityType::OfflineSession, sessionId,
                                  SyncAction::Update, session.toJson()).isEmpty();
    });

    if (!ok) {
        return fail(QString("Failed to end offline session %1: %2")
            .arg(sessionId, m_store->lastErrorString()));
    }

    emit logMessage(QString("Offline session ended for review %1").arg(session.reviewId));
    return true;
}

} // namespace FieldSync
