#ifndef FIELDWORKTYPES_H
#define FIELDWORKTYPES_H

#include <QString>
#include <QStringList>
#include <QDateTime>
#include <QByteArray>
#include <QJsonObject>
#include <QMetaType>

/**
 * @file fieldworktypes.h
 * @brief Records and enums shared by the store, the sync engine and handlers
 *
 * Every record is a plain value type. Binary payloads are held in QByteArray,
 * which is implicitly shared: handing a blob to the upload transport shares
 * the buffer read-only, it never creates a second writable owner.
 */

namespace FieldSync {

/**
 * @brief Synchronization state of a syncable entity
 *
 * Only the SyncEngine writes this field.
 */
enum class SyncStatus {
    Pending,        ///< Local change waiting to be pushed
    Syncing,        ///< Handler currently pushing it
    Synced,         ///< Confirmed by the server
    Failed,         ///< Retry budget exhausted or permanent error
    Conflict        ///< Server rejected a stale snapshot (parked)
};

/**
 * @brief Entity kinds that can have queue entries
 */
enum class EntityType {
    ChecklistItem,
    FieldEvidence,
    DraftFinding,
    OfflineSession
};

enum class SyncAction {
    Create,
    Update,
    Delete
};

enum class ChecklistPhase {
    PreVisit,
    OnSite,
    PostVisit
};

enum class EvidenceType {
    Photo,
    VoiceNote,
    Document
};

enum class FindingSeverity {
    Critical,
    Major,
    Minor,
    Observation
};

// ========== String conversion (wire and column values) ==========

QString syncStatusToString(SyncStatus status);
SyncStatus syncStatusFromString(const QString &value, bool *ok = nullptr);

QString entityTypeToString(EntityType type);
EntityType entityTypeFromString(const QString &value, bool *ok = nullptr);

QString syncActionToString(SyncAction action);
SyncAction syncActionFromString(const QString &value, bool *ok = nullptr);

QString checklistPhaseToString(ChecklistPhase phase);
ChecklistPhase checklistPhaseFromString(const QString &value);

QString evidenceTypeToString(EvidenceType type);
EvidenceType evidenceTypeFromString(const QString &value);

QString findingSeverityToString(FindingSeverity severity);
FindingSeverity findingSeverityFromString(const QString &value);

/**
 * @brief Optional GPS fix attached to evidence and findings
 */
struct GpsFix {
    bool valid = false;
    double latitude = 0.0;
    double longitude = 0.0;
    double accuracy = -1.0;     ///< Metres, negative when unknown

    QJsonObject toJson() const;
    static GpsFix fromJson(const QJsonObject &obj);
};

/**
 * @brief One checklist line item of a review
 */
struct ChecklistItem {
    QString id;
    QString reviewId;
    QString itemCode;           ///< Template line item reference
    QString label;
    ChecklistPhase phase = ChecklistPhase::OnSite;
    int sortOrder = 0;
    bool isCompleted = false;
    QDateTime completedAt;
    QString completedById;
    QString notes;
    QDateTime updatedAt;
    SyncStatus syncStatus = SyncStatus::Pending;

    bool isValid() const { return !id.isEmpty(); }

    QJsonObject toJson() const;
    static ChecklistItem fromJson(const QJsonObject &obj);
};

/**
 * @brief Captured artifact tied to one checklist item
 */
struct FieldEvidence {
    QString id;
    QString checklistItemId;
    QString reviewId;
    EvidenceType type = EvidenceType::Photo;
    QByteArray blob;
    QByteArray thumbnail;       ///< Derived cache, may be empty
    QString mimeType;
    QString fileName;
    qint64 fileSize = 0;
    GpsFix gps;
    QDateTime capturedAt;
    QString annotation;
    bool markedForDeletion = false;
    SyncStatus syncStatus = SyncStatus::Pending;

    bool isValid() const { return !id.isEmpty(); }

    /**
     * @brief Metadata only, no blob or thumbnail
     *
     * Used both as the queue payload and as the multipart sidecar.
     */
    QJsonObject metadataJson() const;
};

/**
 * @brief A finding drafted in the field
 *
 * evidenceIds are weak references: evidence records live and sync on
 * their own.
 */
struct DraftFinding {
    QString id;
    QString reviewId;
    QString title;
    QString description;
    FindingSeverity severity = FindingSeverity::Observation;
    QString areaCode;
    QString questionId;
    QStringList evidenceIds;
    GpsFix gps;
    QDateTime createdAt;
    QDateTime updatedAt;
    bool markedForDeletion = false;
    SyncStatus syncStatus = SyncStatus::Pending;

    bool isValid() const { return !id.isEmpty(); }

    QJsonObject toJson() const;
    static DraftFinding fromJson(const QJsonObject &obj);
};

/**
 * @brief Audit record of a reviewer's offline working window
 */
struct OfflineSession {
    QString id;
    QString reviewId;
    QString userId;
    QDateTime startedAt;
    QDateTime endedAt;
    QString deviceInfo;
    QDateTime syncedAt;

    bool isValid() const { return !id.isEmpty(); }
    bool isOpen() const { return startedAt.isValid() && !endedAt.isValid(); }

    QJsonObject toJson() const;
    static OfflineSession fromJson(const QJsonObject &obj);
};

/**
 * @brief One outstanding intent to push a local change
 */
struct SyncQueueEntry {
    QString id;
    QString entityTypeName;     ///< Raw stored value, kept for unknown types
    EntityType entityType = EntityType::ChecklistItem;
    bool entityTypeKnown = true;
    QString entityId;
    SyncAction action = SyncAction::Update;
    QByteArray payload;         ///< Serialized JSON snapshot
    int retryCount = 0;
    int maxRetries = 3;
    QDateTime lastAttempt;
    QString error;
    QDateTime createdAt;
    bool conflicted = false;
    QByteArray serverSnapshot;  ///< Server copy returned with a conflict

    bool isValid() const { return !id.isEmpty(); }
    bool isExhausted() const { return retryCount >= maxRetries; }

    QJsonObject toJson() const;
};

/**
 * @brief Secondary-key filter for range queries
 *
 * Empty fields are not applied.
 */
struct RecordFilter {
    QString reviewId;
    QString checklistItemId;
    bool filterStatus = false;
    SyncStatus status = SyncStatus::Pending;

    static RecordFilter byReview(const QString &reviewId) {
        RecordFilter f;
        f.reviewId = reviewId;
        return f;
    }

    static RecordFilter byChecklistItem(const QString &checklistItemId) {
        RecordFilter f;
        f.checklistItemId = checklistItemId;
        return f;
    }

    static RecordFilter byStatus(SyncStatus status) {
        RecordFilter f;
        f.filterStatus = true;
        f.status = status;
        return f;
    }
};

/**
 * @brief Snapshot of the queue for status displays
 */
struct SyncEngineStatus {
    int pending = 0;        ///< retryCount < maxRetries
    int failed = 0;         ///< Exhausted, conflicts excluded
    int conflicts = 0;      ///< Entities in conflict across the three tables
    QDateTime lastSyncAt;
    QString lastError;
    bool isSyncing = false;

    QString summary() const {
        return QString("Pending: %1, Failed: %2, Conflicts: %3, Last sync: %4")
            .arg(pending).arg(failed).arg(conflicts)
            .arg(lastSyncAt.isValid() ? lastSyncAt.toString(Qt::ISODate) : QString("never"));
    }
};

/**
 * @brief Operator decision for a parked conflict
 */
enum class ConflictResolution {
    KeepLocal,      ///< Re-arm the entry and push the local snapshot again
    KeepServer      ///< Drop the local change, apply the server copy if any
};

// Timestamps travel as ISO 8601 with milliseconds, UTC.
QString toIsoString(const QDateTime &dt);
QDateTime fromIsoString(const QString &value);

} // namespace FieldSync

Q_DECLARE_METATYPE(FieldSync::SyncEngineStatus)

#endif // FIELDWORKTYPES_H
