#include "fieldworktypes.h"

#include <QJsonArray>

namespace FieldSync {

// ========== Timestamps ==========

QString toIsoString(const QDateTime &dt)
{
    if (!dt.isValid()) {
        return QString();
    }
    return dt.toUTC().toString(Qt::ISODateWithMs);
}

QDateTime fromIsoString(const QString &value)
{
    if (value.isEmpty()) {
        return QDateTime();
    }
    QDateTime dt = QDateTime::fromString(value, Qt::ISODateWithMs);
    if (!dt.isValid()) {
        dt = QDateTime::fromString(value, Qt::ISODate);
    }
    return dt;
}

// ========== Enum conversion ==========

QString syncStatusToString(SyncStatus status)
{
    switch (status) {
    case SyncStatus::Pending: return "pending";
    case SyncStatus::Syncing: return "syncing";
    case SyncStatus::Synced: return "synced";
    case SyncStatus::Failed: return "failed";
    case SyncStatus::Conflict: return "conflict";
    }
    return "pending";
}

SyncStatus syncStatusFromString(const QString &value, bool *ok)
{
    if (ok) *ok = true;
    if (value == "pending") return SyncStatus::Pending;
    if (value == "syncing") return SyncStatus::Syncing;
    if (value == "synced") return SyncStatus::Synced;
    if (value == "failed") return SyncStatus::Failed;
    if (value == "conflict") return SyncStatus::Conflict;
    if (ok) *ok = false;
    return SyncStatus::Pending;
}

QString entityTypeToString(EntityType type)
{
    switch (type) {
    case EntityType::ChecklistItem: return "checklistItem";
    case EntityType::FieldEvidence: return "fieldEvidence";
    case EntityType::DraftFinding: return "draftFinding";
    case EntityType::OfflineSession: return "offlineSession";
    }
    return QString();
}

EntityType entityTypeFromString(const QString &value, bool *ok)
{
    if (ok) *ok = true;
    if (value == "checklistItem") return EntityType::ChecklistItem;
    if (value == "fieldEvidence") return EntityType::FieldEvidence;
    if (value == "draftFinding") return EntityType::DraftFinding;
    if (value == "offlineSession") return EntityType::OfflineSession;
    if (ok) *ok = false;
    return EntityType::ChecklistItem;
}

QString syncActionToString(SyncAction action)
{
    switch (action) {
    case SyncAction::Create: return "create";
    case SyncAction::Update: return "update";
    case SyncAction::Delete: return "delete";
    }
    return "update";
}

SyncAction syncActionFromString(const QString &value, bool *ok)
{
    if (ok) *ok = true;
    QString v = value.toLower();
    if (v == "create") return SyncAction::Create;
    if (v == "update") return SyncAction::Update;
    if (v == "delete") return SyncAction::Delete;
    if (ok) *ok = false;
    return SyncAction::Update;
}

QString checklistPhaseToString(ChecklistPhase phase)
{
    switch (phase) {
    case ChecklistPhase::PreVisit: return "pre-visit";
    case ChecklistPhase::OnSite: return "on-site";
    case ChecklistPhase::PostVisit: return "post-visit";
    }
    return "on-site";
}

ChecklistPhase checklistPhaseFromString(const QString &value)
{
    if (value == "pre-visit") return ChecklistPhase::PreVisit;
    if (value == "post-visit") return ChecklistPhase::PostVisit;
    return ChecklistPhase::OnSite;
}

QString evidenceTypeToString(EvidenceType type)
{
    switch (type) {
    case EvidenceType::Photo: return "photo";
    case EvidenceType::VoiceNote: return "voice_note";
    case EvidenceType::Document: return "document";
    }
    return "photo";
}

EvidenceType evidenceTypeFromString(const QString &value)
{
    if (value == "voice_note") return EvidenceType::VoiceNote;
    if (value == "document") return EvidenceType::Document;
    return EvidenceType::Photo;
}

QString findingSeverityToString(FindingSeverity severity)
{
    switch (severity) {
    case FindingSeverity::Critical: return "critical";
    case FindingSeverity::Major: return "major";
    case FindingSeverity::Minor: return "minor";
    case FindingSeverity::Observation: return "observation";
    }
    return "observation";
}

FindingSeverity findingSeverityFromString(const QString &value)
{
    QString v = value.toLower();
    if (v == "critical") return FindingSeverity::Critical;
    if (v == "major") return FindingSeverity::Major;
    if (v == "minor") return FindingSeverity::Minor;
    return FindingSeverity::Observation;
}

// ========== GpsFix ==========

QJsonObject GpsFix::toJson() const
{
    QJsonObject obj;
    if (!valid) {
        obj["latitude"] = QJsonValue::Null;
        obj["longitude"] = QJsonValue::Null;
        obj["accuracy"] = QJsonValue::Null;
        return obj;
    }
    obj["latitude"] = latitude;
    obj["longitude"] = longitude;
    obj["accuracy"] = accuracy >= 0 ? QJsonValue(accuracy) : QJsonValue(QJsonValue::Null);
    return obj;
}

GpsFix GpsFix::fromJson(const QJsonObject &obj)
{
    GpsFix fix;
    if (obj["latitude"].isDouble() && obj["longitude"].isDouble()) {
        fix.valid = true;
        fix.latitude = obj["latitude"].toDouble();
        fix.longitude = obj["longitude"].toDouble();
        fix.accuracy = obj["accuracy"].toDouble(-1.0);
    }
    return fix;
}

// ========== ChecklistItem ==========

QJsonObject ChecklistItem::toJson() const
{
    QJsonObject obj;
    obj["id"] = id;
    obj["reviewId"] = reviewId;
    obj["itemCode"] = itemCode;
    obj["label"] = label;
    obj["phase"] = checklistPhaseToString(phase);
    obj["sortOrder"] = sortOrder;
    obj["isCompleted"] = isCompleted;
    obj["completedAt"] = completedAt.isValid() ? QJsonValue(toIsoString(completedAt))
                                               : QJsonValue(QJsonValue::Null);
    obj["completedById"] = completedById.isEmpty() ? QJsonValue(QJsonValue::Null)
                                                   : QJsonValue(completedById);
    obj["notes"] = notes;
    obj["clientUpdatedAt"] = toIsoString(updatedAt);
    return obj;
}

ChecklistItem ChecklistItem::fromJson(const QJsonObject &obj)
{
    ChecklistItem item;
    item.id = obj["id"].toString();
    item.reviewId = obj["reviewId"].toString();
    item.itemCode = obj["itemCode"].toString();
    item.label = obj["label"].toString();
    item.phase = checklistPhaseFromString(obj["phase"].toString());
    item.sortOrder = obj["sortOrder"].toInt();
    item.isCompleted = obj["isCompleted"].toBool();
    item.completedAt = fromIsoString(obj["completedAt"].toString());
    item.completedById = obj["completedById"].toString();
    item.notes = obj["notes"].toString();
    item.updatedAt = fromIsoString(obj["clientUpdatedAt"].toString());
    return item;
}

// ========== FieldEvidence ==========

QJsonObject FieldEvidence::metadataJson() const
{
    QJsonObject obj;
    obj["id"] = id;
    obj["checklistItemId"] = checklistItemId;
    obj["reviewId"] = reviewId;
    obj["type"] = evidenceTypeToString(type);
    obj["mimeType"] = mimeType;
    obj["fileName"] = fileName;
    obj["fileSize"] = fileSize;

    QJsonObject gpsObj = gps.toJson();
    obj["gpsLatitude"] = gpsObj["latitude"];
    obj["gpsLongitude"] = gpsObj["longitude"];
    obj["gpsAccuracy"] = gpsObj["accuracy"];

    obj["capturedAt"] = toIsoString(capturedAt);
    obj["annotation"] = annotation;
    return obj;
}

// ========== DraftFinding ==========

QJsonObject DraftFinding::toJson() const
{
    QJsonObject obj;
    obj["clientId"] = id;
    obj["reviewId"] = reviewId;
    obj["title"] = title;
    obj["description"] = description;
    obj["severity"] = findingSeverityToString(severity).toUpper();
    obj["areaCode"] = areaCode;
    obj["questionId"] = questionId.isEmpty() ? QJsonValue(QJsonValue::Null) : QJsonValue(questionId);
    obj["evidenceIds"] = QJsonArray::fromStringList(evidenceIds);

    QJsonObject gpsObj = gps.toJson();
    obj["gpsLatitude"] = gpsObj["latitude"];
    obj["gpsLongitude"] = gpsObj["longitude"];

    obj["createdAt"] = toIsoString(createdAt);
    obj["clientUpdatedAt"] = toIsoString(updatedAt);
    return obj;
}

DraftFinding DraftFinding::fromJson(const QJsonObject &obj)
{
    DraftFinding finding;
    finding.id = obj["clientId"].toString();
    finding.reviewId = obj["reviewId"].toString();
    finding.title = obj["title"].toString();
    finding.description = obj["description"].toString();
    finding.severity = findingSeverityFromString(obj["severity"].toString());
    finding.areaCode = obj["areaCode"].toString();
    finding.questionId = obj["questionId"].toString();

    const QJsonArray ids = obj["evidenceIds"].toArray();
    for (const QJsonValue &val : ids) {
        finding.evidenceIds << val.toString();
    }

    QJsonObject gpsObj;
    gpsObj["latitude"] = obj["gpsLatitude"];
    gpsObj["longitude"] = obj["gpsLongitude"];
    finding.gps = GpsFix::fromJson(gpsObj);

    finding.createdAt = fromIsoString(obj["createdAt"].toString());
    finding.updatedAt = fromIsoString(obj["clientUpdatedAt"].toString());
    return finding;
}

// ========== OfflineSession ==========

QJsonObject OfflineSession::toJson() const
{
    QJsonObject obj;
    obj["id"] = id;
    obj["reviewId"] = reviewId;
    obj["userId"] = userId;
    obj["startedAt"] = toIsoString(startedAt);
    obj["endedAt"] = endedAt.isValid() ? QJsonValue(toIsoString(endedAt)) : QJsonValue(QJsonValue::Null);
    obj["deviceInfo"] = deviceInfo;
    return obj;
}

OfflineSession OfflineSession::fromJson(const QJsonObject &obj)
{
    OfflineSession session;
    session.id = obj["id"].toString();
    session.reviewId = obj["reviewId"].toString();
    session.userId = obj["userId"].toString();
    session.startedAt = fromIsoString(obj["startedAt"].toString());
    session.endedAt = fromIsoString(obj["endedAt"].toString());
    session.deviceInfo = obj["deviceInfo"].toString();
    return session;
}

// ========== SyncQueueEntry ==========

QJsonObject SyncQueueEntry::toJson() const
{
    QJsonObject obj;
    obj["id"] = id;
    obj["entityType"] = entityTypeKnown ? entityTypeToString(entityType) : entityTypeName;
    obj["entityId"] = entityId;
    obj["action"] = syncActionToString(action);
    obj["payload"] = QString::fromUtf8(payload);
    obj["retryCount"] = retryCount;
    obj["maxRetries"] = maxRetries;
    obj["lastAttempt"] = lastAttempt.isValid() ? QJsonValue(toIsoString(lastAttempt))
                                               : QJsonValue(QJsonValue::Null);
    obj["error"] = error.isEmpty() ? QJsonValue(QJsonValue::Null) : QJsonValue(error);
    obj["createdAt"] = toIsoString(createdAt);
    obj["conflicted"] = conflicted;
    return obj;
}

} // namespace FieldSync
