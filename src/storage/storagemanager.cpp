#include "storagemanager.h"
#include "../store/fieldworkstore.h"

#include <QStorageInfo>
#include <QStandardPaths>
#include <QFileInfo>
#include <QDir>
#include <QSaveFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QSet>
#include <QDebug>

namespace FieldSync {

const int StorageManager::EXPORT_FORMAT_VERSION;
const int StorageManager::DEFAULT_RETENTION_DAYS;

namespace {
const char *PERSISTENT_KEY = "persistentStorageGranted";
}

StorageManager::StorageManager(FieldworkStore *store, QObject *parent)
    : QObject(parent)
    , m_store(store)
{
}

QString StorageManager::dataDirectory() const
{
    if (!m_store) {
        return QString();
    }
    return QFileInfo(m_store->databasePath()).absolutePath();
}

// ========== Estimates ==========

StorageEstimate StorageManager::getStorageEstimate() const
{
    StorageEstimate estimate;
    if (!m_store) {
        return estimate;
    }

    const QStringList files = m_store->storageFiles();
    for (const QString &file : files) {
        QFileInfo info(file);
        if (info.exists()) {
            estimate.usage += info.size();
        }
    }

    qint64 free = availableBytes();
    if (free < 0) {
        return StorageEstimate();
    }

    estimate.quota = estimate.usage + free;
    if (m_quotaBytes > 0 && estimate.quota > m_quotaBytes) {
        estimate.quota = m_quotaBytes;
    }
    return estimate;
}

qint64 StorageManager::availableBytes() const
{
    QString dir = dataDirectory();
    if (dir.isEmpty() || !QDir(dir).exists()) {
        return -1;
    }

    QStorageInfo volume(dir);
    if (!volume.isValid() || !volume.isReady()) {
        return -1;
    }
    return volume.bytesAvailable();
}

// ========== Persistence ==========

bool StorageManager::requestPersistentStorage()
{
    if (!m_store || !m_store->isAvailable()) {
        return false;
    }

    if (isPersistentStorageGranted()) {
        return true;
    }

    QString dir = QDir::cleanPath(dataDirectory());
    const QList<QStandardPaths::StandardLocation> volatileLocations = {
        QStandardPaths::CacheLocation,
        QStandardPaths::GenericCacheLocation,
        QStandardPaths::TempLocation
    };
    for (QStandardPaths::StandardLocation location : volatileLocations) {
        QString path = QDir::cleanPath(QStandardPaths::writableLocation(location));
        if (!path.isEmpty() && (dir == path || dir.startsWith(path + '/'))) {
            qDebug() << "[StorageManager] Data directory is in a volatile location:" << dir;
            return false;
        }
    }

    if (!m_store->checkWritable()) {
        return false;
    }

    if (!m_store->setMetaValue(PERSISTENT_KEY, "true")) {
        return false;
    }

    emit logMessage("Persistent storage granted");
    return true;
}

bool StorageManager::isPersistentStorageGranted() const
{
    if (!m_store || !m_store->isAvailable()) {
        return false;
    }
    return m_store->metaValue(PERSISTENT_KEY).toString() == "true";
}

// ========== Retention ==========

int StorageManager::clearOldSyncedData(int olderThanDays)
{
    if (!m_store || !m_store->isAvailable()) {
        emit errorOccurred("Local store is not available");
        return -1;
    }

    QDateTime cutoff = QDateTime::currentDateTimeUtc().addDays(-olderThanDays);
    RecordFilter synced = RecordFilter::byStatus(SyncStatus::Synced);

    int removed = 0;
    bool ok = m_store->runInTransaction([&]() {
        QStringList ids;
        const QList<ChecklistItem> items = m_store->checklistItems(synced,
            [&](const ChecklistItem &item) {
                return item.updatedAt.isValid() && item.updatedAt < cutoff;
            });
        for (const ChecklistItem &item : items) {
            ids << item.id;
        }
        int count = m_store->deleteEntities(EntityType::ChecklistItem, ids);
        if (count < 0) return false;
        removed += count;

        ids.clear();
        const QList<FieldEvidence> evidence = m_store->evidenceRecords(synced, false,
            [&](const FieldEvidence &record) {
                return record.capturedAt.isValid() && record.capturedAt < cutoff;
            });
        for (const FieldEvidence &record : evidence) {
            ids << record.id;
        }
        count = m_store->deleteEntities(EntityType::FieldEvidence, ids);
        if (count < 0) return false;
        removed += count;

        ids.clear();
        const QList<DraftFinding> findings = m_store->draftFindings(synced,
            [&](const DraftFinding &finding) {
                return finding.updatedAt.isValid() && finding.updatedAt < cutoff;
            });
        for (const DraftFinding &finding : findings) {
            ids << finding.id;
        }
        count = m_store->deleteEntities(EntityType::DraftFinding, ids);
        if (count < 0) return false;
        removed += count;

        return true;
    });

    if (!ok) {
        emit errorOccurred(QString("Cleanup failed, nothing removed: %1").arg(m_store->lastErrorString()));
        return -1;
    }

    emit logMessage(QString("Removed %1 synced record(s) older than %2 day(s)")
        .arg(removed).arg(olderThanDays));
    return removed;
}

// ========== Export ==========

QString StorageManager::dataUri(const QString &mimeType, const QByteArray &data)
{
    // data:<mime>;base64,<payload>
    QString mime = mimeType.isEmpty() ? QString("application/octet-stream") : mimeType;
    return QString("data:%1;base64,%2").arg(mime, QString::fromLatin1(data.toBase64()));
}

QJsonObject StorageManager::exportReviewData(const QString &reviewId) const
{
    QJsonObject root;
    root["formatVersion"] = EXPORT_FORMAT_VERSION;
    root["exportedAt"] = toIsoString(QDateTime::currentDateTimeUtc());
    root["reviewId"] = reviewId;

    if (!m_store || !m_store->isAvailable()) {
        return root;
    }

    RecordFilter filter = RecordFilter::byReview(reviewId);
    QSet<QString> entityIds;

    QJsonArray items;
    const QList<ChecklistItem> checklist = m_store->checklistItems(filter);
    for (const ChecklistItem &item : checklist) {
        QJsonObject obj = item.toJson();
        obj["syncStatus"] = syncStatusToString(item.syncStatus);
        items.append(obj);
        entityIds.insert(item.id);
    }
    root["checklistItems"] = items;

    QJsonArray evidence;
    const QList<FieldEvidence> records = m_store->evidenceRecords(filter, true);
    for (const FieldEvidence &record : records) {
        QJsonObject obj = record.metadataJson();
        obj["markedForDeletion"] = record.markedForDeletion;
        obj["syncStatus"] = syncStatusToString(record.syncStatus);
        obj["data"] = record.blob.isEmpty() ? QJsonValue(QJsonValue::Null)
                                            : QJsonValue(dataUri(record.mimeType, record.blob));
        obj["thumbnail"] = record.thumbnail.isEmpty() ? QJsonValue(QJsonValue::Null)
                                                      : QJsonValue(dataUri("image/jpeg", record.thumbnail));
        evidence.append(obj);
        entityIds.insert(record.id);
    }
    root["evidence"] = evidence;

    QJsonArray findings;
    const QList<DraftFinding> drafts = m_store->draftFindings(filter);
    for (const DraftFinding &finding : drafts) {
        QJsonObject obj = finding.toJson();
        obj["markedForDeletion"] = finding.markedForDeletion;
        obj["syncStatus"] = syncStatusToString(finding.syncStatus);
        findings.append(obj);
        entityIds.insert(finding.id);
    }
    root["draftFindings"] = findings;

    QJsonArray sessions;
    const QList<OfflineSession> sessionList = m_store->sessionsForReview(reviewId);
    for (const OfflineSession &session : sessionList) {
        QJsonObject obj = session.toJson();
        obj["syncedAt"] = session.syncedAt.isValid() ? QJsonValue(toIsoString(session.syncedAt))
                                                     : QJsonValue(QJsonValue::Null);
        sessions.append(obj);
        entityIds.insert(session.id);
    }
    root["offlineSessions"] = sessions;

    QJsonArray queue;
    const QList<SyncQueueEntry> entries = m_store->queueEntries();
    for (const SyncQueueEntry &entry : entries) {
        if (entityIds.contains(entry.entityId)) {
            queue.append(entry.toJson());
        }
    }
    root["syncQueue"] = queue;

    return root;
}

bool StorageManager::writeExport(const QString &reviewId, const QString &filePath)
{
    QJsonObject data = exportReviewData(reviewId);

    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        emit errorOccurred(QString("Cannot write export %1: %2").arg(filePath, file.errorString()));
        return false;
    }

    file.write(QJsonDocument(data).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        emit errorOccurred(QString("Cannot write export %1: %2").arg(filePath, file.errorString()));
        return false;
    }

    emit logMessage(QString("Exported review %1 to %2").arg(reviewId, filePath));
    return true;
}

} // namespace FieldSync
