#ifndef STORAGEMANAGER_H
#define STORAGEMANAGER_H

#include <QObject>
#include <QString>
#include <QJsonObject>

namespace FieldSync {

class FieldworkStore;

/**
 * @brief Bytes used by the local store and the space it may grow into
 */
struct StorageEstimate {
    qint64 usage = 0;
    qint64 quota = 0;

    bool isKnown() const { return quota > 0; }
    double usageRatio() const { return quota > 0 ? double(usage) / double(quota) : 0.0; }
};

/**
 * @brief Keeps local storage bounded and exportable
 *
 * Works on the FieldworkStore only: retention cleanup of confirmed data,
 * disk usage estimates for the preflight check, and JSON export of one
 * review for support or manual recovery.
 */
class StorageManager : public QObject
{
    Q_OBJECT

public:
    static const int EXPORT_FORMAT_VERSION = 1;
    static const int DEFAULT_RETENTION_DAYS = 30;

    explicit StorageManager(FieldworkStore *store, QObject *parent = nullptr);

    /**
     * @brief Upper bound for the quota (0 = volume free space only)
     */
    void setQuotaBytes(qint64 bytes) { m_quotaBytes = bytes; }
    qint64 quotaBytes() const { return m_quotaBytes; }

    /**
     * @brief Usage of the store files and the quota left on their volume
     *
     * Never fails; returns zero/zero when nothing can be measured.
     */
    StorageEstimate getStorageEstimate() const;

    /**
     * @brief Free bytes on the volume holding the store, -1 if unknown
     */
    qint64 availableBytes() const;

    /**
     * @brief Ask for storage that the platform will not evict
     *
     * Granted when the data directory is outside the cache and temp
     * locations and the store accepts writes. The grant is remembered in
     * the store metadata.
     */
    bool requestPersistentStorage();

    bool isPersistentStorageGranted() const;

    /**
     * @brief Delete synced records older than @p olderThanDays
     *
     * One transaction across checklist items, evidence and draft findings.
     * Records in any other status are never touched.
     *
     * @return Number of records removed, -1 on failure (nothing removed)
     */
    int clearOldSyncedData(int olderThanDays = DEFAULT_RETENTION_DAYS);

    /**
     * @brief Everything stored for one review as JSON
     *
     * Blobs and thumbnails are embedded as data: URIs.
     */
    QJsonObject exportReviewData(const QString &reviewId) const;

    /**
     * @brief Write exportReviewData() to @p filePath as indented JSON
     */
    bool writeExport(const QString &reviewId, const QString &filePath);

signals:
    void logMessage(const QString &message);
    void errorOccurred(const QString &error);

private:
    static QString dataUri(const QString &mimeType, const QByteArray &data);
    QString dataDirectory() const;

    FieldworkStore *m_store = nullptr;
    qint64 m_quotaBytes = 0;
};

} // namespace FieldSync

#endif // STORAGEMANAGER_H
