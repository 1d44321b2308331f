#ifndef FIELDWORKSTORE_H
#define FIELDWORKSTORE_H

#include <QObject>
#include <QString>
#include <QStringList>
#include <QList>
#include <QVariant>
#include <QSqlDatabase>
#include <functional>
#include "fieldworktypes.h"

class QSqlQuery;

namespace FieldSync {

/**
 * @brief Error category of the last failed store operation
 */
enum class StoreError {
    None,
    StorageUnavailable,     ///< Database cannot be opened or written
    QueryFailed,            ///< Statement failed on an open database
    NotFound                ///< Point operation on a missing id
};

/**
 * @brief Durable local store for offline fieldwork
 *
 * SQLite database accessed through QtSql. Five tables keyed by UUID:
 *   checklist_items, field_evidence, draft_findings, sync_queue,
 *   offline_sessions
 * plus store_meta for small key/value state (last sync time, grants).
 *
 * Every operation returns false / an invalid record on failure and sets
 * lastError(). When the database is not usable the error is
 * StoreError::StorageUnavailable, which callers must treat as a blocking
 * precondition for offline work.
 *
 * Usage:
 * @code
 * FieldworkStore store(dataDir + "/fieldwork.db");
 * if (!store.open()) {
 *     // StorageUnavailable - offline mode cannot start
 * }
 * store.runInTransaction([&]() {
 *     return store.putChecklistItem(item) && engine.enqueue(...).size() > 0;
 * });
 * @endcode
 */
class FieldworkStore : public QObject
{
    Q_OBJECT

public:
    explicit FieldworkStore(const QString &databasePath, QObject *parent = nullptr);
    ~FieldworkStore() override;

    // ========== Lifecycle ==========

    /**
     * @brief Open the database and create or migrate the schema
     */
    bool open();

    void close();

    bool isOpen() const;

    /**
     * @brief True when the database is open and usable
     */
    bool isAvailable() const;

    /**
     * @brief Write and delete a probe row to prove the store is writable
     */
    bool checkWritable();

    QString databasePath() const { return m_databasePath; }

    /**
     * @brief Database file plus its WAL and SHM side files
     */
    QStringList storageFiles() const;

    StoreError lastError() const { return m_lastError; }
    QString lastErrorString() const { return m_lastErrorString; }

    // ========== Transactions ==========

    /**
     * @brief Begin a transaction (nested calls join the outer one)
     */
    bool beginTransaction();
    bool commit();
    void rollback();

    /**
     * @brief Run @p work inside a transaction
     *
     * Commits when @p work returns true, rolls back otherwise. When called
     * inside an outer transaction the work joins it, and a false return
     * marks the outer transaction for rollback.
     */
    bool runInTransaction(const std::function<bool()> &work);

    // ========== Checklist items ==========

    bool putChecklistItem(const ChecklistItem &item);
    ChecklistItem checklistItem(const QString &id) const;
    QList<ChecklistItem> checklistItems(const RecordFilter &filter,
                                        const std::function<bool(const ChecklistItem &)> &predicate = nullptr) const;
    bool deleteChecklistItem(const QString &id);

    // ========== Field evidence ==========

    bool putEvidence(const FieldEvidence &evidence);

    /**
     * @brief Load one evidence record including its blob and thumbnail
     */
    FieldEvidence evidence(const QString &id) const;

    /**
     * @brief Range query; blobs are only loaded when @p withBlobs is set
     */
    QList<FieldEvidence> evidenceRecords(const RecordFilter &filter,
                                         bool withBlobs = false,
                                         const std::function<bool(const FieldEvidence &)> &predicate = nullptr) const;
    bool deleteEvidence(const QString &id);

    /**
     * @brief Rewrite the blob slot of an evidence record in place
     */
    bool updateEvidenceBlob(const QString &id, const QByteArray &blob,
                            const QByteArray &thumbnail, const QString &annotation);

    // ========== Draft findings ==========

    bool putDraftFinding(const DraftFinding &finding);
    DraftFinding draftFinding(const QString &id) const;
    QList<DraftFinding> draftFindings(const RecordFilter &filter,
                                      const std::function<bool(const DraftFinding &)> &predicate = nullptr) const;
    bool deleteDraftFinding(const QString &id);

    // ========== Offline sessions ==========

    bool putSession(const OfflineSession &session);
    OfflineSession session(const QString &id) const;
    QList<OfflineSession> sessionsForReview(const QString &reviewId) const;
    bool deleteSession(const QString &id);

    // ========== Sync queue ==========

    bool addQueueEntry(const SyncQueueEntry &entry);
    bool updateQueueEntry(const SyncQueueEntry &entry);
    SyncQueueEntry queueEntry(const QString &id) const;

    /**
     * @brief All entries in creation order (oldest first)
     */
    QList<SyncQueueEntry> queueEntries() const;

    /**
     * @brief Entries with retryCount < maxRetries in creation order
     */
    QList<SyncQueueEntry> eligibleQueueEntries() const;

    QList<SyncQueueEntry> queueEntriesForEntity(EntityType type, const QString &entityId) const;

    bool deleteQueueEntry(const QString &id);

    /**
     * @brief Bulk delete
     * @return Number of rows removed, -1 on failure
     */
    int deleteQueueEntries(const QStringList &ids);

    // ========== Sync status (written by the SyncEngine only) ==========

    /**
     * @brief Set syncStatus on an entity row
     *
     * Offline sessions have no status column; the call is a no-op success.
     */
    bool setSyncStatus(EntityType type, const QString &entityId, SyncStatus status);

    SyncStatus syncStatus(EntityType type, const QString &entityId, bool *found = nullptr) const;

    /**
     * @brief Count rows of one table in a given status
     * @return Count, or -1 on failure
     */
    int countWithStatus(EntityType type, SyncStatus status) const;

    /**
     * @brief Remove an entity row of any type
     */
    bool deleteEntity(EntityType type, const QString &entityId);

    /**
     * @brief Bulk delete entity rows of one type
     * @return Number of rows removed, -1 on failure
     */
    int deleteEntities(EntityType type, const QStringList &ids);

    // ========== Metadata ==========

    QVariant metaValue(const QString &key, const QVariant &defaultValue = QVariant()) const;
    bool setMetaValue(const QString &key, const QVariant &value);

signals:
    void errorOccurred(const QString &error);

private:
    bool ensureAvailable() const;
    bool createSchema();
    bool exec(QSqlQuery &query) const;
    void setError(StoreError error, const QString &message) const;
    void clearError() const;

    static QString tableFor(EntityType type);
    static QString whereClause(const RecordFilter &filter, bool hasChecklistColumn);
    static void bindFilter(QSqlQuery &query, const RecordFilter &filter);

    ChecklistItem checklistItemFromQuery(const QSqlQuery &query) const;
    FieldEvidence evidenceFromQuery(const QSqlQuery &query, bool withBlobs) const;
    DraftFinding draftFindingFromQuery(const QSqlQuery &query) const;
    OfflineSession sessionFromQuery(const QSqlQuery &query) const;
    SyncQueueEntry queueEntryFromQuery(const QSqlQuery &query) const;

    QList<SyncQueueEntry> selectQueue(const QString &sql,
                                      const QVariantList &bindings = QVariantList()) const;

    QString m_databasePath;
    QString m_connectionName;
    QSqlDatabase m_db;

    int m_transactionDepth = 0;
    bool m_rollbackOnly = false;

    mutable StoreError m_lastError = StoreError::None;
    mutable QString m_lastErrorString;

    static const int SCHEMA_VERSION;
};

} // namespace FieldSync

#endif // FIELDWORKSTORE_H
