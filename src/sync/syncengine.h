#ifndef SYNCENGINE_H
#define SYNCENGINE_H

#include <QObject>
#include <QString>
#include <QList>
#include <QDateTime>
#include <QJsonObject>
#include <functional>
#include "../store/fieldworktypes.h"
#include "synchandlerset.h"

namespace FieldSync {

class FieldworkStore;
class SyncHandler;

/**
 * @brief Drains the sync queue through the per-entity handlers
 *
 * The SyncEngine coordinates:
 *   - Enqueueing local changes (and marking entities pending)
 *   - Draining eligible entries in strict creation order
 *   - Retry accounting with exponential backoff
 *   - Parking conflicts for manual resolution
 *   - Queue housekeeping (retry failed, clear completed)
 *
 * It is the only writer of an entity's syncStatus.
 *
 * Usage:
 * @code
 * FieldworkStore store(path);
 * store.open();
 *
 * SyncEngine engine(&store, SyncHandlerSet::createDefault(&store, transport));
 *
 * // Queue a change (normally done by FieldworkService)
 * engine.enqueue(EntityType::ChecklistItem, item.id, SyncAction::Update,
 *                item.toJson());
 *
 * // Drain when online
 * int synced = engine.processQueue();
 * @endcode
 */
class SyncEngine : public QObject
{
    Q_OBJECT

public:
    static const int DEFAULT_MAX_RETRIES = 3;
    static const int DEFAULT_BACKOFF_BASE_MS = 5000;
    static const int DEFAULT_BACKOFF_MULTIPLIER = 3;
    static const int DEFAULT_COMPLETED_TTL_HOURS = 24;

    /**
     * @brief Create an engine over @p store
     *
     * The engine takes ownership of the handlers in @p handlers.
     */
    SyncEngine(FieldworkStore *store, const SyncHandlerSet &handlers, QObject *parent = nullptr);
    ~SyncEngine() override;

    FieldworkStore *store() const { return m_store; }

    SyncHandler *handlerFor(EntityType type) const { return m_handlers.handlerFor(type); }

    // ========== Configuration ==========

    /**
     * @brief Backoff after a retryable failure
     *
     * The delay is base × multiplier^retryCount, where retryCount is the
     * count before the failed attempt. Default 5000ms × 3^n (5s, 15s, 45s).
     */
    void setBackoff(int baseMs, int multiplier);
    int backoffBase() const { return m_backoffBaseMs; }
    int backoffMultiplier() const { return m_backoffMultiplier; }
    int backoffDelay(int retryCount) const;

    void setDefaultMaxRetries(int maxRetries) { m_defaultMaxRetries = maxRetries; }
    int defaultMaxRetries() const { return m_defaultMaxRetries; }

    /**
     * @brief Age after which exhausted entries are garbage-collected
     */
    void setCompletedTtlHours(int hours) { m_completedTtlHours = hours; }
    int completedTtlHours() const { return m_completedTtlHours; }

    /**
     * @brief Replace the backoff sleep
     *
     * The default waits in a local QEventLoop. Tests inject a recorder.
     */
    void setSleepFunction(std::function<void(int)> sleep);

    // ========== Queue Operations ==========

    /**
     * @brief Queue a change and mark the entity pending
     *
     * Joins the caller's transaction when one is open, so the entity write
     * and its queue entry commit together.
     *
     * @param maxRetries Retry budget, negative for the configured default
     * @return New queue entry id, or an empty string on failure
     */
    QString enqueue(EntityType type, const QString &entityId, SyncAction action,
                    const QByteArray &payload, int maxRetries = -1);

    QString enqueue(EntityType type, const QString &entityId, SyncAction action,
                    const QJsonObject &payload, int maxRetries = -1);

    /**
     * @brief Drain all eligible entries once
     *
     * Returns 0 immediately when a drain is already in progress.
     *
     * @return Number of entries confirmed by the server
     */
    int processQueue();

    /**
     * @brief Re-arm exhausted entries (conflicts excluded)
     *
     * @return Number of entries reset
     */
    int retryFailed();

    /**
     * @brief Delete exhausted entries older than the completed TTL
     *
     * Conflicts are kept until resolved.
     *
     * @return Number of entries removed
     */
    int clearCompleted();

    /**
     * @brief Snapshot of queue counts and last sync state
     */
    SyncEngineStatus getSyncStatus() const;

    /**
     * @brief Entries parked by a conflict, oldest first
     */
    QList<SyncQueueEntry> conflicts() const;

    /**
     * @brief Apply an operator decision to a parked conflict
     */
    bool resolveConflict(const QString &entryId, ConflictResolution resolution);

    bool isSyncing() const { return m_syncing; }
    QDateTime lastSyncAt() const { return m_lastSyncAt; }
    QString lastError() const { return m_lastError; }

signals:
    void syncStarted();
    void syncFinished(int synced);
    void entrySynced(const QString &entryId, const QString &entityId);
    void entryFailed(const QString &entryId, const QString &error);
    void conflictDetected(const QString &entryId, const QString &entityId);
    void statusChanged();
    void logMessage(const QString &message);
    void errorOccurred(const QString &error);

private:
    /**
     * @brief Push one entry and apply the outcome
     *
     * @return Backoff delay in ms to wait before the next entry, 0 for none
     */
    int processEntry(SyncQueueEntry entry, int &synced);

    bool applySuccess(const SyncQueueEntry &entry);
    void markExhausted(SyncQueueEntry &entry, const QString &error, SyncStatus status);
    void setEntityStatus(const SyncQueueEntry &entry, SyncStatus status);
    bool applyServerSnapshot(const SyncQueueEntry &entry);
    void connectHandlerSignals(SyncHandler *handler);
    void reportError(const QString &error);

    FieldworkStore *m_store = nullptr;
    SyncHandlerSet m_handlers;

    std::function<void(int)> m_sleep;

    int m_backoffBaseMs = DEFAULT_BACKOFF_BASE_MS;
    int m_backoffMultiplier = DEFAULT_BACKOFF_MULTIPLIER;
    int m_defaultMaxRetries = DEFAULT_MAX_RETRIES;
    int m_completedTtlHours = DEFAULT_COMPLETED_TTL_HOURS;

    bool m_syncing = false;
    QDateTime m_lastSyncAt;
    QString m_lastError;
};

} // namespace FieldSync

#endif // SYNCENGINE_H
