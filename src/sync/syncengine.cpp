#include "syncengine.h"
#include "synchandler.h"
#include "../store/fieldworkstore.h"

#include <QEventLoop>
#include <QTimer>
#include <QUuid>
#include <QJsonDocument>
#include <QDebug>
#include <cmath>

namespace FieldSync {

const int SyncEngine::DEFAULT_MAX_RETRIES;
const int SyncEngine::DEFAULT_BACKOFF_BASE_MS;
const int SyncEngine::DEFAULT_BACKOFF_MULTIPLIER;
const int SyncEngine::DEFAULT_COMPLETED_TTL_HOURS;

namespace {
const char *LAST_SYNC_KEY = "lastSyncAt";
}

SyncEngine::SyncEngine(FieldworkStore *store, const SyncHandlerSet &handlers, QObject *parent)
    : QObject(parent)
    , m_store(store)
    , m_handlers(handlers)
{
    for (SyncHandler *handler : m_handlers.handlers()) {
        handler->setParent(this);
        connectHandlerSignals(handler);
    }

    // Default backoff: wait in a nested event loop so the UI keeps running
    m_sleep = [](int ms) {
        QEventLoop loop;
        QTimer::singleShot(ms, &loop, &QEventLoop::quit);
        loop.exec();
    };

    if (m_store && m_store->isAvailable()) {
        m_lastSyncAt = fromIsoString(m_store->metaValue(LAST_SYNC_KEY).toString());
    }
}

SyncEngine::~SyncEngine() = default;

// ========== Configuration ==========

void SyncEngine::setBackoff(int baseMs, int multiplier)
{
    m_backoffBaseMs = qMax(0, baseMs);
    m_backoffMultiplier = qMax(1, multiplier);
}

int SyncEngine::backoffDelay(int retryCount) const
{
    double delay = m_backoffBaseMs * std::pow(static_cast<double>(m_backoffMultiplier), retryCount);
    return static_cast<int>(qMin(delay, 3600000.0));
}

void SyncEngine::setSleepFunction(std::function<void(int)> sleep)
{
    if (sleep) {
        m_sleep = std::move(sleep);
    }
}

void SyncEngine::connectHandlerSignals(SyncHandler *handler)
{
    connect(handler, &SyncHandler::logMessage, this, &SyncEngine::logMessage);
    connect(handler, &SyncHandler::errorOccurred, this, &SyncEngine::errorOccurred);
}

void SyncEngine::reportError(const QString &error)
{
    m_lastError = error;
    emit errorOccurred(error);
}

// ========== Queue Operations ==========

QString SyncEngine::enqueue(EntityType type, const QString &entityId, SyncAction action,
                            const QJsonObject &payload, int maxRetries)
{
    return enqueue(type, entityId, action,
                   QJsonDocument(payload).toJson(QJsonDocument::Compact), maxRetries);
}

QString SyncEngine::enqueue(EntityType type, const QString &entityId, SyncAction action,
                            const QByteArray &payload, int maxRetries)
{
    if (!m_store) {
        reportError("No local store configured");
        return QString();
    }

    SyncQueueEntry entry;
    entry.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    entry.entityType = type;
    entry.entityTypeName = entityTypeToString(type);
    entry.entityId = entityId;
    entry.action = action;
    entry.payload = payload;
    entry.maxRetries = maxRetries >= 0 ? maxRetries : m_defaultMaxRetries;
    entry.createdAt = QDateTime::currentDateTimeUtc();

    bool ok = m_store->runInTransaction([&]() {
        return m_store->addQueueEntry(entry)
            && m_store->setSyncStatus(type, entityId, SyncStatus::Pending);
    });

    if (!ok) {
        reportError(QString("Failed to queue %1 %2: %3")
            .arg(entry.entityTypeName, entityId, m_store->lastErrorString()));
        return QString();
    }

    qDebug() << "[SyncEngine] Queued" << entry.entityTypeName << syncActionToString(action)
             << entityId << "as" << entry.id;
    emit statusChanged();
    return entry.id;
}

int SyncEngine::processQueue()
{
    if (m_syncing) {
        qDebug() << "[SyncEngine] Drain already in progress, skipping";
        return 0;
    }

    if (!m_store || !m_store->isAvailable()) {
        reportError("Local store is not available");
        return 0;
    }

    m_syncing = true;
    emit syncStarted();
    emit statusChanged();

    QList<SyncQueueEntry> entries = m_store->eligibleQueueEntries();
    emit logMessage(QString("Processing %1 queued change(s)").arg(entries.size()));

    int synced = 0;
    for (int i = 0; i < entries.size(); ++i) {
        // Re-read: a conflict may have been resolved while we were waiting
        SyncQueueEntry entry = m_store->queueEntry(entries.at(i).id);
        if (!entry.isValid() || entry.isExhausted()) {
            continue;
        }

        int delay = processEntry(entry, synced);

        if (delay > 0 && i < entries.size() - 1) {
            qDebug() << "[SyncEngine] Backing off" << delay << "ms";
            m_sleep(delay);
        }
    }

    if (synced > 0) {
        m_lastSyncAt = QDateTime::currentDateTimeUtc();
        m_store->setMetaValue(LAST_SYNC_KEY, toIsoString(m_lastSyncAt));
    }

    emit logMessage(QString("Sync complete: %1 of %2 change(s) confirmed")
        .arg(synced).arg(entries.size()));

    m_syncing = false;
    emit syncFinished(synced);
    emit statusChanged();
    return synced;
}

int SyncEngine::processEntry(SyncQueueEntry entry, int &synced)
{
    SyncHandler *handler = entry.entityTypeKnown ? m_handlers.handlerFor(entry.entityType) : nullptr;

    if (!handler) {
        QString error = QString("No handler for entityType \"%1\"").arg(entry.entityTypeName);
        qWarning() << "[SyncEngine]" << error << "entry:" << entry.id;
        markExhausted(entry, error, SyncStatus::Failed);
        emit entryFailed(entry.id, error);
        return 0;
    }

    setEntityStatus(entry, SyncStatus::Syncing);

    PushResult result = handler->push(entry);

    switch (result.outcome) {
    case PushOutcome::Success:
        if (applySuccess(entry)) {
            synced++;
            emit entrySynced(entry.id, entry.entityId);
        } else {
            reportError(QString("Synced %1 but failed to update local store: %2")
                .arg(entry.entityId, m_store->lastErrorString()));
        }
        return 0;

    case PushOutcome::Conflict: {
        QString error = result.message.isEmpty() ? QString("Conflict") : result.message;
        entry.conflicted = true;
        entry.serverSnapshot = result.serverSnapshot;
        markExhausted(entry, error, SyncStatus::Conflict);
        m_lastError = error;
        emit logMessage(QString("Conflict on %1 %2: %3")
            .arg(handler->displayName(), entry.entityId, error));
        emit conflictDetected(entry.id, entry.entityId);
        return 0;
    }

    case PushOutcome::Permanent:
        markExhausted(entry, result.message, SyncStatus::Failed);
        m_lastError = result.message;
        emit logMessage(QString("Failed to sync %1 %2: %3")
            .arg(handler->displayName(), entry.entityId, result.message));
        emit entryFailed(entry.id, result.message);
        return 0;

    case PushOutcome::Retryable:
        break;
    }

    int previousRetries = entry.retryCount;
    entry.retryCount++;
    entry.error = result.message;
    entry.lastAttempt = QDateTime::currentDateTimeUtc();
    m_lastError = result.message;

    if (!m_store->updateQueueEntry(entry)) {
        reportError(QString("Failed to record retry for %1: %2")
            .arg(entry.id, m_store->lastErrorString()));
    }

    if (entry.isExhausted()) {
        setEntityStatus(entry, SyncStatus::Failed);
        emit logMessage(QString("Giving up on %1 %2 after %3 attempt(s): %4")
            .arg(handler->displayName(), entry.entityId)
            .arg(entry.retryCount).arg(result.message));
        emit entryFailed(entry.id, result.message);
    } else {
        setEntityStatus(entry, SyncStatus::Pending);
        emit logMessage(QString("Will retry %1 %2 (%3/%4): %5")
            .arg(handler->displayName(), entry.entityId)
            .arg(entry.retryCount).arg(entry.maxRetries).arg(result.message));
    }

    return backoffDelay(previousRetries);
}

bool SyncEngine::applySuccess(const SyncQueueEntry &entry)
{
    return m_store->runInTransaction([&]() {
        // Queue order splits the entity's other entries into older and newer changes
        QList<SyncQueueEntry> older;
        QList<SyncQueueEntry> newer;
        bool seen = false;
        const QList<SyncQueueEntry> siblings = m_store->queueEntriesForEntity(entry.entityType, entry.entityId);
        for (const SyncQueueEntry &sibling : siblings) {
            if (sibling.id == entry.id) {
                seen = true;
            } else if (seen) {
                newer.append(sibling);
            } else {
                older.append(sibling);
            }
        }

        if (!m_store->deleteQueueEntry(entry.id)) {
            return false;
        }

        // Exhausted older snapshots are superseded by the one just confirmed
        QStringList superseded;
        bool parkedConflict = false;
        for (const SyncQueueEntry &stale : older) {
            if (stale.conflicted) {
                parkedConflict = true;
            } else if (stale.isExhausted()) {
                superseded.append(stale.id);
            }
        }
        if (!superseded.isEmpty()) {
            if (m_store->deleteQueueEntries(superseded) < 0) {
                return false;
            }
            qDebug() << "[SyncEngine] Dropped" << superseded.size() << "superseded entries for"
                     << entry.entityId;
        }

        if (entry.action == SyncAction::Delete) {
            return m_store->deleteEntity(entry.entityType, entry.entityId);
        }

        if (entry.entityType == EntityType::OfflineSession) {
            OfflineSession session = m_store->session(entry.entityId);
            if (!session.isValid()) {
                return true;
            }
            session.syncedAt = QDateTime::currentDateTimeUtc();
            return m_store->putSession(session);
        }

        SyncStatus status = SyncStatus::Synced;
        if (!newer.isEmpty()) {
            const SyncQueueEntry &latest = newer.last();
            if (latest.conflicted) {
                status = SyncStatus::Conflict;
            } else if (latest.isExhausted()) {
                status = SyncStatus::Failed;
            } else {
                status = SyncStatus::Pending;
            }
        } else if (parkedConflict) {
            // A parked conflict stays visible until it is resolved
            status = SyncStatus::Conflict;
        }
        return m_store->setSyncStatus(entry.entityType, entry.entityId, status);
    });
}

void SyncEngine::markExhausted(SyncQueueEntry &entry, const QString &error, SyncStatus status)
{
    entry.retryCount = entry.maxRetries;
    entry.error = error;
    entry.lastAttempt = QDateTime::currentDateTimeUtc();

    if (!m_store->updateQueueEntry(entry)) {
        reportError(QString("Failed to update queue entry %1: %2")
            .arg(entry.id, m_store->lastErrorString()));
    }
    setEntityStatus(entry, status);
}

void SyncEngine::setEntityStatus(const SyncQueueEntry &entry, SyncStatus status)
{
    if (!entry.entityTypeKnown) {
        return;
    }
    if (!m_store->setSyncStatus(entry.entityType, entry.entityId, status)) {
        qWarning() << "[SyncEngine] Could not set" << syncStatusToString(status)
                   << "on" << entry.entityId;
    }
}

int SyncEngine::retryFailed()
{
    if (!m_store || !m_store->isAvailable()) {
        reportError("Local store is not available");
        return 0;
    }

    int reset = 0;
    bool ok = m_store->runInTransaction([&]() {
        const QList<SyncQueueEntry> entries = m_store->queueEntries();
        for (SyncQueueEntry entry : entries) {
            if (!entry.isExhausted() || entry.conflicted) {
                continue;
            }
            entry.retryCount = 0;
            entry.error.clear();
            entry.lastAttempt = QDateTime();
            if (!m_store->updateQueueEntry(entry)) {
                return false;
            }
            if (entry.entityTypeKnown
                && !m_store->setSyncStatus(entry.entityType, entry.entityId, SyncStatus::Pending)) {
                return false;
            }
            reset++;
        }
        return true;
    });

    if (!ok) {
        reportError(QString("Failed to reset failed entries: %1").arg(m_store->lastErrorString()));
        return 0;
    }

    if (reset > 0) {
        emit logMessage(QString("Re-queued %1 failed change(s)").arg(reset));
        emit statusChanged();
    }
    return reset;
}

int SyncEngine::clearCompleted()
{
    if (!m_store || !m_store->isAvailable()) {
        reportError("Local store is not available");
        return 0;
    }

    QDateTime cutoff = QDateTime::currentDateTimeUtc().addSecs(-qint64(m_completedTtlHours) * 3600);

    QStringList expired;
    const QList<SyncQueueEntry> entries = m_store->queueEntries();
    for (const SyncQueueEntry &entry : entries) {
        if (entry.isExhausted() && !entry.conflicted
            && entry.lastAttempt.isValid() && entry.lastAttempt < cutoff) {
            expired << entry.id;
        }
    }

    if (expired.isEmpty()) {
        return 0;
    }

    int removed = m_store->deleteQueueEntries(expired);
    if (removed < 0) {
        reportError(QString("Failed to clear completed entries: %1").arg(m_store->lastErrorString()));
        return 0;
    }

    emit logMessage(QString("Cleared %1 expired queue entr%2").arg(removed).arg(removed == 1 ? "y" : "ies"));
    emit statusChanged();
    return removed;
}

SyncEngineStatus SyncEngine::getSyncStatus() const
{
    SyncEngineStatus status;
    status.lastSyncAt = m_lastSyncAt;
    status.lastError = m_lastError;
    status.isSyncing = m_syncing;

    if (!m_store || !m_store->isAvailable()) {
        return status;
    }

    const QList<SyncQueueEntry> entries = m_store->queueEntries();
    for (const SyncQueueEntry &entry : entries) {
        if (entry.conflicted) {
            status.conflicts++;
        } else if (!entry.isExhausted()) {
            status.pending++;
        } else {
            status.failed++;
        }
    }

    return status;
}

QList<SyncQueueEntry> SyncEngine::conflicts() const
{
    QList<SyncQueueEntry> result;
    if (!m_store) {
        return result;
    }
    const QList<SyncQueueEntry> entries = m_store->queueEntries();
    for (const SyncQueueEntry &entry : entries) {
        if (entry.conflicted) {
            result.append(entry);
        }
    }
    return result;
}

// ========== Conflict Resolution ==========

bool SyncEngine::resolveConflict(const QString &entryId, ConflictResolution resolution)
{
    if (!m_store || !m_store->isAvailable()) {
        reportError("Local store is not available");
        return false;
    }

    SyncQueueEntry entry = m_store->queueEntry(entryId);
    if (!entry.isValid()) {
        reportError(QString("Queue entry not found: %1").arg(entryId));
        return false;
    }
    if (!entry.conflicted) {
        reportError(QString("Queue entry %1 is not in conflict").arg(entryId));
        return false;
    }

    bool ok = false;

    if (resolution == ConflictResolution::KeepLocal) {
        QDateTime now = QDateTime::currentDateTimeUtc();

        ok = m_store->runInTransaction([&]() {
            QJsonObject payload = QJsonDocument::fromJson(entry.payload).object();
            if (payload.contains("clientUpdatedAt")) {
                payload["clientUpdatedAt"] = toIsoString(now);
                entry.payload = QJsonDocument(payload).toJson(QJsonDocument::Compact);
            }

            if (entry.entityType == EntityType::ChecklistItem) {
                ChecklistItem item = m_store->checklistItem(entry.entityId);
                if (item.isValid()) {
                    item.updatedAt = now;
                    if (!m_store->putChecklistItem(item)) {
                        return false;
                    }
                }
            }

            entry.retryCount = 0;
            entry.conflicted = false;
            entry.serverSnapshot.clear();
            entry.error.clear();
            entry.lastAttempt = QDateTime();

            return m_store->updateQueueEntry(entry)
                && m_store->setSyncStatus(entry.entityType, entry.entityId, SyncStatus::Pending);
        });

        if (ok) {
            emit logMessage(QString("Conflict on %1 resolved: local change re-queued").arg(entry.entityId));
        }
    } else {
        ok = m_store->runInTransaction([&]() {
            return applyServerSnapshot(entry)
                && m_store->deleteQueueEntry(entry.id)
                && m_store->setSyncStatus(entry.entityType, entry.entityId, SyncStatus::Synced);
        });

        if (ok) {
            emit logMessage(QString("Conflict on %1 resolved: server version kept").arg(entry.entityId));
        }
    }

    if (!ok) {
        reportError(QString("Failed to resolve conflict %1: %2").arg(entryId, m_store->lastErrorString()));
        return false;
    }

    emit statusChanged();
    return true;
}

bool SyncEngine::applyServerSnapshot(const SyncQueueEntry &entry)
{
    if (entry.entityType != EntityType::ChecklistItem || entry.serverSnapshot.isEmpty()) {
        return true;
    }

    QJsonObject server = QJsonDocument::fromJson(entry.serverSnapshot).object();
    if (server.isEmpty()) {
        return true;
    }

    ChecklistItem item = m_store->checklistItem(entry.entityId);
    if (!item.isValid()) {
        return true;
    }

    if (server.contains("isCompleted")) {
        item.isCompleted = server.value("isCompleted").toBool();
    }
    if (server.contains("completedAt")) {
        item.completedAt = fromIsoString(server.value("completedAt").toString());
    }
    if (server.contains("notes")) {
        item.notes = server.value("notes").toString();
    }
    QDateTime serverUpdated = fromIsoString(server.value("updatedAt").toString());
    if (serverUpdated.isValid()) {
        item.updatedAt = serverUpdated;
    }

    qDebug() << "[SyncEngine] Applied server copy of checklist item" << item.id;
    return m_store->putChecklistItem(item);
}

} // namespace FieldSync
