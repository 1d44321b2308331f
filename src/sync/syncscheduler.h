#ifndef SYNCSCHEDULER_H
#define SYNCSCHEDULER_H

#include <QObject>
#include <QTimer>

namespace FieldSync {

class SyncEngine;
class ConnectivityMonitor;
class StorageManager;

/**
 * @brief Decides when the engine drains and when old data is cleaned up
 *
 * Triggers:
 *   - Reconnect: a short delay after the monitor reports online
 *   - Periodic: every periodicInterval while online
 *   - Cleanup: retention cleanup plus clearCompleted every cleanupInterval
 *
 * Overlapping triggers are harmless; the engine ignores a drain request
 * while one is running.
 */
class SyncScheduler : public QObject
{
    Q_OBJECT

public:
    static const int DEFAULT_RECONNECT_DELAY_MS = 2000;
    static const int DEFAULT_PERIODIC_INTERVAL_MS = 300000;
    static const int DEFAULT_CLEANUP_INTERVAL_HOURS = 24;
    static const int DEFAULT_RETENTION_DAYS = 30;

    SyncScheduler(SyncEngine *engine,
                  ConnectivityMonitor *monitor,
                  StorageManager *storage,
                  QObject *parent = nullptr);
    ~SyncScheduler() override;

    void setReconnectDelay(int delayMs) { m_reconnectTimer.setInterval(delayMs); }
    int reconnectDelay() const { return m_reconnectTimer.interval(); }

    void setPeriodicInterval(int intervalMs) { m_periodicTimer.setInterval(intervalMs); }
    int periodicInterval() const { return m_periodicTimer.interval(); }

    void setCleanupInterval(int hours);
    void setRetentionDays(int days) { m_retentionDays = days; }
    int retentionDays() const { return m_retentionDays; }

    bool isRunning() const { return m_running; }
    bool isReconnectPending() const { return m_reconnectTimer.isActive(); }

public slots:
    void start();
    void stop();

    /**
     * @brief Drain now if online
     *
     * @return Entries synced, 0 when offline or already draining
     */
    int syncNow();

    /**
     * @brief Retention cleanup and removal of old exhausted entries
     */
    void runCleanup();

signals:
    void syncTriggered(const QString &reason);
    void cleanupFinished(int recordsRemoved, int entriesRemoved);
    void logMessage(const QString &message);

private slots:
    void onConnectivityChanged(bool online);
    void onReconnectTimeout();
    void onPeriodicTimeout();

private:
    int drain(const QString &reason);

    SyncEngine *m_engine = nullptr;
    ConnectivityMonitor *m_monitor = nullptr;
    StorageManager *m_storage = nullptr;

    QTimer m_reconnectTimer;
    QTimer m_periodicTimer;
    QTimer m_cleanupTimer;

    int m_retentionDays = DEFAULT_RETENTION_DAYS;
    bool m_running = false;
};

} // namespace FieldSync

#endif // SYNCSCHEDULER_H
