#include "syncscheduler.h"
#include "syncengine.h"
#include "../net/connectivitymonitor.h"
#include "../storage/storagemanager.h"

#include <QDebug>

namespace FieldSync {

const int SyncScheduler::DEFAULT_RECONNECT_DELAY_MS;
const int SyncScheduler::DEFAULT_PERIODIC_INTERVAL_MS;
const int SyncScheduler::DEFAULT_CLEANUP_INTERVAL_HOURS;
const int SyncScheduler::DEFAULT_RETENTION_DAYS;

SyncScheduler::SyncScheduler(SyncEngine *engine,
                             ConnectivityMonitor *monitor,
                             StorageManager *storage,
                             QObject *parent)
    : QObject(parent)
    , m_engine(engine)
    , m_monitor(monitor)
    , m_storage(storage)
{
    m_reconnectTimer.setSingleShot(true);
    m_reconnectTimer.setInterval(DEFAULT_RECONNECT_DELAY_MS);
    connect(&m_reconnectTimer, &QTimer::timeout, this, &SyncScheduler::onReconnectTimeout);

    m_periodicTimer.setInterval(DEFAULT_PERIODIC_INTERVAL_MS);
    connect(&m_periodicTimer, &QTimer::timeout, this, &SyncScheduler::onPeriodicTimeout);

    setCleanupInterval(DEFAULT_CLEANUP_INTERVAL_HOURS);
    connect(&m_cleanupTimer, &QTimer::timeout, this, &SyncScheduler::runCleanup);

    if (m_monitor) {
        connect(m_monitor, &ConnectivityMonitor::statusChanged,
                this, &SyncScheduler::onConnectivityChanged);
    }
}

SyncScheduler::~SyncScheduler()
{
    stop();
}

void SyncScheduler::setCleanupInterval(int hours)
{
    m_cleanupTimer.setInterval(qMax(1, hours) * 3600 * 1000);
}

void SyncScheduler::start()
{
    if (m_running) {
        return;
    }
    m_running = true;

    m_periodicTimer.start();
    m_cleanupTimer.start();

    // Pick up whatever was queued before we started
    if (!m_monitor || m_monitor->isOnline()) {
        m_reconnectTimer.start();
    }

    qDebug() << "[SyncScheduler] Started, periodic interval:" << m_periodicTimer.interval() << "ms";
}

void SyncScheduler::stop()
{
    if (!m_running) {
        return;
    }
    m_running = false;

    m_reconnectTimer.stop();
    m_periodicTimer.stop();
    m_cleanupTimer.stop();

    qDebug() << "[SyncScheduler] Stopped";
}

int SyncScheduler::syncNow()
{
    return drain("manual");
}

int SyncScheduler::drain(const QString &reason)
{
    if (!m_engine) {
        return 0;
    }

    if (m_monitor && !m_monitor->isOnline()) {
        qDebug() << "[SyncScheduler] Offline, skipping" << reason << "sync";
        return 0;
    }

    emit syncTriggered(reason);
    return m_engine->processQueue();
}

void SyncScheduler::runCleanup()
{
    int records = 0;
    if (m_storage) {
        records = m_storage->clearOldSyncedData(m_retentionDays);
        if (records < 0) {
            records = 0;
        }
    }

    int entries = m_engine ? m_engine->clearCompleted() : 0;

    if (records > 0 || entries > 0) {
        emit logMessage(QString("Cleanup removed %1 old record(s) and %2 finished queue entr%3")
            .arg(records).arg(entries).arg(entries == 1 ? "y" : "ies"));
    }
    emit cleanupFinished(records, entries);
}

void SyncScheduler::onConnectivityChanged(bool online)
{
    if (!m_running) {
        return;
    }

    if (online) {
        // Give the link a moment to settle before pushing
        m_reconnectTimer.start();
    } else {
        m_reconnectTimer.stop();
    }
}

void SyncScheduler::onReconnectTimeout()
{
    drain("reconnect");
}

void SyncScheduler::onPeriodicTimeout()
{
    drain("periodic");
}

} // namespace FieldSync
