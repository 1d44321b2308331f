#include "connectivitymonitor.h"
#include "remotetransport.h"

#include <QNetworkInformation>
#include <QDebug>

namespace FieldSync {

const int ConnectivityMonitor::DEFAULT_POLL_INTERVAL_MS;
const int ConnectivityMonitor::DEFAULT_PROBE_TIMEOUT_MS;
const int ConnectivityMonitor::DEFAULT_DEBOUNCE_MS;

ConnectivityMonitor::ConnectivityMonitor(RemoteTransport *transport, QObject *parent)
    : QObject(parent)
    , m_transport(transport)
{
    m_pollTimer.setInterval(m_pollIntervalMs);
    connect(&m_pollTimer, &QTimer::timeout, this, &ConnectivityMonitor::onPollTimeout);

    m_debounceTimer.setSingleShot(true);
    m_debounceTimer.setInterval(DEFAULT_DEBOUNCE_MS);
    connect(&m_debounceTimer, &QTimer::timeout, this, &ConnectivityMonitor::onDebounceTimeout);
}

ConnectivityMonitor::~ConnectivityMonitor()
{
    destroy();
}

// ========== Configuration ==========

void ConnectivityMonitor::setPollInterval(int intervalMs)
{
    m_pollIntervalMs = intervalMs;
    m_pollTimer.setInterval(intervalMs);
}

void ConnectivityMonitor::setDebounceInterval(int intervalMs)
{
    m_debounceTimer.setInterval(intervalMs);
}

bool ConnectivityMonitor::attachPlatformEvents()
{
    if (m_destroyed) {
        return false;
    }

    if (!QNetworkInformation::instance()
        && !QNetworkInformation::loadBackendByFeatures(QNetworkInformation::Feature::Reachability)) {
        qDebug() << "[ConnectivityMonitor] No platform network backend, polling only";
        return false;
    }

    QNetworkInformation *info = QNetworkInformation::instance();
    if (m_platformConnection) {
        disconnect(m_platformConnection);
    }
    m_platformConnection = connect(info, &QNetworkInformation::reachabilityChanged, this,
        [this](QNetworkInformation::Reachability reachability) {
            if (reachability == QNetworkInformation::Reachability::Unknown) {
                return;
            }
            setPlatformOnline(reachability == QNetworkInformation::Reachability::Online
                              || reachability == QNetworkInformation::Reachability::Site);
        });

    // Initial state: an offline platform report is believed at once
    QNetworkInformation::Reachability current = info->reachability();
    if (current == QNetworkInformation::Reachability::Disconnected
        || current == QNetworkInformation::Reachability::Local) {
        applyState(false);
    }

    qDebug() << "[ConnectivityMonitor] Attached to backend:" << info->backendName();
    return true;
}

// ========== Lifecycle ==========

void ConnectivityMonitor::start()
{
    if (m_destroyed) {
        qWarning() << "[ConnectivityMonitor] Cannot start - monitor destroyed";
        return;
    }

    if (m_pollTimer.isActive()) {
        return;  // Already running
    }

    m_pollTimer.start();
    qDebug() << "[ConnectivityMonitor] Started with interval:" << m_pollIntervalMs << "ms";
    checkNow();
}

void ConnectivityMonitor::stop()
{
    m_pollTimer.stop();
    m_debounceTimer.stop();
}

void ConnectivityMonitor::destroy()
{
    if (m_destroyed) {
        return;
    }
    m_destroyed = true;

    m_pollTimer.stop();
    m_debounceTimer.stop();

    if (m_platformConnection) {
        disconnect(m_platformConnection);
        m_platformConnection = QMetaObject::Connection();
    }

    const QList<QObject*> watchers = m_watchers;
    m_watchers.clear();
    qDeleteAll(watchers);

    qDebug() << "[ConnectivityMonitor] Destroyed";
}

// ========== Probing ==========

bool ConnectivityMonitor::checkNow()
{
    if (m_destroyed || m_probing) {
        return m_online;
    }

    m_probing = true;
    bool reachable = m_transport ? m_transport->probe(m_probeTimeoutMs) : false;
    m_probing = false;

    // destroy() may have run while the probe was waiting
    if (m_destroyed) {
        return m_online;
    }

    applyState(reachable);
    return m_online;
}

void ConnectivityMonitor::setPlatformOnline(bool online)
{
    if (m_destroyed) {
        return;
    }

    if (!online) {
        m_debounceTimer.stop();
        applyState(false);
        return;
    }

    // Restarting the timer collapses a burst of "online" events into one probe
    m_debounceTimer.start();
}

void ConnectivityMonitor::onPollTimeout()
{
    checkNow();
}

void ConnectivityMonitor::onDebounceTimeout()
{
    checkNow();
}

void ConnectivityMonitor::applyState(bool online)
{
    if (m_online == online) {
        return;
    }

    m_online = online;
    qDebug() << "[ConnectivityMonitor] Now" << (online ? "online" : "offline");
    emit statusChanged(online);
}

// ========== Reconnect ==========

bool ConnectivityMonitor::onReconnect(std::function<void()> callback)
{
    if (m_destroyed || m_online || !callback) {
        return false;
    }

    QObject *watcher = new QObject(this);
    m_watchers.append(watcher);

    connect(this, &ConnectivityMonitor::statusChanged, watcher,
        [this, watcher, callback](bool online) {
            if (!online) {
                return;
            }
            std::function<void()> fire = callback;
            removeWatcher(watcher);
            fire();
        });

    return true;
}

void ConnectivityMonitor::removeWatcher(QObject *watcher)
{
    m_watchers.removeOne(watcher);
    disconnect(this, nullptr, watcher, nullptr);
    watcher->deleteLater();
}

} // namespace FieldSync
