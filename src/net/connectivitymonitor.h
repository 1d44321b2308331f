#ifndef CONNECTIVITYMONITOR_H
#define CONNECTIVITYMONITOR_H

#include <QObject>
#include <QTimer>
#include <QList>
#include <functional>

namespace FieldSync {

class RemoteTransport;

/**
 * @brief Single source of truth for "are we online"
 *
 * Two inputs feed one transition point:
 *   - Passive platform events (QNetworkInformation, or setPlatformOnline()).
 *     "Offline" is applied at once. "Online" is not trusted on its own and
 *     schedules a confirming probe; bursts collapse into one probe.
 *   - Active polling: a probe of the health endpoint every 30 seconds with
 *     a 5 second timeout. The probe result is ground truth.
 *
 * statusChanged() fires only when the state actually flips.
 *
 * Implementation notes:
 * - The probe blocks in a local event loop; a probe requested while one is
 *   in flight is dropped
 * - Reconnect callbacks are one-shot watchers parented to the monitor
 */
class ConnectivityMonitor : public QObject
{
    Q_OBJECT

public:
    static const int DEFAULT_POLL_INTERVAL_MS = 30000;
    static const int DEFAULT_PROBE_TIMEOUT_MS = 5000;
    static const int DEFAULT_DEBOUNCE_MS = 1000;

    explicit ConnectivityMonitor(RemoteTransport *transport, QObject *parent = nullptr);
    ~ConnectivityMonitor() override;

    // ========== Configuration ==========

    void setPollInterval(int intervalMs);
    int pollInterval() const { return m_pollIntervalMs; }

    void setProbeTimeout(int timeoutMs) { m_probeTimeoutMs = timeoutMs; }
    int probeTimeout() const { return m_probeTimeoutMs; }

    /**
     * @brief Delay before a platform "online" report is confirmed
     */
    void setDebounceInterval(int intervalMs);

    /**
     * @brief Follow QNetworkInformation reachability events
     *
     * Loads the platform backend on first use. Returns false when no
     * backend is available; the monitor then relies on polling only.
     */
    bool attachPlatformEvents();

    // ========== State ==========

    bool isOnline() const { return m_online; }
    bool isRunning() const { return m_pollTimer.isActive(); }
    bool isDestroyed() const { return m_destroyed; }

    /**
     * @brief Run @p callback once on the next offline→online transition
     *
     * Arms only while currently offline.
     *
     * @return true if the callback was armed
     */
    bool onReconnect(std::function<void()> callback);

    /**
     * @brief Number of armed reconnect callbacks
     */
    int pendingReconnects() const { return m_watchers.size(); }

public slots:
    /**
     * @brief Start polling and run an immediate probe
     */
    void start();

    /**
     * @brief Stop polling (platform events stay attached)
     */
    void stop();

    /**
     * @brief Tear down timers, platform hooks and reconnect watchers
     *
     * Safe to call more than once. The monitor is inert afterwards.
     */
    void destroy();

    /**
     * @brief Probe now and apply the result
     *
     * @return State after the probe
     */
    bool checkNow();

    /**
     * @brief Passive platform report
     */
    void setPlatformOnline(bool online);

signals:
    void statusChanged(bool online);

private slots:
    void onPollTimeout();
    void onDebounceTimeout();

private:
    void applyState(bool online);
    void removeWatcher(QObject *watcher);

    RemoteTransport *m_transport = nullptr;

    QTimer m_pollTimer;
    QTimer m_debounceTimer;
    int m_pollIntervalMs = DEFAULT_POLL_INTERVAL_MS;
    int m_probeTimeoutMs = DEFAULT_PROBE_TIMEOUT_MS;

    QList<QObject*> m_watchers;
    QMetaObject::Connection m_platformConnection;

    bool m_online = true;
    bool m_probing = false;
    bool m_destroyed = false;
};

} // namespace FieldSync

#endif // CONNECTIVITYMONITOR_H
