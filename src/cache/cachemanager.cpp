#include "cachemanager.h"
#include "../net/remotetransport.h"

#include <QThread>
#include <QDebug>

namespace FieldSync {

CacheManager::CacheManager(const QString &cacheRoot, RemoteTransport *transport, QObject *parent)
    : QObject(parent)
    , m_cache(cacheRoot)
    , m_transport(transport)
{
}

CacheManager::~CacheManager()
{
    stopWorker();
}

// ========== Worker Thread ==========

void CacheManager::startWorker(CacheWorker::TransportFactory factory)
{
    if (isWorkerRunning()) {
        return;  // Already running
    }

    stopWorker();

    m_workerThread = new QThread(this);
    m_worker = new CacheWorker(m_cache.rootPath(), std::move(factory));
    m_worker->moveToThread(m_workerThread);

    connect(m_worker, &CacheWorker::reviewCached, this, &CacheManager::reviewCached);
    connect(m_worker, &CacheWorker::logMessage, this, &CacheManager::logMessage);

    // Clean up worker when thread finishes
    connect(m_workerThread, &QThread::finished, m_worker, &QObject::deleteLater);

    m_workerThread->start();
    qDebug() << "[CacheManager] Worker thread started";
}

void CacheManager::stopWorker()
{
    if (!m_workerThread) {
        return;
    }

    m_workerThread->quit();
    if (!m_workerThread->wait(10000)) {
        qWarning() << "[CacheManager] Worker thread didn't stop, terminating";
        m_workerThread->terminate();
        m_workerThread->wait();
    }
    delete m_workerThread;
    m_workerThread = nullptr;
    m_worker = nullptr;  // Deleted by thread finished signal
    qDebug() << "[CacheManager] Worker thread stopped";
}

bool CacheManager::isWorkerRunning() const
{
    return m_workerThread && m_workerThread->isRunning() && m_worker;
}

// ========== Cache Operations ==========

bool CacheManager::cacheReviewForOffline(const QString &reviewId)
{
    if (reviewId.isEmpty()) {
        return false;
    }

    if (isWorkerRunning()) {
        emit logMessage(QString("Caching review %1 in background").arg(reviewId));
        return QMetaObject::invokeMethod(m_worker, "doCacheReview",
                                         Qt::QueuedConnection,
                                         Q_ARG(QString, reviewId),
                                         Q_ARG(QStringList, m_questionnaireTypes));
    }

    fetchReviewNow(reviewId);
    return isCachedForOffline(reviewId);
}

int CacheManager::fetchReviewNow(const QString &reviewId)
{
    if (!m_transport) {
        emit errorOccurred("No transport configured for caching");
        return 0;
    }

    int total = CacheDirectory::requestsFor(reviewId, m_questionnaireTypes).size();
    int stored = m_cache.fetchAndStore(m_transport, reviewId, m_questionnaireTypes,
        [this](const QString &message) {
            qDebug() << "[CacheManager]" << message;
            emit logMessage(message);
        });

    emit logMessage(QString("Cached %1 of %2 response(s) for review %3").arg(stored).arg(total).arg(reviewId));
    emit reviewCached(reviewId, stored, total);
    return stored;
}

bool CacheManager::isCachedForOffline(const QString &reviewId) const
{
    return m_cache.contains(reviewId, CacheDirectory::REVIEW_KEY);
}

bool CacheManager::clearReviewCache(const QString &reviewId)
{
    if (!m_cache.removeReview(reviewId)) {
        emit errorOccurred(QString("Failed to clear cache for review %1").arg(reviewId));
        return false;
    }
    emit logMessage(QString("Cleared cache for review %1").arg(reviewId));
    return true;
}

QList<CachedReview> CacheManager::getCachedReviews() const
{
    return m_cache.cachedReviews();
}

QByteArray CacheManager::cachedResponse(const QString &reviewId, const QString &key) const
{
    return m_cache.load(reviewId, key);
}

} // namespace FieldSync
