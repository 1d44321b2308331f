#include "cacheworker.h"
#include "cachedirectory.h"
#include "../net/remotetransport.h"

#include <QThread>
#include <QDebug>

namespace FieldSync {

CacheWorker::CacheWorker(const QString &cacheRoot, TransportFactory factory, QObject *parent)
    : QObject(parent)
    , m_cacheRoot(cacheRoot)
    , m_factory(std::move(factory))
{
    qDebug() << "[CacheWorker] Created on thread:" << QThread::currentThread();
}

CacheWorker::~CacheWorker()
{
    delete m_transport;
    qDebug() << "[CacheWorker] Destroyed";
}

void CacheWorker::doCacheReview(const QString &reviewId, const QStringList &questionnaireTypes)
{
    qDebug() << "[CacheWorker] doCacheReview()" << reviewId << "on thread:" << QThread::currentThread();

    if (!m_transport && m_factory) {
        m_transport = m_factory();
    }

    int total = CacheDirectory::requestsFor(reviewId, questionnaireTypes).size();

    if (!m_transport) {
        emit logMessage(QString("Cannot cache review %1: no transport").arg(reviewId));
        emit reviewCached(reviewId, 0, total);
        return;
    }

    CacheDirectory cache(m_cacheRoot);
    int stored = cache.fetchAndStore(m_transport, reviewId, questionnaireTypes,
        [this](const QString &message) { emit logMessage(message); });

    emit logMessage(QString("Cached %1 of %2 response(s) for review %3").arg(stored).arg(total).arg(reviewId));
    emit reviewCached(reviewId, stored, total);
}

} // namespace FieldSync
