#ifndef CACHEMANAGER_H
#define CACHEMANAGER_H

#include <QObject>
#include <QString>
#include <QStringList>
#include <QList>
#include "cachedirectory.h"
#include "cacheworker.h"

class QThread;

namespace FieldSync {

class RemoteTransport;

/**
 * @brief Read-side cache of review data for offline use
 *
 * Independent of the FieldworkStore. Caching a review fetches a fixed set
 * of read endpoints and keeps each successful body in the review's bucket.
 *
 * When the worker thread is running, caching is handed to the CacheWorker
 * with a queued call and completion is reported through reviewCached().
 * Otherwise the fetch runs on the caller's thread.
 *
 * Usage:
 * @code
 * CacheManager cache(cacheDir, transport);
 * cache.setQuestionnaireTypes({"ANS_USOAP_CMA", "SMS_CANSO_SOE"});
 * cache.startWorker([=]() { return new HttpTransport(baseUrl); });
 * cache.cacheReviewForOffline(reviewId);
 * @endcode
 */
class CacheManager : public QObject
{
    Q_OBJECT

public:
    CacheManager(const QString &cacheRoot, RemoteTransport *transport, QObject *parent = nullptr);
    ~CacheManager() override;

    QString cacheRoot() const { return m_cache.rootPath(); }

    void setQuestionnaireTypes(const QStringList &types) { m_questionnaireTypes = types; }
    QStringList questionnaireTypes() const { return m_questionnaireTypes; }

    // ========== Worker Thread ==========

    /**
     * @brief Start the background worker
     *
     * @param factory Creates the worker's transport on the worker thread
     */
    void startWorker(CacheWorker::TransportFactory factory);
    void stopWorker();
    bool isWorkerRunning() const;

    // ========== Cache Operations ==========

    /**
     * @brief Cache a review's read endpoints
     *
     * @return true when the work was queued to the worker, or when the
     *         direct fetch left the review cached
     */
    bool cacheReviewForOffline(const QString &reviewId);

    /**
     * @brief Fetch on the calling thread regardless of the worker
     *
     * @return Number of responses stored
     */
    int fetchReviewNow(const QString &reviewId);

    bool isCachedForOffline(const QString &reviewId) const;
    bool clearReviewCache(const QString &reviewId);
    QList<CachedReview> getCachedReviews() const;

    /**
     * @brief Stored body for one endpoint, empty when not cached
     */
    QByteArray cachedResponse(const QString &reviewId, const QString &key) const;

signals:
    void reviewCached(const QString &reviewId, int stored, int total);
    void logMessage(const QString &message);
    void errorOccurred(const QString &error);

private:
    CacheDirectory m_cache;
    RemoteTransport *m_transport = nullptr;
    QStringList m_questionnaireTypes;

    QThread *m_workerThread = nullptr;
    CacheWorker *m_worker = nullptr;
};

} // namespace FieldSync

#endif // CACHEMANAGER_H
