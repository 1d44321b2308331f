#ifndef CACHEWORKER_H
#define CACHEWORKER_H

#include <QObject>
#include <QStringList>
#include <functional>

namespace FieldSync {

class RemoteTransport;

/**
 * @brief Worker object for filling the read cache off the main thread
 *
 * Runs on a dedicated thread owned by CacheManager. It touches only the
 * cache directory and its own transport, which it creates lazily through
 * the factory so that the network manager lives on the worker thread.
 */
class CacheWorker : public QObject
{
    Q_OBJECT

public:
    using TransportFactory = std::function<RemoteTransport*()>;

    CacheWorker(const QString &cacheRoot, TransportFactory factory, QObject *parent = nullptr);
    ~CacheWorker() override;

public slots:
    /**
     * @brief Fetch and store every endpoint of one review
     */
    void doCacheReview(const QString &reviewId, const QStringList &questionnaireTypes);

signals:
    /**
     * @brief Emitted when a review has been processed
     *
     * @param stored Responses written to the bucket
     * @param total  Endpoints requested
     */
    void reviewCached(const QString &reviewId, int stored, int total);

    void logMessage(const QString &message);

private:
    QString m_cacheRoot;
    TransportFactory m_factory;
    RemoteTransport *m_transport = nullptr;
};

} // namespace FieldSync

#endif // CACHEWORKER_H
