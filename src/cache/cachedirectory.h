#ifndef CACHEDIRECTORY_H
#define CACHEDIRECTORY_H

#include <QString>
#include <QStringList>
#include <QByteArray>
#include <QDateTime>
#include <QJsonObject>
#include <QMap>
#include <QList>
#include <functional>

namespace FieldSync {

class RemoteTransport;

/**
 * @brief One read endpoint cached for a review
 */
struct CacheRequest {
    QString key;            ///< File stem inside the review bucket
    QString procedure;      ///< e.g. "review.getById"
    QJsonObject input;
};

/**
 * @brief When a review was cached and how many responses were stored
 */
struct CachedReview {
    QString reviewId;
    QDateTime cachedAt;
    int entries = 0;
};

/**
 * @brief On-disk layout of the read cache
 *
 *   <root>/reviews/<reviewId>/<key>.json   one response body per endpoint
 *   <root>/cached-reviews.json             side table of cached reviews
 *
 * Plain value class, usable from any thread. Several instances may share
 * one root: response files are replaced atomically and the side table is
 * guarded by a lock file.
 */
class CacheDirectory
{
public:
    static const char *REVIEW_KEY;
    static const char *INDEX_FILE;

    explicit CacheDirectory(const QString &rootPath);

    QString rootPath() const { return m_rootPath; }
    QString bucketPath(const QString &reviewId) const;

    // ========== Responses ==========

    bool store(const QString &reviewId, const QString &key, const QByteArray &body);
    QByteArray load(const QString &reviewId, const QString &key) const;
    bool contains(const QString &reviewId, const QString &key) const;
    QStringList keys(const QString &reviewId) const;

    /**
     * @brief Remove the review's bucket and its side-table row
     */
    bool removeReview(const QString &reviewId);

    // ========== Side table ==========

    QList<CachedReview> cachedReviews() const;
    bool markCached(const QString &reviewId, int entries);

    // ========== Fetching ==========

    /**
     * @brief The fixed endpoint set for one review
     */
    static QList<CacheRequest> requestsFor(const QString &reviewId,
                                           const QStringList &questionnaireTypes);

    /**
     * @brief Fetch every endpoint and store each 2xx body
     *
     * Failed URLs are logged through @p log and skipped.
     *
     * @return Number of responses stored
     */
    int fetchAndStore(RemoteTransport *transport,
                      const QString &reviewId,
                      const QStringList &questionnaireTypes,
                      const std::function<void(const QString &)> &log = nullptr);

    static QString sanitize(const QString &name);

private:
    QString filePath(const QString &reviewId, const QString &key) const;
    QString indexPath() const;
    QMap<QString, CachedReview> readIndex() const;
    bool writeIndex(const QMap<QString, CachedReview> &index);

    QString m_rootPath;
};

} // namespace FieldSync

#endif // CACHEDIRECTORY_H
