#include "cachedirectory.h"
#include "../net/remotetransport.h"
#include "../store/fieldworktypes.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QLockFile>
#include <QJsonDocument>
#include <QJsonArray>
#include <QRegularExpression>
#include <QDebug>

namespace FieldSync {

const char *CacheDirectory::REVIEW_KEY = "review";
const char *CacheDirectory::INDEX_FILE = "cached-reviews.json";

CacheDirectory::CacheDirectory(const QString &rootPath)
    : m_rootPath(rootPath)
{
}

QString CacheDirectory::sanitize(const QString &name)
{
    static const QRegularExpression unsafe("[^A-Za-z0-9_.-]");
    QString safe = name;
    safe.replace(unsafe, "_");
    if (safe.isEmpty() || safe == "." || safe == "..") {
        safe = "_";
    }
    return safe;
}

QString CacheDirectory::bucketPath(const QString &reviewId) const
{
    return QDir(m_rootPath).filePath(QString("reviews/%1").arg(sanitize(reviewId)));
}

QString CacheDirectory::filePath(const QString &reviewId, const QString &key) const
{
    return QDir(bucketPath(reviewId)).filePath(sanitize(key) + ".json");
}

QString CacheDirectory::indexPath() const
{
    return QDir(m_rootPath).filePath(INDEX_FILE);
}

// ========== Responses ==========

bool CacheDirectory::store(const QString &reviewId, const QString &key, const QByteArray &body)
{
    QDir bucket(bucketPath(reviewId));
    if (!bucket.exists() && !bucket.mkpath(".")) {
        qWarning() << "[CacheDirectory] Cannot create" << bucket.absolutePath();
        return false;
    }

    QSaveFile file(filePath(reviewId, key));
    if (!file.open(QIODevice::WriteOnly)) {
        qWarning() << "[CacheDirectory] Cannot write" << file.fileName() << file.errorString();
        return false;
    }
    file.write(body);
    return file.commit();
}

QByteArray CacheDirectory::load(const QString &reviewId, const QString &key) const
{
    QFile file(filePath(reviewId, key));
    if (!file.open(QIODevice::ReadOnly)) {
        return QByteArray();
    }
    return file.readAll();
}

bool CacheDirectory::contains(const QString &reviewId, const QString &key) const
{
    return QFileInfo::exists(filePath(reviewId, key));
}

QStringList CacheDirectory::keys(const QString &reviewId) const
{
    QStringList result;
    const QStringList files = QDir(bucketPath(reviewId)).entryList({"*.json"}, QDir::Files, QDir::Name);
    for (const QString &file : files) {
        result << QFileInfo(file).completeBaseName();
    }
    return result;
}

bool CacheDirectory::removeReview(const QString &reviewId)
{
    QDir bucket(bucketPath(reviewId));
    if (bucket.exists() && !bucket.removeRecursively()) {
        qWarning() << "[CacheDirectory] Cannot remove" << bucket.absolutePath();
        return false;
    }

    QLockFile lock(indexPath() + ".lock");
    if (!lock.tryLock(5000)) {
        return false;
    }
    QMap<QString, CachedReview> index = readIndex();
    if (index.remove(reviewId) > 0) {
        return writeIndex(index);
    }
    return true;
}

// ========== Side table ==========

QMap<QString, CachedReview> CacheDirectory::readIndex() const
{
    QMap<QString, CachedReview> index;

    QFile file(indexPath());
    if (!file.open(QIODevice::ReadOnly)) {
        return index;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        qWarning() << "[CacheDirectory] Ignoring corrupt index:" << parseError.errorString();
        return index;
    }

    QJsonObject reviews = doc.object()["reviews"].toObject();
    for (auto it = reviews.begin(); it != reviews.end(); ++it) {
        QJsonObject obj = it.value().toObject();
        CachedReview review;
        review.reviewId = it.key();
        review.cachedAt = fromIsoString(obj["cachedAt"].toString());
        review.entries = obj["entries"].toInt();
        index[review.reviewId] = review;
    }
    return index;
}

bool CacheDirectory::writeIndex(const QMap<QString, CachedReview> &index)
{
    if (!QDir().mkpath(m_rootPath)) {
        return false;
    }

    QJsonObject reviews;
    for (const CachedReview &review : index) {
        QJsonObject obj;
        obj["cachedAt"] = toIsoString(review.cachedAt);
        obj["entries"] = review.entries;
        reviews[review.reviewId] = obj;
    }

    QJsonObject root;
    root["version"] = 1;
    root["reviews"] = reviews;

    QSaveFile file(indexPath());
    if (!file.open(QIODevice::WriteOnly)) {
        qWarning() << "[CacheDirectory] Cannot write index" << file.errorString();
        return false;
    }
    file.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
    return file.commit();
}

QList<CachedReview> CacheDirectory::cachedReviews() const
{
    return readIndex().values();
}

bool CacheDirectory::markCached(const QString &reviewId, int entries)
{
    QLockFile lock(indexPath() + ".lock");
    if (!QDir().mkpath(m_rootPath) || !lock.tryLock(5000)) {
        return false;
    }

    QMap<QString, CachedReview> index = readIndex();
    CachedReview review;
    review.reviewId = reviewId;
    review.cachedAt = QDateTime::currentDateTimeUtc();
    review.entries = entries;
    index[reviewId] = review;
    return writeIndex(index);
}

// ========== Fetching ==========

QList<CacheRequest> CacheDirectory::requestsFor(const QString &reviewId,
                                                const QStringList &questionnaireTypes)
{
    QJsonObject byId;
    byId["id"] = reviewId;

    QJsonObject byReview;
    byReview["reviewId"] = reviewId;

    QList<CacheRequest> requests = {
        {REVIEW_KEY, "review.getById", byId},
        {"checklist-template", "fieldwork.getChecklistTemplate", byReview},
        {"team-members", "review.getTeamMembers", byReview},
        {"documents", "document.listByReview", byReview}
    };

    for (const QString &type : questionnaireTypes) {
        QJsonObject input;
        input["questionnaireType"] = type;
        requests.append({QString("questionnaire-%1").arg(type.toLower()),
                         "questionnaire.getStructure", input});
    }
    return requests;
}

int CacheDirectory::fetchAndStore(RemoteTransport *transport,
                                  const QString &reviewId,
                                  const QStringList &questionnaireTypes,
                                  const std::function<void(const QString &)> &log)
{
    if (!transport) {
        return 0;
    }

    const QList<CacheRequest> requests = requestsFor(reviewId, questionnaireTypes);
    int stored = 0;

    for (const CacheRequest &request : requests) {
        TransportResponse response = transport->query(request.procedure, request.input);

        if (!response.isSuccess()) {
            // Best effort: skip this endpoint, keep the rest
            QString reason = response.httpStatus > 0
                ? QString("HTTP %1").arg(response.httpStatus)
                : response.errorString;
            if (log) {
                log(QString("Skipped %1 for review %2: %3").arg(request.procedure, reviewId, reason));
            }
            continue;
        }

        if (store(reviewId, request.key, response.body)) {
            stored++;
        } else if (log) {
            log(QString("Could not store %1 for review %2").arg(request.procedure, reviewId));
        }
    }

    if (stored > 0) {
        markCached(reviewId, keys(reviewId).size());
    }
    return stored;
}

} // namespace FieldSync
