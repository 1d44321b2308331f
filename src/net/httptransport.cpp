#include "httptransport.h"
#include "fieldsync_version.h"

#include <QNetworkAccessManager>
#include <QNetworkRequest>
#include <QNetworkReply>
#include <QHttpMultiPart>
#include <QHttpPart>
#include <QUrlQuery>
#include <QEventLoop>
#include <QTimer>
#include <QDebug>

namespace FieldSync {

HttpTransport::HttpTransport(const QUrl &baseUrl, QObject *parent)
    : RemoteTransport(parent)
    , m_manager(new QNetworkAccessManager(this))
    , m_baseUrl(baseUrl)
{
}

HttpTransport::~HttpTransport() = default;

QString HttpTransport::endpointDescription() const
{
    return m_baseUrl.toString();
}

// ========== URL helpers ==========

QString HttpTransport::dispositionFileName(const QString &fileName)
{
    // Quotes, backslashes and control characters would break the part header
    QString safe;
    safe.reserve(fileName.size());
    for (const QChar c : fileName) {
        if (c == '"' || c == '\\' || c.unicode() < 0x20 || c.unicode() == 0x7f) {
            safe.append('_');
        } else {
            safe.append(c);
        }
    }
    return safe.isEmpty() ? QString("upload") : safe;
}

QUrl HttpTransport::joinPath(const QUrl &baseUrl, const QString &path)
{
    QString base = baseUrl.toString(QUrl::RemoveQuery | QUrl::RemoveFragment);
    while (base.endsWith('/')) {
        base.chop(1);
    }
    QString suffix = path;
    if (!suffix.startsWith('/')) {
        suffix.prepend('/');
    }
    return QUrl(base + suffix);
}

QUrl HttpTransport::procedureUrl(const QUrl &baseUrl, const QString &procedure)
{
    return joinPath(baseUrl, QString("/api/trpc/%1").arg(procedure));
}

QUrl HttpTransport::queryUrl(const QUrl &baseUrl, const QString &procedure, const QJsonObject &input)
{
    QUrl url = procedureUrl(baseUrl, procedure);
    QByteArray json = QJsonDocument(input).toJson(QJsonDocument::Compact);

    QUrlQuery query;
    query.addQueryItem("input", QString::fromUtf8(QUrl::toPercentEncoding(QString::fromUtf8(json))));
    url.setQuery(query);
    return url;
}

// ========== Requests ==========

QNetworkRequest HttpTransport::makeRequest(const QUrl &url) const
{
    QNetworkRequest request(url);
    request.setHeader(QNetworkRequest::UserAgentHeader,
                      QString("FieldSync/%1").arg(FIELDSYNC_VERSION_STRING));
    request.setAttribute(QNetworkRequest::RedirectPolicyAttribute,
                         QNetworkRequest::NoLessSafeRedirectPolicy);
    if (!m_authToken.isEmpty()) {
        request.setRawHeader("Authorization", "Bearer " + m_authToken.toUtf8());
    }
    return request;
}

TransportResponse HttpTransport::waitForReply(QNetworkReply *reply, int timeoutMs)
{
    TransportResponse response;

    // Synchronous wait using a local event loop
    QEventLoop loop;
    QTimer timeout;
    timeout.setSingleShot(true);

    connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    connect(&timeout, &QTimer::timeout, &loop, &QEventLoop::quit);

    timeout.start(timeoutMs);
    loop.exec();

    if (timeout.isActive()) {
        timeout.stop();
    } else {
        // Timeout occurred
        qDebug() << "[HttpTransport] Timeout:" << reply->url().toString(QUrl::RemoveQuery);
        reply->abort();
        reply->deleteLater();
        response.timedOut = true;
        response.networkError = true;
        response.errorString = QString("Request timed out after %1 ms").arg(timeoutMs);
        return response;
    }

    QVariant status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
    response.httpStatus = status.isValid() ? status.toInt() : 0;
    response.body = reply->readAll();

    if (reply->error() != QNetworkReply::NoError) {
        response.errorString = reply->errorString();
        // An HTTP error status still carries a usable response
        response.networkError = response.httpStatus == 0;
    }

    qDebug() << "[HttpTransport] Response: HTTP" << response.httpStatus
             << "Size:" << response.body.size() << "bytes"
             << "URL:" << reply->url().toString(QUrl::RemoveQuery);

    reply->deleteLater();
    return response;
}

TransportResponse HttpTransport::mutate(const QString &procedure, const QJsonObject &input)
{
    QNetworkRequest request = makeRequest(procedureUrl(m_baseUrl, procedure));
    request.setHeader(QNetworkRequest::ContentTypeHeader, "application/json");

    QByteArray body = QJsonDocument(input).toJson(QJsonDocument::Compact);
    qDebug() << "[HttpTransport] POST" << procedure << body.size() << "bytes";

    return waitForReply(m_manager->post(request, body), m_requestTimeoutMs);
}

TransportResponse HttpTransport::upload(const QByteArray &blob,
                                        const QString &fileName,
                                        const QString &mimeType,
                                        const QJsonObject &metadata)
{
    QHttpMultiPart *multiPart = new QHttpMultiPart(QHttpMultiPart::FormDataType);

    QHttpPart filePart;
    filePart.setHeader(QNetworkRequest::ContentDispositionHeader,
                       QString("form-data; name=\"file\"; filename=\"%1\"").arg(dispositionFileName(fileName)));
    filePart.setHeader(QNetworkRequest::ContentTypeHeader,
                       mimeType.isEmpty() ? QString("application/octet-stream") : mimeType);
    // QByteArray is implicitly shared, the part only reads the caller's buffer
    filePart.setBody(blob);

    QHttpPart metadataPart;
    metadataPart.setHeader(QNetworkRequest::ContentDispositionHeader,
                           QString("form-data; name=\"metadata\""));
    metadataPart.setHeader(QNetworkRequest::ContentTypeHeader, "application/json");
    metadataPart.setBody(QJsonDocument(metadata).toJson(QJsonDocument::Compact));

    multiPart->append(filePart);
    multiPart->append(metadataPart);

    QNetworkRequest request = makeRequest(joinPath(m_baseUrl, m_uploadPath));
    qDebug() << "[HttpTransport] Upload" << fileName << blob.size() << "bytes";

    QNetworkReply *reply = m_manager->post(request, multiPart);
    multiPart->setParent(reply);

    return waitForReply(reply, m_requestTimeoutMs);
}

TransportResponse HttpTransport::query(const QString &procedure, const QJsonObject &input)
{
    QNetworkRequest request = makeRequest(queryUrl(m_baseUrl, procedure, input));
    qDebug() << "[HttpTransport] GET" << procedure;
    return waitForReply(m_manager->get(request), m_requestTimeoutMs);
}

bool HttpTransport::probe(int timeoutMs)
{
    QNetworkRequest request = makeRequest(joinPath(m_baseUrl, m_healthPath));
    request.setAttribute(QNetworkRequest::CacheLoadControlAttribute,
                         QNetworkRequest::AlwaysNetwork);

    TransportResponse response = waitForReply(m_manager->get(request), timeoutMs);
    return response.isSuccess();
}

} // namespace FieldSync
