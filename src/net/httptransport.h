#ifndef HTTPTRANSPORT_H
#define HTTPTRANSPORT_H

#include "remotetransport.h"

#include <QUrl>

class QNetworkAccessManager;
class QNetworkReply;
class QNetworkRequest;

namespace FieldSync {

/**
 * @brief RemoteTransport over HTTP using QNetworkAccessManager
 *
 * Each call issues one request and waits for it in a local QEventLoop with
 * a QTimer timeout. The network manager lives on the thread that created
 * the transport; create one transport per thread.
 *
 * Wire format:
 *   - mutate:  POST <baseUrl>/api/trpc/<procedure> with the JSON body
 *   - query:   GET  <baseUrl>/api/trpc/<procedure>?input=<url-encoded JSON>
 *   - upload:  POST <baseUrl><uploadPath> multipart/form-data (file, metadata)
 *   - probe:   GET  <baseUrl><healthPath>
 */
class HttpTransport : public RemoteTransport
{
    Q_OBJECT

public:
    explicit HttpTransport(const QUrl &baseUrl, QObject *parent = nullptr);
    ~HttpTransport() override;

    // ========== Configuration ==========

    void setUploadPath(const QString &path) { m_uploadPath = path; }
    QString uploadPath() const { return m_uploadPath; }

    void setHealthPath(const QString &path) { m_healthPath = path; }
    QString healthPath() const { return m_healthPath; }

    /**
     * @brief Bearer token sent with every request (empty = none)
     */
    void setAuthToken(const QString &token) { m_authToken = token; }

    /**
     * @brief Timeout for mutate/query/upload in milliseconds
     *
     * Default is 30000ms.
     */
    void setRequestTimeout(int timeoutMs) { m_requestTimeoutMs = timeoutMs; }
    int requestTimeout() const { return m_requestTimeoutMs; }

    QUrl baseUrl() const { return m_baseUrl; }

    // ========== RemoteTransport ==========

    TransportResponse mutate(const QString &procedure, const QJsonObject &input) override;
    TransportResponse upload(const QByteArray &blob,
                             const QString &fileName,
                             const QString &mimeType,
                             const QJsonObject &metadata) override;
    TransportResponse query(const QString &procedure, const QJsonObject &input) override;
    bool probe(int timeoutMs) override;
    QString endpointDescription() const override;

    // ========== URL helpers ==========

    static QUrl procedureUrl(const QUrl &baseUrl, const QString &procedure);
    static QUrl queryUrl(const QUrl &baseUrl, const QString &procedure, const QJsonObject &input);
    static QUrl joinPath(const QUrl &baseUrl, const QString &path);

    /**
     * @brief File name safe to quote in a Content-Disposition header
     */
    static QString dispositionFileName(const QString &fileName);

private:
    QNetworkRequest makeRequest(const QUrl &url) const;
    TransportResponse waitForReply(QNetworkReply *reply, int timeoutMs);

    QNetworkAccessManager *m_manager = nullptr;
    QUrl m_baseUrl;
    QString m_uploadPath = "/api/fieldwork/evidence";
    QString m_healthPath = "/api/health";
    QString m_authToken;
    int m_requestTimeoutMs = 30000;
};

} // namespace FieldSync

#endif // HTTPTRANSPORT_H
