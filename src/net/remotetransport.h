#ifndef REMOTETRANSPORT_H
#define REMOTETRANSPORT_H

#include <QObject>
#include <QString>
#include <QByteArray>
#include <QJsonObject>
#include <QJsonDocument>

namespace FieldSync {

/**
 * @brief Outcome of one request against the remote API
 *
 * httpStatus is 0 when no HTTP response was received (timeout, DNS,
 * connection refused).
 */
struct TransportResponse {
    int httpStatus = 0;
    QByteArray body;
    QString errorString;
    bool networkError = false;
    bool timedOut = false;

    bool isSuccess() const { return httpStatus >= 200 && httpStatus < 300; }

    /**
     * @brief Parse the body as a JSON object (empty when it is not one)
     */
    QJsonObject json() const {
        QJsonDocument doc = QJsonDocument::fromJson(body);
        return doc.isObject() ? doc.object() : QJsonObject();
    }
};

/**
 * @brief Abstract interface to the remote fieldwork API
 *
 * Calls are synchronous from the caller's point of view. Implementations
 * are free to spin a nested event loop while waiting, so any caller must
 * expect re-entrant signal delivery during a call.
 *
 * Implementations:
 *   - HttpTransport: QNetworkAccessManager against a tRPC-style server
 *   - FakeTransport (tests): scripted in-process responses
 */
class RemoteTransport : public QObject
{
    Q_OBJECT

public:
    explicit RemoteTransport(QObject *parent = nullptr) : QObject(parent) {}
    virtual ~RemoteTransport() = default;

    /**
     * @brief POST a JSON input to a mutation procedure
     *
     * @param procedure Procedure name, e.g. "fieldworkSync.syncChecklistItem"
     */
    virtual TransportResponse mutate(const QString &procedure, const QJsonObject &input) = 0;

    /**
     * @brief Multipart upload of a binary blob with a JSON metadata part
     *
     * @param blob Borrowed read-only for the duration of the call
     */
    virtual TransportResponse upload(const QByteArray &blob,
                                     const QString &fileName,
                                     const QString &mimeType,
                                     const QJsonObject &metadata) = 0;

    /**
     * @brief GET a read procedure with its input encoded in the query string
     */
    virtual TransportResponse query(const QString &procedure, const QJsonObject &input) = 0;

    /**
     * @brief Lightweight reachability probe
     *
     * @return true when the health endpoint answered with any 2xx
     */
    virtual bool probe(int timeoutMs) = 0;

    /**
     * @brief Human-readable endpoint description for logs
     */
    virtual QString endpointDescription() const { return QString(); }
};

} // namespace FieldSync

#endif // REMOTETRANSPORT_H
