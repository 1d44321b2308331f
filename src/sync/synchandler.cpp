#include "synchandler.h"

#include <QJsonDocument>
#include <QJsonParseError>
#include <QDebug>

namespace FieldSync {

QString pushOutcomeToString(PushOutcome outcome)
{
    switch (outcome) {
    case PushOutcome::Success: return "success";
    case PushOutcome::Conflict: return "conflict";
    case PushOutcome::Retryable: return "retryable";
    case PushOutcome::Permanent: return "permanent";
    }
    return "permanent";
}

SyncHandler::SyncHandler(FieldworkStore *store, RemoteTransport *transport, QObject *parent)
    : QObject(parent)
    , m_store(store)
    , m_transport(transport)
{
}

PushResult SyncHandler::classify(const TransportResponse &response)
{
    int status = response.httpStatus;

    if (status >= 200 && status < 300) {
        return PushResult::success(status);
    }

    if (status == 409) {
        return PushResult::conflict(extractMessage(response), response.body, status);
    }

    if (status == 0) {
        QString message = response.errorString.isEmpty()
            ? QString("No response from server")
            : response.errorString;
        return PushResult::retryable(message, 0);
    }

    if (status >= 500) {
        return PushResult::retryable(extractMessage(response), status);
    }

    return PushResult::permanent(extractMessage(response), status);
}

QString SyncHandler::extractMessage(const TransportResponse &response)
{
    QJsonObject body = response.json();

    if (body.contains("error")) {
        QJsonValue error = body.value("error");
        if (error.isObject()) {
            QJsonObject errorObj = error.toObject();
            QString message = errorObj.value("message").toString();
            if (message.isEmpty()) {
                message = errorObj.value("json").toObject().value("message").toString();
            }
            if (!message.isEmpty()) {
                return message;
            }
        } else if (error.isString() && !error.toString().isEmpty()) {
            return error.toString();
        }
    }

    QString message = body.value("message").toString();
    if (!message.isEmpty()) {
        return message;
    }

    return QString("HTTP %1").arg(response.httpStatus);
}

QJsonObject SyncHandler::resultData(const QJsonObject &body)
{
    if (!body.contains("result")) {
        return body;
    }

    QJsonObject data = body.value("result").toObject().value("data").toObject();
    if (data.contains("json") && data.value("json").isObject()) {
        return data.value("json").toObject();
    }
    return data;
}

bool SyncHandler::parsePayload(const SyncQueueEntry &entry, QJsonObject &payload, PushResult &failure) const
{
    QJsonParseError error;
    QJsonDocument doc = QJsonDocument::fromJson(entry.payload, &error);

    if (error.error != QJsonParseError::NoError || !doc.isObject()) {
        QString reason = error.error != QJsonParseError::NoError
            ? error.errorString()
            : QString("payload is not an object");
        failure = PushResult::permanent(QString("Invalid %1 payload: %2").arg(displayName(), reason));
        qWarning() << "[SyncHandler]" << failure.message << "entry:" << entry.id;
        return false;
    }

    payload = doc.object();
    return true;
}

} // namespace FieldSync
