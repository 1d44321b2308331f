#include "checklistitemhandler.h"

#include <QJsonDocument>
#include <QDebug>

namespace FieldSync {

const char *ChecklistItemHandler::PROCEDURE = "fieldworkSync.syncChecklistItem";

ChecklistItemHandler::ChecklistItemHandler(FieldworkStore *store, RemoteTransport *transport, QObject *parent)
    : SyncHandler(store, transport, parent)
{
}

QJsonObject ChecklistItemHandler::buildInput(const ChecklistItem &item, SyncAction action)
{
    QJsonObject input;
    input["itemId"] = item.id;
    input["reviewId"] = item.reviewId;
    input["isCompleted"] = item.isCompleted;
    input["completedAt"] = item.completedAt.isValid() ? QJsonValue(toIsoString(item.completedAt))
                                                     : QJsonValue(QJsonValue::Null);
    input["notes"] = item.notes;
    input["clientUpdatedAt"] = toIsoString(item.updatedAt);
    input["action"] = syncActionToString(action);
    return input;
}

PushResult ChecklistItemHandler::push(const SyncQueueEntry &entry)
{
    if (!m_transport) {
        return PushResult::retryable("No remote transport configured");
    }

    QJsonObject payload;
    PushResult failure;
    if (!parsePayload(entry, payload, failure)) {
        return failure;
    }

    ChecklistItem item = ChecklistItem::fromJson(payload);
    if (item.id.isEmpty()) {
        item.id = entry.entityId;
    }
    if (item.reviewId.isEmpty()) {
        return PushResult::permanent("Checklist item payload has no reviewId");
    }

    TransportResponse response = m_transport->mutate(PROCEDURE, buildInput(item, entry.action));
    PushResult result = classify(response);

    if (result.outcome == PushOutcome::Success) {
        QJsonObject data = resultData(response.json());
        if (data.value("status").toString() == "conflict") {
            QJsonObject serverData = data.value("serverData").toObject();
            qDebug() << "[ChecklistItemHandler] Server has newer copy of" << item.id;
            return PushResult::conflict("Server has a newer version of this checklist item",
                                        QJsonDocument(serverData).toJson(QJsonDocument::Compact),
                                        response.httpStatus);
        }
    } else if (result.outcome == PushOutcome::Conflict) {
        // 409 bodies may carry the server copy under serverData as well
        QJsonObject data = resultData(response.json());
        if (data.contains("serverData")) {
            result.serverSnapshot = QJsonDocument(data.value("serverData").toObject())
                                        .toJson(QJsonDocument::Compact);
        }
    }

    return result;
}

} // namespace FieldSync
